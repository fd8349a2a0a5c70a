#include "sga/voice/ControlLoop.h"

#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace sga::voice;
using namespace sga::voice::test_support;
using types::MicConsumer;
using types::SessionState;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

constexpr uint32_t kFrame = 160; // 10ms @16kHz

CaptureLimits quickLimits(double startThresholdDb) {
    CaptureLimits l;
    l.listenTimeout = milliseconds(200);
    l.phraseLimit = milliseconds(2000);
    l.transcribeTimeout = milliseconds(1000);
    l.vad.startThresholdDb = startThresholdDb;
    l.vad.stopThresholdDb = -40.0;
    l.vad.startHold = milliseconds(0);
    l.vad.stopHold = milliseconds(30);
    l.vad.preRoll = milliseconds(0);
    return l;
}

VoiceSettings testSettings() {
    VoiceSettings s;
    s.sampleRate = 16000;
    s.frameSize = kFrame;
    s.frameReadTimeout = milliseconds(20);
    s.detector.strategy = types::DetectionStrategy::EnergyThreshold;
    s.detector.sampleRate = 16000;
    s.detector.frameSize = kFrame;
    s.detector.energyFloor = 3000.0;
    s.detector.energyWindow = 5;
    s.detector.refractoryMs = 1000;
    s.sleepTimeout = seconds(60);
    s.capture = quickLimits(-35.0);
    s.interruption = quickLimits(-30.0);
    s.farewellPhrase = "Going to sleep.";
    s.apologyPhrase = "Sorry, I encountered an error.";
    s.videoDuration = seconds(2);
    return s;
}

class ControlLoopTests : public ::testing::Test {
protected:
    void SetUp() override { makeLoop(testSettings()); }

    void makeLoop(const VoiceSettings& settings) {
        loop.reset();
        loop = std::make_unique<ControlLoop>(settings, mic, stt, assistant, playback, &camera, clock.source());
        loop->setStateListener([this](SessionState from, SessionState to) {
            std::lock_guard<std::mutex> lock(transitionsMutex);
            transitions.emplace_back(from, to);
        });
        mic.onRead = [this]() {
            if (loop->micConsumer() == MicConsumer::None) unownedReads.fetch_add(1);
        };
    }

    // 能量策略：安静帧之后的突增
    void pushWakeBurst() {
        for (int i = 0; i < 4; ++i) mic.push(toneFrame(kFrame, 100));
        mic.push(toneFrame(kFrame, 8000));
    }

    void wake() {
        pushWakeBurst();
        for (int i = 0; i < 5; ++i) loop->tick();
        ASSERT_EQ(loop->state(), SessionState::Active);
    }

    int countTransitions(SessionState from, SessionState to) {
        std::lock_guard<std::mutex> lock(transitionsMutex);
        int n = 0;
        for (const auto& t : transitions) {
            if (t.first == from && t.second == to) ++n;
        }
        return n;
    }

    ScriptedMic mic;
    FakeStt stt;
    ChunkedSynth synth{6};
    RecordingSpeaker speaker;
    ScriptedAssistant assistant;
    FakeCamera camera;
    FakeClock clock;
    PlaybackController playback{synth, speaker};
    std::unique_ptr<ControlLoop> loop;

    std::mutex transitionsMutex;
    std::vector<std::pair<SessionState, SessionState>> transitions;
    std::atomic<int> unownedReads{0};
};

} // namespace

TEST_F(ControlLoopTests, SilenceKeepsSleeping) {
    // 5s 静音
    for (int i = 0; i < 500; ++i) mic.push(silenceFrame(kFrame));
    for (int i = 0; i < 500; ++i) loop->tick();

    EXPECT_EQ(loop->state(), SessionState::Sleep);
    EXPECT_TRUE(transitions.empty());
    EXPECT_EQ(mic.pending(), 0u);
    EXPECT_TRUE(synth.spoken().empty());
}

TEST_F(ControlLoopTests, EnergySpikeWakesOnceAndTouchesClock) {
    clock.advance(milliseconds(5000));
    EXPECT_EQ(loop->activityClock().elapsed().count(), 5000);

    pushWakeBurst();
    for (int i = 0; i < 4; ++i) loop->tick();
    EXPECT_EQ(loop->state(), SessionState::Sleep);
    loop->tick();

    EXPECT_EQ(loop->state(), SessionState::Active);
    EXPECT_EQ(countTransitions(SessionState::Sleep, SessionState::Active), 1);
    EXPECT_EQ(loop->activityClock().elapsed().count(), 0);
}

TEST_F(ControlLoopTests, UtteranceGoesToAssistantAndReplyIsSpoken) {
    wake();
    stt.queue(std::string("what time is it"));
    mic.pushPhrase(kFrame, 3, 3);

    // 未调用 start() 时直接驱动 tick 也要完整走一轮
    EXPECT_FALSE(loop->isRunning());
    loop->tick();

    ASSERT_EQ(assistant.heard().size(), 1u);
    EXPECT_EQ(assistant.heard()[0], "what time is it");
    EXPECT_TRUE(synth.said("It is noon"));
    EXPECT_EQ(speaker.played.load(), 6);
    EXPECT_EQ(playback.currentSession()->chunksEmitted.load(), 6u);
    EXPECT_FALSE(playback.currentSession()->isCancelled());
    EXPECT_EQ(loop->state(), SessionState::Active);
    EXPECT_EQ(unownedReads.load(), 0);
    EXPECT_EQ(mic.concurrentReads.load(), 0);
}

TEST_F(ControlLoopTests, BargeInCancelsPlaybackAndDispatchesNewUtterance) {
    wake();
    synth.chunkCount = 60;
    speaker.playDelay = milliseconds(5);

    std::shared_ptr<PlaybackSession> interrupted;
    bool cancelledBeforeDispatch = false;
    assistant.onProcess = [&](const std::string& text) -> std::string {
        if (text == "stop") {
            interrupted = playback.currentSession();
            cancelledBeforeDispatch = interrupted && interrupted->isCancelled() && interrupted->finished.load();
            return "Okay";
        }
        return "It is noon and the weather is fine";
    };

    stt.queue(std::string("what time is it"));
    stt.queue(std::string("stop"));
    mic.pushPhrase(kFrame, 2, 3);  // 第一句
    mic.pushPhrase(kFrame, 2, 3);  // 播放中插话

    loop->tick();

    const auto heard = assistant.heard();
    ASSERT_EQ(heard.size(), 2u);
    EXPECT_EQ(heard[0], "what time is it");
    EXPECT_EQ(heard[1], "stop");

    ASSERT_TRUE(interrupted != nullptr);
    EXPECT_TRUE(cancelledBeforeDispatch);
    EXPECT_FALSE(interrupted->failed.load());
    EXPECT_LT(interrupted->chunksEmitted.load(), 60u);
    EXPECT_TRUE(synth.said("Okay"));

    EXPECT_EQ(loop->state(), SessionState::Active);
    EXPECT_EQ(unownedReads.load(), 0);
    EXPECT_EQ(mic.concurrentReads.load(), 0);
}

TEST_F(ControlLoopTests, InactivityTimeoutSleepsExactlyOnce) {
    wake();

    clock.advance(seconds(30));
    loop->tick();
    EXPECT_EQ(loop->state(), SessionState::Active);

    // 无输入的 tick 不刷新活动时间
    clock.advance(seconds(31));
    loop->tick();
    EXPECT_EQ(loop->state(), SessionState::Sleep);
    EXPECT_TRUE(synth.said("Going to sleep."));
    EXPECT_GE(mic.discards.load(), 1);

    for (int i = 0; i < 5; ++i) loop->tick();
    EXPECT_EQ(countTransitions(SessionState::Active, SessionState::Sleep), 1);
    EXPECT_EQ(loop->state(), SessionState::Sleep);
    EXPECT_TRUE(assistant.heard().empty());
}

TEST_F(ControlLoopTests, SleepPhraseSleepsImmediately) {
    wake();
    stt.queue(std::string("Go to sleep."));
    mic.pushPhrase(kFrame, 2, 3);

    loop->tick();

    EXPECT_EQ(loop->state(), SessionState::Sleep);
    EXPECT_TRUE(synth.said("Going to sleep."));
    EXPECT_TRUE(assistant.heard().empty());
    EXPECT_EQ(countTransitions(SessionState::Active, SessionState::Sleep), 1);
}

TEST_F(ControlLoopTests, SleepPhraseDuringPlaybackSleeps) {
    wake();
    synth.chunkCount = 60;
    speaker.playDelay = milliseconds(5);
    stt.queue(std::string("tell me a story"));
    stt.queue(std::string("that's all"));
    mic.pushPhrase(kFrame, 2, 3);
    mic.pushPhrase(kFrame, 2, 3);

    loop->tick();

    EXPECT_EQ(loop->state(), SessionState::Sleep);
    EXPECT_EQ(assistant.heard().size(), 1u);
    EXPECT_TRUE(synth.said("Going to sleep."));
}

TEST_F(ControlLoopTests, PhotoCommandBypassesAssistant) {
    wake();
    stt.queue(std::string("take a photo"));
    mic.pushPhrase(kFrame, 2, 3);

    loop->tick();

    EXPECT_EQ(camera.photos, 1);
    EXPECT_TRUE(synth.said("Taking photo"));
    EXPECT_TRUE(synth.said("Photo saved"));
    EXPECT_TRUE(assistant.heard().empty());
    EXPECT_EQ(loop->state(), SessionState::Active);
}

TEST_F(ControlLoopTests, VideoCommandUsesConfiguredDuration) {
    wake();
    stt.queue(std::string("record video"));
    mic.pushPhrase(kFrame, 2, 3);

    loop->tick();

    EXPECT_EQ(camera.videos, 1);
    EXPECT_EQ(camera.lastDuration.count(), 2);
}

TEST_F(ControlLoopTests, ShutdownCommandStopsLoop) {
    ASSERT_TRUE(loop->start());
    EXPECT_TRUE(loop->isRunning());
    wake();
    stt.queue(std::string("shutdown"));
    mic.pushPhrase(kFrame, 2, 3);

    loop->tick();

    EXPECT_FALSE(loop->isRunning());
    EXPECT_TRUE(synth.said("Shutting down"));
}

TEST_F(ControlLoopTests, AssistantFailureIsApologisedAndCountsAsActivity) {
    wake();
    assistant.onProcess = [](const std::string&) -> std::string { throw std::runtime_error("llm offline"); };
    stt.queue(std::string("hello"));
    mic.pushPhrase(kFrame, 2, 3);
    clock.advance(seconds(10));

    loop->tick();

    EXPECT_TRUE(synth.said("Sorry, I encountered an error."));
    EXPECT_EQ(loop->state(), SessionState::Active);
    EXPECT_EQ(loop->activityClock().elapsed().count(), 0);
}

TEST_F(ControlLoopTests, TickExceptionIsApologisedAndStateKept) {
    mic.throwOnRead = true;
    loop->tick();
    EXPECT_EQ(loop->state(), SessionState::Sleep);
    EXPECT_TRUE(synth.said("Sorry, I encountered an error."));

    mic.throwOnRead = false;
    wake();
}

TEST_F(ControlLoopTests, MicrophoneOpenFailureIsFatal) {
    mic.openOk = false;
    ErrorInfo err;
    EXPECT_FALSE(loop->start(&err));
    EXPECT_EQ(err.errorType, ErrorType::AudioDeviceError);
    EXPECT_FALSE(loop->isRunning());
}

TEST_F(ControlLoopTests, FailedPlaybackKeepsConversationGoing) {
    wake();
    speaker.failPlay = true;
    stt.queue(std::string("what time is it"));
    mic.pushPhrase(kFrame, 2, 3);

    loop->tick();

    EXPECT_TRUE(playback.currentSession()->failed.load());
    EXPECT_EQ(loop->state(), SessionState::Active);
}

TEST_F(ControlLoopTests, AppliedSettingsTakeEffectNextTick) {
    auto next = testSettings();
    next.detector.energyFloor = 5000.0;
    next.sleepTimeout = seconds(1);
    loop->applySettings(next);
    EXPECT_EQ(loop->wakeWordEngine().config().energyFloor, 3000.0);

    loop->tick();
    EXPECT_EQ(loop->wakeWordEngine().config().energyFloor, 5000.0);

    wake();
    clock.advance(seconds(2));
    loop->tick();
    EXPECT_EQ(loop->state(), SessionState::Sleep);
}

TEST_F(ControlLoopTests, UnavailableBackendStillWakes) {
    auto settings = testSettings();
    settings.detector.strategy = types::DetectionStrategy::SpottingModel;
    auto factories = WakeWordEngine::StrategyFactories::defaults();
    factories.spottingModel = [](const types::DetectorConfig&, ErrorInfo* err)
        -> std::unique_ptr<wakeword::WakeWordStrategy> {
        setError(err, ErrorType::BackendUnavailable, "no model");
        return nullptr;
    };
    loop.reset();
    loop = std::make_unique<ControlLoop>(settings, mic, stt, assistant, playback, &camera, clock.source(), factories);

    EXPECT_TRUE(loop->wakeWordEngine().usedFallback());
    pushWakeBurst();
    for (int i = 0; i < 5; ++i) loop->tick();
    EXPECT_EQ(loop->state(), SessionState::Active);
}

TEST_F(ControlLoopTests, StopRequestAbortsListeningBeforeSpeech) {
    wake();
    loop->stop();
    stt.queue(std::string("hello"));
    mic.pushPhrase(kFrame, 2, 3);

    loop->tick();

    EXPECT_EQ(stt.calls, 0);
    EXPECT_EQ(mic.pending(), 5u);
    EXPECT_TRUE(assistant.heard().empty());
}

TEST_F(ControlLoopTests, ThrowingBackendDuringSettingsChangeStaysInsideTick) {
    auto factories = WakeWordEngine::StrategyFactories::defaults();
    factories.spottingModel = [](const types::DetectorConfig&, ErrorInfo*)
        -> std::unique_ptr<wakeword::WakeWordStrategy> {
        throw std::runtime_error("porcupine init threw");
    };
    loop.reset();
    loop = std::make_unique<ControlLoop>(testSettings(), mic, stt, assistant, playback, &camera, clock.source(),
                                         factories);

    auto next = testSettings();
    next.detector.strategy = types::DetectionStrategy::SpottingModel;
    loop->applySettings(next);

    EXPECT_NO_THROW(loop->tick());
    EXPECT_EQ(loop->wakeWordEngine().activeStrategy(), types::DetectionStrategy::EnergyThreshold);
    EXPECT_TRUE(loop->wakeWordEngine().usedFallback());

    pushWakeBurst();
    for (int i = 0; i < 5; ++i) loop->tick();
    EXPECT_EQ(loop->state(), SessionState::Active);
}

TEST_F(ControlLoopTests, PromptAudioHeardWhileSpeakingIsDropped) {
    wake();
    stt.queue(std::string("take a photo"));
    mic.pushPhrase(kFrame, 2, 3);
    // 播报时麦克风录到设备自己的声音
    speaker.afterChunk = [this](int) { mic.push(toneFrame(kFrame, 8000)); };

    loop->tick();
    speaker.afterChunk = nullptr;

    EXPECT_EQ(camera.photos, 1);
    EXPECT_EQ(mic.pending(), 0u);
    EXPECT_GE(mic.discards.load(), 2);

    // 下一轮只剩静默，不会把提示语当成用户的话
    loop->tick();
    EXPECT_EQ(stt.calls, 1);
    EXPECT_TRUE(assistant.heard().empty());
    EXPECT_EQ(loop->state(), SessionState::Active);
}

TEST_F(ControlLoopTests, ApologyAudioIsDroppedAfterTickFailure) {
    speaker.afterChunk = [this](int) { mic.push(toneFrame(kFrame, 8000)); };
    mic.throwOnRead = true;

    loop->tick();
    speaker.afterChunk = nullptr;
    mic.throwOnRead = false;

    EXPECT_TRUE(synth.said("Sorry, I encountered an error."));
    EXPECT_EQ(mic.pending(), 0u);
}

TEST_F(ControlLoopTests, RunReturnsAfterStop) {
    ASSERT_TRUE(loop->start());
    std::thread runner([this]() { loop->run(); });
    std::this_thread::sleep_for(milliseconds(30));
    loop->stop();
    runner.join();
    EXPECT_FALSE(loop->isRunning());
    EXPECT_GT(mic.reads.load(), 0);
    EXPECT_EQ(unownedReads.load(), 0);
}

TEST_F(ControlLoopTests, SayBlocksUntilPlaybackDone) {
    loop->say("Smart glasses ready");
    EXPECT_TRUE(synth.said("Smart glasses ready"));
    EXPECT_EQ(speaker.played.load(), 6);
    EXPECT_FALSE(playback.isSpeaking());
}
