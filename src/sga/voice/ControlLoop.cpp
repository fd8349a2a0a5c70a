#include "sga/voice/ControlLoop.h"

#include "sga/voice/ErrorHandler.h"

#include <cctype>
#include <exception>
#include <sstream>

namespace sga::voice {

using types::MicConsumer;
using types::SessionState;

namespace {

// 在作用域内把麦克风交给一个消费者
class MicPhase {
public:
    MicPhase(std::atomic<MicConsumer>& slot, MicConsumer who) : m_slot(slot) { m_slot.store(who); }
    ~MicPhase() { m_slot.store(MicConsumer::None); }

    MicPhase(const MicPhase&) = delete;
    MicPhase& operator=(const MicPhase&) = delete;

private:
    std::atomic<MicConsumer>& m_slot;
};

} // namespace

ControlLoop::ControlLoop(const VoiceSettings& settings,
                         AudioInput& mic,
                         SpeechToText& stt,
                         Assistant& assistant,
                         PlaybackController& playback,
                         Camera* camera,
                         ActivityClock::TimeSource timeSource,
                         WakeWordEngine::StrategyFactories factories)
    : m_settings(settings)
    , m_mic(mic)
    , m_stt(stt)
    , m_assistant(assistant)
    , m_playback(playback)
    , m_camera(camera)
    , m_factories(std::move(factories))
    , m_clock(std::move(timeSource))
    , m_router(camera, settings.videoDuration, settings.apologyPhrase)
{
    m_engine = WakeWordEngine::create(m_settings.detector, m_factories);
    rebuildCaptureComponents();
}

ControlLoop::~ControlLoop() {
    stop();
    m_playback.stopSpeaking();
    m_playback.join();
    if (m_started) {
        m_mic.close();
    }
}

bool ControlLoop::start(ErrorInfo* err) {
    ErrorInfo local;
    if (!m_mic.open(&local)) {
        if (local.errorType == ErrorType::UnknownError) local.errorType = ErrorType::AudioDeviceError;
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Error, "Cannot open audio input device", local);
        if (err) *err = local;
        return false;
    }
    m_started = true;
    m_stopRequested.store(false);
    m_running.store(true);
    if (m_mic.sampleRate() != m_engine->sampleRate()) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning,
                                   "Microphone rate " + std::to_string(m_mic.sampleRate()) +
                                       " Hz differs from wake word rate " + std::to_string(m_engine->sampleRate()) +
                                       " Hz");
    }
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info,
                               std::string("Control loop started in ") + types::sessionStateToString(state()) +
                                   ", wake word strategy '" +
                                   types::detectionStrategyToString(m_engine->activeStrategy()) + "'" +
                                   (m_engine->usedFallback() ? " (fallback)" : ""));
    return true;
}

void ControlLoop::run() {
    while (m_running.load()) {
        tick();
    }
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, "Control loop stopped");
}

void ControlLoop::stop() {
    m_stopRequested.store(true);
    m_running.store(false);
}

void ControlLoop::applySettings(const VoiceSettings& settings) {
    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pendingSettings = settings;
}

void ControlLoop::applyPendingSettings() {
    std::optional<VoiceSettings> next;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        next.swap(m_pendingSettings);
    }
    if (!next) return;

    const bool detectorChanged = next->detector != m_settings.detector;
    m_settings = std::move(*next);

    if (detectorChanged) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, "Wake word settings changed, rebuilding engine");
        m_engine = WakeWordEngine::create(m_settings.detector, m_factories);
    }
    rebuildCaptureComponents();
    m_router = CommandRouter(m_camera, m_settings.videoDuration, m_settings.apologyPhrase);
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, "Settings applied");
}

void ControlLoop::rebuildCaptureComponents() {
    m_capture = std::make_unique<UtteranceCapture>(m_stt, m_settings.frameSize, m_settings.frameReadTimeout);
    m_monitor = std::make_unique<InterruptionMonitor>(m_mic, m_stt, m_settings.interruption,
                                                      m_settings.frameSize, m_settings.frameReadTimeout);
}

void ControlLoop::tick() {
    try {
        applyPendingSettings();
        if (state() == SessionState::Sleep) {
            sleepTick();
        } else {
            activeTick();
        }
    } catch (const std::exception& e) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Error,
                                   std::string("Control loop tick failed: ") + e.what(),
                                   ErrorInfo::make(ErrorType::UnknownError, e.what()));
        recoverWithApology();
    }
}

void ControlLoop::sleepTick() {
    MicPhase phase(m_consumer, MicConsumer::WakeWord);
    auto frame = m_mic.readFrame(m_engine->frameLength(), m_settings.frameReadTimeout);
    if (!frame) return;

    if (m_engine->detect(*frame)) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, "Wake word detected");
        m_clock.touch();
        setState(SessionState::Active);
    }
}

void ControlLoop::activeTick() {
    if (m_clock.elapsed() > m_settings.sleepTimeout) {
        goToSleep("inactivity timeout");
        return;
    }

    std::optional<std::string> text;
    {
        MicPhase phase(m_consumer, MicConsumer::Capture);
        text = m_capture->capture(m_mic, m_settings.capture, [this]() { return m_stopRequested.load(); });
    }
    if (!text) return;

    m_clock.touch();
    handleUtterance(std::move(*text));
}

void ControlLoop::handleUtterance(std::string text) {
    auto& logger = ErrorHandler::shared();

    while (true) {
        logger.log(ErrorHandler::LogLevel::Info, "Heard: " + text);

        if (containsSleepPhrase(text, m_settings.sleepPhrases)) {
            goToSleep("sleep phrase");
            return;
        }

        const auto outcome = m_router.handle(text, [this](const std::string& line) { say(line); });
        if (outcome != CommandRouter::Outcome::NotHandled) {
            m_clock.touch();
            if (outcome == CommandRouter::Outcome::ShutdownRequested) {
                stop();
            }
            return;
        }

        const std::string reply = askAssistant(text);
        auto interruption = respond(reply);
        m_clock.touch();
        if (!interruption) return;

        text = std::move(*interruption);
    }
}

std::string ControlLoop::askAssistant(const std::string& text) {
    try {
        return m_assistant.process(text);
    } catch (const std::exception& e) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning,
                                   std::string("Assistant failed: ") + e.what(),
                                   ErrorInfo::make(ErrorType::UnknownError, e.what()));
        return m_settings.apologyPhrase;
    }
}

std::optional<std::string> ControlLoop::respond(const std::string& reply) {
    auto session = m_playback.speak(reply);

    std::optional<std::string> interruption;
    {
        MicPhase phase(m_consumer, MicConsumer::Interruption);
        auto pending = m_monitor->startAsync(session, [this]() { m_playback.stopSpeaking(); });
        interruption = pending.get();
    }
    m_playback.join();

    if (session->failed.load()) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning, "Reply playback failed");
    }
    return interruption;
}

void ControlLoop::say(const std::string& text) {
    m_playback.speak(text);
    m_playback.join();
    // 播报期间无人读麦克风，缓冲里只有设备自己的声音
    m_mic.discardPending();
}

void ControlLoop::goToSleep(const char* reason) {
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, std::string("Going to sleep: ") + reason);
    setState(SessionState::Sleep);
    m_engine->reset();
    say(m_settings.farewellPhrase);
}

void ControlLoop::setState(SessionState next) {
    const SessionState prev = m_state.exchange(next);
    if (prev == next) return;
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info,
                               std::string("State ") + types::sessionStateToString(prev) + " -> " +
                                   types::sessionStateToString(next));
    if (m_stateListener) m_stateListener(prev, next);
}

void ControlLoop::recoverWithApology() {
    try {
        say(m_settings.apologyPhrase);
    } catch (const std::exception& e) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Error, std::string("Apology playback failed: ") + e.what());
    }
}

std::string ControlLoop::normalizeUtterance(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (std::ispunct(c)) continue;
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool ControlLoop::containsSleepPhrase(const std::string& utterance, const std::vector<std::string>& phrases) {
    const std::string normalized = normalizeUtterance(utterance);
    for (const auto& p : phrases) {
        const std::string phrase = normalizeUtterance(p);
        if (!phrase.empty() && normalized.find(phrase) != std::string::npos) return true;
    }
    return false;
}

} // namespace sga::voice
