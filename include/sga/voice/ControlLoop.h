#pragma once

#include "sga/voice/ActivityClock.h"
#include "sga/voice/Collaborators.h"
#include "sga/voice/CommandRouter.h"
#include "sga/voice/InterruptionMonitor.h"
#include "sga/voice/PlaybackController.h"
#include "sga/voice/UtteranceCapture.h"
#include "sga/voice/VoiceSettings.h"
#include "sga/voice/WakeWordEngine.h"
#include "sga/voice/types/SessionState.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sga::voice {

/**
 * @brief SLEEP/ACTIVE 状态机
 *
 * 单个控制线程逐 tick 运行；每次回复期间的播放 worker 与打断监听 worker 都在 tick 返回前 join。
 * 麦克风按阶段只交给一个消费者：SLEEP 唤醒词引擎，ACTIVE 先监听再打断监听。
 * 任何 tick 内抛出的 std::exception 都被记录并以道歉语音回应，状态保持不变。
 */
class ControlLoop {
public:
    using StateListener = std::function<void(types::SessionState from, types::SessionState to)>;

    ControlLoop(const VoiceSettings& settings,
                AudioInput& mic,
                SpeechToText& stt,
                Assistant& assistant,
                PlaybackController& playback,
                Camera* camera = nullptr,
                ActivityClock::TimeSource timeSource = nullptr,
                WakeWordEngine::StrategyFactories factories = WakeWordEngine::StrategyFactories::defaults());
    ~ControlLoop();

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    /**
     * @brief 打开麦克风；失败为致命错误，由调用方退出进程
     */
    bool start(ErrorInfo* err = nullptr);

    // 阻塞运行直到 stop()
    void run();

    // 可从任意线程调用；当前 tick 结束后 run() 返回
    void stop();

    bool isRunning() const { return m_running.load(); }

    // 执行一个 tick（测试可直接驱动）
    void tick();

    /**
     * @brief 运行期更新配置；下一个 tick 开始时生效，检测配置变化时重建唤醒词引擎
     */
    void applySettings(const VoiceSettings& settings);

    // 阻塞朗读（不监听打断），结束后丢弃麦克风缓冲；用于提示语、道歉和开机提示
    void say(const std::string& text);

    types::SessionState state() const { return m_state.load(); }
    types::MicConsumer micConsumer() const { return m_consumer.load(); }

    const WakeWordEngine& wakeWordEngine() const { return *m_engine; }
    const ActivityClock& activityClock() const { return m_clock; }

    void setStateListener(StateListener listener) { m_stateListener = std::move(listener); }

    /**
     * @brief 句子是否包含退出短语（小写、去 ASCII 标点、合并空白后匹配）
     */
    static bool containsSleepPhrase(const std::string& utterance, const std::vector<std::string>& phrases);
    static std::string normalizeUtterance(const std::string& text);

private:
    void applyPendingSettings();
    void rebuildCaptureComponents();

    void sleepTick();
    void activeTick();

    void handleUtterance(std::string text);
    std::string askAssistant(const std::string& text);
    std::optional<std::string> respond(const std::string& reply);

    void goToSleep(const char* reason);
    void setState(types::SessionState next);
    void recoverWithApology();

    VoiceSettings m_settings;
    AudioInput& m_mic;
    SpeechToText& m_stt;
    Assistant& m_assistant;
    PlaybackController& m_playback;
    Camera* m_camera;
    WakeWordEngine::StrategyFactories m_factories;

    ActivityClock m_clock;
    std::unique_ptr<WakeWordEngine> m_engine;
    std::unique_ptr<UtteranceCapture> m_capture;
    std::unique_ptr<InterruptionMonitor> m_monitor;
    CommandRouter m_router;

    std::atomic<types::SessionState> m_state{types::SessionState::Sleep};
    std::atomic<types::MicConsumer> m_consumer{types::MicConsumer::None};
    std::atomic<bool> m_running{false};
    // 只由 stop() 置位；未 start() 时直接驱动 tick 也能正常监听
    std::atomic<bool> m_stopRequested{false};
    bool m_started{false};
    StateListener m_stateListener;

    std::mutex m_pendingMutex;
    std::optional<VoiceSettings> m_pendingSettings;
};

} // namespace sga::voice
