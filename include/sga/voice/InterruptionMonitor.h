#pragma once

#include "sga/voice/Collaborators.h"
#include "sga/voice/PlaybackSession.h"
#include "sga/voice/UtteranceCapture.h"
#include "sga/voice/VoiceSettings.h"

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace sga::voice {

/**
 * @brief 播放期间监听用户插话（barge-in）
 *
 * 播放阶段麦克风的唯一消费者。识别到非空语音且会话仍在播放时，先调用 onInterrupt
 * （即 PlaybackController::stopSpeaking），再把文本作为结果返回。
 */
class InterruptionMonitor {
public:
    using InterruptCallback = std::function<void()>;

    InterruptionMonitor(AudioInput& mic, SpeechToText& stt, CaptureLimits limits,
                        uint32_t frameSize, std::chrono::milliseconds frameReadTimeout);

    /**
     * @brief 启动监听 worker
     * @return 插话文本；播放结束前无人开口时为 nullopt
     */
    std::future<std::optional<std::string>> startAsync(std::shared_ptr<PlaybackSession> session,
                                                       InterruptCallback onInterrupt);

    // 同步版本，供 worker 与测试使用
    std::optional<std::string> monitor(const std::shared_ptr<PlaybackSession>& session,
                                       const InterruptCallback& onInterrupt);

    void setLimits(const CaptureLimits& limits) { m_limits = limits; }

private:
    AudioInput& m_mic;
    UtteranceCapture m_capture;
    CaptureLimits m_limits;
};

} // namespace sga::voice
