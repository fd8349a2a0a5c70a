#include "sga/voice/InterruptionMonitor.h"

#include "sga/voice/ErrorHandler.h"

#include <exception>

namespace sga::voice {

InterruptionMonitor::InterruptionMonitor(AudioInput& mic, SpeechToText& stt, CaptureLimits limits,
                                         uint32_t frameSize, std::chrono::milliseconds frameReadTimeout)
    : m_mic(mic)
    , m_capture(stt, frameSize, frameReadTimeout)
    , m_limits(limits)
{
}

std::future<std::optional<std::string>> InterruptionMonitor::startAsync(std::shared_ptr<PlaybackSession> session,
                                                                        InterruptCallback onInterrupt) {
    return std::async(std::launch::async, [this, session = std::move(session), cb = std::move(onInterrupt)]() {
        return monitor(session, cb);
    });
}

std::optional<std::string> InterruptionMonitor::monitor(const std::shared_ptr<PlaybackSession>& session,
                                                        const InterruptCallback& onInterrupt) {
    if (!session) return std::nullopt;

    auto playbackOver = [&session]() { return !session->isLive(); };

    while (session->isLive()) {
        std::optional<std::string> heard;
        try {
            heard = m_capture.capture(m_mic, m_limits, playbackOver);
        } catch (const std::exception& e) {
            ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning,
                                       std::string("Interruption listen failed: ") + e.what());
            return std::nullopt;
        }
        if (!heard) continue;

        // 开口时仍在播放，播放随后自然结束：文本照常返回，无需再取消
        if (!session->isLive()) {
            ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, "Speech overlapping end of playback: " + *heard);
            return heard;
        }

        ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, "Interrupted by user: " + *heard);
        if (onInterrupt) onInterrupt();
        return heard;
    }
    return std::nullopt;
}

} // namespace sga::voice
