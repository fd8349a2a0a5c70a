#pragma once

#include "sga/voice/Collaborators.h"
#include "sga/voice/VoiceSettings.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sga::voice {

/**
 * @brief 一次有界的“听一句话”：能量 VAD 切句 + 语音识别
 *
 * - 等待开口最多 listenTimeout；持续 startHold 高于 startThresholdDb 视为开口
 * - 连续 stopHold 低于 stopThresholdDb 或达到 phraseLimit 视为说完
 * - 开口前 preRoll 的音频一并送识别
 *
 * 时长按读到的音频计算（读超时按超时时长计），与墙钟无关。
 */
class UtteranceCapture {
public:
    // 返回 true 时放弃本次监听（仅在尚未开口时检查）
    using AbortPredicate = std::function<bool()>;

    UtteranceCapture(SpeechToText& stt, uint32_t frameSize, std::chrono::milliseconds frameReadTimeout);

    /**
     * @brief 监听并识别一句话
     * @return 超时/放弃/识别失败/空文本均返回 nullopt
     */
    std::optional<std::string> capture(AudioInput& mic,
                                       const CaptureLimits& limits,
                                       const AbortPredicate& shouldAbort = nullptr);

    /**
     * @brief 只做切句，不识别；未检测到语音返回 nullopt
     */
    std::optional<std::vector<int16_t>> record(AudioInput& mic,
                                               const CaptureLimits& limits,
                                               const AbortPredicate& shouldAbort = nullptr);

private:
    SpeechToText& m_stt;
    uint32_t m_frameSize;
    std::chrono::milliseconds m_readTimeout;
};

} // namespace sga::voice
