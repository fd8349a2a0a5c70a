#pragma once

#include "sga/voice/types/DetectorConfig.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace sga::voice {

/**
 * @brief 能量 VAD 参数（dBFS）
 */
struct VadSettings {
    double startThresholdDb{-35.0};
    double stopThresholdDb{-40.0};
    std::chrono::milliseconds startHold{150};
    std::chrono::milliseconds stopHold{700};
    // 语音起点前保留的音频，避免吞掉首音节
    std::chrono::milliseconds preRoll{300};
};

/**
 * @brief 一次监听的边界
 */
struct CaptureLimits {
    std::chrono::milliseconds listenTimeout{5000};  // 等待开口的最长时间
    std::chrono::milliseconds phraseLimit{10000};   // 单句最长时长
    std::chrono::milliseconds transcribeTimeout{15000};
    VadSettings vad;
};

/**
 * @brief 语音引擎的不可变配置快照
 *
 * 组件在构造时拿到快照；运行期修改只能通过 ControlLoop::applySettings 整体替换。
 */
struct VoiceSettings {
    types::DetectorConfig detector;

    std::chrono::milliseconds sleepTimeout{60000};
    std::vector<std::string> sleepPhrases{"go to sleep", "stop listening", "sleep mode", "that's all"};

    uint32_t sampleRate{16000};
    uint32_t frameSize{512};
    std::chrono::milliseconds frameReadTimeout{500};
    std::string captureDevice;

    CaptureLimits capture;
    CaptureLimits interruption{std::chrono::milliseconds{2000}, std::chrono::milliseconds{10000},
                               std::chrono::milliseconds{15000}, VadSettings{-30.0, -40.0}};

    std::string startupPhrase{"Smart glasses ready"};
    std::string farewellPhrase{"Going to sleep. Say the wake word when you need me."};
    std::string apologyPhrase{"Sorry, I encountered an error."};

    // “record video” 命令的录制时长
    std::chrono::seconds videoDuration{10};

    std::string logLevel{"info"};

    /**
     * @brief 从配置 JSON 构造；缺失键取默认值，未知键忽略
     * @param warnings 可选，收集降级/修正信息
     */
    static VoiceSettings fromJson(const nlohmann::json& root, std::vector<std::string>* warnings = nullptr);
};

} // namespace sga::voice
