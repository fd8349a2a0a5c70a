#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace sga::voice::types {

/**
 * @brief 唤醒词检测策略
 */
enum class DetectionStrategy {
    SpottingModel,        // 关键词检出模型（Porcupine）
    StreamingTranscript,  // 流式转写 + 关键词匹配（Vosk）
    EnergyThreshold       // 能量突变，仅用于测试/兜底
};

inline const char* detectionStrategyToString(DetectionStrategy s) {
    switch (s) {
        case DetectionStrategy::SpottingModel: return "model";
        case DetectionStrategy::StreamingTranscript: return "streaming";
        case DetectionStrategy::EnergyThreshold: return "energy";
    }
    return "energy";
}

/**
 * @brief 解析配置中的 wakeword.method；未知值返回 nullopt
 *
 * 兼容后端名写法：porcupine -> model，vosk -> streaming
 */
inline std::optional<DetectionStrategy> stringToDetectionStrategy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "model" || s == "porcupine") return DetectionStrategy::SpottingModel;
    if (s == "streaming" || s == "vosk") return DetectionStrategy::StreamingTranscript;
    if (s == "energy") return DetectionStrategy::EnergyThreshold;
    return std::nullopt;
}

/**
 * @brief 唤醒词检测配置（引擎构造后不可变；修改需重建引擎）
 */
struct DetectorConfig {
    DetectionStrategy strategy{DetectionStrategy::SpottingModel};
    std::string keyword{"hey glasses"};
    double sensitivity{0.5};
    uint32_t sampleRate{16000};
    uint32_t frameSize{512};
    // 触发后抑制重复触发的窗口（按音频时长计）
    uint32_t refractoryMs{1000};

    // EnergyThreshold
    double energyFloor{3000.0};
    uint32_t energyWindow{5};

    // SpottingModel（Porcupine）
    std::string accessKey;
    std::string modelPath;
    std::string keywordPath;
    std::string keywordDir;

    // StreamingTranscript（Vosk）
    std::string transcriptModelPath;

    static double clampSensitivity(double v) {
        return std::clamp(v, 0.0, 1.0);
    }

    bool operator==(const DetectorConfig& o) const {
        return strategy == o.strategy && keyword == o.keyword && sensitivity == o.sensitivity &&
               sampleRate == o.sampleRate && frameSize == o.frameSize && refractoryMs == o.refractoryMs &&
               energyFloor == o.energyFloor && energyWindow == o.energyWindow && accessKey == o.accessKey &&
               modelPath == o.modelPath && keywordPath == o.keywordPath && keywordDir == o.keywordDir &&
               transcriptModelPath == o.transcriptModelPath;
    }
    bool operator!=(const DetectorConfig& o) const { return !(*this == o); }
};

} // namespace sga::voice::types
