#pragma once

#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

namespace sga::voice::types {

/**
 * @brief 一帧单声道 S16 PCM
 */
struct AudioFrame {
    std::vector<int16_t> samples;
    uint32_t sampleRate{16000};

    AudioFrame() = default;
    AudioFrame(std::vector<int16_t> s, uint32_t rate)
        : samples(std::move(s)), sampleRate(rate) {}

    size_t size() const { return samples.size(); }
    bool empty() const { return samples.empty(); }

    double durationMs() const {
        if (sampleRate == 0) return 0.0;
        return static_cast<double>(samples.size()) * 1000.0 / static_cast<double>(sampleRate);
    }

    /**
     * @brief 均方根幅度（int16 原始单位，0..32768）
     */
    double rms() const {
        if (samples.empty()) return 0.0;
        double sum = 0.0;
        for (int16_t s : samples) {
            const double v = static_cast<double>(s);
            sum += v * v;
        }
        return std::sqrt(sum / static_cast<double>(samples.size()));
    }
};

/**
 * @brief 一段待播放的合成音频（S16 交错 PCM）
 */
struct AudioChunk {
    std::vector<int16_t> samples;
    uint32_t sampleRate{24000};
    uint32_t channels{1};
};

} // namespace sga::voice::types
