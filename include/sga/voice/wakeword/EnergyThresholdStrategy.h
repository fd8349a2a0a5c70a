#pragma once

#include "sga/voice/wakeword/WakeWordStrategy.h"

#include <deque>

namespace sga::voice::wakeword {

/**
 * @brief 能量突变检测（仅用于测试/兜底）
 *
 * 帧 RMS 同时超过绝对下限和最近若干帧均值的 2 倍即触发，触发后清空窗口。
 * 不识别关键词，任何响声都可能唤醒。
 */
class EnergyThresholdStrategy : public WakeWordStrategy {
public:
    explicit EnergyThresholdStrategy(const types::DetectorConfig& cfg);

    bool process(const types::AudioFrame& frame) override;
    std::size_t requiredFrameLength() const override { return 0; }
    uint32_t requiredSampleRate() const override { return m_sampleRate; }
    void reset() override { m_window.clear(); }
    types::DetectionStrategy kind() const override { return types::DetectionStrategy::EnergyThreshold; }

    std::size_t windowSize() const { return m_window.size(); }

private:
    double m_floor;
    std::size_t m_maxWindow;
    uint32_t m_sampleRate;
    std::deque<double> m_window;
};

} // namespace sga::voice::wakeword
