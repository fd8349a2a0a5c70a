#pragma once

#include "sga/voice/types/AudioFrame.h"
#include "sga/voice/types/DetectorConfig.h"

#include <cstddef>
#include <cstdint>

namespace sga::voice::wakeword {

/**
 * @brief 唤醒词检测策略接口
 */
class WakeWordStrategy {
public:
    virtual ~WakeWordStrategy() = default;

    // 处理一帧；检测到唤醒词返回 true
    virtual bool process(const types::AudioFrame& frame) = 0;

    // 策略要求的帧长（采样数）；0 表示不限
    virtual std::size_t requiredFrameLength() const = 0;

    virtual uint32_t requiredSampleRate() const = 0;

    // 清空内部累积状态
    virtual void reset() = 0;

    virtual types::DetectionStrategy kind() const = 0;
};

} // namespace sga::voice::wakeword
