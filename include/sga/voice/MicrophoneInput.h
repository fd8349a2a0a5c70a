#pragma once

#include "sga/voice/Collaborators.h"
#include "sga/voice/utils/AudioProcessor.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace sga::voice {

/**
 * @brief miniaudio 录音设备 -> 有界采样队列
 *
 * 设备回调线程写入，消费者线程按帧读取；队列满时丢弃最旧的采样。
 */
class MicrophoneInput : public AudioInput {
public:
    MicrophoneInput(uint32_t sampleRate, std::string deviceName = {}, std::size_t maxBufferedMs = 10000);
    ~MicrophoneInput() override;

    MicrophoneInput(const MicrophoneInput&) = delete;
    MicrophoneInput& operator=(const MicrophoneInput&) = delete;

    bool open(ErrorInfo* err) override;
    std::optional<types::AudioFrame> readFrame(std::size_t sampleCount, std::chrono::milliseconds timeout) override;
    void discardPending() override;
    void close() override;
    uint32_t sampleRate() const override { return m_sampleRate; }

    // 设备回调入口（也供测试直接注入采样）
    void pushSamples(const int16_t* samples, std::size_t count);

    std::size_t bufferedSamples() const;
    uint64_t droppedSamples() const;

private:
    uint32_t m_sampleRate;
    std::string m_deviceName;
    std::size_t m_maxSamples;

    utils::AudioProcessor m_processor;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<int16_t> m_buffer;
    uint64_t m_dropped{0};
    bool m_open{false};
};

} // namespace sga::voice
