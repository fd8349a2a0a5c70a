#pragma once

#include "sga/voice/Collaborators.h"
#include "sga/voice/utils/AudioProcessor.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace sga::voice {

/**
 * @brief miniaudio 引擎 + 环形缓冲流的扬声器输出
 *
 * 环形缓冲只容纳 bufferAhead 的音频，写满时 playChunk 按 pollInterval 等待，
 * 因此取消后最多残留 bufferAhead 的声音。
 */
class SpeakerOutput : public AudioOutput {
public:
    explicit SpeakerOutput(std::chrono::milliseconds bufferAhead = std::chrono::milliseconds{250},
                           std::chrono::milliseconds pollInterval = std::chrono::milliseconds{10});
    ~SpeakerOutput() override;

    SpeakerOutput(const SpeakerOutput&) = delete;
    SpeakerOutput& operator=(const SpeakerOutput&) = delete;

    // 初始化播放设备；失败为 AudioDeviceError
    bool initialize(ErrorInfo* err);

    bool playChunk(const types::AudioChunk& chunk, const CancelToken& token) override;
    bool drain(const CancelToken& token) override;
    void cancel() override;

private:
    bool ensureStream(uint32_t sampleRate, uint32_t channels);
    void closeStream();

    std::chrono::milliseconds m_bufferAhead;
    std::chrono::milliseconds m_pollInterval;

    utils::AudioProcessor m_processor;
    std::mutex m_mutex;
    std::optional<uint32_t> m_soundId;
    uint32_t m_streamRate{0};
    uint32_t m_streamChannels{0};
};

} // namespace sga::voice
