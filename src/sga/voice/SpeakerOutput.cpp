#include "sga/voice/SpeakerOutput.h"

#include "sga/voice/ErrorHandler.h"

#include <algorithm>
#include <thread>

namespace sga::voice {

SpeakerOutput::SpeakerOutput(std::chrono::milliseconds bufferAhead, std::chrono::milliseconds pollInterval)
    : m_bufferAhead(bufferAhead)
    , m_pollInterval(pollInterval)
{
}

SpeakerOutput::~SpeakerOutput() {
    closeStream();
    m_processor.shutdown();
}

bool SpeakerOutput::initialize(ErrorInfo* err) {
    if (m_processor.isInitialized()) return true;
    if (!m_processor.initialize()) {
        const auto last = m_processor.lastError();
        setError(err, ErrorType::AudioDeviceError,
                 "Failed to open playback device" + (last ? ": " + last->message : std::string()),
                 last ? static_cast<int>(last->code) : 0);
        return false;
    }
    return true;
}

bool SpeakerOutput::ensureStream(uint32_t sampleRate, uint32_t channels) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_soundId && m_streamRate == sampleRate && m_streamChannels == channels) return true;
    if (m_soundId) {
        m_processor.stop(*m_soundId);
        m_soundId.reset();
    }

    utils::AudioStreamConfig stream;
    stream.format = utils::AudioFormat::S16;
    stream.sampleRate = sampleRate;
    stream.channels = channels;
    const std::size_t bufferFrames =
        std::max<std::size_t>(1, static_cast<std::size_t>(sampleRate) * static_cast<std::size_t>(m_bufferAhead.count()) / 1000);

    auto id = m_processor.startStream(stream, bufferFrames);
    if (!id) {
        const auto last = m_processor.lastError();
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Error,
                                   "Failed to start playback stream" + (last ? ": " + last->message : std::string()));
        return false;
    }
    m_soundId = id;
    m_streamRate = sampleRate;
    m_streamChannels = channels;
    return true;
}

void SpeakerOutput::closeStream() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_soundId) {
        m_processor.stop(*m_soundId);
        m_soundId.reset();
    }
}

bool SpeakerOutput::playChunk(const types::AudioChunk& chunk, const CancelToken& token) {
    if (chunk.samples.empty()) return true;
    if (!m_processor.isInitialized()) return false;
    const uint32_t channels = chunk.channels == 0 ? 1 : chunk.channels;
    if (!ensureStream(chunk.sampleRate, channels)) return false;

    const auto* data = reinterpret_cast<const std::uint8_t*>(chunk.samples.data());
    std::size_t remaining = chunk.samples.size() * sizeof(int16_t);
    while (remaining > 0) {
        if (token.isCancelled()) return true;

        std::optional<std::size_t> written;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_soundId) return true;
            written = m_processor.appendStreamData(*m_soundId, data, remaining);
        }
        if (!written) {
            ErrorHandler::shared().log(ErrorHandler::LogLevel::Error, "Playback stream rejected audio");
            return false;
        }
        data += *written;
        remaining -= *written;
        if (remaining > 0) {
            std::this_thread::sleep_for(m_pollInterval);
        }
    }
    return true;
}

bool SpeakerOutput::drain(const CancelToken& token) {
    while (!token.isCancelled()) {
        std::optional<std::size_t> queued;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_soundId) return true;
            queued = m_processor.queuedStreamFrames(*m_soundId);
        }
        if (!queued || *queued == 0) {
            // 设备仍在播放最后一个周期
            std::this_thread::sleep_for(m_pollInterval * 2);
            closeStream();
            return true;
        }
        std::this_thread::sleep_for(m_pollInterval);
    }
    return false;
}

void SpeakerOutput::cancel() {
    closeStream();
}

} // namespace sga::voice
