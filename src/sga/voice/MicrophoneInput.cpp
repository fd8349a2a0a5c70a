#include "sga/voice/MicrophoneInput.h"

#include "sga/voice/ErrorHandler.h"

namespace sga::voice {

MicrophoneInput::MicrophoneInput(uint32_t sampleRate, std::string deviceName, std::size_t maxBufferedMs)
    : m_sampleRate(sampleRate)
    , m_deviceName(std::move(deviceName))
    , m_maxSamples(static_cast<std::size_t>(sampleRate) * maxBufferedMs / 1000)
{
}

MicrophoneInput::~MicrophoneInput() {
    close();
}

bool MicrophoneInput::open(ErrorInfo* err) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_open) return true;
    }

    utils::CaptureOptions opts;
    opts.stream.format = utils::AudioFormat::S16;
    opts.stream.sampleRate = m_sampleRate;
    opts.stream.channels = 1;
    opts.deviceName = m_deviceName;
    opts.onData = [this](const int16_t* samples, uint32_t frames) { pushSamples(samples, frames); };
    opts.onError = [](const utils::AudioError& e) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Error, "Microphone error: " + e.message);
    };

    if (!m_processor.startCapture(opts)) {
        const auto last = m_processor.lastError();
        setError(err, ErrorType::AudioDeviceError,
                 "Failed to open capture device" + (last ? ": " + last->message : std::string()),
                 last ? static_cast<int>(last->code) : 0);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_open = true;
    m_buffer.clear();
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info,
                               "Microphone open at " + std::to_string(m_sampleRate) + " Hz" +
                                   (m_deviceName.empty() ? std::string() : " (" + m_deviceName + ")"));
    return true;
}

void MicrophoneInput::pushSamples(const int16_t* samples, std::size_t count) {
    if (samples == nullptr || count == 0) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_buffer.insert(m_buffer.end(), samples, samples + count);
        if (m_buffer.size() > m_maxSamples) {
            const std::size_t excess = m_buffer.size() - m_maxSamples;
            m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(excess));
            m_dropped += excess;
        }
    }
    m_cv.notify_all();
}

std::optional<types::AudioFrame> MicrophoneInput::readFrame(std::size_t sampleCount, std::chrono::milliseconds timeout) {
    if (sampleCount == 0) return std::nullopt;

    std::unique_lock<std::mutex> lock(m_mutex);
    const bool ready = m_cv.wait_for(lock, timeout, [&] { return !m_open || m_buffer.size() >= sampleCount; });
    if (!ready || !m_open) return std::nullopt;

    types::AudioFrame frame;
    frame.sampleRate = m_sampleRate;
    frame.samples.assign(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(sampleCount));
    m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(sampleCount));
    return frame;
}

void MicrophoneInput::discardPending() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_buffer.clear();
}

void MicrophoneInput::close() {
    bool wasOpen = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        wasOpen = m_open;
        m_open = false;
        m_buffer.clear();
    }
    m_cv.notify_all();
    if (wasOpen) {
        m_processor.stopCapture();
    }
}

std::size_t MicrophoneInput::bufferedSamples() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffer.size();
}

uint64_t MicrophoneInput::droppedSamples() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

} // namespace sga::voice
