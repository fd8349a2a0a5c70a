#include "sga/voice/utils/AudioProcessor.h"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace {
ma_device* toDevice(void* ptr) { return reinterpret_cast<ma_device*>(ptr); }
ma_engine* toEngine(void* ptr) { return reinterpret_cast<ma_engine*>(ptr); }
ma_sound* toSound(void* ptr) { return reinterpret_cast<ma_sound*>(ptr); }
ma_context* toContext(void* ptr) { return reinterpret_cast<ma_context*>(ptr); }

using sga::voice::utils::AudioFormat;
using sga::voice::utils::AudioStreamConfig;

struct StreamSource {
    ma_data_source_base base{};
    ma_pcm_rb rb{};
    AudioStreamConfig stream{};
    std::size_t bytesPerFrame{0};
};

StreamSource* getStreamSource(ma_data_source* ds) {
    return reinterpret_cast<StreamSource*>(ds);
}

ma_format formatOf(const AudioStreamConfig& cfg) {
    return cfg.format == AudioFormat::S16 ? ma_format_s16 : ma_format_f32;
}

ma_result streamRead(ma_data_source* pDataSource, void* pFramesOut, ma_uint64 frameCount, ma_uint64* pFramesRead) {
    auto* src = getStreamSource(pDataSource);
    if (src == nullptr || pFramesOut == nullptr) {
        return MA_INVALID_ARGS;
    }

    ma_uint64 totalRead = 0;
    auto* dst = static_cast<std::uint8_t*>(pFramesOut);
    const std::size_t bytesPerFrame = src->bytesPerFrame;

    while (totalRead < frameCount) {
        const ma_uint64 requested = frameCount - totalRead;
        const ma_uint64 available = ma_pcm_rb_available_read(&src->rb);

        if (available == 0) {
            // 合成跟不上时补静音，保持设备时钟连续；流由 stop() 结束
            std::memset(dst + totalRead * bytesPerFrame, 0, static_cast<std::size_t>(requested) * bytesPerFrame);
            totalRead += requested;
            break;
        }

        ma_uint32 acquire = static_cast<ma_uint32>(std::min(requested, available));
        void* pRead = nullptr;
        if (ma_pcm_rb_acquire_read(&src->rb, &acquire, &pRead) != MA_SUCCESS || pRead == nullptr) {
            break;
        }
        std::memcpy(dst + totalRead * bytesPerFrame, pRead, static_cast<std::size_t>(acquire) * bytesPerFrame);
        ma_pcm_rb_commit_read(&src->rb, acquire);
        totalRead += acquire;
    }

    if (pFramesRead) *pFramesRead = totalRead;
    return MA_SUCCESS;
}

ma_result streamGetDataFormat(ma_data_source* pDataSource,
                              ma_format* pFormat,
                              ma_uint32* pChannels,
                              ma_uint32* pSampleRate,
                              ma_channel* /*pChannelMap*/,
                              size_t /*channelMapCap*/) {
    auto* src = getStreamSource(pDataSource);
    if (src == nullptr) {
        return MA_INVALID_ARGS;
    }
    if (pFormat) *pFormat = formatOf(src->stream);
    if (pChannels) *pChannels = src->stream.channels;
    if (pSampleRate) *pSampleRate = src->stream.sampleRate;
    return MA_SUCCESS;
}

ma_data_source_vtable g_streamVTable{
    streamRead,
    nullptr,            // onSeek
    streamGetDataFormat,
    nullptr,            // onGetCursor
    nullptr             // onGetLength
};

StreamSource* createStreamSource(const AudioStreamConfig& stream, std::size_t bufferFrames) {
    if (stream.sampleRate == 0 || stream.channels == 0) {
        return nullptr;
    }

    auto* src = new StreamSource();
    src->stream = stream;
    src->bytesPerFrame = ma_get_bytes_per_sample(formatOf(stream)) * stream.channels;

    ma_data_source_config dsCfg = ma_data_source_config_init();
    dsCfg.vtable = &g_streamVTable;
    if (ma_data_source_init(&dsCfg, &src->base) != MA_SUCCESS) {
        delete src;
        return nullptr;
    }
    if (ma_pcm_rb_init(formatOf(stream), stream.channels, static_cast<ma_uint32>(bufferFrames),
                       nullptr, nullptr, &src->rb) != MA_SUCCESS) {
        ma_data_source_uninit(&src->base);
        delete src;
        return nullptr;
    }
    return src;
}

void destroyStreamSource(StreamSource* src) {
    if (src == nullptr) {
        return;
    }
    ma_pcm_rb_uninit(&src->rb);
    ma_data_source_uninit(&src->base);
    delete src;
}

float dbfsFromRms(float rms) {
    if (rms <= 1e-9f) {
        return -90.0f;
    }
    return 20.0f * std::log10(rms);
}

std::size_t bytesPerSampleFor(AudioFormat fmt) {
    return fmt == AudioFormat::S16 ? sizeof(std::int16_t) : sizeof(float);
}

} // namespace

namespace sga::voice::utils {

AudioProcessor::AudioProcessor() = default;

AudioProcessor::~AudioProcessor() { shutdown(); }

ma_format AudioProcessor::toMiniaudioFormat(AudioFormat fmt) {
    return fmt == AudioFormat::S16 ? ma_format_s16 : ma_format_f32;
}

std::size_t AudioProcessor::frameSizeBytes(const AudioStreamConfig& cfg) {
    return bytesPerSampleFor(cfg.format) * cfg.channels;
}

std::optional<AudioError> AudioProcessor::lastError() const {
    std::lock_guard<std::mutex> lock(lastErrorMutex_);
    return lastError_;
}

void AudioProcessor::setLastError(AudioErrorCode code, const std::string& message) const {
    std::lock_guard<std::mutex> lock(lastErrorMutex_);
    lastError_ = AudioError{code, message};
}

void AudioProcessor::reportError(const CaptureOptions& opts, AudioErrorCode code, const std::string& message) const {
    setLastError(code, message);
    if (opts.onError) {
        opts.onError(AudioError{code, message});
    }
}

// ========== 电平 / WAV ==========

std::optional<AudioError> AudioProcessor::checkPcm(const AudioStreamConfig& stream, std::size_t pcmBytes) {
    if (stream.sampleRate < 8000 || stream.sampleRate > 192000 || stream.channels == 0 || stream.channels > 8) {
        return AudioError{AudioErrorCode::InvalidArgs,
                          "unsupported stream " + std::to_string(stream.sampleRate) + " Hz x" +
                              std::to_string(stream.channels)};
    }
    if (pcmBytes == 0) return AudioError{AudioErrorCode::InvalidArgs, "empty pcm"};
    if (pcmBytes % frameSizeBytes(stream) != 0) {
        return AudioError{AudioErrorCode::InvalidArgs, "pcm is not frame-aligned"};
    }
    return std::nullopt;
}

float AudioProcessor::dbfsOf(const std::int16_t* samples, std::size_t count) {
    if (samples == nullptr || count == 0) {
        return -90.0f;
    }
    double accum = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        const double v = static_cast<double>(samples[i]) / 32768.0;
        accum += v * v;
    }
    return dbfsFromRms(static_cast<float>(std::sqrt(accum / static_cast<double>(count))));
}

bool AudioProcessor::writeWavFile(const std::string& path,
                                  const AudioStreamConfig& stream,
                                  const std::vector<std::uint8_t>& pcm) const {
    const ma_uint64 frames = pcm.size() / frameSizeBytes(stream);
    const ma_encoder_config encCfg = ma_encoder_config_init(ma_encoding_format_wav, toMiniaudioFormat(stream.format),
                                                            stream.channels, stream.sampleRate);
    ma_encoder encoder;
    if (ma_encoder_init_file(path.c_str(), &encCfg, &encoder) != MA_SUCCESS) {
        setLastError(AudioErrorCode::EncoderFailed, "encodeWav: cannot open " + path);
        return false;
    }
    ma_uint64 written = 0;
    const bool ok = ma_encoder_write_pcm_frames(&encoder, pcm.data(), frames, &written) == MA_SUCCESS &&
                    written == frames;
    ma_encoder_uninit(&encoder);
    if (!ok) setLastError(AudioErrorCode::EncoderFailed, "encodeWav: short write to " + path);
    return ok;
}

std::optional<std::string> AudioProcessor::encodeWav(const AudioStreamConfig& stream,
                                                     const std::vector<std::uint8_t>& pcm) const {
    if (auto bad = checkPcm(stream, pcm.size())) {
        setLastError(bad->code, "encodeWav: " + bad->message);
        return std::nullopt;
    }

    static std::atomic<std::uint32_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::error_code ec;
    const auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        setLastError(AudioErrorCode::IoFailed, "encodeWav: no temp directory: " + ec.message());
        return std::nullopt;
    }
    const auto path = dir / ("sga_utt_" + std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)) + ".wav");

    if (!writeWavFile(path.string(), stream, pcm)) {
        std::filesystem::remove(path, ec);
        return std::nullopt;
    }
    std::string bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    std::filesystem::remove(path, ec);
    if (bytes.empty()) {
        setLastError(AudioErrorCode::IoFailed, "encodeWav: failed to read back " + path.string());
        return std::nullopt;
    }
    return bytes;
}

// ========== 播放 ==========

bool AudioProcessor::initialize(const AudioStreamConfig& playbackConfig) {
    if (initialized_) {
        return true;
    }

    ma_engine_config cfg = ma_engine_config_init();
    cfg.channels = playbackConfig.channels;
    cfg.sampleRate = playbackConfig.sampleRate;
    cfg.listenerCount = 1;

    auto* engine = new ma_engine();
    if (ma_engine_init(&cfg, engine) != MA_SUCCESS) {
        delete engine;
        setLastError(AudioErrorCode::DeviceInitFailed, "ma_engine_init failed");
        return false;
    }

    engine_ = engine;
    playbackConfig_ = playbackConfig;
    initialized_ = true;
    return true;
}

void AudioProcessor::shutdown() {
    stopAll();
    stopCapture();

    if (initialized_ && engine_ != nullptr) {
        ma_engine_uninit(toEngine(engine_));
        delete toEngine(engine_);
    }
    engine_ = nullptr;
    initialized_ = false;
}

std::optional<std::uint32_t> AudioProcessor::startStream(const AudioStreamConfig& stream, std::size_t bufferFrames) {
    if (!initialized_) {
        setLastError(AudioErrorCode::NotInitialized, "startStream: engine not initialized");
        return std::nullopt;
    }
    AudioStreamConfig cfg = stream;
    if (cfg.sampleRate == 0) cfg.sampleRate = playbackConfig_.sampleRate != 0 ? playbackConfig_.sampleRate : 48000;
    if (cfg.channels == 0) cfg.channels = playbackConfig_.channels != 0 ? playbackConfig_.channels : 1;
    if (bufferFrames == 0) {
        setLastError(AudioErrorCode::InvalidArgs, "startStream: bufferFrames is zero");
        return std::nullopt;
    }

    auto* src = createStreamSource(cfg, bufferFrames);
    if (src == nullptr) {
        setLastError(AudioErrorCode::InternalError, "startStream: failed to create stream source");
        return std::nullopt;
    }

    auto* sound = new ma_sound();
    if (ma_sound_init_from_data_source(toEngine(engine_), &src->base, 0, nullptr, sound) != MA_SUCCESS) {
        destroyStreamSource(src);
        delete sound;
        setLastError(AudioErrorCode::InternalError, "startStream: ma_sound_init_from_data_source failed");
        return std::nullopt;
    }

    const auto id = nextSoundId_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(soundMutex_);
        auto handle = std::make_unique<SoundHandle>();
        handle->sound = sound;
        handle->streamSource = src;
        sounds_.emplace(id, std::move(handle));
    }
    ma_sound_start(sound);
    return id;
}

std::optional<std::size_t> AudioProcessor::appendStreamData(std::uint32_t soundId, const void* pcm, std::size_t bytes) {
    if (pcm == nullptr || bytes == 0) {
        setLastError(AudioErrorCode::InvalidArgs, "appendStreamData: pcm is null or bytes is zero");
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(soundMutex_);
    auto it = sounds_.find(soundId);
    if (it == sounds_.end() || it->second->streamSource == nullptr) {
        setLastError(AudioErrorCode::NotFound, "appendStreamData: soundId not found or not a stream");
        return std::nullopt;
    }
    auto* src = reinterpret_cast<StreamSource*>(it->second->streamSource);
    const ma_uint64 frames = std::min<ma_uint64>(bytes / src->bytesPerFrame, ma_pcm_rb_available_write(&src->rb));

    ma_uint64 totalWritten = 0;
    const auto* srcBytes = static_cast<const std::uint8_t*>(pcm);
    while (totalWritten < frames) {
        ma_uint32 acquire = static_cast<ma_uint32>(frames - totalWritten);
        void* pWrite = nullptr;
        if (ma_pcm_rb_acquire_write(&src->rb, &acquire, &pWrite) != MA_SUCCESS || pWrite == nullptr || acquire == 0) {
            setLastError(AudioErrorCode::InternalError, "appendStreamData: ma_pcm_rb_acquire_write failed");
            break;
        }
        std::memcpy(pWrite, srcBytes + totalWritten * src->bytesPerFrame, static_cast<std::size_t>(acquire) * src->bytesPerFrame);
        ma_pcm_rb_commit_write(&src->rb, acquire);
        totalWritten += acquire;
    }
    return static_cast<std::size_t>(totalWritten) * src->bytesPerFrame;
}

std::optional<std::size_t> AudioProcessor::queuedStreamFrames(std::uint32_t soundId) const {
    std::lock_guard<std::mutex> lock(soundMutex_);
    auto it = sounds_.find(soundId);
    if (it == sounds_.end() || it->second->streamSource == nullptr) {
        return std::nullopt;
    }
    auto* src = reinterpret_cast<StreamSource*>(it->second->streamSource);
    return static_cast<std::size_t>(ma_pcm_rb_available_read(&src->rb));
}

// 在锁外释放：ma_sound_uninit 会等待音频线程
static void releaseSound(void* soundPtr, void* streamPtr) {
    auto* sound = toSound(soundPtr);
    ma_sound_stop(sound);
    ma_sound_uninit(sound);
    delete sound;
    destroyStreamSource(reinterpret_cast<StreamSource*>(streamPtr));
}

bool AudioProcessor::stop(std::uint32_t soundId) {
    std::unique_ptr<SoundHandle> handle;
    {
        std::lock_guard<std::mutex> lock(soundMutex_);
        auto node = sounds_.extract(soundId);
        if (node.empty()) return false;
        handle = std::move(node.mapped());
    }
    releaseSound(handle->sound, handle->streamSource);
    return true;
}

void AudioProcessor::stopAll() {
    decltype(sounds_) active;
    {
        std::lock_guard<std::mutex> lock(soundMutex_);
        active.swap(sounds_);
    }
    for (auto& entry : active) {
        releaseSound(entry.second->sound, entry.second->streamSource);
    }
}

// ========== 录音 ==========

void AudioProcessor::dataCallbackCapture(void* pUserData, const void* pInput, std::uint32_t frameCount) {
    auto* self = reinterpret_cast<AudioProcessor*>(pUserData);
    if (self != nullptr) {
        self->onCaptureFrames(pInput, frameCount);
    }
}

void AudioProcessor::onCaptureFrames(const void* pInput, std::uint32_t frameCount) {
    if (!capturing_ || pInput == nullptr || !captureOptions_.onData) {
        return;
    }
    captureOptions_.onData(static_cast<const std::int16_t*>(pInput), frameCount);
}

bool AudioProcessor::startCapture(const CaptureOptions& opts) {
    if (capturing_) {
        return true;
    }
    if (opts.stream.format != AudioFormat::S16 || opts.stream.channels != 1 || opts.stream.sampleRate == 0) {
        reportError(opts, AudioErrorCode::InvalidArgs, "startCapture: only S16 mono with explicit sampleRate is supported");
        return false;
    }

    auto* ctx = new ma_context();
    if (ma_context_init(nullptr, 0, nullptr, ctx) != MA_SUCCESS) {
        delete ctx;
        reportError(opts, AudioErrorCode::DeviceInitFailed, "startCapture: ma_context_init failed");
        return false;
    }
    captureContext_ = ctx;

    ma_device_config deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.sampleRate = opts.stream.sampleRate;
    deviceConfig.capture.format = ma_format_s16;
    deviceConfig.capture.channels = 1;
    deviceConfig.dataCallback = [](ma_device* device, void* /*pOutput*/, const void* pInput, ma_uint32 frameCount) {
        dataCallbackCapture(device->pUserData, pInput, frameCount);
    };
    deviceConfig.pUserData = this;
    if (opts.stream.periodSizeInFrames != 0) {
        deviceConfig.periodSizeInFrames = opts.stream.periodSizeInFrames;
    }

    // 指定设备名优先；否则默认输入若是 loopback（扬声器回采），换成第一个非 loopback 设备
    ma_device_info* playbackInfos = nullptr;
    ma_uint32 playbackCount = 0;
    ma_device_info* captureInfos = nullptr;
    ma_uint32 captureCount = 0;
    if (ma_context_get_devices(ctx, &playbackInfos, &playbackCount, &captureInfos, &captureCount) == MA_SUCCESS &&
        captureInfos != nullptr && captureCount > 0) {
        auto lowerName = [](const ma_device_info& info) {
            std::string name(info.name);
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return name;
        };
        const ma_device_info* chosen = nullptr;
        if (!opts.deviceName.empty()) {
            std::string wanted = opts.deviceName;
            std::transform(wanted.begin(), wanted.end(), wanted.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            for (ma_uint32 i = 0; i < captureCount && !chosen; ++i) {
                if (lowerName(captureInfos[i]).find(wanted) != std::string::npos) chosen = &captureInfos[i];
            }
        }
        if (!chosen && lowerName(captureInfos[0]).find("loopback") != std::string::npos) {
            for (ma_uint32 i = 1; i < captureCount && !chosen; ++i) {
                if (lowerName(captureInfos[i]).find("loopback") == std::string::npos) chosen = &captureInfos[i];
            }
        }
        if (chosen) deviceConfig.capture.pDeviceID = &chosen->id;
    }

    captureOptions_ = opts;
    auto* device = new ma_device();
    if (ma_device_init(ctx, &deviceConfig, device) != MA_SUCCESS) {
        delete device;
        releaseCapture();
        reportError(opts, AudioErrorCode::DeviceInitFailed, "startCapture: ma_device_init failed");
        return false;
    }
    captureDevice_ = device;

    capturing_ = true;
    if (ma_device_start(device) != MA_SUCCESS) {
        releaseCapture();
        reportError(opts, AudioErrorCode::DeviceStartFailed, "startCapture: ma_device_start failed");
        return false;
    }
    return true;
}

void AudioProcessor::stopCapture() {
    if (captureDevice_ != nullptr && ma_device_stop(toDevice(captureDevice_)) != MA_SUCCESS) {
        reportError(captureOptions_, AudioErrorCode::DeviceStopFailed, "stopCapture: ma_device_stop failed");
    }
    releaseCapture();
}

void AudioProcessor::releaseCapture() {
    capturing_ = false;
    if (auto* device = toDevice(captureDevice_)) {
        ma_device_uninit(device);
        delete device;
        captureDevice_ = nullptr;
    }
    if (auto* ctx = toContext(captureContext_)) {
        ma_context_uninit(ctx);
        delete ctx;
        captureContext_ = nullptr;
    }
}

} // namespace sga::voice::utils
