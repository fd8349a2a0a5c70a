#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <miniaudio.h>

namespace sga::voice::utils {

enum class AudioFormat {
    F32,
    S16,
};

enum class AudioErrorCode : std::uint8_t {
    None = 0,
    NotInitialized,
    InvalidArgs,
    NotFound,
    DeviceInitFailed,
    DeviceStartFailed,
    DeviceStopFailed,
    EncoderFailed,
    IoFailed,
    BufferOverflow,
    InternalError,
};

struct AudioError {
    AudioErrorCode code{AudioErrorCode::None};
    std::string message{};
};

struct AudioStreamConfig {
    AudioFormat format{AudioFormat::S16};
    std::uint32_t sampleRate{0};            // 0 表示使用设备默认采样率
    std::uint32_t channels{0};              // 0 表示使用设备默认声道数
    std::uint32_t periodSizeInFrames{0};    // 0 表示使用 miniaudio 默认值
};

struct CaptureOptions {
    // 录音固定转换为该格式（miniaudio 负责重采样/下混）
    AudioStreamConfig stream{AudioFormat::S16, 16000, 1, 0};
    // 设备名子串；为空时使用默认输入（避开 loopback）
    std::string deviceName;
    std::function<void(const std::int16_t* samples, std::uint32_t frames)> onData;
    std::function<void(const AudioError& err)> onError;
};

/**
 * @brief 基于 miniaudio 的音频处理器
 * - 流式播放：环形缓冲数据源，供 TTS PCM 分块写入
 * - 录音：S16 单声道回调，供唤醒词/监听消费
 * - 电平（dBFS）与上传用的 WAV 编码
 */
class AudioProcessor {
public:
    AudioProcessor();
    ~AudioProcessor();

    AudioProcessor(const AudioProcessor&) = delete;
    AudioProcessor& operator=(const AudioProcessor&) = delete;

    bool initialize(const AudioStreamConfig& playbackConfig = {});
    void shutdown();
    bool isInitialized() const { return initialized_; }

    std::optional<AudioError> lastError() const;

    // ---- 流式播放 ----
    /**
     * @brief 启动流式播放
     * @param bufferFrames 环形缓冲容量（帧），决定最多领先播放多少音频
     * @return soundId
     */
    std::optional<std::uint32_t> startStream(const AudioStreamConfig& stream, std::size_t bufferFrames);
    /**
     * @brief 追加 PCM；缓冲不足时只写入能容纳的整帧部分
     * @return 实际写入的字节数（帧对齐）；失败返回 nullopt
     */
    std::optional<std::size_t> appendStreamData(std::uint32_t soundId, const void* pcm, std::size_t bytes);
    /**
     * @brief 尚未被设备读走的帧数；soundId 不存在返回 nullopt
     */
    std::optional<std::size_t> queuedStreamFrames(std::uint32_t soundId) const;
    bool stop(std::uint32_t soundId);
    void stopAll();

    // ---- 录音 ----
    bool startCapture(const CaptureOptions& opts);
    void stopCapture();

    // S16 样本的 RMS 电平；空输入返回 -90
    static float dbfsOf(const std::int16_t* samples, std::size_t count);

    /**
     * @brief 将 PCM 编码为 WAV 字节（经临时文件，供 multipart 上传）
     */
    std::optional<std::string> encodeWav(const AudioStreamConfig& stream,
                                         const std::vector<std::uint8_t>& pcm) const;

private:
    struct SoundHandle {
        void* sound{nullptr};        // ma_sound*
        void* streamSource{nullptr}; // StreamSource*
    };

    mutable std::mutex soundMutex_;
    std::unordered_map<std::uint32_t, std::unique_ptr<SoundHandle>> sounds_;
    std::atomic<std::uint32_t> nextSoundId_{1};

    mutable std::mutex lastErrorMutex_;
    mutable std::optional<AudioError> lastError_{};

    void* engine_{nullptr}; // ma_engine*
    AudioStreamConfig playbackConfig_{};
    bool initialized_{false};

    void* captureContext_{nullptr}; // ma_context*
    void* captureDevice_{nullptr};  // ma_device*
    CaptureOptions captureOptions_{};
    std::atomic<bool> capturing_{false};

    static ma_format toMiniaudioFormat(AudioFormat fmt);
    static std::size_t frameSizeBytes(const AudioStreamConfig& cfg);
    static std::optional<AudioError> checkPcm(const AudioStreamConfig& stream, std::size_t pcmBytes);
    bool writeWavFile(const std::string& path, const AudioStreamConfig& stream,
                      const std::vector<std::uint8_t>& pcm) const;
    void releaseCapture();
    void setLastError(AudioErrorCode code, const std::string& message) const;
    void reportError(const CaptureOptions& opts, AudioErrorCode code, const std::string& message) const;
    static void dataCallbackCapture(void* pUserData, const void* pInput, std::uint32_t frameCount);
    void onCaptureFrames(const void* pInput, std::uint32_t frameCount);
};

} // namespace sga::voice::utils
