#pragma once

#include "sga/voice/CancelToken.h"
#include "sga/voice/ErrorTypes.h"
#include "sga/voice/types/AudioFrame.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sga::voice {

/**
 * @brief 麦克风输入
 *
 * 同一时刻只允许一个消费者调用 readFrame（由 ControlLoop 的阶段划分保证）。
 */
class AudioInput {
public:
    virtual ~AudioInput() = default;

    // 打开设备；失败为致命错误
    virtual bool open(ErrorInfo* err) = 0;

    /**
     * @brief 读取恰好 sampleCount 个采样
     * @return 超时或设备关闭返回 nullopt
     */
    virtual std::optional<types::AudioFrame> readFrame(std::size_t sampleCount, std::chrono::milliseconds timeout) = 0;

    // 丢弃已缓存但未读取的音频（例如设备自己播放时录到的声音）
    virtual void discardPending() = 0;

    virtual void close() = 0;

    virtual uint32_t sampleRate() const = 0;
};

/**
 * @brief 扬声器输出；只由播放 worker 调用
 */
class AudioOutput {
public:
    virtual ~AudioOutput() = default;

    /**
     * @brief 排队播放一块音频；领先播放位置的缓冲量有上限
     * @return 设备错误返回 false；token 被取消时尽快返回
     */
    virtual bool playChunk(const types::AudioChunk& chunk, const CancelToken& token) = 0;

    /**
     * @brief 等待已排队音频播放完；token 被取消时立即返回 false
     */
    virtual bool drain(const CancelToken& token) = 0;

    // 丢弃所有已排队音频
    virtual void cancel() = 0;
};

/**
 * @brief 语音识别
 */
class SpeechToText {
public:
    virtual ~SpeechToText() = default;

    /**
     * @brief 转写一段 16-bit 单声道 PCM
     * @return 识别失败/无内容返回 nullopt（瞬时错误，不抛异常）
     */
    virtual std::optional<std::string> transcribe(const std::vector<int16_t>& pcm,
                                                  uint32_t sampleRate,
                                                  std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief 语音合成
 */
class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    // 返回 false 表示停止合成
    using ChunkCallback = std::function<bool(const types::AudioChunk& chunk)>;

    /**
     * @brief 合成并逐块回调
     * @param cancel 被取消后应尽快返回，包括阻塞在网络读取时
     * @return 合成后端失败返回 false（onChunk 主动中止或被取消不算失败）
     */
    virtual bool synthesize(const std::string& text, const ChunkCallback& onChunk, const CancelToken& cancel,
                            ErrorInfo* err) = 0;
};

/**
 * @brief 对话助手（自然语言理解/工具调用均在其内部）
 */
class Assistant {
public:
    virtual ~Assistant() = default;

    // 返回要朗读的回复；实现应自行处理失败
    virtual std::string process(const std::string& utterance) = 0;
};

/**
 * @brief 相机
 */
class Camera {
public:
    virtual ~Camera() = default;

    // 返回保存的文件路径
    virtual std::optional<std::string> takePhoto(ErrorInfo* err) = 0;
    virtual std::optional<std::string> recordVideo(std::chrono::seconds duration, ErrorInfo* err) = 0;
};

} // namespace sga::voice
