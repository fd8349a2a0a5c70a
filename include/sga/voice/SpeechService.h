#pragma once

#include "sga/voice/Collaborators.h"
#include "sga/voice/ConfigManager.h"
#include "sga/voice/ErrorTypes.h"
#include "sga/voice/utils/AudioProcessor.h"
#include "sga/voice/utils/HttpClient.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sga::voice {

/**
 * @brief 语音服务：OpenAI 兼容的 STT（/audio/transcriptions）与流式 TTS（/audio/speech）
 *
 * STT 与 TTS 使用各自的 HttpClient：TTS 流与打断监听的 STT 请求会并发进行。
 */
class SpeechService : public SpeechToText, public SpeechSynthesizer {
public:
    /**
     * @brief STT配置
     */
    struct STTConfig {
        std::string baseUrl;
        std::string apiKey;
        std::string modelId{"whisper-1"};
        std::optional<std::string> language;  // 语言代码，如"en"
        int timeoutMs{15000};
    };

    /**
     * @brief TTS配置
     */
    struct TTSConfig {
        std::string baseUrl;
        std::string apiKey;
        std::string modelId{"tts-1"};
        std::string voice{"alloy"};
        std::uint32_t sampleRate{24000};   // 服务端 PCM 输出采样率
        std::optional<float> speed;        // 语速（0.25-4.0）
        int timeoutMs{30000};
        // 每个回调块的时长；块边界即取消检查点
        std::uint32_t chunkMs{100};
    };

    explicit SpeechService(const ConfigManager& cfg);
    SpeechService(STTConfig stt, TTSConfig tts);
    ~SpeechService() override;

    SpeechService(const SpeechService&) = delete;
    SpeechService& operator=(const SpeechService&) = delete;

    // ========== SpeechToText ==========
    std::optional<std::string> transcribe(const std::vector<int16_t>& pcm,
                                          uint32_t sampleRate,
                                          std::chrono::milliseconds timeout) override;

    // ========== SpeechSynthesizer ==========
    bool synthesize(const std::string& text, const ChunkCallback& onChunk, const CancelToken& cancel,
                    ErrorInfo* err) override;

    const STTConfig& sttConfig() const { return stt_; }
    const TTSConfig& ttsConfig() const { return tts_; }

    static STTConfig loadSTTConfig(const ConfigManager& cfg);
    static TTSConfig loadTTSConfig(const ConfigManager& cfg);

    // 解析 {"text": "..."} 或 {"data": {"text": "..."}}；无文本返回 nullopt
    static std::optional<std::string> parseTranscription(const std::string& body);

private:
    STTConfig stt_;
    TTSConfig tts_;
    std::unique_ptr<utils::HttpClient> sttClient_;
    std::unique_ptr<utils::HttpClient> ttsClient_;
    utils::AudioProcessor audioProcessor_;
};

} // namespace sga::voice
