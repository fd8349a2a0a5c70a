#include "sga/voice/SpeechService.h"

#include "sga/voice/ErrorHandler.h"

#include <algorithm>
#include <cstring>

#include "nlohmann/json.hpp"

namespace sga::voice {

SpeechService::SpeechService(const ConfigManager& cfg)
    : SpeechService(loadSTTConfig(cfg), loadTTSConfig(cfg))
{
}

SpeechService::SpeechService(STTConfig stt, TTSConfig tts)
    : stt_(std::move(stt))
    , tts_(std::move(tts))
    , sttClient_(std::make_unique<utils::HttpClient>(stt_.baseUrl))
    , ttsClient_(std::make_unique<utils::HttpClient>(tts_.baseUrl))
{
    sttClient_->setTimeout(stt_.timeoutMs);
    ttsClient_->setTimeout(tts_.timeoutMs);
    if (!stt_.apiKey.empty()) sttClient_->setDefaultHeader("Authorization", "Bearer " + stt_.apiKey);
    if (!tts_.apiKey.empty()) ttsClient_->setDefaultHeader("Authorization", "Bearer " + tts_.apiKey);
}

SpeechService::~SpeechService() = default;

namespace {
constexpr long long kMaxTimeoutMs = 600000;
}

SpeechService::STTConfig SpeechService::loadSTTConfig(const ConfigManager& cfg) {
    STTConfig config;
    // stt.* 缺省时回退到 api.*
    config.baseUrl = cfg.getString("stt.baseUrl").value_or(cfg.getString("api.baseUrl").value_or(""));
    config.apiKey = cfg.getString("stt.apiKey").value_or(cfg.getString("api.apiKey").value_or(""));
    if (auto m = cfg.getString("stt.model")) config.modelId = *m;
    if (auto l = cfg.getString("stt.language")) config.language = *l;
    if (auto t = cfg.getInteger("stt.timeoutMs", 1, kMaxTimeoutMs)) config.timeoutMs = static_cast<int>(*t);
    return config;
}

SpeechService::TTSConfig SpeechService::loadTTSConfig(const ConfigManager& cfg) {
    TTSConfig config;
    config.baseUrl = cfg.getString("tts.baseUrl").value_or(cfg.getString("api.baseUrl").value_or(""));
    config.apiKey = cfg.getString("tts.apiKey").value_or(cfg.getString("api.apiKey").value_or(""));
    if (auto m = cfg.getString("tts.model")) config.modelId = *m;
    if (auto v = cfg.getString("tts.voice")) config.voice = *v;
    if (auto r = cfg.getInteger("tts.sampleRate", 8000, 192000)) config.sampleRate = static_cast<std::uint32_t>(*r);
    if (auto s = cfg.getNumber("tts.speed"); s && *s > 0) config.speed = static_cast<float>(*s);
    if (auto t = cfg.getInteger("tts.timeoutMs", 1, kMaxTimeoutMs)) config.timeoutMs = static_cast<int>(*t);
    return config;
}

std::optional<std::string> SpeechService::parseTranscription(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    std::string text;
    // OpenAI兼容格式：{"text":"..."}
    if (auto it = j.find("text"); it != j.end() && it->is_string()) {
        text = it->get<std::string>();
    }
    // 嵌套格式：{"data":{"text":"..."}}
    if (text.empty()) {
        if (auto d = j.find("data"); d != j.end() && d->is_object()) {
            if (auto it = d->find("text"); it != d->end() && it->is_string()) {
                text = it->get<std::string>();
            }
        }
    }
    if (text.empty()) return std::nullopt;
    return text;
}

std::optional<std::string> SpeechService::transcribe(const std::vector<int16_t>& pcm,
                                                     uint32_t sampleRate,
                                                     std::chrono::milliseconds timeout) {
    auto& logger = ErrorHandler::shared();
    if (pcm.empty()) return std::nullopt;
    if (stt_.baseUrl.empty() || stt_.apiKey.empty()) {
        logger.log(ErrorHandler::LogLevel::Warning, "STT not configured (stt.baseUrl / stt.apiKey)");
        return std::nullopt;
    }

    utils::AudioStreamConfig stream;
    stream.format = utils::AudioFormat::S16;
    stream.sampleRate = sampleRate;
    stream.channels = 1;

    std::vector<std::uint8_t> bytes(pcm.size() * sizeof(int16_t));
    std::memcpy(bytes.data(), pcm.data(), bytes.size());

    auto wav = audioProcessor_.encodeWav(stream, bytes);
    if (!wav) {
        const auto err = audioProcessor_.lastError();
        logger.log(ErrorHandler::LogLevel::Warning,
                   "STT: WAV encoding failed" + (err ? ": " + err->message : std::string()));
        return std::nullopt;
    }

    std::map<std::string, std::string> fields;
    fields["model"] = stt_.modelId;
    if (stt_.language && !stt_.language->empty()) {
        fields["language"] = *stt_.language;
    }

    std::map<std::string, utils::HttpClient::MultipartFile> files;
    files["file"] = utils::HttpClient::MultipartFile{"utterance.wav", "audio/wav", std::move(*wav)};

    const int timeoutMs = timeout.count() > 0 ? static_cast<int>(timeout.count()) : stt_.timeoutMs;
    sttClient_->setTimeout(timeoutMs);
    auto resp = sttClient_->postMultipart("/audio/transcriptions", fields, files);
    if (!resp.isSuccess()) {
        logger.log(ErrorHandler::LogLevel::Warning, "STT request failed",
                   ErrorHandler::fromHttpResponse(resp, sttClient_->buildFullUrl("/audio/transcriptions")));
        return std::nullopt;
    }

    auto text = parseTranscription(resp.body);
    if (text) {
        logger.log(ErrorHandler::LogLevel::Debug, "STT: " + *text);
    }
    return text;
}

bool SpeechService::synthesize(const std::string& text, const ChunkCallback& onChunk, const CancelToken& cancel,
                               ErrorInfo* err) {
    if (text.empty()) return true;
    if (tts_.baseUrl.empty() || tts_.apiKey.empty()) {
        setError(err, ErrorType::InvalidRequest, "TTS not configured (tts.baseUrl / tts.apiKey)");
        return false;
    }

    nlohmann::json body;
    body["model"] = tts_.modelId;
    body["input"] = text;
    body["voice"] = tts_.voice;
    body["response_format"] = "pcm"; // 流式必须使用PCM
    if (tts_.speed.has_value()) {
        body["speed"] = *tts_.speed;
    }

    utils::HttpRequest req;
    req.method = utils::HttpMethod::POST;
    req.url = ttsClient_->buildFullUrl("/audio/speech");
    req.timeoutMs = tts_.timeoutMs;
    req.body = body.dump();
    req.headers["Content-Type"] = "application/json";
    req.abortRequested = [cancel]() { return cancel.isCancelled(); };

    const std::size_t chunkSamples =
        std::max<std::size_t>(1, static_cast<std::size_t>(tts_.sampleRate) * tts_.chunkMs / 1000);

    types::AudioChunk pending;
    pending.sampleRate = tts_.sampleRate;
    pending.channels = 1;
    pending.samples.reserve(chunkSamples);
    // 跨网络块的奇数字节
    std::string carry;
    bool stoppedByCallback = false;

    auto emit = [&](bool force) -> bool {
        while (pending.samples.size() >= chunkSamples || (force && !pending.samples.empty())) {
            types::AudioChunk out;
            out.sampleRate = pending.sampleRate;
            out.channels = pending.channels;
            const std::size_t n = std::min(chunkSamples, pending.samples.size());
            out.samples.assign(pending.samples.begin(), pending.samples.begin() + static_cast<std::ptrdiff_t>(n));
            pending.samples.erase(pending.samples.begin(), pending.samples.begin() + static_cast<std::ptrdiff_t>(n));
            if (!onChunk(out)) {
                stoppedByCallback = true;
                return false;
            }
        }
        return true;
    };

    req.streamHandler = [&](std::string_view data) -> bool {
        carry.append(data.data(), data.size());
        const std::size_t whole = carry.size() / sizeof(int16_t);
        if (whole == 0) return true;
        const std::size_t old = pending.samples.size();
        pending.samples.resize(old + whole);
        std::memcpy(pending.samples.data() + old, carry.data(), whole * sizeof(int16_t));
        carry.erase(0, whole * sizeof(int16_t));
        return emit(false);
    };

    auto resp = ttsClient_->executeStream(req);
    if (resp.cancelled || stoppedByCallback || cancel.isCancelled()) {
        return true;
    }
    if (!resp.isSuccess()) {
        if (err) *err = ErrorHandler::fromHttpResponse(resp, req.url);
        return false;
    }
    emit(true);
    return true;
}

} // namespace sga::voice
