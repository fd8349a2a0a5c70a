#include "sga/voice/wakeword/StreamingTranscriptStrategy.h"

#include "sga/voice/ErrorHandler.h"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <vosk_api.h>

#include "nlohmann/json.hpp"

namespace sga::voice::wakeword {

struct StreamingTranscriptStrategy::Impl {
    VoskModel* model{nullptr};
    VoskRecognizer* recognizer{nullptr};
    std::string keyword;
    uint32_t sampleRate{16000};

    ~Impl() {
        if (recognizer) vosk_recognizer_free(recognizer);
        if (model) vosk_model_free(model);
    }
};

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool StreamingTranscriptStrategy::resultMatchesKeyword(const std::string& resultJson, const std::string& keyword) {
    if (keyword.empty()) return false;
    auto j = nlohmann::json::parse(resultJson, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;
    auto it = j.find("text");
    if (it == j.end() || !it->is_string()) return false;
    return lower(it->get<std::string>()).find(lower(keyword)) != std::string::npos;
}

StreamingTranscriptStrategy::StreamingTranscriptStrategy(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl))
{
}

StreamingTranscriptStrategy::~StreamingTranscriptStrategy() = default;

std::unique_ptr<StreamingTranscriptStrategy> StreamingTranscriptStrategy::create(const types::DetectorConfig& cfg,
                                                                                 ErrorInfo* err) {
    std::error_code ec;
    if (cfg.transcriptModelPath.empty() || !std::filesystem::is_directory(cfg.transcriptModelPath, ec)) {
        setError(err, ErrorType::BackendUnavailable, "Vosk model directory not found: " + cfg.transcriptModelPath);
        return nullptr;
    }

    vosk_set_log_level(-1);
    auto impl = std::make_unique<Impl>();
    impl->keyword = cfg.keyword;
    impl->sampleRate = cfg.sampleRate;

    impl->model = vosk_model_new(cfg.transcriptModelPath.c_str());
    if (!impl->model) {
        setError(err, ErrorType::BackendUnavailable, "Failed to load Vosk model: " + cfg.transcriptModelPath);
        return nullptr;
    }
    impl->recognizer = vosk_recognizer_new(impl->model, static_cast<float>(cfg.sampleRate));
    if (!impl->recognizer) {
        setError(err, ErrorType::BackendUnavailable, "Failed to create Vosk recognizer");
        return nullptr;
    }

    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info,
                               "Vosk recognizer ready (model " + cfg.transcriptModelPath + ", keyword '" +
                                   cfg.keyword + "')");
    return std::unique_ptr<StreamingTranscriptStrategy>(new StreamingTranscriptStrategy(std::move(impl)));
}

bool StreamingTranscriptStrategy::process(const types::AudioFrame& frame) {
    if (!m_impl->recognizer || frame.empty()) return false;

    const int final = vosk_recognizer_accept_waveform(
        m_impl->recognizer,
        reinterpret_cast<const char*>(frame.samples.data()),
        static_cast<int>(frame.samples.size() * sizeof(int16_t)));
    if (final < 0) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning, "Vosk accept_waveform failed");
        return false;
    }
    if (final == 0) return false;

    const std::string result = vosk_recognizer_result(m_impl->recognizer);
    if (resultMatchesKeyword(result, m_impl->keyword)) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Debug, "Vosk keyword match: " + result);
        return true;
    }
    return false;
}

uint32_t StreamingTranscriptStrategy::requiredSampleRate() const {
    return m_impl->sampleRate;
}

void StreamingTranscriptStrategy::reset() {
    if (m_impl->recognizer) vosk_recognizer_reset(m_impl->recognizer);
}

} // namespace sga::voice::wakeword
