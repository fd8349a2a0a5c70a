#include "sga/voice/wakeword/SpottingModelStrategy.h"

#include "sga/voice/ConfigManager.h"
#include "sga/voice/ErrorHandler.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

// Porcupine C API
extern "C" {
#include "pv_porcupine.h"
}

namespace sga::voice::wakeword {

struct SpottingModelStrategy::Impl {
    pv_porcupine_t* porcupine{nullptr};
    std::size_t frameLength{512};
    uint32_t sampleRate{16000};

    ~Impl() {
        if (porcupine) {
            pv_porcupine_delete(porcupine);
        }
    }
};

namespace {

std::string normalizePhrase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

} // namespace

std::string SpottingModelStrategy::builtinKeywordFor(const std::string& phrase) {
    static const std::map<std::string, std::string> kBuiltin{
        {"hey glasses", "computer"},
        {"hey jarvis", "jarvis"},
        {"ok google", "ok google"},
        {"hey google", "hey google"},
        {"alexa", "alexa"},
        {"computer", "computer"},
        {"porcupine", "porcupine"},
    };
    auto it = kBuiltin.find(normalizePhrase(phrase));
    if (it == kBuiltin.end()) return "computer";
    return it->second;
}

std::string SpottingModelStrategy::resolveKeywordPath(const types::DetectorConfig& cfg) {
    if (!cfg.keywordPath.empty()) return cfg.keywordPath;
    std::filesystem::path p(cfg.keywordDir);
    p /= builtinKeywordFor(cfg.keyword) + "_linux.ppn";
    return p.string();
}

SpottingModelStrategy::SpottingModelStrategy(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl))
{
}

SpottingModelStrategy::~SpottingModelStrategy() = default;

std::unique_ptr<SpottingModelStrategy> SpottingModelStrategy::create(const types::DetectorConfig& cfg, ErrorInfo* err) {
    if (cfg.accessKey.empty() || ConfigManager::isUnresolvedPlaceholder(cfg.accessKey)) {
        setError(err, ErrorType::BackendUnavailable, "Porcupine access key not configured (PORCUPINE_ACCESS_KEY)");
        return nullptr;
    }

    std::error_code ec;
    if (cfg.modelPath.empty() || !std::filesystem::exists(cfg.modelPath, ec)) {
        setError(err, ErrorType::BackendUnavailable, "Porcupine model file not found: " + cfg.modelPath);
        return nullptr;
    }

    const std::string keywordPath = resolveKeywordPath(cfg);
    if (!std::filesystem::exists(keywordPath, ec)) {
        setError(err, ErrorType::BackendUnavailable, "Porcupine keyword file not found: " + keywordPath);
        return nullptr;
    }

    const char* kwPaths[] = {keywordPath.c_str()};
    const float sens[] = {static_cast<float>(types::DetectorConfig::clampSensitivity(cfg.sensitivity))};

    auto impl = std::make_unique<Impl>();
    pv_status_t status = pv_porcupine_init(
        cfg.accessKey.c_str(),
        cfg.modelPath.c_str(),
        "cpu",
        1,
        kwPaths,
        sens,
        &impl->porcupine
    );
    if (status != PV_STATUS_SUCCESS) {
        impl->porcupine = nullptr;
        setError(err, ErrorType::BackendUnavailable,
                 std::string("Failed to initialize Porcupine: ") + pv_status_to_string(status),
                 static_cast<int>(status));
        return nullptr;
    }

    impl->frameLength = static_cast<std::size_t>(pv_porcupine_frame_length());
    impl->sampleRate = static_cast<uint32_t>(pv_sample_rate());

    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info,
                               std::string("Porcupine initialized (version ") + pv_porcupine_version() +
                                   ", keyword " + keywordPath + ", frame_length " +
                                   std::to_string(impl->frameLength) + ")");

    return std::unique_ptr<SpottingModelStrategy>(new SpottingModelStrategy(std::move(impl)));
}

bool SpottingModelStrategy::process(const types::AudioFrame& frame) {
    if (!m_impl->porcupine || frame.size() != m_impl->frameLength) return false;

    int32_t keywordIndex = -1;
    pv_status_t status = pv_porcupine_process(m_impl->porcupine, frame.samples.data(), &keywordIndex);
    if (status != PV_STATUS_SUCCESS) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning,
                                   std::string("Porcupine process error: ") + pv_status_to_string(status));
        return false;
    }
    return keywordIndex >= 0;
}

std::size_t SpottingModelStrategy::requiredFrameLength() const {
    return m_impl->frameLength;
}

uint32_t SpottingModelStrategy::requiredSampleRate() const {
    return m_impl->sampleRate;
}

} // namespace sga::voice::wakeword
