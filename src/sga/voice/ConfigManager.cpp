#include "sga/voice/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <set>

namespace sga::voice {

namespace {

std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string lowered(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool hasPrefix(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::optional<std::string> slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::filesystem::file_time_type stampOf(const std::string& path, std::error_code& ec) {
    if (!std::filesystem::exists(path, ec)) return {};
    return std::filesystem::last_write_time(path, ec);
}

} // namespace

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

ConfigManager::~ConfigManager() {
    stopWatching();
}

std::optional<nlohmann::json> ConfigManager::parseDocument(const std::string& text, std::string& errMsg) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        errMsg = std::string("Config JSON parse failed: ") + e.what();
        return std::nullopt;
    }
    if (!doc.is_object()) {
        errMsg = "Config root must be a JSON object";
        return std::nullopt;
    }
    applyEnvMappingOverrides(doc);
    expandEnvPlaceholders(doc);
    return doc;
}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    const auto text = slurp(path);
    if (text) return loadFromString(*text, err);

    auto defaults = makeDefaultConfig();
    applyEnvMappingOverrides(defaults);
    expandEnvPlaceholders(defaults);
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(defaults);
    }

    // 模板里的密钥仍是 ${...} 占位符
    ErrorInfo saveErr;
    const bool created = saveToFile(path, &saveErr);
    if (err) {
        *err = ErrorInfo::make(ErrorType::UnknownError, "Config file not found, using default config: " + path);
        nlohmann::json details{{"path", path}, {"fallback", "default_config"}, {"auto_created", created}};
        if (!created) details["auto_create_failed"] = saveErr.toJson();
        err->details = std::move(details);
    }
    return true;
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    std::string why;
    auto doc = parseDocument(jsonText, why);
    if (!doc) {
        setError(err, ErrorType::InvalidRequest, why);
        if (err) err->details = nlohmann::json{{"snippet", jsonText.substr(0, 256)}};
        return false;
    }
    std::lock_guard<std::mutex> lk(m_mu);
    m_cfg = std::move(*doc);
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    const auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec && !std::filesystem::is_directory(dir)) {
            setError(err, ErrorType::UnknownError, "Failed to create config directory: " + dir.string(), 1);
            return false;
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        setError(err, ErrorType::UnknownError, "Failed to open config file for write: " + path, 2);
        return false;
    }
    out << makeDefaultConfig().dump(2) << '\n';
    if (!out.flush()) {
        setError(err, ErrorType::UnknownError, "Failed to write config file: " + path, 3);
        return false;
    }
    return true;
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    if (const auto* node = findByPath(m_cfg, parts)) return *node;
    return std::nullopt;
}

std::optional<std::string> ConfigManager::getString(const std::string& keyPath) const {
    const auto v = get(keyPath);
    if (!v || !v->is_string()) return std::nullopt;
    auto s = trimmed(v->get<std::string>());
    if (s.empty() || isUnresolvedPlaceholder(s)) return std::nullopt;
    return s;
}

std::optional<double> ConfigManager::getNumber(const std::string& keyPath) const {
    const auto v = get(keyPath);
    if (!v || !v->is_number()) return std::nullopt;
    return v->get<double>();
}

std::optional<long long> ConfigManager::getInteger(const std::string& keyPath, long long lo, long long hi) const {
    const auto d = getNumber(keyPath);
    if (!d || !std::isfinite(*d) || std::floor(*d) != *d) return std::nullopt;
    if (*d < static_cast<double>(lo) || *d > static_cast<double>(hi)) return std::nullopt;
    return static_cast<long long>(*d);
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        setError(err, ErrorType::InvalidRequest, "Empty keyPath");
        return false;
    }
    std::lock_guard<std::mutex> lk(m_mu);
    *findOrCreateByPath(m_cfg, parts) = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    expandEnvPlaceholders(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "SGA voice engine config template (auto-generated). JSON has no comments; use _comment fields.";
    j["wakeword"] = {
        {"_comment", "method: model (Porcupine keyword spotting) | streaming (Vosk transcript match) | energy (test only). "
                     "Unavailable backends fall back to energy."},
        {"method", "model"},
        {"keyword", "hey glasses"},
        {"sensitivity", 0.5},
        {"refractoryMs", 1000},
        {"energy", {
            {"floor", 3000},
            {"window", 5}
        }},
        {"porcupine", {
            {"_comment", "accessKey should come from env PORCUPINE_ACCESS_KEY. keywordPath overrides keywordDir lookup."},
            {"accessKey", "${PORCUPINE_ACCESS_KEY}"},
            {"modelPath", "models/porcupine/porcupine_params.pv"},
            {"keywordPath", ""},
            {"keywordDir", "models/porcupine/keywords"}
        }},
        {"vosk", {
            {"modelPath", "models/vosk-model-small-en-us-0.15"}
        }}
    };
    j["activity"] = {
        {"sleepTimeoutSeconds", 60},
        {"sleepPhrases", nlohmann::json::array({"go to sleep", "stop listening", "sleep mode", "that's all"})}
    };
    j["audio"] = {
        {"sampleRate", 16000},
        {"frameSize", 512},
        {"frameReadTimeoutMs", 500},
        {"captureDevice", ""}
    };
    j["speech"] = {
        {"listenTimeoutSeconds", 5},
        {"phraseTimeLimitSeconds", 10},
        {"vad", {
            {"startThresholdDb", -35.0},
            {"stopThresholdDb", -40.0},
            {"startHoldMs", 150},
            {"stopHoldMs", 700},
            {"preRollMs", 300}
        }}
    };
    j["interruption"] = {
        {"_comment", "Barge-in listening during playback. Higher start threshold rejects speaker echo."},
        {"listenTimeoutSeconds", 2},
        {"startThresholdDb", -30.0}
    };
    j["responses"] = {
        {"startup", "Smart glasses ready"},
        {"farewell", "Going to sleep. Say the wake word when you need me."},
        {"apology", "Sorry, I encountered an error."}
    };
    j["api"] = {
        {"_comment", "OpenAI-compatible endpoint shared by stt/tts/assistant unless overridden."},
        {"baseUrl", "https://api.openai.com/v1"},
        {"apiKey", "${SGA_API_KEY}"},
        {"timeoutMs", 30000}
    };
    j["stt"] = {
        {"baseUrl", ""},
        {"apiKey", ""},
        {"model", "whisper-1"},
        {"language", "en"},
        {"timeoutMs", 15000}
    };
    j["tts"] = {
        {"baseUrl", ""},
        {"apiKey", ""},
        {"model", "tts-1"},
        {"voice", "alloy"},
        {"sampleRate", 24000},
        {"speed", 1.0},
        {"timeoutMs", 30000}
    };
    j["assistant"] = {
        {"model", "gpt-4o-mini"},
        {"personality", "You are a helpful assistant running on smart glasses. Keep answers short and easy to listen to."},
        {"maxHistoryTurns", 6},
        {"maxTokens", 300},
        {"temperature", 0.7}
    };
    j["camera"] = {
        {"deviceIndex", 0},
        {"mediaDir", "media"},
        {"videoSeconds", 10},
        {"fps", 20.0}
    };
    j["logging"] = {
        {"level", "info"}
    };
    return j;
}

std::string ConfigManager::redactSensitive(const std::string& keyPath, const std::string& value) {
    if (!isSensitiveKeyPath(keyPath)) return value;
    const auto v = trimmed(value);
    if (v.size() <= 8) return "******";
    return v.substr(0, 2) + "******" + v.substr(v.size() - 2);
}

bool ConfigManager::isUnresolvedPlaceholder(const std::string& value) {
    const auto v = trimmed(value);
    return hasPrefix(v, "${") && v.find('}') != std::string::npos;
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* v = std::getenv(name.c_str());
    if (!v || *v == '\0') return std::nullopt;
    return std::string(v);
}

bool ConfigManager::isSensitiveKeyPath(const std::string& keyPath) {
    const auto low = lowered(keyPath);
    for (const char* marker : {"apikey", "accesskey", "secret"}) {
        if (low.find(marker) != std::string::npos) return true;
    }
    return false;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (begin <= keyPath.size()) {
        const auto dot = keyPath.find('.', begin);
        const auto end = dot == std::string::npos ? keyPath.size() : dot;
        if (end > begin) parts.push_back(keyPath.substr(begin, end - begin));
        begin = end + 1;
    }
    return parts;
}

const nlohmann::json* ConfigManager::findByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* node = &root;
    for (const auto& k : parts) {
        if (!node->is_object()) return nullptr;
        const auto it = node->find(k);
        if (it == node->end()) return nullptr;
        node = &*it;
    }
    return node;
}

nlohmann::json* ConfigManager::findOrCreateByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* node = &root;
    for (const auto& k : parts) {
        if (!node->is_object()) *node = nlohmann::json::object();
        node = &(*node)[k];
    }
    return node;
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    struct EnvBinding {
        const char* env;
        const char* keyPath;
        bool numeric;
    };
    static const EnvBinding bindings[] = {
        {"PORCUPINE_ACCESS_KEY", "wakeword.porcupine.accessKey", false},
        {"VOSK_MODEL_PATH", "wakeword.vosk.modelPath", false},
        {"SGA_WAKEWORD_METHOD", "wakeword.method", false},
        {"SGA_API_KEY", "api.apiKey", false},
        {"SGA_BASE_URL", "api.baseUrl", false},
        {"SGA_SLEEP_TIMEOUT_SECONDS", "activity.sleepTimeoutSeconds", true},
        {"SGA_LOG_LEVEL", "logging.level", false},
    };

    for (const auto& b : bindings) {
        const auto env = getEnv(b.env);
        if (!env) continue;
        const auto val = trimmed(*env);
        if (val.empty()) continue;

        nlohmann::json& target = *findOrCreateByPath(root, splitKeyPath(b.keyPath));
        target = val;
        if (b.numeric) {
            // 不是合法数字时保留字符串，由 validateJson 报错
            char* end = nullptr;
            const double d = std::strtod(val.c_str(), &end);
            if (end && *end == '\0') target = d;
        }
    }
}

void ConfigManager::expandEnvPlaceholders(nlohmann::json& node) {
    if (node.is_structured()) {
        for (auto& child : node) expandEnvPlaceholders(child);
    } else if (node.is_string()) {
        node = expandEnvPlaceholdersInString(node.get<std::string>());
    }
}

// ${NAME} 替换为环境变量；未设置的保留原文
std::string ConfigManager::expandEnvPlaceholdersInString(const std::string& s) {
    std::string out;
    size_t pos = 0;
    while (pos < s.size()) {
        const auto open = s.find("${", pos);
        const auto close = open == std::string::npos ? std::string::npos : s.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(s, pos, std::string::npos);
            break;
        }
        out.append(s, pos, open - pos);
        const auto env = getEnv(s.substr(open + 2, close - open - 2));
        out += env ? *env : s.substr(open, close - open + 1);
        pos = close + 1;
    }
    return out;
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfg) {
    std::vector<std::string> out;

    for (const char* section : {"wakeword", "activity", "audio", "speech", "interruption", "responses",
                                "api", "stt", "tts", "assistant", "camera", "logging"}) {
        if (cfg.contains(section) && !cfg[section].is_object()) {
            out.push_back(std::string("Invalid '") + section + "' (object required)");
        }
    }
    if (!out.empty()) return out;

    auto positiveNumber = [&](const char* section, const char* key, bool hard) {
        if (!cfg.contains(section) || !cfg[section].contains(key)) return;
        const auto& v = cfg[section][key];
        if (!v.is_number() || v.get<double>() <= 0.0) {
            const std::string msg = std::string("Invalid '") + section + "." + key + "' (positive number required)";
            out.push_back(hard ? msg : "WARN: " + msg + ", default used");
        }
    };

    // 整数且落在 [lo, hi]；小数或超大值不能安全转换为计数
    auto integerInRange = [&](const nlohmann::json& node, const std::string& path, const char* key, double lo,
                              double hi, bool hard) {
        if (!node.is_object() || !node.contains(key)) return;
        const auto& v = node[key];
        const double d = v.is_number() ? v.get<double>() : lo - 1.0;
        if (!std::isfinite(d) || d < lo || d > hi || std::floor(d) != d) {
            const std::string msg = "Invalid '" + path + "." + key + "' (integer in [" + std::to_string(static_cast<long long>(lo)) +
                                    ", " + std::to_string(static_cast<long long>(hi)) + "] required)";
            out.push_back(hard ? msg : "WARN: " + msg + ", default used");
        }
    };

    if (cfg.contains("wakeword")) {
        const auto& w = cfg["wakeword"];
        integerInRange(w, "wakeword", "refractoryMs", 0, 60000, false);
        if (w.contains("energy")) integerInRange(w["energy"], "wakeword.energy", "window", 1, 1000, false);
        if (w.contains("method")) {
            static const std::set<std::string> known = {"model", "streaming", "energy", "porcupine", "vosk"};
            const auto method = w["method"].is_string() ? w["method"].get<std::string>() : std::string{};
            if (known.find(trimmed(lowered(method))) == known.end()) {
                out.push_back("WARN: Unknown 'wakeword.method' '" + method + "', energy detection will be used");
            }
        }
        if (w.contains("sensitivity")) {
            if (!w["sensitivity"].is_number()) {
                out.push_back("WARN: Invalid 'wakeword.sensitivity' (number required), default used");
            } else {
                const double s = w["sensitivity"].get<double>();
                if (s < 0.0 || s > 1.0) out.push_back("WARN: 'wakeword.sensitivity' outside [0,1], clamped");
            }
        }
        if (w.contains("keyword") && (!w["keyword"].is_string() || trimmed(w["keyword"].get<std::string>()).empty())) {
            out.push_back("Invalid 'wakeword.keyword' (non-empty string required)");
        }
        if (w.contains("porcupine") && w["porcupine"].is_object() && w["porcupine"].contains("accessKey")) {
            const auto& key = w["porcupine"]["accessKey"];
            if (key.is_string() && isUnresolvedPlaceholder(key.get<std::string>())) {
                out.push_back("WARN: 'wakeword.porcupine.accessKey' unresolved, keyword spotting unavailable");
            }
        }
    }

    positiveNumber("activity", "sleepTimeoutSeconds", true);
    if (cfg.contains("activity") && cfg["activity"].contains("sleepPhrases") && !cfg["activity"]["sleepPhrases"].is_array()) {
        out.push_back("Invalid 'activity.sleepPhrases' (array required)");
    }

    if (cfg.contains("audio")) {
        integerInRange(cfg["audio"], "audio", "sampleRate", 8000, 192000, true);
        integerInRange(cfg["audio"], "audio", "frameSize", 32, 8192, true);
    }
    positiveNumber("audio", "frameReadTimeoutMs", false);
    positiveNumber("speech", "listenTimeoutSeconds", false);
    positiveNumber("speech", "phraseTimeLimitSeconds", false);
    positiveNumber("interruption", "listenTimeoutSeconds", false);

    if (cfg.contains("api")) {
        const auto& api = cfg["api"];
        if (api.contains("baseUrl")) {
            const auto baseUrl = api["baseUrl"].is_string() ? trimmed(api["baseUrl"].get<std::string>()) : std::string{};
            if (!(hasPrefix(baseUrl, "http://") || hasPrefix(baseUrl, "https://"))) {
                out.push_back("WARN: Invalid 'api.baseUrl' (must start with http:// or https://)");
            }
        }
        if (api.contains("apiKey") && api["apiKey"].is_string()) {
            const auto key = api["apiKey"].get<std::string>();
            if (isUnresolvedPlaceholder(key)) {
                out.push_back("WARN: 'api.apiKey' unresolved env placeholder: " + redactSensitive("api.apiKey", key));
            }
        }
    }

    if (cfg.contains("logging") && cfg["logging"].contains("level")) {
        static const std::set<std::string> levels = {"error", "warning", "warn", "info", "debug"};
        const auto& lv = cfg["logging"]["level"];
        if (!lv.is_string() || levels.find(lv.get<std::string>()) == levels.end()) {
            out.push_back("WARN: Invalid 'logging.level', info used");
        }
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!hasPrefix(s, "WARN:")) return true;
    }
    return false;
}

// ========== 热重载 ==========

bool ConfigManager::startWatchingFile(const std::string& path, const WatchOptions& opt, ReloadCallback cb, ErrorInfo* err) {
    stopWatching();
    if (trimmed(path).empty()) {
        setError(err, ErrorType::InvalidRequest, "Empty config watch path");
        return false;
    }

    std::error_code ec;
    const auto stamp = stampOf(path, ec);
    {
        std::lock_guard<std::mutex> lk(m_watch.mu);
        m_watch.stop.store(false);
        m_watch.active = true;
        m_watch.path = path;
        m_watch.options = opt;
        m_watch.onReload = std::move(cb);
        m_watch.appliedStamp = stamp;
        m_watch.lastError.clear();
    }
    m_watch.thread = std::thread(&ConfigManager::watchLoop, this);
    return true;
}

void ConfigManager::watchLoop() {
    std::string path;
    WatchOptions opt;
    {
        std::lock_guard<std::mutex> lk(m_watch.mu);
        path = m_watch.path;
        opt = m_watch.options;
    }

    // 文件时间戳稳定 debounce 之后才重载，写入过程中的半截文件不会被读到
    std::optional<std::filesystem::file_time_type> candidate;
    auto candidateSince = std::chrono::steady_clock::now();

    for (;;) {
        std::filesystem::file_time_type applied;
        {
            std::unique_lock<std::mutex> lk(m_watch.mu);
            if (m_watch.cv.wait_for(lk, opt.pollInterval, [this] { return m_watch.stop.load(); })) return;
            applied = m_watch.appliedStamp;
        }

        std::error_code ec;
        const auto stamp = stampOf(path, ec);
        if (ec) continue;

        if (stamp == applied) {
            candidate.reset();
            continue;
        }
        if (!candidate || *candidate != stamp) {
            candidate = stamp;
            candidateSince = std::chrono::steady_clock::now();
            continue;
        }
        if (std::chrono::steady_clock::now() - candidateSince >= opt.debounce) {
            reloadFrom(path, stamp);
            candidate.reset();
        }
    }
}

void ConfigManager::setReloadError(std::string message) {
    std::lock_guard<std::mutex> lk(m_watch.mu);
    m_watch.lastError = std::move(message);
}

void ConfigManager::reloadFrom(const std::string& path, std::filesystem::file_time_type stamp) {
    const auto text = slurp(path);
    if (!text) {
        setReloadError("Failed to open file: " + path);
        return;
    }
    std::string why;
    auto doc = parseDocument(*text, why);
    if (!doc) {
        setReloadError("Reload failed: " + why);
        return;
    }
    const auto issues = validateJson(*doc);
    if (hasHardValidationErrors(issues)) {
        setReloadError("Validation failed");
        return;
    }

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = *doc;
    }
    ReloadCallback cb;
    {
        std::lock_guard<std::mutex> lk(m_watch.mu);
        m_watch.lastError.clear();
        m_watch.appliedStamp = stamp;
        cb = m_watch.onReload;
    }
    if (cb) cb(*doc, issues);
}

void ConfigManager::stopWatching() {
    {
        std::lock_guard<std::mutex> lk(m_watch.mu);
        if (!m_watch.active) return;
        m_watch.stop.store(true);
    }
    m_watch.cv.notify_all();
    if (m_watch.thread.joinable()) m_watch.thread.join();

    std::lock_guard<std::mutex> lk(m_watch.mu);
    m_watch.active = false;
    m_watch.path.clear();
    m_watch.onReload = nullptr;
    m_watch.stop.store(false);
}

bool ConfigManager::isWatching() const {
    std::lock_guard<std::mutex> lk(m_watch.mu);
    return m_watch.active;
}

std::string ConfigManager::getLastReloadError() const {
    std::lock_guard<std::mutex> lk(m_watch.mu);
    return m_watch.lastError;
}

} // namespace sga::voice
