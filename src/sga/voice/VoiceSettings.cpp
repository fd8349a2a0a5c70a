#include "sga/voice/VoiceSettings.h"

#include "sga/voice/ConfigManager.h"

#include <algorithm>
#include <cmath>

namespace sga::voice {

namespace {

const nlohmann::json* child(const nlohmann::json& node, const char* key) {
    if (!node.is_object()) return nullptr;
    auto it = node.find(key);
    if (it == node.end()) return nullptr;
    return &(*it);
}

std::string readString(const nlohmann::json& node, const char* key, const std::string& def) {
    const auto* v = child(node, key);
    if (!v || !v->is_string()) return def;
    const auto s = v->get<std::string>();
    // 未解析的 ${ENV} 占位符视为未配置
    if (ConfigManager::isUnresolvedPlaceholder(s)) return def;
    return s;
}

double readNumber(const nlohmann::json& node, const char* key, double def) {
    const auto* v = child(node, key);
    if (!v || !v->is_number()) return def;
    return v->get<double>();
}

// 时长上限：一天
constexpr double kMaxSeconds = 86400.0;
constexpr double kMaxMillis = kMaxSeconds * 1000.0;

// 非整数或超出 [lo, hi] 时回退默认值并记录
uint32_t readCount(const nlohmann::json& node, const char* key, uint32_t def, uint32_t lo, uint32_t hi,
                   std::vector<std::string>* warnings, const char* section) {
    const double v = readNumber(node, key, def);
    if (std::isfinite(v) && std::floor(v) == v && v >= lo && v <= hi) return static_cast<uint32_t>(v);
    if (warnings) {
        warnings->push_back(std::string(section) + "." + key + " must be an integer in [" + std::to_string(lo) + ", " +
                            std::to_string(hi) + "], default used");
    }
    return def;
}

double readPositive(const nlohmann::json& node, const char* key, double def, std::vector<std::string>* warnings,
                    const char* section, double hi = kMaxSeconds) {
    const double v = readNumber(node, key, def);
    if (v > 0.0 && v <= hi) return v;
    if (warnings) {
        warnings->push_back(std::string(section) + "." + key + " must be positive and at most " + std::to_string(hi) +
                            ", default used");
    }
    return def;
}

// 调用方已保证 s 在 [0, kMaxSeconds]
std::chrono::milliseconds seconds(double s) {
    return std::chrono::milliseconds{static_cast<int64_t>(std::llround(s * 1000.0))};
}

std::chrono::milliseconds millis(double ms) {
    return std::chrono::milliseconds{static_cast<int64_t>(std::llround(std::min(std::max(ms, 0.0), kMaxMillis)))};
}

VadSettings readVad(const nlohmann::json& node, VadSettings vad) {
    vad.startThresholdDb = readNumber(node, "startThresholdDb", vad.startThresholdDb);
    vad.stopThresholdDb = readNumber(node, "stopThresholdDb", vad.stopThresholdDb);
    vad.startHold = millis(readNumber(node, "startHoldMs", static_cast<double>(vad.startHold.count())));
    vad.stopHold = millis(readNumber(node, "stopHoldMs", static_cast<double>(vad.stopHold.count())));
    vad.preRoll = millis(readNumber(node, "preRollMs", static_cast<double>(vad.preRoll.count())));
    return vad;
}

} // namespace

VoiceSettings VoiceSettings::fromJson(const nlohmann::json& root, std::vector<std::string>* warnings) {
    VoiceSettings s;
    static const nlohmann::json empty = nlohmann::json::object();
    auto section = [&](const char* name) -> const nlohmann::json& {
        const auto* v = child(root, name);
        return (v && v->is_object()) ? *v : empty;
    };

    // audio
    const auto& audio = section("audio");
    s.sampleRate = readCount(audio, "sampleRate", s.sampleRate, 8000, 192000, warnings, "audio");
    s.frameSize = readCount(audio, "frameSize", s.frameSize, 32, 8192, warnings, "audio");
    s.frameReadTimeout = millis(readPositive(audio, "frameReadTimeoutMs",
                                             static_cast<double>(s.frameReadTimeout.count()), warnings, "audio",
                                             kMaxMillis));
    s.captureDevice = readString(audio, "captureDevice", s.captureDevice);

    // wakeword
    const auto& wake = section("wakeword");
    auto& d = s.detector;
    const auto method = readString(wake, "method", types::detectionStrategyToString(d.strategy));
    if (auto strategy = types::stringToDetectionStrategy(method)) {
        d.strategy = *strategy;
    } else {
        d.strategy = types::DetectionStrategy::EnergyThreshold;
        if (warnings) warnings->push_back("unknown wakeword.method '" + method + "', using energy detection");
    }
    d.keyword = readString(wake, "keyword", d.keyword);
    const double sens = readNumber(wake, "sensitivity", d.sensitivity);
    d.sensitivity = types::DetectorConfig::clampSensitivity(sens);
    if (d.sensitivity != sens && warnings) warnings->push_back("wakeword.sensitivity clamped to [0,1]");
    d.sampleRate = s.sampleRate;
    d.frameSize = s.frameSize;
    d.refractoryMs = readCount(wake, "refractoryMs", d.refractoryMs, 0, 60000, warnings, "wakeword");

    if (const auto* energy = child(wake, "energy")) {
        d.energyFloor = readPositive(*energy, "floor", d.energyFloor, warnings, "wakeword.energy");
        d.energyWindow = readCount(*energy, "window", d.energyWindow, 1, 1000, warnings, "wakeword.energy");
    }
    if (const auto* pv = child(wake, "porcupine")) {
        d.accessKey = readString(*pv, "accessKey", d.accessKey);
        d.modelPath = readString(*pv, "modelPath", d.modelPath);
        d.keywordPath = readString(*pv, "keywordPath", d.keywordPath);
        d.keywordDir = readString(*pv, "keywordDir", d.keywordDir);
    }
    d.transcriptModelPath = "models/vosk-model-small-en-us-0.15";
    if (const auto* vosk = child(wake, "vosk")) {
        d.transcriptModelPath = readString(*vosk, "modelPath", d.transcriptModelPath);
    }

    // activity
    const auto& activity = section("activity");
    s.sleepTimeout = seconds(readPositive(activity, "sleepTimeoutSeconds", 60.0, warnings, "activity"));
    if (const auto* phrases = child(activity, "sleepPhrases"); phrases && phrases->is_array()) {
        std::vector<std::string> list;
        for (const auto& p : *phrases) {
            if (p.is_string() && !p.get<std::string>().empty()) list.push_back(p.get<std::string>());
        }
        s.sleepPhrases = std::move(list);
    }

    // speech / interruption
    const auto& speech = section("speech");
    s.capture.listenTimeout = seconds(readPositive(speech, "listenTimeoutSeconds", 5.0, warnings, "speech"));
    s.capture.phraseLimit = seconds(readPositive(speech, "phraseTimeLimitSeconds", 10.0, warnings, "speech"));
    if (const auto* vad = child(speech, "vad")) {
        s.capture.vad = readVad(*vad, s.capture.vad);
    }
    s.capture.transcribeTimeout = millis(readPositive(section("stt"), "timeoutMs", 15000.0, warnings, "stt", kMaxMillis));

    const auto& intr = section("interruption");
    s.interruption.vad = s.capture.vad;
    s.interruption.vad.startThresholdDb = readNumber(intr, "startThresholdDb", -30.0);
    s.interruption.listenTimeout = seconds(readPositive(intr, "listenTimeoutSeconds", 2.0, warnings, "interruption"));
    s.interruption.phraseLimit = s.capture.phraseLimit;
    s.interruption.transcribeTimeout = s.capture.transcribeTimeout;

    // responses
    const auto& responses = section("responses");
    s.startupPhrase = readString(responses, "startup", s.startupPhrase);
    s.farewellPhrase = readString(responses, "farewell", s.farewellPhrase);
    s.apologyPhrase = readString(responses, "apology", s.apologyPhrase);

    s.videoDuration = std::chrono::seconds{
        static_cast<int64_t>(std::llround(readPositive(section("camera"), "videoSeconds", 10.0, warnings, "camera")))};

    s.logLevel = readString(section("logging"), "level", s.logLevel);
    return s;
}

} // namespace sga::voice
