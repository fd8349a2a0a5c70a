#include "sga/voice/ErrorHandler.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <sstream>

namespace sga::voice {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static int levelRank(ErrorHandler::LogLevel lv) {
    switch (lv) {
        case ErrorHandler::LogLevel::Error: return 0;
        case ErrorHandler::LogLevel::Warning: return 1;
        case ErrorHandler::LogLevel::Info: return 2;
        default: return 3;
    }
}

ErrorHandler::ErrorHandler(LoggerConfig cfg)
    : m_loggerCfg(cfg)
{
}

ErrorHandler& ErrorHandler::shared() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_loggerCfg = cfg;
}

ErrorHandler::LoggerConfig ErrorHandler::getLoggerConfig() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_loggerCfg;
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::parseLogLevel(const std::string& text) {
    const auto low = utils::toLowerAscii(text);
    if (low == "error") return LogLevel::Error;
    if (low == "warning" || low == "warn") return LogLevel::Warning;
    if (low == "info") return LogLevel::Info;
    if (low == "debug") return LogLevel::Debug;
    return std::nullopt;
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_loggerCfg.enabled) return;
    if (levelRank(level) > levelRank(m_loggerCfg.minLevel)) return;

    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }
    oss << "\n";
    const auto line = oss.str();
    std::fwrite(line.c_str(), 1, line.size(), stderr);
    std::fflush(stderr);
}

ErrorType ErrorHandler::mapHttpStatusToErrorType(int statusCode, const std::string& transportError) {
    if (statusCode == 0) {
        // statusCode==0 表示传输层失败；文案含 timeout/read 超时归为 Timeout
        const auto low = utils::toLowerAscii(transportError);
        if (low.find("timeout") != std::string::npos || low.find("timed out") != std::string::npos) {
            return ErrorType::TimeoutError;
        }
        return ErrorType::NetworkError;
    }
    if (statusCode == 408) return ErrorType::TimeoutError;
    if (statusCode == 429) return ErrorType::RateLimitError;
    if (statusCode >= 500 && statusCode < 600) return ErrorType::ServerError;
    if (statusCode >= 400 && statusCode < 500) return ErrorType::InvalidRequest;
    return ErrorType::UnknownError;
}

std::optional<ErrorInfo> ErrorHandler::parseApiErrorJson(const nlohmann::json& root, int httpStatusCode) {
    // {"error": {"message": "...", "type": "...", "code": "..."}}
    if (!root.is_object() || !root.contains("error")) return std::nullopt;
    const auto& e = root.at("error");

    ErrorInfo info;
    info.errorCode = httpStatusCode;
    info.errorType = mapHttpStatusToErrorType(httpStatusCode);

    if (e.is_string()) {
        info.message = e.get<std::string>();
    } else if (e.is_object()) {
        info.message = e.value("message", std::string{});
        info.details = e;
        const auto typeStr = utils::toLowerAscii(e.contains("type") && e.at("type").is_string()
            ? e.at("type").get<std::string>() : std::string{});
        if (typeStr.find("rate") != std::string::npos) info.errorType = ErrorType::RateLimitError;
        if (typeStr.find("timeout") != std::string::npos) info.errorType = ErrorType::TimeoutError;
    } else {
        return std::nullopt;
    }
    if (info.message.empty()) info.message = "API error";
    return info;
}

ErrorInfo ErrorHandler::fromHttpResponse(const utils::HttpResponse& resp, const std::optional<std::string>& url) {
    ErrorInfo info;
    info.errorCode = resp.statusCode;
    info.errorType = mapHttpStatusToErrorType(resp.statusCode, resp.error);

    std::optional<nlohmann::json> parsed;
    if (!resp.body.empty()) {
        parsed = resp.asJson();
        if (parsed.has_value()) {
            if (auto apiInfo = parseApiErrorJson(*parsed, resp.statusCode)) {
                info = *apiInfo;
            }
        }
    }

    // message：API error.message -> 传输层错误 -> body 片段
    if (info.message.empty()) {
        if (!resp.error.empty()) {
            info.message = resp.error;
        } else if (!resp.body.empty()) {
            info.message = resp.body.substr(0, 256);
        } else {
            info.message = "HTTP request failed";
        }
    }

    if (!info.details.has_value()) {
        nlohmann::json d;
        d["http_status"] = resp.statusCode;
        if (!resp.error.empty()) d["transport_error"] = resp.error;
        if (parsed.has_value()) {
            d["body_json"] = *parsed;
        } else if (!resp.body.empty()) {
            d["body_snippet"] = resp.body.substr(0, 1024);
        }
        info.details = d;
    }

    // 只记录 url，不记录 Authorization 等请求头
    if (url.has_value()) {
        info.context = std::map<std::string, std::string>{{"url", *url}};
    }
    return info;
}

} // namespace sga::voice
