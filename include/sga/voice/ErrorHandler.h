#pragma once

#include "sga/voice/ErrorTypes.h"
#include "sga/voice/utils/HttpTypes.h"

#include <mutex>
#include <optional>
#include <string>

namespace sga::voice {

/**
 * @brief 错误识别与结构化日志
 *
 * 日志格式：`[epoch_ms] LEVEL message {error json}`，输出到 stderr。
 * 控制线程与播放/打断监听 worker 会并发写日志，单行输出整体加锁。
 */
class ErrorHandler {
public:
    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Info};
        bool enabled{true};
    };

    ErrorHandler() = default;
    explicit ErrorHandler(LoggerConfig cfg);

    /**
     * @brief 进程级共享实例（由 logging.level 配置）
     */
    static ErrorHandler& shared();

    void setLoggerConfig(LoggerConfig cfg);
    LoggerConfig getLoggerConfig() const;

    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    static const char* logLevelToString(LogLevel level);

    // "error" / "warning" / "warn" / "info" / "debug"（大小写不敏感）
    static std::optional<LogLevel> parseLogLevel(const std::string& text);

    // ========== 识别/解析 ==========
    static ErrorType mapHttpStatusToErrorType(int statusCode, const std::string& transportError = "");

    // 从 HttpResponse 生成 ErrorInfo（会尝试解析 body 的 API 错误 JSON）
    static ErrorInfo fromHttpResponse(const utils::HttpResponse& resp,
                                      const std::optional<std::string>& url = std::nullopt);

    // 解析 OpenAI 兼容 error JSON；非 error 结构返回 nullopt
    static std::optional<ErrorInfo> parseApiErrorJson(const nlohmann::json& root, int httpStatusCode = 0);

private:
    mutable std::mutex m_mutex;
    LoggerConfig m_loggerCfg;
};

} // namespace sga::voice
