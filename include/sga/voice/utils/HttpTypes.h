#pragma once

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "nlohmann/json.hpp"

namespace sga::voice::utils {

/**
 * @brief HTTP请求方法枚举
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief HTTP请求结构
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 30000;

    // 流式响应：每收到一段 2xx 响应体就回调一次；返回 false 立即中止传输
    std::function<bool(std::string_view)> streamHandler;
    // 流式请求期间轮询；返回 true 时断开连接，阻塞中的读取随之返回
    std::function<bool()> abortRequested;

    void setHeader(const std::string& key, const std::string& value) {
        headers[key] = value;
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

/**
 * @brief HTTP错误/状态分类
 */
enum class HttpErrorType {
    None,
    Network,       // statusCode == 0 or transport error
    Timeout,       // 408 or 超时
    RateLimit,     // 429
    Client,        // 4xx
    Server,        // 5xx
    Cancelled      // streamHandler 主动中止
};

inline std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief HTTP响应结构
 */
struct HttpResponse {
    int statusCode = 0;
    std::map<std::string, std::string> headers; // 小写键 -> 首值
    std::string body;
    std::string error;      // 传输层错误信息（如果有）
    bool cancelled = false; // 流式回调返回 false 导致的中止

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300 && !cancelled;
    }

    bool isServerError() const {
        return statusCode >= 500 && statusCode < 600;
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(toLowerAscii(key));
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool isJson() const {
        auto ct = getHeader("Content-Type");
        return ct.has_value() && ct->find("application/json") != std::string::npos;
    }

    /**
     * @brief 解析 JSON 响应体；失败返回 nullopt 并写出原因
     */
    std::optional<nlohmann::json> asJson(std::string* errorMsg = nullptr) const {
        try {
            return nlohmann::json::parse(body);
        } catch (const std::exception& e) {
            if (errorMsg) *errorMsg = e.what();
            return std::nullopt;
        }
    }
};

/**
 * @brief 重试配置
 */
struct RetryConfig {
    int maxRetries = 2;
    std::chrono::milliseconds initialDelay{500};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxDelay{4000};
    bool enableJitter = true;
    bool retryOnRateLimit = true;
    bool retryOnServerError = true;

    /**
     * @brief 计算第 attempt 次重试前的延迟（attempt 从 0 开始）
     */
    std::chrono::milliseconds getRetryDelay(int attempt) const {
        const double scaled = static_cast<double>(initialDelay.count()) *
                              std::pow(backoffMultiplier, attempt);
        double delay = std::min(scaled, static_cast<double>(maxDelay.count()));
        if (enableJitter) {
            const double randomFactor = (std::rand() % 200 - 100) / 100.0; // -1..1
            delay += delay * 0.2 * randomFactor;
        }
        return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(std::max(0.0, delay))};
    }
};

} // namespace sga::voice::utils
