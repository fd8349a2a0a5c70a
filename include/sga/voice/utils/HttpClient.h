#pragma once

#include "HttpTypes.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

// 前向声明，避免在头文件中包含整个 httplib.h
namespace httplib {
    class Client;
}

namespace sga::voice::utils {

/**
 * @brief HTTP客户端封装类
 *
 * 同步请求 + 基础重试，另外提供可中止的流式请求（TTS 音频流）和 multipart 上传（STT）。
 * 基于cpp-httplib实现，按 scheme://host 缓存底层连接。
 *
 * 流式请求每次使用独立的 httplib::Client：httplib 的单个 Client 会串行化请求，
 * 若与普通请求共用，播放中的 TTS 流会阻塞打断监听的 STT 请求。
 */
class HttpClient {
public:
    explicit HttpClient(const std::string& baseUrl = "");
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void setDefaultHeader(const std::string& key, const std::string& value);
    void setRetryConfig(const RetryConfig& config);
    RetryConfig getRetryConfig() const { return m_retryConfig; }
    void setTimeout(int timeoutMs);
    int getTimeout() const { return m_timeoutMs; }

    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::string& contentType = "application/json",
                      const std::map<std::string, std::string>& headers = {});

    HttpResponse postJson(const std::string& path,
                          const std::string& jsonBody,
                          const std::map<std::string, std::string>& headers = {});

    struct MultipartFile {
        std::string filename;
        std::string contentType;
        std::string data; // 内存数据
    };

    /**
     * @brief multipart/form-data POST
     */
    HttpResponse postMultipart(const std::string& path,
                               const std::map<std::string, std::string>& fields,
                               const std::map<std::string, MultipartFile>& files,
                               const std::map<std::string, std::string>& headers = {});

    /**
     * @brief 通用请求（带重试）
     */
    HttpResponse execute(const HttpRequest& request);

    /**
     * @brief 流式请求（不重试）
     *
     * 2xx 响应体按块交给 request.streamHandler；handler 返回 false 时连接被中止，
     * 返回的 response.cancelled 为 true。非 2xx 响应体照常累积到 response.body。
     * 设置了 request.abortRequested 时另起线程轮询，命中后断开连接，
     * 服务端停止发送数据也不必等到读超时。
     */
    HttpResponse executeStream(const HttpRequest& request);

    std::string buildFullUrl(const std::string& path) const;

    friend class HttpClientTestAccessor;

private:
    struct UrlParts {
        std::string origin; // scheme://host[:port]
        std::string path;   // 以 / 开头
    };

    static UrlParts splitUrl(const std::string& url);
    std::shared_ptr<httplib::Client> getOrCreateClient(const std::string& origin);
    std::shared_ptr<httplib::Client> makeClient(const std::string& origin, int timeoutMs) const;

    HttpResponse executeWithRetry(const HttpRequest& request);
    HttpResponse executeOnce(const HttpRequest& request);
    HttpResponse withRetry(const std::function<HttpResponse()>& attemptOnce);

    bool isRetryableError(const HttpResponse& response) const;
    std::map<std::string, std::string> mergeHeaders(
        const std::map<std::string, std::string>& requestHeaders) const;

    static HttpErrorType classifyStatus(int statusCode);

    std::string m_baseUrl;
    std::map<std::string, std::string> m_defaultHeaders;
    RetryConfig m_retryConfig;
    int m_timeoutMs;
    std::chrono::milliseconds m_connectionTimeout{5000};

    mutable std::mutex m_clientMutex;
    std::map<std::string, std::shared_ptr<httplib::Client>> m_clientPool;
};

} // namespace sga::voice::utils
