#include "sga/voice/utils/HttpClient.h"

#include "sga/voice/ErrorHandler.h"

#include "httplib.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

namespace sga::voice::utils {

namespace {

constexpr auto kAbortPollInterval = std::chrono::milliseconds(20);

// 请求进行期间轮询 check；命中后反复 stop() 客户端直到请求结束
class AbortWatcher {
public:
    AbortWatcher(const std::function<bool()>& check, httplib::Client& client) {
        if (!check) return;
        m_thread = std::thread([this, &check, &client]() {
            while (!m_done.load()) {
                if (m_fired.load() || check()) {
                    m_fired.store(true);
                    client.stop();
                }
                std::this_thread::sleep_for(kAbortPollInterval);
            }
        });
    }

    ~AbortWatcher() {
        m_done.store(true);
        if (m_thread.joinable()) m_thread.join();
    }

    AbortWatcher(const AbortWatcher&) = delete;
    AbortWatcher& operator=(const AbortWatcher&) = delete;

    bool fired() const { return m_fired.load(); }

private:
    std::atomic<bool> m_done{false};
    std::atomic<bool> m_fired{false};
    std::thread m_thread;
};

void copyHeaders(const httplib::Headers& from, std::map<std::string, std::string>& to) {
    for (const auto& [key, value] : from) {
        to.emplace(toLowerAscii(key), value);
    }
}

std::string transportError(httplib::Error err) {
    return "Request failed: " + httplib::to_string(err);
}

} // namespace

HttpClient::HttpClient(const std::string& baseUrl)
    : m_baseUrl(baseUrl)
    , m_timeoutMs(30000)
{
    m_defaultHeaders["User-Agent"] = "SGA-Voice/1.0";
}

HttpClient::~HttpClient() = default;

void HttpClient::setDefaultHeader(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    m_defaultHeaders[key] = value;
}

void HttpClient::setRetryConfig(const RetryConfig& config) {
    m_retryConfig = config;
}

void HttpClient::setTimeout(int timeoutMs) {
    m_timeoutMs = timeoutMs;
}

// ========== 同步请求方法 ==========

HttpResponse HttpClient::get(const std::string& path,
                             const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = buildFullUrl(path);
    request.headers = mergeHeaders(headers);
    request.timeoutMs = m_timeoutMs;
    return execute(request);
}

HttpResponse HttpClient::post(const std::string& path,
                              const std::string& body,
                              const std::string& contentType,
                              const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = buildFullUrl(path);
    request.body = body;
    request.timeoutMs = m_timeoutMs;
    request.headers = mergeHeaders(headers);
    request.headers["Content-Type"] = contentType;
    return execute(request);
}

HttpResponse HttpClient::postJson(const std::string& path,
                                  const std::string& jsonBody,
                                  const std::map<std::string, std::string>& headers) {
    return post(path, jsonBody, "application/json", headers);
}

HttpResponse HttpClient::postMultipart(const std::string& path,
                                       const std::map<std::string, std::string>& fields,
                                       const std::map<std::string, MultipartFile>& files,
                                       const std::map<std::string, std::string>& headers) {
    const auto parts = splitUrl(buildFullUrl(path));

    httplib::MultipartFormDataItems items;
    for (const auto& [name, value] : fields) {
        items.push_back({name, value, "", ""});
    }
    for (const auto& [name, file] : files) {
        items.push_back({name, file.data, file.filename, file.contentType});
    }

    httplib::Headers hdrs;
    for (const auto& [key, value] : mergeHeaders(headers)) {
        // Content-Type 由 httplib 生成（带 boundary）
        if (toLowerAscii(key) == "content-type") continue;
        hdrs.emplace(key, value);
    }

    return withRetry([&]() {
        HttpResponse response;
        try {
            auto result = getOrCreateClient(parts.origin)->Post(parts.path, hdrs, items);
            if (result) {
                response.statusCode = result->status;
                response.body = result->body;
                copyHeaders(result->headers, response.headers);
            } else {
                response.error = transportError(result.error());
            }
        } catch (const std::exception& e) {
            response.error = "Exception: " + std::string(e.what());
        }
        return response;
    });
}

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return executeWithRetry(request);
}

HttpResponse HttpClient::executeStream(const HttpRequest& request) {
    HttpResponse response;
    if (!request.streamHandler) {
        return execute(request);
    }

    const auto parts = splitUrl(request.url);
    try {
        auto client = makeClient(parts.origin, request.timeoutMs);

        httplib::Request req;
        req.method = request.method == HttpMethod::POST ? "POST" : "GET";
        req.path = parts.path;
        for (const auto& [key, value] : mergeHeaders(request.headers)) {
            req.headers.emplace(key, value);
        }
        req.body = request.body;

        int status = 0;
        req.response_handler = [&](const httplib::Response& r) {
            status = r.status;
            copyHeaders(r.headers, response.headers);
            return true;
        };
        req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
            if (status < 200 || status >= 300) {
                response.body.append(data, len);
                return true;
            }
            const bool aborted = request.abortRequested && request.abortRequested();
            if (aborted || !request.streamHandler(std::string_view(data, len))) {
                response.cancelled = true;
                return false;
            }
            return true;
        };

        httplib::Response res;
        httplib::Error err = httplib::Error::Success;
        bool ok = false;
        {
            AbortWatcher watcher(request.abortRequested, *client);
            ok = client->send(req, res, err);
            if (watcher.fired()) response.cancelled = true;
        }
        response.statusCode = status != 0 ? status : res.status;
        if (!ok && !response.cancelled) {
            response.statusCode = 0;
            response.error = transportError(err);
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = "Exception: " + std::string(e.what());
    }
    return response;
}

// ========== 私有方法 ==========

HttpClient::UrlParts HttpClient::splitUrl(const std::string& url) {
    UrlParts parts;
    const auto schemePos = url.find("://");
    const auto hostStart = schemePos == std::string::npos ? 0 : schemePos + 3;
    const auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        parts.origin = url;
        parts.path = "/";
    } else {
        parts.origin = url.substr(0, pathStart);
        parts.path = url.substr(pathStart);
    }
    return parts;
}

std::shared_ptr<httplib::Client> HttpClient::makeClient(const std::string& origin, int timeoutMs) const {
    auto client = std::make_shared<httplib::Client>(origin);
    const auto connectMs = m_connectionTimeout.count();
    client->set_connection_timeout(static_cast<time_t>(connectMs / 1000),
                                   static_cast<time_t>((connectMs % 1000) * 1000));
    client->set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
    client->set_write_timeout(5, 0);
    client->set_follow_location(true);
    return client;
}

std::shared_ptr<httplib::Client> HttpClient::getOrCreateClient(const std::string& origin) {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    auto it = m_clientPool.find(origin);
    if (it != m_clientPool.end()) {
        return it->second;
    }
    auto client = makeClient(origin, m_timeoutMs);
    m_clientPool[origin] = client;
    return client;
}

HttpResponse HttpClient::executeWithRetry(const HttpRequest& request) {
    return withRetry([&]() { return executeOnce(request); });
}

HttpResponse HttpClient::withRetry(const std::function<HttpResponse()>& attemptOnce) {
    for (int attempt = 0;; ++attempt) {
        HttpResponse response = attemptOnce();
        if (response.isSuccess() || !isRetryableError(response) || attempt >= m_retryConfig.maxRetries) {
            return response;
        }
        const auto delay = m_retryConfig.getRetryDelay(attempt);
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Debug,
                                   "HTTP " + std::to_string(response.statusCode) + " " + response.error +
                                       ", retry " + std::to_string(attempt + 1) + " in " +
                                       std::to_string(delay.count()) + "ms");
        std::this_thread::sleep_for(delay);
    }
}

HttpResponse HttpClient::executeOnce(const HttpRequest& request) {
    HttpResponse response;
    try {
        const auto parts = splitUrl(request.url);
        auto client = getOrCreateClient(parts.origin);

        // Content-Type 通过 httplib 的参数传递，避免重复头
        httplib::Headers headers;
        for (const auto& [key, value] : mergeHeaders(request.headers)) {
            if (toLowerAscii(key) == "content-type") continue;
            headers.emplace(key, value);
        }

        httplib::Result result;
        switch (request.method) {
            case HttpMethod::GET:
                result = client->Get(parts.path, headers);
                break;
            case HttpMethod::POST:
                result = client->Post(parts.path, headers, request.body,
                                      request.getHeader("Content-Type").value_or("application/json"));
                break;
        }

        if (result) {
            response.statusCode = result->status;
            response.body = result->body;
            copyHeaders(result->headers, response.headers);
        } else {
            response.statusCode = 0;
            response.error = transportError(result.error());
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = "Exception: " + std::string(e.what());
    }
    return response;
}

std::string HttpClient::buildFullUrl(const std::string& path) const {
    if (m_baseUrl.empty() || path.find("://") != std::string::npos) {
        return path;
    }
    std::string fullUrl = m_baseUrl;
    if (path.empty()) return fullUrl;
    if (fullUrl.back() == '/' && path.front() == '/') {
        fullUrl.pop_back();
    } else if (fullUrl.back() != '/' && path.front() != '/') {
        fullUrl += '/';
    }
    fullUrl += path;
    return fullUrl;
}

bool HttpClient::isRetryableError(const HttpResponse& response) const {
    if (response.cancelled) return false;
    switch (classifyStatus(response.statusCode)) {
        case HttpErrorType::Network:
        case HttpErrorType::Timeout:
            return true;
        case HttpErrorType::RateLimit:
            return m_retryConfig.retryOnRateLimit;
        case HttpErrorType::Server:
            return m_retryConfig.retryOnServerError;
        default:
            return false;
    }
}

std::map<std::string, std::string> HttpClient::mergeHeaders(
    const std::map<std::string, std::string>& requestHeaders) const {
    std::lock_guard<std::mutex> lock(m_clientMutex);
    std::map<std::string, std::string> merged = m_defaultHeaders;
    for (const auto& [k, v] : requestHeaders) {
        merged[k] = v;
    }
    return merged;
}

HttpErrorType HttpClient::classifyStatus(int statusCode) {
    if (statusCode == 0) return HttpErrorType::Network;
    if (statusCode == 408) return HttpErrorType::Timeout;
    if (statusCode == 429) return HttpErrorType::RateLimit;
    if (statusCode >= 500 && statusCode < 600) return HttpErrorType::Server;
    if (statusCode >= 400 && statusCode < 500) return HttpErrorType::Client;
    return HttpErrorType::None;
}

} // namespace sga::voice::utils
