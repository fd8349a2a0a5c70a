#include "sga/voice/ChatAssistant.h"

#include "sga/voice/ErrorHandler.h"

#include <algorithm>
#include <cctype>

namespace sga::voice {

namespace {

std::string trimCopy(std::string s) {
    auto notSpace = [](int ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

} // namespace

ChatAssistant::RequestError::RequestError(const ErrorInfo& info)
    : std::runtime_error(info.toString())
    , m_info(info)
{}

ChatAssistant::ChatAssistant(Config cfg)
    : m_cfg(std::move(cfg))
    , m_client(std::make_unique<utils::HttpClient>(m_cfg.baseUrl))
{
    m_client->setTimeout(m_cfg.timeoutMs);
    if (!m_cfg.apiKey.empty()) m_client->setDefaultHeader("Authorization", "Bearer " + m_cfg.apiKey);
    m_client->setDefaultHeader("Accept", "application/json");
}

ChatAssistant::Config ChatAssistant::loadConfig(const ConfigManager& cfg) {
    Config c;
    c.baseUrl = cfg.getString("assistant.baseUrl").value_or(cfg.getString("api.baseUrl").value_or(""));
    c.apiKey = cfg.getString("assistant.apiKey").value_or(cfg.getString("api.apiKey").value_or(""));
    if (auto m = cfg.getString("assistant.model")) c.model = *m;
    if (auto p = cfg.getString("assistant.personality")) c.systemPrompt = *p;
    if (auto h = cfg.getInteger("assistant.maxHistoryTurns", 0, 1000)) c.maxHistoryTurns = static_cast<std::size_t>(*h);
    if (auto t = cfg.getInteger("assistant.maxTokens", 1, 1000000)) c.maxTokens = static_cast<int>(*t);
    if (auto t = cfg.getNumber("assistant.temperature"); t && *t >= 0) c.temperature = *t;
    if (auto t = cfg.getInteger("api.timeoutMs", 1, 600000)) c.timeoutMs = static_cast<int>(*t);
    if (auto a = cfg.getString("responses.apology")) c.apologyPhrase = *a;
    return c;
}

nlohmann::json ChatAssistant::buildRequestBody(const std::string& utterance) const {
    nlohmann::json messages = nlohmann::json::array();
    if (!m_cfg.systemPrompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", m_cfg.systemPrompt}});
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& turn : m_history) {
            messages.push_back({{"role", "user"}, {"content", turn.user}});
            messages.push_back({{"role", "assistant"}, {"content", turn.assistant}});
        }
    }
    messages.push_back({{"role", "user"}, {"content", utterance}});

    nlohmann::json body;
    body["model"] = m_cfg.model;
    body["messages"] = std::move(messages);
    body["max_tokens"] = m_cfg.maxTokens;
    body["temperature"] = m_cfg.temperature;
    return body;
}

std::string ChatAssistant::extractReply(const nlohmann::json& response) {
    if (response.is_object()) {
        auto choices = response.find("choices");
        if (choices != response.end() && choices->is_array() && !choices->empty()) {
            const auto& first = (*choices)[0];
            auto message = first.find("message");
            if (message != first.end() && message->is_object()) {
                auto content = message->find("content");
                if (content != message->end() && content->is_string()) {
                    auto text = trimCopy(content->get<std::string>());
                    if (!text.empty()) return text;
                }
            }
        }
    }
    ErrorInfo info = ErrorInfo::make(ErrorType::UnknownError, "Response has no choices[0].message.content");
    info.details = nlohmann::json{{"body_snippet", response.dump().substr(0, 512)}};
    throw RequestError(info);
}

std::string ChatAssistant::requestCompletion(const std::string& utterance) {
    if (m_cfg.baseUrl.empty() || m_cfg.apiKey.empty()) {
        throw RequestError(ErrorInfo::make(ErrorType::InvalidRequest, "Assistant API not configured (api.baseUrl / api.apiKey)"));
    }

    const std::string endpoint = "/chat/completions";
    const auto resp = m_client->postJson(endpoint, buildRequestBody(utterance).dump());
    if (!resp.isSuccess()) {
        auto info = ErrorHandler::fromHttpResponse(resp, m_client->buildFullUrl(endpoint));
        if (!info.context.has_value()) info.context = std::map<std::string, std::string>{};
        (*info.context)["model"] = m_cfg.model;
        throw RequestError(info);
    }

    std::string parseError;
    auto parsed = resp.asJson(&parseError);
    if (!parsed.has_value()) {
        ErrorInfo info = ErrorInfo::make(ErrorType::UnknownError, "Invalid JSON response: " + parseError, resp.statusCode);
        info.details = nlohmann::json{{"body_snippet", resp.body.substr(0, 1024)}};
        throw RequestError(info);
    }
    return extractReply(*parsed);
}

std::string ChatAssistant::process(const std::string& utterance) {
    try {
        std::string reply = requestCompletion(utterance);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.push_back(Turn{utterance, reply});
        while (m_history.size() > m_cfg.maxHistoryTurns) {
            m_history.pop_front();
        }
        return reply;
    } catch (const RequestError& e) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning, "Assistant request failed", e.errorInfo());
        return m_cfg.apologyPhrase;
    } catch (const std::exception& e) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning, std::string("Assistant failed: ") + e.what());
        return m_cfg.apologyPhrase;
    }
}

void ChatAssistant::clearHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_history.clear();
}

std::size_t ChatAssistant::historyTurns() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_history.size();
}

} // namespace sga::voice
