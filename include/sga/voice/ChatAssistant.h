#pragma once

#include "sga/voice/Collaborators.h"
#include "sga/voice/ConfigManager.h"
#include "sga/voice/ErrorTypes.h"
#include "sga/voice/utils/HttpClient.h"

#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

namespace sga::voice {

/**
 * @brief OpenAI 兼容 /chat/completions 对话助手
 *
 * 保留最近 maxHistoryTurns 轮对话作为上下文；任何失败都转成道歉语句返回，process 不抛异常。
 */
class ChatAssistant : public Assistant {
public:
    struct Config {
        std::string baseUrl;
        std::string apiKey;
        std::string model{"gpt-4o-mini"};
        std::string systemPrompt;
        std::size_t maxHistoryTurns{6};
        int maxTokens{300};
        double temperature{0.7};
        int timeoutMs{30000};
        std::string apologyPhrase{"Sorry, I encountered an error."};
    };

    /**
     * @brief 请求失败（携带结构化 ErrorInfo），只在本类内部抛出和捕获
     */
    class RequestError : public std::runtime_error {
    public:
        explicit RequestError(const ErrorInfo& info);
        const ErrorInfo& errorInfo() const { return m_info; }

    private:
        ErrorInfo m_info;
    };

    explicit ChatAssistant(Config cfg);

    static Config loadConfig(const ConfigManager& cfg);

    std::string process(const std::string& utterance) override;

    void clearHistory();
    std::size_t historyTurns() const;

    // 构造请求体（包含 system、历史与本轮 user 消息）
    nlohmann::json buildRequestBody(const std::string& utterance) const;

    // 取 choices[0].message.content；缺失时抛 RequestError
    static std::string extractReply(const nlohmann::json& response);

private:
    struct Turn {
        std::string user;
        std::string assistant;
    };

    std::string requestCompletion(const std::string& utterance);

    Config m_cfg;
    std::unique_ptr<utils::HttpClient> m_client;
    mutable std::mutex m_mutex;
    std::deque<Turn> m_history;
};

} // namespace sga::voice
