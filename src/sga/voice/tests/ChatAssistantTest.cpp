#include "sga/voice/ChatAssistant.h"

#include "sga/voice/ConfigManager.h"
#include "sga/voice/ErrorTypes.h"

#include "httplib.h"
#include "nlohmann/json.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace sga::voice;

// 轻量自测断言工具
namespace mini_test {

inline std::string toString(const std::string& v) { return v; }
inline std::string toString(const char* v) { return v ? std::string(v) : "null"; }
inline std::string toString(bool v) { return v ? "true" : "false"; }

template <typename T>
std::string toString(const T& v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

class AssertionFailed : public std::runtime_error {
public:
    explicit AssertionFailed(const std::string& msg) : std::runtime_error(msg) {}
};

#define CHECK_TRUE(cond)                                                                          \
    do {                                                                                          \
        if (!(cond))                                                                              \
            throw mini_test::AssertionFailed(std::string("CHECK_TRUE failed: ") + #cond);         \
    } while (0)

#define CHECK_FALSE(cond) CHECK_TRUE(!(cond))

#define CHECK_EQ(a, b)                                                                            \
    do {                                                                                          \
        const auto _va = (a);                                                                     \
        const auto _vb = (b);                                                                     \
        if (!(_va == _vb)) {                                                                      \
            throw mini_test::AssertionFailed(std::string("CHECK_EQ failed: ") + #a " vs " #b +    \
                                             " (" + mini_test::toString(_va) + " vs " +           \
                                             mini_test::toString(_vb) + ")");                     \
        }                                                                                         \
    } while (0)

struct TestCase {
    std::string name;
    std::function<void()> fn;
};

inline int run(const std::vector<TestCase>& tests) {
    int failed = 0;
    for (const auto& t : tests) {
        try {
            t.fn();
            std::cout << "[  OK  ] " << t.name << "\n";
        } catch (const AssertionFailed& e) {
            failed++;
            std::cout << "[ FAIL ] " << t.name << " :: " << e.what() << "\n";
        } catch (const std::exception& e) {
            failed++;
            std::cout << "[ EXC  ] " << t.name << " :: " << e.what() << "\n";
        } catch (...) {
            failed++;
            std::cout << "[ EXC  ] " << t.name << " :: unknown exception\n";
        }
    }
    std::cout << "Executed " << tests.size() << " cases, failed " << failed << ".\n";
    return failed == 0 ? 0 : 1;
}

} // namespace mini_test

static std::string makeLocalBaseUrl(int port) {
    return "http://127.0.0.1:" + std::to_string(port) + "/v1";
}

struct ServerGuard {
    httplib::Server& server;
    std::thread th;
    explicit ServerGuard(httplib::Server& s) : server(s) {}
    ~ServerGuard() {
        server.stop();
        if (th.joinable()) th.join();
    }
};

static std::string completionBody(const std::string& content) {
    nlohmann::json j;
    j["id"] = "chatcmpl-test";
    j["object"] = "chat.completion";
    j["choices"] = nlohmann::json::array({
        {{"index", 0}, {"message", {{"role", "assistant"}, {"content", content}}}, {"finish_reason", "stop"}}
    });
    return j.dump();
}

static ChatAssistant::Config configFor(int port) {
    ChatAssistant::Config c;
    c.baseUrl = makeLocalBaseUrl(port);
    c.apiKey = "test_key_123";
    c.systemPrompt = "You are a helpful assistant in smart glasses.";
    c.apologyPhrase = "Sorry, something went wrong.";
    return c;
}

int main() {
    using mini_test::TestCase;
    std::vector<TestCase> tests;

    tests.push_back({"load_config_reads_assistant_and_api_sections", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({
            "api": {"baseUrl": "https://api.example.com/v1", "apiKey": "shared", "timeoutMs": 12000},
            "assistant": {"model": "gpt-test", "personality": "Be brief.", "maxHistoryTurns": 3, "maxTokens": 64, "temperature": 0.2},
            "responses": {"apology": "My apologies."}
        })", &err));

        const auto c = ChatAssistant::loadConfig(cm);
        CHECK_EQ(c.baseUrl, "https://api.example.com/v1");
        CHECK_EQ(c.apiKey, "shared");
        CHECK_EQ(c.model, "gpt-test");
        CHECK_EQ(c.systemPrompt, "Be brief.");
        CHECK_EQ(c.maxHistoryTurns, 3u);
        CHECK_EQ(c.maxTokens, 64);
        CHECK_EQ(c.timeoutMs, 12000);
        CHECK_EQ(c.apologyPhrase, "My apologies.");
    }});

    tests.push_back({"build_request_body_carries_system_and_history", []() {
        ChatAssistant::Config c;
        c.systemPrompt = "Be brief.";
        c.maxTokens = 50;
        ChatAssistant assistant(c);

        const auto body = assistant.buildRequestBody("hello");
        CHECK_EQ(body["model"].get<std::string>(), "gpt-4o-mini");
        CHECK_EQ(body["max_tokens"].get<int>(), 50);
        CHECK_EQ(body["messages"].size(), 2u);
        CHECK_EQ(body["messages"][0]["role"].get<std::string>(), "system");
        CHECK_EQ(body["messages"][1]["role"].get<std::string>(), "user");
        CHECK_EQ(body["messages"][1]["content"].get<std::string>(), "hello");

        ChatAssistant plain(ChatAssistant::Config{});
        CHECK_EQ(plain.buildRequestBody("hi")["messages"].size(), 1u);
    }});

    tests.push_back({"extract_reply_trims_or_throws", []() {
        CHECK_EQ(ChatAssistant::extractReply(nlohmann::json::parse(completionBody("  It is noon.\n"))), "It is noon.");

        bool threw = false;
        try {
            ChatAssistant::extractReply(nlohmann::json::parse(R"({"choices":[]})"));
        } catch (const ChatAssistant::RequestError& e) {
            threw = true;
            CHECK_TRUE(e.errorInfo().errorType == ErrorType::UnknownError);
        }
        CHECK_TRUE(threw);

        threw = false;
        try {
            ChatAssistant::extractReply(nlohmann::json::parse(completionBody("   ")));
        } catch (const ChatAssistant::RequestError&) {
            threw = true;
        }
        CHECK_TRUE(threw);
    }});

    tests.push_back({"process_returns_reply_and_keeps_history", []() {
        httplib::Server server;
        std::mutex mu;
        std::vector<nlohmann::json> bodies;
        std::string auth;
        server.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
            std::size_t n = 0;
            {
                std::lock_guard<std::mutex> lk(mu);
                auth = req.get_header_value("Authorization");
                bodies.push_back(nlohmann::json::parse(req.body));
                n = bodies.size();
            }
            res.status = 200;
            res.set_content(completionBody("reply " + std::to_string(n)), "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        ChatAssistant assistant(configFor(port));
        CHECK_EQ(assistant.process("what time is it"), "reply 1");
        CHECK_EQ(assistant.process("and the date"), "reply 2");
        CHECK_EQ(assistant.historyTurns(), 2u);

        std::lock_guard<std::mutex> lk(mu);
        CHECK_EQ(auth, "Bearer test_key_123");
        CHECK_EQ(bodies.size(), 2u);
        // system + 上一轮 user/assistant + 本轮 user
        const auto& msgs = bodies[1]["messages"];
        CHECK_EQ(msgs.size(), 4u);
        CHECK_EQ(msgs[1]["content"].get<std::string>(), "what time is it");
        CHECK_EQ(msgs[2]["role"].get<std::string>(), "assistant");
        CHECK_EQ(msgs[2]["content"].get<std::string>(), "reply 1");
        CHECK_EQ(msgs[3]["content"].get<std::string>(), "and the date");
    }});

    tests.push_back({"history_is_bounded", []() {
        httplib::Server server;
        std::mutex mu;
        std::vector<std::size_t> messageCounts;
        server.Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lk(mu);
                messageCounts.push_back(nlohmann::json::parse(req.body)["messages"].size());
            }
            res.status = 200;
            res.set_content(completionBody("ok"), "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        auto cfg = configFor(port);
        cfg.maxHistoryTurns = 2;
        ChatAssistant assistant(cfg);
        for (int i = 0; i < 4; ++i) {
            CHECK_EQ(assistant.process("turn " + std::to_string(i)), "ok");
        }
        CHECK_EQ(assistant.historyTurns(), 2u);

        std::lock_guard<std::mutex> lk(mu);
        CHECK_EQ(messageCounts.size(), 4u);
        CHECK_EQ(messageCounts[0], 2u);
        CHECK_EQ(messageCounts[1], 4u);
        CHECK_EQ(messageCounts[2], 6u);
        CHECK_EQ(messageCounts[3], 6u);

        assistant.clearHistory();
        CHECK_EQ(assistant.historyTurns(), 0u);
    }});

    tests.push_back({"http_error_turns_into_apology", []() {
        httplib::Server server;
        server.Post("/v1/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            res.status = 401;
            res.set_content(R"({"error":{"message":"Invalid API key","type":"invalid_request_error"}})", "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        ChatAssistant assistant(configFor(port));
        CHECK_EQ(assistant.process("hello"), "Sorry, something went wrong.");
        CHECK_EQ(assistant.historyTurns(), 0u);
    }});

    tests.push_back({"malformed_response_turns_into_apology", []() {
        httplib::Server server;
        server.Post("/v1/chat/completions", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
            res.set_content("this is not json", "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        ChatAssistant assistant(configFor(port));
        CHECK_EQ(assistant.process("hello"), "Sorry, something went wrong.");
    }});

    tests.push_back({"unconfigured_assistant_apologises", []() {
        ChatAssistant::Config c;
        c.apologyPhrase = "Sorry.";
        ChatAssistant assistant(c);
        CHECK_EQ(assistant.process("hello"), "Sorry.");
    }});

    return mini_test::run(tests);
}
