#include "sga/voice/SpeechService.h"

#include "sga/voice/ConfigManager.h"
#include "sga/voice/ErrorTypes.h"

#include "httplib.h"
#include "nlohmann/json.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
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

static std::string pcmBytes(std::size_t samples) {
    std::vector<int16_t> pcm(samples);
    for (std::size_t i = 0; i < samples; ++i) pcm[i] = static_cast<int16_t>(i % 1000);
    return std::string(reinterpret_cast<const char*>(pcm.data()), pcm.size() * sizeof(int16_t));
}

static SpeechService::STTConfig sttFor(int port) {
    SpeechService::STTConfig c;
    c.baseUrl = makeLocalBaseUrl(port);
    c.apiKey = "test_key_123";
    c.language = std::string("en");
    return c;
}

static SpeechService::TTSConfig ttsFor(int port) {
    SpeechService::TTSConfig c;
    c.baseUrl = makeLocalBaseUrl(port);
    c.apiKey = "test_key_123";
    c.sampleRate = 24000;
    c.chunkMs = 100;
    return c;
}

int main() {
    using mini_test::TestCase;
    std::vector<TestCase> tests;

    tests.push_back({"config_falls_back_to_shared_api_section", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({
            "api": {"baseUrl": "https://api.example.com/v1", "apiKey": "shared"},
            "stt": {"baseUrl": "", "model": "whisper-large", "language": "de"},
            "tts": {"baseUrl": "https://tts.example.com/v1", "apiKey": "own", "voice": "nova", "sampleRate": 22050, "speed": 1.25}
        })", &err));

        const auto stt = SpeechService::loadSTTConfig(cm);
        CHECK_EQ(stt.baseUrl, "https://api.example.com/v1");
        CHECK_EQ(stt.apiKey, "shared");
        CHECK_EQ(stt.modelId, "whisper-large");
        CHECK_TRUE(stt.language.has_value());
        CHECK_EQ(*stt.language, "de");

        const auto tts = SpeechService::loadTTSConfig(cm);
        CHECK_EQ(tts.baseUrl, "https://tts.example.com/v1");
        CHECK_EQ(tts.apiKey, "own");
        CHECK_EQ(tts.voice, "nova");
        CHECK_EQ(tts.sampleRate, 22050u);
        CHECK_TRUE(tts.speed.has_value());
        CHECK_EQ(tts.modelId, "tts-1");
    }});

    tests.push_back({"unresolved_key_counts_as_missing", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"api":{"baseUrl":"https://x/v1","apiKey":"${SOME_UNSET_KEY_FOR_TEST}"}})", &err));
        CHECK_TRUE(SpeechService::loadSTTConfig(cm).apiKey.empty());
        CHECK_TRUE(SpeechService::loadTTSConfig(cm).apiKey.empty());
    }});

    tests.push_back({"parse_transcription_formats", []() {
        CHECK_EQ(SpeechService::parseTranscription(R"({"text":"hello"})").value_or(""), "hello");
        CHECK_EQ(SpeechService::parseTranscription(R"({"data":{"text":"nested"}})").value_or(""), "nested");
        CHECK_FALSE(SpeechService::parseTranscription(R"({"text":""})").has_value());
        CHECK_FALSE(SpeechService::parseTranscription("not json").has_value());
        CHECK_FALSE(SpeechService::parseTranscription("[1,2]").has_value());
    }});

    tests.push_back({"transcribe_posts_wav_and_parses_text", []() {
        httplib::Server server;
        std::mutex mu;
        std::string auth;
        std::string contentType;
        server.Post("/v1/audio/transcriptions", [&](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lk(mu);
                auth = req.get_header_value("Authorization");
                contentType = req.get_header_value("Content-Type");
            }
            res.status = 200;
            res.set_content(R"({"text":"what time is it"})", "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        SpeechService speech(sttFor(port), ttsFor(port));
        const std::vector<int16_t> pcm(1600, 1200);
        auto text = speech.transcribe(pcm, 16000, std::chrono::milliseconds(5000));
        CHECK_TRUE(text.has_value());
        CHECK_EQ(*text, "what time is it");

        std::lock_guard<std::mutex> lk(mu);
        CHECK_EQ(auth, "Bearer test_key_123");
        CHECK_TRUE(contentType.find("multipart/form-data") != std::string::npos);
    }});

    tests.push_back({"transcribe_http_error_yields_nothing", []() {
        httplib::Server server;
        server.Post("/v1/audio/transcriptions", [](const httplib::Request&, httplib::Response& res) {
            res.status = 401;
            res.set_content(R"({"error":{"message":"bad key","type":"invalid_request_error"}})", "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        SpeechService speech(sttFor(port), ttsFor(port));
        CHECK_FALSE(speech.transcribe(std::vector<int16_t>(800, 500), 16000, std::chrono::milliseconds(5000)).has_value());
    }});

    tests.push_back({"transcribe_without_config_or_audio", []() {
        SpeechService speech(SpeechService::STTConfig{}, SpeechService::TTSConfig{});
        CHECK_FALSE(speech.transcribe(std::vector<int16_t>(800, 500), 16000, std::chrono::milliseconds(100)).has_value());
        CHECK_FALSE(speech.transcribe({}, 16000, std::chrono::milliseconds(100)).has_value());
    }});

    tests.push_back({"synthesize_streams_fixed_size_chunks", []() {
        httplib::Server server;
        std::mutex mu;
        std::string requestBody;
        server.Post("/v1/audio/speech", [&](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lk(mu);
                requestBody = req.body;
            }
            res.status = 200;
            res.set_content(pcmBytes(6000), "application/octet-stream");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        SpeechService speech(sttFor(port), ttsFor(port));
        std::vector<std::size_t> sizes;
        std::vector<int16_t> all;
        ErrorInfo err;
        const bool ok = speech.synthesize("It is noon", [&](const types::AudioChunk& c) {
            CHECK_EQ(c.sampleRate, 24000u);
            sizes.push_back(c.samples.size());
            all.insert(all.end(), c.samples.begin(), c.samples.end());
            return true;
        }, CancelToken{}, &err);
        CHECK_TRUE(ok);

        // 24000Hz * 100ms = 2400 采样一块，最后一块是余量
        CHECK_EQ(sizes.size(), 3u);
        CHECK_EQ(sizes[0], 2400u);
        CHECK_EQ(sizes[1], 2400u);
        CHECK_EQ(sizes[2], 1200u);
        CHECK_EQ(all.size(), 6000u);
        CHECK_EQ(all[999], static_cast<int16_t>(999));
        CHECK_EQ(all[1000], static_cast<int16_t>(0));

        std::lock_guard<std::mutex> lk(mu);
        const auto body = nlohmann::json::parse(requestBody);
        CHECK_EQ(body["input"].get<std::string>(), "It is noon");
        CHECK_EQ(body["response_format"].get<std::string>(), "pcm");
        CHECK_EQ(body["voice"].get<std::string>(), "alloy");
        CHECK_EQ(body["model"].get<std::string>(), "tts-1");
    }});

    tests.push_back({"synthesize_stops_when_callback_declines", []() {
        httplib::Server server;
        server.Post("/v1/audio/speech", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
            res.set_content(pcmBytes(24000), "application/octet-stream");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        SpeechService speech(sttFor(port), ttsFor(port));
        int chunks = 0;
        ErrorInfo err;
        const bool ok = speech.synthesize("long text", [&](const types::AudioChunk&) {
            ++chunks;
            return chunks < 2;
        }, CancelToken{}, &err);
        // 主动中止不算失败
        CHECK_TRUE(ok);
        CHECK_EQ(chunks, 2);
    }});

    tests.push_back({"synthesize_returns_promptly_when_cancelled_during_stalled_stream", []() {
        httplib::Server server;
        std::atomic<bool> release{false};
        server.Post("/v1/audio/speech", [&](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("application/octet-stream", [&](size_t, httplib::DataSink& sink) {
                const auto head = pcmBytes(2400);
                sink.write(head.data(), head.size());
                // 发完一块后停住，不再发送也不关闭
                const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
                while (!release.load() && std::chrono::steady_clock::now() < until) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                }
                sink.done();
                return true;
            });
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        auto tts = ttsFor(port);
        tts.timeoutMs = 10000;
        SpeechService speech(sttFor(port), tts);
        CancelToken token;
        std::atomic<int> chunks{0};
        std::thread canceller([&]() {
            const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(3);
            while (chunks.load() == 0 && std::chrono::steady_clock::now() < until) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            token.cancel();
        });

        ErrorInfo err;
        const auto t0 = std::chrono::steady_clock::now();
        const bool ok = speech.synthesize("a long answer", [&](const types::AudioChunk&) {
            chunks.fetch_add(1);
            return true;
        }, token, &err);
        const auto elapsed = std::chrono::steady_clock::now() - t0;
        canceller.join();
        release.store(true);

        CHECK_TRUE(ok);
        CHECK_EQ(chunks.load(), 1);
        CHECK_TRUE(token.isCancelled());
        // 远小于 10 秒读超时
        CHECK_TRUE(elapsed < std::chrono::seconds(2));
    }});

    tests.push_back({"synthesize_http_error_reports_failure", []() {
        httplib::Server server;
        server.Post("/v1/audio/speech", [](const httplib::Request&, httplib::Response& res) {
            res.status = 400;
            res.set_content(R"({"error":{"message":"voice not found","type":"invalid_request_error"}})", "application/json");
        });
        const int port = server.bind_to_any_port("127.0.0.1");
        CHECK_TRUE(port > 0);
        ServerGuard guard(server);
        guard.th = std::thread([&]() { server.listen_after_bind(); });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));

        SpeechService speech(sttFor(port), ttsFor(port));
        int chunks = 0;
        ErrorInfo err;
        CHECK_FALSE(speech.synthesize("hello", [&](const types::AudioChunk&) { ++chunks; return true; }, CancelToken{}, &err));
        CHECK_EQ(chunks, 0);
        CHECK_EQ(err.errorCode, 400);
        CHECK_TRUE(err.errorType == ErrorType::InvalidRequest);
    }});

    tests.push_back({"synthesize_without_config_fails", []() {
        SpeechService speech(SpeechService::STTConfig{}, SpeechService::TTSConfig{});
        ErrorInfo err;
        CHECK_FALSE(speech.synthesize("hello", [](const types::AudioChunk&) { return true; }, CancelToken{}, &err));
        CHECK_TRUE(err.errorType == ErrorType::InvalidRequest);
        // 空文本无事可做
        CHECK_TRUE(speech.synthesize("", [](const types::AudioChunk&) { return true; }, CancelToken{}, &err));
    }});

    return mini_test::run(tests);
}
