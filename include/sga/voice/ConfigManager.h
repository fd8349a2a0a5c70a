#pragma once

#include "sga/voice/ErrorTypes.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"

namespace sga::voice {

/**
 * @brief 语音引擎配置（JSON）
 *
 * 读取顺序：文件 -> 环境变量映射（PORCUPINE_ACCESS_KEY 等）-> ${ENV} 占位符替换。
 * 组件不直接持有本类，启动时由 VoiceSettings::fromJson 生成快照；
 * HTTP 适配器通过 getString/getNumber 读取各自的段。
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    /**
     * @brief 从文件加载
     *
     * 文件不存在时使用内置默认配置并写出模板，返回 true，err 中说明回退原因。
     */
    bool loadFromFile(const std::string& path, ErrorInfo* err = nullptr);

    // 解析失败返回 false，保留旧配置
    bool loadFromString(const std::string& jsonText, ErrorInfo* err = nullptr);

    nlohmann::json getRaw() const;

    // a.b.c 形式的路径
    std::optional<nlohmann::json> get(const std::string& keyPath) const;
    bool set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err = nullptr);

    /**
     * @brief 非空且已解析的字符串；空串、非字符串、未解析的 ${ENV} 均视为未设置
     */
    std::optional<std::string> getString(const std::string& keyPath) const;
    std::optional<double> getNumber(const std::string& keyPath) const;
    /**
     * @brief 落在 [lo, hi] 的整数；小数、越界或非数字视为未设置
     */
    std::optional<long long> getInteger(const std::string& keyPath, long long lo, long long hi) const;

    void applyEnvironmentOverrides();

    // 错误与 "WARN:" 前缀的警告混在一起返回
    std::vector<std::string> validate() const;
    static std::vector<std::string> validateJson(const nlohmann::json& cfg);
    static bool hasHardValidationErrors(const std::vector<std::string>& issues);

    static nlohmann::json makeDefaultConfig();

    // 写出默认模板；密钥保持 ${ENV} 占位符
    bool saveToFile(const std::string& path, ErrorInfo* err = nullptr) const;

    static std::string redactSensitive(const std::string& keyPath, const std::string& value);
    static bool isUnresolvedPlaceholder(const std::string& value);

    // ========== 热重载 ==========
    struct WatchOptions {
        std::chrono::milliseconds pollInterval{250};
        std::chrono::milliseconds debounce{300};
    };

    // 只在新文件通过校验（无硬错误）后回调；issues 中可能仍有警告
    using ReloadCallback = std::function<void(const nlohmann::json& newConfig,
                                              const std::vector<std::string>& issues)>;

    bool startWatchingFile(const std::string& path, const WatchOptions& opt, ReloadCallback cb, ErrorInfo* err = nullptr);
    void stopWatching();
    bool isWatching() const;

    std::string getLastReloadError() const;

private:
    // 解析 + 环境变量覆盖；失败时 errMsg 给出原因
    static std::optional<nlohmann::json> parseDocument(const std::string& text, std::string& errMsg);

    static std::optional<std::string> getEnv(const std::string& name);
    static bool isSensitiveKeyPath(const std::string& keyPath);

    static std::vector<std::string> splitKeyPath(const std::string& keyPath);
    static const nlohmann::json* findByPath(const nlohmann::json& root, const std::vector<std::string>& parts);
    static nlohmann::json* findOrCreateByPath(nlohmann::json& root, const std::vector<std::string>& parts);

    static void applyEnvMappingOverrides(nlohmann::json& root);
    static void expandEnvPlaceholders(nlohmann::json& node);
    static std::string expandEnvPlaceholdersInString(const std::string& s);

    void watchLoop();
    void reloadFrom(const std::string& path, std::filesystem::file_time_type stamp);
    void setReloadError(std::string message);

    mutable std::mutex m_mu;
    nlohmann::json m_cfg;

    struct Watcher {
        mutable std::mutex mu;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        bool active{false};
        std::string path;
        WatchOptions options{};
        ReloadCallback onReload{};
        std::filesystem::file_time_type appliedStamp{};
        std::string lastError;
    };
    Watcher m_watch;
};

} // namespace sga::voice
