#pragma once

#include "sga/voice/ErrorTypes.h"
#include "sga/voice/types/AudioFrame.h"
#include "sga/voice/types/DetectorConfig.h"
#include "sga/voice/wakeword/WakeWordStrategy.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

namespace sga::voice {

/**
 * @brief 唤醒词引擎
 *
 * 持有一个检测策略，按 fallbackChain 依次尝试构造；能量策略不会失败，所以 create 总能成功。
 * 触发后在 refractoryMs 的音频时长内不再返回 true，期间帧仍交给策略处理。
 * 只在控制线程使用，不加锁。
 */
class WakeWordEngine {
public:
    using StrategyFactory =
        std::function<std::unique_ptr<wakeword::WakeWordStrategy>(const types::DetectorConfig&, ErrorInfo*)>;

    /**
     * @brief 各策略的构造函数表（测试可注入失败的工厂）
     */
    struct StrategyFactories {
        StrategyFactory spottingModel;
        StrategyFactory streamingTranscript;
        StrategyFactory energyThreshold;

        // Porcupine / Vosk / 能量 三个真实实现
        static StrategyFactories defaults();
    };

    /**
     * @brief 构造顺序：[preferred, EnergyThreshold]（去重）
     */
    static std::vector<types::DetectionStrategy> fallbackChain(types::DetectionStrategy preferred);

    static std::unique_ptr<WakeWordEngine> create(const types::DetectorConfig& cfg,
                                                  const StrategyFactories& factories = StrategyFactories::defaults());

    WakeWordEngine(const WakeWordEngine&) = delete;
    WakeWordEngine& operator=(const WakeWordEngine&) = delete;

    /**
     * @brief 处理一帧
     * @return 本帧确认唤醒返回 true；帧长不符策略要求时返回 false
     */
    bool detect(const types::AudioFrame& frame);

    // 控制循环读取麦克风时应使用的帧长/采样率
    std::size_t frameLength() const;
    uint32_t sampleRate() const;

    types::DetectionStrategy activeStrategy() const { return m_strategy->kind(); }
    bool usedFallback() const { return m_usedFallback; }
    const types::DetectorConfig& config() const { return m_config; }

    // 清空策略内部状态和不应期（进入 SLEEP 时调用）
    void reset();

private:
    WakeWordEngine(types::DetectorConfig cfg, std::unique_ptr<wakeword::WakeWordStrategy> strategy, bool usedFallback);

    static const StrategyFactory* factoryFor(const StrategyFactories& factories, types::DetectionStrategy s);

    types::DetectorConfig m_config;
    std::unique_ptr<wakeword::WakeWordStrategy> m_strategy;
    bool m_usedFallback{false};
    // 剩余不应期（采样数）
    uint64_t m_refractoryRemaining{0};
};

} // namespace sga::voice
