#pragma once

#include "sga/voice/ErrorTypes.h"
#include "sga/voice/wakeword/WakeWordStrategy.h"

#include <memory>
#include <string>

namespace sga::voice::wakeword {

/**
 * @brief Porcupine 关键词检出
 *
 * 帧长与采样率由 Porcupine 决定（通常 512 / 16000）。
 */
class SpottingModelStrategy : public WakeWordStrategy {
public:
    /**
     * @brief 创建策略；缺少 access key / 模型 / 关键词文件或初始化失败时返回 nullptr
     */
    static std::unique_ptr<SpottingModelStrategy> create(const types::DetectorConfig& cfg, ErrorInfo* err);

    ~SpottingModelStrategy() override;

    bool process(const types::AudioFrame& frame) override;
    std::size_t requiredFrameLength() const override;
    uint32_t requiredSampleRate() const override;
    void reset() override {}
    types::DetectionStrategy kind() const override { return types::DetectionStrategy::SpottingModel; }

    /**
     * @brief 唤醒短语 -> Porcupine 内置关键词名（未知短语回退 computer）
     */
    static std::string builtinKeywordFor(const std::string& phrase);

    /**
     * @brief 解析关键词文件路径：显式 keywordPath 优先，否则 `<keywordDir>/<name>_linux.ppn`
     */
    static std::string resolveKeywordPath(const types::DetectorConfig& cfg);

private:
    struct Impl;
    explicit SpottingModelStrategy(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> m_impl;
};

} // namespace sga::voice::wakeword
