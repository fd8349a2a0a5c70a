#pragma once

#include "sga/voice/ErrorTypes.h"
#include "sga/voice/wakeword/WakeWordStrategy.h"

#include <memory>
#include <string>

namespace sga::voice::wakeword {

/**
 * @brief Vosk 流式转写 + 关键词匹配
 *
 * 只在识别器给出最终结果时匹配，部分结果不触发。
 */
class StreamingTranscriptStrategy : public WakeWordStrategy {
public:
    static std::unique_ptr<StreamingTranscriptStrategy> create(const types::DetectorConfig& cfg, ErrorInfo* err);

    ~StreamingTranscriptStrategy() override;

    bool process(const types::AudioFrame& frame) override;
    std::size_t requiredFrameLength() const override { return 0; }
    uint32_t requiredSampleRate() const override;
    void reset() override;
    types::DetectionStrategy kind() const override { return types::DetectionStrategy::StreamingTranscript; }

    // 识别结果 JSON 中的 text 是否包含关键词（大小写不敏感）
    static bool resultMatchesKeyword(const std::string& resultJson, const std::string& keyword);

private:
    struct Impl;
    explicit StreamingTranscriptStrategy(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> m_impl;
};

} // namespace sga::voice::wakeword
