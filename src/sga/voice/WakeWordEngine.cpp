#include "sga/voice/WakeWordEngine.h"

#include "sga/voice/ErrorHandler.h"
#include "sga/voice/wakeword/EnergyThresholdStrategy.h"
#include "sga/voice/wakeword/SpottingModelStrategy.h"
#include "sga/voice/wakeword/StreamingTranscriptStrategy.h"

#include <algorithm>
#include <exception>

namespace sga::voice {

using types::DetectionStrategy;

WakeWordEngine::StrategyFactories WakeWordEngine::StrategyFactories::defaults() {
    StrategyFactories f;
    f.spottingModel = [](const types::DetectorConfig& cfg, ErrorInfo* err) -> std::unique_ptr<wakeword::WakeWordStrategy> {
        return wakeword::SpottingModelStrategy::create(cfg, err);
    };
    f.streamingTranscript = [](const types::DetectorConfig& cfg, ErrorInfo* err) -> std::unique_ptr<wakeword::WakeWordStrategy> {
        return wakeword::StreamingTranscriptStrategy::create(cfg, err);
    };
    f.energyThreshold = [](const types::DetectorConfig& cfg, ErrorInfo*) -> std::unique_ptr<wakeword::WakeWordStrategy> {
        return std::make_unique<wakeword::EnergyThresholdStrategy>(cfg);
    };
    return f;
}

std::vector<DetectionStrategy> WakeWordEngine::fallbackChain(DetectionStrategy preferred) {
    std::vector<DetectionStrategy> chain{preferred};
    if (preferred != DetectionStrategy::EnergyThreshold) {
        chain.push_back(DetectionStrategy::EnergyThreshold);
    }
    return chain;
}

const WakeWordEngine::StrategyFactory* WakeWordEngine::factoryFor(const StrategyFactories& factories,
                                                                  DetectionStrategy s) {
    switch (s) {
        case DetectionStrategy::SpottingModel: return &factories.spottingModel;
        case DetectionStrategy::StreamingTranscript: return &factories.streamingTranscript;
        case DetectionStrategy::EnergyThreshold: return &factories.energyThreshold;
    }
    return &factories.energyThreshold;
}

std::unique_ptr<WakeWordEngine> WakeWordEngine::create(const types::DetectorConfig& cfg,
                                                       const StrategyFactories& factories) {
    auto& logger = ErrorHandler::shared();
    types::DetectorConfig effective = cfg;
    effective.sensitivity = types::DetectorConfig::clampSensitivity(cfg.sensitivity);

    std::unique_ptr<wakeword::WakeWordStrategy> strategy;
    for (DetectionStrategy s : fallbackChain(effective.strategy)) {
        const StrategyFactory* factory = factoryFor(factories, s);
        if (!*factory) {
            logger.log(ErrorHandler::LogLevel::Warning,
                       std::string("Wake word strategy '") + types::detectionStrategyToString(s) + "' has no factory");
            continue;
        }

        ErrorInfo err;
        try {
            strategy = (*factory)(effective, &err);
        } catch (const std::exception& e) {
            // 后端库加载/初始化抛出时按不可用处理，继续下一个
            strategy.reset();
            err = ErrorInfo::make(ErrorType::BackendUnavailable, std::string("backend init threw: ") + e.what());
        }
        if (strategy) break;
        logger.log(ErrorHandler::LogLevel::Warning,
                   std::string("Wake word strategy '") + types::detectionStrategyToString(s) + "' unavailable",
                   err);
    }

    if (!strategy) {
        strategy = std::make_unique<wakeword::EnergyThresholdStrategy>(effective);
    }

    const bool fallback = strategy->kind() != effective.strategy;
    if (fallback) {
        logger.log(ErrorHandler::LogLevel::Warning,
                   std::string("Wake word detection degraded: requested '") +
                       types::detectionStrategyToString(effective.strategy) + "', using '" +
                       types::detectionStrategyToString(strategy->kind()) + "'");
    } else {
        logger.log(ErrorHandler::LogLevel::Info,
                   std::string("Wake word strategy '") + types::detectionStrategyToString(strategy->kind()) +
                       "' ready, keyword '" + effective.keyword + "'");
    }

    return std::unique_ptr<WakeWordEngine>(new WakeWordEngine(std::move(effective), std::move(strategy), fallback));
}

WakeWordEngine::WakeWordEngine(types::DetectorConfig cfg,
                               std::unique_ptr<wakeword::WakeWordStrategy> strategy,
                               bool usedFallback)
    : m_config(std::move(cfg))
    , m_strategy(std::move(strategy))
    , m_usedFallback(usedFallback)
{
}

bool WakeWordEngine::detect(const types::AudioFrame& frame) {
    const std::size_t required = m_strategy->requiredFrameLength();
    if (required != 0 && frame.size() != required) {
        ErrorHandler::shared().log(ErrorHandler::LogLevel::Debug,
                                   "WakeWordEngine: dropping frame of " + std::to_string(frame.size()) +
                                       " samples, strategy expects " + std::to_string(required));
        return false;
    }

    const bool hit = m_strategy->process(frame);

    if (m_refractoryRemaining > 0) {
        m_refractoryRemaining -= std::min<uint64_t>(m_refractoryRemaining, frame.size());
        return false;
    }
    if (!hit) return false;

    const uint32_t rate = frame.sampleRate != 0 ? frame.sampleRate : sampleRate();
    m_refractoryRemaining = static_cast<uint64_t>(m_config.refractoryMs) * rate / 1000;
    return true;
}

std::size_t WakeWordEngine::frameLength() const {
    const std::size_t required = m_strategy->requiredFrameLength();
    return required != 0 ? required : m_config.frameSize;
}

uint32_t WakeWordEngine::sampleRate() const {
    const uint32_t rate = m_strategy->requiredSampleRate();
    return rate != 0 ? rate : m_config.sampleRate;
}

void WakeWordEngine::reset() {
    m_strategy->reset();
    m_refractoryRemaining = 0;
}

} // namespace sga::voice
