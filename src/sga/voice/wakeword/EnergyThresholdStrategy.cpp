#include "sga/voice/wakeword/EnergyThresholdStrategy.h"
#include "sga/voice/ErrorHandler.h"

#include <algorithm>
#include <numeric>

namespace sga::voice::wakeword {

EnergyThresholdStrategy::EnergyThresholdStrategy(const types::DetectorConfig& cfg)
    : m_floor(cfg.energyFloor)
    , m_maxWindow(std::max<std::size_t>(1, cfg.energyWindow))
    , m_sampleRate(cfg.sampleRate)
{
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning,
                               "EnergyThresholdStrategy: test-only detector, keyword '" + cfg.keyword +
                                   "' is ignored and any loud sound will wake the device");
}

bool EnergyThresholdStrategy::process(const types::AudioFrame& frame) {
    if (frame.empty()) return false;

    const double energy = frame.rms();
    m_window.push_back(energy);
    while (m_window.size() > m_maxWindow) {
        m_window.pop_front();
    }

    // 均值包含当前帧
    const double avg = std::accumulate(m_window.begin(), m_window.end(), 0.0) / static_cast<double>(m_window.size());
    if (energy > m_floor && energy > 2.0 * avg) {
        m_window.clear();
        return true;
    }
    return false;
}

} // namespace sga::voice::wakeword
