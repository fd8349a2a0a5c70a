#pragma once

namespace sga::voice::types {

/**
 * @brief 设备交互状态，仅由 ControlLoop 持有和修改
 */
enum class SessionState {
    Sleep,
    Active
};

inline const char* sessionStateToString(SessionState s) {
    return s == SessionState::Active ? "ACTIVE" : "SLEEP";
}

/**
 * @brief 当前读取麦克风的组件（每个阶段恰好一个）
 */
enum class MicConsumer {
    None,
    WakeWord,
    Capture,
    Interruption
};

inline const char* micConsumerToString(MicConsumer c) {
    switch (c) {
        case MicConsumer::WakeWord: return "WakeWord";
        case MicConsumer::Capture: return "Capture";
        case MicConsumer::Interruption: return "Interruption";
        case MicConsumer::None: return "None";
    }
    return "None";
}

} // namespace sga::voice::types
