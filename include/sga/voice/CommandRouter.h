#pragma once

#include "sga/voice/Collaborators.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace sga::voice {

/**
 * @brief 在交给助手之前处理的设备命令（拍照、录像、关机）
 */
class CommandRouter {
public:
    enum class Command {
        TakePhoto,
        RecordVideo,
        Shutdown
    };

    enum class Outcome {
        NotHandled,
        Handled,
        ShutdownRequested
    };

    // 阻塞朗读一句提示
    using SayFn = std::function<void(const std::string&)>;

    /**
     * @param camera 可为空；为空时拍照/录像回复道歉
     */
    CommandRouter(Camera* camera, std::chrono::seconds videoDuration, std::string apologyPhrase);

    static std::optional<Command> match(const std::string& utterance);
    static const char* commandToString(Command c);

    Outcome handle(const std::string& utterance, const SayFn& say);

    void setApologyPhrase(std::string phrase) { m_apology = std::move(phrase); }

private:
    Camera* m_camera;
    std::chrono::seconds m_videoDuration;
    std::string m_apology;
};

} // namespace sga::voice
