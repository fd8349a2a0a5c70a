#include "sga/voice/CommandRouter.h"

#include "sga/voice/ErrorHandler.h"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace sga::voice {

namespace {

bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (text.find(n) != std::string::npos) return true;
    }
    return false;
}

} // namespace

CommandRouter::CommandRouter(Camera* camera, std::chrono::seconds videoDuration, std::string apologyPhrase)
    : m_camera(camera)
    , m_videoDuration(videoDuration)
    , m_apology(std::move(apologyPhrase))
{
}

std::optional<CommandRouter::Command> CommandRouter::match(const std::string& utterance) {
    std::string lower = utterance;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (containsAny(lower, {"take a photo", "take photo"})) return Command::TakePhoto;
    if (containsAny(lower, {"record video", "start recording"})) return Command::RecordVideo;
    if (containsAny(lower, {"shutdown", "turn off"})) return Command::Shutdown;
    return std::nullopt;
}

const char* CommandRouter::commandToString(Command c) {
    switch (c) {
        case Command::TakePhoto: return "TakePhoto";
        case Command::RecordVideo: return "RecordVideo";
        case Command::Shutdown: return "Shutdown";
    }
    return "Unknown";
}

CommandRouter::Outcome CommandRouter::handle(const std::string& utterance, const SayFn& say) {
    auto cmd = match(utterance);
    if (!cmd) return Outcome::NotHandled;

    auto& logger = ErrorHandler::shared();
    logger.log(ErrorHandler::LogLevel::Info, std::string("Special command: ") + commandToString(*cmd));

    switch (*cmd) {
        case Command::TakePhoto: {
            say("Taking photo");
            if (!m_camera) {
                logger.log(ErrorHandler::LogLevel::Warning, "No camera available");
                say(m_apology);
                return Outcome::Handled;
            }
            ErrorInfo err;
            auto path = m_camera->takePhoto(&err);
            if (!path) {
                logger.log(ErrorHandler::LogLevel::Warning, "Photo capture failed", err);
                say(m_apology);
                return Outcome::Handled;
            }
            logger.log(ErrorHandler::LogLevel::Info, "Photo saved: " + *path);
            say("Photo saved");
            return Outcome::Handled;
        }
        case Command::RecordVideo: {
            say("Recording video");
            if (!m_camera) {
                logger.log(ErrorHandler::LogLevel::Warning, "No camera available");
                say(m_apology);
                return Outcome::Handled;
            }
            ErrorInfo err;
            auto path = m_camera->recordVideo(m_videoDuration, &err);
            if (!path) {
                logger.log(ErrorHandler::LogLevel::Warning, "Video recording failed", err);
                say(m_apology);
                return Outcome::Handled;
            }
            logger.log(ErrorHandler::LogLevel::Info, "Video saved: " + *path);
            say("Video saved");
            return Outcome::Handled;
        }
        case Command::Shutdown:
            say("Shutting down");
            return Outcome::ShutdownRequested;
    }
    return Outcome::NotHandled;
}

} // namespace sga::voice
