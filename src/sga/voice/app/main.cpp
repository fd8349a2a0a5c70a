#include "sga/voice/ChatAssistant.h"
#include "sga/voice/ConfigManager.h"
#include "sga/voice/ControlLoop.h"
#include "sga/voice/ErrorHandler.h"
#include "sga/voice/MicrophoneInput.h"
#include "sga/voice/OpenCvCamera.h"
#include "sga/voice/PlaybackController.h"
#include "sga/voice/SpeakerOutput.h"
#include "sga/voice/SpeechService.h"
#include "sga/voice/VoiceSettings.h"

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace sga::voice;

namespace {

std::atomic<bool> g_stopRequested{false};

void onSignal(int) {
    g_stopRequested.store(true);
}

void applyLogLevel(const std::string& level) {
    auto& logger = ErrorHandler::shared();
    auto parsed = ErrorHandler::parseLogLevel(level);
    if (!parsed) {
        logger.log(ErrorHandler::LogLevel::Warning, "Unknown logging.level '" + level + "', keeping current level");
        return;
    }
    auto cfg = logger.getLoggerConfig();
    cfg.minLevel = *parsed;
    logger.setLoggerConfig(cfg);
}

OpenCvCamera::Config loadCameraConfig(const ConfigManager& cfg) {
    OpenCvCamera::Config c;
    if (auto idx = cfg.getInteger("camera.deviceIndex", 0, 64)) c.deviceIndex = static_cast<int>(*idx);
    if (auto dir = cfg.getString("camera.mediaDir")) c.mediaDir = *dir;
    if (auto fps = cfg.getNumber("camera.fps"); fps && *fps > 0) c.fps = *fps;
    return c;
}

} // namespace

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config/voice.json";
    auto& logger = ErrorHandler::shared();

    ConfigManager config;
    ErrorInfo loadErr;
    if (!config.loadFromFile(configPath, &loadErr)) {
        std::cerr << "Failed to load config: " << loadErr.toString() << "\n";
        return 1;
    }
    if (!loadErr.message.empty()) {
        logger.log(ErrorHandler::LogLevel::Warning, loadErr.message, loadErr);
    }
    config.applyEnvironmentOverrides();

    const auto issues = config.validate();
    for (const auto& issue : issues) {
        logger.log(ErrorHandler::LogLevel::Warning, "Config: " + issue);
    }
    if (ConfigManager::hasHardValidationErrors(issues)) {
        std::cerr << "Invalid configuration: " << configPath << "\n";
        return 1;
    }

    std::vector<std::string> warnings;
    VoiceSettings settings = VoiceSettings::fromJson(config.getRaw(), &warnings);
    for (const auto& w : warnings) {
        logger.log(ErrorHandler::LogLevel::Warning, "Config: " + w);
    }
    applyLogLevel(settings.logLevel);

    SpeakerOutput speaker;
    ErrorInfo speakerErr;
    if (!speaker.initialize(&speakerErr)) {
        logger.log(ErrorHandler::LogLevel::Error, "Audio output unavailable", speakerErr);
        return 1;
    }

    MicrophoneInput mic(settings.sampleRate, settings.captureDevice);
    SpeechService speech(config);
    ChatAssistant assistant(ChatAssistant::loadConfig(config));
    OpenCvCamera camera(loadCameraConfig(config));
    PlaybackController playback(speech, speaker);

    ControlLoop loop(settings, mic, speech, assistant, playback, &camera);
    if (loop.wakeWordEngine().usedFallback()) {
        logger.log(ErrorHandler::LogLevel::Warning,
                   "Wake word backend unavailable: any loud sound will wake the device (energy detection)");
    }

    ErrorInfo micErr;
    if (!loop.start(&micErr)) {
        std::cerr << "Cannot start: " << micErr.toString() << "\n";
        return 2;
    }

    ConfigManager::WatchOptions watchOpts;
    ErrorInfo watchErr;
    const bool watching = config.startWatchingFile(
        configPath, watchOpts,
        [&loop](const nlohmann::json& next, const std::vector<std::string>& reloadIssues) {
            for (const auto& issue : reloadIssues) {
                ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning, "Config reload: " + issue);
            }
            std::vector<std::string> reloadWarnings;
            VoiceSettings updated = VoiceSettings::fromJson(next, &reloadWarnings);
            for (const auto& w : reloadWarnings) {
                ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning, "Config reload: " + w);
            }
            applyLogLevel(updated.logLevel);
            loop.applySettings(updated);
        },
        &watchErr);
    if (!watching) {
        logger.log(ErrorHandler::LogLevel::Warning, "Config hot reload disabled", watchErr);
    }

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::thread signalWatcher([&loop]() {
        while (loop.isRunning()) {
            if (g_stopRequested.load()) {
                ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, "Stop requested");
                loop.stop();
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    loop.say(settings.startupPhrase);
    loop.run();

    signalWatcher.join();
    config.stopWatching();
    return 0;
}
