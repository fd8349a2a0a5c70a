#include "sga/voice/PlaybackController.h"

#include "sga/voice/ErrorHandler.h"

#include <exception>

namespace sga::voice {

PlaybackController::PlaybackController(SpeechSynthesizer& tts, AudioOutput& out)
    : m_tts(tts)
    , m_out(out)
{
}

PlaybackController::~PlaybackController() {
    stopSpeaking();
    join();
}

std::shared_ptr<PlaybackSession> PlaybackController::speak(const std::string& text) {
    std::lock_guard<std::mutex> joinLock(m_joinMutex);
    stopSpeaking();
    if (m_worker.joinable()) {
        m_worker.join();
    }

    auto session = std::make_shared<PlaybackSession>(text);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_session = session;
    }
    m_worker = std::thread(&PlaybackController::playbackWorker, this, session);
    return session;
}

bool PlaybackController::stopSpeaking() {
    std::shared_ptr<PlaybackSession> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        session = m_session;
    }
    if (!session || session->finished.load()) return false;
    if (!session->token.cancelIfActive()) return false;

    ErrorHandler::shared().log(ErrorHandler::LogLevel::Debug, "Playback cancelled");
    return true;
}

void PlaybackController::join() {
    std::lock_guard<std::mutex> joinLock(m_joinMutex);
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool PlaybackController::isSpeaking() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session && m_session->isLive();
}

std::shared_ptr<PlaybackSession> PlaybackController::currentSession() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_session;
}

void PlaybackController::playbackWorker(std::shared_ptr<PlaybackSession> session) {
    try {
        playSession(*session);
    } catch (const std::exception& e) {
        markFailed(*session, std::string("playback worker exception: ") + e.what());
        m_out.cancel();
    }
    session->finished.store(true);
}

void PlaybackController::playSession(PlaybackSession& session) {
    const CancelToken& token = session.token;
    bool outputFailed = false;

    auto onChunk = [&](const types::AudioChunk& chunk) -> bool {
        if (token.isCancelled()) return false;
        if (!m_out.playChunk(chunk, token)) {
            if (!token.isCancelled()) outputFailed = true;
            return false;
        }
        session.chunksEmitted.fetch_add(1);
        return !token.isCancelled();
    };

    ErrorInfo err;
    const bool ok = m_tts.synthesize(session.text, onChunk, token, &err);

    if (outputFailed) {
        markFailed(session, "audio output rejected chunk");
        m_out.cancel();
        return;
    }
    if (token.isCancelled()) {
        m_out.cancel();
        return;
    }
    if (!ok) {
        markFailed(session, "speech synthesis failed", &err);
        m_out.cancel();
        return;
    }

    if (!m_out.drain(token)) {
        if (!token.isCancelled()) {
            markFailed(session, "audio output drain failed");
        }
        m_out.cancel();
    }
}

void PlaybackController::markFailed(PlaybackSession& session, const std::string& reason, const ErrorInfo* err) {
    session.failed.store(true);
    session.token.cancel();
    std::optional<ErrorInfo> info;
    if (err) info = *err;
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Warning, "Playback failed: " + reason, info);
}

} // namespace sga::voice
