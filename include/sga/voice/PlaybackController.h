#pragma once

#include "sga/voice/Collaborators.h"
#include "sga/voice/PlaybackSession.h"

#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sga::voice {

/**
 * @brief 扬声器的唯一写入者
 *
 * speak 立即返回，合成与播放在 worker 线程进行；同一时刻最多一个会话。
 * 取消检查点在每个音频块前后。
 */
class PlaybackController {
public:
    PlaybackController(SpeechSynthesizer& tts, AudioOutput& out);
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    /**
     * @brief 开始朗读；先取消并等待上一个会话结束
     * @return 新会话
     */
    std::shared_ptr<PlaybackSession> speak(const std::string& text);

    /**
     * @brief 取消当前会话
     * @return 仅当本次调用取消了一个仍在播放的会话时返回 true
     */
    bool stopSpeaking();

    // 等待当前 worker 结束
    void join();

    bool isSpeaking() const;
    std::shared_ptr<PlaybackSession> currentSession() const;

private:
    void playbackWorker(std::shared_ptr<PlaybackSession> session);
    void playSession(PlaybackSession& session);
    void markFailed(PlaybackSession& session, const std::string& reason, const ErrorInfo* err = nullptr);

    SpeechSynthesizer& m_tts;
    AudioOutput& m_out;

    mutable std::mutex m_mutex;
    std::shared_ptr<PlaybackSession> m_session;
    std::thread m_worker;
    // join 与 speak 可能来自不同线程
    std::mutex m_joinMutex;
};

} // namespace sga::voice
