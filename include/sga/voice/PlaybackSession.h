#pragma once

#include "sga/voice/CancelToken.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace sga::voice {

/**
 * @brief 一次回复的播放会话
 *
 * 由 PlaybackController 创建，与打断监听共享；finished/failed 只由播放 worker 写。
 * finished 表示 worker 已退出（正常播完、被取消或失败）。
 * 被取消的会话不会恢复。
 */
struct PlaybackSession {
    explicit PlaybackSession(std::string t)
        : text(std::move(t))
        , startedAt(std::chrono::steady_clock::now())
    {
    }

    const std::string text;
    const std::chrono::steady_clock::time_point startedAt;
    CancelToken token;

    std::atomic<bool> finished{false};
    std::atomic<bool> failed{false};
    std::atomic<std::size_t> chunksEmitted{0};

    bool isCancelled() const { return token.isCancelled(); }

    // 仍在播放：未结束且未取消
    bool isLive() const { return !finished.load() && !token.isCancelled(); }
};

} // namespace sga::voice
