#pragma once

#include <chrono>
#include <functional>
#include <mutex>

namespace sga::voice {

/**
 * @brief 最近一次用户活动的时间戳
 *
 * 只有 ControlLoop 调用 touch()；时间源可注入以便测试。
 */
class ActivityClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using TimeSource = std::function<TimePoint()>;

    explicit ActivityClock(TimeSource now = nullptr);

    // 记录一次活动
    void touch();

    // 距上次活动经过的时间
    std::chrono::milliseconds elapsed() const;

    TimePoint lastActivity() const;
    TimePoint now() const;

private:
    TimeSource m_now;
    mutable std::mutex m_mutex;
    TimePoint m_last;
};

} // namespace sga::voice
