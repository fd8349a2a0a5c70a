#include "sga/voice/ActivityClock.h"

namespace sga::voice {

ActivityClock::ActivityClock(TimeSource now)
    : m_now(now ? std::move(now) : TimeSource([] { return std::chrono::steady_clock::now(); }))
    , m_last(m_now())
{
}

void ActivityClock::touch() {
    const auto t = m_now();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last = t;
}

std::chrono::milliseconds ActivityClock::elapsed() const {
    const auto t = m_now();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (t <= m_last) return std::chrono::milliseconds{0};
    return std::chrono::duration_cast<std::chrono::milliseconds>(t - m_last);
}

ActivityClock::TimePoint ActivityClock::lastActivity() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last;
}

ActivityClock::TimePoint ActivityClock::now() const {
    return m_now();
}

} // namespace sga::voice
