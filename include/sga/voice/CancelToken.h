#pragma once

#include <atomic>
#include <memory>

namespace sga::voice {

/**
 * @brief 协作式取消令牌
 *
 * 拷贝共享同一标志；取消是终态，不可恢复。
 */
class CancelToken {
public:
    CancelToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_flag->store(true, std::memory_order_release); }
    bool isCancelled() const { return m_flag->load(std::memory_order_acquire); }

    // 仅在未取消时取消；返回本次调用是否完成了取消
    bool cancelIfActive() const {
        bool expected = false;
        return m_flag->compare_exchange_strong(expected, true, std::memory_order_acq_rel);
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace sga::voice
