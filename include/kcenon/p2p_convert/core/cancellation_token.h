/**
 * @file cancellation_token.h
 * @brief Shared cooperative cancellation flag
 */

#ifndef KCENON_P2P_CONVERT_CORE_CANCELLATION_TOKEN_H
#define KCENON_P2P_CONVERT_CORE_CANCELLATION_TOKEN_H

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace kcenon::p2p_convert {

/**
 * @brief Cooperative cancellation signal shared between a caller and a worker
 *
 * Copies share the same underlying flag. wait_for() sleeps until the timeout
 * elapses or cancel() is called, whichever comes first.
 */
class cancellation_token {
public:
    cancellation_token() : state_(std::make_shared<shared_state>()) {}

    void cancel() {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled = true;
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] auto is_cancelled() const -> bool {
        std::lock_guard lock(state_->mutex);
        return state_->cancelled;
    }

    /**
     * @brief Sleep for @p timeout unless cancelled first
     * @return true if cancelled
     */
    template <typename Rep, typename Period>
    auto wait_for(std::chrono::duration<Rep, Period> timeout) const -> bool {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled; });
    }

private:
    struct shared_state {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<shared_state> state_;
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_CANCELLATION_TOKEN_H
