/**
 * @file retry_controller.h
 * @brief Bounded retries with exponential backoff and per-attempt deadlines
 */

#ifndef KCENON_P2P_CONVERT_CORE_RETRY_CONTROLLER_H
#define KCENON_P2P_CONVERT_CORE_RETRY_CONTROLLER_H

#include <kcenon/p2p_convert/core/cancellation_token.h>
#include <kcenon/p2p_convert/core/error_codes.h>
#include <kcenon/p2p_convert/core/logging.h>
#include <kcenon/p2p_convert/core/retry_policy.h>
#include <kcenon/p2p_convert/core/types.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

namespace kcenon::p2p_convert {

/**
 * @brief Per-attempt view handed to the attempt function
 *
 * Long-running attempts poll should_stop() and bound their blocking waits
 * by remaining() so the deadline and cancellation are honoured promptly.
 */
class attempt_context {
public:
    using clock = std::chrono::steady_clock;

    attempt_context(uint32_t attempt, clock::time_point deadline, cancellation_token token)
        : attempt_(attempt),
          deadline_(deadline),
          token_(std::move(token)),
          aborted_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] auto attempt() const -> uint32_t { return attempt_; }
    [[nodiscard]] auto deadline() const -> clock::time_point { return deadline_; }

    [[nodiscard]] auto remaining() const -> std::chrono::milliseconds {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

    [[nodiscard]] auto expired() const -> bool {
        return aborted_->load() || clock::now() >= deadline_;
    }

    [[nodiscard]] auto is_cancelled() const -> bool { return token_.is_cancelled(); }

    [[nodiscard]] auto should_stop() const -> bool { return expired() || is_cancelled(); }

    void abort() { aborted_->store(true); }

private:
    uint32_t attempt_;
    clock::time_point deadline_;
    cancellation_token token_;
    std::shared_ptr<std::atomic<bool>> aborted_;
};

/**
 * @brief Observation points of the retry loop
 */
struct retry_hooks {
    /// Called before every attempt (1-based)
    std::function<void(uint32_t attempt)> on_attempt;

    /// Called after a retryable failure, before waiting @p delay
    std::function<void(uint32_t attempt, const error& err, std::chrono::milliseconds delay)>
        on_retry;
};

/**
 * @brief Stateless retry/backoff driver
 *
 * Runs each attempt on its own thread under the policy's attempt_timeout.
 * An attempt still running at its deadline is aborted through its context
 * and, if it has not returned within max_abort_grace, abandoned: it keeps
 * its own copy of the attempt function and the loop continues with
 * attempt_timeout. A result that arrives after the deadline is discarded.
 * Retryable (network) failures are retried after the backoff delay;
 * any other failure is returned immediately. When every attempt fails the
 * result is retries_exhausted carrying the last error message.
 *
 * @code
 * auto conn = retry_controller::execute<connection_handle>(
 *     policy, token, [&](const attempt_context& ctx) { return transport->dial(peer, ctx.remaining()); });
 * @endcode
 */
class retry_controller {
public:
    template <typename T, typename AttemptFn>
    [[nodiscard]] static auto execute(const retry_policy& policy,
                                      const cancellation_token& token,
                                      AttemptFn&& attempt_fn,
                                      const retry_hooks& hooks = {}) -> result<T> {
        if (auto valid = policy.validate(); !valid) {
            return unexpected(valid.error());
        }

        error last_error{error_code::retries_exhausted, "no attempt was made"};

        for (uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
            if (token.is_cancelled()) {
                return unexpected(error{error_code::transfer_cancelled, "Transfer was cancelled"});
            }

            if (hooks.on_attempt) {
                hooks.on_attempt(attempt);
            }

            auto outcome = run_attempt<T>(policy, token, attempt, attempt_fn);
            if (outcome) {
                return outcome;
            }

            last_error = outcome.error();
            if (!is_retryable(last_error)) {
                return outcome;
            }

            if (attempt == policy.max_attempts) {
                break;
            }

            const auto delay = policy.delay_for(attempt - 1);
            P2PC_LOG_WARN(log_category::retry,
                          "Attempt " + std::to_string(attempt) + "/" +
                              std::to_string(policy.max_attempts) + " failed: " +
                              last_error.message + "; retrying in " +
                              std::to_string(delay.count()) + "ms");

            if (hooks.on_retry) {
                hooks.on_retry(attempt, last_error, delay);
            }

            if (token.wait_for(delay)) {
                return unexpected(error{error_code::transfer_cancelled, "Transfer was cancelled"});
            }
        }

        P2PC_LOG_ERROR(log_category::retry,
                       "Giving up after " + std::to_string(policy.max_attempts) +
                           " attempts: " + last_error.message);
        return unexpected(error{error_code::retries_exhausted, last_error.message});
    }

    /// Longest wait for an attempt to wind down once its deadline has passed
    static constexpr std::chrono::milliseconds max_abort_grace{250};

private:
    /**
     * @brief State owned jointly by the controller and one attempt thread
     *
     * The attempt function is copied in, so an attempt abandoned after its
     * deadline never refers to the controller's stack.
     */
    template <typename T, typename Fn>
    struct attempt_task {
        explicit attempt_task(const Fn& f) : fn(f) {}

        Fn fn;
        std::promise<result<T>> promise;
    };

    template <typename T, typename AttemptFn>
    static auto run_attempt(const retry_policy& policy,
                            const cancellation_token& token,
                            uint32_t attempt,
                            const AttemptFn& attempt_fn) -> result<T> {
        using task_type = attempt_task<T, std::decay_t<AttemptFn>>;

        attempt_context ctx(attempt, attempt_context::clock::now() + policy.attempt_timeout,
                            token);

        auto task = std::make_shared<task_type>(attempt_fn);
        auto pending = task->promise.get_future();
        try {
            std::thread([task, ctx]() {
                try {
                    task->promise.set_value(task->fn(ctx));
                } catch (const std::exception& e) {
                    task->promise.set_value(result<T>(unexpected(error{
                        error_code::internal_error, std::string("attempt threw: ") + e.what()})));
                } catch (...) {
                    task->promise.set_value(result<T>(unexpected(error{
                        error_code::internal_error, "attempt threw a non-standard exception"})));
                }
            }).detach();
        } catch (const std::system_error& e) {
            return unexpected(error{error_code::internal_error,
                                    std::string("failed to start attempt: ") + e.what()});
        }

        if (pending.wait_for(policy.attempt_timeout) == std::future_status::ready) {
            return pending.get();
        }

        // Deadline passed: ask the attempt to wind down, then give up on it.
        ctx.abort();
        const auto grace = std::min(policy.attempt_timeout, max_abort_grace);
        if (pending.wait_for(grace) == std::future_status::ready) {
            auto late = pending.get();
            if (!late && late.error().code == error_code::transfer_cancelled) {
                return late;
            }
        } else {
            P2PC_LOG_WARN(log_category::retry,
                          "Attempt " + std::to_string(attempt) +
                              " still running after its deadline; abandoning it");
        }
        return unexpected(error{error_code::attempt_timeout,
                                "attempt " + std::to_string(attempt) + " timed out after " +
                                    std::to_string(policy.attempt_timeout.count()) + "ms"});
    }
};

}  // namespace kcenon::p2p_convert

#endif  // KCENON_P2P_CONVERT_CORE_RETRY_CONTROLLER_H
