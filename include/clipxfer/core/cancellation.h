/**
 * @file cancellation.h
 * @brief Cooperative cancellation for the polling loops
 */

#ifndef CLIPXFER_CORE_CANCELLATION_H
#define CLIPXFER_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace clipxfer {

/**
 * @brief Shared cancellation flag with an optional deadline
 *
 * Copies share the same flag, so a token handed to an engine can be
 * cancelled from another thread or a signal handler through any copy.
 */
class cancellation_token {
public:
    using clock = std::chrono::steady_clock;

    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    /**
     * @brief Request cancellation
     */
    void cancel() noexcept { flag_->store(true); }

    /**
     * @brief Derive a token sharing this flag and expiring at a deadline
     */
    [[nodiscard]] auto with_deadline(clock::time_point deadline) const -> cancellation_token {
        cancellation_token copy(*this);
        copy.deadline_ = deadline;
        return copy;
    }

    [[nodiscard]] auto with_timeout(clock::duration timeout) const -> cancellation_token {
        return with_deadline(clock::now() + timeout);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        if (flag_->load()) {
            return true;
        }
        return deadline_.has_value() && clock::now() >= *deadline_;
    }

    /**
     * @brief Raw flag, for async-signal-safe cancellation
     */
    [[nodiscard]] auto flag() const noexcept -> std::atomic<bool>* { return flag_.get(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::optional<clock::time_point> deadline_;
};

}  // namespace clipxfer

#endif  // CLIPXFER_CORE_CANCELLATION_H
