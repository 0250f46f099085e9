#pragma once

#include <atomic>
#include <functional>
#include <memory>

namespace depfetch {

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP

/**
 * @brief Shared cancellation flag threaded through a batch.
 *
 * Copies observe the same flag. cancel() is async-signal-safe (a relaxed
 * atomic store), so it may be invoked from a signal handler as well as from
 * an asio signal_set completion.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { state_->store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return state_->load(std::memory_order_relaxed);
    }

    /**
     * @brief Adapter for callback-style cancellation checks (HTTP write callbacks).
     */
    [[nodiscard]] ShouldCancel asCallback() const {
        auto state = state_;
        return [state]() { return state->load(std::memory_order_relaxed); };
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace depfetch
