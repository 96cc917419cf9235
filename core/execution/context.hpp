#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace coderun {
namespace execution {

using Clock = std::chrono::steady_clock;

// Absolute point in time after which work on a request must stop.
// Passed by value through every call so remaining-budget arithmetic stays explicit.
class Deadline {
public:
    static Deadline after(std::chrono::milliseconds budget);
    static Deadline at(Clock::time_point when);

    Clock::time_point time_point() const { return when_; }

    // Time left, never negative
    std::chrono::milliseconds remaining() const;
    bool expired() const;

    // Remaining whole seconds rounded up, at least 1. Used for in-unit timeouts.
    int remaining_seconds_ceil() const;

    Deadline earlier_of(const Deadline &other) const;

private:
    explicit Deadline(Clock::time_point when) : when_(when) {}
    Clock::time_point when_;
};

/**
 * @brief Shared cancellation flag with callbacks
 *
 * Copies share state. cancel() is idempotent; registered callbacks run once,
 * on the cancelling thread, while the token's lock is held so that
 * remove_callback() returning guarantees the callback is no longer running.
 * Callbacks must not call back into the same token.
 */
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken();

    void cancel();
    bool is_cancelled() const;

    // Runs cb immediately if already cancelled (and returns 0).
    uint64_t on_cancel(Callback cb);
    void remove_callback(uint64_t id);

private:
    struct State {
        std::mutex mutex;
        std::atomic<bool> cancelled{false};
        uint64_t next_id = 1;
        std::map<uint64_t, Callback> callbacks;
    };
    std::shared_ptr<State> state_;
};

// Scoped on_cancel registration
class CancelRegistration {
public:
    CancelRegistration(CancellationToken token, CancellationToken::Callback cb);
    ~CancelRegistration();

    CancelRegistration(const CancelRegistration &) = delete;
    CancelRegistration &operator=(const CancelRegistration &) = delete;

private:
    CancellationToken token_;
    uint64_t id_;
};

struct ExecutionContext {
    Deadline deadline;
    CancellationToken token;

    bool cancelled() const { return token.is_cancelled(); }
    bool should_stop() const { return token.is_cancelled() || deadline.expired(); }

    // Same token, tighter deadline
    ExecutionContext narrowed(const Deadline &other) const { return {deadline.earlier_of(other), token}; }
};

}  // namespace execution
}  // namespace coderun
