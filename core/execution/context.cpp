#include "context.hpp"

#include <utility>

namespace coderun {
namespace execution {

Deadline Deadline::after(std::chrono::milliseconds budget) { return Deadline(Clock::now() + budget); }

Deadline Deadline::at(Clock::time_point when) { return Deadline(when); }

std::chrono::milliseconds Deadline::remaining() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(when_ - Clock::now());
    if (left.count() < 0) {
        return std::chrono::milliseconds(0);
    }
    return left;
}

bool Deadline::expired() const { return Clock::now() >= when_; }

int Deadline::remaining_seconds_ceil() const {
    auto ms = remaining().count();
    auto seconds = static_cast<int>((ms + 999) / 1000);
    return seconds < 1 ? 1 : seconds;
}

Deadline Deadline::earlier_of(const Deadline &other) const { return other.when_ < when_ ? other : *this; }

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled.exchange(true)) {
        return;
    }
    for (auto &[id, cb] : state_->callbacks) {
        if (cb) {
            cb();
        }
    }
    state_->callbacks.clear();
}

bool CancellationToken::is_cancelled() const { return state_->cancelled.load(); }

uint64_t CancellationToken::on_cancel(Callback cb) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->cancelled.load()) {
        lock.unlock();
        cb();
        return 0;
    }
    uint64_t id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(cb));
    return id;
}

void CancellationToken::remove_callback(uint64_t id) {
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id);
}

CancelRegistration::CancelRegistration(CancellationToken token, CancellationToken::Callback cb)
    : token_(std::move(token)), id_(0) {
    id_ = token_.on_cancel(std::move(cb));
}

CancelRegistration::~CancelRegistration() { token_.remove_callback(id_); }

}  // namespace execution
}  // namespace coderun
