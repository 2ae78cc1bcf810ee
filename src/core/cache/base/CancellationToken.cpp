#include "veloce/core/cache/base/CancellationToken.hpp"
#include <condition_variable>
#include <mutex>

namespace veloce {
namespace core {
namespace cache {

struct CancellationToken::State {
    mutable std::mutex mutex;
    std::condition_variable condition;
    bool cancelled = false;
};

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->condition.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->condition.wait_for(lock, timeout, [this] {
        return state_->cancelled;
    });
}

} // namespace cache
} // namespace core
} // namespace veloce
