#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace q2browse {

class CancellationSource;

// Cheap to copy; all copies observe the same source. A default-constructed
// token can never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const;

    // Sleeps up to `duration`; returns true as soon as cancellation is observed.
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    friend class CancellationSource;

    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    explicit CancellationToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

class CancellationSource {
public:
    CancellationSource();

    void cancel();
    bool isCancelled() const;
    CancellationToken token() const;

private:
    std::shared_ptr<CancellationToken::State> state_;
};

inline CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {}

inline void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled.store(true);
    }
    state_->cv.notify_all();
}

inline bool CancellationSource::isCancelled() const {
    return state_->cancelled.load();
}

inline CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

inline bool CancellationToken::isCancelled() const {
    return state_ && state_->cancelled.load();
}

inline bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, duration, [&]() { return state_->cancelled.load(); });
}

} // namespace q2browse
