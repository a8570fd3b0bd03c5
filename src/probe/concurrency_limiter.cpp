#include "probe/concurrency_limiter.hpp"

#include <algorithm>

namespace {
constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{50};
}

namespace q2browse::probe {

ConcurrencyLimiter::Permit &ConcurrencyLimiter::Permit::operator=(Permit &&other) noexcept {
    if (this != &other) {
        release();
        owner = other.owner;
        other.owner = nullptr;
    }
    return *this;
}

void ConcurrencyLimiter::Permit::release() {
    if (owner) {
        owner->releaseSlot();
        owner = nullptr;
    }
}

ConcurrencyLimiter::ConcurrencyLimiter(std::size_t maxInFlight)
    : limit(std::max<std::size_t>(1, maxInFlight)) {}

std::optional<ConcurrencyLimiter::Permit> ConcurrencyLimiter::acquire(const CancellationToken &cancellation) {
    std::unique_lock<std::mutex> lock(mutex);
    while (used >= limit) {
        if (cancellation.isCancelled()) {
            return std::nullopt;
        }
        cv.wait_for(lock, CANCEL_POLL_INTERVAL);
    }
    if (cancellation.isCancelled()) {
        return std::nullopt;
    }
    ++used;
    return Permit(this);
}

std::size_t ConcurrencyLimiter::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex);
    return used;
}

void ConcurrencyLimiter::releaseSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (used > 0) {
            --used;
        }
    }
    cv.notify_all();
}

} // namespace q2browse::probe
