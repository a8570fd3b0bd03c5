#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>

#include "common/cancellation.hpp"

namespace q2browse::probe {

// Counting semaphore bounding how many probes are on the wire at once.
class ConcurrencyLimiter {
public:
    class Permit {
    public:
        Permit(Permit &&other) noexcept : owner(other.owner) { other.owner = nullptr; }
        Permit &operator=(Permit &&other) noexcept;
        Permit(const Permit &) = delete;
        Permit &operator=(const Permit &) = delete;
        ~Permit() { release(); }

        void release();

    private:
        friend class ConcurrencyLimiter;
        explicit Permit(ConcurrencyLimiter *limiter) : owner(limiter) {}

        ConcurrencyLimiter *owner = nullptr;
    };

    explicit ConcurrencyLimiter(std::size_t maxInFlight);

    ConcurrencyLimiter(const ConcurrencyLimiter &) = delete;
    ConcurrencyLimiter &operator=(const ConcurrencyLimiter &) = delete;

    // Blocks until a slot frees up. Returns nothing once cancellation is observed.
    std::optional<Permit> acquire(const CancellationToken &cancellation);

    std::size_t capacity() const { return limit; }
    std::size_t inFlight() const;

private:
    void releaseSlot();

    const std::size_t limit;
    std::size_t used = 0;
    mutable std::mutex mutex;
    std::condition_variable cv;
};

} // namespace q2browse::probe
