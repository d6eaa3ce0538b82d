#pragma once
#include <chrono>
#include <mutex>
#include <optional>

namespace TrapWatch {

// Handle on a mutex that remembers when it was acquired. One handle per
// acquisition; release() must be called exactly once, which is what
// ScopedExclusiveLock is for.
class ExclusiveLock {
public:
    explicit ExclusiveLock(std::mutex& mutex);

    // Blocks until the mutex is free. Throws std::runtime_error if the
    // underlying primitive fails.
    void acquire();
    void release();

    // Seconds since acquisition, 0 when not held
    double timeWaited() const;
    bool isHeld() const { return acquiredAt_.has_value(); }

private:
    std::mutex& mutex_;
    std::optional<std::chrono::steady_clock::time_point> acquiredAt_;
};

// Process-wide classification lock
std::mutex& exclusiveMutex();

ExclusiveLock acquireExclusiveLock();
void releaseExclusiveLock(ExclusiveLock& lock);

class ScopedExclusiveLock {
public:
    ScopedExclusiveLock();
    ~ScopedExclusiveLock();

    ScopedExclusiveLock(const ScopedExclusiveLock&) = delete;
    ScopedExclusiveLock& operator=(const ScopedExclusiveLock&) = delete;

    double timeWaited() const { return lock_.timeWaited(); }

private:
    ExclusiveLock lock_;
};

} // namespace TrapWatch
