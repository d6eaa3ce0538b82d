#include "ExclusiveLock.hpp"
#include "Logger.hpp"
#include <stdexcept>
#include <system_error>

namespace TrapWatch {

ExclusiveLock::ExclusiveLock(std::mutex& mutex)
    : mutex_(mutex) {}

void ExclusiveLock::acquire() {
    try {
        mutex_.lock();
    } catch (const std::system_error& e) {
        throw std::runtime_error("Unable to acquire lock: " + std::string(e.what()));
    }
    acquiredAt_ = std::chrono::steady_clock::now();
}

void ExclusiveLock::release() {
    acquiredAt_.reset();
    mutex_.unlock();
}

double ExclusiveLock::timeWaited() const {
    if (!acquiredAt_) {
        return 0.0;
    }
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - *acquiredAt_).count();
}

std::mutex& exclusiveMutex() {
    static std::mutex mutex;
    return mutex;
}

ExclusiveLock acquireExclusiveLock() {
    LOG_DEBUG("Acquiring lock");
    ExclusiveLock lock(exclusiveMutex());
    lock.acquire();
    return lock;
}

void releaseExclusiveLock(ExclusiveLock& lock) {
    LOG_DEBUG("Releasing lock");
    lock.release();
}

ScopedExclusiveLock::ScopedExclusiveLock()
    : lock_(acquireExclusiveLock()) {}

ScopedExclusiveLock::~ScopedExclusiveLock() {
    releaseExclusiveLock(lock_);
}

} // namespace TrapWatch
