#pragma once

#include "../common/cancel_token.hpp"
#include <cstdint>
#include <string>

namespace gattbench {
namespace runner {

enum class LockMode {
    FAIL_FAST,      // Contention throws immediately
    BLOCKING,       // Wait up to a timeout, then throw
};

const char* lockModeToString(LockMode mode);
bool parseLockMode(const std::string& str, LockMode& out);

/**
 * AdapterLock - Exclusive use of one radio adapter across processes
 *
 * flock(LOCK_EX) on <lock_dir>/<adapter>.lock. The kernel drops the lock
 * when the holder exits, so a crashed run never leaves the adapter wedged.
 * Each instance opens its own descriptor: two instances in one process
 * contend exactly like two processes.
 */
class AdapterLock {
public:
    AdapterLock(std::string lock_dir, const std::string& adapter);
    ~AdapterLock();

    AdapterLock(const AdapterLock&) = delete;
    AdapterLock& operator=(const AdapterLock&) = delete;

    // Throws LockContentionError on contention / timeout, CancelledError if
    // the token fires while waiting
    void acquire(LockMode mode, uint32_t timeout_ms, const CancelToken& cancel);

    // Single non-blocking attempt
    bool tryAcquire();

    void release();

    bool isHeld() const { return fd_ >= 0; }
    const std::string& path() const { return path_; }

    static std::string lockPathFor(const std::string& lock_dir, const std::string& adapter);

private:
    std::string lock_dir_;
    std::string path_;
    int fd_ = -1;
    std::string last_error_;
};

// Scoped hold for one trial
class ScopedAdapterLock {
public:
    ScopedAdapterLock(AdapterLock& lock, LockMode mode, uint32_t timeout_ms, const CancelToken& cancel)
        : lock_(lock) {
        lock_.acquire(mode, timeout_ms, cancel);
    }
    ~ScopedAdapterLock() { lock_.release(); }

    ScopedAdapterLock(const ScopedAdapterLock&) = delete;
    ScopedAdapterLock& operator=(const ScopedAdapterLock&) = delete;

private:
    AdapterLock& lock_;
};

} // namespace runner
} // namespace gattbench
