#include "adapter_lock.hpp"
#include "../client/run_log.hpp"
#include "../common/fs_util.hpp"
#include "gattbench/errors.hpp"
#include "gattbench/logging.hpp"

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace gattbench {
namespace runner {

namespace {
constexpr uint32_t LOCK_POLL_MS = 50;
}

const char* lockModeToString(LockMode mode) {
    switch (mode) {
        case LockMode::FAIL_FAST: return "fail_fast";
        case LockMode::BLOCKING:  return "blocking";
        default: return "unknown";
    }
}

bool parseLockMode(const std::string& str, LockMode& out) {
    if (str == "fail_fast" || str == "fail-fast") { out = LockMode::FAIL_FAST; return true; }
    if (str == "blocking" || str == "wait") { out = LockMode::BLOCKING; return true; }
    return false;
}

std::string AdapterLock::lockPathFor(const std::string& lock_dir, const std::string& adapter) {
    return joinPath(lock_dir, client::sanitizeName(adapter.empty() ? "default" : adapter) + ".lock");
}

AdapterLock::AdapterLock(std::string lock_dir, const std::string& adapter)
    : lock_dir_(std::move(lock_dir)), path_(lockPathFor(lock_dir_, adapter)) {
}

AdapterLock::~AdapterLock() {
    release();
}

bool AdapterLock::tryAcquire() {
    if (fd_ >= 0) {
        return true;
    }
    if (!ensureDirectory(lock_dir_)) {
        last_error_ = "cannot create lock directory " + lock_dir_;
        return false;
    }

    int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        last_error_ = std::string("open: ") + strerror(errno);
        return false;
    }
    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        last_error_ = errno == EWOULDBLOCK ? "held by another run" : std::string("flock: ") + strerror(errno);
        close(fd);
        return false;
    }

    // Holder pid for whoever inspects the file by hand
    char pid[32];
    int len = snprintf(pid, sizeof(pid), "%d\n", static_cast<int>(getpid()));
    if (ftruncate(fd, 0) != 0 || write(fd, pid, static_cast<size_t>(len)) != len) {
        LOG_RUNNER(DEBUG, "Could not record pid in %s", path_.c_str());
    }

    fd_ = fd;
    last_error_.clear();
    LOG_RUNNER(DEBUG, "Adapter lock acquired: %s", path_.c_str());
    return true;
}

void AdapterLock::acquire(LockMode mode, uint32_t timeout_ms, const CancelToken& cancel) {
    if (tryAcquire()) {
        return;
    }
    if (mode == LockMode::FAIL_FAST) {
        throw LockContentionError("adapter lock " + path_ + ": " + last_error_, path_);
    }

    LOG_RUNNER(INFO, "Waiting up to %u ms for adapter lock %s", timeout_ms, path_.c_str());
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!cancel.waitFor(LOCK_POLL_MS)) {
            throw CancelledError();
        }
        if (tryAcquire()) {
            return;
        }
    }
    char msg[160];
    snprintf(msg, sizeof(msg), "timed out after %u ms waiting for adapter lock", timeout_ms);
    throw LockContentionError(std::string(msg) + " " + path_ + " (" + last_error_ + ")", path_);
}

void AdapterLock::release() {
    if (fd_ < 0) {
        return;
    }
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
    LOG_RUNNER(DEBUG, "Adapter lock released: %s", path_.c_str());
}

} // namespace runner
} // namespace gattbench
