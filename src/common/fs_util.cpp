#include "fs_util.hpp"
#include "gattbench/logging.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace gattbench {

namespace {
bool isDirectory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}
}

bool ensureDirectory(const std::string& dir) {
    if (dir.empty()) {
        return true;
    }
    // Create parent directories first
    for (size_t i = 1; i < dir.size(); i++) {
        if (dir[i] == '/') {
            std::string subdir = dir.substr(0, i);
            mkdir(subdir.c_str(), 0755);
        }
    }
    mkdir(dir.c_str(), 0755);
    return isDirectory(dir);
}

bool ensureParentDirectory(const std::string& file_path) {
    size_t pos = file_path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return true;
    }
    return ensureDirectory(file_path.substr(0, pos));
}

bool fileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

std::string joinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    if (dir.back() == '/') {
        return dir + name;
    }
    return dir + "/" + name;
}

bool writeFileAtomic(const std::string& path, const std::string& content) {
    if (!ensureParentDirectory(path)) {
        log(LogLevel::ERROR, "FS", "Cannot create directory for %s", path.c_str());
        return false;
    }

    std::string tmp = path + ".tmp";
    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        log(LogLevel::ERROR, "FS", "open %s: %s", tmp.c_str(), strerror(errno));
        return false;
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            log(LogLevel::ERROR, "FS", "write %s: %s", tmp.c_str(), strerror(errno));
            close(fd);
            unlink(tmp.c_str());
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) {
        log(LogLevel::WARN, "FS", "fsync %s: %s", tmp.c_str(), strerror(errno));
    }
    close(fd);

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        log(LogLevel::ERROR, "FS", "rename %s: %s", path.c_str(), strerror(errno));
        unlink(tmp.c_str());
        return false;
    }
    return true;
}

std::string expandHome(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

} // namespace gattbench
