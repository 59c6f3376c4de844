#include "common/file_lock.hpp"
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

FileLock::FileLock(const std::string& path, int mode) {
    fd_ = open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, mode);
    if (fd_ < 0) {
        lastError_ = "Failed to open " + path + ": " + strerror(errno);
        return;
    }

    int rc;
    do {
        rc = flock(fd_, LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        lastError_ = "Failed to lock " + path + ": " + strerror(errno);
        return;
    }
    locked_ = true;
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        if (locked_) {
            flock(fd_, LOCK_UN);
        }
        close(fd_);
    }
}

bool FileLock::append(const std::string& data) {
    if (!isLocked()) {
        return false;
    }

    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = write(fd_, data.data() + offset, data.size() - offset);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            lastError_ = std::string("Write failed: ") + strerror(errno);
            return false;
        }
        offset += static_cast<size_t>(n);
    }
    return true;
}
