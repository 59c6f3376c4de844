#pragma once

#include <string>

// Exclusive flock() held for the lifetime of the object. The file is opened
// for appending so the same descriptor can be written while locked.
class FileLock {
public:
    explicit FileLock(const std::string& path, int mode = 0640);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool isLocked() const { return fd_ >= 0 && locked_; }
    int fd() const { return fd_; }
    std::string getLastError() const { return lastError_; }

    // Appends the whole buffer; false on short or failed writes
    bool append(const std::string& data);

private:
    int fd_{-1};
    bool locked_{false};
    std::string lastError_;
};
