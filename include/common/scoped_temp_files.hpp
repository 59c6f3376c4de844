#pragma once

#include <string>
#include <vector>

// Files and directories staged under a temp root, removed when the scope
// ends. Paths outside the root are refused so archives that already sit in
// their final location are never deleted.
class ScopedTempFiles {
public:
    explicit ScopedTempFiles(std::string tempRoot);
    ~ScopedTempFiles();

    ScopedTempFiles(const ScopedTempFiles&) = delete;
    ScopedTempFiles& operator=(const ScopedTempFiles&) = delete;

    bool track(const std::string& path);
    bool isInsideRoot(const std::string& path) const;

    // Removes everything tracked; returns the paths actually deleted
    std::vector<std::string> cleanup();

    const std::vector<std::string>& tracked() const { return paths_; }

private:
    std::string tempRoot_;
    std::vector<std::string> paths_;
};
