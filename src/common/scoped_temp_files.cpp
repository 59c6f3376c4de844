#include "common/scoped_temp_files.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

ScopedTempFiles::ScopedTempFiles(std::string tempRoot) : tempRoot_(std::move(tempRoot)) {}

ScopedTempFiles::~ScopedTempFiles() {
    cleanup();
}

bool ScopedTempFiles::isInsideRoot(const std::string& path) const {
    if (tempRoot_.empty() || path.empty()) {
        return false;
    }
    fs::path root = fs::path(tempRoot_).lexically_normal();
    fs::path candidate = fs::path(path).lexically_normal();
    fs::path relative = candidate.lexically_relative(root);
    if (relative.empty() || relative == ".") {
        return false;
    }
    return relative.begin()->string() != "..";
}

bool ScopedTempFiles::track(const std::string& path) {
    if (!isInsideRoot(path)) {
        Logger::debug("Not tracking " + path + " for cleanup: outside " + tempRoot_);
        return false;
    }
    paths_.push_back(path);
    return true;
}

std::vector<std::string> ScopedTempFiles::cleanup() {
    std::vector<std::string> removed;
    // Newest first so staged files go before their directory
    for (auto it = paths_.rbegin(); it != paths_.rend(); ++it) {
        std::error_code ec;
        if (!fs::exists(*it, ec)) {
            continue;
        }
        fs::remove_all(*it, ec);
        if (ec) {
            Logger::warning("Failed to remove temp path " + *it + ": " + ec.message());
        } else {
            removed.push_back(*it);
        }
    }
    paths_.clear();
    return removed;
}
