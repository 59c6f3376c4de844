#include "cancel/cancellation.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

FileCancellationStore::FileCancellationStore(std::string cancelDir) : cancelDir_(std::move(cancelDir)) {}

std::string FileCancellationStore::markerPath(const std::string& jobId) const {
    return cancelDir_ + "/" + utils::sanitizeName(jobId) + ".cancel";
}

bool FileCancellationStore::requestCancel(const std::string& jobId) {
    if (utils::sanitizeName(jobId).empty()) {
        lastError_ = "Invalid job id";
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(cancelDir_, ec);
    if (ec) {
        lastError_ = "Failed to create " + cancelDir_ + ": " + ec.message();
        return false;
    }

    std::ofstream marker(markerPath(jobId), std::ios::trunc);
    if (!marker) {
        lastError_ = "Failed to write cancel marker for " + jobId;
        return false;
    }
    marker << utils::currentTimestamp() << "\n";
    Logger::info("Cancellation requested for job " + jobId);
    return true;
}

bool FileCancellationStore::isCancelled(const std::string& jobId) const {
    if (jobId.empty()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(markerPath(jobId), ec);
}

void FileCancellationStore::clear(const std::string& jobId) {
    std::error_code ec;
    std::filesystem::remove(markerPath(jobId), ec);
    if (ec) {
        Logger::warning("Failed to clear cancel marker for " + jobId + ": " + ec.message());
    }
}
