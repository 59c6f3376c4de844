#include "common/job_log.hpp"
#include "common/file_lock.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>

JobLog::JobLog(const std::string& logDir, const std::string& jobId) {
    path_ = logDir + "/" + jobId + ".log";
    try {
        std::filesystem::create_directories(logDir);
    } catch (const std::exception& e) {
        Logger::error("Failed to create job log directory " + logDir + ": " + e.what());
        usable_ = false;
    }
}

void JobLog::write(const std::string& message) {
    appendLine("[" + utils::currentTimestamp() + "] " + message);
}

void JobLog::writeRaw(const std::string& line) {
    appendLine(line);
}

void JobLog::banner(const std::string& title) {
    const std::string rule(64, '=');
    appendLine(rule);
    appendLine("  " + title);
    appendLine(rule);
}

void JobLog::appendLine(const std::string& line) {
    if (!usable_) {
        Logger::debug("[job log unavailable] " + line);
        return;
    }

    FileLock lock(path_, 0640);
    if (!lock.isLocked()) {
        Logger::error("Job log write failed: " + lock.getLastError());
        return;
    }
    if (!lock.append(line + "\n")) {
        Logger::error("Job log write failed: " + lock.getLastError());
    }
}

std::vector<std::string> JobLog::readLines() const {
    std::vector<std::string> lines;
    std::ifstream in(path_);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}
