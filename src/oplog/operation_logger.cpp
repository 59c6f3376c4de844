#include "oplog/operation_logger.hpp"
#include "common/file_lock.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sys/stat.h>

using json = nlohmann::json;

void to_json(json& j, const OperationLogEvent& event) {
    j = json{
        {"timestamp", event.timestamp},
        {"user", event.user},
        {"type", event.type},
        {"items", event.items},
        {"success", event.success},
        {"message", event.message},
        {"requestor", event.requestor}
    };
    if (!event.jobId.empty()) {
        j["job_id"] = event.jobId;
    }
}

void from_json(const json& j, OperationLogEvent& event) {
    event.timestamp = j.value("timestamp", std::string());
    event.user = j.value("user", std::string());
    event.type = j.value("type", std::string("event"));
    event.items.clear();
    auto items = j.find("items");
    if (items != j.end()) {
        if (items->is_array()) {
            for (const auto& item : *items) {
                if (item.is_string()) {
                    event.items.push_back(item.get<std::string>());
                }
            }
        } else if (items->is_string()) {
            event.items.push_back(items->get<std::string>());
        }
    }
    event.success = j.value("success", false);
    event.message = j.value("message", std::string());
    event.requestor = j.value("requestor", std::string("N/A"));
    event.jobId = j.value("job_id", std::string());
}

FileOperationLogger::FileOperationLogger(std::string logPath) : logPath_(std::move(logPath)) {}

bool FileOperationLogger::logEvent(const OperationLogEvent& event) {
    OperationLogEvent stamped = event;
    if (stamped.timestamp.empty()) {
        stamped.timestamp = utils::currentTimestamp();
    }
    if (stamped.requestor.empty()) {
        stamped.requestor = "cron";
    }

    try {
        std::filesystem::path dir = std::filesystem::path(logPath_).parent_path();
        if (!dir.empty()) {
            std::filesystem::create_directories(dir);
        }

        json j = stamped;
        FileLock lock(logPath_, 0644);
        if (!lock.isLocked() || !lock.append(j.dump() + "\n")) {
            Logger::error("Failed to write operations log: " + lock.getLastError() +
                          ". Entry: " + j.dump());
            return false;
        }
        chmod(logPath_.c_str(), 0644);
        return true;
    } catch (const std::exception& e) {
        Logger::error(std::string("Failed to write operations log: ") + e.what());
        return false;
    }
}

LogPage FileOperationLogger::getLogs(const LogQuery& query) const {
    LogPage page;
    page.currentPage = query.page < 1 ? 1 : query.page;
    int limit = query.limit < 1 ? 50 : query.limit;

    std::ifstream in(logPath_);
    if (!in) {
        return page;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!utils::trim(line).empty()) {
            lines.push_back(line);
        }
    }
    std::reverse(lines.begin(), lines.end());

    std::vector<LogRecord> matched;
    std::vector<std::string> accounts;

    for (const auto& raw : lines) {
        OperationLogEvent event;
        try {
            event = json::parse(raw).get<OperationLogEvent>();
        } catch (const json::exception&) {
            continue;
        }

        if (!query.isRoot && !event.user.empty() && event.user != query.user) {
            continue;
        }

        std::string status = event.success ? "success" : "error";
        std::string account = utils::join(event.items, ", ");

        for (const auto& item : event.items) {
            if (!item.empty() && std::find(accounts.begin(), accounts.end(), item) == accounts.end()) {
                accounts.push_back(item);
            }
        }

        if (query.filter != "all" && !query.filter.empty()) {
            if (query.filter == "error" || query.filter == "success") {
                if (status != query.filter) continue;
            } else if (event.type != query.filter) {
                continue;
            }
        }

        if (!query.accountFilter.empty() && !utils::containsIgnoreCase(account, query.accountFilter)) {
            continue;
        }

        LogRecord record;
        record.timestamp = event.timestamp;
        record.type = event.type;
        record.account = account;
        record.user = event.user;
        record.requestor = event.requestor.empty() ? "N/A" : event.requestor;
        record.status = status;
        record.message = event.message;
        record.jobId = event.jobId;
        matched.push_back(record);
    }

    std::sort(accounts.begin(), accounts.end());
    page.accounts = accounts;
    page.totalPages = static_cast<int>((matched.size() + limit - 1) / limit);

    size_t offset = static_cast<size_t>(page.currentPage - 1) * static_cast<size_t>(limit);
    for (size_t i = offset; i < matched.size() && i < offset + static_cast<size_t>(limit); ++i) {
        page.logs.push_back(matched[i]);
    }
    return page;
}
