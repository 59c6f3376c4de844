#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct OperationLogEvent {
    std::string timestamp;
    std::string user;
    // backup_local, backup_remote, restore_local, restore_remote, ...
    std::string type;
    std::vector<std::string> items;
    bool success{true};
    std::string message;
    std::string requestor;
    std::string jobId;
};

void to_json(nlohmann::json& j, const OperationLogEvent& event);
void from_json(const nlohmann::json& j, OperationLogEvent& event);

struct LogQuery {
    std::string user;
    bool isRoot{false};
    int page{1};
    int limit{50};
    // all | error | success | exact event type
    std::string filter{"all"};
    // Case-insensitive substring of the joined items
    std::string accountFilter;
};

struct LogRecord {
    std::string timestamp;
    std::string type;
    std::string account;
    std::string user;
    std::string requestor;
    // "success" or "error"
    std::string status;
    std::string message;
    std::string jobId;
};

struct LogPage {
    std::vector<LogRecord> logs;
    int totalPages{0};
    int currentPage{1};
    // Every item seen by this user, sorted, before the account filter
    std::vector<std::string> accounts;
};

// Durable audit trail of finished operations.
class OperationLogger {
public:
    virtual ~OperationLogger() = default;

    virtual bool logEvent(const OperationLogEvent& event) = 0;
    // Newest first; non-root users only see their own entries
    virtual LogPage getLogs(const LogQuery& query) const = 0;
};

// JSON lines in a single file, appended under flock.
class FileOperationLogger : public OperationLogger {
public:
    explicit FileOperationLogger(std::string logPath);

    bool logEvent(const OperationLogEvent& event) override;
    LogPage getLogs(const LogQuery& query) const override;

    const std::string& path() const { return logPath_; }

private:
    std::string logPath_;
};

// Deployments without an audit trail
class NullOperationLogger : public OperationLogger {
public:
    bool logEvent(const OperationLogEvent&) override { return true; }
    LogPage getLogs(const LogQuery& query) const override {
        LogPage page;
        page.currentPage = query.page;
        return page;
    }
};
