#pragma once

#include "common/errors.hpp"
#include "common/job.hpp"
#include "restore/restore_options.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Request for a multi-account backup job
struct BackupRequest {
    std::vector<std::string> accounts;   // Processed in this order
    std::string destinationId;
    std::string user{"root"};            // Owner of the job, selects preferences
    std::string jobId;                   // Queue job id, enables cancellation
    std::string backupId;                // Pre-generated log id, generated when empty
    std::string scheduleId;              // Empty for manual runs
    int retention{30};                   // 0 = unlimited
    std::string requestor;               // Caller IP or "cron"
};

// Outcome for one account in a backup job
struct AccountBackupResult {
    std::string account;
    bool success{false};
    std::string message;
    std::string file;        // Canonical archive name
    std::string dbFile;      // Companion database archive, if any
    int64_t size{0};
    double durationSeconds{0.0};
    std::string checksum;    // SHA-256 of the main archive
    ErrorCode code{ErrorCode::None};
};

struct BackupJobResult {
    bool success{false};
    bool cancelled{false};
    std::string message;
    std::vector<AccountBackupResult> results;   // Request order, one per processed account
    std::vector<std::string> errors;            // "account: message"
    std::string log;                            // Per-account summary lines
    std::string backupId;
    std::string jobId;
    std::string logPath;
    ErrorCode code{ErrorCode::None};
    Job::Outcome outcome{Job::Outcome::NONE};

    const AccountBackupResult* find(const std::string& account) const {
        for (const auto& result : results) {
            if (result.account == account) {
                return &result;
            }
        }
        return nullptr;
    }
};

// Request to restore one account archive
struct RestoreRequest {
    std::string archive;          // Path or key, relative to the destination base path
    std::string destinationId;
    RestoreOptions options;
    std::string user{"root"};
    std::string restoreId;        // Pre-generated log id, generated when empty
    std::string requestor;
};

struct RestoreJobResult {
    bool success{false};
    std::string message;
    std::string restoreId;
    std::string logPath;
    std::string account;
    int exitCode{0};
    bool dbRestoreFailed{false};
    ErrorCode code{ErrorCode::None};
    ErrorCode warning{ErrorCode::None};
    Job::Outcome outcome{Job::Outcome::NONE};
};

// One archive found on a destination
struct BackupListing {
    std::string path;
    std::string displayName;
    int64_t size{0};
    std::string date;
    std::string account;
};

// What an archive holds, without restoring it
struct BackupPreview {
    bool success{false};
    std::string message;
    size_t totalFiles{0};
    bool hasHomedir{false};
    bool hasMysql{false};
    bool hasPgsql{false};
    bool hasEmail{false};
    bool hasSsl{false};
    bool hasDnsZones{false};
    std::string account;
    std::vector<std::string> sampleFiles;
    int64_t size{0};
};
