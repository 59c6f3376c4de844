#pragma once

#include "common/engine_context.hpp"
#include "common/job.hpp"
#include "common/job_config.hpp"
#include "common/job_log.hpp"
#include <memory>
#include <string>
#include <vector>

class BackupManager {
public:
    explicit BackupManager(EngineContext context);
    ~BackupManager() = default;

    // Runs every account of the request in order. Never throws; all
    // failures come back in the result.
    BackupJobResult run(const BackupRequest& request, ProgressCallback progressCallback = nullptr);

    // Canonical archives on a destination, optionally narrowed to names
    // containing accountFilter (case-insensitive)
    bool listBackups(const std::string& destinationId, const std::string& accountFilter,
                     std::vector<BackupListing>& backups);

    std::string getLastError() const { return lastError_; }
    void clearLastError() { lastError_.clear(); }

private:
    BackupJobResult execute(const BackupRequest& request, Job& job, JobLog& log,
                            const ProgressCallback& progressCallback);
    AccountBackupResult backupAccount(const std::string& account,
                                      const Destination& destination,
                                      Transport& transport,
                                      const UserConfig& userConfig,
                                      const std::string& stagingDir,
                                      JobLog& log);
    BackupJobResult abort(const BackupRequest& request, Job& job, JobLog& log,
                          ErrorCode code, const std::string& message,
                          const std::string& logType);
    void logOperation(const BackupRequest& request, const std::string& type,
                      const std::vector<std::string>& items, bool success,
                      const std::string& message, const std::string& backupId);

    EngineContext context_;
    std::string lastError_;
};
