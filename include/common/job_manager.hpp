#pragma once

#include "backup/backup_manager.hpp"
#include "cancel/cancellation.hpp"
#include "common/engine_context.hpp"
#include "common/job_config.hpp"
#include "oplog/operation_logger.hpp"
#include "restore/restore_manager.hpp"
#include <memory>
#include <string>
#include <vector>

struct PruneResult {
    bool success{true};
    std::vector<std::string> removed;   // Manifest files deleted from the destination
    std::vector<std::string> errors;
};

// Wires configuration into the orchestrators and exposes every operation
// the command line offers.
class JobManager {
public:
    explicit JobManager(const AppConfig& config);
    // Tests hand in a context with fakes already plugged in
    explicit JobManager(EngineContext context);
    ~JobManager() = default;

    bool initialize();

    BackupJobResult runBackup(const BackupRequest& request, ProgressCallback progressCallback = nullptr);
    RestoreJobResult runRestore(const RestoreRequest& request);

    bool requestCancel(const std::string& jobId);
    LogPage getLogs(const LogQuery& query) const;
    bool listBackups(const std::string& destinationId, const std::string& accountFilter,
                     std::vector<BackupListing>& backups);
    BackupPreview previewBackup(const std::string& archivePath) const;

    // Drops archives of a schedule beyond its retention, per account
    PruneResult pruneSchedule(const std::string& scheduleId, const std::string& destinationId, int retention);

    const EngineContext& context() const { return context_; }

    std::string getLastError() const { return lastError_; }
    void clearLastError() { lastError_.clear(); }

private:
    static EngineContext buildContext(const AppConfig& config);

    EngineContext context_;
    std::shared_ptr<FileCancellationStore> cancelStore_;
    std::unique_ptr<BackupManager> backupManager_;
    std::unique_ptr<RestoreManager> restoreManager_;
    std::string lastError_;
};
