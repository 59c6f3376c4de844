#pragma once

#include "common/engine_context.hpp"
#include "common/job.hpp"
#include "common/job_config.hpp"
#include "common/job_log.hpp"
#include "common/scoped_temp_files.hpp"
#include <string>

class RestoreManager {
public:
    explicit RestoreManager(EngineContext context);
    ~RestoreManager() = default;

    // Restores a single account archive. Never throws.
    RestoreJobResult run(const RestoreRequest& request);

    // Lists a local archive and reports what it carries
    BackupPreview previewBackup(const std::string& archivePath) const;

    // Looks the account up in a passwd-format file and under homeRoot
    static bool accountExists(const std::string& account,
                              const std::string& passwdPath = "/etc/passwd",
                              const std::string& homeRoot = "/home");

    std::string getLastError() const { return lastError_; }

private:
    RestoreJobResult execute(const RestoreRequest& request, Job& job, JobLog& log);
    bool retrieve(const std::string& reference, const Destination& destination, Transport& transport,
                  const std::string& stagingDir, ScopedTempFiles& staging,
                  std::string& localPath, std::string& error);
    RestoreJobResult fail(const RestoreRequest& request, Job& job, JobLog& log, RestoreJobResult result,
                          const std::string& logType, const std::string& logMessage,
                          const std::string& items);
    void logOperation(const RestoreRequest& request, const std::string& type, const std::string& item,
                      bool success, const std::string& message, const std::string& restoreId);
    void cleanupStaging(ScopedTempFiles& staging, JobLog& log);

    EngineContext context_;
    std::string lastError_;
};
