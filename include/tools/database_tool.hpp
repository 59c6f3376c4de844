#pragma once

#include "common/errors.hpp"
#include "common/process_runner.hpp"
#include "config/user_config.hpp"
#include <ctime>
#include <string>

struct DatabaseBackupResult {
    bool success{false};
    // Account has no databases; not a failure
    bool skipped{false};
    std::string message;
    std::string archivePath;
    ErrorCode code{ErrorCode::None};
};

struct DatabaseRestoreResult {
    bool success{false};
    std::string message;
    ErrorCode code{ErrorCode::None};
};

// Hot (non-locking) database copies stored beside the main archive.
class DatabaseTool {
public:
    virtual ~DatabaseTool() = default;

    virtual DatabaseBackupResult backupDatabases(const std::string& account,
                                                 const std::string& targetDir,
                                                 const UserConfig& options,
                                                 std::time_t timestamp,
                                                 const LineCallback& onLine) = 0;
    virtual DatabaseRestoreResult restoreDatabases(const std::string& account,
                                                   const std::string& archivePath,
                                                   const std::string& method,
                                                   const LineCallback& onLine) = 0;
};

// External helper:
//   {tool} --method=M --account=A --output=PATH    (backup)
//   {tool} --method=M --account=A --archive=PATH   (restore)
// A zero exit without an output file means there was nothing to copy.
class HotCopyDatabaseTool : public DatabaseTool {
public:
    explicit HotCopyDatabaseTool(std::string toolPath, ProcessRunner runner = ProcessRunner());

    DatabaseBackupResult backupDatabases(const std::string& account,
                                         const std::string& targetDir,
                                         const UserConfig& options,
                                         std::time_t timestamp,
                                         const LineCallback& onLine) override;
    DatabaseRestoreResult restoreDatabases(const std::string& account,
                                           const std::string& archivePath,
                                           const std::string& method,
                                           const LineCallback& onLine) override;

private:
    std::string toolPath_;
    ProcessRunner runner_;
};
