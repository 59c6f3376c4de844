#include "tools/database_tool.hpp"
#include "common/archive_name.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <sys/stat.h>

HotCopyDatabaseTool::HotCopyDatabaseTool(std::string toolPath, ProcessRunner runner)
    : toolPath_(std::move(toolPath)), runner_(std::move(runner)) {}

DatabaseBackupResult HotCopyDatabaseTool::backupDatabases(const std::string& account,
                                                          const std::string& targetDir,
                                                          const UserConfig& options,
                                                          std::time_t timestamp,
                                                          const LineCallback& onLine) {
    DatabaseBackupResult result;
    std::string output = targetDir + "/" + archive_name::buildDatabaseName(account, timestamp);

    std::vector<std::string> argv = {
        toolPath_,
        "--method=" + options.dbBackupMethod,
        "--account=" + account,
        "--output=" + output
    };

    ProcessResult proc = runner_.run(argv, onLine);
    if (!proc.started) {
        result.code = ErrorCode::ProcessSpawnFailed;
        result.message = "Failed to start database backup tool: " + proc.error;
        return result;
    }

    if (!proc.success()) {
        result.code = ErrorCode::DatabaseBackupFailed;
        result.message = options.dbBackupMethod + " exited with code " + std::to_string(proc.exitCode);
        // Never leave a half-written copy next to the archive
        std::error_code ec;
        std::filesystem::remove(output, ec);
        return result;
    }

    result.success = true;
    if (std::filesystem::is_regular_file(output)) {
        chmod(output.c_str(), 0600);
        result.archivePath = output;
        result.message = "Database backup created";
    } else {
        result.skipped = true;
        result.message = "No databases to back up";
    }
    return result;
}

DatabaseRestoreResult HotCopyDatabaseTool::restoreDatabases(const std::string& account,
                                                            const std::string& archivePath,
                                                            const std::string& method,
                                                            const LineCallback& onLine) {
    DatabaseRestoreResult result;

    std::vector<std::string> argv = {
        toolPath_,
        "--method=" + method,
        "--account=" + account,
        "--archive=" + archivePath
    };

    ProcessResult proc = runner_.run(argv, onLine);
    if (!proc.started) {
        result.code = ErrorCode::ProcessSpawnFailed;
        result.message = "Failed to start database restore tool: " + proc.error;
        return result;
    }
    if (!proc.success()) {
        result.code = ErrorCode::DatabaseRestoreFailed;
        result.message = "exit code " + std::to_string(proc.exitCode);
        Logger::warning("Database restore for " + account + " failed: " + result.message);
        return result;
    }

    result.success = true;
    result.message = "Database data restored";
    return result;
}
