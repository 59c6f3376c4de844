#include "tools/archive_tool.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

PkgAcctTool::PkgAcctTool(std::string toolPath, ProcessRunner runner)
    : toolPath_(std::move(toolPath)), runner_(std::move(runner)) {}

std::vector<std::string> PkgAcctTool::buildArguments(const std::string& account,
                                                     const std::string& targetDir,
                                                     const UserConfig& options) const {
    std::vector<std::string> argv = {toolPath_};

    if (options.compressionOption == "nocompress") {
        argv.push_back("--nocompress");
    } else {
        argv.push_back("--compress");
    }

    if (options.incremental) {
        argv.push_back("--incremental");
    }

    for (const auto& flag : UserConfig::knownSkipFlags()) {
        if (options.isSkipped(flag)) {
            argv.push_back("--skip" + flag);
        }
    }

    // Hot database copies are taken separately; keep only the schema in the archive
    if (options.usesHotDatabaseBackup()) {
        argv.push_back("--dbbackup=schema");
    } else if (options.dbBackupType == "skip") {
        if (!options.isSkipped("mysql")) {
            argv.push_back("--skipmysql");
        }
    } else if (options.dbBackupType == "all" || options.dbBackupType == "schema" ||
               options.dbBackupType == "name") {
        argv.push_back("--dbbackup=" + options.dbBackupType);
    }

    argv.push_back(account);
    argv.push_back(targetDir);
    return argv;
}

std::string PkgAcctTool::expectedArtifact(const std::string& account,
                                          const std::string& targetDir,
                                          const UserConfig& options) {
    std::string extension = options.compressionOption == "nocompress" ? ".tar" : ".tar.gz";
    return targetDir + "/cpmove-" + account + extension;
}

ArchiveToolResult PkgAcctTool::createArchive(const std::string& account,
                                             const std::string& targetDir,
                                             const UserConfig& options,
                                             const LineCallback& onLine) {
    ArchiveToolResult result;
    result.path = expectedArtifact(account, targetDir, options);

    std::vector<std::string> argv = buildArguments(account, targetDir, options);
    Logger::info("Running archive tool for " + account + " into " + targetDir);

    ProcessResult proc = runner_.run(argv, onLine);

    if (!proc.started) {
        result.code = ErrorCode::ProcessSpawnFailed;
        result.message = "Failed to start archive tool: " + proc.error;
        Logger::error(result.message);
        return result;
    }

    if (!proc.success()) {
        result.code = ErrorCode::ArchiveToolFailed;
        result.message = proc.signaled
            ? "pkgacct terminated by signal " + std::to_string(proc.signal)
            : "pkgacct failed (exit code " + std::to_string(proc.exitCode) + ")";
        Logger::error(result.message + " for " + account);

        // A directory-style output is never usable; files are left to the caller
        std::string workDir = targetDir + "/cpmove-" + account;
        std::error_code ec;
        if (fs::is_directory(workDir, ec)) {
            fs::remove_all(workDir, ec);
            if (ec) {
                Logger::warning("Failed to remove partial output " + workDir + ": " + ec.message());
            }
        }
        return result;
    }

    result.success = true;
    result.message = "pkgacct completed";
    return result;
}
