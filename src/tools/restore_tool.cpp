#include "tools/restore_tool.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

RestorePkgTool::RestorePkgTool(std::string toolPath, ProcessRunner runner)
    : toolPath_(std::move(toolPath)), runner_(std::move(runner)) {
    // No interactive input is ever expected
    ProcessOptions opts = runner_.getOptions();
    opts.stdinData.clear();
    runner_.setOptions(opts);
}

std::vector<std::string> RestorePkgTool::buildArguments(const std::string& archivePath,
                                                        const RestoreOptions& options) const {
    std::vector<std::string> argv = {toolPath_};

    std::vector<std::string> disabled = options.disabledModules();
    if (!disabled.empty()) {
        argv.push_back("--disable=" + utils::join(disabled, ","));
    }

    argv.push_back("--skipaccount");

    if (options.force) {
        argv.push_back("--force");
    }
    if (!options.newUser.empty()) {
        argv.push_back("--newuser=" + options.newUser);
    }
    if (!options.ip.empty()) {
        argv.push_back("--ip=" + options.ip);
    }

    // Archive path must come last
    argv.push_back(archivePath);
    return argv;
}

RestoreToolResult RestorePkgTool::restoreArchive(const std::string& archivePath,
                                                 const RestoreOptions& options,
                                                 const LineCallback& onLine) {
    RestoreToolResult result;
    std::vector<std::string> argv = buildArguments(archivePath, options);
    Logger::info("Running restore tool: " + utils::join(argv, " "));

    ProcessResult proc = runner_.run(argv, onLine);

    if (!proc.started) {
        result.code = ErrorCode::ProcessSpawnFailed;
        result.message = "Failed to start restore tool: " + proc.error;
        Logger::error(result.message);
        return result;
    }

    result.exitCode = proc.signaled ? 128 + proc.signal : proc.exitCode;
    if (!proc.success()) {
        result.code = ErrorCode::RestoreToolFailed;
        result.message = "Restore failed (exit code " + std::to_string(result.exitCode) + ")";
        Logger::error(result.message + " for " + archivePath);
        return result;
    }

    result.success = true;
    result.message = "Restore completed successfully";
    return result;
}
