#pragma once

#include "common/errors.hpp"
#include "common/process_runner.hpp"
#include "restore/restore_options.hpp"
#include <string>
#include <vector>

struct RestoreToolResult {
    bool success{false};
    std::string message;
    int exitCode{-1};
    ErrorCode code{ErrorCode::None};
};

// Restores one account from an archive on local disk.
class RestoreTool {
public:
    virtual ~RestoreTool() = default;

    virtual RestoreToolResult restoreArchive(const std::string& archivePath,
                                             const RestoreOptions& options,
                                             const LineCallback& onLine) = 0;
};

// restorepkg-compatible tool:
//   restorepkg [--disable=Mod1,Mod2] --skipaccount [--force] [--newuser=N] [--ip=IP] {archive}
class RestorePkgTool : public RestoreTool {
public:
    explicit RestorePkgTool(std::string toolPath, ProcessRunner runner = ProcessRunner());

    RestoreToolResult restoreArchive(const std::string& archivePath,
                                     const RestoreOptions& options,
                                     const LineCallback& onLine) override;

    std::vector<std::string> buildArguments(const std::string& archivePath,
                                            const RestoreOptions& options) const;

private:
    std::string toolPath_;
    ProcessRunner runner_;
};
