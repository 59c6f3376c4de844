#pragma once

#include "common/errors.hpp"
#include "common/process_runner.hpp"
#include "config/user_config.hpp"
#include <string>
#include <vector>

struct ArchiveToolResult {
    bool success{false};
    std::string message;
    // Where the artifact is expected; may be missing or a directory
    std::string path;
    ErrorCode code{ErrorCode::None};
};

// Produces one account archive inside a target directory.
class ArchiveTool {
public:
    virtual ~ArchiveTool() = default;

    virtual ArchiveToolResult createArchive(const std::string& account,
                                            const std::string& targetDir,
                                            const UserConfig& options,
                                            const LineCallback& onLine) = 0;
};

// pkgacct-compatible tool: `pkgacct [flags] {account} {targetDir}` writes
// {targetDir}/cpmove-{account}.tar.gz (or .tar when uncompressed).
class PkgAcctTool : public ArchiveTool {
public:
    explicit PkgAcctTool(std::string toolPath, ProcessRunner runner = ProcessRunner());

    ArchiveToolResult createArchive(const std::string& account,
                                    const std::string& targetDir,
                                    const UserConfig& options,
                                    const LineCallback& onLine) override;

    std::vector<std::string> buildArguments(const std::string& account,
                                            const std::string& targetDir,
                                            const UserConfig& options) const;
    static std::string expectedArtifact(const std::string& account,
                                        const std::string& targetDir,
                                        const UserConfig& options);

private:
    std::string toolPath_;
    ProcessRunner runner_;
};
