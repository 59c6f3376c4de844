#pragma once

#include <string>
#include <vector>

struct VerificationResult {
    bool success{false};
    std::string errorMessage;
    size_t entryCount{0};
};

// Structural archive check used before anything is handed to the restore tool.
class ArchiveVerifier {
public:
    virtual ~ArchiveVerifier() = default;

    virtual VerificationResult verify(const std::string& archivePath) const = 0;
    // Entry paths in archive order; false with error filled when unreadable
    virtual bool listEntries(const std::string& archivePath, std::vector<std::string>& entries,
                             std::string& error) const = 0;
};

// libarchive reader for tar and tar.gz: every header must parse and the
// compressed stream must be readable to the end. Nothing is extracted.
class BackupVerifier : public ArchiveVerifier {
public:
    BackupVerifier() = default;

    VerificationResult verify(const std::string& archivePath) const override;
    bool listEntries(const std::string& archivePath, std::vector<std::string>& entries,
                     std::string& error) const override;
};
