#include "backup/backup_verifier.hpp"
#include "common/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <functional>

namespace {

// Walks every header; the visitor sees each entry path
bool walkArchive(const std::string& archivePath,
                 const std::function<void(const std::string&)>& visit,
                 std::string& error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(archivePath, ec)) {
        error = "Archive not found: " + archivePath;
        return false;
    }

    struct archive* a = archive_read_new();
    if (!a) {
        error = "Failed to allocate archive reader";
        return false;
    }
    archive_read_support_filter_gzip(a);
    archive_read_support_format_tar(a);

    if (archive_read_open_filename(a, archivePath.c_str(), 10240) != ARCHIVE_OK) {
        const char* reason = archive_error_string(a);
        error = "Failed to open archive " + archivePath + ": " + (reason ? reason : "unknown error");
        archive_read_free(a);
        return false;
    }

    bool ok = true;
    struct archive_entry* entry = nullptr;
    while (true) {
        int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            const char* reason = archive_error_string(a);
            error = std::string("Corrupt archive header: ") + (reason ? reason : "unknown error");
            ok = false;
            break;
        }
        if (r == ARCHIVE_WARN) {
            const char* reason = archive_error_string(a);
            Logger::warning("Archive warning in " + archivePath + ": " + (reason ? reason : ""));
        }

        const char* name = archive_entry_pathname(entry);
        if (visit) {
            visit(name ? name : "");
        }

        if (archive_read_data_skip(a) < ARCHIVE_WARN) {
            const char* reason = archive_error_string(a);
            error = std::string("Truncated archive data: ") + (reason ? reason : "unknown error");
            ok = false;
            break;
        }
    }

    archive_read_close(a);
    archive_read_free(a);
    return ok;
}

} // namespace

VerificationResult BackupVerifier::verify(const std::string& archivePath) const {
    VerificationResult result;

    std::string error;
    size_t count = 0;
    bool ok = walkArchive(archivePath, [&count](const std::string&) { ++count; }, error);

    result.entryCount = count;
    if (!ok) {
        result.errorMessage = error;
        Logger::error("Archive verification failed for " + archivePath + ": " + error);
        return result;
    }
    if (count == 0) {
        result.errorMessage = "Archive contains no entries";
        return result;
    }

    result.success = true;
    Logger::debug("Verified " + archivePath + " (" + std::to_string(count) + " entries)");
    return result;
}

bool BackupVerifier::listEntries(const std::string& archivePath, std::vector<std::string>& entries,
                                 std::string& error) const {
    entries.clear();
    return walkArchive(archivePath, [&entries](const std::string& name) { entries.push_back(name); }, error);
}
