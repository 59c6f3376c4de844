#include "backup/backup_manager.hpp"
#include "common/archive_name.hpp"
#include "common/logger.hpp"
#include "common/scoped_temp_files.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <sys/stat.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::string RULE(40, '-');

std::string trimTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

LineCallback toolOutputTo(JobLog& log) {
    return [&log](StreamKind stream, const std::string& line) {
        std::string trimmed = utils::trim(line);
        if (trimmed.empty()) {
            return;
        }
        log.write(stream == StreamKind::Stderr ? "      [STDERR] " + trimmed : "      " + trimmed);
    };
}

AccountBackupResult failed(const std::string& account, ErrorCode code, const std::string& message) {
    AccountBackupResult result;
    result.account = account;
    result.success = false;
    result.code = code;
    result.message = message;
    return result;
}

} // namespace

BackupManager::BackupManager(EngineContext context) : context_(std::move(context)) {}

BackupJobResult BackupManager::run(const BackupRequest& request, ProgressCallback progressCallback) {
    // Caller ids name the staging directory and job log, so they must stay a single path component
    std::string backupId = utils::sanitizeName(request.backupId);
    if (backupId.empty()) {
        backupId = Job::generateId("backup");
    }
    Job job(backupId);
    JobLog log(context_.config.logDir, backupId);

    if (!context_.isComplete()) {
        lastError_ = "Backup engine is missing collaborators";
        Logger::error(lastError_);
        log.write("[ERROR] " + lastError_);
        job.finish(Job::Outcome::FAILURE);

        BackupJobResult result;
        result.message = lastError_;
        result.backupId = backupId;
        result.jobId = request.jobId;
        result.logPath = log.path();
        result.code = ErrorCode::InternalError;
        result.outcome = Job::Outcome::FAILURE;
        return result;
    }

    try {
        return execute(request, job, log, progressCallback);
    } catch (const std::exception& e) {
        lastError_ = std::string("Backup job failed unexpectedly: ") + e.what();
        Logger::error(lastError_);
        log.write("[ERROR] " + lastError_);
        log.writeRaw("BACKUP FAILED");

        BackupJobResult result;
        result.message = lastError_;
        result.errors.push_back(lastError_);
        result.backupId = backupId;
        result.jobId = request.jobId;
        result.logPath = log.path();
        result.code = ErrorCode::InternalError;
        result.outcome = Job::Outcome::FAILURE;

        try {
            logOperation(request, "backup", request.accounts, false, lastError_, backupId);
        } catch (const std::exception& inner) {
            Logger::error(std::string("Failed to record backup failure: ") + inner.what());
        }
        job.finish(Job::Outcome::FAILURE);
        return result;
    }
}

BackupJobResult BackupManager::execute(const BackupRequest& request, Job& job, JobLog& log,
                                       const ProgressCallback& progressCallback) {
    const std::string backupId = job.getId();
    job.setProgressCallback(progressCallback);

    log.banner("ACCTVAULT BACKUP OPERATION");
    log.writeRaw("Backup ID: " + backupId);
    if (!request.jobId.empty()) {
        log.writeRaw("Job ID: " + request.jobId);
    }
    log.writeRaw("Started: " + utils::currentTimestamp());
    log.writeRaw("User: " + request.user);
    log.writeRaw("Accounts: " + utils::join(request.accounts, ", "));
    log.writeRaw("");

    job.transition(Job::State::VALIDATE_DESTINATION);

    if (request.accounts.empty()) {
        return abort(request, job, log, ErrorCode::InvalidRequest, "No accounts specified", "backup");
    }

    std::optional<Destination> found = context_.destinations->findById(request.destinationId);
    if (!found) {
        log.write("[ERROR] Invalid destination ID: " + request.destinationId);
        return abort(request, job, log, ErrorCode::InvalidDestination, "Invalid destination", "backup");
    }
    const Destination destination = *found;
    const bool isLocal = destination.isLocal();
    const std::string logType = isLocal ? "backup_local" : "backup_remote";

    if (!destination.enabled) {
        log.write("[ERROR] Destination is disabled: " + destination.name);
        return abort(request, job, log, ErrorCode::DestinationDisabled, "Destination is disabled", logType);
    }

    UserConfig userConfig = context_.userConfigs->getUserConfig(request.user);
    std::shared_ptr<Transport> transport = context_.transports->createTransport(destination);
    if (!transport) {
        log.write("[ERROR] No transport available for type " + destination.normalizedType());
        return abort(request, job, log, ErrorCode::InvalidDestination,
                     "No transport for destination type " + destination.normalizedType(), logType);
    }

    log.write("[STEP 1/5] Validating destination...");
    log.write("  -> Destination: " + destination.name);
    log.write("  -> Type: " + destination.normalizedType());
    log.write("  -> Path: " + (destination.path.empty() ? std::string("/backup") : destination.path));
    log.writeRaw("");

    json baseContext = {
        {"accounts", request.accounts},
        {"destination", destination.name},
        {"user", request.user},
        {"requestor", request.requestor.empty() ? std::string("cron") : request.requestor},
        {"backup_id", backupId}
    };

    job.transition(Job::State::NOTIFY_START);
    if (userConfig.notifyBackupStart) {
        log.write("[STEP 2/5] Sending start notification...");
        context_.notifier->notify(NotificationEvent::BackupStart, baseContext, userConfig);
        log.write("  -> Notification sent");
    } else {
        log.write("[STEP 2/5] Start notification skipped (not enabled)");
    }
    log.writeRaw("");

    job.transition(Job::State::EXECUTE);
    job.setStatus("running");

    // Remote jobs stage into a directory private to this job
    std::string tempRoot = userConfig.tempDirectory.empty() ? context_.config.tempDir : userConfig.tempDirectory;
    ScopedTempFiles staging(tempRoot);
    std::string stagingDir;
    if (!isLocal) {
        stagingDir = trimTrailingSlash(tempRoot) + "/" + backupId;
    }

    BackupJobResult result;
    result.backupId = backupId;
    result.jobId = request.jobId;
    result.logPath = log.path();

    std::vector<std::string> logMessages;
    std::vector<std::string> accountsWithDuration;
    const int total = static_cast<int>(request.accounts.size());
    int completed = 0;
    ErrorCode firstError = ErrorCode::None;

    for (const auto& account : request.accounts) {
        ++completed;
        log.write("[STEP 3/5] Processing account " + std::to_string(completed) + "/" +
                  std::to_string(total) + ": " + account);
        log.writeRaw(RULE);

        auto started = std::chrono::steady_clock::now();

        AccountBackupResult accountResult;
        if (!isLocal && !fs::is_directory(stagingDir)) {
            std::error_code ec;
            fs::create_directories(stagingDir, ec);
            if (!ec) {
                fs::permissions(stagingDir, fs::perms::owner_all, ec);
                staging.track(stagingDir);
            }
            if (ec) {
                accountResult = failed(account, ErrorCode::DirectoryCreateFailed,
                                       "Failed to create temp directory: " + stagingDir);
            }
        }
        if (accountResult.message.empty()) {
            accountResult = backupAccount(account, destination, *transport, userConfig, stagingDir, log);
        }

        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        accountResult.account = account;
        accountResult.durationSeconds = elapsed;
        std::string duration = utils::formatDuration(elapsed);
        accountsWithDuration.push_back(account + " (" + duration + ")");

        if (!accountResult.success) {
            result.errors.push_back(account + ": " + accountResult.message);
            if (firstError == ErrorCode::None) {
                firstError = accountResult.code;
            }
            log.write("  FAILED: " + accountResult.message + " (" + duration + ")");
        } else {
            log.write("  SUCCESS: " + accountResult.message + " (" + duration + ")");

            ManifestEntry entry;
            entry.manifestId = request.scheduleId.empty() ? Manifest::MANUAL_ID : request.scheduleId;
            entry.account = account;
            entry.file = accountResult.file;
            entry.dbFile = accountResult.dbFile;
            entry.size = accountResult.size;
            entry.destinationId = destination.id;
            entry.retention = request.retention;
            entry.checksum = accountResult.checksum;
            if (!context_.manifest->addEntry(entry)) {
                log.write("  [WARNING] Failed to record archive in manifest: " + context_.manifest->getLastError());
            }
        }

        logMessages.push_back("[" + account + "] " + (accountResult.success ? "SUCCESS" : "FAILED") +
                              ": " + accountResult.message);
        result.results.push_back(accountResult);
        log.writeRaw("");

        job.updateProgress(completed, total);

        if (!request.jobId.empty() && context_.cancellation->isCancelled(request.jobId)) {
            log.writeRaw("");
            log.write("CANCELLATION REQUESTED");
            log.write("Job cancelled by user after completing " + std::to_string(completed) + "/" +
                      std::to_string(total) + " accounts");
            context_.cancellation->clear(request.jobId);

            std::vector<std::string> remaining(request.accounts.begin() + completed, request.accounts.end());
            if (!remaining.empty()) {
                log.write("Skipped (not attempted): " + utils::join(remaining, ", "));
            }
            logMessages.push_back("[CANCELLED] Remaining accounts skipped: " + utils::join(remaining, ", "));
            result.cancelled = true;
            break;
        }
    }

    staging.cleanup();

    result.success = result.errors.empty() && !result.cancelled;

    const int failedCount = static_cast<int>(result.errors.size());
    log.write("[STEP 4/5] Backup processing complete");
    log.write("  -> Completed: " + std::to_string(completed) + "/" + std::to_string(total));
    log.write("  -> Successful: " + std::to_string(completed - failedCount) + "/" + std::to_string(completed));
    log.write("  -> Failed: " + std::to_string(failedCount) + "/" + std::to_string(completed));
    if (result.cancelled) {
        log.write("  -> Status: CANCELLED");
    }
    log.writeRaw("");

    job.transition(Job::State::LOG);
    result.log = utils::join(logMessages, "\n");
    logOperation(request, logType, accountsWithDuration, result.success,
                 destination.describe() + "\n" + result.log, backupId);

    job.transition(Job::State::NOTIFY_END);
    log.write("[STEP 5/5] Sending completion notification...");
    if (result.success && userConfig.notifyBackupSuccess) {
        log.write("  -> Sending success notification");
        json context = baseContext;
        json results = json::object();
        for (const auto& r : result.results) {
            results[r.account] = {{"success", r.success}, {"message", r.message},
                                  {"file", r.file}, {"size", r.size}};
        }
        context["results"] = results;
        context_.notifier->notify(NotificationEvent::BackupSuccess, context, userConfig);
    } else if (!result.success && userConfig.notifyBackupFailure) {
        log.write("  -> Sending failure notification");
        json context = baseContext;
        context["errors"] = result.errors;
        context["cancelled"] = result.cancelled;
        context_.notifier->notify(NotificationEvent::BackupFailure, context, userConfig);
    } else {
        log.write("  -> No notification configured for this outcome");
    }

    log.writeRaw("");
    log.banner(result.cancelled ? "BACKUP CANCELLED" : (result.success ? "BACKUP COMPLETED SUCCESSFULLY" : "BACKUP FAILED"));
    if (result.cancelled) {
        log.writeRaw("Completed " + std::to_string(completed) + "/" + std::to_string(total) +
                     " accounts before cancellation");
    } else if (!result.success) {
        log.writeRaw("Errors: " + utils::join(result.errors, "; "));
    }
    log.writeRaw("Finished: " + utils::currentTimestamp());

    if (result.success) {
        result.message = "All backups completed successfully";
        result.outcome = Job::Outcome::SUCCESS;
    } else if (result.cancelled) {
        result.message = "Cancelled after " + std::to_string(completed) + "/" + std::to_string(total) + " accounts";
        result.code = ErrorCode::Cancelled;
        result.outcome = Job::Outcome::CANCELLED;
    } else {
        result.message = "Some backups failed";
        result.code = firstError;
        result.outcome = Job::Outcome::FAILURE;
    }

    job.finish(result.outcome);
    Logger::info("Backup " + backupId + ": " + result.message);
    return result;
}

AccountBackupResult BackupManager::backupAccount(const std::string& account,
                                                 const Destination& destination,
                                                 Transport& transport,
                                                 const UserConfig& userConfig,
                                                 const std::string& stagingDir,
                                                 JobLog& log) {
    const bool isLocal = destination.isLocal();
    std::string workDir;

    if (isLocal) {
        std::string base = trimTrailingSlash(destination.path.empty() ? std::string("/backup") : destination.path);
        workDir = base + "/" + account;
        std::error_code ec;
        if (!fs::is_directory(workDir, ec)) {
            fs::create_directories(workDir, ec);
            if (ec) {
                return failed(account, ErrorCode::DirectoryCreateFailed,
                              "Failed to create backup directory: " + workDir);
            }
            fs::permissions(workDir, fs::perms::owner_all, ec);
        }
    } else {
        workDir = stagingDir;
    }

    log.write("  [3a] Preparing backup environment...");
    log.write("      -> Destination type: " + destination.normalizedType());
    log.write("      -> Working directory: " + workDir);

    log.write("  [3b] Running archive tool for " + account + "...");
    log.writeRaw("      " + std::string(56, '-'));
    ArchiveToolResult archive = context_.archiveTool->createArchive(account, workDir, userConfig, toolOutputTo(log));
    log.writeRaw("      " + std::string(56, '-'));

    if (!archive.success) {
        log.write("      archive tool failed: " + archive.message);
        return failed(account, archive.code == ErrorCode::None ? ErrorCode::ArchiveToolFailed : archive.code,
                      archive.message);
    }
    log.write("      archive tool completed successfully");

    std::error_code ec;
    if (!fs::is_regular_file(archive.path, ec)) {
        log.write("      archive tool did not create expected file: " + archive.path);
        if (fs::is_directory(archive.path, ec)) {
            fs::remove_all(archive.path, ec);
        }
        return failed(account, ErrorCode::ArtifactMissing, "Archive tool did not create a valid archive file");
    }

    std::time_t now = std::time(nullptr);
    std::string backupFile = archive_name::buildBackupName(account, now);
    std::string finalPath = workDir + "/" + backupFile;

    log.write("      -> Renaming to: " + backupFile);
    fs::rename(archive.path, finalPath, ec);
    if (ec) {
        log.write("      Failed to rename backup file: " + ec.message());
        std::error_code removeEc;
        fs::remove(archive.path, removeEc);
        return failed(account, ErrorCode::RenameFailed, "Failed to rename backup file");
    }
    chmod(finalPath.c_str(), 0600);

    AccountBackupResult result;
    result.account = account;
    result.file = backupFile;
    auto size = fs::file_size(finalPath, ec);
    result.size = ec ? 0 : static_cast<int64_t>(size);
    log.write("      -> Archive size: " + utils::formatSize(result.size));

    std::string checksumError;
    if (utils::sha256File(finalPath, result.checksum, checksumError)) {
        log.write("      -> SHA-256: " + result.checksum);
    } else {
        log.write("      [WARNING] " + checksumError);
    }

    struct StagedFile {
        std::string local;
        std::string remote;
    };
    std::vector<StagedFile> staged = {{finalPath, account + "/" + backupFile}};

    if (userConfig.usesHotDatabaseBackup()) {
        log.write("  [3c] Running hot database backup (" + userConfig.dbBackupMethod + ")...");
        DatabaseBackupResult db = context_.databaseTool->backupDatabases(account, workDir, userConfig, now,
                                                                         toolOutputTo(log));
        if (!db.success && !db.skipped) {
            log.write("      Database backup failed: " + db.message);
            fs::remove(finalPath, ec);
            return failed(account, ErrorCode::DatabaseBackupFailed, "Database backup failed: " + db.message);
        }
        if (!db.archivePath.empty() && fs::is_regular_file(db.archivePath, ec)) {
            result.dbFile = archive_name::baseName(db.archivePath);
            auto dbSize = fs::file_size(db.archivePath, ec);
            log.write("      Database backup created: " + result.dbFile + " (" +
                      utils::formatSize(ec ? 0 : static_cast<int64_t>(dbSize)) + ")");
            staged.push_back({db.archivePath, account + "/" + result.dbFile});
        } else {
            log.write("      -> No databases to backup (skipped)");
        }
    } else {
        log.write("  [3c] Database backup method: " + userConfig.dbBackupMethod + " (included in archive)");
    }

    if (isLocal) {
        log.write("  [3d] Local backup complete - files in place");
        result.success = true;
        result.message = "Backup completed successfully";
        return result;
    }

    log.write("  [3d] Uploading to remote destination...");
    TransportResult dir = transport.mkdir(account, destination);
    if (!dir.success) {
        log.write("      [WARNING] Could not create remote directory " + account + ": " + dir.message);
    }

    std::vector<std::string> uploadErrors;
    for (const auto& file : staged) {
        std::string name = archive_name::baseName(file.local);
        log.write("      -> Uploading: " + name);
        TransportResult upload = transport.upload(file.local, file.remote, destination);
        if (upload.success) {
            log.write("        Upload successful");
        } else {
            std::string message = upload.message.empty() ? "Upload failed" : upload.message;
            uploadErrors.push_back(name + ": " + message);
            log.write("        Upload failed: " + message);
        }
    }

    // Staged copies go regardless of how the uploads went
    log.write("  [3e] Cleaning up temporary files...");
    for (const auto& file : staged) {
        if (fs::exists(file.local, ec)) {
            log.write("      -> Removing: " + archive_name::baseName(file.local));
            fs::remove(file.local, ec);
            if (ec) {
                log.write("      [WARNING] Failed to remove " + file.local + ": " + ec.message());
            }
        }
    }
    log.write("      Cleanup complete");

    if (!uploadErrors.empty()) {
        result.success = false;
        result.code = ErrorCode::TransportFailed;
        result.message = utils::join(uploadErrors, "; ");
        return result;
    }

    result.success = true;
    result.message = "Backup completed successfully";
    return result;
}

BackupJobResult BackupManager::abort(const BackupRequest& request, Job& job, JobLog& log,
                                     ErrorCode code, const std::string& message,
                                     const std::string& logType) {
    lastError_ = message;
    log.writeRaw("");
    log.writeRaw("BACKUP FAILED");
    Logger::error("Backup " + job.getId() + " aborted: " + message);

    job.transition(Job::State::LOG);
    logOperation(request, logType, request.accounts, false,
                 message + " (" + errorCodeToString(code) + ")", job.getId());
    job.finish(Job::Outcome::FAILURE);

    BackupJobResult result;
    result.success = false;
    result.message = message;
    result.errors.push_back(message);
    result.backupId = job.getId();
    result.jobId = request.jobId;
    result.logPath = log.path();
    result.code = code;
    result.outcome = Job::Outcome::FAILURE;
    return result;
}

void BackupManager::logOperation(const BackupRequest& request, const std::string& type,
                                 const std::vector<std::string>& items, bool success,
                                 const std::string& message, const std::string& backupId) {
    OperationLogEvent event;
    event.user = request.user;
    event.type = type;
    event.items = items;
    event.success = success;
    event.message = message;
    event.requestor = request.requestor;
    event.jobId = backupId;
    if (!context_.operationLogger->logEvent(event)) {
        Logger::warning("Operation log entry for " + backupId + " was not written");
    }
}

bool BackupManager::listBackups(const std::string& destinationId, const std::string& accountFilter,
                                std::vector<BackupListing>& backups) {
    backups.clear();

    std::optional<Destination> destination = context_.destinations->findById(destinationId);
    if (!destination) {
        lastError_ = "Invalid destination";
        return false;
    }

    std::shared_ptr<Transport> transport = context_.transports->createTransport(*destination);
    if (!transport) {
        lastError_ = "No transport for destination type " + destination->normalizedType();
        return false;
    }

    try {
        std::vector<TransportEntry> topLevel;
        TransportResult listed = transport->list("", *destination, topLevel);
        if (!listed.success) {
            lastError_ = listed.message;
            return false;
        }

        std::vector<TransportEntry> files;
        for (const auto& entry : topLevel) {
            if (!entry.isDirectory()) {
                files.push_back(entry);
                continue;
            }
            if (!accountFilter.empty() && !utils::containsIgnoreCase(entry.name, accountFilter)) {
                continue;
            }
            std::vector<TransportEntry> inner;
            TransportResult sub = transport->list(entry.path, *destination, inner);
            if (!sub.success) {
                Logger::warning("Failed to list " + entry.path + ": " + sub.message);
                continue;
            }
            files.insert(files.end(), inner.begin(), inner.end());
        }

        for (const auto& file : files) {
            if (file.isDirectory()) {
                continue;
            }
            std::optional<std::string> account = archive_name::parseAccount(file.name);
            if (!account) {
                continue;
            }
            if (!accountFilter.empty() && !utils::containsIgnoreCase(file.name, accountFilter)) {
                continue;
            }
            BackupListing listing;
            listing.path = file.path;
            listing.displayName = file.name;
            listing.size = file.size;
            listing.account = *account;
            listing.date = archive_name::parseDisplayDate(file.name).value_or("");
            backups.push_back(listing);
        }
    } catch (const std::exception& e) {
        lastError_ = std::string("Failed to list backups: ") + e.what();
        Logger::error(lastError_);
        return false;
    }

    std::sort(backups.begin(), backups.end(),
              [](const BackupListing& a, const BackupListing& b) { return a.path > b.path; });
    return true;
}
