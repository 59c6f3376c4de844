#include "restore/restore_manager.hpp"
#include "common/archive_name.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <regex>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::string RULE(60, '-');
const size_t PREVIEW_SAMPLE_LIMIT = 50;

std::string trimTrailingSlash(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string fileSizeText(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    return ec ? std::string("unknown size") : utils::formatSize(static_cast<int64_t>(size));
}

} // namespace

RestoreManager::RestoreManager(EngineContext context) : context_(std::move(context)) {}

RestoreJobResult RestoreManager::run(const RestoreRequest& request) {
    std::string restoreId = utils::sanitizeName(request.restoreId);
    if (restoreId.empty()) {
        restoreId = Job::generateId("restore");
    }
    Job job(restoreId);
    JobLog log(context_.config.logDir, restoreId);

    RestoreJobResult result;
    result.restoreId = restoreId;
    result.logPath = log.path();
    result.outcome = Job::Outcome::FAILURE;

    if (!context_.isComplete()) {
        lastError_ = "Restore engine is missing collaborators";
        Logger::error(lastError_);
        log.write("ERROR: " + lastError_);
        job.finish(Job::Outcome::FAILURE);
        result.message = lastError_;
        result.code = ErrorCode::InternalError;
        return result;
    }

    try {
        return execute(request, job, log);
    } catch (const std::exception& e) {
        lastError_ = std::string("Restore failed unexpectedly: ") + e.what();
        Logger::error(lastError_);
        log.write("ERROR: " + lastError_);
        result.message = lastError_;
        result.code = ErrorCode::InternalError;
        result.account = archive_name::parseAccount(request.archive).value_or("");
        try {
            logOperation(request, "restore", result.account.empty() ? request.archive : result.account,
                         false, lastError_, restoreId);
        } catch (const std::exception& inner) {
            Logger::error(std::string("Failed to record restore failure: ") + inner.what());
        }
        job.finish(Job::Outcome::FAILURE);
        return result;
    }
}

RestoreJobResult RestoreManager::execute(const RestoreRequest& request, Job& job, JobLog& log) {
    auto started = std::chrono::steady_clock::now();
    auto elapsed = [&started]() {
        return utils::formatDuration(
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count());
    };

    RestoreJobResult result;
    result.restoreId = job.getId();
    result.logPath = log.path();
    result.outcome = Job::Outcome::FAILURE;

    job.transition(Job::State::VALIDATE_DESTINATION);

    std::optional<Destination> found = context_.destinations->findById(request.destinationId);
    if (!found) {
        log.write("ERROR: Invalid destination ID: " + request.destinationId);
        result.message = "Invalid destination";
        result.code = ErrorCode::InvalidDestination;
        return fail(request, job, log, result, "restore", result.message, request.archive);
    }
    const Destination destination = *found;
    const bool isLocal = destination.isLocal();
    const std::string logType = isLocal ? "restore_local" : "restore_remote";
    const std::string destInfo = destination.describe();

    if (!destination.enabled) {
        log.write("ERROR: Destination is disabled: " + destination.name);
        result.message = "Destination is disabled";
        result.code = ErrorCode::DestinationDisabled;
        return fail(request, job, log, result, logType, destInfo + "\n" + result.message, request.archive);
    }

    std::optional<std::string> account = archive_name::parseAccount(request.archive);
    if (!account) {
        log.write("ERROR: Cannot determine account from backup filename: " +
                  archive_name::baseName(request.archive));
        result.message = "Unrecognised backup filename: " + archive_name::baseName(request.archive);
        result.code = ErrorCode::UnparsableFilename;
        return fail(request, job, log, result, logType, destInfo + "\n" + result.message, request.archive);
    }
    result.account = *account;

    std::shared_ptr<Transport> transport = context_.transports->createTransport(destination);
    if (!transport) {
        result.message = "No transport for destination type " + destination.normalizedType();
        result.code = ErrorCode::InvalidDestination;
        return fail(request, job, log, result, logType, destInfo + "\n" + result.message, result.account);
    }

    UserConfig userConfig = context_.userConfigs->getUserConfig(request.user);
    std::string tempRoot = userConfig.tempDirectory.empty() ? context_.config.tempDir : userConfig.tempDirectory;
    ScopedTempFiles staging(tempRoot);
    std::string stagingDir = trimTrailingSlash(tempRoot) + "/" + job.getId();

    log.write("=== ACCTVAULT RESTORE OPERATION ===");
    log.write("Restore ID: " + job.getId());
    log.write("Account: " + result.account);
    log.write("Backup file: " + archive_name::baseName(request.archive));
    log.write("Source: " + destination.name + " (" + destination.normalizedType() + ")");
    log.write(RULE);

    job.transition(Job::State::RETRIEVE);
    if (isLocal) {
        log.write("Locating backup file on local storage...");
    } else {
        log.write("Downloading backup from remote destination...");
        log.write("Remote path: " + request.archive);
    }

    std::string localPath;
    std::string error;
    if (!retrieve(request.archive, destination, *transport, stagingDir, staging, localPath, error)) {
        log.write("ERROR: Retrieval failed - " + error);
        cleanupStaging(staging, log);
        result.message = "Retrieval failed: " + error;
        result.code = ErrorCode::RetrievalFailed;
        return fail(request, job, log, result, logType, destInfo + "\nRetrieval failed: " + error,
                    result.account + " (" + elapsed() + ")");
    }
    if (isLocal) {
        log.write("Backup file located: " + localPath + " (" + fileSizeText(localPath) + ")");
    } else {
        log.write("Download complete! Size: " + fileSizeText(localPath));
        log.write("Local path: " + localPath);
    }
    log.write(RULE);

    job.transition(Job::State::VERIFY);
    log.write("Verifying backup file integrity...");
    VerificationResult verification = context_.verifier->verify(localPath);
    if (!verification.success) {
        log.write("ERROR: Invalid backup file - " + verification.errorMessage);
        cleanupStaging(staging, log);
        result.message = "Invalid backup file: " + verification.errorMessage;
        result.code = ErrorCode::VerificationFailed;
        return fail(request, job, log, result, logType, destInfo + "\n" + result.message,
                    result.account + " (" + elapsed() + ")");
    }
    log.write("Backup file verified successfully (" + std::to_string(verification.entryCount) + " entries).");
    log.write(RULE);

    // Companion hot database archive, if one was taken with this backup
    std::string dbLocalPath;
    std::optional<std::string> dbReference = archive_name::companionDatabasePath(request.archive);
    if (dbReference && transport->exists(*dbReference, destination)) {
        log.write("Found accompanying database backup: " + archive_name::baseName(*dbReference));
        if (!isLocal) {
            log.write("Downloading database backup...");
        }
        std::string dbError;
        if (retrieve(*dbReference, destination, *transport, stagingDir, staging, dbLocalPath, dbError)) {
            log.write("Database backup ready (" + fileSizeText(dbLocalPath) + ")");
        } else {
            log.write("Warning: Could not retrieve database backup - " + dbError);
            dbLocalPath.clear();
        }
        log.write(RULE);
    }

    json notifyContext = {
        {"account", result.account},
        {"backup_file", request.archive},
        {"destination", destination.name},
        {"user", request.user},
        {"requestor", request.requestor.empty() ? std::string("cron") : request.requestor},
        {"restore_id", job.getId()}
    };

    job.transition(Job::State::NOTIFY_START);
    if (userConfig.notifyRestoreStart) {
        log.write("Sending restore start notification...");
        context_.notifier->notify(NotificationEvent::RestoreStart, notifyContext, userConfig);
    }

    job.transition(Job::State::EXECUTE);
    job.setStatus("running");
    log.write("Restoring account using restore tool...");
    log.write("Source: " + archive_name::baseName(localPath));
    std::vector<std::string> disabled = request.options.disabledModules();
    if (!disabled.empty()) {
        log.write("Disabled modules: " + utils::join(disabled, ", "));
    }

    RestoreToolResult restored = context_.restoreTool->restoreArchive(
        localPath, request.options,
        [&log](StreamKind stream, const std::string& line) {
            std::string trimmed = utils::trim(line);
            if (trimmed.empty()) {
                return;
            }
            log.write(stream == StreamKind::Stderr ? "[STDERR] " + trimmed : trimmed);
        });
    result.exitCode = restored.exitCode;

    if (!restored.success) {
        if (restored.code == ErrorCode::ProcessSpawnFailed) {
            log.write("ERROR: Failed to start restore process");
        } else {
            log.write("restore tool FAILED (exit code: " + std::to_string(restored.exitCode) + ")");
        }
        result.success = false;
        result.message = restored.message;
        result.code = restored.code == ErrorCode::None ? ErrorCode::RestoreToolFailed : restored.code;
    } else {
        log.write("restore tool completed successfully.");
        log.write("Account restore completed successfully.");
        result.success = true;
        result.message = restored.message.empty() ? "Restore completed successfully" : restored.message;
    }
    log.write(RULE);

    if (result.success && !dbLocalPath.empty()) {
        log.write("Restoring database data from hot backup...");
        std::string method = userConfig.usesHotDatabaseBackup() ? userConfig.dbBackupMethod : std::string("auto");
        DatabaseRestoreResult db = context_.databaseTool->restoreDatabases(
            result.account, dbLocalPath, method,
            [&log](StreamKind stream, const std::string& line) {
                std::string trimmed = utils::trim(line);
                if (!trimmed.empty()) {
                    log.write(stream == StreamKind::Stderr ? "[STDERR] " + trimmed : trimmed);
                }
            });
        std::string reason = db.message.empty() ? std::string("Unknown") : db.message;
        if (!db.success) {
            log.write("WARNING: Database data restore failed - " + reason);
            result.message += " (Warning: DB data restore failed: " + reason + ")";
            result.dbRestoreFailed = true;
            result.warning = ErrorCode::DatabaseRestoreFailed;
        } else {
            log.write("Database data restored successfully.");
            result.message += " (DB data restored)";
        }
        log.write(RULE);
    }

    cleanupStaging(staging, log);

    job.transition(Job::State::LOG);
    logOperation(request, logType, result.account + " (" + elapsed() + ")", result.success,
                 destInfo + "\n" + result.message, job.getId());

    job.transition(Job::State::NOTIFY_END);
    if (result.success && userConfig.notifyRestoreSuccess) {
        log.write("Sending restore success notification...");
        json context = notifyContext;
        context["message"] = result.message;
        context_.notifier->notify(NotificationEvent::RestoreSuccess, context, userConfig);
    } else if (!result.success && userConfig.notifyRestoreFailure) {
        log.write("Sending restore failure notification...");
        json context = notifyContext;
        context["error"] = result.message;
        context_.notifier->notify(NotificationEvent::RestoreFailure, context, userConfig);
    }

    log.write(std::string(60, '='));
    log.write(result.success ? "RESTORE COMPLETED SUCCESSFULLY" : "RESTORE FAILED");
    log.write(std::string(60, '='));

    result.outcome = result.success ? Job::Outcome::SUCCESS : Job::Outcome::FAILURE;
    job.finish(result.outcome);
    Logger::info("Restore " + job.getId() + " of " + result.account + ": " + result.message);
    return result;
}

bool RestoreManager::retrieve(const std::string& reference, const Destination& destination,
                              Transport& transport, const std::string& stagingDir,
                              ScopedTempFiles& staging, std::string& localPath, std::string& error) {
    std::error_code ec;

    if (destination.isLocal()) {
        localPath = Transport::resolvePath(reference, destination);
        if (!fs::is_regular_file(localPath, ec)) {
            error = "Backup file not found: " + localPath;
            return false;
        }
        return true;
    }

    if (!fs::is_directory(stagingDir, ec)) {
        fs::create_directories(stagingDir, ec);
        if (ec) {
            error = "Failed to create temp directory " + stagingDir + ": " + ec.message();
            return false;
        }
        fs::permissions(stagingDir, fs::perms::owner_all, ec);
        staging.track(stagingDir);
    }

    localPath = stagingDir + "/" + archive_name::baseName(reference);
    staging.track(localPath);

    TransportResult downloaded = transport.download(reference, localPath, destination);
    if (!downloaded.success) {
        error = downloaded.message.empty() ? std::string("Download failed") : downloaded.message;
        return false;
    }
    if (!fs::is_regular_file(localPath, ec)) {
        error = "Downloaded file missing: " + localPath;
        return false;
    }
    return true;
}

RestoreJobResult RestoreManager::fail(const RestoreRequest& request, Job& job, JobLog& log,
                                      RestoreJobResult result, const std::string& logType,
                                      const std::string& logMessage, const std::string& items) {
    lastError_ = result.message;
    Logger::error("Restore " + job.getId() + " failed: " + result.message);
    log.write("RESTORE FAILED");

    job.transition(Job::State::LOG);
    logOperation(request, logType, items, false, logMessage, job.getId());
    job.finish(Job::Outcome::FAILURE);

    result.success = false;
    result.outcome = Job::Outcome::FAILURE;
    return result;
}

void RestoreManager::logOperation(const RestoreRequest& request, const std::string& type,
                                  const std::string& item, bool success, const std::string& message,
                                  const std::string& restoreId) {
    OperationLogEvent event;
    event.user = request.user;
    event.type = type;
    event.items = {item};
    event.success = success;
    event.message = message;
    event.requestor = request.requestor;
    event.jobId = restoreId;
    if (!context_.operationLogger->logEvent(event)) {
        Logger::warning("Operation log entry for " + restoreId + " was not written");
    }
}

void RestoreManager::cleanupStaging(ScopedTempFiles& staging, JobLog& log) {
    if (staging.tracked().empty()) {
        return;
    }
    log.write("Cleaning up temporary files...");
    for (const auto& path : staging.cleanup()) {
        log.write("Removed temporary file: " + archive_name::baseName(path));
    }
    log.write("Cleanup complete.");
}

BackupPreview RestoreManager::previewBackup(const std::string& archivePath) const {
    BackupPreview preview;

    std::vector<std::string> entries;
    std::string error;
    if (!context_.verifier) {
        preview.message = "No archive reader configured";
        return preview;
    }
    if (!context_.verifier->listEntries(archivePath, entries, error)) {
        preview.message = error;
        return preview;
    }

    static const std::regex accountPattern("cpmove-([a-z0-9_]+)");
    for (const auto& entry : entries) {
        std::smatch match;
        if (std::regex_search(entry, match, accountPattern)) {
            preview.account = match[1].str();
        }
        if (entry.find("homedir") != std::string::npos) preview.hasHomedir = true;
        if (entry.find("mysql") != std::string::npos) preview.hasMysql = true;
        if (entry.find("pgsql") != std::string::npos || entry.find("postgres") != std::string::npos) {
            preview.hasPgsql = true;
        }
        if (entry.find("mail") != std::string::npos || entry.find("/et/") != std::string::npos) {
            preview.hasEmail = true;
        }
        if (entry.find("ssl") != std::string::npos) preview.hasSsl = true;
        if (entry.find("dnszones") != std::string::npos) preview.hasDnsZones = true;
    }

    preview.totalFiles = entries.size();
    size_t samples = std::min(entries.size(), PREVIEW_SAMPLE_LIMIT);
    preview.sampleFiles.assign(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(samples));

    std::error_code ec;
    auto size = fs::file_size(archivePath, ec);
    preview.size = ec ? 0 : static_cast<int64_t>(size);
    preview.success = true;
    return preview;
}

bool RestoreManager::accountExists(const std::string& account, const std::string& passwdPath,
                                   const std::string& homeRoot) {
    if (account.empty()) {
        return false;
    }

    std::ifstream passwd(passwdPath);
    std::string line;
    while (std::getline(passwd, line)) {
        if (utils::startsWith(line, account + ":")) {
            return true;
        }
    }

    std::error_code ec;
    return fs::is_directory(trimTrailingSlash(homeRoot) + "/" + account, ec);
}
