#include "common/job_manager.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "notify/channels.hpp"
#include "transport/transport_factory.hpp"
#include <algorithm>
#include <filesystem>

JobManager::JobManager(const AppConfig& config) : context_(buildContext(config)) {
    cancelStore_ = std::dynamic_pointer_cast<FileCancellationStore>(context_.cancellation);
}

JobManager::JobManager(EngineContext context) : context_(std::move(context)) {
    cancelStore_ = std::dynamic_pointer_cast<FileCancellationStore>(context_.cancellation);
}

EngineContext JobManager::buildContext(const AppConfig& config) {
    EngineContext context;
    context.config = config;
    context.destinations = std::make_shared<DestinationRegistry>();
    context.userConfigs = std::make_shared<UserConfigStore>(config.configDir);
    context.transports = std::make_shared<DefaultTransportFactory>(config.transportBridgePath);
    context.archiveTool = std::make_shared<PkgAcctTool>(config.archiveToolPath);
    context.restoreTool = std::make_shared<RestorePkgTool>(config.restoreToolPath);
    context.databaseTool = std::make_shared<HotCopyDatabaseTool>(config.databaseToolPath);
    context.verifier = std::make_shared<BackupVerifier>();
    context.manifest = std::make_shared<Manifest>(config.manifestDir);
    context.operationLogger = std::make_shared<FileOperationLogger>(config.operationLogPath());
    context.cancellation = std::make_shared<FileCancellationStore>(config.cancelDir);

    auto dispatcher = std::make_shared<NotificationDispatcher>();
    dispatcher->addChannel(std::make_shared<EmailChannel>(config.sendmailPath));
    dispatcher->addChannel(std::make_shared<WebhookChannel>());
    context.notifier = dispatcher;
    return context;
}

bool JobManager::initialize() {
    if (!context_.isComplete()) {
        lastError_ = "Engine context is incomplete";
        Logger::error(lastError_);
        return false;
    }

    const std::string& destinationsFile = context_.config.destinationsFile;
    std::error_code ec;
    if (!destinationsFile.empty() && std::filesystem::exists(destinationsFile, ec)) {
        if (!context_.destinations->loadFromFile(destinationsFile)) {
            lastError_ = context_.destinations->getLastError();
            return false;
        }
    } else if (!destinationsFile.empty()) {
        Logger::warning("No destinations file at " + destinationsFile);
    }

    backupManager_ = std::make_unique<BackupManager>(context_);
    restoreManager_ = std::make_unique<RestoreManager>(context_);
    return true;
}

BackupJobResult JobManager::runBackup(const BackupRequest& request, ProgressCallback progressCallback) {
    if (!backupManager_) {
        BackupJobResult result;
        result.message = "Job manager not initialized";
        result.code = ErrorCode::InternalError;
        result.outcome = Job::Outcome::FAILURE;
        lastError_ = result.message;
        return result;
    }
    BackupJobResult result = backupManager_->run(request, std::move(progressCallback));
    if (!result.success) {
        lastError_ = result.message;
    }
    return result;
}

RestoreJobResult JobManager::runRestore(const RestoreRequest& request) {
    if (!restoreManager_) {
        RestoreJobResult result;
        result.message = "Job manager not initialized";
        result.code = ErrorCode::InternalError;
        result.outcome = Job::Outcome::FAILURE;
        lastError_ = result.message;
        return result;
    }
    RestoreJobResult result = restoreManager_->run(request);
    if (!result.success) {
        lastError_ = result.message;
    }
    return result;
}

bool JobManager::requestCancel(const std::string& jobId) {
    if (!cancelStore_) {
        lastError_ = "Cancellation is not supported by this engine";
        return false;
    }
    if (!cancelStore_->requestCancel(jobId)) {
        lastError_ = cancelStore_->getLastError();
        return false;
    }
    return true;
}

LogPage JobManager::getLogs(const LogQuery& query) const {
    return context_.operationLogger->getLogs(query);
}

bool JobManager::listBackups(const std::string& destinationId, const std::string& accountFilter,
                             std::vector<BackupListing>& backups) {
    if (!backupManager_) {
        lastError_ = "Job manager not initialized";
        return false;
    }
    if (!backupManager_->listBackups(destinationId, accountFilter, backups)) {
        lastError_ = backupManager_->getLastError();
        return false;
    }
    return true;
}

BackupPreview JobManager::previewBackup(const std::string& archivePath) const {
    if (!restoreManager_) {
        BackupPreview preview;
        preview.message = "Job manager not initialized";
        return preview;
    }
    return restoreManager_->previewBackup(archivePath);
}

PruneResult JobManager::pruneSchedule(const std::string& scheduleId, const std::string& destinationId,
                                      int retention) {
    PruneResult result;

    std::optional<Destination> destination = context_.destinations->findById(destinationId);
    if (!destination) {
        result.success = false;
        result.errors.push_back("Invalid destination");
        lastError_ = result.errors.back();
        return result;
    }
    std::shared_ptr<Transport> transport = context_.transports->createTransport(*destination);
    if (!transport) {
        result.success = false;
        result.errors.push_back("No transport for destination type " + destination->normalizedType());
        lastError_ = result.errors.back();
        return result;
    }

    std::vector<std::string> accounts;
    for (const auto& entry : context_.manifest->readEntries(scheduleId)) {
        if (entry.destinationId != destinationId) {
            continue;
        }
        if (std::find(accounts.begin(), accounts.end(), entry.account) == accounts.end()) {
            accounts.push_back(entry.account);
        }
    }

    std::vector<std::string> pruned;
    for (const auto& account : accounts) {
        for (const auto& entry : context_.manifest->getExpiredEntries(scheduleId, account, retention)) {
            if (entry.destinationId != destinationId) {
                continue;
            }

            TransportResult removed = transport->remove(account + "/" + entry.file, *destination);
            if (!removed.success) {
                result.errors.push_back(entry.file + ": " + removed.message);
                Logger::warning("Failed to prune " + entry.file + ": " + removed.message);
                continue;
            }
            if (!entry.dbFile.empty()) {
                TransportResult removedDb = transport->remove(account + "/" + entry.dbFile, *destination);
                if (!removedDb.success) {
                    Logger::warning("Failed to prune " + entry.dbFile + ": " + removedDb.message);
                }
            }
            pruned.push_back(entry.file);
            Logger::info("Pruned " + entry.file + " from " + destination->name);
        }
    }

    if (!pruned.empty() && !context_.manifest->removeEntries(scheduleId, pruned)) {
        result.errors.push_back(context_.manifest->getLastError());
    }

    if (!pruned.empty()) {
        OperationLogEvent event;
        event.user = "root";
        event.type = destination->isLocal() ? "prune_local" : "prune_remote";
        std::string where = destination->isLocal() || destination->host.empty() ? destination->name : destination->host;
        event.items = {"Destination: " + where, "Retention: " + std::to_string(retention), "Schedule: " + scheduleId};
        event.success = result.errors.empty();
        event.message = "Deleted:\n" + utils::join(pruned, "\n");
        event.requestor = "cron";
        if (!context_.operationLogger->logEvent(event)) {
            Logger::warning("Operation log entry for prune of " + scheduleId + " was not written");
        }
    }

    result.removed = pruned;
    result.success = result.errors.empty();
    if (!result.success) {
        lastError_ = result.errors.front();
    }
    return result;
}
