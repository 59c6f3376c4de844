#pragma once

#include "backup/backup_verifier.hpp"
#include "cancel/cancellation.hpp"
#include "config/app_config.hpp"
#include "config/user_config.hpp"
#include "destination/destination.hpp"
#include "manifest/manifest.hpp"
#include "notify/notifier.hpp"
#include "oplog/operation_logger.hpp"
#include "tools/archive_tool.hpp"
#include "tools/database_tool.hpp"
#include "tools/restore_tool.hpp"
#include "transport/transport.hpp"
#include <memory>

// Collaborators shared by the backup and restore orchestrators.
// Every member must be set; use the Null/Never implementations where a
// deployment has nothing to plug in.
struct EngineContext {
    AppConfig config;
    std::shared_ptr<DestinationRegistry> destinations;
    std::shared_ptr<UserConfigStore> userConfigs;
    std::shared_ptr<TransportFactory> transports;
    std::shared_ptr<ArchiveTool> archiveTool;
    std::shared_ptr<RestoreTool> restoreTool;
    std::shared_ptr<DatabaseTool> databaseTool;
    std::shared_ptr<ArchiveVerifier> verifier;
    std::shared_ptr<Manifest> manifest;
    std::shared_ptr<Notifier> notifier;
    std::shared_ptr<OperationLogger> operationLogger;
    std::shared_ptr<CancellationCheck> cancellation;

    bool isComplete() const {
        return destinations && userConfigs && transports && archiveTool && restoreTool &&
               databaseTool && verifier && manifest && notifier && operationLogger && cancellation;
    }
};
