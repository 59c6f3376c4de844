#pragma once

#include "common/archive_name.hpp"
#include "common/engine_context.hpp"
#include "test_support.hpp"
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

// Writes {targetDir}/cpmove-{account}.tar.gz unless the account is listed as failing
class FakeArchiveTool : public ArchiveTool {
public:
    ArchiveToolResult createArchive(const std::string& account, const std::string& targetDir,
                                    const UserConfig&, const LineCallback& onLine) override {
        calls.push_back(account);
        ArchiveToolResult result;
        result.path = targetDir + "/cpmove-" + account + ".tar.gz";
        if (onLine) {
            onLine(StreamKind::Stdout, "pkgacct working on " + account);
            onLine(StreamKind::Stderr, "warning for " + account);
        }
        if (failing.count(account)) {
            result.message = "Archive tool exited with code 2";
            result.code = ErrorCode::ArchiveToolFailed;
            return result;
        }
        if (!missingArtifact.count(account)) {
            std::ofstream(result.path) << "archive of " << account << "\n";
        }
        result.success = true;
        result.message = "Archive created";
        return result;
    }

    std::vector<std::string> calls;
    std::set<std::string> failing;
    std::set<std::string> missingArtifact;
};

// Remote store kept in memory, keyed by remote path
class FakeTransport : public Transport {
public:
    TransportResult upload(const std::string& localPath, const std::string& remoteKey,
                           const Destination&) override {
        TransportResult result;
        result.path = remoteKey;
        uploads.push_back(remoteKey);
        if (failUploads) {
            result.message = "connection reset";
            return result;
        }
        files[remoteKey] = TempDir::read(localPath);
        result.success = true;
        return result;
    }

    TransportResult download(const std::string& remoteKey, const std::string& localPath,
                             const Destination&) override {
        TransportResult result;
        result.path = remoteKey;
        downloads.push_back(remoteKey);
        auto it = files.find(remoteKey);
        if (it == files.end()) {
            result.message = "No such file: " + remoteKey;
            return result;
        }
        std::ofstream(localPath, std::ios::binary) << it->second;
        result.success = true;
        return result;
    }

    TransportResult list(const std::string& path, const Destination&,
                         std::vector<TransportEntry>& entries) override {
        entries.clear();
        std::set<std::string> dirs;
        std::string prefix = path.empty() ? "" : path + "/";
        for (const auto& file : files) {
            if (file.first.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            std::string rest = file.first.substr(prefix.size());
            size_t slash = rest.find('/');
            TransportEntry entry;
            if (slash != std::string::npos) {
                std::string dir = rest.substr(0, slash);
                if (!dirs.insert(dir).second) {
                    continue;
                }
                entry.name = dir;
                entry.path = prefix + dir;
                entry.type = "dir";
            } else {
                entry.name = rest;
                entry.path = file.first;
                entry.size = static_cast<int64_t>(file.second.size());
            }
            entries.push_back(entry);
        }
        TransportResult result;
        result.success = true;
        return result;
    }

    TransportResult remove(const std::string& path, const Destination&) override {
        removed.push_back(path);
        TransportResult result;
        result.path = path;
        result.success = files.erase(path) > 0;
        if (!result.success) {
            result.message = "No such file: " + path;
        }
        return result;
    }

    bool exists(const std::string& path, const Destination&) override { return files.count(path) > 0; }

    TransportResult mkdir(const std::string& path, const Destination&) override {
        directories.push_back(path);
        TransportResult result;
        result.success = true;
        return result;
    }

    std::string name() const override { return "fake"; }

    std::map<std::string, std::string> files;
    std::vector<std::string> uploads;
    std::vector<std::string> downloads;
    std::vector<std::string> removed;
    std::vector<std::string> directories;
    bool failUploads{false};
};

// Local destinations get `local`, everything else `remote`; either may be null
class FakeTransportFactory : public TransportFactory {
public:
    std::shared_ptr<Transport> createTransport(const Destination& destination) override {
        return destination.isLocal() ? local : remote;
    }

    std::shared_ptr<Transport> local;
    std::shared_ptr<Transport> remote;
};

class FakeRestoreTool : public RestoreTool {
public:
    RestoreToolResult restoreArchive(const std::string& archivePath, const RestoreOptions& options,
                                     const LineCallback& onLine) override {
        archives.push_back(archivePath);
        lastOptions = options;
        sawFile = std::filesystem::is_regular_file(archivePath);
        if (onLine) {
            onLine(StreamKind::Stdout, "Restoring account");
            onLine(StreamKind::Stderr, "minor issue");
        }
        return result;
    }

    RestoreToolResult result{true, "Restore completed successfully", 0, ErrorCode::None};
    std::vector<std::string> archives;
    RestoreOptions lastOptions;
    bool sawFile{false};
};

class FakeDatabaseTool : public DatabaseTool {
public:
    DatabaseBackupResult backupDatabases(const std::string& account, const std::string& targetDir,
                                         const UserConfig&, std::time_t timestamp,
                                         const LineCallback&) override {
        backups.push_back(account);
        DatabaseBackupResult result = backupResult;
        if (result.success && !result.skipped) {
            result.archivePath = targetDir + "/" + archive_name::buildDatabaseName(account, timestamp);
            std::ofstream(result.archivePath) << "databases of " << account << "\n";
        }
        return result;
    }

    DatabaseRestoreResult restoreDatabases(const std::string& account, const std::string& archivePath,
                                           const std::string& method, const LineCallback&) override {
        restores.push_back(account + "|" + archive_name::baseName(archivePath) + "|" + method);
        return restoreResult;
    }

    DatabaseBackupResult backupResult{true, false, "Database backup created", "", ErrorCode::None};
    DatabaseRestoreResult restoreResult{true, "Databases restored", ErrorCode::None};
    std::vector<std::string> backups;
    std::vector<std::string> restores;
};

class FakeNotifier : public Notifier {
public:
    void notify(NotificationEvent event, const nlohmann::json& context, const UserConfig&) override {
        events.push_back(event);
        contexts.push_back(context);
    }

    std::vector<NotificationEvent> events;
    std::vector<nlohmann::json> contexts;
};

// Reports cancellation once isCancelled has been asked `after` times
class FakeCancellation : public CancellationCheck {
public:
    bool isCancelled(const std::string& jobId) const override {
        checked.push_back(jobId);
        return after > 0 && static_cast<int>(checked.size()) >= after;
    }
    void clear(const std::string& jobId) override { cleared.push_back(jobId); }

    int after{0};
    mutable std::vector<std::string> checked;
    std::vector<std::string> cleared;
};

// Context wired to fakes and real file-backed stores under a scratch directory:
// "local1" (local, enabled), "remote1" (sftp, enabled), "off" (local, disabled).
struct FakeEngine {
    explicit FakeEngine(const TempDir& dir) {
        context.config.logDir = dir.sub("logs");
        context.config.tempDir = dir.sub("tmp");
        context.config.manifestDir = dir.sub("manifests");
        context.config.cancelDir = dir.sub("cancel");
        context.config.configDir = dir.sub("etc");
        context.config.destinationsFile = dir.sub("etc/destinations.json");

        auto registry = std::make_shared<DestinationRegistry>();
        Destination local;
        local.id = "local1";
        local.name = "Local Disk";
        local.type = "local";
        local.path = dir.sub("backups");
        registry->addDestination(local);

        Destination remote;
        remote.id = "remote1";
        remote.name = "Offsite";
        remote.type = "sftp";
        remote.path = "/srv/backups";
        remote.host = "backup.example.com";
        registry->addDestination(remote);

        Destination disabled = local;
        disabled.id = "off";
        disabled.name = "Old Disk";
        disabled.enabled = false;
        registry->addDestination(disabled);

        userConfigs = std::make_shared<UserConfigStore>(dir.sub("etc"));
        userConfig.tempDirectory = dir.sub("tmp");
        userConfigs->saveUserConfig("root", userConfig);

        factory->local = localTransport;
        factory->remote = remoteTransport;

        context.destinations = registry;
        context.userConfigs = userConfigs;
        context.transports = factory;
        context.archiveTool = archiveTool;
        context.restoreTool = restoreTool;
        context.databaseTool = databaseTool;
        context.verifier = std::make_shared<BackupVerifier>();
        context.manifest = std::make_shared<Manifest>(dir.sub("manifests"));
        context.notifier = notifier;
        context.operationLogger = std::make_shared<FileOperationLogger>(dir.sub("logs/operations.log"));
        context.cancellation = cancellation;
    }

    // Saves a modified copy of the root user's preferences
    void updateUserConfig(const std::function<void(UserConfig&)>& change) {
        change(userConfig);
        userConfigs->saveUserConfig("root", userConfig);
    }

    std::vector<LogRecord> operations() const {
        LogQuery query;
        query.isRoot = true;
        query.limit = 100;
        return context.operationLogger->getLogs(query).logs;
    }

    EngineContext context;
    UserConfig userConfig;
    std::shared_ptr<UserConfigStore> userConfigs;
    std::shared_ptr<FakeTransportFactory> factory = std::make_shared<FakeTransportFactory>();
    std::shared_ptr<FakeTransport> localTransport = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeTransport> remoteTransport = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeArchiveTool> archiveTool = std::make_shared<FakeArchiveTool>();
    std::shared_ptr<FakeRestoreTool> restoreTool = std::make_shared<FakeRestoreTool>();
    std::shared_ptr<FakeDatabaseTool> databaseTool = std::make_shared<FakeDatabaseTool>();
    std::shared_ptr<FakeNotifier> notifier = std::make_shared<FakeNotifier>();
    std::shared_ptr<FakeCancellation> cancellation = std::make_shared<FakeCancellation>();
};
