#pragma once

#include <string>

enum class ErrorCode {
    None,
    InvalidRequest,
    InvalidDestination,
    DestinationDisabled,
    DirectoryCreateFailed,
    ArchiveToolFailed,
    ArtifactMissing,
    RenameFailed,
    DatabaseBackupFailed,
    TransportFailed,
    UnparsableFilename,
    RetrievalFailed,
    VerificationFailed,
    RestoreToolFailed,
    DatabaseRestoreFailed,
    ProcessSpawnFailed,
    Cancelled,
    InternalError
};

std::string errorCodeToString(ErrorCode code);
