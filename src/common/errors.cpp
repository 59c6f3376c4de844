#include "common/errors.hpp"

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                  return "None";
        case ErrorCode::InvalidRequest:        return "InvalidRequest";
        case ErrorCode::InvalidDestination:    return "InvalidDestination";
        case ErrorCode::DestinationDisabled:   return "DestinationDisabled";
        case ErrorCode::DirectoryCreateFailed: return "DirectoryCreateFailed";
        case ErrorCode::ArchiveToolFailed:     return "ArchiveToolFailed";
        case ErrorCode::ArtifactMissing:       return "ArtifactMissing";
        case ErrorCode::RenameFailed:          return "RenameFailed";
        case ErrorCode::DatabaseBackupFailed:  return "DatabaseBackupFailed";
        case ErrorCode::TransportFailed:       return "TransportFailed";
        case ErrorCode::UnparsableFilename:    return "UnparsableFilename";
        case ErrorCode::RetrievalFailed:       return "RetrievalFailed";
        case ErrorCode::VerificationFailed:    return "VerificationFailed";
        case ErrorCode::RestoreToolFailed:     return "RestoreToolFailed";
        case ErrorCode::DatabaseRestoreFailed: return "DatabaseRestoreFailed";
        case ErrorCode::ProcessSpawnFailed:    return "ProcessSpawnFailed";
        case ErrorCode::Cancelled:             return "Cancelled";
        case ErrorCode::InternalError:         return "InternalError";
        default:                               return "Unknown";
    }
}
