#pragma once

#include <string>

// Value of the well-known status file on the restore target
enum class RemoteStatus {
    Restoring,
    Failed,
    Complete,
    Unknown
};

// Restore session state machine
enum class RestoreState {
    Init,
    Validating,
    Restoring,
    Complete,
    Failed,
    Aborted
};

inline std::string remoteStatusToString(RemoteStatus status) {
    switch (status) {
        case RemoteStatus::Restoring: return "restoring";
        case RemoteStatus::Failed:    return "failed";
        case RemoteStatus::Complete:  return "complete";
        default:                      return "unknown";
    }
}

// Anything other than the three published values reads as Unknown.
inline RemoteStatus parseRemoteStatus(const std::string& value) {
    if (value == "restoring") {
        return RemoteStatus::Restoring;
    }
    if (value == "failed") {
        return RemoteStatus::Failed;
    }
    if (value == "complete") {
        return RemoteStatus::Complete;
    }
    return RemoteStatus::Unknown;
}

inline std::string restoreStateToString(RestoreState state) {
    switch (state) {
        case RestoreState::Init:       return "init";
        case RestoreState::Validating: return "validating";
        case RestoreState::Restoring:  return "restoring";
        case RestoreState::Complete:   return "complete";
        case RestoreState::Failed:     return "failed";
        case RestoreState::Aborted:    return "aborted";
        default:                       return "unknown";
    }
}
