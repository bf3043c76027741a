// PAMTALK - Operation Status Implementation
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include "pamtalk/core/status.h"

namespace pamtalk {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                  return "Ok";
        case ErrorCode::Unauthorized:        return "Unauthorized";
        case ErrorCode::InvalidState:        return "InvalidState";
        case ErrorCode::AlreadyExecuted:     return "AlreadyExecuted";
        case ErrorCode::AlreadyActive:       return "AlreadyActive";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::NothingPending:      return "NothingPending";
        case ErrorCode::InvalidAmount:       return "InvalidAmount";
        case ErrorCode::Paused:              return "Paused";
        case ErrorCode::Frozen:              return "Frozen";
        case ErrorCode::StationInactive:     return "StationInactive";
        case ErrorCode::Expired:             return "Expired";
        case ErrorCode::QuorumNotMet:        return "QuorumNotMet";
        case ErrorCode::NotFound:            return "NotFound";
        case ErrorCode::AlreadyExists:       return "AlreadyExists";
        default:                             return "Unknown";
    }
}

} // namespace pamtalk
