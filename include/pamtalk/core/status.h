// PAMTALK - Operation Status
// Copyright (c) 2024 PAMTALK Developers
// MIT License
//
// Every state transition in the exchange core reports its outcome through a
// Status (or a Result<T> carrying a value on success). A failed operation
// never leaves partial effects behind.

#ifndef PAMTALK_CORE_STATUS_H
#define PAMTALK_CORE_STATUS_H

#include <optional>
#include <string>
#include <utility>

namespace pamtalk {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // Caller lacks the required role or identity
    Unauthorized,

    // Operation attempted from a state that forbids it
    InvalidState,
    AlreadyExecuted,
    AlreadyActive,

    // Resource availability
    InsufficientBalance,
    NothingPending,

    // Zero, negative or out-of-range input
    InvalidAmount,

    // Administrative holds
    Paused,
    Frozen,
    StationInactive,

    // Governance timing
    Expired,
    QuorumNotMet,

    // Lookup failures
    NotFound,
    AlreadyExists,
};

/// Convert error code to string
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Status
// ============================================================================

class Status {
private:
    ErrorCode code_;
    std::string message_;

public:
    Status() : code_(ErrorCode::Ok) {}
    Status(ErrorCode code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Error(ErrorCode code, const std::string& msg = "") { return Status(code, msg); }

    bool ok() const { return code_ == ErrorCode::Ok; }
    explicit operator bool() const { return ok(); }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool Is(ErrorCode code) const { return code_ == code; }

    std::string ToString() const {
        if (ok()) return "OK";
        std::string result = ErrorCodeToString(code_);
        if (!message_.empty()) {
            result += ": " + message_;
        }
        return result;
    }
};

// ============================================================================
// Result - value or failure status
// ============================================================================

template<typename T>
class Result {
private:
    Status status_;
    std::optional<T> value_;

public:
    Result(T value) : value_(std::move(value)) {}
    Result(Status status) : status_(std::move(status)) {}
    Result(ErrorCode code, const std::string& msg = "") : status_(code, msg) {}

    bool ok() const { return status_.ok() && value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Status& status() const { return status_; }
    ErrorCode code() const { return status_.code(); }

    /// Access the value. Only valid when ok().
    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const T& operator*() const { return *value_; }
    const T* operator->() const { return &*value_; }

    T value_or(T fallback) const { return value_ ? *value_ : std::move(fallback); }
};

} // namespace pamtalk

#endif // PAMTALK_CORE_STATUS_H
