#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for NetLink
 * 
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Transfer and discovery code returns Result instead of throwing.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace nlk {

/**
 * @brief Error codes for NetLink operations
 */
enum class ErrorCode {
    Success = 0,
    
    // Connection errors (100-199), retryable
    NetworkError = 100,
    ConnectionFailed = 101,
    ConnectionTimeout = 102,
    ConnectionClosed = 103,
    SendFailed = 104,
    ReceiveFailed = 105,
    
    // Protocol errors (200-299), fatal
    ProtocolError = 200,
    BadMagic = 201,
    MalformedFrame = 202,
    InvalidOffset = 203,
    UnsafePath = 204,
    ChecksumMismatch = 205,
    TransferRejected = 206,
    
    // File system errors (300-399), fatal on the side they occur
    FileNotFound = 300,
    FileAccessDenied = 301,
    FileReadError = 302,
    FileWriteError = 303,
    DirectoryNotFound = 304,
    DirectoryCreateFailed = 305,
    NotARegularFile = 306,
    
    // Discovery errors (400-499), recovered locally
    DiscoveryError = 400,
    MalformedBeacon = 401,
    ForeignBeacon = 402,
    SocketSetupFailed = 403,
    
    // Configuration errors (600-699)
    ConfigError = 600,
    InvalidConfig = 601,
    MissingConfig = 602,
    
    // General errors (900-999)
    InvalidArgument = 900,
    Cancelled = 901,
    InternalError = 999
};

/**
 * @brief Failure classes used by the retry logic
 */
enum class ErrorCategory {
    None,
    Connection,
    Protocol,
    FileIO,
    Discovery,
    Config,
    General
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionTimeout: return "Connection timeout";
        case ErrorCode::ConnectionClosed: return "Connection closed by peer";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::ProtocolError: return "Protocol error";
        case ErrorCode::BadMagic: return "Unrecognized protocol magic";
        case ErrorCode::MalformedFrame: return "Malformed frame";
        case ErrorCode::InvalidOffset: return "Invalid resume offset";
        case ErrorCode::UnsafePath: return "Unsafe relative path";
        case ErrorCode::ChecksumMismatch: return "Checksum mismatch";
        case ErrorCode::TransferRejected: return "Transfer rejected by receiver";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileAccessDenied: return "File access denied";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::DirectoryNotFound: return "Directory not found";
        case ErrorCode::DirectoryCreateFailed: return "Directory creation failed";
        case ErrorCode::NotARegularFile: return "Not a regular file";
        case ErrorCode::DiscoveryError: return "Discovery error";
        case ErrorCode::MalformedBeacon: return "Malformed beacon";
        case ErrorCode::ForeignBeacon: return "Foreign beacon";
        case ErrorCode::SocketSetupFailed: return "Socket setup failed";
        case ErrorCode::ConfigError: return "Configuration error";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::MissingConfig: return "Missing configuration";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Map an error code to its failure class (by numeric range)
 */
inline ErrorCategory errorCategory(ErrorCode code) {
    int value = static_cast<int>(code);
    if (value == 0) return ErrorCategory::None;
    if (value >= 100 && value < 200) return ErrorCategory::Connection;
    if (value >= 200 && value < 300) return ErrorCategory::Protocol;
    if (value >= 300 && value < 400) return ErrorCategory::FileIO;
    if (value >= 400 && value < 500) return ErrorCategory::Discovery;
    if (value >= 600 && value < 700) return ErrorCategory::Config;
    return ErrorCategory::General;
}

/**
 * @brief Only connection-level failures are worth another attempt
 */
inline bool isRetryable(ErrorCode code) {
    return errorCategory(code) == ErrorCategory::Connection;
}

inline const char* errorCategoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::Connection: return "connection";
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::FileIO: return "file-io";
        case ErrorCategory::Discovery: return "discovery";
        case ErrorCategory::Config: return "config";
        case ErrorCategory::General: return "general";
    }
    return "unknown";
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;
    
    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    
    bool retryable() const { return isRetryable(code); }
    ErrorCategory category() const { return errorCategory(code); }
    
    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 * 
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 * 
 * Usage:
 * @code
 * Result<uint64_t> size = statSource(path);
 * if (!size) {
 *     logger.log(LogLevel::ERROR, size.error().message, "Sender");
 *     return size.error();
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}
    
    /// Construct error result
    Result(E error) : data_(std::move(error)) {}
    
    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }
    
    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }
    
    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }
    
    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }
    
    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }
    
    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }
    
    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }
    
    /// Arrow operator (access value members)
    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    /// Construct success result
    Result() : error_(std::nullopt) {}
    
    /// Construct error result
    Result(E error) : error_(std::move(error)) {}
    
    /// Check if result is success
    bool ok() const { return !error_.has_value(); }
    
    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }
    
    /// Check if result is error
    bool isError() const { return error_.has_value(); }
    
    /// Get error (throws if success)
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a success result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace nlk
