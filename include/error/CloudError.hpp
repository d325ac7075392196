#pragma once

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>

namespace cs::error {

enum class ErrorCode {
    AuthRequired,
    AuthExpired,
    AuthInvalid,

    NetworkUnavailable,
    NetworkTimeout,
    NetworkError,

    StorageQuotaExceeded,
    StoragePermissionDenied,
    StorageNotFound,
    StorageCorrupted,

    DataTooLarge,
    DataInvalid,
    DataCorrupted,
    DataChecksumMismatch,
    SaveValidationFailed,

    OperationCancelled,
    OperationTimeout,
    OperationFailed,
    QueueFull,

    ConfigInvalid,
    ConfigMissing,

    Unknown,
    Internal
};

enum class Severity { Low, Medium, High, Critical };

std::string codeToString(ErrorCode code);
std::string severityToString(Severity severity);

class CloudError : public std::runtime_error {
public:
    CloudError(ErrorCode code, const std::string& message, Severity severity, bool retryable);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] Severity severity() const noexcept { return severity_; }
    [[nodiscard]] bool retryable() const noexcept { return retryable_; }
    [[nodiscard]] std::chrono::system_clock::time_point timestamp() const noexcept { return timestamp_; }

    // Message suitable for showing to a player
    [[nodiscard]] std::string userMessage() const;

private:
    ErrorCode code_;
    Severity severity_;
    bool retryable_;
    std::chrono::system_clock::time_point timestamp_;
};

// Invalid or incomplete configuration; always fatal to initialization
class ConfigurationError : public CloudError {
public:
    explicit ConfigurationError(const std::string& message, ErrorCode code = ErrorCode::ConfigInvalid)
        : CloudError(code, message, Severity::Critical, false) {}
};

class OperationError : public CloudError {
public:
    OperationError(ErrorCode code, const std::string& message, bool retryable,
                   Severity severity = Severity::Medium)
        : CloudError(code, message, severity, retryable) {}

    [[nodiscard]] const std::string& operationId() const noexcept { return operationId_; }
    void setOperationId(const std::string& id) { operationId_ = id; }

private:
    std::string operationId_;
};

class QueueCapacityError : public CloudError {
public:
    explicit QueueCapacityError(const std::string& message)
        : CloudError(ErrorCode::QueueFull, message, Severity::High, false) {}
};

// Only thrown when the digest itself cannot be computed; corrupted data is reported as data
class IntegrityError : public CloudError {
public:
    explicit IntegrityError(const std::string& message, ErrorCode code = ErrorCode::SaveValidationFailed)
        : CloudError(code, message, Severity::High, false) {}
};

// Wraps whatever an executor threw into an OperationError
OperationError normalize(const std::exception_ptr& ep);

// Maps an HTTP status to the matching operation error
OperationError fromHttpStatus(long status, const std::string& body);

}
