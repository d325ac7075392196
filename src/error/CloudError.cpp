#include "error/CloudError.hpp"

#include <nlohmann/json.hpp>

namespace cs::error {

std::string codeToString(const ErrorCode code) {
    switch (code) {
        case ErrorCode::AuthRequired: return "auth/required";
        case ErrorCode::AuthExpired: return "auth/expired";
        case ErrorCode::AuthInvalid: return "auth/invalid";
        case ErrorCode::NetworkUnavailable: return "network/unavailable";
        case ErrorCode::NetworkTimeout: return "network/timeout";
        case ErrorCode::NetworkError: return "network/error";
        case ErrorCode::StorageQuotaExceeded: return "storage/quota-exceeded";
        case ErrorCode::StoragePermissionDenied: return "storage/permission-denied";
        case ErrorCode::StorageNotFound: return "storage/not-found";
        case ErrorCode::StorageCorrupted: return "storage/corrupted";
        case ErrorCode::DataTooLarge: return "data/too-large";
        case ErrorCode::DataInvalid: return "data/invalid";
        case ErrorCode::DataCorrupted: return "data/corrupted";
        case ErrorCode::DataChecksumMismatch: return "data/checksum-mismatch";
        case ErrorCode::SaveValidationFailed: return "save/validation-failed";
        case ErrorCode::OperationCancelled: return "operation/cancelled";
        case ErrorCode::OperationTimeout: return "operation/timeout";
        case ErrorCode::OperationFailed: return "operation/failed";
        case ErrorCode::QueueFull: return "queue/full";
        case ErrorCode::ConfigInvalid: return "config/invalid";
        case ErrorCode::ConfigMissing: return "config/missing";
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::Internal: return "internal";
    }
    return "unknown";
}

std::string severityToString(const Severity severity) {
    switch (severity) {
        case Severity::Low: return "low";
        case Severity::Medium: return "medium";
        case Severity::High: return "high";
        case Severity::Critical: return "critical";
    }
    return "unknown";
}

CloudError::CloudError(const ErrorCode code, const std::string& message, const Severity severity, const bool retryable)
    : std::runtime_error(message),
      code_(code),
      severity_(severity),
      retryable_(retryable),
      timestamp_(std::chrono::system_clock::now()) {}

std::string CloudError::userMessage() const {
    switch (code_) {
        case ErrorCode::AuthRequired:
        case ErrorCode::AuthExpired:
            return "Please sign in to access cloud saves.";
        case ErrorCode::AuthInvalid:
            return "Authentication failed. Please check your credentials.";
        case ErrorCode::NetworkUnavailable:
            return "Service temporarily unavailable. Please try again later.";
        case ErrorCode::NetworkTimeout:
        case ErrorCode::OperationTimeout:
            return "Operation timed out. Please try again.";
        case ErrorCode::NetworkError:
            return "Network error. Please check your connection.";
        case ErrorCode::StorageQuotaExceeded:
            return "Cloud storage quota exceeded. Please delete some saves.";
        case ErrorCode::StoragePermissionDenied:
            return "Permission denied. Please sign in and try again.";
        case ErrorCode::StorageNotFound:
            return "Save file not found in cloud storage.";
        case ErrorCode::StorageCorrupted:
        case ErrorCode::DataCorrupted:
        case ErrorCode::DataChecksumMismatch:
            return "Save data appears to be corrupted.";
        case ErrorCode::DataTooLarge:
            return "Save data is too large to upload.";
        case ErrorCode::QueueFull:
            return "Too many pending cloud operations. Please try again once you are back online.";
        case ErrorCode::ConfigInvalid:
        case ErrorCode::ConfigMissing:
            return "Cloud saves are not configured correctly.";
        default:
            return "An unexpected error occurred. Please try again.";
    }
}

OperationError normalize(const std::exception_ptr& ep) {
    try {
        std::rethrow_exception(ep);
    } catch (const OperationError& e) {
        return e;
    } catch (const CloudError& e) {
        return {e.code(), e.what(), e.retryable(), e.severity()};
    } catch (const nlohmann::json::exception& e) {
        return {ErrorCode::DataInvalid, std::string("Malformed operation data: ") + e.what(), false};
    } catch (const std::exception& e) {
        return {ErrorCode::Unknown, e.what(), true};
    } catch (...) {
        return {ErrorCode::Unknown, "Unknown non-standard exception", true};
    }
}

OperationError fromHttpStatus(const long status, const std::string& body) {
    const auto msg = "HTTP " + std::to_string(status) + (body.empty() ? "" : ": " + body.substr(0, 256));

    if (status == 401) return {ErrorCode::AuthInvalid, msg, false};
    if (status == 403) return {ErrorCode::StoragePermissionDenied, msg, false, Severity::High};
    if (status == 404) return {ErrorCode::StorageNotFound, msg, false};
    if (status == 408) return {ErrorCode::NetworkTimeout, msg, true};
    if (status == 413) return {ErrorCode::DataTooLarge, msg, false};
    if (status == 429) return {ErrorCode::StorageQuotaExceeded, msg, true};
    if (status >= 500) return {ErrorCode::NetworkUnavailable, msg, true, Severity::High};
    return {ErrorCode::OperationFailed, msg, false};
}

}
