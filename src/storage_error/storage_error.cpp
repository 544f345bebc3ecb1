// src/storage_error/storage_error.cpp
#include "flowstore/storage_error/storage_error.h"
#include "flowstore/storage_error/error_utils.h"
#include <nlohmann/json.hpp>
#include <sstream>
#include <iomanip> // For std::put_time
#include <ctime>

namespace flowstore {
namespace storage {

StorageError::StorageError(ErrorCode code, const std::string& message)
    : code(code)
    , severity(error_utils::getErrorSeverity(code))
    , category(error_utils::getErrorCategory(code))
    , message(message.empty() ? std::string(error_utils::errorCodeToString(code)) : message)
    , timestamp(std::chrono::system_clock::now()) {
}

StorageError::StorageError(ErrorCode code, const std::string& message, const std::string& details)
    : StorageError(code, message) {
    this->details = details;
}

StorageError& StorageError::withDetails(const std::string& details_param) {
    this->details = details_param;
    return *this;
}

StorageError& StorageError::withSuggestedAction(const std::string& action) {
    this->suggested_action = action;
    return *this;
}

StorageError& StorageError::withLocation(const std::string& file, size_t line, const std::string& function) {
    this->file_path = file;
    this->line_number = line;
    this->function_name = function;
    return *this;
}

StorageError& StorageError::withUnderlyingError(ErrorCode underlying) {
    this->underlying_error = underlying;
    return *this;
}

StorageError& StorageError::withContext(const std::string& key, const std::string& value) {
    this->context[key] = value;
    return *this;
}

StorageError& StorageError::withTimestamp(std::chrono::system_clock::time_point ts) {
    this->timestamp = ts;
    return *this;
}

std::string StorageError::toString() const {
    std::ostringstream oss;
    oss << "[" << error_utils::severityToString(severity) << "] "
        << error_utils::errorCodeToString(code) << " (" << static_cast<int>(code) << "): "
        << message;
    if (!details.empty()) {
        oss << " - " << details;
    }
    return oss.str();
}

std::string StorageError::toDetailedString() const {
    std::ostringstream oss;

    oss << "Error Details:\n";
    oss << "  Code: " << error_utils::errorCodeToString(code)
        << " (" << static_cast<int>(code) << ")\n";
    oss << "  Severity: " << error_utils::severityToString(severity) << "\n";
    oss << "  Category: " << error_utils::categoryToString(category) << "\n";
    oss << "  Message: " << message << "\n";

    if (!details.empty()) {
        oss << "  Details: " << details << "\n";
    }
    if (!suggested_action.empty()) {
        oss << "  Suggested Action: " << suggested_action << "\n";
    }
    if (file_path && line_number && function_name) {
        oss << "  Location: " << *function_name << " at " << *file_path << ":" << *line_number << "\n";
    }
    if (underlying_error) {
        oss << "  Underlying Error: " << error_utils::errorCodeToString(*underlying_error)
            << " (" << static_cast<int>(*underlying_error) << ")\n";
    }
    if (!context.empty()) {
        oss << "  Context:\n";
        for (const auto& [key, value] : context) {
            oss << "    " << key << ": " << value << "\n";
        }
    }

    // gmtime_r keeps this safe to call from the maintenance thread.
    std::time_t time_t_val = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);
    oss << "  Timestamp: " << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ") << "\n";

    return oss.str();
}

std::string StorageError::toJson() const {
    nlohmann::json j;
    j["code"] = static_cast<int>(code);
    j["code_name"] = std::string(error_utils::errorCodeToString(code));
    j["severity"] = std::string(error_utils::severityToString(severity));
    j["category"] = std::string(error_utils::categoryToString(category));
    j["message"] = message;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count();

    if (!details.empty()) {
        j["details"] = details;
    }
    if (!suggested_action.empty()) {
        j["suggested_action"] = suggested_action;
    }
    if (file_path && line_number && function_name) {
        j["location"] = {{"file", *file_path}, {"line", *line_number}, {"function", *function_name}};
    }
    if (underlying_error) {
        j["underlying_error_code"] = static_cast<int>(*underlying_error);
        j["underlying_error_name"] = std::string(error_utils::errorCodeToString(*underlying_error));
    }
    if (!context.empty()) {
        j["context"] = context;
    }
    return j.dump();
}

// Static factory methods
StorageError StorageError::invalidKey(const std::string& key, const std::string& reason) {
    return StorageError(ErrorCode::INVALID_KEY, "Invalid key", reason)
        .withContext("key_length", std::to_string(key.size()));
}

StorageError StorageError::unavailable(const std::string& operation, const std::string& details) {
    return StorageError(ErrorCode::STORAGE_UNAVAILABLE, "Storage temporarily unavailable", details)
        .withContext("operation", operation)
        .withSuggestedAction("Retry the operation once the backend recovers");
}

StorageError StorageError::timeout(const std::string& operation, std::chrono::milliseconds duration) {
    return StorageError(ErrorCode::TIMEOUT, "Operation timed out")
        .withDetails("Operation '" + operation + "' exceeded " + std::to_string(duration.count()) + "ms")
        .withContext("operation", operation);
}

StorageError StorageError::versionConflict(const std::string& key, uint64_t expected, uint64_t actual) {
    return StorageError(ErrorCode::VERSION_CONFLICT, "Record version does not match")
        .withDetails("expected version " + std::to_string(expected) + ", found " + std::to_string(actual))
        .withContext("key", key)
        .withSuggestedAction("Re-read the record and retry with its current version");
}

} // namespace storage
} // namespace flowstore
