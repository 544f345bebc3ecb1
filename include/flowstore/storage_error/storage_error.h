// include/flowstore/storage_error/storage_error.h

#pragma once

#include "error_codes.h"
#include <string>
#include <optional>
#include <chrono>
#include <map>

namespace flowstore {
namespace storage {

/**
 * @brief Detailed error information with context
 */
class StorageError {
public:
    ErrorCode code;
    ErrorSeverity severity; // Derived from code
    ErrorCategory category; // Derived from code
    std::string message;
    std::string details;
    std::string suggested_action;
    std::optional<std::string> file_path;
    std::optional<size_t> line_number;
    std::optional<std::string> function_name;
    std::chrono::system_clock::time_point timestamp;
    std::optional<ErrorCode> underlying_error;
    std::map<std::string, std::string> context; // ordered for stable output

    StorageError(ErrorCode code, const std::string& message = "");
    StorageError(ErrorCode code, const std::string& message, const std::string& details);

    // Builder pattern for detailed error construction
    StorageError& withDetails(const std::string& details);
    StorageError& withSuggestedAction(const std::string& action);
    StorageError& withLocation(const std::string& file, size_t line, const std::string& function);
    StorageError& withUnderlyingError(ErrorCode underlying);
    StorageError& withContext(const std::string& key, const std::string& value);
    StorageError& withTimestamp(std::chrono::system_clock::time_point ts);

    std::string toString() const;
    std::string toDetailedString() const;
    std::string toJson() const;

    // Static factory methods for common errors
    static StorageError invalidKey(const std::string& key, const std::string& reason);
    static StorageError unavailable(const std::string& operation, const std::string& details);
    static StorageError timeout(const std::string& operation, std::chrono::milliseconds duration);
    static StorageError versionConflict(const std::string& key, uint64_t expected, uint64_t actual);
};

} // namespace storage
} // namespace flowstore
