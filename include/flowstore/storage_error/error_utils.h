// include/flowstore/storage_error/error_utils.h
#pragma once

#include "error_codes.h"
#include "storage_error.h" // Needed for STORAGE_ERROR macros

#include <string_view>

namespace flowstore {
namespace storage {
namespace error_utils {

    std::string_view errorCodeToString(ErrorCode code);
    std::string_view severityToString(ErrorSeverity severity);
    std::string_view categoryToString(ErrorCategory category);

    ErrorSeverity getErrorSeverity(ErrorCode code);
    ErrorCategory getErrorCategory(ErrorCode code);

    // Error code predicates
    bool isCorruption(ErrorCode code); // Record bytes cannot be turned back into a value
    bool isTransient(ErrorCode code);  // Worth retrying
    bool isCritical(ErrorCode code);

} // namespace error_utils
} // namespace storage
} // namespace flowstore

// Helper macros for error reporting with location info
#define STORAGE_ERROR(code, message) \
    ::flowstore::storage::StorageError(code, message).withLocation(__FILE__, __LINE__, __FUNCTION__)

#define STORAGE_ERROR_WITH_DETAILS(code, message, details) \
    ::flowstore::storage::StorageError(code, message, details).withLocation(__FILE__, __LINE__, __FUNCTION__)
