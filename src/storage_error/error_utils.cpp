// src/storage_error/error_utils.cpp

#include "flowstore/storage_error/error_utils.h"

namespace flowstore {
namespace storage {
namespace error_utils {

std::string_view errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        // Storage Engine Errors
        case ErrorCode::STORAGE_SHUT_DOWN: return "STORAGE_SHUT_DOWN";
        case ErrorCode::STORAGE_UNAVAILABLE: return "STORAGE_UNAVAILABLE";
        case ErrorCode::BACKUP_NOT_FOUND: return "BACKUP_NOT_FOUND";

        // Codec Errors
        case ErrorCode::COMPRESSION_ERROR: return "COMPRESSION_ERROR";
        case ErrorCode::ENCRYPTION_FAILED: return "ENCRYPTION_FAILED";
        case ErrorCode::DECRYPTION_FAILED: return "DECRYPTION_FAILED";

        // WAL Errors
        case ErrorCode::WAL_SINK_FAILED: return "WAL_SINK_FAILED";
        case ErrorCode::WAL_CORRUPTION: return "WAL_CORRUPTION";

        // I/O Errors
        case ErrorCode::IO_READ_ERROR: return "IO_READ_ERROR";
        case ErrorCode::IO_WRITE_ERROR: return "IO_WRITE_ERROR";
        case ErrorCode::FILE_NOT_FOUND: return "FILE_NOT_FOUND";

        // Data Validation Errors
        case ErrorCode::INVALID_KEY: return "INVALID_KEY";
        case ErrorCode::INVALID_VALUE: return "INVALID_VALUE";
        case ErrorCode::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ErrorCode::INVALID_DATA_FORMAT: return "INVALID_DATA_FORMAT";

        // Concurrency Errors
        case ErrorCode::VERSION_CONFLICT: return "VERSION_CONFLICT";

        // Configuration Errors
        case ErrorCode::INVALID_CONFIGURATION: return "INVALID_CONFIGURATION";
        case ErrorCode::OPTION_OUT_OF_RANGE: return "OPTION_OUT_OF_RANGE";

        // Generic Errors
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::CANCELLED: return "CANCELLED";
        case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";

        default: return "UNKNOWN_ERROR_CODE_DETAIL";
    }
}

std::string_view severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        case ErrorSeverity::FATAL: return "FATAL";
        default: return "UNKNOWN_SEVERITY";
    }
}

std::string_view categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::STORAGE_ENGINE: return "STORAGE_ENGINE";
        case ErrorCategory::CODEC: return "CODEC";
        case ErrorCategory::WAL: return "WAL";
        case ErrorCategory::IO_FILESYSTEM: return "IO_FILESYSTEM";
        case ErrorCategory::DATA_VALIDATION: return "DATA_VALIDATION";
        case ErrorCategory::CONCURRENCY: return "CONCURRENCY";
        case ErrorCategory::CONFIGURATION: return "CONFIGURATION";
        case ErrorCategory::GENERIC: return "GENERIC";
        default: return "UNKNOWN_CATEGORY";
    }
}

ErrorSeverity getErrorSeverity(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorSeverity::INFO;

        // A corrupt record is lost for the caller, the engine itself is fine.
        case ErrorCode::CHECKSUM_MISMATCH:
        case ErrorCode::COMPRESSION_ERROR:
        case ErrorCode::DECRYPTION_FAILED:
            return ErrorSeverity::CRITICAL;

        case ErrorCode::WAL_CORRUPTION:
            return ErrorSeverity::FATAL;

        case ErrorCode::STORAGE_SHUT_DOWN:
        case ErrorCode::ENCRYPTION_FAILED:
        case ErrorCode::WAL_SINK_FAILED:
        case ErrorCode::IO_READ_ERROR:
        case ErrorCode::IO_WRITE_ERROR:
        case ErrorCode::INVALID_DATA_FORMAT:
        case ErrorCode::INVALID_CONFIGURATION:
        case ErrorCode::INTERNAL_ERROR:
            return ErrorSeverity::ERROR;

        case ErrorCode::STORAGE_UNAVAILABLE:
        case ErrorCode::INVALID_KEY:
        case ErrorCode::INVALID_VALUE:
        case ErrorCode::VERSION_CONFLICT:
        case ErrorCode::OPTION_OUT_OF_RANGE:
        case ErrorCode::TIMEOUT:
            return ErrorSeverity::WARNING;

        case ErrorCode::BACKUP_NOT_FOUND:
        case ErrorCode::CANCELLED:
            return ErrorSeverity::INFO;

        default:
            return ErrorSeverity::ERROR;
    }
}

ErrorCategory getErrorCategory(ErrorCode code) {
    int code_value = static_cast<int>(code);

    if (code_value >= 1000 && code_value < 2000) {
        return ErrorCategory::STORAGE_ENGINE;
    } else if (code_value >= 2000 && code_value < 3000) {
        return ErrorCategory::CODEC;
    } else if (code_value >= 3000 && code_value < 4000) {
        return ErrorCategory::WAL;
    } else if (code_value >= 4000 && code_value < 5000) {
        return ErrorCategory::IO_FILESYSTEM;
    } else if (code_value >= 5000 && code_value < 6000) {
        return ErrorCategory::DATA_VALIDATION;
    } else if (code_value >= 6000 && code_value < 7000) {
        return ErrorCategory::CONCURRENCY;
    } else if (code_value >= 7000 && code_value < 8000) {
        return ErrorCategory::CONFIGURATION;
    } else {
        return ErrorCategory::GENERIC;
    }
}

bool isCorruption(ErrorCode code) {
    switch (code) {
        case ErrorCode::CHECKSUM_MISMATCH:
        case ErrorCode::COMPRESSION_ERROR:
        case ErrorCode::DECRYPTION_FAILED:
        case ErrorCode::INVALID_DATA_FORMAT:
            return true;
        default:
            return false;
    }
}

bool isTransient(ErrorCode code) {
    switch (code) {
        case ErrorCode::STORAGE_UNAVAILABLE:
        case ErrorCode::IO_READ_ERROR:
        case ErrorCode::IO_WRITE_ERROR:
        case ErrorCode::WAL_SINK_FAILED:
            return true;
        default:
            return false;
    }
}

bool isCritical(ErrorCode code) {
    ErrorSeverity severity = getErrorSeverity(code);
    return severity == ErrorSeverity::CRITICAL || severity == ErrorSeverity::FATAL;
}

} // namespace error_utils
} // namespace storage
} // namespace flowstore
