// include/flowstore/storage_error/error_codes.h
#pragma once

namespace flowstore {
namespace storage {

/**
 * @brief Error codes for engine, codec, and bookkeeping failures
 */
enum class ErrorCode : int {
    // Success
    OK = 0,

    // Storage Engine Errors (1000-1999)
    STORAGE_SHUT_DOWN = 1001,
    STORAGE_UNAVAILABLE = 1002,   // Transient backend failure, retried
    BACKUP_NOT_FOUND = 1003,

    // Codec Errors (2000-2999)
    COMPRESSION_ERROR = 2001,
    ENCRYPTION_FAILED = 2002,
    DECRYPTION_FAILED = 2003,

    // Write-Ahead Log Errors (3000-3999)
    WAL_SINK_FAILED = 3001,
    WAL_CORRUPTION = 3002,

    // I/O Errors (4000-4999)
    IO_READ_ERROR = 4001,
    IO_WRITE_ERROR = 4002,
    FILE_NOT_FOUND = 4003,

    // Data Validation Errors (5000-5999)
    INVALID_KEY = 5001,
    INVALID_VALUE = 5002,
    CHECKSUM_MISMATCH = 5003,
    INVALID_DATA_FORMAT = 5004,

    // Concurrency Errors (6000-6999)
    VERSION_CONFLICT = 6001,

    // Configuration Errors (7000-7999)
    INVALID_CONFIGURATION = 7001,
    OPTION_OUT_OF_RANGE = 7002,

    // Generic Errors (10000+)
    TIMEOUT = 10001,
    CANCELLED = 10002,
    INTERNAL_ERROR = 10003
};

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    INFO,       // Informational, operation can continue
    WARNING,    // Operation succeeded or degraded with issues
    ERROR,      // Operation failed but the engine is stable
    CRITICAL,   // Data lost for the affected record
    FATAL       // A persisted log can no longer be trusted
};

/**
 * @brief Error categories for grouping related errors
 */
enum class ErrorCategory {
    STORAGE_ENGINE,
    CODEC,
    WAL,
    IO_FILESYSTEM,
    DATA_VALIDATION,
    CONCURRENCY,
    CONFIGURATION,
    GENERIC
};

} // namespace storage
} // namespace flowstore
