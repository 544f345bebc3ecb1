// include/flowstore/storage_error/exceptions.h
#pragma once

#include "storage_error.h"
#include <stdexcept>

namespace flowstore {

/**
 * @brief Base of every exception the engine throws across its public API.
 *
 * Carries the full storage::StorageError so callers can inspect the code,
 * severity, and context without parsing what().
 */
class StorageException : public std::runtime_error {
public:
    explicit StorageException(storage::StorageError error)
        : std::runtime_error(error.toString()), error_(std::move(error)) {}

    const storage::StorageError& error() const noexcept { return error_; }
    storage::ErrorCode code() const noexcept { return error_.code; }

private:
    storage::StorageError error_;
};

// Bad caller input. Never retried.
class InvalidKeyError : public StorageException {
public:
    using StorageException::StorageException;
};

// Stored bytes cannot be turned back into a value. Never retried.
class CorruptRecordError : public StorageException {
public:
    using StorageException::StorageException;
};

class DecryptionError : public CorruptRecordError {
public:
    using CorruptRecordError::CorruptRecordError;
};

// Backend hiccup; the retry executor tries again.
class TransientStorageError : public StorageException {
public:
    using StorageException::StorageException;
};

class VersionConflictError : public StorageException {
public:
    using StorageException::StorageException;
};

// keys()/query() gave up on a deadline or cancellation flag.
class ScanAbortedError : public StorageException {
public:
    using StorageException::StorageException;
};

class ConfigurationError : public StorageException {
public:
    using StorageException::StorageException;
};

} // namespace flowstore
