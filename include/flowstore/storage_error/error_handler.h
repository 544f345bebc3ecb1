// include/flowstore/storage_error/error_handler.h
#pragma once

#include "storage_error.h"

namespace flowstore {
namespace storage {

/**
 * @brief Hook for embedders that want to forward engine errors elsewhere
 */
class ErrorHandler {
public:
    virtual ~ErrorHandler() = default;
    virtual void handleError(const StorageError& error) = 0;
    virtual void handleCriticalError(const StorageError& error) = 0;
};

} // namespace storage
} // namespace flowstore
