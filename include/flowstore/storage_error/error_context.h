// include/flowstore/storage_error/error_context.h
#pragma once

#include "storage_error.h"
#include <memory>
#include <deque>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace flowstore {
namespace storage {

class ErrorHandler;

/**
 * @brief Bounded log of recent errors plus per-code counters.
 *
 * When the log grows past its capacity it is trimmed to the newest half.
 * Counters are never trimmed.
 */
class ErrorContext {
private:
    std::shared_ptr<ErrorHandler> handler_;
    std::deque<StorageError> recent_errors_;
    std::unordered_map<ErrorCode, size_t> error_counts_;
    size_t capacity_;
    mutable std::mutex mutex_;

public:
    static constexpr size_t DEFAULT_CAPACITY = 1000;

    explicit ErrorContext(size_t capacity = DEFAULT_CAPACITY, std::shared_ptr<ErrorHandler> handler = nullptr);

    void setErrorHandler(std::shared_ptr<ErrorHandler> handler);
    void reportError(const StorageError& error);
    void reportError(ErrorCode code, const std::string& message);

    size_t getErrorCount(ErrorCode code) const;
    size_t getTotalErrorCount() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    std::vector<StorageError> getRecentErrors(size_t count = 10) const;

    bool hasRepeatedErrors(ErrorCode code, size_t threshold = 5) const;

    void clearErrors();
};

} // namespace storage
} // namespace flowstore
