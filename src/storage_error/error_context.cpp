// src/storage_error/error_context.cpp

#include "flowstore/storage_error/error_context.h"
#include "flowstore/storage_error/error_handler.h"
#include "flowstore/debug_utils.h"
#include <algorithm>

namespace flowstore {
namespace storage {

ErrorContext::ErrorContext(size_t capacity, std::shared_ptr<ErrorHandler> handler)
    : handler_(std::move(handler)), capacity_(std::max<size_t>(capacity, 2)) {
}

void ErrorContext::setErrorHandler(std::shared_ptr<ErrorHandler> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void ErrorContext::reportError(const StorageError& error) {
    std::shared_ptr<ErrorHandler> handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_counts_[error.code]++;

        recent_errors_.push_back(error);
        if (recent_errors_.size() > capacity_) {
            size_t keep = capacity_ / 2;
            recent_errors_.erase(recent_errors_.begin(), recent_errors_.end() - keep);
        }
        handler = handler_;
    }

    // The handler runs outside the lock so it may query this context.
    if (handler) {
        try {
            if (error.severity == ErrorSeverity::CRITICAL || error.severity == ErrorSeverity::FATAL) {
                handler->handleCriticalError(error);
            } else {
                handler->handleError(error);
            }
        } catch (const std::exception& e) {
            LOG_WARN("[ErrorContext] Error handler threw while handling {}: {}", error.toString(), e.what());
        }
    }
}

void ErrorContext::reportError(ErrorCode code, const std::string& message) {
    reportError(StorageError(code, message));
}

size_t ErrorContext::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = error_counts_.find(code);
    return it != error_counts_.end() ? it->second : 0;
}

size_t ErrorContext::getTotalErrorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [code, count] : error_counts_) {
        total += count;
    }
    return total;
}

size_t ErrorContext::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recent_errors_.size();
}

std::vector<StorageError> ErrorContext::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t actual_count = std::min(count, recent_errors_.size());
    if (actual_count == 0) {
        return {};
    }
    return std::vector<StorageError>(recent_errors_.end() - actual_count, recent_errors_.end());
}

bool ErrorContext::hasRepeatedErrors(ErrorCode code, size_t threshold) const {
    return getErrorCount(code) >= threshold;
}

void ErrorContext::clearErrors() {
    std::lock_guard<std::mutex> lock(mutex_);
    recent_errors_.clear();
    error_counts_.clear();
}

} // namespace storage
} // namespace flowstore
