// @include/flowstore/threading/retry_executor.h
#pragma once

#include "../storage_error/exceptions.h"
#include "../storage_error/error_utils.h"
#include "../debug_utils.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <typeinfo>

namespace flowstore {
namespace threading {

struct RetryPolicy {
    size_t max_attempts = 5; // total attempts, including the first
    std::chrono::milliseconds base_delay{100};
    std::chrono::milliseconds max_delay{5000};
};

/**
 * @class RetryExecutor
 * @brief Runs a closure, retrying transient failures with exponential backoff.
 *
 * The delay after failed attempt n (0-based) is base_delay * 2^n, capped at
 * max_delay. TransientStorageError and exceptions from outside the storage
 * taxonomy are retried; every other StorageException is rethrown at once.
 * When attempts run out the last error is rethrown unchanged.
 */
class RetryExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using RetryObserver = std::function<void(const std::string& operation, size_t attempt, const std::exception& error)>;

    explicit RetryExecutor(RetryPolicy policy, Sleeper sleeper = nullptr)
        : policy_(policy), sleeper_(std::move(sleeper)) {
        if (policy_.max_attempts == 0) policy_.max_attempts = 1;
        if (!sleeper_) {
            sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
        }
    }

    void setRetryObserver(RetryObserver observer) { observer_ = std::move(observer); }

    std::chrono::milliseconds delayForAttempt(size_t attempt) const {
        // Past 2^20 the cap has long since applied.
        size_t shift = std::min<size_t>(attempt, 20);
        auto delay = policy_.base_delay * (int64_t{1} << shift);
        return std::min(delay, policy_.max_delay);
    }

    static bool isRetryable(const std::exception& e) {
        if (dynamic_cast<const TransientStorageError*>(&e)) {
            return true;
        }
        if (auto* se = dynamic_cast<const StorageException*>(&e)) {
            // A plain StorageException may still carry a transient code.
            return typeid(*se) == typeid(StorageException) && storage::error_utils::isTransient(se->code());
        }
        return true;
    }

    template<typename Fn>
    auto execute(const std::string& operation, Fn&& fn) -> decltype(fn()) {
        for (size_t attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const std::exception& e) {
                if (!isRetryable(e) || attempt + 1 >= policy_.max_attempts) {
                    if (attempt > 0) {
                        LOG_WARN("[RetryExecutor] {} failed after {} attempts: {}", operation, attempt + 1, e.what());
                    }
                    throw;
                }
                auto delay = delayForAttempt(attempt);
                LOG_WARN("[RetryExecutor] {} attempt {}/{} failed ({}), retrying in {}ms",
                         operation, attempt + 1, policy_.max_attempts, e.what(), delay.count());
                if (observer_) {
                    observer_(operation, attempt + 1, e);
                }
                sleeper_(delay);
            }
        }
    }

    const RetryPolicy& policy() const { return policy_; }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
    RetryObserver observer_;
};

} // namespace threading
} // namespace flowstore
