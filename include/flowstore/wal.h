// @include/flowstore/wal.h
#pragma once

#include "types.h"
#include "storage_error/result.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flowstore {

enum class WalOperation : uint8_t {
    SET = 1,
    DELETE = 2,
};

struct WalEntry {
    LSN lsn = INVALID_LSN;
    WalOperation operation = WalOperation::SET;
    std::string key;
    std::optional<json> value; // present for SET when value logging is on
    TimePoint timestamp{};
};

struct WalConfig {
    bool enabled = true;
    std::chrono::milliseconds retention{std::chrono::minutes(5)};
    size_t max_entries = 10000;
    size_t trim_to_entries = 5000;
    bool log_values = true;
};

/**
 * @brief Durable consumer of WAL entries.
 *
 * consume() either takes the whole batch or throws; the log only advances
 * its consumed position after a successful return.
 */
class WalSink {
public:
    virtual ~WalSink() = default;
    virtual void consume(const std::vector<WalEntry>& batch) = 0;
};

/**
 * Appends entries to a file as frames of
 *   u32 payload_length | u32 crc32(payload_length) | u32 crc32(payload) | payload
 * where payload = u64 lsn | u8 op | u64 millis | str key | u8 has_value | [str value_json].
 * Integers are little-endian, str is a u32-length-prefixed byte string.
 */
class FileWalSink : public WalSink {
public:
    explicit FileWalSink(const std::string& path);
    ~FileWalSink() override;

    void consume(const std::vector<WalEntry>& batch) override;
    const std::string& path() const { return path_; }

    // Reads every complete frame in order. A torn final frame is ignored; a
    // checksum mismatch or an oversized frame throws StorageException(WAL_CORRUPTION).
    static std::vector<WalEntry> readAll(const std::string& path);

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mutex_;
};

class WriteAheadLog {
public:
    WriteAheadLog(WalConfig config, ClockFn clock);

    // Returns the new entry's LSN. Trims the oldest entries once max_entries is exceeded.
    LSN append(WalOperation operation, const std::string& key, const json* value);

    // Drops entries older than the retention window. Never drops entries a sink has not consumed.
    size_t prune(TimePoint now);

    void attachSink(std::shared_ptr<WalSink> sink);
    bool hasSink() const;
    // Delivers unconsumed entries to the sink in batches of batch_size.
    storage::Status flushToSink(size_t batch_size);

    std::vector<WalEntry> entries() const;
    size_t size() const;
    LSN lastLsn() const;
    LSN consumedLsn() const;
    bool enabled() const { return config_.enabled; }
    const WalConfig& config() const { return config_; }

    uint64_t totalAppended() const { return appended_total_.load(std::memory_order_relaxed); }
    uint64_t totalPruned() const { return pruned_total_.load(std::memory_order_relaxed); }
    json toJson() const;

private:
    size_t trimToLocked(size_t target);

    WalConfig config_;
    ClockFn clock_;
    std::deque<WalEntry> entries_;
    LSN next_lsn_ = 1;
    LSN consumed_lsn_ = INVALID_LSN;
    std::shared_ptr<WalSink> sink_;
    std::atomic<uint64_t> appended_total_{0};
    std::atomic<uint64_t> pruned_total_{0};
    std::atomic<uint64_t> sink_failures_{0};
    mutable std::mutex mutex_;
};

} // namespace flowstore
