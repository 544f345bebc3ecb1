// @include/flowstore/types.h

#pragma once
#include <zlib.h>

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>
#include <functional>
#include <atomic>

#include <nlohmann/json.hpp>

namespace flowstore {

using json = nlohmann::json;

// --- Foundational Data Types ---
using LSN = uint64_t; // Log sequence number of a WAL entry
static constexpr LSN INVALID_LSN = 0;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn = std::function<TimePoint()>;

static constexpr size_t DEFAULT_MAX_KEY_LENGTH = 250;

// --- Compression and Encryption Enums ---
enum class CompressionAlgorithm : uint8_t {
    NONE   = 0,
    FAST   = 1, // Dictionary substitution of common phrases
    SIMPLE = 2, // Run-length encoding
    LZ77   = 3, // Sliding-window back references
    ZSTD   = 4,
    LZ4    = 5,
};

enum class EncryptionScheme : uint8_t {
    NONE = 0,
    AES256_GCM_HKDF_DAILY = 1, // AEAD with a per-day, per-record derived sub-key
};

// --- Resource telemetry ---
enum class NetworkQuality : uint8_t {
    GOOD,        // wifi / 4g
    MODERATE,    // 3g
    SLOW,        // 2g
    CONSTRAINED, // slow-2g
    OFFLINE
};

struct ResourceState {
    double memory_pressure = 0.0; // 0.0 (idle) .. 1.0 (exhausted)
    NetworkQuality network_quality = NetworkQuality::GOOD;
    bool battery_constrained = false;
};

// --- Records ---
struct RecordMetadata {
    size_t original_size = 0;
    bool compressed = false;
    bool encrypted = false;
    CompressionAlgorithm algorithm = CompressionAlgorithm::NONE;
    EncryptionScheme encryption_scheme = EncryptionScheme::NONE;
    uint32_t checksum = 0;
    TimePoint created_at{};
    TimePoint updated_at{};
    uint64_t version = 0;
    size_t size = 0;
    uint64_t access_count = 0;
    TimePoint last_accessed_at{};
    std::optional<TimePoint> expires_at;
};

struct Record {
    std::string payload;
    RecordMetadata metadata;

    bool isExpired(TimePoint now) const {
        return metadata.expires_at.has_value() && now >= *metadata.expires_at;
    }
};

// --- Operation options and results ---
struct SetOptions {
    std::optional<bool> compress; // unset = engine default
    std::optional<bool> encrypt;  // unset = engine default
    bool backup = false;
    std::optional<std::chrono::milliseconds> ttl;
};

struct RemoveOptions {
    bool backup = false;
};

struct WriteResult {
    std::string key;
    size_t size = 0;
    double duration_ms = 0.0;
    bool compressed = false;
    bool encrypted = false;
    CompressionAlgorithm algorithm = CompressionAlgorithm::NONE;
    uint64_t version = 0;
};

struct DeleteResult {
    std::string key;
    bool existed = false;
};

// Shared by keys() and query(): a scan gives up once the deadline passes or
// the flag is raised.
struct ScanControl {
    std::optional<std::chrono::milliseconds> timeout;
    const std::atomic<bool>* cancel = nullptr;
};

struct KeysOptions {
    std::optional<size_t> limit;
    size_t offset = 0;
    ScanControl control;
};

struct QueryOptions {
    std::string key_pattern = "*";
    std::optional<size_t> limit;
    ScanControl control;
};

struct BackupInfo {
    std::string backup_id;
    std::string original_key;
    TimePoint created_at{};
    uint64_t version = 0;
};

inline uint32_t calculate_payload_checksum(const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) {
        return 0;
    }
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, data, static_cast<uInt>(len));
    return static_cast<uint32_t>(crc);
}

inline uint32_t calculate_payload_checksum(const std::string& data) {
    return calculate_payload_checksum(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

inline int64_t to_epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace flowstore
