// @include/flowstore/codec.h
#pragma once

#include "types.h"
#include "cipher.h"

#include <array>
#include <atomic>
#include <memory>
#include <string>

namespace flowstore {

struct CompressionConfig {
    bool enabled = true;
    size_t min_size = 100;          // compress payloads larger than this
    size_t degraded_min_size = 50;  // threshold when the network is not GOOD
    size_t simple_threshold = 1000; // above this, run-length encoding
    size_t lz77_threshold = 10000;  // above this, LZ77
    double keep_ratio = 0.9;        // keep output only if smaller than keep_ratio * input
    std::optional<CompressionAlgorithm> preferred_algorithm; // overrides the size tiers
    int zstd_level = 0;
};

// Snapshot handed to the codec by the resource governor for one write.
struct CompressionPolicy {
    bool force_all_sizes = false;
    NetworkQuality network_quality = NetworkQuality::GOOD;
};

struct EncodedValue {
    std::string payload;
    RecordMetadata metadata; // codec-owned fields only; timestamps and version are left to the engine
};

class CodecStats {
public:
    static constexpr size_t ALGORITHM_SLOTS = 6;

    void record_compression(CompressionAlgorithm algorithm, size_t before, size_t after);
    void record_skipped_compression() { skipped_.fetch_add(1, std::memory_order_relaxed); }
    void record_encryption() { encryptions_.fetch_add(1, std::memory_order_relaxed); }
    void record_decryption() { decryptions_.fetch_add(1, std::memory_order_relaxed); }

    uint64_t get_compressions() const { return compressions_.load(std::memory_order_relaxed); }
    uint64_t get_skipped() const { return skipped_.load(std::memory_order_relaxed); }
    uint64_t get_bytes_saved() const { return bytes_saved_.load(std::memory_order_relaxed); }
    uint64_t get_encryptions() const { return encryptions_.load(std::memory_order_relaxed); }
    uint64_t get_decryptions() const { return decryptions_.load(std::memory_order_relaxed); }
    uint64_t get_algorithm_count(CompressionAlgorithm algorithm) const;
    double get_average_ratio() const; // compressed / original over kept compressions

    json toJson() const;

private:
    std::atomic<uint64_t> compressions_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> bytes_saved_{0};
    std::atomic<uint64_t> bytes_in_{0};
    std::atomic<uint64_t> bytes_out_{0};
    std::atomic<uint64_t> encryptions_{0};
    std::atomic<uint64_t> decryptions_{0};
    std::array<std::atomic<uint64_t>, ALGORITHM_SLOTS> per_algorithm_{};
};

/**
 * Turns a JSON value into record bytes and back.
 *
 * encode: canonical JSON text -> optional compression -> optional encryption,
 * then a CRC32 over the final bytes. decode verifies the checksum and
 * reverses the pipeline, raising CorruptRecordError (DecryptionError for
 * cipher failures) on any mismatch.
 */
class Codec {
public:
    Codec(CompressionConfig config, std::shared_ptr<Cipher> cipher);

    static std::string serialize(const json& value);

    // NONE means "store uncompressed". Deterministic for a given size and policy.
    CompressionAlgorithm selectAlgorithm(size_t serialized_size, const CompressionPolicy& policy) const;

    EncodedValue encode(const json& value, bool compress, bool encrypt, const CompressionPolicy& policy);
    json decode(const std::string& payload, const RecordMetadata& metadata) const;

    bool hasCipher() const { return cipher_ != nullptr; }
    const Cipher* cipher() const { return cipher_.get(); }
    const CompressionConfig& config() const { return config_; }
    const CodecStats& stats() const { return stats_; }

private:
    CompressionConfig config_;
    std::shared_ptr<Cipher> cipher_;
    mutable CodecStats stats_;
};

} // namespace flowstore
