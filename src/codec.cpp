// @src/codec.cpp
#include "flowstore/codec.h"
#include "flowstore/compression_utils.h"
#include "flowstore/encryption_library.h"
#include "flowstore/storage_error/exceptions.h"
#include "flowstore/storage_error/error_utils.h"
#include "flowstore/debug_utils.h"

#include <magic_enum/magic_enum.hpp>

namespace flowstore {

using storage::ErrorCode;

namespace {

[[noreturn]] void throwCorrupt(ErrorCode code, const std::string& details) {
    throw CorruptRecordError(STORAGE_ERROR_WITH_DETAILS(code, "Stored record cannot be decoded", details));
}

} // namespace

// --- CodecStats ---

void CodecStats::record_compression(CompressionAlgorithm algorithm, size_t before, size_t after) {
    compressions_.fetch_add(1, std::memory_order_relaxed);
    bytes_in_.fetch_add(before, std::memory_order_relaxed);
    bytes_out_.fetch_add(after, std::memory_order_relaxed);
    if (before > after) {
        bytes_saved_.fetch_add(before - after, std::memory_order_relaxed);
    }
    auto slot = static_cast<size_t>(algorithm);
    if (slot < ALGORITHM_SLOTS) {
        per_algorithm_[slot].fetch_add(1, std::memory_order_relaxed);
    }
}

uint64_t CodecStats::get_algorithm_count(CompressionAlgorithm algorithm) const {
    auto slot = static_cast<size_t>(algorithm);
    return slot < ALGORITHM_SLOTS ? per_algorithm_[slot].load(std::memory_order_relaxed) : 0;
}

double CodecStats::get_average_ratio() const {
    uint64_t in = bytes_in_.load(std::memory_order_relaxed);
    uint64_t out = bytes_out_.load(std::memory_order_relaxed);
    return in > 0 ? static_cast<double>(out) / static_cast<double>(in) : 1.0;
}

json CodecStats::toJson() const {
    json by_algorithm = json::object();
    for (auto algorithm : magic_enum::enum_values<CompressionAlgorithm>()) {
        if (algorithm == CompressionAlgorithm::NONE) continue;
        by_algorithm[std::string(magic_enum::enum_name(algorithm))] = get_algorithm_count(algorithm);
    }
    return {
        {"operations", get_compressions()},
        {"skipped", get_skipped()},
        {"totalSaved", get_bytes_saved()},
        {"avgRatio", get_average_ratio()},
        {"byAlgorithm", by_algorithm},
    };
}

// --- Codec ---

Codec::Codec(CompressionConfig config, std::shared_ptr<Cipher> cipher)
    : config_(std::move(config)), cipher_(std::move(cipher)) {}

std::string Codec::serialize(const json& value) {
    try {
        return value.dump();
    } catch (const json::type_error& e) {
        throw StorageException(STORAGE_ERROR_WITH_DETAILS(ErrorCode::INVALID_VALUE,
                                                          "Value cannot be serialized", e.what()));
    }
}

CompressionAlgorithm Codec::selectAlgorithm(size_t serialized_size, const CompressionPolicy& policy) const {
    if (serialized_size == 0) {
        return CompressionAlgorithm::NONE;
    }
    const NetworkQuality network = policy.network_quality;
    const bool degraded = network != NetworkQuality::GOOD;
    const bool worth_it = policy.force_all_sizes ||
                          serialized_size > config_.min_size ||
                          (degraded && serialized_size > config_.degraded_min_size);
    if (!worth_it) {
        return CompressionAlgorithm::NONE;
    }
    if (config_.preferred_algorithm) {
        return *config_.preferred_algorithm;
    }
    if (network == NetworkQuality::CONSTRAINED || network == NetworkQuality::OFFLINE ||
        serialized_size > config_.lz77_threshold) {
        return CompressionAlgorithm::LZ77;
    }
    if (network == NetworkQuality::SLOW || serialized_size > config_.simple_threshold) {
        return CompressionAlgorithm::SIMPLE;
    }
    return CompressionAlgorithm::FAST;
}

EncodedValue Codec::encode(const json& value, bool compress, bool encrypt, const CompressionPolicy& policy) {
    EncodedValue result;
    std::string serialized = serialize(value);
    result.metadata.original_size = serialized.size();
    result.payload = std::move(serialized);

    if (compress && config_.enabled) {
        CompressionAlgorithm algorithm = selectAlgorithm(result.payload.size(), policy);
        if (algorithm != CompressionAlgorithm::NONE) {
            try {
                std::string compressed = CompressionManager::compress(result.payload, algorithm, config_.zstd_level);
                const double limit = config_.keep_ratio * static_cast<double>(result.payload.size());
                if (static_cast<double>(compressed.size()) < limit) {
                    stats_.record_compression(algorithm, result.payload.size(), compressed.size());
                    result.payload = std::move(compressed);
                    result.metadata.compressed = true;
                    result.metadata.algorithm = algorithm;
                } else {
                    stats_.record_skipped_compression();
                    LOG_TRACE("[Codec::encode] {} gained too little ({} -> {} bytes), storing raw",
                              magic_enum::enum_name(algorithm), result.payload.size(), compressed.size());
                }
            } catch (const std::exception& e) {
                // A failed compression only costs space.
                stats_.record_skipped_compression();
                LOG_WARN("[Codec::encode] {} compression failed, storing raw: {}", magic_enum::enum_name(algorithm), e.what());
            }
        }
    }

    if (encrypt) {
        if (!cipher_) {
            throw StorageException(STORAGE_ERROR_WITH_DETAILS(ErrorCode::ENCRYPTION_FAILED,
                                                              "Encryption requested", "no cipher configured"));
        }
        try {
            result.payload = cipher_->encrypt(result.payload);
        } catch (const CryptoException& e) {
            throw StorageException(STORAGE_ERROR_WITH_DETAILS(ErrorCode::ENCRYPTION_FAILED,
                                                              "Encryption failed", e.what()));
        }
        stats_.record_encryption();
        result.metadata.encrypted = true;
        result.metadata.encryption_scheme = cipher_->scheme();
    }

    result.metadata.size = result.payload.size();
    result.metadata.checksum = calculate_payload_checksum(result.payload);
    return result;
}

json Codec::decode(const std::string& payload, const RecordMetadata& metadata) const {
    if (payload.size() != metadata.size) {
        throwCorrupt(ErrorCode::CHECKSUM_MISMATCH, "payload is " + std::to_string(payload.size()) +
                                                   " bytes, metadata says " + std::to_string(metadata.size));
    }
    if (calculate_payload_checksum(payload) != metadata.checksum) {
        throwCorrupt(ErrorCode::CHECKSUM_MISMATCH, "payload checksum does not match metadata");
    }

    std::string data = payload;
    if (metadata.encrypted) {
        if (!cipher_) {
            throw DecryptionError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::DECRYPTION_FAILED,
                                                             "Payload could not be decrypted", "no cipher configured"));
        }
        data = cipher_->decrypt(data); // throws DecryptionError
        stats_.record_decryption();
    }

    if (metadata.compressed) {
        if (metadata.algorithm == CompressionAlgorithm::NONE) {
            throwCorrupt(ErrorCode::INVALID_DATA_FORMAT, "record marked compressed without an algorithm");
        }
        try {
            data = CompressionManager::decompress(data, metadata.algorithm, metadata.original_size);
        } catch (const std::exception& e) {
            throwCorrupt(ErrorCode::COMPRESSION_ERROR, std::string(magic_enum::enum_name(metadata.algorithm)) +
                                                         ": " + e.what());
        }
    }

    if (data.size() != metadata.original_size) {
        throwCorrupt(ErrorCode::INVALID_DATA_FORMAT, "decoded " + std::to_string(data.size()) +
                                                     " bytes, expected " + std::to_string(metadata.original_size));
    }

    try {
        return json::parse(data);
    } catch (const json::parse_error& e) {
        throwCorrupt(ErrorCode::INVALID_DATA_FORMAT, e.what());
    }
}

} // namespace flowstore
