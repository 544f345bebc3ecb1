// @src/wal.cpp
#include "flowstore/wal.h"
#include "flowstore/serialization_utils.h"
#include "flowstore/storage_error/exceptions.h"
#include "flowstore/storage_error/error_utils.h"
#include "flowstore/debug_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <sstream>

namespace flowstore {

using storage::ErrorCode;

// --- FileWalSink ---

FileWalSink::FileWalSink(const std::string& path)
    : path_(path), out_(path, std::ios::binary | std::ios::app) {
    if (!out_) {
        throw StorageException(STORAGE_ERROR(ErrorCode::IO_WRITE_ERROR, "Cannot open WAL sink file")
                                   .withContext("path", path));
    }
    LOG_INFO("[FileWalSink] Appending WAL entries to {}", path);
}

FileWalSink::~FileWalSink() {
    if (out_.is_open()) {
        out_.flush();
    }
}

namespace {

constexpr uint32_t kMaxFrameBytes = 64u * 1024 * 1024;
constexpr std::streamoff kFrameHeaderBytes = 12;

uint32_t lengthChecksum(uint32_t length) {
    std::ostringstream bytes;
    SerializeUInt32(bytes, length);
    return calculate_payload_checksum(bytes.str());
}

[[noreturn]] void throwWalCorruption(const std::string& path, size_t frame, const std::string& details) {
    throw StorageException(STORAGE_ERROR_WITH_DETAILS(ErrorCode::WAL_CORRUPTION, "WAL frame is corrupt", details)
                               .withContext("path", path)
                               .withContext("frame", std::to_string(frame)));
}

} // namespace

void FileWalSink::consume(const std::vector<WalEntry>& batch) {
    std::ostringstream frames;
    for (const auto& entry : batch) {
        std::ostringstream payload_stream;
        SerializeUInt64(payload_stream, entry.lsn);
        payload_stream.put(static_cast<char>(entry.operation));
        SerializeUInt64(payload_stream, static_cast<uint64_t>(to_epoch_millis(entry.timestamp)));
        SerializeString(payload_stream, entry.key);
        payload_stream.put(entry.value ? 1 : 0);
        if (entry.value) {
            SerializeString(payload_stream, entry.value->dump());
        }
        const std::string payload = payload_stream.str();
        const auto length = static_cast<uint32_t>(payload.size());
        SerializeUInt32(frames, length);
        SerializeUInt32(frames, lengthChecksum(length));
        SerializeUInt32(frames, calculate_payload_checksum(payload));
        frames.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    }

    const std::string bytes = frames.str();
    std::lock_guard<std::mutex> lock(mutex_);
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out_.flush();
    if (!out_) {
        out_.clear();
        throw TransientStorageError(STORAGE_ERROR(ErrorCode::IO_WRITE_ERROR, "WAL sink write failed")
                                        .withContext("path", path_));
    }
}

std::vector<WalEntry> FileWalSink::readAll(const std::string& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        throw StorageException(STORAGE_ERROR(ErrorCode::FILE_NOT_FOUND, "Cannot open WAL file").withContext("path", path));
    }
    const std::streamoff file_size = in.tellg();
    in.seekg(0);

    std::vector<WalEntry> entries;
    while (true) {
        const std::streamoff frame_start = in.tellg();
        if (frame_start < 0) {
            throw TransientStorageError(STORAGE_ERROR(ErrorCode::IO_READ_ERROR, "WAL file read failed")
                                            .withContext("path", path));
        }
        if (frame_start == file_size) {
            break; // clean end of file
        }
        if (file_size - frame_start < kFrameHeaderBytes) {
            LOG_WARN("[FileWalSink::readAll] Torn frame header at end of {}, ignoring", path);
            break;
        }

        auto readField = [&]() -> uint32_t {
            std::string failure = "unexpected end of file";
            try {
                if (auto field = DeserializeUInt32(in)) {
                    return *field;
                }
            } catch (const std::runtime_error& e) {
                failure = e.what();
            }
            throw TransientStorageError(STORAGE_ERROR_WITH_DETAILS(ErrorCode::IO_READ_ERROR, "WAL file read failed", failure)
                                            .withContext("path", path));
        };
        const uint32_t length = readField();
        const uint32_t length_crc = readField();
        const uint32_t payload_crc = readField();
        if (lengthChecksum(length) != length_crc) {
            throwWalCorruption(path, entries.size(), "frame length checksum mismatch");
        }
        if (length > kMaxFrameBytes) {
            throwWalCorruption(path, entries.size(), "frame length " + std::to_string(length) + " exceeds limit");
        }
        // A verified length running past the end can only be a frame whose write was cut short.
        if (static_cast<std::streamoff>(length) > file_size - frame_start - kFrameHeaderBytes) {
            LOG_WARN("[FileWalSink::readAll] Torn frame payload at end of {}, ignoring", path);
            break;
        }

        std::string payload(length, '\0');
        in.read(&payload[0], length);
        if (static_cast<uint32_t>(in.gcount()) != length) {
            throw TransientStorageError(STORAGE_ERROR(ErrorCode::IO_READ_ERROR, "WAL file read failed")
                                            .withContext("path", path));
        }
        if (calculate_payload_checksum(payload) != payload_crc) {
            throwWalCorruption(path, entries.size(), "payload checksum mismatch");
        }

        try {
            std::istringstream ps(payload);
            WalEntry entry;
            entry.lsn = DeserializeUInt64(ps);
            int op = ps.get();
            auto operation = magic_enum::enum_cast<WalOperation>(static_cast<uint8_t>(op));
            if (op == std::char_traits<char>::eof() || !operation) {
                throw std::runtime_error("unknown WAL operation " + std::to_string(op));
            }
            entry.operation = *operation;
            entry.timestamp = TimePoint(std::chrono::milliseconds(static_cast<int64_t>(DeserializeUInt64(ps))));
            entry.key = DeserializeString(ps);
            if (ps.get() == 1) {
                entry.value = json::parse(DeserializeString(ps));
            }
            entries.push_back(std::move(entry));
        } catch (const std::exception& e) {
            throwWalCorruption(path, entries.size(), e.what());
        }
    }
    return entries;
}

// --- WriteAheadLog ---

WriteAheadLog::WriteAheadLog(WalConfig config, ClockFn clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
}

LSN WriteAheadLog::append(WalOperation operation, const std::string& key, const json* value) {
    WalEntry entry;
    entry.operation = operation;
    entry.key = key;
    if (value && config_.log_values) {
        entry.value = *value;
    }
    entry.timestamp = clock_();

    std::lock_guard<std::mutex> lock(mutex_);
    entry.lsn = next_lsn_++;
    LSN lsn = entry.lsn;
    entries_.push_back(std::move(entry));
    appended_total_.fetch_add(1, std::memory_order_relaxed);

    if (entries_.size() > config_.max_entries) {
        [[maybe_unused]] size_t dropped = trimToLocked(config_.trim_to_entries);
        LOG_DEBUG(1, "[WriteAheadLog] Size cap reached, dropped {} oldest entries", dropped);
    }
    return lsn;
}

size_t WriteAheadLog::trimToLocked(size_t target) {
    size_t dropped = 0;
    while (entries_.size() > target) {
        const WalEntry& front = entries_.front();
        if (sink_ && front.lsn > consumed_lsn_) {
            break; // not yet durable
        }
        entries_.pop_front();
        ++dropped;
    }
    pruned_total_.fetch_add(dropped, std::memory_order_relaxed);
    return dropped;
}

size_t WriteAheadLog::prune(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimePoint cutoff = now - config_.retention;
    size_t dropped = 0;
    while (!entries_.empty()) {
        const WalEntry& front = entries_.front();
        if (front.timestamp >= cutoff) break;
        if (sink_ && front.lsn > consumed_lsn_) break;
        entries_.pop_front();
        ++dropped;
    }
    pruned_total_.fetch_add(dropped, std::memory_order_relaxed);
    if (entries_.size() > config_.max_entries) {
        dropped += trimToLocked(config_.trim_to_entries);
    }
    if (dropped > 0) {
        LOG_DEBUG(1, "[WriteAheadLog] Pruned {} entries, {} remain", dropped, entries_.size());
    }
    return dropped;
}

void WriteAheadLog::attachSink(std::shared_ptr<WalSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
    // Entries appended before the sink existed are not owed to it.
    consumed_lsn_ = entries_.empty() ? next_lsn_ - 1 : entries_.front().lsn - 1;
}

bool WriteAheadLog::hasSink() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sink_ != nullptr;
}

storage::Status WriteAheadLog::flushToSink(size_t batch_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sink_) {
        return {};
    }
    if (batch_size == 0) batch_size = 1;

    std::vector<WalEntry> batch;
    batch.reserve(batch_size);
    for (const auto& entry : entries_) {
        if (entry.lsn <= consumed_lsn_) continue;
        batch.push_back(entry);
        if (batch.size() == batch_size) {
            try {
                sink_->consume(batch);
            } catch (const StorageException& e) {
                sink_failures_.fetch_add(1, std::memory_order_relaxed);
                return storage::StorageError(e.error()).withUnderlyingError(ErrorCode::WAL_SINK_FAILED);
            } catch (const std::exception& e) {
                sink_failures_.fetch_add(1, std::memory_order_relaxed);
                return STORAGE_ERROR_WITH_DETAILS(ErrorCode::WAL_SINK_FAILED, "WAL sink rejected a batch", e.what());
            }
            consumed_lsn_ = batch.back().lsn;
            batch.clear();
        }
    }
    if (!batch.empty()) {
        try {
            sink_->consume(batch);
        } catch (const StorageException& e) {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
            return storage::StorageError(e.error()).withUnderlyingError(ErrorCode::WAL_SINK_FAILED);
        } catch (const std::exception& e) {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
            return STORAGE_ERROR_WITH_DETAILS(ErrorCode::WAL_SINK_FAILED, "WAL sink rejected a batch", e.what());
        }
        consumed_lsn_ = batch.back().lsn;
    }
    return {};
}

std::vector<WalEntry> WriteAheadLog::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<WalEntry>(entries_.begin(), entries_.end());
}

size_t WriteAheadLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

LSN WriteAheadLog::lastLsn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_lsn_ - 1;
}

LSN WriteAheadLog::consumedLsn() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumed_lsn_;
}

json WriteAheadLog::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"enabled", config_.enabled},
        {"entries", entries_.size()},
        {"lastLsn", next_lsn_ - 1},
        {"consumedLsn", consumed_lsn_},
        {"appended", appended_total_.load(std::memory_order_relaxed)},
        {"pruned", pruned_total_.load(std::memory_order_relaxed)},
        {"sinkAttached", sink_ != nullptr},
        {"sinkFailures", sink_failures_.load(std::memory_order_relaxed)},
    };
}

} // namespace flowstore
