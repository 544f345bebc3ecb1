// @include/flowstore/record_store.h
#pragma once

#include "types.h"

#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowstore {

/**
 * @brief Owner of all records, keyed by string.
 *
 * Implementations may be swapped for a durable backend. Reads return copies.
 * Transient backend failures are reported as TransientStorageError so the
 * engine's retry executor can handle them.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual void put(const std::string& key, Record record) = 0;
    virtual std::optional<Record> get(const std::string& key) const = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual bool contains(const std::string& key) const = 0;
    // Bumps access statistics; returns false if the key is absent.
    virtual bool touch(const std::string& key, TimePoint now) = 0;
    // Keys matching a glob ('*' any run, '?' one character), sorted.
    virtual std::vector<std::string> scanKeys(const std::string& pattern) const = 0;
    virtual size_t size() const = 0;
    virtual size_t payloadBytes() const = 0; // keys plus payloads
};

// Anchored regex for a glob; every character other than '*' and '?' is literal.
std::regex globToRegex(const std::string& pattern);
bool globMatch(const std::regex& compiled, const std::string& key);

class InMemoryRecordStore : public RecordStore {
public:
    void put(const std::string& key, Record record) override;
    std::optional<Record> get(const std::string& key) const override;
    bool remove(const std::string& key) override;
    bool contains(const std::string& key) const override;
    bool touch(const std::string& key, TimePoint now) override;
    std::vector<std::string> scanKeys(const std::string& pattern) const override;
    size_t size() const override { return records_.size(); }
    size_t payloadBytes() const override { return payload_bytes_; }

private:
    std::unordered_map<std::string, Record> records_;
    size_t payload_bytes_ = 0;
};

} // namespace flowstore
