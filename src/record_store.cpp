// @src/record_store.cpp
#include "flowstore/record_store.h"
#include <algorithm>

namespace flowstore {

std::regex globToRegex(const std::string& pattern) {
    static const std::string kSpecial = R"(\^$.|+()[]{}/)";
    std::string expr;
    expr.reserve(pattern.size() * 2);
    for (char c : pattern) {
        // [\s\S] rather than '.', which stops at line terminators.
        if (c == '*') {
            expr += R"([\s\S]*)";
        } else if (c == '?') {
            expr += R"([\s\S])";
        } else {
            if (kSpecial.find(c) != std::string::npos) {
                expr += '\\';
            }
            expr += c;
        }
    }
    return std::regex(expr, std::regex::ECMAScript | std::regex::optimize);
}

bool globMatch(const std::regex& compiled, const std::string& key) {
    return std::regex_match(key, compiled);
}

void InMemoryRecordStore::put(const std::string& key, Record record) {
    auto it = records_.find(key);
    if (it != records_.end()) {
        payload_bytes_ -= it->second.payload.size();
        payload_bytes_ += record.payload.size();
        it->second = std::move(record);
        return;
    }
    payload_bytes_ += key.size() + record.payload.size();
    records_.emplace(key, std::move(record));
}

std::optional<Record> InMemoryRecordStore::get(const std::string& key) const {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryRecordStore::remove(const std::string& key) {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return false;
    }
    payload_bytes_ -= key.size() + it->second.payload.size();
    records_.erase(it);
    return true;
}

bool InMemoryRecordStore::contains(const std::string& key) const {
    return records_.count(key) > 0;
}

bool InMemoryRecordStore::touch(const std::string& key, TimePoint now) {
    auto it = records_.find(key);
    if (it == records_.end()) {
        return false;
    }
    it->second.metadata.access_count++;
    it->second.metadata.last_accessed_at = now;
    return true;
}

std::vector<std::string> InMemoryRecordStore::scanKeys(const std::string& pattern) const {
    std::vector<std::string> keys;
    if (pattern == "*") {
        keys.reserve(records_.size());
        for (const auto& [key, record] : records_) {
            keys.push_back(key);
        }
    } else {
        std::regex compiled = globToRegex(pattern);
        for (const auto& [key, record] : records_) {
            if (globMatch(compiled, key)) {
                keys.push_back(key);
            }
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace flowstore
