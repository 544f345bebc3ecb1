// @src/index_manager.cpp
#include "flowstore/index_manager.h"
#include "flowstore/debug_utils.h"

#include <cmath>
#include <limits>
#include <mutex>
#include <vector>

namespace flowstore {

bool IndexManager::isIndexable(const json& value) {
    return value.is_string() || value.is_number();
}

std::optional<std::string> IndexManager::encodeValue(const json& value) {
    if (value.is_string()) {
        return "s:" + value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return "n:" + value.dump();
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return "n:" + std::to_string(static_cast<int64_t>(d));
        }
        return "n:" + value.dump();
    }
    return std::nullopt;
}

void IndexManager::indexOnWrite(const std::string& key, const json& value) {
    std::map<std::string, std::string> fields;
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (auto encoded = encodeValue(it.value())) {
                fields.emplace(it.key(), std::move(*encoded));
            }
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto rev_it = reverse_.find(key);
    if (rev_it != reverse_.end()) {
        // Drop only the entries whose value changed or vanished.
        for (const auto& [field, old_encoded] : rev_it->second) {
            auto next = fields.find(field);
            if (next != fields.end() && next->second == old_encoded) {
                continue;
            }
            auto field_it = index_.find(field);
            if (field_it == index_.end()) continue;
            auto value_it = field_it->second.find(old_encoded);
            if (value_it == field_it->second.end()) continue;
            postings_ -= value_it->second.erase(key);
        }
    }

    for (const auto& [field, encoded] : fields) {
        if (index_[field][encoded].insert(key).second) {
            ++postings_;
        }
    }

    if (fields.empty()) {
        reverse_.erase(key);
    } else {
        reverse_[key] = std::move(fields);
    }
}

void IndexManager::removeFromIndex(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    removeLocked(key);
}

void IndexManager::removeLocked(const std::string& key) {
    auto rev_it = reverse_.find(key);
    if (rev_it == reverse_.end()) {
        return;
    }
    for (const auto& [field, encoded] : rev_it->second) {
        auto field_it = index_.find(field);
        if (field_it == index_.end()) continue;
        auto value_it = field_it->second.find(encoded);
        if (value_it == field_it->second.end()) continue;
        postings_ -= value_it->second.erase(key);
    }
    reverse_.erase(rev_it);
}

std::optional<std::set<std::string>> IndexManager::findByField(const std::string& field, const json& value) const {
    auto encoded = encodeValue(value);
    if (!encoded) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto field_it = index_.find(field);
    if (field_it == index_.end()) {
        return std::nullopt;
    }
    auto value_it = field_it->second.find(*encoded);
    if (value_it == field_it->second.end()) {
        return std::set<std::string>{};
    }
    return value_it->second;
}

bool IndexManager::hasField(const std::string& field) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.count(field) > 0;
}

size_t IndexManager::garbageCollect(const std::function<bool(const std::string&)>& key_exists) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = 0;

    std::vector<std::string> stale_keys;
    for (const auto& [key, fields] : reverse_) {
        if (!key_exists(key)) {
            stale_keys.push_back(key);
        }
    }
    for (const auto& key : stale_keys) {
        removed += reverse_[key].size();
        removeLocked(key);
    }

    for (auto field_it = index_.begin(); field_it != index_.end();) {
        auto& values = field_it->second;
        for (auto value_it = values.begin(); value_it != values.end();) {
            if (value_it->second.empty()) {
                value_it = values.erase(value_it);
                ++removed;
            } else {
                ++value_it;
            }
        }
        if (values.empty()) {
            field_it = index_.erase(field_it);
            ++removed;
        } else {
            ++field_it;
        }
    }

    if (removed > 0) {
        LOG_DEBUG(1, "[IndexManager] Garbage collection removed {} entries ({} stale keys)", removed, stale_keys.size());
    }
    return removed;
}

size_t IndexManager::fieldCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.size();
}

size_t IndexManager::postingCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return postings_;
}

size_t IndexManager::indexedKeyCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return reverse_.size();
}

json IndexManager::toJson() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    json fields = json::object();
    for (const auto& [field, values] : index_) {
        fields[field] = values.size();
    }
    return {
        {"fields", fields},
        {"postings", postings_},
        {"indexedKeys", reverse_.size()},
    };
}

void IndexManager::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    index_.clear();
    reverse_.clear();
    postings_ = 0;
}

} // namespace flowstore
