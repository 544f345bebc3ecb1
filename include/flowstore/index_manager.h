// @include/flowstore/index_manager.h
#pragma once

#include "types.h"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace flowstore {

/**
 * @brief Field-equality secondary index: field -> scalar value -> keys.
 *
 * Every top-level string or number field of an object value is indexed.
 * A reverse map (key -> indexed fields) makes overwrite and delete exact,
 * so index entries never point at a key whose current value differs.
 */
class IndexManager {
public:
    // Writes replace whatever the key had indexed before.
    void indexOnWrite(const std::string& key, const json& value);
    void removeFromIndex(const std::string& key);

    /**
     * Keys whose `field` equals `value`.
     * Returns nullopt when the index cannot answer (value not indexable, or
     * no record has ever indexed `field`); the caller must scan instead.
     */
    std::optional<std::set<std::string>> findByField(const std::string& field, const json& value) const;

    bool hasField(const std::string& field) const;

    // Drops empty entries and keys for which key_exists returns false.
    size_t garbageCollect(const std::function<bool(const std::string&)>& key_exists);

    size_t fieldCount() const;
    size_t postingCount() const;
    size_t indexedKeyCount() const;
    json toJson() const;
    void clear();

    static bool isIndexable(const json& value);
    // Type-tagged text so 37 and "37" never share an entry while 37 and 37.0 do.
    static std::optional<std::string> encodeValue(const json& value);

private:
    void removeLocked(const std::string& key);

    std::map<std::string, std::map<std::string, std::set<std::string>>> index_;
    std::unordered_map<std::string, std::map<std::string, std::string>> reverse_;
    size_t postings_ = 0;
    mutable std::shared_mutex mutex_;
};

} // namespace flowstore
