// od::Dict - an insertion-ordered, thread safe dictionary
#pragma once

#include <od/value.h>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace od {

class Dict;
class JsonDecoder;
using DictPtr = std::shared_ptr<Dict>;

// Items keep the order they were set in. Deleting a key only marks its
// entry; marked entries are dropped in bulk once enough of them pile up.
//
// Every member function takes the instance mutex for its whole duration.
// A Dict stored as a value of another Dict is a separate lock domain.
class Dict {
  public:
    using key_type = std::string;
    using value_type = Value;

    struct Item {
        key_type key;
        value_type value;
    };

    // Number of tombstones tolerated before the entries are rebuilt.
    static constexpr size_t kCompactThreshold = 10;

    Dict() = default;
    Dict(std::initializer_list<std::pair<const key_type, value_type>> init);

    // The mutex is neither copyable nor movable; use copy() for clones.
    Dict(const Dict&) = delete;
    Dict& operator=(const Dict&) = delete;

    // Append (or move to the end) `key`.
    Dict& set(const key_type& key, value_type value);
    // Replace the value of an existing key in place; appends a fresh key.
    Dict& update(const key_type& key, value_type value);
    // Tombstone `key`. Missing keys are ignored.
    void erase(const key_type& key);

    // (value, true) on a hit, (default or null, false) on a miss.
    std::pair<value_type, bool> get(const key_type& key) const;
    bool has(const key_type& key) const;

    std::optional<std::string> getString(const key_type& key) const;
    std::optional<bool> getBool(const key_type& key) const;
    std::optional<int64_t> getInt64(const key_type& key) const;
    std::optional<std::vector<std::string>> getStrings(const key_type& key) const;

    Dict& setDefault(value_type value);
    value_type getDefault() const;
    bool isCaseInsensitive() const;

    std::vector<key_type> keys() const;
    std::vector<Item> items() const;
    std::vector<value_type> values() const;
    size_t size() const;
    bool empty() const { return size() == 0; }
    size_t tombstones() const;

    DictPtr copy() const;
    DictPtr setCaseInsensitive() const;
    void mergeFrom(const Dict& other);

    std::map<key_type, value_type> toMap() const;

    // JSON text of the dictionary. Never throws.
    std::string dump() const;
    std::string dump(int indent) const;
    std::string debugString() const;

  private:
    struct Entry {
        key_type key;
        value_type value;
        bool deleted = false;
    };

    key_type normalize(const key_type& key) const;
    // Callers hold mutex_.
    void setLocked(const key_type& key, value_type value);
    void maybeCompact();

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::unordered_map<key_type, size_t> index_;
    bool case_insensitive_ = false;
    value_type default_value_;

    friend class JsonDecoder;
};

DictPtr make_dict();
DictPtr make_dict(std::initializer_list<std::pair<const Dict::key_type, Value>> init);

std::ostream& operator<<(std::ostream& os, const Dict& d);

} // namespace od
