#include <od/dict.h>
#include <od/json.h>

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace od {

Dict::Dict(std::initializer_list<std::pair<const key_type, value_type>> init) {
    for (auto const& p : init) setLocked(p.first, p.second);
}

DictPtr make_dict() { return std::make_shared<Dict>(); }

DictPtr make_dict(std::initializer_list<std::pair<const Dict::key_type, Value>> init) {
    return std::make_shared<Dict>(init);
}

Dict::key_type Dict::normalize(const key_type& key) const {
    if (!case_insensitive_) return key;
    key_type out = key;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

Dict& Dict::set(const key_type& key, value_type value) {
    std::lock_guard<std::mutex> lock(mutex_);
    setLocked(key, std::move(value));
    return *this;
}

void Dict::setLocked(const key_type& key, value_type value) {
    auto norm = normalize(key);

    // An existing key moves to the end: retire the old entry.
    auto it = index_.find(norm);
    if (it != index_.end()) {
        entries_[it->second].deleted = true;
        entries_[it->second].value = value_type();
    }

    index_[norm] = entries_.size();
    entries_.push_back(Entry{key, std::move(value), false});
    maybeCompact();
}

Dict& Dict::update(const key_type& key, value_type value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto norm = normalize(key);
    auto it = index_.find(norm);
    if (it != index_.end()) {
        entries_[it->second].value = std::move(value);
        return *this;
    }
    index_[norm] = entries_.size();
    entries_.push_back(Entry{key, std::move(value), false});
    maybeCompact();
    return *this;
}

void Dict::maybeCompact() {
    if (entries_.size() - index_.size() < kCompactThreshold) return;

    std::vector<Entry> live;
    std::unordered_map<key_type, size_t> index;
    live.reserve(index_.size());
    index.reserve(index_.size());
    for (auto& e : entries_) {
        if (e.deleted) continue;
        index[normalize(e.key)] = live.size();
        live.push_back(std::move(e));
    }
    entries_ = std::move(live);
    index_ = std::move(index);
}

void Dict::erase(const key_type& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(normalize(key));
    if (it == index_.end()) return;
    Entry& e = entries_[it->second];
    e.deleted = true;
    e.value = value_type();
    index_.erase(it);
}

std::pair<Dict::value_type, bool> Dict::get(const key_type& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(normalize(key));
    if (it == index_.end()) return {default_value_, false};
    return {entries_[it->second].value, true};
}

bool Dict::has(const key_type& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(normalize(key)) == 1;
}

std::optional<std::string> Dict::getString(const key_type& key) const {
    auto [v, found] = get(key);
    if (!found) return std::nullopt;
    return to_string(v);
}

std::optional<bool> Dict::getBool(const key_type& key) const {
    auto [v, found] = get(key);
    if (!found) return std::nullopt;
    return to_bool(v);
}

std::optional<int64_t> Dict::getInt64(const key_type& key) const {
    auto [v, found] = get(key);
    if (!found) return std::nullopt;
    return to_int64(v);
}

std::optional<std::vector<std::string>> Dict::getStrings(const key_type& key) const {
    auto [v, found] = get(key);
    if (!found) return std::nullopt;
    return to_strings(v);
}

Dict& Dict::setDefault(value_type value) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_value_ = std::move(value);
    return *this;
}

Dict::value_type Dict::getDefault() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_value_;
}

bool Dict::isCaseInsensitive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return case_insensitive_;
}

std::vector<Dict::key_type> Dict::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<key_type> out;
    out.reserve(index_.size());
    for (auto const& e : entries_)
        if (!e.deleted) out.push_back(e.key);
    return out;
}

std::vector<Dict::Item> Dict::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Item> out;
    out.reserve(index_.size());
    for (auto const& e : entries_)
        if (!e.deleted) out.push_back(Item{e.key, e.value});
    return out;
}

std::vector<Dict::value_type> Dict::values() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<value_type> out;
    out.reserve(index_.size());
    for (auto const& e : entries_)
        if (!e.deleted) out.push_back(e.value);
    return out;
}

size_t Dict::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

size_t Dict::tombstones() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size() - index_.size();
}

DictPtr Dict::copy() const {
    auto out = make_dict();
    std::lock_guard<std::mutex> lock(mutex_);
    out->entries_ = entries_;
    out->index_ = index_;
    out->case_insensitive_ = case_insensitive_;
    out->default_value_ = default_value_;
    return out;
}

DictPtr Dict::setCaseInsensitive() const {
    auto out = make_dict();
    out->case_insensitive_ = true;
    for (auto& item : items()) out->set(item.key, std::move(item.value));
    return out;
}

void Dict::mergeFrom(const Dict& other) {
    // Snapshot first so the two locks are never held together.
    for (auto& item : other.items()) set(item.key, std::move(item.value));
}

std::map<Dict::key_type, Dict::value_type> Dict::toMap() const {
    std::map<key_type, value_type> out;
    for (auto& item : items()) out[item.key] = std::move(item.value);
    return out;
}

std::string Dict::dump() const {
    try {
        return dump_json(*this);
    } catch (const std::exception& e) {
        return std::string("Error: ") + e.what();
    }
}

std::string Dict::dump(int indent) const {
    try {
        return dump_json(*this, indent);
    } catch (const std::exception& e) {
        return std::string("Error: ") + e.what();
    }
}

std::string Dict::debugString() const {
    std::ostringstream ss;
    ss << "Keys [";
    bool first = true;
    for (auto const& k : keys()) {
        if (!first) ss << ' ';
        first = false;
        ss << k;
    }
    ss << "], len(store) " << size() << ", case_insensitive " << (isCaseInsensitive() ? "true" : "false")
       << " default_value " << getDefault().dump();
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Dict& d) {
    os << d.dump();
    return os;
}

} // namespace od
