// od::Value - the dynamically typed value slot of an ordered dictionary
#pragma once

#include <od/timestamp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace od {

class Dict; // forward

// Deepest nesting of dicts and lists the codecs read or write.
constexpr size_t kMaxNestingDepth = 1000;

struct Value {
    using list_t = std::vector<Value>;
    using bytes_t = std::vector<uint8_t>;
    using dict_ptr = std::shared_ptr<Dict>;

    enum Kind { Null, Bool, Int, Uint, Double, String, Bytes, Time, List, Object };

    // Alternative order must follow Kind.
    std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, bytes_t, Timestamp,
                 list_t, dict_ptr>
                v;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : v(b) {}
    Value(int x) : v(int64_t(x)) {}
    Value(long x) : v(int64_t(x)) {}
    Value(long long x) : v(int64_t(x)) {}
    Value(unsigned x) : v(uint64_t(x)) {}
    Value(unsigned long x) : v(uint64_t(x)) {}
    Value(unsigned long long x) : v(uint64_t(x)) {}
    Value(double x) : v(x) {}
    Value(const char* s) : v(std::string(s)) {}
    Value(const std::string& s) : v(s) {}
    Value(std::string&& s) : v(std::move(s)) {}
    Value(const bytes_t& b) : v(b) {}
    Value(bytes_t&& b) : v(std::move(b)) {}
    Value(const Timestamp& t) : v(t) {}
    Value(const list_t& l) : v(l) {}
    Value(list_t&& l) : v(std::move(l)) {}
    Value(dict_ptr d) : v(std::move(d)) {}

    Kind kind() const noexcept { return static_cast<Kind>(v.index()); }

    bool is_null() const noexcept { return std::holds_alternative<std::monostate>(v); }
    bool is_bool() const noexcept { return std::holds_alternative<bool>(v); }
    bool is_int() const noexcept { return std::holds_alternative<int64_t>(v); }
    bool is_uint() const noexcept { return std::holds_alternative<uint64_t>(v); }
    bool is_double() const noexcept { return std::holds_alternative<double>(v); }
    bool is_string() const noexcept { return std::holds_alternative<std::string>(v); }
    bool is_bytes() const noexcept { return std::holds_alternative<bytes_t>(v); }
    bool is_time() const noexcept { return std::holds_alternative<Timestamp>(v); }
    bool is_list() const noexcept { return std::holds_alternative<list_t>(v); }
    bool is_dict() const noexcept { return std::holds_alternative<dict_ptr>(v); }

    bool as_bool() const { return std::get<bool>(v); }
    int64_t as_int() const { return std::get<int64_t>(v); }
    uint64_t as_uint() const { return std::get<uint64_t>(v); }
    double as_double() const { return std::get<double>(v); }
    const std::string& as_string() const { return std::get<std::string>(v); }
    const bytes_t& as_bytes() const { return std::get<bytes_t>(v); }
    const Timestamp& as_time() const { return std::get<Timestamp>(v); }
    const list_t& as_list() const { return std::get<list_t>(v); }
    const dict_ptr& as_dict() const { return std::get<dict_ptr>(v); }

    // Structural equality. Nested dictionaries compare by their live items
    // in order, not by identity. A pair of dicts met again while already
    // being compared counts as equal, so cyclic values terminate.
    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

    // Compact JSON rendering of this value.
    std::string dump() const;
};

const char* kind_name(Value::Kind k) noexcept;

// Coercions used by the typed getters of Dict. Each returns nullopt when the
// value cannot be read as the requested type.
//
//   to_string:  String, Bytes (raw contents)
//   to_bool:    Bool
//   to_int64:   Int, Uint (wrapping above INT64_MAX), Double (truncated
//               toward zero; nullopt when non-finite or out of range)
//   to_strings: List; elements that are not String or Bytes are skipped
std::optional<std::string> to_string(const Value& v);
std::optional<bool> to_bool(const Value& v);
std::optional<int64_t> to_int64(const Value& v);
std::optional<std::vector<std::string>> to_strings(const Value& v);

} // namespace od
