#include <od/value.h>
#include <od/dict.h>
#include <od/json.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace od {

const char* kind_name(Value::Kind k) noexcept {
    switch (k) {
        case Value::Null: return "null";
        case Value::Bool: return "bool";
        case Value::Int: return "int64";
        case Value::Uint: return "uint64";
        case Value::Double: return "double";
        case Value::String: return "string";
        case Value::Bytes: return "bytes";
        case Value::Time: return "timestamp";
        case Value::List: return "list";
        case Value::Object: return "object";
    }
    return "unknown";
}

namespace {
    using ActivePairs = std::vector<std::pair<const Dict*, const Dict*>>;

    bool equal(const Value& x, const Value& y, ActivePairs& active) {
        if (x.v.index() != y.v.index()) return false;

        if (x.is_list()) {
            const auto& l = x.as_list();
            const auto& r = y.as_list();
            if (l.size() != r.size()) return false;
            for (size_t k = 0; k < l.size(); ++k)
                if (!equal(l[k], r[k], active)) return false;
            return true;
        }
        if (!x.is_dict()) return x.v == y.v;

        const auto& a = x.as_dict();
        const auto& b = y.as_dict();
        if (a == b) return true;
        if (!a || !b) return false;

        auto key = std::make_pair(static_cast<const Dict*>(a.get()), static_cast<const Dict*>(b.get()));
        if (std::find(active.begin(), active.end(), key) != active.end()) return true;

        auto lhs = a->items();
        auto rhs = b->items();
        if (lhs.size() != rhs.size()) return false;

        active.push_back(key);
        bool same = true;
        for (size_t k = 0; same && k < lhs.size(); ++k)
            same = lhs[k].key == rhs[k].key && equal(lhs[k].value, rhs[k].value, active);
        active.pop_back();
        return same;
    }
}

bool Value::operator==(const Value& o) const {
    ActivePairs active;
    return equal(*this, o, active);
}

std::string Value::dump() const { return dump_json(*this); }

std::optional<std::string> to_string(const Value& v) {
    if (v.is_string()) return v.as_string();
    if (v.is_bytes()) {
        const auto& b = v.as_bytes();
        return std::string(b.begin(), b.end());
    }
    return std::nullopt;
}

std::optional<bool> to_bool(const Value& v) {
    if (v.is_bool()) return v.as_bool();
    return std::nullopt;
}

std::optional<int64_t> to_int64(const Value& v) {
    switch (v.kind()) {
        case Value::Int:
            return v.as_int();
        case Value::Uint:
            return static_cast<int64_t>(v.as_uint());
        case Value::Double: {
            double d = v.as_double();
            // 2^63 is exactly representable; anything at or above it overflows.
            if (!std::isfinite(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0)
                return std::nullopt;
            return static_cast<int64_t>(d);
        }
        default:
            return std::nullopt;
    }
}

std::optional<std::vector<std::string>> to_strings(const Value& v) {
    if (!v.is_list()) return std::nullopt;
    std::vector<std::string> out;
    for (auto const& e : v.as_list()) {
        if (auto s = to_string(e)) out.push_back(std::move(*s));
    }
    return out;
}

} // namespace od
