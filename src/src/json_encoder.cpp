#include <od/json.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace od {

namespace {
    // A value with no JSON representation. Recovered by writing null.
    struct EncodeValueError : public std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    std::string base64(const Value::bytes_t& in) {
        static const char* table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string out;
        out.reserve((in.size() + 2) / 3 * 4);
        size_t k = 0;
        for (; k + 2 < in.size(); k += 3) {
            uint32_t n = (uint32_t(in[k]) << 16) | (uint32_t(in[k + 1]) << 8) | in[k + 2];
            out.push_back(table[(n >> 18) & 63]);
            out.push_back(table[(n >> 12) & 63]);
            out.push_back(table[(n >> 6) & 63]);
            out.push_back(table[n & 63]);
        }
        if (k + 1 == in.size()) {
            uint32_t n = uint32_t(in[k]) << 16;
            out.push_back(table[(n >> 18) & 63]);
            out.push_back(table[(n >> 12) & 63]);
            out += "==";
        } else if (k + 2 == in.size()) {
            uint32_t n = (uint32_t(in[k]) << 16) | (uint32_t(in[k + 1]) << 8);
            out.push_back(table[(n >> 18) & 63]);
            out.push_back(table[(n >> 12) & 63]);
            out.push_back(table[(n >> 6) & 63]);
            out.push_back('=');
        }
        return out;
    }

    std::string format_double(double d) {
        if (!std::isfinite(d)) throw EncodeValueError("unsupported value: non-finite number");
        char buf[64];
        auto res = std::to_chars(buf, buf + sizeof(buf), d);
        return std::string(buf, res.ptr);
    }

    class Encoder {
      public:
        explicit Encoder(int indent) : indent_(indent > 0 ? indent : 0) {}

        std::string dict(const Dict& d, int level) {
            // items() releases d's lock before anything nested is visited.
            auto items = d.items();
            Nesting nesting(depth_);
            path_.push_back(&d);

            std::string body;
            bool first = true;
            for (auto const& item : items) {
                // Back references to anything being encoded are dropped.
                if (item.value.is_dict() && on_path(item.value.as_dict().get())) continue;

                std::string val;
                try {
                    val = value(item.value, level + 1);
                } catch (const EncodeValueError&) {
                    val = "null";
                }

                if (!first) body += ',';
                first = false;
                newline(body, level + 1);
                body += quote_json(item.key);
                body += indent_ ? ": " : ":";
                body += val;
            }

            path_.pop_back();
            std::string out = "{";
            out += body;
            if (!first) newline(out, level);
            out += '}';
            return out;
        }

        // Marshal one value. Lists are all or nothing: a bad element makes
        // the whole list fail. Nested dictionaries recover on their own.
        std::string value(const Value& v, int level) {
            switch (v.kind()) {
                case Value::Null:
                    return "null";
                case Value::Bool:
                    return v.as_bool() ? "true" : "false";
                case Value::Int:
                    return std::to_string(v.as_int());
                case Value::Uint:
                    return std::to_string(v.as_uint());
                case Value::Double:
                    return format_double(v.as_double());
                case Value::String:
                    return quote_json(v.as_string());
                case Value::Bytes:
                    return '"' + base64(v.as_bytes()) + '"';
                case Value::Time: {
                    const auto& ts = v.as_time();
                    int64_t y = ts.year();
                    if (y < 0 || y > 9999) throw EncodeValueError("timestamp year outside of range [0,9999]");
                    return '"' + format_rfc3339(ts) + '"';
                }
                case Value::List:
                    return list(v.as_list(), level);
                case Value::Object: {
                    const auto& d = v.as_dict();
                    if (!d) return "null";
                    if (depth_ >= kMaxNestingDepth) throw EncodeValueError("maximum nesting depth exceeded");
                    return dict(*d, level);
                }
            }
            return "null";
        }

        std::string list(const Value::list_t& L, int level) {
            if (depth_ >= kMaxNestingDepth) throw EncodeValueError("maximum nesting depth exceeded");
            if (L.empty()) return "[]";
            Nesting nesting(depth_);
            std::string out = "[";
            for (size_t k = 0; k < L.size(); ++k) {
                if (k) out += ',';
                newline(out, level + 1);
                const Value& e = L[k];
                if (e.is_dict() && on_path(e.as_dict().get())) out += "null";
                else out += value(e, level + 1);
            }
            newline(out, level);
            out += ']';
            return out;
        }

      private:
        // Counts one open container for as long as it is in scope.
        struct Nesting {
            explicit Nesting(size_t& d) : depth(d) { ++depth; }
            ~Nesting() { --depth; }
            size_t& depth;
        };

        bool on_path(const Dict* d) const { return std::find(path_.begin(), path_.end(), d) != path_.end(); }

        void newline(std::string& s, int level) const {
            if (!indent_) return;
            s += '\n';
            s.append(size_t(indent_) * size_t(level), ' ');
        }

        int indent_;
        size_t depth_ = 0;
        std::vector<const Dict*> path_;
    };
}

std::string quote_json(const std::string& s) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0xF]);
                } else {
                    out.push_back(ch);
                }
        }
    }
    out.push_back('"');
    return out;
}

std::string dump_json(const Dict& dict) { return dump_json(dict, 0); }

std::string dump_json(const Dict& dict, int indent) {
    Encoder e(indent);
    return e.dict(dict, 0);
}

std::string dump_json(const Value& value) {
    Encoder e(0);
    try {
        return e.value(value, 0);
    } catch (const EncodeValueError&) {
        return "null";
    }
}

} // namespace od
