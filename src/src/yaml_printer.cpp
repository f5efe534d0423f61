#include <od/yaml.h>
#include "yaml_scalar.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>
#include <string>

namespace od {
namespace yaml {

namespace {
    bool needs_quoting(const std::string& s) {
        if (s.empty()) return true;
        if (std::isspace(static_cast<unsigned char>(s.front())) || std::isspace(static_cast<unsigned char>(s.back())))
            return true;

        const std::string special = ":#{}[],&*?|<>=!%@`\"'\\";
        for (char c : s) {
            if (c == '\n' || c == '\r' || c == '\t') return true;
            if (special.find(c) != std::string::npos) return true;
        }
        if (s.front() == '-') return true;

        // Anything that would read back as null, bool or a number.
        return !detail::plain_scalar(s).is_string();
    }

    std::string quote_string(const std::string& s) {
        std::string out;
        out.push_back('"');
        for (char c : s) {
            if (c == '"' || c == '\\') {
                out.push_back('\\');
                out.push_back(c);
            } else if (c == '\n') {
                out += "\\n";
            } else if (c == '\t') {
                out += "\\t";
            } else if (c == '\r') {
                out += "\\r";
            } else {
                out.push_back(c);
            }
        }
        out.push_back('"');
        return out;
    }

    std::string scalar_text(const Value& v) {
        switch (v.kind()) {
            case Value::Null:
                return "null";
            case Value::Bool:
                return v.as_bool() ? "true" : "false";
            case Value::Int:
                return std::to_string(v.as_int());
            case Value::Uint:
                return std::to_string(v.as_uint());
            case Value::Double: {
                double d = v.as_double();
                if (std::isnan(d)) return ".nan";
                if (std::isinf(d)) return d < 0 ? "-.inf" : ".inf";
                char buf[64];
                auto res = std::to_chars(buf, buf + sizeof(buf), d);
                std::string out(buf, res.ptr);
                // Keep integral doubles floating point when read back.
                if (out.find_first_of(".e") == std::string::npos) out += ".0";
                return out;
            }
            case Value::String:
                return needs_quoting(v.as_string()) ? quote_string(v.as_string()) : v.as_string();
            case Value::Bytes: {
                const auto& b = v.as_bytes();
                std::string s(b.begin(), b.end());
                return needs_quoting(s) ? quote_string(s) : s;
            }
            case Value::Time:
                return quote_string(format_rfc3339(v.as_time()));
            default:
                return "null";
        }
    }

    class Emitter {
      public:
        void pairs(const MapSlice& items, int indent) {
            for (auto const& p : items) {
                if (p.value.is_dict() && on_path(p.value.as_dict().get())) continue;
                pad(indent);
                out << scalar_text(p.key) << ':';
                nested(p.value, indent);
            }
        }

        void dict(const Dict& d, int indent) {
            path.push_back(&d);
            ++depth;
            pairs(to_pairs(d), indent);
            --depth;
            path.pop_back();
        }

        std::string str() const { return out.str(); }

        std::vector<const Dict*> path;

      private:
        // Writes the remainder of a "key:" or "-" line.
        void nested(const Value& v, int indent) {
            if ((v.is_dict() || v.is_list()) && depth >= kMaxNestingDepth) {
                out << " null\n";
                return;
            }
            if (v.is_dict()) {
                const auto& d = v.as_dict();
                if (!d || d->empty()) {
                    out << (d ? " {}\n" : " null\n");
                    return;
                }
                out << '\n';
                dict(*d, indent + 2);
                return;
            }
            if (v.is_list()) {
                const auto& L = v.as_list();
                if (L.empty()) {
                    out << " []\n";
                    return;
                }
                out << '\n';
                list(L, indent + 2);
                return;
            }
            out << ' ' << scalar_text(v) << '\n';
        }

        void list(const Value::list_t& L, int indent) {
            ++depth;
            for (auto const& e : L) {
                pad(indent);
                out << '-';
                if (e.is_dict() && on_path(e.as_dict().get())) {
                    out << " null\n";
                    continue;
                }
                nested(e, indent);
            }
            --depth;
        }

        void pad(int n) {
            for (int k = 0; k < n; ++k) out.put(' ');
        }

        bool on_path(const Dict* d) const { return std::find(path.begin(), path.end(), d) != path.end(); }

        std::ostringstream out;
        size_t depth = 0;
    };
}

std::string dump_pairs(const MapSlice& items) {
    if (items.empty()) return "{}\n";
    Emitter e;
    e.pairs(items, 0);
    return e.str();
}

std::string dump_yaml(const Dict& dict) {
    Emitter e;
    e.dict(dict, 0);
    std::string res = e.str();
    if (res.empty()) return "{}\n";
    return res;
}

} // namespace yaml
} // namespace od
