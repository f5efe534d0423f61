#include <od/yaml.h>
#include "yaml_scalar.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace od {
namespace yaml {

namespace detail {

Value plain_scalar(const std::string& str) {
    if (str.empty() || str == "null" || str == "~" || str == "Null" || str == "NULL") return Value();
    if (str == "true" || str == "True" || str == "TRUE") return Value(true);
    if (str == "false" || str == "False" || str == "FALSE") return Value(false);
    if (str == ".inf" || str == ".Inf" || str == ".INF" || str == "+.inf" || str == "+.Inf" || str == "+.INF")
        return Value(std::numeric_limits<double>::infinity());
    if (str == "-.inf" || str == "-.Inf" || str == "-.INF") return Value(-std::numeric_limits<double>::infinity());
    if (str == ".nan" || str == ".NaN" || str == ".NAN") return Value(std::numeric_limits<double>::quiet_NaN());

    const char* first = str.data();
    const char* last = first + str.size();
    const char* digits = (*first == '-' || *first == '+') ? first + 1 : first;
    if (digits == last || !(std::isdigit(static_cast<unsigned char>(*digits)) || *digits == '.'))
        return Value(str);
    if (*first == '+') ++first;

    bool is_float = str.find_first_of(".eE") != std::string::npos;
    if (!is_float) {
        int64_t n = 0;
        auto rn = std::from_chars(first, last, n);
        if (rn.ec == std::errc() && rn.ptr == last) return Value(n);
        uint64_t u = 0;
        auto ru = std::from_chars(first, last, u);
        if (ru.ec == std::errc() && ru.ptr == last) return Value(u);
    } else {
        double d = 0.0;
        auto rd = std::from_chars(first, last, d);
        if (rd.ec == std::errc() && rd.ptr == last) return Value(d);
    }
    return Value(str);
}

} // namespace detail

namespace {
    struct Line {
        int indent;
        std::string text; // indentation and trailing comment removed
        size_t number;
    };

    std::string rtrim(std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
        return s;
    }

    std::string trim(const std::string& s) {
        size_t a = 0;
        while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
        return rtrim(s.substr(a));
    }

    // Remove a '#' comment that is outside quotes and starts a word.
    std::string strip_comment(const std::string& s) {
        char quote = '\0';
        for (size_t k = 0; k < s.size(); ++k) {
            char c = s[k];
            if (quote) {
                if (c == '\\' && quote == '"') { ++k; continue; }
                if (c == quote) quote = '\0';
                continue;
            }
            if (c == '"' || c == '\'') {
                if (k == 0 || std::isspace(static_cast<unsigned char>(s[k - 1])) || s[k - 1] == '[' ||
                    s[k - 1] == ',' || s[k - 1] == ':' || s[k - 1] == '-')
                    quote = c;
                continue;
            }
            if (c == '#' && (k == 0 || std::isspace(static_cast<unsigned char>(s[k - 1])))) return rtrim(s.substr(0, k));
        }
        return rtrim(s);
    }

    class YamlParser {
      public:
        explicit YamlParser(const std::string& text) { split(text); }

        MapSlice parse() {
            if (lines.empty()) return {};
            if (lines.size() == 1 && lines[0].text == "{}") return {};
            if (is_seq_item(lines[0].text))
                throw YamlError("document root must be a mapping", lines[0].number);
            MapSlice out = parse_mapping(lines[0].indent);
            if (pos < lines.size()) throw YamlError("unexpected indentation", lines[pos].number);
            return out;
        }

      private:
        void split(const std::string& text) {
            size_t start = 0;
            size_t number = 0;
            while (start <= text.size()) {
                size_t end = text.find('\n', start);
                if (end == std::string::npos) end = text.size();
                std::string raw = text.substr(start, end - start);
                ++number;
                start = end + 1;

                int indent = 0;
                size_t k = 0;
                while (k < raw.size() && (raw[k] == ' ' || raw[k] == '\t')) {
                    if (raw[k] == '\t') throw YamlError("tabs are not allowed for indentation", number);
                    ++indent;
                    ++k;
                }
                std::string body = strip_comment(raw.substr(k));
                if (body.empty()) continue;
                if (indent == 0 && (body == "---" || body == "...")) continue;
                lines.push_back(Line{indent, body, number});
                if (end == text.size()) break;
            }
        }

        static bool is_seq_item(const std::string& t) { return t == "-" || (t.size() > 1 && t[0] == '-' && t[1] == ' '); }

        // Position of the ':' separating key and value, or npos.
        static size_t find_colon(const std::string& t) {
            char quote = '\0';
            for (size_t k = 0; k < t.size(); ++k) {
                char c = t[k];
                if (quote) {
                    if (c == '\\' && quote == '"') { ++k; continue; }
                    if (c == quote) quote = '\0';
                    continue;
                }
                if ((c == '"' || c == '\'') && k == 0) { quote = c; continue; }
                if (c == ':' && (k + 1 == t.size() || t[k + 1] == ' ')) return k;
            }
            return std::string::npos;
        }

        Value quoted(const std::string& t, size_t number) const {
            char q = t[0];
            std::string out;
            size_t k = 1;
            for (; k < t.size(); ++k) {
                char c = t[k];
                if (q == '\'' && c == '\'') {
                    if (k + 1 < t.size() && t[k + 1] == '\'') { out.push_back('\''); ++k; continue; }
                    break;
                }
                if (q == '"' && c == '"') break;
                if (q == '"' && c == '\\' && k + 1 < t.size()) {
                    char e = t[++k];
                    if (e == 'n') out.push_back('\n');
                    else if (e == 't') out.push_back('\t');
                    else if (e == 'r') out.push_back('\r');
                    else if (e == '0') out.push_back('\0');
                    else out.push_back(e);
                    continue;
                }
                out.push_back(c);
            }
            if (k >= t.size()) throw YamlError("unterminated quoted string", number);
            if (k + 1 != t.size()) throw YamlError("unexpected text after quoted string", number);
            return Value(std::move(out));
        }

        Value scalar(const std::string& raw, size_t number) const {
            std::string t = trim(raw);
            if (!t.empty() && (t[0] == '"' || t[0] == '\'')) return quoted(t, number);
            return detail::plain_scalar(t);
        }

        // Split a single-line flow sequence body on commas outside quotes.
        Value flow_sequence(const std::string& t, size_t number) const {
            if (t.back() != ']') throw YamlError("unterminated flow sequence", number);
            std::string body = trim(t.substr(1, t.size() - 2));
            Value::list_t out;
            if (body.empty()) return Value(std::move(out));
            char quote = '\0';
            std::string cur;
            for (size_t k = 0; k < body.size(); ++k) {
                char c = body[k];
                if (quote) {
                    if (c == quote) quote = '\0';
                } else if (c == '"' || c == '\'') {
                    quote = c;
                } else if (c == ',') {
                    out.push_back(scalar(cur, number));
                    cur.clear();
                    continue;
                } else if (c == '[' || c == '{') {
                    throw YamlError("nested flow collections are not supported", number);
                }
                cur.push_back(c);
            }
            if (quote) throw YamlError("unterminated quoted string", number);
            out.push_back(scalar(cur, number));
            return Value(std::move(out));
        }

        Value inline_value(const std::string& t, size_t number) const {
            if (t[0] == '[') return flow_sequence(t, number);
            if (t[0] == '{') {
                if (trim(t.substr(1)) != "}") throw YamlError("flow mappings are only supported empty", number);
                return Value(make_dict());
            }
            if (t[0] == '|' || t[0] == '>') throw YamlError("block scalars are not supported", number);
            if (t[0] == '&' || t[0] == '*') throw YamlError("anchors and aliases are not supported", number);
            return scalar(t, number);
        }

        // Value of a key whose text ended at the ':'; the block (if any) starts
        // on the next line.
        Value block_value(int parent_indent) {
            if (pos >= lines.size()) return Value();
            const Line& next = lines[pos];
            if (next.indent > parent_indent) {
                if (is_seq_item(next.text)) return Value(parse_sequence(next.indent));
                return mapping_value(parse_mapping(next.indent));
            }
            if (next.indent == parent_indent && is_seq_item(next.text)) return Value(parse_sequence(next.indent));
            return Value();
        }

        static Value mapping_value(const MapSlice& pairs) {
            auto d = make_dict();
            from_pairs(pairs, *d);
            return Value(d);
        }

        MapSlice parse_mapping(int indent) {
            Nesting nesting(*this);
            MapSlice out;
            while (pos < lines.size()) {
                Line& line = lines[pos];
                if (line.indent < indent) break;
                if (line.indent > indent) throw YamlError("unexpected indentation", line.number);
                if (is_seq_item(line.text)) break;

                size_t colon = find_colon(line.text);
                if (colon == std::string::npos) throw YamlError("expected ':' after key", line.number);
                std::string key_text = trim(line.text.substr(0, colon));
                if (key_text.empty()) throw YamlError("empty mapping key", line.number);
                std::string rest = trim(line.text.substr(colon + 1));
                size_t number = line.number;
                Value key = scalar(key_text, number);
                ++pos;

                Value value = rest.empty() ? block_value(indent) : inline_value(rest, number);
                out.push_back(MapItem{std::move(key), std::move(value)});
            }
            return out;
        }

        Value::list_t parse_sequence(int indent) {
            Nesting nesting(*this);
            Value::list_t out;
            while (pos < lines.size()) {
                Line& line = lines[pos];
                if (line.indent < indent) break;
                if (line.indent > indent) throw YamlError("unexpected indentation", line.number);
                if (!is_seq_item(line.text)) break;

                std::string item = line.text.size() > 1 ? line.text.substr(2) : std::string();
                int content_indent = indent + 2;
                while (!item.empty() && item[0] == ' ') { item.erase(0, 1); ++content_indent; }

                if (item.empty()) {
                    // A sibling "- x" at the same indent is the next item,
                    // not the content of this one.
                    ++pos;
                    if (pos < lines.size() && lines[pos].indent > indent) out.push_back(block_value(indent));
                    else out.push_back(Value());
                    continue;
                }

                // "- key: value" or "- - x": reread the rest of the line as
                // the first line of a block indented past the dash.
                if (is_seq_item(item)) {
                    line.indent = content_indent;
                    line.text = item;
                    out.push_back(Value(parse_sequence(content_indent)));
                    continue;
                }
                if (item[0] != '"' && item[0] != '\'' && item[0] != '[' && find_colon(item) != std::string::npos) {
                    line.indent = content_indent;
                    line.text = item;
                    out.push_back(mapping_value(parse_mapping(content_indent)));
                    continue;
                }
                ++pos;
                out.push_back(inline_value(item, line.number));
            }
            return out;
        }

        // Counts one open block; throws past kMaxNestingDepth.
        struct Nesting {
            explicit Nesting(YamlParser& p) : parser(p) {
                if (parser.depth >= kMaxNestingDepth)
                    throw YamlError("maximum nesting depth exceeded",
                                    parser.lines[std::min(parser.pos, parser.lines.size() - 1)].number);
                ++parser.depth;
            }
            ~Nesting() { --parser.depth; }
            YamlParser& parser;
        };

        std::vector<Line> lines;
        size_t pos = 0;
        size_t depth = 0;
    };
}

MapSlice parse_pairs(const std::string& text) {
    YamlParser parser(text);
    return parser.parse();
}

} // namespace yaml
} // namespace od
