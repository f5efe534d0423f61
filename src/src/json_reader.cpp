#include <od/json_reader.h>

#include <cctype>
#include <sstream>

namespace od {

DecodeError::DecodeError(Kind kind, const std::string& msg, size_t line, size_t column)
    : std::runtime_error(msg), kind_(kind), line_(line), column_(column) {}

namespace {
    int hex_val(char c) {
        if ('0' <= c && c <= '9') return c - '0';
        if ('a' <= c && c <= 'f') return 10 + (c - 'a');
        if ('A' <= c && c <= 'F') return 10 + (c - 'A');
        return -1;
    }

    void encode_utf8(uint32_t cp, std::string& out) {
        if (cp <= 0x7F) out.push_back(static_cast<char>(cp));
        else if (cp <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string describe(char c) {
        if (c == '\0') return "end of input";
        std::string out = "'";
        out.push_back(c);
        out.push_back('\'');
        return out;
    }
}

char JsonReader::get() {
    if (i >= s.size()) return '\0';
    char c = s[i++];
    if (c == '\n') { ++line_; col_ = 1; }
    else ++col_;
    return c;
}

void JsonReader::skip_ws() {
    while (i < s.size()) {
        char c = s[i];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') get();
        else break;
    }
}

std::string JsonReader::format_error(const std::string& base) const {
    std::ostringstream ss;
    ss << base << " (line " << line_ << ", column " << col_ << ")";
    if (!stack_.empty()) {
        auto const& o = stack_.back();
        ss << " (" << o.opener << " opened at line " << o.line << ", column " << o.col << ")";
    }
    return ss.str();
}

void JsonReader::fail(DecodeError::Kind kind, const std::string& base) const {
    throw DecodeError(kind, format_error(base), line_, col_);
}

JsonReader::Token JsonReader::begin_token() const {
    Token t;
    t.line = line_;
    t.column = col_;
    return t;
}

bool JsonReader::more() {
    skip_ws();
    char c = peek();
    return c != '\0' && c != ']' && c != '}';
}

JsonReader::Token JsonReader::next() {
    while (true) {
        skip_ws();
        char c = peek();

        if (stack_.empty()) {
            if (c == '\0') return begin_token();
            return read_value();
        }

        Frame& f = stack_.back();
        switch (f.state) {
            case State::ObjectKeyOrEnd:
                if (c == '}') return close('}');
                return read_key();
            case State::ObjectKey:
                return read_key();
            case State::ObjectColon:
                if (c != ':') {
                    if (c == '\0') fail(DecodeError::UnexpectedEnd, "unexpected end of input after object key");
                    fail(DecodeError::Syntax, "expected ':' after object key, found " + describe(c));
                }
                get();
                f.state = State::ObjectValue;
                continue;
            case State::ObjectCommaOrEnd:
                if (c == ',') { get(); f.state = State::ObjectKey; continue; }
                if (c == '}') return close('}');
                if (c == '\0') fail(DecodeError::UnexpectedEnd, "unexpected end of input inside object");
                fail(DecodeError::Syntax, "expected ',' or '}' after object value, found " + describe(c));
            case State::ArrayValueOrEnd:
                if (c == ']') return close(']');
                return read_value();
            case State::ArrayCommaOrEnd:
                if (c == ',') { get(); f.state = State::ArrayValue; continue; }
                if (c == ']') return close(']');
                if (c == '\0') fail(DecodeError::UnexpectedEnd, "unexpected end of input inside array");
                fail(DecodeError::Syntax, "expected ',' or ']' after array element, found " + describe(c));
            case State::ObjectValue:
            case State::ArrayValue:
                return read_value();
        }
    }
}

JsonReader::Token JsonReader::close(char closer) {
    Token t = begin_token();
    get();
    stack_.pop_back();
    t.type = closer == '}' ? Token::EndObject : Token::EndArray;
    after_value();
    return t;
}

void JsonReader::after_value() {
    if (stack_.empty()) return;
    Frame& f = stack_.back();
    if (f.opener == '{') f.state = State::ObjectCommaOrEnd;
    else f.state = State::ArrayCommaOrEnd;
}

// Keys may be any scalar here; rejecting non-string keys is left to the
// consumer so it can report them as such.
JsonReader::Token JsonReader::read_key() {
    char c = peek();
    if (c == '{' || c == '[')
        fail(DecodeError::NonStringKey, "object key must be a string, found " + describe(c));
    if (c == '}' || c == ']' || c == ',')
        fail(DecodeError::UnexpectedDelimiter, "expected object key, found " + describe(c));
    Token t = read_value();
    stack_.back().state = State::ObjectColon;
    return t;
}

JsonReader::Token JsonReader::read_value() {
    Token t = begin_token();
    char c = peek();
    switch (c) {
        case '{':
        case '[':
            if (stack_.size() >= kMaxNestingDepth)
                fail(DecodeError::TooDeep, "maximum nesting depth exceeded");
            get();
            stack_.push_back(Frame{c, c == '{' ? State::ObjectKeyOrEnd : State::ArrayValueOrEnd, t.line, t.column});
            t.type = c == '{' ? Token::BeginObject : Token::BeginArray;
            return t;
        case '}':
        case ']':
        case ',':
        case ':':
            fail(DecodeError::UnexpectedDelimiter, "unexpected " + describe(c) + " while parsing value");
        case '\0':
            fail(DecodeError::UnexpectedEnd, "unexpected end of input while parsing value");
        case '"':
            t.type = Token::String;
            t.text = read_string();
            break;
        case 't':
            expect_literal("true");
            t.type = Token::Bool;
            t.boolean = true;
            break;
        case 'f':
            expect_literal("false");
            t.type = Token::Bool;
            break;
        case 'n':
            expect_literal("null");
            t.type = Token::Null;
            break;
        default:
            if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
                t.type = Token::Number;
                t.text = read_number();
                break;
            }
            fail(DecodeError::Syntax, "invalid character " + describe(c) + " looking for beginning of value");
    }
    // Keys are followed by ':' rather than a separator; read_key fixes up the state.
    after_value();
    return t;
}

void JsonReader::expect_literal(const char* word) {
    std::string w(word);
    if (s.compare(i, w.size(), w) != 0) fail(DecodeError::Syntax, "invalid literal, expected '" + w + "'");
    for (size_t k = 0; k < w.size(); ++k) get();
}

std::string JsonReader::read_string() {
    get(); // opening quote
    std::string out;
    while (true) {
        char c = get();
        if (c == '\0' && i >= s.size()) fail(DecodeError::UnexpectedEnd, "unexpected end in string");
        if (c == '"') break;
        if (static_cast<unsigned char>(c) < 0x20) fail(DecodeError::Syntax, "invalid control character in string");
        if (c != '\\') {
            out.push_back(c);
            continue;
        }
        char e = get();
        switch (e) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                auto read_hex4 = [&]() -> uint32_t {
                    uint32_t v = 0;
                    for (int k = 0; k < 4; ++k) {
                        char h = get();
                        if (h == '\0' && i >= s.size()) fail(DecodeError::UnexpectedEnd, "unterminated unicode escape");
                        int hv = hex_val(h);
                        if (hv < 0) fail(DecodeError::Syntax, "invalid unicode escape");
                        v = (v << 4) | static_cast<uint32_t>(hv);
                    }
                    return v;
                };
                uint32_t cp = read_hex4();
                if (cp >= 0xD800 && cp <= 0xDBFF && peek() == '\\' && i + 1 < s.size() && s[i + 1] == 'u') {
                    get();
                    get();
                    uint32_t lo = read_hex4();
                    if (lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else {
                        encode_utf8(0xFFFD, out);
                        cp = lo;
                    }
                }
                if (cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;
                encode_utf8(cp, out);
                break;
            }
            case '\0':
                if (i >= s.size()) fail(DecodeError::UnexpectedEnd, "unexpected end in string escape");
                [[fallthrough]];
            default:
                fail(DecodeError::Syntax, "unsupported escape sequence");
        }
    }
    return out;
}

std::string JsonReader::read_number() {
    size_t start = i;
    auto digit = [&]() { return std::isdigit(static_cast<unsigned char>(peek())) != 0; };

    if (peek() == '-') get();
    if (!digit()) fail(DecodeError::Syntax, "invalid number");
    if (peek() == '0') {
        get();
    } else {
        while (digit()) get();
    }
    if (peek() == '.') {
        get();
        if (!digit()) fail(DecodeError::Syntax, "invalid number: expected digit after '.'");
        while (digit()) get();
    }
    if (peek() == 'e' || peek() == 'E') {
        get();
        if (peek() == '+' || peek() == '-') get();
        if (!digit()) fail(DecodeError::Syntax, "invalid number: expected digit in exponent");
        while (digit()) get();
    }
    return s.substr(start, i - start);
}

} // namespace od
