#include <od/json.h>
#include <od/json_reader.h>

#include <charconv>
#include <mutex>

namespace od {

// Recursive descent over JsonReader tokens. Members are inserted in the
// order they arrive, with set() semantics.
class JsonDecoder {
  public:
    using Token = JsonReader::Token;

    explicit JsonDecoder(const std::string& text) : r(text) {}

    void decode(Dict& out) {
        std::lock_guard<std::mutex> lock(out.mutex_);

        Token t = r.next();
        if (t.type == Token::End)
            throw DecodeError(DecodeError::UnexpectedEnd, "empty document", t.line, t.column);
        if (t.type != Token::BeginObject)
            throw DecodeError(DecodeError::NotAnObject, "expect JSON object open with '{'", t.line, t.column);

        members(out);

        try {
            t = r.next();
        } catch (const DecodeError& e) {
            throw DecodeError(DecodeError::TrailingData,
                              std::string("unexpected data after top-level object: ") + e.what(), e.line(),
                              e.column());
        }
        if (t.type != Token::End)
            throw DecodeError(DecodeError::TrailingData, "unexpected data after top-level object", t.line,
                              t.column);
    }

  private:
    // The opening brace has been consumed. Either the caller holds
    // d.mutex_ or d is not shared yet.
    void members(Dict& d) {
        while (r.more()) {
            Token k = r.next();
            if (k.type != Token::String)
                throw DecodeError(DecodeError::NonStringKey, "object key must be a string", k.line, k.column);
            Token t = r.next();
            d.setLocked(k.text, value(t));
        }
        Token t = r.next();
        if (t.type != Token::EndObject) r.fail(DecodeError::UnexpectedDelimiter, "expected '}' to close object");
    }

    Value::list_t array() {
        Value::list_t out;
        while (r.more()) {
            Token t = r.next();
            out.push_back(value(t));
        }
        Token t = r.next();
        if (t.type != Token::EndArray) r.fail(DecodeError::UnexpectedDelimiter, "expected ']' to close array");
        return out;
    }

    Value value(const Token& t) {
        switch (t.type) {
            case Token::BeginObject: {
                auto d = make_dict();
                members(*d);
                return Value(d);
            }
            case Token::BeginArray:
                return Value(array());
            case Token::String:
                return string(t);
            case Token::Number:
                return number(t);
            case Token::Bool:
                return Value(t.boolean);
            case Token::Null:
                return Value();
            case Token::End:
                throw DecodeError(DecodeError::UnexpectedEnd, "unexpected end of input", t.line, t.column);
            default:
                throw DecodeError(DecodeError::UnexpectedDelimiter, "unexpected delimiter", t.line, t.column);
        }
    }

    // Strings shaped like an RFC 3339 date-time become timestamps.
    static Value string(const Token& t) {
        if (t.text.size() >= 20 && t.text[10] == 'T') {
            if (auto ts = parse_rfc3339(t.text)) return Value(*ts);
        }
        return Value(t.text);
    }

    // First full parse wins: unsigned, then signed, then floating point.
    static Value number(const Token& t) {
        const char* first = t.text.data();
        const char* last = first + t.text.size();

        uint64_t u = 0;
        auto ru = std::from_chars(first, last, u);
        if (ru.ec == std::errc() && ru.ptr == last) return Value(u);

        int64_t n = 0;
        auto rn = std::from_chars(first, last, n);
        if (rn.ec == std::errc() && rn.ptr == last) return Value(n);

        double d = 0.0;
        auto rd = std::from_chars(first, last, d);
        if (rd.ec == std::errc() && rd.ptr == last) return Value(d);

        throw DecodeError(DecodeError::InvalidNumber, "number out of range: " + t.text, t.line, t.column);
    }

    JsonReader r;
};

void parse_json(const std::string& text, Dict& out) {
    JsonDecoder(text).decode(out);
}

DictPtr parse_json(const std::string& text) {
    auto d = make_dict();
    parse_json(text, *d);
    return d;
}

} // namespace od
