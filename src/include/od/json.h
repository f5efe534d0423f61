#pragma once

#include <od/dict.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace od {

class DecodeError : public std::runtime_error {
  public:
    enum Kind {
        Syntax,              // invalid character, misplaced ':' or ','
        NotAnObject,         // document does not start with '{'
        NonStringKey,        // object key is not a string
        UnexpectedDelimiter, // closing delimiter where a value belongs
        UnexpectedEnd,       // input ends inside the document
        TrailingData,        // tokens after the top-level object
        InvalidNumber,       // numeral that fits no 64-bit type
        TooDeep              // nesting beyond kMaxNestingDepth
    };

    DecodeError(Kind kind, const std::string& msg, size_t line, size_t column);

    Kind kind() const noexcept { return kind_; }
    size_t line() const noexcept { return line_; }
    size_t column() const noexcept { return column_; }

  private:
    Kind kind_;
    size_t line_;
    size_t column_;
};

// Decode one JSON object into `out`, keeping the document's key order.
// Keys already in `out` stay; decoded keys are set() on top of them.
// Throws DecodeError.
void parse_json(const std::string& text, Dict& out);
DictPtr parse_json(const std::string& text);

// Order-preserving encoding. Always yields a valid document; values that
// cannot be represented are written as null.
std::string dump_json(const Dict& dict);
// Indented variant; indent <= 0 gives the compact form.
std::string dump_json(const Dict& dict, int indent);

// JSON text of a single value with the same rules.
std::string dump_json(const Value& value);

// Quote and escape `s` as a JSON string literal.
std::string quote_json(const std::string& s);

namespace json_literals {
    inline DictPtr operator"" _json(const char* s, std::size_t len) {
        return parse_json(std::string(s, len));
    }
}

} // namespace od
