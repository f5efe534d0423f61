#pragma once

#include <od/json.h>

#include <cstddef>
#include <string>
#include <vector>

namespace od {

// Streaming JSON tokenizer. Separators (':' and ',') are checked and
// consumed internally; callers only see value and delimiter tokens.
class JsonReader {
  public:
    struct Token {
        enum Type { BeginObject, EndObject, BeginArray, EndArray, String, Number, Bool, Null, End };

        Type type = End;
        // Decoded text for String, raw numeral for Number.
        std::string text;
        bool boolean = false;
        size_t line = 1;
        size_t column = 1;

        bool isDelim() const noexcept { return type <= EndArray; }
    };

    explicit JsonReader(const std::string& text) : s(text) {}

    // True when another element follows in the current object or array.
    bool more();
    // Next token; Token::End once the input is exhausted. Throws DecodeError.
    Token next();

    size_t line() const noexcept { return line_; }
    size_t column() const noexcept { return col_; }

    [[noreturn]] void fail(DecodeError::Kind kind, const std::string& base) const;

  private:
    enum class State { ObjectKeyOrEnd, ObjectKey, ObjectColon, ObjectValue, ObjectCommaOrEnd,
                       ArrayValueOrEnd, ArrayValue, ArrayCommaOrEnd };

    struct Frame {
        char opener;
        State state;
        size_t line, col;
    };

    char peek() const { return i < s.size() ? s[i] : '\0'; }
    char get();
    void skip_ws();

    Token begin_token() const;
    Token read_value();
    Token read_key();
    Token close(char closer);
    void after_value();

    std::string read_string();
    std::string read_number();
    void expect_literal(const char* word);

    std::string format_error(const std::string& base) const;

    const std::string& s;
    size_t i = 0;
    size_t line_ = 1;
    size_t col_ = 1;
    std::vector<Frame> stack_;
};

} // namespace od
