#pragma once

#include "diagnostic.h"
#include <string>
#include <string_view>
#include <vector>

namespace kisexpr {

enum class TokenType {
    OpenParen,
    CloseParen,
    Symbol,
    String,
    Eof
};

struct Token {
    TokenType type = TokenType::Eof;
    std::string text;          // symbol text or decoded string value
    std::string raw;           // string source text between the quotes
    bool break_before = false; // whitespace before the token held a newline
    int newlines = 0;          // number of newlines in that whitespace
    std::string indent;        // whitespace after that newline
    Location location;
};

const char* token_type_name(TokenType type);

// Splits S-expression text into tokens, one per call to next().
//
// The tokenizer does no classification: numbers and yes/no are plain
// Symbol tokens. Lexical problems (unterminated strings, stray close
// parens) are reported to the diagnostics sink and recovered from.
// The input must outlive the tokenizer.
class Tokenizer {
public:
    Tokenizer(std::string_view text, std::vector<Diagnostic>& diagnostics);

    // Next token; returns Eof forever once the input is exhausted
    Token next();

    // Current paren nesting depth
    int depth() const { return depth_; }

private:
    std::string_view text_;
    std::vector<Diagnostic>& diagnostics_;
    size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
    int depth_ = 0;

    Location here() const;
    void advance();
    void skip_whitespace(Token& tok);
    void read_string(Token& tok);
    void read_symbol(Token& tok);
    void error(const std::string& msg, const Location& loc);
};

} // namespace kisexpr
