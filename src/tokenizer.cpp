#include "tokenizer.h"

namespace kisexpr {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

static bool is_delimiter(char c) {
    return is_space(c) || c == '(' || c == ')' || c == '"';
}

const char* token_type_name(TokenType type) {
    switch (type) {
        case TokenType::OpenParen:  return "'('";
        case TokenType::CloseParen: return "')'";
        case TokenType::Symbol:     return "symbol";
        case TokenType::String:     return "string";
        case TokenType::Eof:        return "end of input";
    }
    return "token";
}

Tokenizer::Tokenizer(std::string_view text, std::vector<Diagnostic>& diagnostics)
    : text_(text), diagnostics_(diagnostics) {
    if (text_.size() >= 3 && text_.substr(0, 3) == "\xEF\xBB\xBF") {
        pos_ = 3;
        diagnostics_.push_back({Severity::Info, "skipped UTF-8 byte order mark", here()});
    }
}

Location Tokenizer::here() const {
    Location loc;
    loc.line = line_;
    loc.column = column_;
    loc.offset = pos_;
    return loc;
}

void Tokenizer::advance() {
    if (text_[pos_] == '\n') {
        line_++;
        column_ = 1;
    } else {
        column_++;
    }
    pos_++;
}

void Tokenizer::error(const std::string& msg, const Location& loc) {
    diagnostics_.push_back({Severity::Error, msg, loc});
}

void Tokenizer::skip_whitespace(Token& tok) {
    size_t line_start = std::string_view::npos;
    while (pos_ < text_.size() && is_space(text_[pos_])) {
        if (text_[pos_] == '\n') {
            tok.break_before = true;
            tok.newlines++;
            line_start = pos_ + 1;
        }
        advance();
    }
    if (line_start != std::string_view::npos) {
        tok.indent = std::string(text_.substr(line_start, pos_ - line_start));
    }
}

Token Tokenizer::next() {
    for (;;) {
        Token tok;
        skip_whitespace(tok);
        tok.location = here();

        if (pos_ >= text_.size()) {
            tok.type = TokenType::Eof;
            return tok;
        }

        char c = text_[pos_];
        if (c == '(') {
            advance();
            depth_++;
            tok.type = TokenType::OpenParen;
            return tok;
        }
        if (c == ')') {
            advance();
            if (depth_ == 0) {
                error("unexpected ')' with no open list", tok.location);
                continue;
            }
            depth_--;
            tok.type = TokenType::CloseParen;
            return tok;
        }
        if (c == '"') {
            read_string(tok);
            return tok;
        }
        read_symbol(tok);
        return tok;
    }
}

void Tokenizer::read_string(Token& tok) {
    tok.type = TokenType::String;
    advance(); // opening quote
    size_t raw_start = pos_;

    while (pos_ < text_.size()) {
        char c = text_[pos_];
        if (c == '"') {
            tok.raw = std::string(text_.substr(raw_start, pos_ - raw_start));
            advance();
            return;
        }
        if (c == '\\' && pos_ + 1 < text_.size()) {
            advance();
            char e = text_[pos_];
            switch (e) {
                case '"':  tok.text += '"'; break;
                case '\\': tok.text += '\\'; break;
                case 'n':  tok.text += '\n'; break;
                case 'r':  tok.text += '\r'; break;
                case 't':  tok.text += '\t'; break;
                default:
                    // Unknown escapes are kept as written
                    tok.text += '\\';
                    tok.text += e;
                    break;
            }
            advance();
            continue;
        }
        tok.text += c;
        advance();
    }

    error("unterminated string", tok.location);
    tok.raw = std::string(text_.substr(raw_start));
}

void Tokenizer::read_symbol(Token& tok) {
    tok.type = TokenType::Symbol;
    size_t start = pos_;
    while (pos_ < text_.size() && !is_delimiter(text_[pos_])) {
        advance();
    }
    tok.text = std::string(text_.substr(start, pos_ - start));
}

} // namespace kisexpr
