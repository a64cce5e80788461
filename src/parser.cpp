#include "parser.h"
#include "tokenizer.h"
#include "utils.h"

namespace kisexpr {

namespace {

// A list that has been opened but not yet closed
struct Frame {
    std::string tag;
    bool awaiting_tag = true;
    bool break_before = false;
    int blank_lines = 0;
    std::vector<Node> children;
    Location start;
};

int blank_lines(const Token& tok) {
    return tok.newlines > 1 ? tok.newlines - 1 : 0;
}

Node make_atom(const Token& tok) {
    Node n;
    if (tok.type == TokenType::String) {
        n = Node::string(tok.text, tok.raw);
    } else if (auto num = parse_number(tok.text)) {
        n = Node::number(*num, tok.text);
    } else {
        n = Node::symbol(tok.text);
    }
    Layout layout;
    layout.break_before = tok.break_before;
    layout.blank_lines_before = blank_lines(tok);
    return n.with_layout(layout);
}

Node close_frame(Frame& f, std::optional<bool> break_before_close, int blank_lines_before_close) {
    Layout layout;
    layout.break_before = f.break_before;
    layout.blank_lines_before = f.blank_lines;
    layout.break_before_close = break_before_close;
    layout.blank_lines_before_close = blank_lines_before_close;
    return Node::list(std::move(f.tag), std::move(f.children)).with_layout(layout);
}

std::string describe(const Token& tok) {
    if (tok.type == TokenType::Symbol) return "symbol '" + tok.text + "'";
    return token_type_name(tok.type);
}

} // namespace

Parser::Parser(const ParserOptions& opts)
    : opts_(opts) {}

ParseResult Parser::parse(std::string_view text) const {
    ParseResult result;
    auto& diags = result.diagnostics;
    auto& style = result.style;

    if (text.find("\r\n") != std::string_view::npos) {
        style.newline = "\r\n";
    }

    Tokenizer tokenizer(text, diags);
    Token tok = tokenizer.next();

    // Find the root list
    bool reported = false;
    while (tok.type != TokenType::OpenParen && tok.type != TokenType::Eof) {
        if (!reported) {
            diags.push_back({Severity::Error,
                             "expected '(' at start of document, found " + describe(tok),
                             tok.location});
            reported = true;
        }
        tok = tokenizer.next();
    }
    if (tok.type == TokenType::Eof) {
        if (!reported) {
            diags.push_back({Severity::Error, "empty document: no root list", tok.location});
        }
        return result;
    }

    std::vector<Frame> stack;
    stack.emplace_back();
    stack.back().start = tok.location;

    // Records the indent unit from the first line break directly inside the root
    auto note_indent = [&](const Token& t) {
        if (stack.size() == 1 && !style.indent_detected && t.break_before && !t.indent.empty()) {
            style.indent = t.indent;
            style.indent_detected = true;
        }
    };

    auto untagged = [&](Frame& f) {
        diags.push_back({Severity::Warning, "list has no tag", f.start});
        f.awaiting_tag = false;
    };

    int skip_depth = 0;
    bool root_closed = false;

    while (!stack.empty()) {
        tok = tokenizer.next();

        if (skip_depth > 0 && tok.type != TokenType::Eof) {
            if (tok.type == TokenType::OpenParen) skip_depth++;
            else if (tok.type == TokenType::CloseParen) skip_depth--;
            continue;
        }

        switch (tok.type) {
            case TokenType::OpenParen: {
                if (stack.back().awaiting_tag) untagged(stack.back());
                if (static_cast<int>(stack.size()) >= opts_.max_depth) {
                    diags.push_back({Severity::Error,
                                     "list nested deeper than " + std::to_string(opts_.max_depth) +
                                     " levels was skipped",
                                     tok.location});
                    skip_depth = 1;
                    break;
                }
                note_indent(tok);
                Frame f;
                f.break_before = tok.break_before;
                f.blank_lines = blank_lines(tok);
                f.start = tok.location;
                stack.push_back(std::move(f));
                break;
            }

            case TokenType::CloseParen: {
                if (stack.back().awaiting_tag) {
                    diags.push_back({Severity::Warning, "empty list", stack.back().start});
                }
                Node node = close_frame(stack.back(), tok.break_before, blank_lines(tok));
                stack.pop_back();
                if (stack.empty()) {
                    result.root = std::move(node);
                    root_closed = true;
                } else {
                    stack.back().children.push_back(std::move(node));
                }
                break;
            }

            case TokenType::Symbol: {
                Frame& f = stack.back();
                if (f.awaiting_tag) {
                    f.tag = tok.text;
                    f.awaiting_tag = false;
                    break;
                }
                note_indent(tok);
                f.children.push_back(make_atom(tok));
                break;
            }

            case TokenType::String: {
                Frame& f = stack.back();
                if (f.awaiting_tag) untagged(f);
                note_indent(tok);
                f.children.push_back(make_atom(tok));
                break;
            }

            case TokenType::Eof: {
                diags.push_back({Severity::Error,
                                 "unexpected end of input: " + std::to_string(stack.size()) +
                                 " unclosed list(s)",
                                 tok.location});
                // Close everything that is still open, keeping what was read
                while (!stack.empty()) {
                    Node node = close_frame(stack.back(), std::nullopt, 0);
                    stack.pop_back();
                    if (stack.empty()) {
                        result.root = std::move(node);
                    } else {
                        stack.back().children.push_back(std::move(node));
                    }
                }
                break;
            }
        }
    }

    if (root_closed) {
        tok = tokenizer.next();
        if (tok.type != TokenType::Eof) {
            diags.push_back({Severity::Error,
                             "unexpected content after root list: " + describe(tok),
                             tok.location});
            while (tok.type != TokenType::Eof) {
                tok = tokenizer.next();
            }
        }
    }

    return result;
}

ParseResult parse(std::string_view text) {
    return Parser().parse(text);
}

} // namespace kisexpr
