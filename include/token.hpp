#pragma once

#include <memory>
#include <string>
#include <utility>

#include "SourceManager.hpp"

// Token types (keep in sync with the parser/lexer)
enum class TokenType {
    // -----------------------
    // Declaration / statements
    // -----------------------
    GORTS,  // 'գործ' (function)
    TUR,    // 'տուր' (return)

    // -----------------------
    // Control-flow
    // -----------------------
    YETE,     // 'եթե' (if)
    HP,       // 'հպ' (else)
    MINCHEV,  // 'մինչև' (while)

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    NUMBER,
    STRING,
    BOOLEAN,       // 'այո' / 'ոչ'
    NULL_LITERAL,  // 'հեչ'

    // -----------------------
    // Punctuation
    // -----------------------
    SEMICOLON,
    COMMA,
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,

    // -----------------------
    // Assignment / file end
    // -----------------------
    ASSIGN,
    EOF_TOKEN,

    // -----------------------
    // Arithmetic
    // -----------------------
    PLUS,
    MINUS,
    STAR,
    SLASH,
    PERCENT,

    // -----------------------
    // Logical
    // -----------------------
    AND,  // 'և'
    OR,   // 'կամ'
    NOT,  // 'չի'

    // -----------------------
    // Comparison
    // -----------------------
    GREATERTHAN,
    GREATEROREQUALTHAN,
    LESSTHAN,
    LESSOREQUALTHAN,
    EQUALITY,
    NOTEQUAL,

    // -----------------------
    // Layout
    // -----------------------
    NEWLINE
};

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<repl>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start, in code points
    int length = 0;        // token length in code points

    std::shared_ptr<const SourceManager> src_mgr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, std::shared_ptr<const SourceManager> mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(std::move(mgr)) {}

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location
struct Token {
    TokenType type = TokenType::EOF_TOKEN;
    std::string value;  // raw text / normalized lexeme
    TokenLocation loc;  // file:line:col and length/span

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col, length);
}
