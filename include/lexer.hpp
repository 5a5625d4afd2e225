#pragma once

#include <memory>
#include <string>
#include <vector>

#include "SoorjError.hpp"
#include "SourceManager.hpp"
#include "token.hpp"

class Lexer {
   public:
    Lexer(const std::string& source, const std::string& filename = "");
    std::vector<Token> tokenize();

   private:
    const std::string src;
    const std::string filename;
    std::shared_ptr<const SourceManager> src_mgr;
    size_t i = 0;
    int line = 1;
    int col = 1;

    // parentheses level (suppress NEWLINE inside parentheses)
    int paren_level = 0;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();

    // decode the code point starting at src[i + offset]; width receives its byte length
    char32_t peek_code_point(size_t offset, size_t& width) const;
    std::string advance_code_point();

    // Add token: optional explicit length (if -1, length is value.size()).
    void add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length = -1);

    SoorjError lex_error(const std::string& message, int tok_line, int tok_col) const;

    void scan_token(std::vector<Token>& out);
    void scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index);
    void scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col);

    // scan quoted (single/double) string (handles escapes)
    void scan_quoted_string(std::vector<Token>& out, int tok_line, int tok_col, char quote);

    void skip_line_comment();
    void handle_newline(std::vector<Token>& out);
};

bool is_identifier_start(char32_t cp);
bool is_identifier_part(char32_t cp);
