#include "lexer.hpp"

#include <cctype>
#include <sstream>
#include <unordered_map>

static const char32_t INVALID_CODE_POINT = 0xFFFFFFFF;

// Armenian letters (capital, modifier, small incl. the 'և' ligature) and the
// Armenian presentation-form ligatures. Punctuation in the block is excluded.
static bool is_armenian_letter(char32_t cp) {
    return (cp >= 0x0531 && cp <= 0x0556) ||
        cp == 0x0559 ||
        (cp >= 0x0560 && cp <= 0x0588) ||
        (cp >= 0xFB13 && cp <= 0xFB17);
}

bool is_identifier_start(char32_t cp) {
    if (cp < 0x80) {
        return std::isalpha(static_cast<unsigned char>(cp)) || cp == '_';
    }
    return is_armenian_letter(cp);
}

bool is_identifier_part(char32_t cp) {
    if (cp < 0x80 && std::isdigit(static_cast<unsigned char>(cp))) return true;
    return is_identifier_start(cp);
}

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename)
    : src(source),
      filename(filename.empty() ? "<repl>" : filename),
      src_mgr(std::make_shared<SourceManager>(filename.empty() ? "<repl>" : filename, source)),
      i(0),
      line(1),
      col(1) {
}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
        // continuation bytes do not start a new column
        col++;
    }
    return c;
}

char32_t Lexer::peek_code_point(size_t offset, size_t& width) const {
    size_t idx = i + offset;
    width = 1;
    if (idx >= src.size()) return 0;

    unsigned char lead = static_cast<unsigned char>(src[idx]);
    if (lead < 0x80) return lead;

    char32_t cp;
    size_t extra;
    if ((lead & 0xE0) == 0xC0) {
        cp = lead & 0x1F;
        extra = 1;
    } else if ((lead & 0xF0) == 0xE0) {
        cp = lead & 0x0F;
        extra = 2;
    } else if ((lead & 0xF8) == 0xF0) {
        cp = lead & 0x07;
        extra = 3;
    } else {
        return INVALID_CODE_POINT;
    }

    if (idx + extra >= src.size()) return INVALID_CODE_POINT;
    for (size_t k = 1; k <= extra; ++k) {
        unsigned char b = static_cast<unsigned char>(src[idx + k]);
        if ((b & 0xC0) != 0x80) return INVALID_CODE_POINT;
        cp = (cp << 6) | (b & 0x3F);
    }
    width = extra + 1;
    return cp;
}

std::string Lexer::advance_code_point() {
    size_t width = 1;
    peek_code_point(0, width);
    std::string out;
    for (size_t k = 0; k < width && !eof(); ++k) out.push_back(advance());
    return out;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename, tok_line, tok_col, len, src_mgr);
    Token t{type, value, loc};
    out.push_back(std::move(t));
}

SoorjError Lexer::lex_error(const std::string& message, int tok_line, int tok_col) const {
    return SoorjError(ErrorKind::LexError, message, TokenLocation(filename, tok_line, tok_col, 1, src_mgr));
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

void Lexer::handle_newline(std::vector<Token>& out) {
    int newline_line = line;
    int newline_col = col;
    advance();

    // line breaks inside (...) never end a statement
    if (paren_level > 0) return;

    // --- CONTINUATION CHECK ---
    // a trailing binary operator, '=' or ',' means the expression goes on
    if (!out.empty()) {
        switch (out.back().type) {
            case TokenType::ASSIGN:
            case TokenType::PLUS:
            case TokenType::MINUS:
            case TokenType::STAR:
            case TokenType::SLASH:
            case TokenType::PERCENT:
            case TokenType::COMMA:
            case TokenType::AND:
            case TokenType::OR:
            case TokenType::NOT:
            case TokenType::EQUALITY:
            case TokenType::NOTEQUAL:
            case TokenType::LESSTHAN:
            case TokenType::LESSOREQUALTHAN:
            case TokenType::GREATERTHAN:
            case TokenType::GREATEROREQUALTHAN:
            case TokenType::NEWLINE:
                return;
            default:
                break;
        }
    } else {
        return;
    }

    add_token(out, TokenType::NEWLINE, "", newline_line, newline_col, 1);
}

// digits, optionally one '.' followed by more digits
void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string val;
    bool seen_dot = false;

    while (!eof()) {
        char c = peek();

        if (std::isdigit((unsigned char)c)) {
            val.push_back(advance());
        }
        // decimal point (only one allowed, and must be followed by a digit)
        else if (c == '.' && !seen_dot && std::isdigit((unsigned char)peek_next())) {
            seen_dot = true;
            val.push_back(advance());
        } else {
            break;
        }
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, TokenType::NUMBER, val, tok_line, tok_col, tok_length);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col) {
    std::string id;
    while (!eof()) {
        size_t width = 1;
        char32_t cp = peek_code_point(0, width);
        if (cp == INVALID_CODE_POINT || !is_identifier_part(cp)) break;
        id += advance_code_point();
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        // control-flow keywords
        {"եթե", TokenType::YETE},       // if
        {"հպ", TokenType::HP},          // else
        {"մինչև", TokenType::MINCHEV},  // while

        // functions
        {"գործ", TokenType::GORTS},  // function
        {"տուր", TokenType::TUR},    // return

        // keyword literals
        {"այո", TokenType::BOOLEAN},
        {"ոչ", TokenType::BOOLEAN},
        {"հեչ", TokenType::NULL_LITERAL},

        // logical
        {"և", TokenType::AND},
        {"կամ", TokenType::OR},
        {"չի", TokenType::NOT},
    };

    auto it = keywords.find(id);
    int tok_length = col - tok_col;
    if (it != keywords.end()) {
        add_token(out, it->second, id, tok_line, tok_col, tok_length);
    } else {
        add_token(out, TokenType::IDENTIFIER, id, tok_line, tok_col, tok_length);
    }
}

// scan quoted string with basic escapes; supports single and double quotes
void Lexer::scan_quoted_string(std::vector<Token>& out, int tok_line, int tok_col, char quote) {
    // skip opening quote
    advance();
    std::string val;

    while (true) {
        if (eof()) {
            throw lex_error("Unterminated string literal", tok_line, tok_col);
        }

        char c = peek();
        if (c == quote) {
            advance();
            break;
        }

        if (c == '\\') {
            advance();  // consume backslash
            if (eof()) {
                throw lex_error("Unterminated string literal", tok_line, tok_col);
            }
            char nxt = peek();
            if (nxt == 'n') {
                val.push_back('\n');
                advance();
            } else if (nxt == 't') {
                val.push_back('\t');
                advance();
            } else if (nxt == 'r') {
                val.push_back('\r');
                advance();
            } else {
                // \\ \" \' and any other escaped character stand for themselves
                val += advance_code_point();
            }
            continue;
        }

        val.push_back(advance());
    }

    int tok_length = line == tok_line ? col - tok_col : 1;
    add_token(out, TokenType::STRING, val, tok_line, tok_col, tok_length);
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    // whitespace except newline
    if (c == ' ' || c == '\t' || c == '\r') {
        advance();
        return;
    }

    if (c == '\n') {
        handle_newline(out);
        return;
    }

    // comments: '#' to end of line
    if (c == '#') {
        skip_line_comment();
        return;
    }

    int tok_line = line;
    int tok_col = col;

    // two-character operators
    if (peek_next() == '=') {
        switch (c) {
            case '=':
                add_token(out, TokenType::EQUALITY, "==", tok_line, tok_col, 2);
                advance();
                advance();
                return;
            case '!':
                add_token(out, TokenType::NOTEQUAL, "!=", tok_line, tok_col, 2);
                advance();
                advance();
                return;
            case '<':
                add_token(out, TokenType::LESSOREQUALTHAN, "<=", tok_line, tok_col, 2);
                advance();
                advance();
                return;
            case '>':
                add_token(out, TokenType::GREATEROREQUALTHAN, ">=", tok_line, tok_col, 2);
                advance();
                advance();
                return;
            default:
                break;
        }
    }

    switch (c) {
        case '(':
            paren_level++;
            add_token(out, TokenType::OPENPARENTHESIS, "(", tok_line, tok_col, 1);
            advance();
            return;
        case ')':
            if (paren_level > 0) paren_level--;
            add_token(out, TokenType::CLOSEPARENTHESIS, ")", tok_line, tok_col, 1);
            advance();
            return;
        case '{':
            add_token(out, TokenType::OPENBRACE, "{", tok_line, tok_col, 1);
            advance();
            return;
        case '}':
            add_token(out, TokenType::CLOSEBRACE, "}", tok_line, tok_col, 1);
            advance();
            return;
        case ',':
            add_token(out, TokenType::COMMA, ",", tok_line, tok_col, 1);
            advance();
            return;
        case ';':
            add_token(out, TokenType::SEMICOLON, ";", tok_line, tok_col, 1);
            advance();
            return;
        case '=':
            add_token(out, TokenType::ASSIGN, "=", tok_line, tok_col, 1);
            advance();
            return;
        case '+':
            add_token(out, TokenType::PLUS, "+", tok_line, tok_col, 1);
            advance();
            return;
        case '-':
            add_token(out, TokenType::MINUS, "-", tok_line, tok_col, 1);
            advance();
            return;
        case '*':
            add_token(out, TokenType::STAR, "*", tok_line, tok_col, 1);
            advance();
            return;
        case '/':
            add_token(out, TokenType::SLASH, "/", tok_line, tok_col, 1);
            advance();
            return;
        case '%':
            add_token(out, TokenType::PERCENT, "%", tok_line, tok_col, 1);
            advance();
            return;
        case '>':
            add_token(out, TokenType::GREATERTHAN, ">", tok_line, tok_col, 1);
            advance();
            return;
        case '<':
            add_token(out, TokenType::LESSTHAN, "<", tok_line, tok_col, 1);
            advance();
            return;
        case '"':
            scan_quoted_string(out, tok_line, tok_col, '"');
            return;
        case '\'':
            scan_quoted_string(out, tok_line, tok_col, '\'');
            return;
        default:
            break;
    }

    if (std::isdigit((unsigned char)c)) {
        scan_number(out, tok_line, tok_col, i);
        return;
    }

    size_t width = 1;
    char32_t cp = peek_code_point(0, width);
    if (cp == INVALID_CODE_POINT) {
        throw lex_error("Malformed UTF-8 byte sequence in source", tok_line, tok_col);
    }

    // identifier or keyword
    if (is_identifier_start(cp)) {
        scan_identifier_or_keyword(out, tok_line, tok_col);
        return;
    }

    // unknown char
    std::string s = src.substr(i, width);
    throw lex_error("Unrecognized character '" + s + "'", tok_line, tok_col);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;

    // skip UTF-8 BOM if present
    if (src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        i = 3;
    }

    while (!eof()) scan_token(out);

    // final EOF token
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);

    return out;
}
