#include <gtest/gtest.h>

#include "SoorjError.hpp"
#include "lexer.hpp"
#include "token.hpp"

// Helper to get token types from source
static std::vector<TokenType> getTokenTypes(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    std::vector<TokenType> types;
    for (const auto& tok : tokens) {
        types.push_back(tok.type);
    }
    return types;
}

static ErrorKind lexErrorKind(const std::string& source) {
    try {
        Lexer lexer(source, "<test>");
        lexer.tokenize();
    } catch (const SoorjError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a lexing error for: " << source;
    return ErrorKind::ValueError;
}

// Basic tokenization
TEST(LexerTest, TokenizesNumbers) {
    Lexer lexer("123", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::NUMBER);
    EXPECT_EQ(tokens[0].value, "123");
    EXPECT_EQ(tokens[1].type, TokenType::EOF_TOKEN);
}

TEST(LexerTest, TokenizesFloats) {
    Lexer lexer("3.14", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_GE(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, TokenType::NUMBER);
    EXPECT_EQ(tokens[0].value, "3.14");
}

TEST(LexerTest, DotWithoutDigitsIsNotPartOfNumber) {
    EXPECT_EQ(lexErrorKind("3."), ErrorKind::LexError);
}

TEST(LexerTest, TokenizesArmenianIdentifiers) {
    Lexer lexer("գումար ա1_բ _x name", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[0].value, "գումար");
    EXPECT_EQ(tokens[1].value, "ա1_բ");
    EXPECT_EQ(tokens[2].value, "_x");
    EXPECT_EQ(tokens[3].value, "name");
}

// Keywords
TEST(LexerTest, TokenizesKeywords) {
    auto types = getTokenTypes("եթե հպ մինչև գործ տուր հեչ և կամ չի");
    std::vector<TokenType> expected = {
        TokenType::YETE, TokenType::HP, TokenType::MINCHEV, TokenType::GORTS, TokenType::TUR,
        TokenType::NULL_LITERAL, TokenType::AND, TokenType::OR, TokenType::NOT, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, KeywordPrefixIsStillAnIdentifier) {
    Lexer lexer("եթեա տուրք", "<test>");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].type, TokenType::IDENTIFIER);
    EXPECT_EQ(tokens[0].value, "եթեա");
    EXPECT_EQ(tokens[1].type, TokenType::IDENTIFIER);
}

TEST(LexerTest, TokenizesBooleans) {
    Lexer lexer("այո ոչ", "<test>");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].type, TokenType::BOOLEAN);
    EXPECT_EQ(tokens[0].value, "այո");
    EXPECT_EQ(tokens[1].type, TokenType::BOOLEAN);
    EXPECT_EQ(tokens[1].value, "ոչ");
}

// Operators
TEST(LexerTest, TokenizesOperators) {
    auto types = getTokenTypes("+ - * / % = == != < > <= >=");
    std::vector<TokenType> expected = {
        TokenType::PLUS, TokenType::MINUS, TokenType::STAR, TokenType::SLASH, TokenType::PERCENT,
        TokenType::ASSIGN, TokenType::EQUALITY, TokenType::NOTEQUAL, TokenType::LESSTHAN,
        TokenType::GREATERTHAN, TokenType::LESSOREQUALTHAN, TokenType::GREATEROREQUALTHAN,
        TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, TokenizesPunctuation) {
    auto types = getTokenTypes("( ) { } , ;");
    std::vector<TokenType> expected = {
        TokenType::OPENPARENTHESIS, TokenType::CLOSEPARENTHESIS, TokenType::OPENBRACE,
        TokenType::CLOSEBRACE, TokenType::COMMA, TokenType::SEMICOLON, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

// Strings
TEST(LexerTest, TokenizesStringsWithEitherQuote) {
    Lexer lexer("\"Բարեւ\" 'աշխարհ'", "<test>");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].value, "Բարեւ");
    EXPECT_EQ(tokens[1].type, TokenType::STRING);
    EXPECT_EQ(tokens[1].value, "աշխարհ");
}

TEST(LexerTest, DecodesEscapes) {
    Lexer lexer(R"("a\nb\tc\\d\"e\'f\qg")", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].value, "a\nb\tc\\d\"e'fqg");
}

TEST(LexerTest, StringsMaySpanLines) {
    Lexer lexer("\"one\ntwo\"", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens[0].type, TokenType::STRING);
    EXPECT_EQ(tokens[0].value, "one\ntwo");
}

TEST(LexerTest, UnterminatedStringIsALexError) {
    EXPECT_EQ(lexErrorKind("\"abc"), ErrorKind::LexError);
    EXPECT_EQ(lexErrorKind("'abc\\"), ErrorKind::LexError);
}

TEST(LexerTest, UnknownCharacterIsALexError) {
    EXPECT_EQ(lexErrorKind("ա = @"), ErrorKind::LexError);
    EXPECT_EQ(lexErrorKind("!ա"), ErrorKind::LexError);
    EXPECT_EQ(lexErrorKind("ա։"), ErrorKind::LexError);  // Armenian full stop is punctuation
}

TEST(LexerTest, MalformedUtf8IsALexError) {
    EXPECT_EQ(lexErrorKind("ա = \xC0"), ErrorKind::LexError);
}

TEST(LexerTest, LexErrorCarriesLocation) {
    try {
        Lexer lexer("ա = 1\nբ = $", "prog.srj");
        lexer.tokenize();
        FAIL() << "expected LexError";
    } catch (const SoorjError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::LexError);
        EXPECT_EQ(e.location().filename, "prog.srj");
        EXPECT_EQ(e.location().line, 2);
        EXPECT_EQ(e.location().col, 5);
        std::string what = e.what();
        EXPECT_NE(what.find("LexError at prog.srj:2:5"), std::string::npos);
        EXPECT_NE(what.find("բ = $"), std::string::npos);
    }
}

// Layout
TEST(LexerTest, NewlinesSeparateStatements) {
    auto types = getTokenTypes("ա = 10\nբ = 20");
    std::vector<TokenType> expected = {
        TokenType::IDENTIFIER, TokenType::ASSIGN, TokenType::NUMBER, TokenType::NEWLINE,
        TokenType::IDENTIFIER, TokenType::ASSIGN, TokenType::NUMBER, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, BlankLinesAndCommentsCollapse) {
    auto types = getTokenTypes("\n\n# header\nա\n\n# middle\n\nբ # trailing\n");
    std::vector<TokenType> expected = {
        TokenType::IDENTIFIER, TokenType::NEWLINE, TokenType::IDENTIFIER, TokenType::NEWLINE,
        TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, NewlinesInsideParenthesesAreSkipped) {
    auto types = getTokenTypes("գրէ(1,\n2\n)");
    std::vector<TokenType> expected = {
        TokenType::IDENTIFIER, TokenType::OPENPARENTHESIS, TokenType::NUMBER, TokenType::COMMA,
        TokenType::NUMBER, TokenType::CLOSEPARENTHESIS, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, TrailingOperatorContinuesTheLine) {
    auto types = getTokenTypes("ա = 1 +\n2");
    std::vector<TokenType> expected = {
        TokenType::IDENTIFIER, TokenType::ASSIGN, TokenType::NUMBER, TokenType::PLUS,
        TokenType::NUMBER, TokenType::EOF_TOKEN};
    EXPECT_EQ(types, expected);
}

TEST(LexerTest, ColumnsCountCodePoints) {
    Lexer lexer("աբգ = 10", "<test>");
    auto tokens = lexer.tokenize();

    EXPECT_EQ(tokens[0].loc.col, 1);
    EXPECT_EQ(tokens[0].loc.length, 3);
    EXPECT_EQ(tokens[1].loc.col, 5);
    EXPECT_EQ(tokens[2].loc.col, 7);
}

TEST(LexerTest, SkipsByteOrderMarkAndCarriageReturns) {
    Lexer lexer("\xEF\xBB\xBFա = 1\r\nբ = 2\r\n", "<test>");
    auto tokens = lexer.tokenize();

    ASSERT_EQ(tokens.size(), 9u);
    EXPECT_EQ(tokens[0].value, "ա");
    EXPECT_EQ(tokens[0].loc.col, 1);
    EXPECT_EQ(tokens[3].type, TokenType::NEWLINE);
    EXPECT_EQ(tokens[4].loc.line, 2);
}
