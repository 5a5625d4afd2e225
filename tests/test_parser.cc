#include <gtest/gtest.h>

#include <sstream>

#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"

static std::unique_ptr<ProgramNode> parseSource(const std::string& source) {
    Lexer lexer(source, "<test>");
    auto tokens = lexer.tokenize();
    Parser parser(tokens);
    return parser.parse();
}

// Message of the ParseError raised for source, empty when it parses.
static std::string parseErrorMessage(const std::string& source) {
    try {
        parseSource(source);
    } catch (const SoorjError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseError) << e.what();
        return e.message();
    }
    return "";
}

// Expression of the single expression statement in source
static ExpressionNode* onlyExpression(const ProgramNode& program) {
    EXPECT_EQ(program.body.size(), 1u);
    auto* stmt = dynamic_cast<ExpressionStatementNode*>(program.body[0].get());
    EXPECT_NE(stmt, nullptr);
    return stmt ? stmt->expression.get() : nullptr;
}

// ============================================================================
// PRECEDENCE
// ============================================================================

TEST(ParserTest, MultiplicationBindsTighterThanAddition) {
    auto program = parseSource("ա = 1 + 2 * 3");
    ASSERT_EQ(program->body.size(), 1u);

    auto* assign = dynamic_cast<AssignmentNode*>(program->body[0].get());
    ASSERT_NE(assign, nullptr);
    EXPECT_EQ(assign->name, "ա");

    auto* add = dynamic_cast<BinaryExpressionNode*>(assign->value.get());
    ASSERT_NE(add, nullptr);
    EXPECT_EQ(add->op, "+");
    auto* mul = dynamic_cast<BinaryExpressionNode*>(add->right.get());
    ASSERT_NE(mul, nullptr);
    EXPECT_EQ(mul->op, "*");
}

TEST(ParserTest, BinaryOperatorsAreLeftAssociative) {
    auto program = parseSource("1 - 2 - 3");
    EXPECT_EQ(onlyExpression(*program)->to_string(), "((1 - 2) - 3)");
}

TEST(ParserTest, ParenthesesOverridePrecedence) {
    auto program = parseSource("(1 + 2) * 3");
    EXPECT_EQ(onlyExpression(*program)->to_string(), "((1 + 2) * 3)");
}

TEST(ParserTest, UnaryBindsTighterThanBinary) {
    EXPECT_EQ(onlyExpression(*parseSource("-ա * 2"))->to_string(), "((-ա) * 2)");
    EXPECT_EQ(onlyExpression(*parseSource("չի ա == բ"))->to_string(), "((չի ա) == բ)");
}

TEST(ParserTest, ComparisonBindsTighterThanEquality) {
    EXPECT_EQ(onlyExpression(*parseSource("ա < բ == գ >= դ"))->to_string(), "((ա < բ) == (գ >= դ))");
}

TEST(ParserTest, AndBindsTighterThanOr) {
    auto program = parseSource("ա կամ բ և գ");
    auto* orNode = dynamic_cast<LogicalExpressionNode*>(onlyExpression(*program));
    ASSERT_NE(orNode, nullptr);
    EXPECT_EQ(orNode->op, TokenType::OR);

    auto* andNode = dynamic_cast<LogicalExpressionNode*>(orNode->right.get());
    ASSERT_NE(andNode, nullptr);
    EXPECT_EQ(andNode->op, TokenType::AND);
    EXPECT_EQ(orNode->to_string(), "(ա կամ (բ և գ))");
}

TEST(ParserTest, CallsChainOnTheirResult) {
    auto program = parseSource("f(1)(2, 3)");
    auto* outer = dynamic_cast<CallExpressionNode*>(onlyExpression(*program));
    ASSERT_NE(outer, nullptr);
    EXPECT_EQ(outer->arguments.size(), 2u);
    EXPECT_NE(dynamic_cast<CallExpressionNode*>(outer->callee.get()), nullptr);
}

TEST(ParserTest, ParsesLiterals) {
    auto program = parseSource("գրէ(3.5, 'բառ', այո, ոչ, հեչ)");
    auto* call = dynamic_cast<CallExpressionNode*>(onlyExpression(*program));
    ASSERT_NE(call, nullptr);
    ASSERT_EQ(call->arguments.size(), 5u);

    auto* num = dynamic_cast<NumericLiteralNode*>(call->arguments[0].get());
    ASSERT_NE(num, nullptr);
    EXPECT_DOUBLE_EQ(num->value, 3.5);
    auto* str = dynamic_cast<StringLiteralNode*>(call->arguments[1].get());
    ASSERT_NE(str, nullptr);
    EXPECT_EQ(str->value, "բառ");
    auto* yes = dynamic_cast<BooleanLiteralNode*>(call->arguments[2].get());
    ASSERT_NE(yes, nullptr);
    EXPECT_TRUE(yes->value);
    auto* no = dynamic_cast<BooleanLiteralNode*>(call->arguments[3].get());
    ASSERT_NE(no, nullptr);
    EXPECT_FALSE(no->value);
    EXPECT_NE(dynamic_cast<NullNode*>(call->arguments[4].get()), nullptr);
}

// ============================================================================
// STATEMENTS
// ============================================================================

TEST(ParserTest, SeparatorsAreNewlinesOrSemicolons) {
    auto program = parseSource("ա = 1; բ = 2\nգ = 3;");
    EXPECT_EQ(program->body.size(), 3u);
}

TEST(ParserTest, EmptyProgram) {
    EXPECT_TRUE(parseSource("")->body.empty());
    EXPECT_TRUE(parseSource("\n\n;;\n# comment only\n")->body.empty());
}

TEST(ParserTest, IfElseAcrossLines) {
    auto program = parseSource("եթե ա > 1 {\n  բ = 1\n}\nհպ {\n  բ = 2\n}\nգ = 3");
    ASSERT_EQ(program->body.size(), 2u);

    auto* ifNode = dynamic_cast<IfStatementNode*>(program->body[0].get());
    ASSERT_NE(ifNode, nullptr);
    EXPECT_TRUE(ifNode->has_else);
    EXPECT_EQ(ifNode->then_body.size(), 1u);
    EXPECT_EQ(ifNode->else_body.size(), 1u);
    EXPECT_NE(dynamic_cast<AssignmentNode*>(program->body[1].get()), nullptr);
}

TEST(ParserTest, IfWithoutElseLeavesNextStatement) {
    auto program = parseSource("եթե ա { }\n\nգ = 1");
    ASSERT_EQ(program->body.size(), 2u);

    auto* ifNode = dynamic_cast<IfStatementNode*>(program->body[0].get());
    ASSERT_NE(ifNode, nullptr);
    EXPECT_FALSE(ifNode->has_else);
    EXPECT_TRUE(ifNode->then_body.empty());
}

TEST(ParserTest, ParsesWhileLoop) {
    auto program = parseSource("մինչև ի < 3 {\n  ի = ի + 1\n}");
    ASSERT_EQ(program->body.size(), 1u);

    auto* loop = dynamic_cast<WhileStatementNode*>(program->body[0].get());
    ASSERT_NE(loop, nullptr);
    EXPECT_EQ(loop->condition->to_string(), "(ի < 3)");
    EXPECT_EQ(loop->body.size(), 1u);
}

TEST(ParserTest, ParsesFunctionDeclaration) {
    auto program = parseSource("գործ գումար(ա, բ) {\n  տուր ա + բ\n}");
    ASSERT_EQ(program->body.size(), 1u);

    auto* fn = dynamic_cast<FunctionDeclarationNode*>(program->body[0].get());
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->name, "գումար");
    ASSERT_EQ(fn->parameters.size(), 2u);
    EXPECT_EQ(fn->parameters[0]->name, "ա");
    EXPECT_EQ(fn->parameters[1]->name, "բ");
    ASSERT_EQ(fn->body.size(), 1u);

    auto* ret = dynamic_cast<ReturnStatementNode*>(fn->body[0].get());
    ASSERT_NE(ret, nullptr);
    ASSERT_NE(ret->value, nullptr);
    EXPECT_EQ(ret->value->to_string(), "(ա + բ)");
}

TEST(ParserTest, ReturnValueIsOptional) {
    auto program = parseSource("գործ f() { տուր }\nտուր\nտուր; տուր 1");
    ASSERT_EQ(program->body.size(), 4u);

    auto* fn = dynamic_cast<FunctionDeclarationNode*>(program->body[0].get());
    ASSERT_NE(fn, nullptr);
    auto* inner = dynamic_cast<ReturnStatementNode*>(fn->body[0].get());
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->value, nullptr);

    EXPECT_EQ(dynamic_cast<ReturnStatementNode*>(program->body[1].get())->value, nullptr);
    EXPECT_EQ(dynamic_cast<ReturnStatementNode*>(program->body[2].get())->value, nullptr);
    EXPECT_NE(dynamic_cast<ReturnStatementNode*>(program->body[3].get())->value, nullptr);
}

TEST(ParserTest, BareBlockIsAStatement) {
    auto program = parseSource("{ ա = 1; բ = 2 }");
    ASSERT_EQ(program->body.size(), 1u);

    auto* block = dynamic_cast<BlockStatementNode*>(program->body[0].get());
    ASSERT_NE(block, nullptr);
    EXPECT_EQ(block->body.size(), 2u);
}

TEST(ParserTest, ClonedFunctionIsIndependent) {
    auto program = parseSource("գործ f(ա) { տուր ա * 2 }");
    auto copy = program->body[0]->clone();
    program.reset();

    auto* fn = dynamic_cast<FunctionDeclarationNode*>(copy.get());
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->to_string(), "գործ f(ա) { ... }");
    EXPECT_EQ(fn->body[0]->to_string(), "տուր (ա * 2)");
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(ParserTest, TwoStatementsOnOneLine) {
    EXPECT_NE(parseErrorMessage("ա = 1 բ = 2").find("Expected newline or ';'"), std::string::npos);
}

TEST(ParserTest, KeywordIsNotAName) {
    EXPECT_NE(parseErrorMessage("գործ եթե() {}").find("Expected function name"), std::string::npos);
    EXPECT_FALSE(parseErrorMessage("տուր = 1").empty());
}

TEST(ParserTest, InvalidAssignmentTarget) {
    EXPECT_NE(parseErrorMessage("f() = 3").find("Invalid assignment target"), std::string::npos);
    EXPECT_NE(parseErrorMessage("(ա) = 3").find("Invalid assignment target"), std::string::npos);
}

TEST(ParserTest, DuplicateParameter) {
    EXPECT_NE(parseErrorMessage("գործ f(ա, ա) {}").find("Duplicate parameter"), std::string::npos);
}

TEST(ParserTest, UnterminatedBlockReportsEndOfInput) {
    std::string msg = parseErrorMessage("եթե ա {\n  բ = 1\n");
    EXPECT_NE(msg.find("Expected '}'"), std::string::npos);
    EXPECT_NE(msg.find("found end of input"), std::string::npos);
}

TEST(ParserTest, BraceMayOpenOnTheNextLine) {
    auto program = parseSource("եթե այո\n{\n  գրէ(1)\n}\nհպ\n{\n  գրէ(2)\n}\n"
                               "մինչև ոչ\n{ }\n"
                               "գործ ֆ()\n{ տուր 1 }");
    ASSERT_EQ(program->body.size(), 3u);

    auto* ifNode = dynamic_cast<IfStatementNode*>(program->body[0].get());
    ASSERT_NE(ifNode, nullptr);
    EXPECT_TRUE(ifNode->has_else);
    EXPECT_EQ(ifNode->then_body.size(), 1u);
    EXPECT_EQ(ifNode->else_body.size(), 1u);

    EXPECT_NE(dynamic_cast<WhileStatementNode*>(program->body[1].get()), nullptr);

    auto* fn = dynamic_cast<FunctionDeclarationNode*>(program->body[2].get());
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->body.size(), 1u);
}

TEST(ParserTest, ConditionMustBeFollowedByBrace) {
    EXPECT_NE(parseErrorMessage("մինչև ա բ").find("Expected '{' to begin 'մինչև' body"), std::string::npos);
    // a header alone is unfinished, not wrong
    EXPECT_NE(parseErrorMessage("եթե ա\n").find("found end of input"), std::string::npos);
}

TEST(ParserTest, MissingClosingParenthesis) {
    EXPECT_NE(parseErrorMessage("(1 + 2").find("Expected ')'"), std::string::npos);
    EXPECT_NE(parseErrorMessage("f(1, 2").find("Expected ')'"), std::string::npos);
}

TEST(ParserTest, MissingOperand) {
    EXPECT_NE(parseErrorMessage("ա = 1 +").find("Unexpected end of input"), std::string::npos);
    EXPECT_FALSE(parseErrorMessage("ա = * 2").empty());
    EXPECT_FALSE(parseErrorMessage("}").empty());
}

TEST(ParserTest, ElseWithoutIf) {
    EXPECT_FALSE(parseErrorMessage("հպ { }").empty());
}

TEST(ParserTest, DeepNestingIsAParseError) {
    const int deep = 10000;
    EXPECT_NE(parseErrorMessage(std::string(deep, '(') + "1" + std::string(deep, ')')).find("nested too deeply"),
              std::string::npos);
    EXPECT_NE(parseErrorMessage(std::string(deep, '-') + "1").find("nested too deeply"), std::string::npos);
    EXPECT_NE(parseErrorMessage(std::string(deep, '{') + std::string(deep, '}')).find("nested too deeply"),
              std::string::npos);

    std::string callChain;
    for (int i = 0; i < deep; ++i) callChain += "f(";
    EXPECT_NE(parseErrorMessage(callChain + "1" + std::string(deep, ')')).find("nested too deeply"), std::string::npos);
}

TEST(ParserTest, ModerateNestingParses) {
    const int depth = 50;
    auto program = parseSource(std::string(depth, '(') + "1" + std::string(depth, ')') + "\n" +
                               std::string(depth, '-') + "1\n" + std::string(depth, '{') + std::string(depth, '}'));
    EXPECT_EQ(program->body.size(), 3u);
}

TEST(ParserTest, ErrorCarriesTokenLocation) {
    try {
        parseSource("ա = 1\nբ = )");
        FAIL() << "expected ParseError";
    } catch (const SoorjError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ParseError);
        EXPECT_EQ(e.location().line, 2);
        EXPECT_EQ(e.location().col, 5);
    }
}

// ============================================================================
// DEBUG DUMPS
// ============================================================================

TEST(DebugDumpTest, TokensAreListedByName) {
    Lexer lexer("եթե ա { }", "<test>");
    std::ostringstream out;
    print_tokens(lexer.tokenize(), out);

    std::string dump = out.str();
    EXPECT_NE(dump.find("\"type\": \"YETE\""), std::string::npos);
    EXPECT_NE(dump.find("\"value\": \"ա\""), std::string::npos);
    EXPECT_NE(dump.find("\"type\": \"EOF_TOKEN\""), std::string::npos);
}

TEST(DebugDumpTest, ProgramShowsNestedBodies) {
    auto program = parseSource("գործ f() {\n  եթե ա { տուր 1 } հպ { տուր 2 }\n}");
    std::ostringstream out;
    print_program_debug(program.get(), out);

    std::string dump = out.str();
    EXPECT_NE(dump.find("\"type\": \"FunctionDeclaration\""), std::string::npos);
    EXPECT_NE(dump.find("\"type\": \"If\""), std::string::npos);
    EXPECT_NE(dump.find("\"else\": "), std::string::npos);
    EXPECT_NE(dump.find("\"text\": \"տուր 2\""), std::string::npos);
}
