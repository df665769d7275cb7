#include <gtest/gtest.h>

#include <Parsing/Parser.hpp>
#include <memory>
#include <string>

using namespace Lla;

class ParserTest : public ::testing::Test
{
protected:
	Parser::Result parse(std::string source)
	{
		m_source = std::move(source);
		m_sourceInfo = std::make_unique<SourceInfo>("<test>", m_source);
		m_scanner.init(*m_sourceInfo, nullptr);
		return parser.parse(m_scanner, *m_sourceInfo, nullptr);
	}

	Parser parser;

private:
	std::string m_source;
	std::unique_ptr<SourceInfo> m_sourceInfo;
	Scanner m_scanner;
};

TEST_F(ParserTest, Precedence)
{
	auto result = parse("1 + 2 * 3");
	ASSERT_FALSE(result.hadError);
	ASSERT_EQ(result.ast.size(), 1);
	ASSERT_EQ(result.ast[0]->type, StmtType::Expr);

	const auto& expr = *static_cast<const ExprStmt&>(*result.ast[0]).expr;
	ASSERT_EQ(expr.type, ExprType::Binary);
	const auto& add = static_cast<const BinaryExpr&>(expr);
	EXPECT_EQ(add.op, TokenType::Plus);
	EXPECT_EQ(add.lhs->type, ExprType::NumberConstant);
	ASSERT_EQ(add.rhs->type, ExprType::Binary);
	EXPECT_EQ(static_cast<const BinaryExpr&>(*add.rhs).op, TokenType::Star);
}

TEST_F(ParserTest, SubtractionIsLeftAssociative)
{
	auto result = parse("1 - 2 - 3");
	ASSERT_FALSE(result.hadError);
	const auto& expr = static_cast<const BinaryExpr&>(*static_cast<const ExprStmt&>(*result.ast[0]).expr);
	ASSERT_EQ(expr.lhs->type, ExprType::Binary);
	EXPECT_EQ(expr.rhs->type, ExprType::NumberConstant);
}

TEST_F(ParserTest, AssignmentIsRightAssociative)
{
	auto result = parse("a = b = 1");
	ASSERT_FALSE(result.hadError);
	const auto& expr = static_cast<const AssignmentExpr&>(*static_cast<const ExprStmt&>(*result.ast[0]).expr);
	EXPECT_EQ(expr.lhs->type, ExprType::Identifier);
	EXPECT_EQ(expr.rhs->type, ExprType::Assignment);
}

TEST_F(ParserTest, Statements)
{
	auto result = parse(
		"var x = 1;\n"
		"fun f(a, b) { return a; }\n"
		"struct Point { x, y }\n"
		"if x < 2 { print x; } elif x < 3 { } else { }\n"
		"while true { break; }\n"
		"loop { continue; }\n"
		"{ let y; }\n");
	ASSERT_FALSE(result.hadError);
	ASSERT_EQ(result.ast.size(), 7);
	EXPECT_EQ(result.ast[0]->type, StmtType::VariableDeclaration);
	ASSERT_EQ(result.ast[1]->type, StmtType::Fn);
	EXPECT_EQ(static_cast<const FnStmt&>(*result.ast[1]).arguments.size(), 2);
	ASSERT_EQ(result.ast[2]->type, StmtType::Struct);
	EXPECT_EQ(static_cast<const StructStmt&>(*result.ast[2]).fieldNames.size(), 2);
	ASSERT_EQ(result.ast[3]->type, StmtType::If);
	const auto& ifStmt = static_cast<const IfStmt&>(*result.ast[3]);
	ASSERT_TRUE(ifStmt.elseThen.has_value());
	ASSERT_EQ(ifStmt.elseThen->size(), 1);
	EXPECT_EQ((*ifStmt.elseThen)[0]->type, StmtType::If);
	ASSERT_EQ(result.ast[4]->type, StmtType::Loop);
	EXPECT_TRUE(static_cast<const LoopStmt&>(*result.ast[4]).condition.has_value());
	ASSERT_EQ(result.ast[5]->type, StmtType::Loop);
	EXPECT_FALSE(static_cast<const LoopStmt&>(*result.ast[5]).condition.has_value());
	EXPECT_EQ(result.ast[6]->type, StmtType::Block);
}

TEST_F(ParserTest, LambdaExpression)
{
	auto result = parse("var f = fun(x) { return x; }; fun(y) { }(1)");
	ASSERT_FALSE(result.hadError);
	ASSERT_EQ(result.ast.size(), 2);
	const auto& declaration = static_cast<const VariableDeclarationStmt&>(*result.ast[0]);
	ASSERT_TRUE(declaration.initializer.has_value());
	EXPECT_EQ((*declaration.initializer)->type, ExprType::Lambda);
	ASSERT_EQ(result.ast[1]->type, StmtType::Expr);
	EXPECT_EQ(static_cast<const ExprStmt&>(*result.ast[1]).expr->type, ExprType::Call);
}

TEST_F(ParserTest, FieldAccessAndCalls)
{
	auto result = parse("a.b(1, 2).c = 3");
	ASSERT_FALSE(result.hadError);
	const auto& assignment = static_cast<const AssignmentExpr&>(*static_cast<const ExprStmt&>(*result.ast[0]).expr);
	ASSERT_EQ(assignment.lhs->type, ExprType::GetField);
	const auto& field = static_cast<const GetFieldExpr&>(*assignment.lhs);
	EXPECT_EQ(field.fieldName, "c");
	ASSERT_EQ(field.lhs->type, ExprType::Call);
	EXPECT_EQ(static_cast<const CallExpr&>(*field.lhs).arguments.size(), 2);
}

TEST_F(ParserTest, SemicolonOptionalBeforeBraceAndEnd)
{
	auto result = parse("fun f() { return 1 } f()");
	EXPECT_FALSE(result.hadError);
}

TEST_F(ParserTest, MissingSemicolon)
{
	auto result = parse("var x = 1 var y = 2");
	ASSERT_TRUE(result.hadError);
	EXPECT_TRUE(result.ast.empty());
	EXPECT_FALSE(result.errorAtEof);
	EXPECT_EQ(result.error->type, CompileErrorType::Parse);
	EXPECT_EQ(result.error->expected, TokenType::Semicolon);
	EXPECT_EQ(result.error->found, TokenType::Var);
	EXPECT_EQ(result.error->message, "expected ';' but found 'var'");
}

TEST_F(ParserTest, ErrorAtEndOfSource)
{
	auto result = parse("fun f() {\n var x = 1;\n");
	ASSERT_TRUE(result.hadError);
	EXPECT_TRUE(result.errorAtEof);
	EXPECT_EQ(result.error->found, TokenType::Eof);
}

TEST_F(ParserTest, ExpectedExpression)
{
	auto result = parse("1 + ;");
	ASSERT_TRUE(result.hadError);
	EXPECT_EQ(result.error->message, "expected expression, found ';'");
	EXPECT_EQ(result.error->position.line, 1);
	EXPECT_EQ(result.error->position.column, 5);
}

TEST_F(ParserTest, ScannerErrorIsReported)
{
	auto result = parse("var x = \"abc");
	ASSERT_TRUE(result.hadError);
	EXPECT_EQ(result.error->type, CompileErrorType::Lex);
	EXPECT_FALSE(result.errorAtEof);
}

TEST_F(ParserTest, NestingLimit)
{
	std::string source;
	for (int i = 0; i < Parser::MAX_NESTING_DEPTH + 10; i++)
		source += '(';
	source += '1';
	for (int i = 0; i < Parser::MAX_NESTING_DEPTH + 10; i++)
		source += ')';

	auto result = parse(source);
	ASSERT_TRUE(result.hadError);
	EXPECT_EQ(result.error->message.rfind("nesting too deep", 0), 0);
}

TEST_F(ParserTest, LongElifChainHitsNestingLimit)
{
	std::string source = "if false {}";
	for (int i = 0; i < 20000; i++)
		source += " elif false {}";

	auto result = parse(source);
	ASSERT_TRUE(result.hadError);
	EXPECT_EQ(result.error->message.rfind("nesting too deep", 0), 0);
}

TEST_F(ParserTest, ChainedAssignmentHitsNestingLimit)
{
	std::string source = "var x = 0; ";
	for (int i = 0; i < 50000; i++)
		source += "x = ";
	source += "1";

	auto result = parse(source);
	ASSERT_TRUE(result.hadError);
	EXPECT_EQ(result.error->message.rfind("nesting too deep", 0), 0);
}

TEST_F(ParserTest, LongBinaryChainHitsNestingLimit)
{
	std::string source = "1";
	for (int i = 0; i < 200000; i++)
		source += " + 1";

	auto result = parse(source);
	ASSERT_TRUE(result.hadError);
	EXPECT_EQ(result.error->message.rfind("nesting too deep", 0), 0);
}

TEST_F(ParserTest, LongCallChainHitsNestingLimit)
{
	std::string source = "f";
	for (int i = 0; i < 100000; i++)
		source += "()";

	auto result = parse(source);
	ASSERT_TRUE(result.hadError);
	EXPECT_EQ(result.error->message.rfind("nesting too deep", 0), 0);
}

TEST_F(ParserTest, ChainsBelowNestingLimitParse)
{
	std::string source = "if false {}";
	for (int i = 0; i < 100; i++)
		source += " elif false {}";
	source += "\nvar x = 0; x = x = x = 1;\n1";
	for (int i = 0; i < 100; i++)
		source += " + 1";
	source += ";\nf()().a.b()";

	auto result = parse(source);
	EXPECT_FALSE(result.hadError);
	EXPECT_EQ(result.ast.size(), 5);
}
