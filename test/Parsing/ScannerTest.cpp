#include <gtest/gtest.h>

#include <Parsing/Scanner.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace Lla;

class ScannerTest : public ::testing::Test
{
protected:
	std::vector<Token> scan(std::string source)
	{
		m_source = std::move(source);
		m_sourceInfo = std::make_unique<SourceInfo>("<test>", m_source);
		scanner.init(*m_sourceInfo, nullptr);

		std::vector<Token> tokens;
		for (;;)
		{
			tokens.push_back(scanner.nextToken());
			if (tokens.back().type == TokenType::Eof)
				break;
		}
		return tokens;
	}

	Scanner scanner;

private:
	std::string m_source;
	std::unique_ptr<SourceInfo> m_sourceInfo;
};

TEST_F(ScannerTest, Numbers)
{
	auto tokens = scan("1234 3.5");
	ASSERT_EQ(tokens.size(), 3);
	EXPECT_EQ(tokens[0].type, TokenType::Number);
	EXPECT_EQ(tokens[0].number, 1234.0);
	EXPECT_EQ(tokens[1].type, TokenType::Number);
	EXPECT_EQ(tokens[1].number, 3.5);
	EXPECT_EQ(tokens[2].type, TokenType::Eof);
}

TEST_F(ScannerTest, NumberFollowedByDot)
{
	auto tokens = scan("1.a");
	ASSERT_EQ(tokens.size(), 4);
	EXPECT_EQ(tokens[0].type, TokenType::Number);
	EXPECT_EQ(tokens[1].type, TokenType::Dot);
	EXPECT_EQ(tokens[2].type, TokenType::Identifier);
}

TEST_F(ScannerTest, Operators)
{
	auto tokens = scan("+ - * / % ! != = == < <= > >=");
	const TokenType expected[] = {
		TokenType::Plus, TokenType::Minus, TokenType::Star, TokenType::Slash, TokenType::Percent,
		TokenType::Not, TokenType::NotEquals, TokenType::Equals, TokenType::EqualsEquals,
		TokenType::Less, TokenType::LessEquals, TokenType::More, TokenType::MoreEquals,
		TokenType::Eof
	};
	ASSERT_EQ(tokens.size(), std::size(expected));
	for (size_t i = 0; i < tokens.size(); i++)
	{
		EXPECT_EQ(tokens[i].type, expected[i]) << "token " << i;
	}
}

TEST_F(ScannerTest, KeywordsAndSynonyms)
{
	auto tokens = scan("var let fun func while loop elif struct variable");
	ASSERT_EQ(tokens.size(), 10);
	EXPECT_EQ(tokens[0].type, TokenType::Var);
	EXPECT_EQ(tokens[1].type, TokenType::Var);
	EXPECT_EQ(tokens[2].type, TokenType::Fun);
	EXPECT_EQ(tokens[3].type, TokenType::Fun);
	EXPECT_EQ(tokens[4].type, TokenType::While);
	EXPECT_EQ(tokens[5].type, TokenType::Loop);
	EXPECT_EQ(tokens[6].type, TokenType::Elif);
	EXPECT_EQ(tokens[7].type, TokenType::Struct);
	EXPECT_EQ(tokens[8].type, TokenType::Identifier);
	EXPECT_EQ(tokens[8].lexeme, "variable");
}

TEST_F(ScannerTest, StringEscapes)
{
	auto tokens = scan(R"("a\n\"b\"\\")");
	ASSERT_EQ(tokens.size(), 2);
	EXPECT_EQ(tokens[0].type, TokenType::String);
	EXPECT_EQ(tokens[0].string, "a\n\"b\"\\");
}

TEST_F(ScannerTest, InvalidEscape)
{
	auto tokens = scan(R"("a\qb")");
	EXPECT_EQ(tokens[0].type, TokenType::Error);
	ASSERT_TRUE(scanner.hadError());
	EXPECT_EQ(scanner.error()->type, CompileErrorType::Lex);
	EXPECT_EQ(scanner.error()->message, "invalid escape sequence '\\q'");
	EXPECT_EQ(scanner.error()->start, 2);
	EXPECT_EQ(scanner.error()->end, 4);
}

TEST_F(ScannerTest, EscapedLineBreak)
{
	auto tokens = scan("\"a\\\nb\" 1");
	ASSERT_EQ(tokens.size(), 3);
	EXPECT_EQ(tokens[0].type, TokenType::String);
	EXPECT_EQ(tokens[0].string, "a\nb");
	EXPECT_EQ(tokens[1].position.line, 2);
	EXPECT_FALSE(scanner.hadError());
}

TEST_F(ScannerTest, RawLineBreakInString)
{
	auto tokens = scan("\"a\nb\"");
	EXPECT_EQ(tokens[0].type, TokenType::Error);
	ASSERT_TRUE(scanner.hadError());
	EXPECT_EQ(scanner.error()->message, "newline inside string literal");
}

TEST_F(ScannerTest, ResetRestartsFromTheStart)
{
	auto first = scan("var x = \"s\"; x + 1.5");

	scanner.reset();
	std::vector<Token> second;
	for (;;)
	{
		second.push_back(scanner.nextToken());
		if (second.back().type == TokenType::Eof)
			break;
	}

	ASSERT_EQ(first.size(), second.size());
	for (size_t i = 0; i < first.size(); i++)
	{
		EXPECT_EQ(first[i].type, second[i].type);
		EXPECT_EQ(first[i].start, second[i].start);
		EXPECT_EQ(first[i].end, second[i].end);
		EXPECT_EQ(first[i].lexeme, second[i].lexeme);
	}
	EXPECT_EQ(second[3].string, "s");
	EXPECT_EQ(second[7].number, 1.5);
}

TEST_F(ScannerTest, CommentsAreSkipped)
{
	auto tokens = scan("1 // comment\n# other comment\n2");
	ASSERT_EQ(tokens.size(), 3);
	EXPECT_EQ(tokens[1].number, 2.0);
	EXPECT_EQ(tokens[1].position.line, 3);
	EXPECT_EQ(tokens[1].position.column, 1);
}

TEST_F(ScannerTest, UnterminatedString)
{
	auto tokens = scan("\"abc");
	EXPECT_EQ(tokens[0].type, TokenType::Error);
	ASSERT_TRUE(scanner.hadError());
	EXPECT_EQ(scanner.error()->type, CompileErrorType::Lex);
	EXPECT_EQ(scanner.error()->message, "unterminated string");
}

TEST_F(ScannerTest, UnexpectedCharacter)
{
	auto tokens = scan("1 @ 2");
	EXPECT_EQ(tokens[1].type, TokenType::Error);
	ASSERT_TRUE(scanner.hadError());
	EXPECT_EQ(scanner.error()->message, "unexpected character '@'");
	EXPECT_EQ(scanner.error()->start, 2);
	EXPECT_EQ(scanner.error()->position.column, 3);
}
