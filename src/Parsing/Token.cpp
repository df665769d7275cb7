#include <Parsing/Token.hpp>

using namespace Lla;

Token::Token(TokenType type, size_t start, size_t end)
	: type(type)
	, start(start)
	, end(end)
	, position{ 1, 1 }
	, number(0.0)
{}

SourceLocation Token::location() const
{
	return SourceLocation(start, end);
}

const char* Lla::tokenTypeToString(TokenType type)
{
	switch (type)
	{
	case TokenType::Plus: return "'+'";
	case TokenType::Minus: return "'-'";
	case TokenType::Star: return "'*'";
	case TokenType::Slash: return "'/'";
	case TokenType::Percent: return "'%'";
	case TokenType::Not: return "'!'";
	case TokenType::Equals: return "'='";
	case TokenType::NotEquals: return "'!='";
	case TokenType::EqualsEquals: return "'=='";
	case TokenType::Less: return "'<'";
	case TokenType::LessEquals: return "'<='";
	case TokenType::More: return "'>'";
	case TokenType::MoreEquals: return "'>='";
	case TokenType::Dot: return "'.'";
	case TokenType::Semicolon: return "';'";
	case TokenType::LeftParen: return "'('";
	case TokenType::RightParen: return "')'";
	case TokenType::LeftBrace: return "'{'";
	case TokenType::RightBrace: return "'}'";
	case TokenType::Comma: return "','";
	case TokenType::And: return "'and'";
	case TokenType::Or: return "'or'";
	case TokenType::Break: return "'break'";
	case TokenType::Continue: return "'continue'";
	case TokenType::Elif: return "'elif'";
	case TokenType::Else: return "'else'";
	case TokenType::False: return "'false'";
	case TokenType::Fun: return "'fun'";
	case TokenType::If: return "'if'";
	case TokenType::Var: return "'var'";
	case TokenType::Loop: return "'loop'";
	case TokenType::Nil: return "'nil'";
	case TokenType::Print: return "'print'";
	case TokenType::Return: return "'return'";
	case TokenType::Struct: return "'struct'";
	case TokenType::True: return "'true'";
	case TokenType::While: return "'while'";
	case TokenType::Number: return "number";
	case TokenType::Identifier: return "identifier";
	case TokenType::String: return "string";
	case TokenType::Error: return "invalid token";
	case TokenType::Eof: return "end of file";
	}

	return "";
}
