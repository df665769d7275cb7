#pragma once

#include <Value.hpp>
#include <Parsing/SourceInfo.hpp>

#include <string>
#include <string_view>

namespace Lla
{

enum class TokenType
{
	// Operators
	Plus,
	Minus,
	Star,
	Slash,
	Percent,
	Not,
	Equals,
	NotEquals,
	EqualsEquals,
	Less,
	LessEquals,
	More,
	MoreEquals,
	Dot,

	// Symbols
	Semicolon,
	LeftParen,
	RightParen,
	LeftBrace,
	RightBrace,
	Comma,

	// Keywords
	And,
	Or,
	Break,
	Continue,
	Elif,
	Else,
	False,
	Fun,
	If,
	Var,
	Loop,
	Nil,
	Print,
	Return,
	Struct,
	True,
	While,

	// Other
	Number,
	Identifier,
	String,

	// Special
	Error,
	Eof
};

const char* tokenTypeToString(TokenType type);

struct Token
{
public:
	Token(TokenType type, size_t start, size_t end);

	SourceLocation location() const;

public:
	TokenType type;

	size_t start;
	size_t end;
	SourcePosition position;

	// Points into the source.
	std::string_view lexeme;
	// Only set for TokenType::Number.
	Float number;
	// Only set for TokenType::String. Escape sequences are already decoded.
	std::string string;
};

}
