#pragma once

#include <Parsing/Token.hpp>
#include <Parsing/SourceInfo.hpp>
#include <ErrorReporter.hpp>
#include <optional>
#include <stdarg.h>

namespace Lla
{

// Tokens are produced on demand. After the end of the source every call to nextToken() returns an Eof token.
class Scanner
{
public:
	Scanner();

	// The error reporter can be nullptr.
	void init(const SourceInfo& sourceInfo, ErrorReporter* errorReporter);
	Token nextToken();
	// Starts again from the beginning of the source.
	void reset();

	bool hadError() const;
	// The first error encountered.
	const std::optional<CompileError>& error() const;

private:
	Token token();

	Token number();
	Token keywordOrIdentifier();
	Token string();

	Token makeToken(TokenType type);

	void skipWhitespace();

	[[nodiscard]] Token errorToken(const char* format, ...);
	[[nodiscard]] Token errorTokenAt(size_t start, size_t end, const char* format, ...);
	void errorAt(size_t start, size_t end, const char* format, va_list args);
	char peek() const;
	char peekNext() const;
	bool isAtEnd() const;
	void advance();
	bool match(char c);

	// Making my own functions because the c functions from ctype.h use int as input the results are also based on the current C locale.
	static bool isDigit(char c);
	static bool isIdentifierStartChar(char c);
	static bool isIdentifierChar(char c);

private:
	const SourceInfo* m_sourceInfo;

	size_t m_currentCharIndex;
	size_t m_tokenStartIndex;

	ErrorReporter* m_errorReporter;

	std::optional<CompileError> m_error;
};

}
