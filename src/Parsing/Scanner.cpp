#include <Parsing/Scanner.hpp>
#include <Format.hpp>
#include <Asserts.hpp>

#include <charconv>
#include <unordered_map>
#include <stdarg.h>

using namespace Lla;

Scanner::Scanner()
	: m_sourceInfo(nullptr)
	, m_currentCharIndex(0)
	, m_tokenStartIndex(0)
	, m_errorReporter(nullptr)
{}

void Scanner::init(const SourceInfo& sourceInfo, ErrorReporter* errorReporter)
{
	m_sourceInfo = &sourceInfo;
	m_errorReporter = errorReporter;
	reset();
}

void Scanner::reset()
{
	m_currentCharIndex = 0;
	m_tokenStartIndex = 0;
	m_error = std::nullopt;
}

bool Scanner::hadError() const
{
	return m_error.has_value();
}

const std::optional<CompileError>& Scanner::error() const
{
	return m_error;
}

Token Scanner::nextToken()
{
	ASSERT(m_sourceInfo != nullptr);

	skipWhitespace();
	m_tokenStartIndex = m_currentCharIndex;
	if (isAtEnd())
	{
		return makeToken(TokenType::Eof);
	}
	return token();
}

Token Scanner::token()
{
	char c = peek();
	advance();

	switch (c)
	{
		case '+': return makeToken(TokenType::Plus);
		case '-': return makeToken(TokenType::Minus);
		case '*': return makeToken(TokenType::Star);
		case '/': return makeToken(TokenType::Slash);
		case '%': return makeToken(TokenType::Percent);
		case '=': return match('=')
			? makeToken(TokenType::EqualsEquals)
			: makeToken(TokenType::Equals);
		case '!': return match('=')
			? makeToken(TokenType::NotEquals)
			: makeToken(TokenType::Not);
		case '<': return match('=')
			? makeToken(TokenType::LessEquals)
			: makeToken(TokenType::Less);
		case '>': return match('=')
			? makeToken(TokenType::MoreEquals)
			: makeToken(TokenType::More);
		case ';': return makeToken(TokenType::Semicolon);
		case '(': return makeToken(TokenType::LeftParen);
		case ')': return makeToken(TokenType::RightParen);
		case '{': return makeToken(TokenType::LeftBrace);
		case '}': return makeToken(TokenType::RightBrace);
		case ',': return makeToken(TokenType::Comma);
		case '.': return makeToken(TokenType::Dot);
		case '"': return string();

		default:
			if (isDigit(c))
				return number();
			if (isIdentifierStartChar(c))
				return keywordOrIdentifier();

			if ((c >= 0x20) && (c < 0x7F))
				return errorToken("unexpected character '%c'", c);
			return errorToken("unexpected character 0x%02x", static_cast<unsigned char>(c));
	}
}

Token Scanner::number()
{
	while (isDigit(peek()))
		advance();

	// "1." is the number 1 followed by a dot.
	if ((peek() == '.') && isDigit(peekNext()))
	{
		advance();
		while (isDigit(peek()))
			advance();
	}

	const auto text = m_sourceInfo->source.substr(m_tokenStartIndex, m_currentCharIndex - m_tokenStartIndex);
	Float value;
	const auto result = std::from_chars(text.data(), text.data() + text.size(), value);

	if (result.ec == std::errc::result_out_of_range)
	{
		return errorToken("number literal out of range");
	}
	else if ((result.ec != std::errc()) || (result.ptr != text.data() + text.size()))
	{
		return errorToken("invalid number literal");
	}

	auto token = makeToken(TokenType::Number);
	token.number = value;
	return token;
}

Token Scanner::keywordOrIdentifier()
{
	static const std::unordered_map<std::string_view, TokenType> keywords = {
		{ "and", TokenType::And },
		{ "or", TokenType::Or },
		{ "break", TokenType::Break },
		{ "continue", TokenType::Continue },
		{ "elif", TokenType::Elif },
		{ "else", TokenType::Else },
		{ "false", TokenType::False },
		{ "fun", TokenType::Fun },
		{ "func", TokenType::Fun },
		{ "if", TokenType::If },
		{ "var", TokenType::Var },
		{ "let", TokenType::Var },
		{ "loop", TokenType::Loop },
		{ "nil", TokenType::Nil },
		{ "print", TokenType::Print },
		{ "return", TokenType::Return },
		{ "struct", TokenType::Struct },
		{ "true", TokenType::True },
		{ "while", TokenType::While },
	};

	while (isIdentifierChar(peek()))
		advance();

	auto token = makeToken(TokenType::Identifier);

	const auto keyword = keywords.find(token.lexeme);
	if (keyword != keywords.end())
		token.type = keyword->second;

	return token;
}

Token Scanner::string()
{
	std::string result;

	for (;;)
	{
		if (isAtEnd())
		{
			return errorTokenAt(m_tokenStartIndex, m_tokenStartIndex + 1, "unterminated string");
		}

		const auto c = peek();
		if (c == '"')
		{
			advance();
			break;
		}
		if (c == '\n')
		{
			return errorTokenAt(m_currentCharIndex, m_currentCharIndex + 1, "newline inside string literal");
		}

		advance();
		if (c != '\\')
		{
			result += c;
			continue;
		}

		if (isAtEnd())
		{
			return errorTokenAt(m_tokenStartIndex, m_tokenStartIndex + 1, "unterminated string");
		}

		const auto escapeStart = m_currentCharIndex - 1;
		const auto escaped = peek();
		advance();
		switch (escaped)
		{
			case '\\': result += '\\'; break;
			case '"': result += '"'; break;
			case 'n': result += '\n'; break;
			case 'r': result += '\r'; break;
			case 't': result += '\t'; break;
			case '0': result += '\0'; break;
			// A backslash before a line break keeps the line break.
			case '\n': result += '\n'; break;
			default:
				if ((escaped >= 0x20) && (escaped < 0x7F))
					return errorTokenAt(escapeStart, m_currentCharIndex, "invalid escape sequence '\\%c'", escaped);
				return errorTokenAt(escapeStart, m_currentCharIndex, "invalid escape sequence");
		}
	}

	auto token = makeToken(TokenType::String);
	token.string = std::move(result);
	return token;
}

Token Scanner::makeToken(TokenType type)
{
	Token token(type, m_tokenStartIndex, m_currentCharIndex);
	token.position = m_sourceInfo->getPosition(m_tokenStartIndex);
	token.lexeme = m_sourceInfo->source.substr(m_tokenStartIndex, m_currentCharIndex - m_tokenStartIndex);
	m_tokenStartIndex = m_currentCharIndex;
	return token;
}

void Scanner::skipWhitespace()
{
	while (isAtEnd() == false)
	{
		switch (peek())
		{
			case ' ':
			case '\t':
			case '\r':
			case '\f':
			case '\n':
				advance();
				break;

			case '/':
				if (peekNext() != '/')
					return;
				[[fallthrough]];
			case '#':
				while ((isAtEnd() == false) && (peek() != '\n'))
					advance();
				break;

			default:
				return;
		}
	}
}

Token Scanner::errorToken(const char* format, ...)
{
	const auto start = m_tokenStartIndex;
	const auto end = m_currentCharIndex;
	va_list args;
	va_start(args, format);
	errorAt(start, end, format, args);
	va_end(args);
	return makeToken(TokenType::Error);
}

Token Scanner::errorTokenAt(size_t start, size_t end, const char* format, ...)
{
	va_list args;
	va_start(args, format);
	errorAt(start, end, format, args);
	va_end(args);
	return makeToken(TokenType::Error);
}

void Scanner::errorAt(size_t start, size_t end, const char* format, va_list args)
{
	if (m_error.has_value())
		return;

	CompileError error;
	error.type = CompileErrorType::Lex;
	error.message = formatToString(format, args);
	error.position = m_sourceInfo->getPosition(start);
	error.start = start;
	error.end = end;
	m_error = std::move(error);

	if (m_errorReporter != nullptr)
	{
		m_errorReporter->onScannerError(*m_error);
	}
}

char Scanner::peek() const
{
	if (isAtEnd())
		return '\0';
	return m_sourceInfo->source[m_currentCharIndex];
}

char Scanner::peekNext() const
{
	if ((m_currentCharIndex + 1) >= m_sourceInfo->source.size())
		return '\0';
	return m_sourceInfo->source[m_currentCharIndex + 1];
}

bool Scanner::isAtEnd() const
{
	return m_currentCharIndex >= m_sourceInfo->source.size();
}

void Scanner::advance()
{
	if (isAtEnd() == false)
		m_currentCharIndex++;
}

bool Scanner::match(char c)
{
	if (peek() == c)
	{
		advance();
		return true;
	}
	return false;
}

bool Scanner::isDigit(char c)
{
	return (c >= '0') && (c <= '9');
}

bool Scanner::isIdentifierStartChar(char c)
{
	return ((c >= 'a') && (c <= 'z'))
		|| ((c >= 'A') && (c <= 'Z'))
		|| (c == '_');
}

bool Scanner::isIdentifierChar(char c)
{
	return isIdentifierStartChar(c) || isDigit(c);
}
