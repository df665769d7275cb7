#pragma once

#include <Parsing/SourceInfo.hpp>
#include <Parsing/Token.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Lla
{

enum class CompileErrorType
{
	Lex,
	Parse,
	Semantic,
	DuplicateDeclaration,
};

const char* compileErrorTypeName(CompileErrorType type);

struct CompileError
{
	CompileErrorType type;
	std::string message;
	SourcePosition position;
	// Byte offsets into the source.
	size_t start;
	size_t end;
	// Only set for parse errors. expected is set only when a single kind of token was expected.
	std::optional<TokenType> expected;
	std::optional<TokenType> found;

	SourceLocation location() const;
};

enum class RuntimeErrorType
{
	Type,
	Arity,
	UndefinedGlobal,
	StackOverflow,
};

const char* runtimeErrorTypeName(RuntimeErrorType type);

struct StackTraceEntry
{
	std::string functionName;
	size_t line;
};

struct RuntimeError
{
	RuntimeErrorType type;
	std::string message;
	// Innermost frame first.
	std::vector<StackTraceEntry> stackTrace;
};

}
