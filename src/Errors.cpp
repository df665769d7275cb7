#include <Errors.hpp>

using namespace Lla;

const char* Lla::compileErrorTypeName(CompileErrorType type)
{
	switch (type)
	{
	case CompileErrorType::Lex: return "LexError";
	case CompileErrorType::Parse: return "ParseError";
	case CompileErrorType::Semantic: return "CompileError";
	case CompileErrorType::DuplicateDeclaration: return "DuplicateDeclarationError";
	}
	return "";
}

SourceLocation CompileError::location() const
{
	return SourceLocation(start, end);
}

const char* Lla::runtimeErrorTypeName(RuntimeErrorType type)
{
	switch (type)
	{
	case RuntimeErrorType::Type: return "RuntimeTypeError";
	case RuntimeErrorType::Arity: return "ArityError";
	case RuntimeErrorType::UndefinedGlobal: return "UndefinedGlobalError";
	case RuntimeErrorType::StackOverflow: return "StackOverflowError";
	}
	return "";
}
