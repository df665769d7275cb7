#include <Lla.hpp>
#include <Parsing/Scanner.hpp>
#include <Parsing/Parser.hpp>
#include <Compiling/Compiler.hpp>

using namespace Lla;

bool CompileResult::hadError() const
{
	return error.has_value();
}

CompileResult Lla::compile(std::string_view source, ErrorReporter* errorReporter)
{
	const SourceInfo sourceInfo("<source>", source);
	return compile(sourceInfo, errorReporter);
}

CompileResult Lla::compile(const SourceInfo& sourceInfo, ErrorReporter* errorReporter)
{
	Scanner scanner;
	// Scanner errors are reported by the parser when it reaches the error token.
	scanner.init(sourceInfo, nullptr);

	Parser parser;
	auto parserResult = parser.parse(scanner, sourceInfo, errorReporter);
	if (parserResult.hadError)
	{
		return CompileResult{ std::move(parserResult.error), parserResult.errorAtEof, nullptr };
	}

	Compiler compiler;
	auto compilerResult = compiler.compile(parserResult.ast, sourceInfo, errorReporter);
	if (compilerResult.hadError)
	{
		return CompileResult{ std::move(compilerResult.error), false, nullptr };
	}

	return CompileResult{ std::nullopt, false, std::move(compilerResult.program) };
}
