#include <Lla.hpp>
#include <Builtins.hpp>
#include <ReadFile.hpp>
#include <Repl.hpp>
#include <TerminalErrorReporter.hpp>
#include <Vm/Vm.hpp>
#include <iostream>
#include <cstdlib>
#include <memory>

using namespace Lla;

static constexpr std::string_view FILE_EXTENSION = ".lla";

static int runFile(std::string_view path)
{
	if ((path.size() < FILE_EXTENSION.size()) || (path.substr(path.size() - FILE_EXTENSION.size()) != FILE_EXTENSION))
	{
		std::cerr << "fatal error: input file does not use the '.lla' file extension\n";
		return EXIT_FAILURE;
	}

	const auto source = stringFromFile(path);
	if (source.has_value() == false)
	{
		std::cerr << "fatal error: failed to open file '" << path << "'\n";
		return EXIT_FAILURE;
	}

	const SourceInfo sourceInfo(path, *source);
	TerminalErrorReporter errorReporter(std::cerr, sourceInfo, 4);

	const auto compileResult = compile(sourceInfo, &errorReporter);
	if (compileResult.hadError())
	{
		return EXIT_FAILURE;
	}

	auto vm = std::make_unique<Vm>();
	Globals globals(*vm);
	defineBuiltins(globals);
	const auto result = vm->execute(compileResult.program, globals, &errorReporter);
	if (result.hadError())
	{
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}

int main(int argc, char** argv)
{
	if (argc > 2)
	{
		std::cerr << "usage: lla [file.lla]\n";
		return EXIT_FAILURE;
	}

	if (argc == 2)
	{
		return runFile(argv[1]);
	}

	return runRepl(std::cin, std::cout, std::cerr);
}
