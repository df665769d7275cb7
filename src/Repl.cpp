#include <Repl.hpp>
#include <Lla.hpp>
#include <Builtins.hpp>
#include <TerminalErrorReporter.hpp>
#include <Vm/Vm.hpp>
#include <cstdlib>
#include <memory>
#include <string>

using namespace Lla;

int Lla::runRepl(std::istream& in, std::ostream& out, std::ostream& errorOut)
{
	// The Vm is too big to put on the stack.
	auto vm = std::make_unique<Vm>(GcConfig(), out);
	Globals globals(*vm);
	defineBuiltins(globals);

	std::string source;
	std::string text;

	out << ">>> ";
	while (std::getline(in, text))
	{
		source += text;
		source += '\n';

		const SourceInfo sourceInfo("<repl>", source);
		TerminalErrorReporter errorReporter(errorOut, sourceInfo, 4);

		// Report the error only if more input can't fix it.
		const auto tryCompile = compile(sourceInfo);
		if (tryCompile.hadError() && tryCompile.errorAtEof)
		{
			out << "... ";
			continue;
		}

		const auto compileResult = compile(sourceInfo, &errorReporter);
		if (compileResult.hadError() == false)
		{
			const auto result = vm->execute(compileResult.program, globals, &errorReporter);
			if ((result.hadError() == false) && (result.value.isNil() == false))
			{
				out << vm->allocator().toString(result.value) << '\n';
			}
		}

		source.clear();
		out << ">>> ";
	}
	out << '\n';

	return EXIT_SUCCESS;
}
