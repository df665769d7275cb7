#include <gtest/gtest.h>

#include <Lla.hpp>
#include <Builtins.hpp>
#include <ReadFile.hpp>
#include <TerminalErrorReporter.hpp>
#include <Vm/Vm.hpp>
#include <memory>
#include <sstream>
#include <string>

using namespace Lla;

struct ScriptTestCase
{
	const char* name;
	const char* expectedOutput;
};

static const ScriptTestCase tests[] = {
	{ "variable_scoping", "0010" },
	{ "loops", "0123456789" },
	{ "ret", "6" },
	{ "concatenation", "abctrue2false" },
	{ "instance_fields", "nil4nil" },
	{ "comments", "abc" },
	{ "primes", "2 3 5 7 11 13 17 19 23 29 31 37 41 43 47 " },
	{ "linked_list", "3 2 1 " },
	{ "linked_list_using_closures", "1234" },
	{ "lambdas", "0 1 4 9 16 25 36 49 64 81 100 " },
	{ "lambda_closure", "2" },
	{ "counter", "123" },
};

class ScriptTest : public ::testing::TestWithParam<ScriptTestCase>
{};

// The scripts print their output piece by piece through put().
static Value put(Context& c)
{
	auto output = c.data<std::ostream>();
	*output << c.toString(c.args(0));
	return Value::nil();
}

TEST_P(ScriptTest, ProducesExpectedOutput)
{
	const auto& test = GetParam();
	const auto filename = std::string(LLA_TEST_SCRIPTS_DIR) + "/" + test.name + ".lla";
	const auto source = stringFromFile(filename);
	ASSERT_TRUE(source.has_value()) << "couldn't open file " << filename;

	const SourceInfo sourceInfo(filename, *source);
	std::stringstream errorOutput;
	TerminalErrorReporter errorReporter(errorOutput, sourceInfo, 4);

	const auto compileResult = compile(sourceInfo, &errorReporter);
	ASSERT_FALSE(compileResult.hadError()) << errorOutput.str();

	std::stringstream output;
	auto vm = std::make_unique<Vm>(GcConfig(), output);
	{
		Globals globals(*vm);
		defineBuiltins(globals);
		globals.defineNativeFunction("put", put, 1, static_cast<std::ostream*>(&output));

		const auto result = vm->execute(compileResult.program, globals, &errorReporter);
		ASSERT_FALSE(result.hadError()) << errorOutput.str();
	}
	EXPECT_EQ(output.str(), test.expectedOutput);
}

INSTANTIATE_TEST_SUITE_P(
	Scripts,
	ScriptTest,
	::testing::ValuesIn(tests),
	[](const ::testing::TestParamInfo<ScriptTestCase>& info) { return std::string(info.param.name); });
