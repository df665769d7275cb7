#include <gtest/gtest.h>

#include <Lla.hpp>
#include <Context.hpp>
#include <TerminalErrorReporter.hpp>
#include <Vm/Vm.hpp>
#include <memory>
#include <sstream>
#include <string>

using namespace Lla;

class RuntimeErrorTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		vm = std::make_unique<Vm>(GcConfig(), output);
		globals = std::make_unique<Globals>(*vm);
	}

	RuntimeError runExpectingError(std::string_view source)
	{
		const auto compileResult = compile(source);
		EXPECT_FALSE(compileResult.hadError());
		if (compileResult.hadError())
			return RuntimeError{};

		const auto result = vm->execute(compileResult.program, *globals);
		EXPECT_TRUE(result.hadError());
		EXPECT_TRUE(result.value.isNil());
		EXPECT_EQ(vm->state(), VmState::PausedOnError);
		if (result.hadError() == false)
			return RuntimeError{};
		return *result.error;
	}

	std::stringstream output;
	std::unique_ptr<Vm> vm;
	std::unique_ptr<Globals> globals;
};

TEST_F(RuntimeErrorTest, WrongArgumentCount)
{
	const auto error = runExpectingError("fun f(a, b) { return a + b; }\nf(1)");
	EXPECT_EQ(error.type, RuntimeErrorType::Arity);
	EXPECT_EQ(error.message, "f() expected 2 arguments but got 1");
	ASSERT_EQ(error.stackTrace.size(), 1);
	EXPECT_EQ(error.stackTrace[0].functionName, "script");
	EXPECT_EQ(error.stackTrace[0].line, 2);
}

TEST_F(RuntimeErrorTest, WrongStructArgumentCount)
{
	const auto error = runExpectingError("struct P { x, y }\nP(1, 2, 3)");
	EXPECT_EQ(error.type, RuntimeErrorType::Arity);
	EXPECT_EQ(error.message, "P() expected 2 arguments but got 3");
}

static Value nativeOneArgument(Context&)
{
	return Value::nil();
}

TEST_F(RuntimeErrorTest, WrongNativeArgumentCount)
{
	globals->defineNativeFunction("one", nativeOneArgument, 1);
	const auto error = runExpectingError("one()");
	EXPECT_EQ(error.type, RuntimeErrorType::Arity);
	EXPECT_EQ(error.message, "one() expected 1 arguments but got 0");
}

TEST_F(RuntimeErrorTest, UndeclaredGlobal)
{
	const auto error = runExpectingError("var a = 1;\nprint b;");
	EXPECT_EQ(error.type, RuntimeErrorType::UndefinedGlobal);
	EXPECT_EQ(error.message, "'b' is not defined");
	ASSERT_EQ(error.stackTrace.size(), 1);
	EXPECT_EQ(error.stackTrace[0].line, 2);
}

TEST_F(RuntimeErrorTest, AssignmentToUndeclaredGlobal)
{
	const auto error = runExpectingError("b = 1");
	EXPECT_EQ(error.type, RuntimeErrorType::UndefinedGlobal);
	EXPECT_FALSE(globals->contains("b"));
}

TEST_F(RuntimeErrorTest, TypeErrors)
{
	auto error = runExpectingError("1 + \"a\"");
	EXPECT_EQ(error.type, RuntimeErrorType::Type);
	EXPECT_EQ(error.message, "cannot apply '+' to number and string");

	error = runExpectingError("-nil");
	EXPECT_EQ(error.type, RuntimeErrorType::Type);
	EXPECT_EQ(error.message, "cannot negate nil");

	error = runExpectingError("1()");
	EXPECT_EQ(error.type, RuntimeErrorType::Type);
	EXPECT_EQ(error.message, "number is not callable");

	error = runExpectingError("if 1 { }");
	EXPECT_EQ(error.type, RuntimeErrorType::Type);
	EXPECT_EQ(error.message, "condition must be a bool, found number");

	error = runExpectingError("1.x");
	EXPECT_EQ(error.type, RuntimeErrorType::Type);
}

TEST_F(RuntimeErrorTest, MissingField)
{
	const auto error = runExpectingError("struct P { x }\nvar p = P(1);\np.y");
	EXPECT_EQ(error.type, RuntimeErrorType::Type);
	EXPECT_EQ(error.message, "'P' has no field 'y'");
}

static Value expectsNumber(Context& c)
{
	return Value(c.getNumber(0));
}

TEST_F(RuntimeErrorTest, NativeFunctionThrows)
{
	globals->defineNativeFunction("num", expectsNumber, 1);
	const auto error = runExpectingError("num(\"a\")");
	EXPECT_EQ(error.type, RuntimeErrorType::Type);
	EXPECT_EQ(error.message, "num(): expected argument 0 to be number, found string");
}

TEST_F(RuntimeErrorTest, StackOverflow)
{
	const auto error = runExpectingError("fun f(n) { return f(n + 1); }\nf(0)");
	EXPECT_EQ(error.type, RuntimeErrorType::StackOverflow);
	EXPECT_EQ(error.stackTrace.size(), Vm::CALL_STACK_SIZE);
	EXPECT_EQ(error.stackTrace.front().functionName, "f");
	EXPECT_EQ(error.stackTrace.back().functionName, "script");
}

TEST_F(RuntimeErrorTest, StackTraceIsInnermostFirst)
{
	const auto source =
		"fun inner() {\n"
		"	return nil + 1;\n"
		"}\n"
		"fun outer() {\n"
		"	return inner();\n"
		"}\n"
		"outer()";
	const auto error = runExpectingError(source);
	ASSERT_EQ(error.stackTrace.size(), 3);
	EXPECT_EQ(error.stackTrace[0].functionName, "inner");
	EXPECT_EQ(error.stackTrace[0].line, 2);
	EXPECT_EQ(error.stackTrace[1].functionName, "outer");
	EXPECT_EQ(error.stackTrace[1].line, 5);
	EXPECT_EQ(error.stackTrace[2].functionName, "script");
	EXPECT_EQ(error.stackTrace[2].line, 7);
}

TEST_F(RuntimeErrorTest, VmCanBeReusedAfterError)
{
	runExpectingError("undefinedFunction()");
	vm->reset();
	EXPECT_EQ(vm->state(), VmState::Ready);
	EXPECT_EQ(vm->stackSize(), 0);
	EXPECT_EQ(vm->callStackSize(), 0);

	const auto program = compile("1 + 1");
	const auto result = vm->execute(program.program, *globals);
	ASSERT_FALSE(result.hadError());
	EXPECT_EQ(result.value, Value(2.0));
}

TEST_F(RuntimeErrorTest, ReporterOutput)
{
	const std::string source = "var x = 1;\nx + nil";
	const SourceInfo sourceInfo("test.lla", source);
	std::stringstream errorOutput;
	TerminalErrorReporter reporter(errorOutput, sourceInfo, 4);

	const auto program = compile(sourceInfo, &reporter);
	ASSERT_FALSE(program.hadError());
	const auto result = vm->execute(program.program, *globals, &reporter);
	ASSERT_TRUE(result.hadError());

	const auto text = errorOutput.str();
	EXPECT_NE(text.find("test.lla:2"), std::string::npos);
	EXPECT_NE(text.find("RuntimeTypeError: cannot apply '+' to number and nil"), std::string::npos);
	EXPECT_NE(text.find("line 2 in script()"), std::string::npos);
}

TEST_F(RuntimeErrorTest, CompileErrorReporterOutput)
{
	const std::string source = "var x = 1;\nvar x = 2;";
	const SourceInfo sourceInfo("test.lla", source);
	std::stringstream errorOutput;
	TerminalErrorReporter reporter(errorOutput, sourceInfo, 4);

	const auto program = compile(sourceInfo, &reporter);
	ASSERT_TRUE(program.hadError());

	const auto text = errorOutput.str();
	EXPECT_NE(text.find("test.lla:2:1"), std::string::npos);
	EXPECT_NE(text.find("DuplicateDeclarationError: redeclaration of global 'x'"), std::string::npos);
	EXPECT_NE(text.find("var x = 2;"), std::string::npos);
}
