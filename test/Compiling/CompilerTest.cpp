#include <gtest/gtest.h>

#include <Lla.hpp>
#include <Compiling/Compiler.hpp>
#include <Op.hpp>
#include <algorithm>
#include <string>
#include <vector>

using namespace Lla;

class CompilerTest : public ::testing::Test
{
protected:
	static uint8_t op(Op op)
	{
		return static_cast<uint8_t>(op);
	}

	static bool containsOp(const Chunk& chunk, Op op)
	{
		const auto& code = chunk.byteCode.code;
		return std::find(code.begin(), code.end(), static_cast<uint8_t>(op)) != code.end();
	}

	static const Chunk& functionConstant(const Chunk& chunk, size_t index)
	{
		return *chunk.constants.at(index).functionValue;
	}
};

TEST_F(CompilerTest, ArithmeticFollowsPrecedence)
{
	const auto result = compile("1 + 2 * 3");
	ASSERT_FALSE(result.hadError());
	const auto& chunk = *result.program;

	const std::vector<uint8_t> expected = {
		op(Op::GetConstant), 0, 0, 0, 0,
		op(Op::GetConstant), 0, 0, 0, 1,
		op(Op::GetConstant), 0, 0, 0, 2,
		op(Op::Multiply),
		op(Op::Add),
		op(Op::Return),
	};
	EXPECT_EQ(chunk.byteCode.code, expected);
	EXPECT_EQ(chunk.byteCode.lineNumberAtOffset.size(), chunk.byteCode.code.size());

	ASSERT_EQ(chunk.constants.size(), 3);
	EXPECT_EQ(chunk.constants[0].numberValue, 1.0);
	EXPECT_EQ(chunk.constants[1].numberValue, 2.0);
	EXPECT_EQ(chunk.constants[2].numberValue, 3.0);
}

TEST_F(CompilerTest, ConstantsAreDeduplicated)
{
	const auto result = compile("print 1 + 1; print \"a\" + \"a\";");
	ASSERT_FALSE(result.hadError());
	EXPECT_EQ(result.program->constants.size(), 2);
}

TEST_F(CompilerTest, ProgramWithoutTrailingExpressionReturnsNil)
{
	const auto result = compile("var x = 1;");
	ASSERT_FALSE(result.hadError());
	const auto& code = result.program->byteCode.code;
	ASSERT_GE(code.size(), 2);
	EXPECT_EQ(code[code.size() - 2], op(Op::LoadNil));
	EXPECT_EQ(code[code.size() - 1], op(Op::Return));
	EXPECT_TRUE(containsOp(*result.program, Op::DefineGlobal));
}

TEST_F(CompilerTest, CompilingIsDeterministic)
{
	const auto source = "var x = 1; fun f(a) { var b = a; return fun() { return b + x; }; } f(2)()";
	const auto first = compile(source);
	const auto second = compile(source);
	ASSERT_FALSE(first.hadError());
	ASSERT_FALSE(second.hadError());
	EXPECT_EQ(first.program->byteCode.code, second.program->byteCode.code);
	EXPECT_EQ(first.program->constants.size(), second.program->constants.size());
}

TEST_F(CompilerTest, FunctionsAreNestedChunks)
{
	const auto result = compile("fun add(a, b) { return a + b; }");
	ASSERT_FALSE(result.hadError());
	const auto& script = *result.program;
	EXPECT_EQ(script.name, "script");
	ASSERT_EQ(script.constants[0].type, Constant::Type::Function);

	const auto& function = functionConstant(script, 0);
	EXPECT_EQ(function.name, "add");
	EXPECT_EQ(function.argCount, 2);
	EXPECT_EQ(function.upvalueCount, 0);
	EXPECT_TRUE(containsOp(function, Op::GetLocal));
	EXPECT_FALSE(containsOp(function, Op::GetGlobal));
}

TEST_F(CompilerTest, CapturedLocalsBecomeUpvalues)
{
	const auto result = compile("fun outer() { var x = 1; fun inner() { return x; } return inner; }");
	ASSERT_FALSE(result.hadError());
	const auto& outer = functionConstant(*result.program, 0);
	size_t innerIndex = 0;
	while (outer.constants[innerIndex].type != Constant::Type::Function)
		innerIndex++;
	const auto& inner = functionConstant(outer, innerIndex);
	EXPECT_EQ(inner.name, "inner");
	EXPECT_EQ(inner.upvalueCount, 1);
	EXPECT_TRUE(containsOp(inner, Op::GetUpvalue));
}

TEST_F(CompilerTest, LambdasAreAnonymous)
{
	const auto result = compile("var f = fun() { return 1; };");
	ASSERT_FALSE(result.hadError());
	EXPECT_EQ(functionConstant(*result.program, 0).name, "anonymous");
}

TEST_F(CompilerTest, RedeclaredGlobal)
{
	const auto result = compile("var x = 1;\nvar x = 2;");
	ASSERT_TRUE(result.hadError());
	EXPECT_EQ(result.error->type, CompileErrorType::DuplicateDeclaration);
	EXPECT_EQ(result.error->message, "redeclaration of global 'x'");
	EXPECT_EQ(result.error->position.line, 2);
	EXPECT_EQ(result.program, nullptr);
}

TEST_F(CompilerTest, RedeclaredLocal)
{
	const auto result = compile("{ var x = 1; var x = 2; }");
	ASSERT_TRUE(result.hadError());
	EXPECT_EQ(result.error->type, CompileErrorType::DuplicateDeclaration);
}

TEST_F(CompilerTest, ShadowingInInnerScopeIsAllowed)
{
	const auto result = compile("var x = 1; { var x = 2; { var x = 3; } }");
	EXPECT_FALSE(result.hadError());
}

TEST_F(CompilerTest, DuplicateStructField)
{
	const auto result = compile("struct A { x, x }");
	ASSERT_TRUE(result.hadError());
	EXPECT_EQ(result.error->type, CompileErrorType::DuplicateDeclaration);
	EXPECT_EQ(result.error->message, "redeclaration of field 'x'");
}

TEST_F(CompilerTest, ReturnOutsideOfFunction)
{
	const auto result = compile("return 1;");
	ASSERT_TRUE(result.hadError());
	EXPECT_EQ(result.error->type, CompileErrorType::Semantic);
	EXPECT_EQ(result.error->message, "cannot return outside of a function");
}

TEST_F(CompilerTest, BreakOutsideOfLoop)
{
	const auto result = compile("break;");
	ASSERT_TRUE(result.hadError());
	EXPECT_EQ(result.error->message, "cannot use break outside of a loop");
}

TEST_F(CompilerTest, BreakInsideFunctionInsideLoop)
{
	const auto result = compile("loop { fun f() { continue; } }");
	ASSERT_TRUE(result.hadError());
	EXPECT_EQ(result.error->message, "cannot use continue outside of a loop");
}

TEST_F(CompilerTest, InvalidAssignmentTarget)
{
	const auto result = compile("1 = 2");
	ASSERT_TRUE(result.hadError());
	EXPECT_EQ(result.error->message, "invalid left side of assignment");
}

TEST_F(CompilerTest, TooManyLocals)
{
	std::string source = "fun f() {";
	for (size_t i = 0; i <= Compiler::MAX_LOCALS; i++)
	{
		source += " var v" + std::to_string(i) + ";";
	}
	source += " }";
	const auto result = compile(source);
	ASSERT_TRUE(result.hadError());
	EXPECT_EQ(result.error->message, "too many local variables in function");
}
