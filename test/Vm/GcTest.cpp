#include <gtest/gtest.h>

#include <Lla.hpp>
#include <Builtins.hpp>
#include <Debug/DebugOptions.hpp>
#include <Vm/Vm.hpp>
#include <algorithm>
#include <memory>
#include <sstream>

using namespace Lla;

class GcTest : public ::testing::Test
{
protected:
	void init(const GcConfig& config)
	{
		globals.reset();
		vm = std::make_unique<Vm>(config, output);
		globals = std::make_unique<Globals>(*vm);
		defineBuiltins(*globals);
	}

	ExecuteResult run(std::string_view source)
	{
		const auto compileResult = compile(source);
		EXPECT_FALSE(compileResult.hadError());
		if (compileResult.hadError())
			return ExecuteResult{ Value::nil(), std::nullopt };
		const auto result = vm->execute(compileResult.program, *globals);
		EXPECT_FALSE(result.hadError()) << result.error->message;
		return result;
	}

	std::stringstream output;
	std::unique_ptr<Vm> vm;
	std::unique_ptr<Globals> globals;
};

TEST_F(GcTest, UnreachableObjectsAreFreed)
{
	init(GcConfig());
	run("var i = 0; while i < 100 { var temporary = \"temp\" + str(i); i = i + 1; }");
	// Collecting before every allocation frees it early.
#ifndef LLA_DEBUG_STRESS_TEST_GC
	EXPECT_TRUE(vm->allocator().findString("temp42").has_value());
#endif

	vm->allocator().runGc();
	EXPECT_FALSE(vm->allocator().findString("temp42").has_value());
	EXPECT_TRUE(globals->contains("i"));
}

TEST_F(GcTest, GlobalsAreRoots)
{
	init(GcConfig());
	run("var s = \"a\" + \"b\"; struct P { x } var p = P(\"field\" + \"value\");");
	vm->allocator().runGc();

	const auto s = globals->get("s");
	ASSERT_TRUE(s.has_value());
	EXPECT_EQ(vm->allocator().toString(*s), "ab");
	EXPECT_TRUE(vm->allocator().findString("fieldvalue").has_value());
}

TEST_F(GcTest, ResultStaysAliveUntilNextExecute)
{
	init(GcConfig());
	const auto result = run("\"result\" + \"value\"");
	vm->allocator().runGc();
	ASSERT_TRUE(result.value.isObj());
	ASSERT_TRUE(vm->allocator().isAlive(result.value.asObj()));
	EXPECT_EQ(vm->allocator().toString(result.value), "resultvalue");

	run("1");
	vm->allocator().runGc();
	EXPECT_FALSE(vm->allocator().findString("resultvalue").has_value());
}

TEST_F(GcTest, CollectionRunsWhenThresholdIsReached)
{
	GcConfig config;
	config.initialGcThreshold = 1024;
	config.heapGrowthFactor = 2.0;
	init(config);

	run("var i = 0; var s = \"\"; while i < 1000 { s = str(i); i = i + 1; }");
	EXPECT_GT(vm->allocator().gcRunCount(), 0);
	EXPECT_EQ(globals->get("s").has_value(), true);
	EXPECT_EQ(vm->allocator().toString(*globals->get("s")), "999");
}

TEST_F(GcTest, ThresholdGrowsWithLiveHeap)
{
	GcConfig config;
	config.initialGcThreshold = 64;
	config.heapGrowthFactor = 3.0;
	init(config);

	run("var a = \"some string\"; var b = \"another string\";");
	auto& allocator = vm->allocator();
	allocator.runGc();
	const auto expected = static_cast<size_t>(static_cast<double>(allocator.bytesAllocated()) * 3.0);
	EXPECT_EQ(allocator.nextGcThreshold(), std::max(expected, config.initialGcThreshold));
}

TEST_F(GcTest, CollectingOnEveryAllocationKeepsProgramsCorrect)
{
	GcConfig config;
	config.collectOnEveryAllocation = true;
	init(config);

	const auto source =
		"struct Node { value, next }\n"
		"fun makeAdder(x) { return fun(y) { return str(x) + str(y); }; }\n"
		"var list = nil;\n"
		"var i = 0;\n"
		"while i < 20 {\n"
		"	list = Node(makeAdder(i), list);\n"
		"	i = i + 1;\n"
		"}\n"
		"var result = \"\";\n"
		"while list != nil {\n"
		"	result = result + list.value(\"-\");\n"
		"	list = list.next;\n"
		"}\n"
		"result";
	const auto result = run(source);
	ASSERT_TRUE(result.value.isObj());
	EXPECT_EQ(
		vm->allocator().toString(result.value),
		"19-18-17-16-15-14-13-12-11-10-9-8-7-6-5-4-3-2-1-0-");
	EXPECT_GT(vm->allocator().gcRunCount(), 20);
}

TEST_F(GcTest, LocalValuesAreRoots)
{
	init(GcConfig());
	auto& allocator = vm->allocator();
	Value value(allocator.allocateString("local"));
	allocator.registerLocal(&value);
	allocator.runGc();
	EXPECT_TRUE(allocator.isAlive(value.asObj()));
	allocator.unregisterLocal(&value);

	allocator.runGc();
	EXPECT_FALSE(allocator.findString("local").has_value());
}
