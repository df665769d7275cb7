#include <gtest/gtest.h>

#include <Repl.hpp>
#include <cstdlib>
#include <sstream>
#include <string>

using namespace Lla;

class ReplTest : public ::testing::Test
{
protected:
	int run(const char* input)
	{
		std::stringstream in(input);
		return runRepl(in, output, errorOutput);
	}

	std::stringstream output;
	std::stringstream errorOutput;
};

TEST_F(ReplTest, GlobalsPersistBetweenLines)
{
	EXPECT_EQ(run("var x = 1;\nx + 1\n"), EXIT_SUCCESS);
	EXPECT_EQ(output.str(), ">>> >>> 2\n>>> \n");
	EXPECT_TRUE(errorOutput.str().empty());
}

TEST_F(ReplTest, UnfinishedInputContinuesOnNextLine)
{
	run("var x = 7;\nfun f() {\nreturn x;\n}\nf()\n");
	EXPECT_EQ(output.str(), ">>> >>> ... ... >>> 7\n>>> \n");
	EXPECT_TRUE(errorOutput.str().empty());
}

TEST_F(ReplTest, ErrorsDontEndTheSession)
{
	run("1 +* 2\nundefinedName\nprint \"still running\";\n");
	EXPECT_NE(errorOutput.str().find("ParseError: expected expression, found '*'"), std::string::npos);
	EXPECT_NE(errorOutput.str().find("UndefinedGlobalError: 'undefinedName' is not defined"), std::string::npos);
	EXPECT_NE(output.str().find("still running\n"), std::string::npos);
}

TEST_F(ReplTest, BuiltinsAreDefined)
{
	run("str(12) + \"!\"\n");
	EXPECT_EQ(output.str(), ">>> 12!\n>>> \n");
}
