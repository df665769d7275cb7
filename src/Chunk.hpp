#pragma once

#include <ByteCode.hpp>
#include <Value.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Lla
{

struct Chunk;

// Constants don't reference the heap so a chunk can be compiled without a Vm and run by any number of them.
struct Constant
{
	enum class Type
	{
		Number,
		String,
		Function,
	};

	static Constant number(Float value);
	static Constant string(std::string value);
	static Constant function(std::shared_ptr<const Chunk> value);

	Type type;
	Float numberValue;
	std::string stringValue;
	std::shared_ptr<const Chunk> functionValue;
};

struct Chunk
{
	std::string name;
	int argCount;
	int upvalueCount;
	ByteCode byteCode;
	std::vector<Constant> constants;
};

}
