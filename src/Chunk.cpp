#include <Chunk.hpp>

using namespace Lla;

Constant Constant::number(Float value)
{
	Constant constant;
	constant.type = Type::Number;
	constant.numberValue = value;
	return constant;
}

Constant Constant::string(std::string value)
{
	Constant constant;
	constant.type = Type::String;
	constant.numberValue = 0.0;
	constant.stringValue = std::move(value);
	return constant;
}

Constant Constant::function(std::shared_ptr<const Chunk> value)
{
	Constant constant;
	constant.type = Type::Function;
	constant.numberValue = 0.0;
	constant.functionValue = std::move(value);
	return constant;
}
