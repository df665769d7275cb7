#include <Builtins.hpp>
#include <chrono>

using namespace Lla;

Value Lla::str(Context& c)
{
	const auto& value = c.args(0);
	if (value.isObj() && c.allocator.get(value.as.obj)->isString())
		return value;
	return Value(c.allocator.allocateString(c.toString(value)));
}

Value Lla::clock(Context&)
{
	const auto sinceEpoch = std::chrono::steady_clock::now().time_since_epoch();
	return Value(std::chrono::duration<Float>(sinceEpoch).count());
}

void Lla::defineBuiltins(Globals& globals)
{
	globals.defineNativeFunction("str", Lla::str, 1);
	globals.defineNativeFunction("clock", Lla::clock, 0);
}
