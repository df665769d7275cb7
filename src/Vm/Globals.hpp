#pragma once

#include <Allocator.hpp>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace Lla
{

class Vm;

// Global variables of a program. Owned by the caller so they can be kept between executions, for example in a REPL.
// The values live on the heap of the Vm the table was created for, so it has to be destroyed before the Vm.
class Globals
{
public:
	explicit Globals(Vm& vm);
	Globals(const Globals&) = delete;
	Globals& operator=(const Globals&) = delete;

	void set(std::string_view name, const Value& value);
	void set(ObjHandle name, const Value& value);
	std::optional<Value> get(std::string_view name) const;
	// Returns nullptr if the variable isn't defined.
	Value* at(ObjHandle name);
	bool contains(std::string_view name) const;
	size_t size() const;

	void defineNativeFunction(std::string_view name, NativeFunction function, int argCount, void* context = nullptr);

	const Allocator& allocator() const;

private:
	static void mark(Globals* globals, Allocator& allocator);

private:
	Allocator& m_allocator;
	// Keys are interned strings.
	std::unordered_map<ObjHandle, Value, ObjHandle::Hasher> m_values;
	Allocator::MarkingFunctionHandle m_markingFunctionHandle;
};

}
