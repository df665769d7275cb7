#include <Vm/Globals.hpp>
#include <Vm/Vm.hpp>

using namespace Lla;

Globals::Globals(Vm& vm)
	: m_allocator(vm.allocator())
	, m_markingFunctionHandle(m_allocator.registerMarkingFunction(this, mark))
{}

void Globals::set(std::string_view name, const Value& value)
{
	// The value isn't rooted while the name is allocated.
	Value rootedValue = value;
	m_allocator.registerLocal(&rootedValue);
	const auto nameHandle = m_allocator.allocateString(name);
	m_allocator.unregisterLocal(&rootedValue);
	set(nameHandle, rootedValue);
}

void Globals::set(ObjHandle name, const Value& value)
{
	m_values[name] = value;
}

std::optional<Value> Globals::get(std::string_view name) const
{
	const auto nameHandle = m_allocator.findString(name);
	if (nameHandle.has_value() == false)
		return std::nullopt;

	const auto value = m_values.find(*nameHandle);
	if (value == m_values.end())
		return std::nullopt;
	return value->second;
}

Value* Globals::at(ObjHandle name)
{
	const auto value = m_values.find(name);
	if (value == m_values.end())
		return nullptr;
	return &value->second;
}

bool Globals::contains(std::string_view name) const
{
	return get(name).has_value();
}

size_t Globals::size() const
{
	return m_values.size();
}

void Globals::defineNativeFunction(std::string_view name, NativeFunction function, int argCount, void* context)
{
	const auto functionHandle = m_allocator.allocateNativeFunction(name, function, argCount, context);
	set(name, Value(functionHandle));
}

const Allocator& Globals::allocator() const
{
	return m_allocator;
}

void Globals::mark(Globals* globals, Allocator& allocator)
{
	for (const auto& [name, value] : globals->m_values)
	{
		allocator.addObj(name);
		allocator.addValue(value);
	}
}
