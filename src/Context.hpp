#pragma once

#include <Allocator.hpp>
#include <Errors.hpp>
#include <string>
#include <string_view>

// Interface used by native functions to access their arguments and the heap.

namespace Lla
{

// Thrown by native functions. The Vm turns it into a RuntimeError.
class NativeException
{
public:
	NativeException(RuntimeErrorType type, std::string message);

	RuntimeErrorType type;
	std::string message;
};

class Context;

// Keeps the value alive while it exists. Values returned from allocating functions aren't rooted anywhere,
// so they have to be stored in a LocalValue if anything else is allocated before they are returned.
class LocalValue
{
public:
	LocalValue(const Value& value, Context& context);
	LocalValue(const LocalValue& other);
	LocalValue(std::string_view string, Context& context);
	~LocalValue();
	LocalValue& operator=(const LocalValue&) = delete;

	static LocalValue number(Float value, Context& context);
	static LocalValue boolean(bool value, Context& context);
	static LocalValue nil(Context& context);

	bool isNumber() const;
	Float asNumber() const;
	bool isBool() const;
	bool asBool() const;
	bool isNil() const;
	bool isString() const;
	std::string_view asString() const;

public:
	Value value;
private:
	Context& m_context;
};

class Context
{
public:
	Context(Value* args, int argCount, Allocator& allocator, void* data);

	const Value& args(size_t index) const;
	int argCount() const;

	// These throw a RuntimeTypeError NativeException if the argument has a different type.
	Float getNumber(size_t index) const;
	bool getBool(size_t index) const;
	std::string_view getString(size_t index) const;

	std::string_view typeName(const Value& value) const;
	std::string toString(const Value& value) const;

	// The data the native function was registered with.
	template<typename T>
	T* data();

private:
	[[noreturn]] void throwArgumentTypeError(size_t index, const char* expected) const;

public:
	Allocator& allocator;

private:
	Value* const m_args;
	const int m_argCount;
	void* const m_data;
};

template<typename T>
T* Context::data()
{
	return static_cast<T*>(m_data);
}

}
