#include <Context.hpp>
#include <Format.hpp>
#include <Asserts.hpp>

using namespace Lla;

NativeException::NativeException(RuntimeErrorType type, std::string message)
	: type(type)
	, message(std::move(message))
{}

LocalValue::LocalValue(const Value& value, Context& context)
	: value(value)
	, m_context(context)
{
	m_context.allocator.registerLocal(&this->value);
}

LocalValue::LocalValue(const LocalValue& other)
	: value(other.value)
	, m_context(other.m_context)
{
	m_context.allocator.registerLocal(&this->value);
}

LocalValue::LocalValue(std::string_view string, Context& context)
	: LocalValue(Value(context.allocator.allocateString(string)), context)
{}

LocalValue::~LocalValue()
{
	m_context.allocator.unregisterLocal(&value);
}

LocalValue LocalValue::number(Float value, Context& context)
{
	return LocalValue(Value(value), context);
}

LocalValue LocalValue::boolean(bool value, Context& context)
{
	return LocalValue(Value(value), context);
}

LocalValue LocalValue::nil(Context& context)
{
	return LocalValue(Value::nil(), context);
}

bool LocalValue::isNumber() const
{
	return value.isNumber();
}

Float LocalValue::asNumber() const
{
	return value.asNumber();
}

bool LocalValue::isBool() const
{
	return value.isBool();
}

bool LocalValue::asBool() const
{
	return value.asBool();
}

bool LocalValue::isNil() const
{
	return value.isNil();
}

bool LocalValue::isString() const
{
	return value.isObj() && m_context.allocator.get(value.as.obj)->isString();
}

std::string_view LocalValue::asString() const
{
	ASSERT(isString());
	return m_context.allocator.get(value.as.obj)->asString()->chars;
}

Context::Context(Value* args, int argCount, Allocator& allocator, void* data)
	: allocator(allocator)
	, m_args(args)
	, m_argCount(argCount)
	, m_data(data)
{}

const Value& Context::args(size_t index) const
{
	ASSERT(index < static_cast<size_t>(m_argCount));
	return m_args[index];
}

int Context::argCount() const
{
	return m_argCount;
}

Float Context::getNumber(size_t index) const
{
	const auto& value = args(index);
	if (value.isNumber() == false)
		throwArgumentTypeError(index, "number");
	return value.asNumber();
}

bool Context::getBool(size_t index) const
{
	const auto& value = args(index);
	if (value.isBool() == false)
		throwArgumentTypeError(index, "bool");
	return value.asBool();
}

std::string_view Context::getString(size_t index) const
{
	const auto& value = args(index);
	if ((value.isObj() == false) || (allocator.get(value.as.obj)->isString() == false))
		throwArgumentTypeError(index, "string");
	return allocator.get(value.as.obj)->asString()->chars;
}

std::string_view Context::typeName(const Value& value) const
{
	return allocator.typeName(value);
}

std::string Context::toString(const Value& value) const
{
	return allocator.toString(value);
}

void Context::throwArgumentTypeError(size_t index, const char* expected) const
{
	const auto found = typeName(args(index));
	throw NativeException(
		RuntimeErrorType::Type,
		formatToString("expected argument %zu to be %s, found %.*s", index, expected, static_cast<int>(found.size()), found.data()));
}
