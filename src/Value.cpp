#include <Value.hpp>

using namespace Lla;

bool ObjHandle::operator==(const ObjHandle& other) const
{
	return index == other.index;
}

bool ObjHandle::operator!=(const ObjHandle& other) const
{
	return index != other.index;
}

size_t ObjHandle::Hasher::operator()(const ObjHandle& handle) const
{
	return std::hash<uint32_t>()(handle.index);
}

Value::Value()
	: type(ValueType::Nil)
{
	as.number = 0.0;
}

Value::Value(Float number)
	: type(ValueType::Number)
{
	as.number = number;
}

Value::Value(bool boolean)
	: type(ValueType::Bool)
{
	as.boolean = boolean;
}

Value::Value(ObjHandle obj)
	: type(ValueType::Obj)
{
	as.obj = obj;
}

bool Value::operator==(const Value& other) const
{
	if (type != other.type)
		return false;

	switch (type)
	{
	case ValueType::Number: return as.number == other.as.number;
	case ValueType::Bool: return as.boolean == other.as.boolean;
	case ValueType::Nil: return true;
	case ValueType::Obj: return as.obj == other.as.obj;
	}

	ASSERT_NOT_REACHED();
	return false;
}

bool Value::operator!=(const Value& other) const
{
	return (*this == other) == false;
}

Value Value::nil()
{
	return Value();
}

const char* Lla::valueTypeName(ValueType type)
{
	switch (type)
	{
	case ValueType::Number: return "number";
	case ValueType::Bool: return "bool";
	case ValueType::Nil: return "nil";
	case ValueType::Obj: return "object";
	}

	ASSERT_NOT_REACHED();
	return "";
}
