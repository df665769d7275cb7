#pragma once

#include <Asserts.hpp>
#include <stdint.h>
#include <stddef.h>
#include <functional>

namespace Lla
{

using Float = double;

// Index of an object inside the Allocator's arena. Handles of freed objects are reused.
struct ObjHandle
{
	uint32_t index;

	bool operator==(const ObjHandle& other) const;
	bool operator!=(const ObjHandle& other) const;

	struct Hasher
	{
		size_t operator()(const ObjHandle& handle) const;
	};
};

#define VALUE_TYPE_LIST(macro) \
	macro(Number) \
	macro(Bool) \
	macro(Nil) \
	macro(Obj)

enum class ValueType : uint8_t
{
#define COMMA(type) type,
	VALUE_TYPE_LIST(COMMA)
#undef COMMA
};

class Value
{
public:
	Value();
	explicit Value(Float number);
	explicit Value(bool boolean);
	explicit Value(ObjHandle obj);

#define GENERATE_HELPERS(valueType) \
	bool is##valueType() const \
	{ \
		return type == ValueType::valueType; \
	}
	VALUE_TYPE_LIST(GENERATE_HELPERS)
#undef GENERATE_HELPERS

	Float asNumber() const
	{
		ASSERT(isNumber());
		return as.number;
	}

	bool asBool() const
	{
		ASSERT(isBool());
		return as.boolean;
	}

	ObjHandle asObj() const
	{
		ASSERT(isObj());
		return as.obj;
	}

	// Objects compare by identity. Strings are interned so identity is equality.
	bool operator==(const Value& other) const;
	bool operator!=(const Value& other) const;

public:
	static Value nil();

	ValueType type;

	union
	{
		Float number;
		bool boolean;
		ObjHandle obj;
	} as;
};

const char* valueTypeName(ValueType type);

}
