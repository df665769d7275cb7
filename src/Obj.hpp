#pragma once

#include <Value.hpp>
#include <Chunk.hpp>
#include <memory>
#include <string>
#include <vector>

namespace Lla
{

#define OBJ_TYPE_LIST(macro) \
	macro(String) \
	macro(Function) \
	macro(Closure) \
	macro(Upvalue) \
	macro(NativeFunction) \
	macro(Struct) \
	macro(Instance)

enum class ObjType : uint8_t
{
#define COMMA(type) type,
	OBJ_TYPE_LIST(COMMA)
#undef COMMA
};

#define FORWARD_DECLARE(type) struct Obj##type;
OBJ_TYPE_LIST(FORWARD_DECLARE)
#undef FORWARD_DECLARE

struct Obj
{
	Obj(ObjType type);
	virtual ~Obj() = default;

	ObjType type;
	bool isMarked;
	// Bytes accounted to the object by the allocator.
	size_t size;

#define GENERATE_HELPERS(objType) \
	bool is##objType() const \
	{ \
		return type == ObjType::objType; \
	} \
	Obj##objType* as##objType(); \
	const Obj##objType* as##objType() const;

	OBJ_TYPE_LIST(GENERATE_HELPERS)
#undef GENERATE_HELPERS
};

const char* objTypeName(ObjType type);

struct ObjString final : public Obj
{
	ObjString(std::string chars);

	std::string chars;
};

struct ObjFunction final : public Obj
{
	ObjFunction(std::shared_ptr<const Chunk> chunk);

	const std::string& name() const;
	int argCount() const;

	std::shared_ptr<const Chunk> chunk;
	// The chunk's constant pool materialized on the heap. Filled in by the Vm when the function is loaded.
	std::vector<Value> constants;
};

struct ObjClosure final : public Obj
{
	ObjClosure(ObjHandle function);

	ObjHandle function;
	std::vector<ObjHandle> upvalues;
};

struct ObjUpvalue final : public Obj
{
	static constexpr size_t CLOSED = SIZE_MAX;

	ObjUpvalue(size_t stackIndex);

	bool isOpen() const;

	// While the upvalue is open the variable lives on the Vm stack at stackIndex.
	size_t stackIndex;
	Value value;
};

class Context;
using NativeFunction = Value(*)(Context&);

struct ObjNativeFunction final : public Obj
{
	ObjNativeFunction(std::string name, NativeFunction function, int argCount, void* context);

	std::string name;
	NativeFunction function;
	int argCount;
	void* context;
};

struct ObjStruct final : public Obj
{
	ObjStruct(ObjHandle name, std::vector<ObjHandle> fieldNames);

	// Returns fieldNames.size() if there is no such field.
	size_t fieldIndex(ObjHandle fieldName) const;

	ObjHandle name;
	std::vector<ObjHandle> fieldNames;
};

struct ObjInstance final : public Obj
{
	ObjInstance(ObjHandle struct_, size_t fieldCount);

	ObjHandle struct_;
	std::vector<Value> fields;
};

}
