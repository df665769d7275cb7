#include <Obj.hpp>

using namespace Lla;

Obj::Obj(ObjType type)
	: type(type)
	, isMarked(false)
	, size(0)
{}

#define GENERATE_HELPERS(objType) \
	Obj##objType* Obj::as##objType() \
	{ \
		ASSERT(is##objType()); \
		return static_cast<Obj##objType*>(this); \
	} \
	const Obj##objType* Obj::as##objType() const \
	{ \
		ASSERT(is##objType()); \
		return static_cast<const Obj##objType*>(this); \
	}

OBJ_TYPE_LIST(GENERATE_HELPERS)
#undef GENERATE_HELPERS

const char* Lla::objTypeName(ObjType type)
{
	switch (type)
	{
	case ObjType::String: return "string";
	case ObjType::Function: return "function";
	case ObjType::Closure: return "function";
	case ObjType::Upvalue: return "upvalue";
	case ObjType::NativeFunction: return "native function";
	case ObjType::Struct: return "struct";
	case ObjType::Instance: return "instance";
	}

	ASSERT_NOT_REACHED();
	return "";
}

ObjString::ObjString(std::string chars)
	: Obj(ObjType::String)
	, chars(std::move(chars))
{}

ObjFunction::ObjFunction(std::shared_ptr<const Chunk> chunk)
	: Obj(ObjType::Function)
	, chunk(std::move(chunk))
{}

const std::string& ObjFunction::name() const
{
	return chunk->name;
}

int ObjFunction::argCount() const
{
	return chunk->argCount;
}

ObjClosure::ObjClosure(ObjHandle function)
	: Obj(ObjType::Closure)
	, function(function)
{}

ObjUpvalue::ObjUpvalue(size_t stackIndex)
	: Obj(ObjType::Upvalue)
	, stackIndex(stackIndex)
{}

bool ObjUpvalue::isOpen() const
{
	return stackIndex != CLOSED;
}

ObjNativeFunction::ObjNativeFunction(std::string name, NativeFunction function, int argCount, void* context)
	: Obj(ObjType::NativeFunction)
	, name(std::move(name))
	, function(function)
	, argCount(argCount)
	, context(context)
{}

ObjStruct::ObjStruct(ObjHandle name, std::vector<ObjHandle> fieldNames)
	: Obj(ObjType::Struct)
	, name(name)
	, fieldNames(std::move(fieldNames))
{}

size_t ObjStruct::fieldIndex(ObjHandle fieldName) const
{
	for (size_t i = 0; i < fieldNames.size(); i++)
	{
		if (fieldNames[i] == fieldName)
			return i;
	}
	return fieldNames.size();
}

ObjInstance::ObjInstance(ObjHandle struct_, size_t fieldCount)
	: Obj(ObjType::Instance)
	, struct_(struct_)
	, fields(fieldCount)
{}
