#include <Allocator.hpp>
#include <Asserts.hpp>
#include <Debug/DebugOptions.hpp>
#include <Format.hpp>
#include <algorithm>

using namespace Lla;

Allocator::Allocator(const GcConfig& config)
	: m_config(config)
	, m_nextMarkingFunctionId(0)
	, m_bytesAllocated(0)
	, m_bytesAllocatedAfterWhichTheGcRuns(config.initialGcThreshold)
	, m_gcRunCount(0)
{}

Allocator::~Allocator()
{
	for (auto obj : m_objs)
	{
		delete obj;
	}
}

ObjHandle Allocator::allocateString(std::string_view chars)
{
	if (const auto string = findString(chars); string.has_value())
	{
		return *string;
	}

	const auto size = sizeof(ObjString) + chars.size();
	collectIfNeeded(size);
	auto obj = new ObjString(std::string(chars));
	const auto handle = insertObj(obj, size);
	m_stringPool[std::string_view(obj->chars)] = handle;
	return handle;
}

std::optional<ObjHandle> Allocator::findString(std::string_view chars) const
{
	const auto result = m_stringPool.find(chars);
	if (result == m_stringPool.end())
	{
		return std::nullopt;
	}
	return result->second;
}

ObjHandle Allocator::allocateFunction(std::shared_ptr<const Chunk> chunk)
{
	const auto size = sizeof(ObjFunction) + chunk->constants.size() * sizeof(Value);
	collectIfNeeded(size);
	return insertObj(new ObjFunction(std::move(chunk)), size);
}

ObjHandle Allocator::allocateClosure(ObjHandle function)
{
	const auto upvalueCount = static_cast<size_t>(get(function)->asFunction()->chunk->upvalueCount);
	const auto size = sizeof(ObjClosure) + upvalueCount * sizeof(ObjHandle);
	collectIfNeeded(size);
	auto obj = new ObjClosure(function);
	// Filled in by the caller, marking only looks at the upvalues already added.
	obj->upvalues.reserve(upvalueCount);
	return insertObj(obj, size);
}

ObjHandle Allocator::allocateUpvalue(size_t stackIndex)
{
	const auto size = sizeof(ObjUpvalue);
	collectIfNeeded(size);
	return insertObj(new ObjUpvalue(stackIndex), size);
}

ObjHandle Allocator::allocateNativeFunction(std::string_view name, NativeFunction function, int argCount, void* context)
{
	const auto size = sizeof(ObjNativeFunction) + name.size();
	collectIfNeeded(size);
	return insertObj(new ObjNativeFunction(std::string(name), function, argCount, context), size);
}

ObjHandle Allocator::allocateStruct(ObjHandle name, std::vector<ObjHandle> fieldNames)
{
	const auto size = sizeof(ObjStruct) + fieldNames.size() * sizeof(ObjHandle);
	collectIfNeeded(size);
	return insertObj(new ObjStruct(name, std::move(fieldNames)), size);
}

ObjHandle Allocator::allocateInstance(ObjHandle struct_)
{
	const auto fieldCount = get(struct_)->asStruct()->fieldNames.size();
	const auto size = sizeof(ObjInstance) + fieldCount * sizeof(Value);
	collectIfNeeded(size);
	return insertObj(new ObjInstance(struct_, fieldCount), size);
}

Obj* Allocator::get(ObjHandle handle)
{
	ASSERT(isAlive(handle));
	return m_objs[handle.index];
}

const Obj* Allocator::get(ObjHandle handle) const
{
	ASSERT(isAlive(handle));
	return m_objs[handle.index];
}

bool Allocator::isAlive(ObjHandle handle) const
{
	return (handle.index < m_objs.size()) && (m_objs[handle.index] != nullptr);
}

void Allocator::collectIfNeeded(size_t bytesToAllocate)
{
	auto shouldCollect = m_config.collectOnEveryAllocation
		|| ((m_bytesAllocated + bytesToAllocate) > m_bytesAllocatedAfterWhichTheGcRuns);
#ifdef LLA_DEBUG_STRESS_TEST_GC
	shouldCollect = true;
#endif

	if (shouldCollect)
	{
		runGc();
	}
}

ObjHandle Allocator::insertObj(Obj* obj, size_t size)
{
	obj->size = size;
	m_bytesAllocated += size;

	if (m_freeIndices.empty() == false)
	{
		const auto index = m_freeIndices.back();
		m_freeIndices.pop_back();
		m_objs[index] = obj;
		return ObjHandle{ index };
	}

	ASSERT(m_objs.size() < UINT32_MAX);
	m_objs.push_back(obj);
	return ObjHandle{ static_cast<uint32_t>(m_objs.size() - 1) };
}

void Allocator::markObj(Obj* obj)
{
	if (obj->isMarked)
		return;

	obj->isMarked = true;
	switch (obj->type)
	{
		case ObjType::String:
		case ObjType::NativeFunction:
			return;

		case ObjType::Function:
		{
			const auto function = obj->asFunction();
			for (const auto& constant : function->constants)
			{
				addValue(constant);
			}
			return;
		}

		case ObjType::Closure:
		{
			const auto closure = obj->asClosure();
			addObj(closure->function);
			for (const auto upvalue : closure->upvalues)
			{
				addObj(upvalue);
			}
			return;
		}

		case ObjType::Upvalue:
		{
			// An open upvalue's variable is on the Vm stack which is a root.
			addValue(obj->asUpvalue()->value);
			return;
		}

		case ObjType::Struct:
		{
			const auto struct_ = obj->asStruct();
			addObj(struct_->name);
			for (const auto fieldName : struct_->fieldNames)
			{
				addObj(fieldName);
			}
			return;
		}

		case ObjType::Instance:
		{
			const auto instance = obj->asInstance();
			addObj(instance->struct_);
			for (const auto& field : instance->fields)
			{
				addValue(field);
			}
			return;
		}
	}

	ASSERT_NOT_REACHED();
}

void Allocator::runGc()
{
	m_gcRunCount++;
	m_markedObjs.clear();

	for (const auto& entry : m_markingFunctions)
	{
		entry.function(*this);
	}

	for (const auto value : m_localValues)
	{
		addValue(*value);
	}

	while (m_markedObjs.empty() == false)
	{
		auto obj = m_markedObjs.back();
		m_markedObjs.pop_back();
		markObj(obj);
	}

	// The pool has to be pruned before the strings are freed because the keys point into them.
	for (auto it = m_stringPool.begin(); it != m_stringPool.end();)
	{
		if (m_objs[it->second.index]->isMarked)
			++it;
		else
			it = m_stringPool.erase(it);
	}

	for (size_t i = 0; i < m_objs.size(); i++)
	{
		auto obj = m_objs[i];
		if (obj == nullptr)
			continue;

		if (obj->isMarked)
		{
			obj->isMarked = false;
		}
		else
		{
			freeObj(static_cast<uint32_t>(i));
		}
	}

	const auto grownThreshold = static_cast<size_t>(static_cast<double>(m_bytesAllocated) * m_config.heapGrowthFactor);
	m_bytesAllocatedAfterWhichTheGcRuns = std::max(grownThreshold, m_config.initialGcThreshold);
}

void Allocator::freeObj(uint32_t index)
{
	auto obj = m_objs[index];
	m_bytesAllocated -= obj->size;
	delete obj;
	m_objs[index] = nullptr;
	m_freeIndices.push_back(index);
}

void Allocator::addObj(ObjHandle handle)
{
	// Marking a freed object means something wasn't rooted.
	ASSERT(isAlive(handle));
	m_markedObjs.push_back(m_objs[handle.index]);
}

void Allocator::addValue(const Value& value)
{
	if (value.isObj())
	{
		addObj(value.as.obj);
	}
}

void Allocator::unregisterMarkingFunction(size_t id)
{
	const auto entry = std::find_if(m_markingFunctions.begin(), m_markingFunctions.end(), [id](const MarkingFunctionEntry& entry)
	{
		return entry.id == id;
	});
	ASSERT(entry != m_markingFunctions.end());
	m_markingFunctions.erase(entry);
}

void Allocator::registerLocal(Value* value)
{
	const auto isNewItem = m_localValues.insert(value).second == true;
	ASSERT(isNewItem);
}

void Allocator::unregisterLocal(Value* value)
{
	const auto wasDeleted = m_localValues.erase(value) == 1;
	ASSERT(wasDeleted);
}

std::string_view Allocator::typeName(const Value& value) const
{
	if (value.isObj())
	{
		return objTypeName(get(value.as.obj)->type);
	}
	return valueTypeName(value.type);
}

std::string Allocator::toString(const Value& value) const
{
	switch (value.type)
	{
	case ValueType::Number: return numberToString(value.as.number);
	case ValueType::Bool: return value.as.boolean ? "true" : "false";
	case ValueType::Nil: return "nil";
	case ValueType::Obj: break;
	}

	const auto obj = get(value.as.obj);
	switch (obj->type)
	{
	case ObjType::String:
		return obj->asString()->chars;
	case ObjType::Function:
		return "<fn " + obj->asFunction()->name() + ">";
	case ObjType::Closure:
		return "<fn " + get(obj->asClosure()->function)->asFunction()->name() + ">";
	case ObjType::Upvalue:
		return "<upvalue>";
	case ObjType::NativeFunction:
		return "<native fn " + obj->asNativeFunction()->name + ">";
	case ObjType::Struct:
		return "<struct " + get(obj->asStruct()->name)->asString()->chars + ">";
	case ObjType::Instance:
	{
		const auto struct_ = get(obj->asInstance()->struct_)->asStruct();
		return "<" + get(struct_->name)->asString()->chars + " instance>";
	}
	}

	ASSERT_NOT_REACHED();
	return "";
}

size_t Allocator::liveObjectCount() const
{
	return m_objs.size() - m_freeIndices.size();
}

size_t Allocator::bytesAllocated() const
{
	return m_bytesAllocated;
}

size_t Allocator::nextGcThreshold() const
{
	return m_bytesAllocatedAfterWhichTheGcRuns;
}

size_t Allocator::gcRunCount() const
{
	return m_gcRunCount;
}

const GcConfig& Allocator::config() const
{
	return m_config;
}

Allocator::MarkingFunctionHandle::MarkingFunctionHandle(Allocator& allocator, size_t id)
	: m_allocator(allocator)
	, m_id(id)
{}

Allocator::MarkingFunctionHandle::~MarkingFunctionHandle()
{
	m_allocator.unregisterMarkingFunction(m_id);
}
