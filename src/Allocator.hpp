#pragma once

#include <Value.hpp>
#include <Obj.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Lla
{

struct GcConfig
{
	// Accounted bytes after which the first collection runs. Also the lowest the threshold can go.
	size_t initialGcThreshold = 1024 * 1024;
	// After a collection the next one runs when the heap grows to liveBytes * heapGrowthFactor.
	double heapGrowthFactor = 2.0;
	bool collectOnEveryAllocation = false;
};

class Allocator
{
public:
	// Unregisters the marking function when destroyed.
	class MarkingFunctionHandle
	{
	public:
		MarkingFunctionHandle(Allocator& allocator, size_t id);
		~MarkingFunctionHandle();
		MarkingFunctionHandle(const MarkingFunctionHandle&) = delete;
		MarkingFunctionHandle& operator=(const MarkingFunctionHandle&) = delete;

	private:
		Allocator& m_allocator;
		size_t m_id;
	};

private:
	struct MarkingFunctionEntry
	{
		std::function<void(Allocator&)> function;
		size_t id;
	};

public:
	explicit Allocator(const GcConfig& config = GcConfig());
	~Allocator();
	Allocator(const Allocator&) = delete;
	Allocator& operator=(const Allocator&) = delete;

	// The function is called at the start of every collection. It should add the roots it owns using addObj() and addValue().
	template<typename T>
	MarkingFunctionHandle registerMarkingFunction(T* data, void (*function)(T*, Allocator&));
	void unregisterMarkingFunction(size_t id);

	// Strings are interned, allocating the same text twice returns the same handle.
	ObjHandle allocateString(std::string_view chars);
	std::optional<ObjHandle> findString(std::string_view chars) const;
	ObjHandle allocateFunction(std::shared_ptr<const Chunk> chunk);
	ObjHandle allocateClosure(ObjHandle function);
	ObjHandle allocateUpvalue(size_t stackIndex);
	ObjHandle allocateNativeFunction(std::string_view name, NativeFunction function, int argCount, void* context);
	ObjHandle allocateStruct(ObjHandle name, std::vector<ObjHandle> fieldNames);
	ObjHandle allocateInstance(ObjHandle struct_);

	Obj* get(ObjHandle handle);
	const Obj* get(ObjHandle handle) const;
	bool isAlive(ObjHandle handle) const;

	void runGc();

	void addObj(ObjHandle handle);
	void addValue(const Value& value);

	// Registered values are roots until they are unregistered.
	void registerLocal(Value* value);
	void unregisterLocal(Value* value);

	std::string_view typeName(const Value& value) const;
	std::string toString(const Value& value) const;

	size_t liveObjectCount() const;
	size_t bytesAllocated() const;
	size_t nextGcThreshold() const;
	size_t gcRunCount() const;
	const GcConfig& config() const;

private:
	void collectIfNeeded(size_t bytesToAllocate);
	ObjHandle insertObj(Obj* obj, size_t size);
	void markObj(Obj* obj);
	void freeObj(uint32_t index);

private:
	GcConfig m_config;

	// Indexed by ObjHandle::index. Freed slots are nullptr and their indices are stored in m_freeIndices.
	std::vector<Obj*> m_objs;
	std::vector<uint32_t> m_freeIndices;

	std::vector<MarkingFunctionEntry> m_markingFunctions;
	size_t m_nextMarkingFunctionId;

	// A stack is used instead of recursion to avoid stack overflow.
	std::vector<Obj*> m_markedObjs;

	std::unordered_set<Value*> m_localValues;

	size_t m_bytesAllocated;
	size_t m_bytesAllocatedAfterWhichTheGcRuns;
	size_t m_gcRunCount;

	// The keys point into the ObjString chars.
	std::unordered_map<std::string_view, ObjHandle> m_stringPool;
};

}

template<typename T>
Lla::Allocator::MarkingFunctionHandle Lla::Allocator::registerMarkingFunction(T* data, void (*function)(T*, Allocator&))
{
	const auto id = m_nextMarkingFunctionId;
	m_nextMarkingFunctionId++;

	m_markingFunctions.push_back(MarkingFunctionEntry{
		[data, function](Allocator& allocator) { function(data, allocator); },
		id
	});

	return MarkingFunctionHandle(*this, id);
}
