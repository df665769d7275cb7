#pragma once

#include <Allocator.hpp>
#include <Chunk.hpp>
#include <Errors.hpp>
#include <ErrorReporter.hpp>
#include <StaticStack.hpp>
#include <Vm/Globals.hpp>
#include <iostream>
#include <memory>
#include <optional>

namespace Lla
{

enum class VmState
{
	Ready,
	Running,
	PausedOnError,
	Halted,
};

const char* vmStateName(VmState state);

struct ExecuteResult
{
	bool hadError() const;

	// Stays alive until the next call to execute().
	Value value;
	std::optional<RuntimeError> error;
};

class Vm
{
public:
	static constexpr size_t STACK_SIZE = 8192;
	static constexpr size_t CALL_STACK_SIZE = 256;

private:
	struct CallFrame
	{
		const uint8_t* instructionPointer;
		// Index of the first argument. The callee is below it.
		size_t base;
		ObjClosure* closure;
		ObjFunction* function;
	};

	enum class [[nodiscard]] Result
	{
		Ok,
		Error,
	};

public:
	explicit Vm(const GcConfig& gcConfig = GcConfig(), std::ostream& output = std::cout);
	Vm(const Vm&) = delete;
	Vm& operator=(const Vm&) = delete;

	ExecuteResult execute(std::shared_ptr<const Chunk> program, Globals& globals, ErrorReporter* errorReporter = nullptr);
	// Executes with fresh globals.
	ExecuteResult execute(std::shared_ptr<const Chunk> program, ErrorReporter* errorReporter = nullptr);
	// Discards the state left after an error.
	void reset();

	VmState state() const;
	Allocator& allocator();
	const Allocator& allocator() const;
	size_t stackSize() const;
	size_t callStackSize() const;

private:
	Result run();

	uint32_t readUint32();
	uint8_t readUint8();
	const Value& readConstant();

	// Allocates the function and all the functions nested in its constants.
	ObjHandle loadFunction(const std::shared_ptr<const Chunk>& chunk);

	Result error(RuntimeErrorType type, const char* format, ...);
	Result typeErrorBinary(const char* op, const Value& lhs, const Value& rhs);
	Result callValue(const Value& callee, int argCount);
	Result callClosure(ObjClosure* closure, int argCount);
	Result callNativeFunction(ObjNativeFunction* function, int argCount);
	Result constructInstance(ObjHandle structHandle, int argCount);
	Result checkCondition(const Value& value);

	ObjHandle captureUpvalue(size_t stackIndex);
	// Closes all the open upvalues pointing at or above the stack index.
	void closeUpvalues(size_t stackIndex);

	bool isString(const Value& value) const;
	ObjString* asString(const Value& value);
	std::string_view typeName(const Value& value) const;
	std::vector<StackTraceEntry> stackTrace() const;
	void debugPrintStack();

	static void mark(Vm* vm, Allocator& allocator);

private:
	Allocator m_allocator;
	std::ostream& m_output;
	VmState m_state;

	StaticStack<Value, STACK_SIZE> m_stack;
	StaticStack<CallFrame, CALL_STACK_SIZE> m_callStack;
	std::vector<ObjHandle> m_openUpvalues;

	Globals* m_globals;
	ErrorReporter* m_errorReporter;
	std::optional<RuntimeError> m_error;
	Value m_result;
	// Functions that are allocated but not yet reachable from anything else.
	std::vector<ObjHandle> m_functionsBeingLoaded;

	Allocator::MarkingFunctionHandle m_rootMarkingFunctionHandle;
};

}
