#include <Vm/Vm.hpp>
#include <Context.hpp>
#include <Debug/DebugOptions.hpp>
#include <Debug/Disassembler.hpp>
#include <Asserts.hpp>
#include <Format.hpp>
#include <algorithm>
#include <math.h>
#include <stdarg.h>

using namespace Lla;

#define TRY(somethingThatReturnsResult) \
	do \
	{ \
		if ((somethingThatReturnsResult) == Result::Error) \
		{ \
			return Result::Error; \
		} \
	} while (false)

#define TRY_PUSH(value) \
	do \
	{ \
		if (m_stack.push(value) == false) \
		{ \
			return error(RuntimeErrorType::StackOverflow, "stack overflow"); \
		} \
	} while (false)

#define TRY_PUSH_CALL_STACK() \
	do \
	{ \
		if (m_callStack.push() == false) \
		{ \
			return error(RuntimeErrorType::StackOverflow, "call stack overflow"); \
		} \
	} while (false)

const char* Lla::vmStateName(VmState state)
{
	switch (state)
	{
	case VmState::Ready: return "ready";
	case VmState::Running: return "running";
	case VmState::PausedOnError: return "paused on error";
	case VmState::Halted: return "halted";
	}

	ASSERT_NOT_REACHED();
	return "";
}

bool ExecuteResult::hadError() const
{
	return error.has_value();
}

Vm::Vm(const GcConfig& gcConfig, std::ostream& output)
	: m_allocator(gcConfig)
	, m_output(output)
	, m_state(VmState::Ready)
	, m_globals(nullptr)
	, m_errorReporter(nullptr)
	, m_rootMarkingFunctionHandle(m_allocator.registerMarkingFunction(this, mark))
{}

ExecuteResult Vm::execute(std::shared_ptr<const Chunk> program, Globals& globals, ErrorReporter* errorReporter)
{
	ASSERT(m_state != VmState::Running);
	ASSERT(&globals.allocator() == &m_allocator);

	reset();
	m_globals = &globals;
	m_errorReporter = errorReporter;
	m_state = VmState::Running;

	const auto function = loadFunction(program);
	const auto closure = m_allocator.allocateClosure(function);
	auto result = Result::Error;
	if (m_stack.push(Value(closure)))
	{
		m_functionsBeingLoaded.clear();
		if (callClosure(m_allocator.get(closure)->asClosure(), 0) == Result::Ok)
		{
			result = run();
		}
	}
	else
	{
		result = error(RuntimeErrorType::StackOverflow, "stack overflow");
	}
	m_globals = nullptr;

	if (result == Result::Error)
	{
		m_state = VmState::PausedOnError;
		if (m_errorReporter != nullptr)
		{
			m_errorReporter->onVmError(*m_error);
		}
		return ExecuteResult{ Value::nil(), m_error };
	}

	// The program should always finish without anything on both the execution and call stack.
	ASSERT(m_stack.isEmpty());
	ASSERT(m_callStack.isEmpty());
	ASSERT(m_openUpvalues.empty());
	m_state = VmState::Halted;
	return ExecuteResult{ m_result, std::nullopt };
}

ExecuteResult Vm::execute(std::shared_ptr<const Chunk> program, ErrorReporter* errorReporter)
{
	Globals globals(*this);
	return execute(std::move(program), globals, errorReporter);
}

void Vm::reset()
{
	m_stack.clear();
	m_callStack.clear();
	m_openUpvalues.clear();
	m_functionsBeingLoaded.clear();
	m_error = std::nullopt;
	m_result = Value::nil();
	m_state = VmState::Ready;
}

VmState Vm::state() const
{
	return m_state;
}

Allocator& Vm::allocator()
{
	return m_allocator;
}

const Allocator& Vm::allocator() const
{
	return m_allocator;
}

size_t Vm::stackSize() const
{
	return m_stack.size();
}

size_t Vm::callStackSize() const
{
	return m_callStack.size();
}

Vm::Result Vm::run()
{
	for (;;)
	{
	#ifdef LLA_DEBUG_PRINT_VM_EXECUTION_TRACE
		debugPrintStack();
		{
			const auto& frame = m_callStack.top();
			const auto& chunk = *frame.function->chunk;
			disassembleInstruction(chunk, frame.instructionPointer - chunk.byteCode.code.data(), std::cout);
			std::cout << '\n';
		}
	#endif

		const auto op = static_cast<Op>(readUint8());

		switch (op)
		{

#define BINARY_ARITHMETIC_OP(op, opString) \
		{ \
			const auto lhs = m_stack.peek(1); \
			const auto rhs = m_stack.peek(0); \
			if ((lhs.isNumber() == false) || (rhs.isNumber() == false)) \
			{ \
				return typeErrorBinary(opString, lhs, rhs); \
			} \
			m_stack.pop(); \
			m_stack.top() = Value(lhs.asNumber() op rhs.asNumber()); \
			break; \
		}

		case Op::Add:
		{
			const auto lhs = m_stack.peek(1);
			const auto rhs = m_stack.peek(0);
			if (lhs.isNumber() && rhs.isNumber())
			{
				m_stack.pop();
				m_stack.top() = Value(lhs.asNumber() + rhs.asNumber());
			}
			else if (isString(lhs) && isString(rhs))
			{
				// Both operands stay on the stack until the result is allocated.
				const auto chars = asString(lhs)->chars + asString(rhs)->chars;
				const auto result = Value(m_allocator.allocateString(chars));
				m_stack.pop();
				m_stack.top() = result;
			}
			else
			{
				return typeErrorBinary("+", lhs, rhs);
			}
			break;
		}
		case Op::Subtract: BINARY_ARITHMETIC_OP(-, "-")
		case Op::Multiply: BINARY_ARITHMETIC_OP(*, "*")
		case Op::Divide: BINARY_ARITHMETIC_OP(/, "/")

#undef BINARY_ARITHMETIC_OP

		case Op::Modulo:
		{
			const auto lhs = m_stack.peek(1);
			const auto rhs = m_stack.peek(0);
			if ((lhs.isNumber() == false) || (rhs.isNumber() == false))
			{
				return typeErrorBinary("%", lhs, rhs);
			}
			m_stack.pop();
			m_stack.top() = Value(fmod(lhs.asNumber(), rhs.asNumber()));
			break;
		}

#define BINARY_COMPARISON_OP(op, opString) \
		{ \
			const auto lhs = m_stack.peek(1); \
			const auto rhs = m_stack.peek(0); \
			bool result; \
			if (lhs.isNumber() && rhs.isNumber()) \
			{ \
				result = lhs.asNumber() op rhs.asNumber(); \
			} \
			else if (isString(lhs) && isString(rhs)) \
			{ \
				result = asString(lhs)->chars op asString(rhs)->chars; \
			} \
			else \
			{ \
				return typeErrorBinary(opString, lhs, rhs); \
			} \
			m_stack.pop(); \
			m_stack.top() = Value(result); \
			break; \
		}

		case Op::Less: BINARY_COMPARISON_OP(<, "<")
		case Op::LessEqual: BINARY_COMPARISON_OP(<=, "<=")
		case Op::More: BINARY_COMPARISON_OP(>, ">")
		case Op::MoreEqual: BINARY_COMPARISON_OP(>=, ">=")

#undef BINARY_COMPARISON_OP

		case Op::Equals:
		{
			const auto rhs = m_stack.peek(0);
			m_stack.pop();
			m_stack.top() = Value(m_stack.top() == rhs);
			break;
		}

		case Op::NotEquals:
		{
			const auto rhs = m_stack.peek(0);
			m_stack.pop();
			m_stack.top() = Value(m_stack.top() != rhs);
			break;
		}

		case Op::Negate:
		{
			auto& value = m_stack.top();
			if (value.isNumber() == false)
			{
				const auto type = typeName(value);
				return error(RuntimeErrorType::Type, "cannot negate %.*s", static_cast<int>(type.size()), type.data());
			}
			value = Value(-value.asNumber());
			break;
		}

		case Op::Not:
		{
			auto& value = m_stack.top();
			if (value.isBool() == false)
			{
				const auto type = typeName(value);
				return error(RuntimeErrorType::Type, "cannot apply '!' to %.*s", static_cast<int>(type.size()), type.data());
			}
			value = Value(value.asBool() == false);
			break;
		}

		case Op::GetConstant:
		{
			const auto constant = readConstant();
			TRY_PUSH(constant);
			break;
		}

		case Op::GetLocal:
		{
			const auto index = readUint32();
			const auto value = m_stack[m_callStack.top().base + index];
			TRY_PUSH(value);
			break;
		}

		case Op::SetLocal:
		{
			const auto index = readUint32();
			m_stack[m_callStack.top().base + index] = m_stack.top();
			break;
		}

		case Op::DefineGlobal:
		{
			const auto name = readConstant().asObj();
			m_globals->set(name, m_stack.top());
			m_stack.pop();
			break;
		}

		case Op::GetGlobal:
		{
			const auto name = readConstant().asObj();
			const auto value = m_globals->at(name);
			if (value == nullptr)
			{
				return error(RuntimeErrorType::UndefinedGlobal, "'%s' is not defined", asString(Value(name))->chars.c_str());
			}
			TRY_PUSH(*value);
			break;
		}

		case Op::SetGlobal:
		{
			const auto name = readConstant().asObj();
			const auto value = m_globals->at(name);
			if (value == nullptr)
			{
				return error(RuntimeErrorType::UndefinedGlobal, "'%s' is not defined", asString(Value(name))->chars.c_str());
			}
			*value = m_stack.top();
			break;
		}

		case Op::GetUpvalue:
		{
			const auto index = readUint32();
			const auto upvalue = m_allocator.get(m_callStack.top().closure->upvalues[index])->asUpvalue();
			const auto value = upvalue->isOpen() ? m_stack[upvalue->stackIndex] : upvalue->value;
			TRY_PUSH(value);
			break;
		}

		case Op::SetUpvalue:
		{
			const auto index = readUint32();
			auto upvalue = m_allocator.get(m_callStack.top().closure->upvalues[index])->asUpvalue();
			if (upvalue->isOpen())
			{
				m_stack[upvalue->stackIndex] = m_stack.top();
			}
			else
			{
				upvalue->value = m_stack.top();
			}
			break;
		}

		case Op::GetField:
		{
			const auto fieldName = readConstant().asObj();
			auto& value = m_stack.top();
			if ((value.isObj() == false) || (m_allocator.get(value.as.obj)->isInstance() == false))
			{
				const auto type = typeName(value);
				return error(
					RuntimeErrorType::Type,
					"cannot get field '%s' of %.*s",
					asString(Value(fieldName))->chars.c_str(),
					static_cast<int>(type.size()),
					type.data());
			}
			const auto instance = m_allocator.get(value.as.obj)->asInstance();
			const auto struct_ = m_allocator.get(instance->struct_)->asStruct();
			const auto index = struct_->fieldIndex(fieldName);
			if (index == struct_->fieldNames.size())
			{
				return error(
					RuntimeErrorType::Type,
					"'%s' has no field '%s'",
					asString(Value(struct_->name))->chars.c_str(),
					asString(Value(fieldName))->chars.c_str());
			}
			value = instance->fields[index];
			break;
		}

		case Op::SetField:
		{
			const auto fieldName = readConstant().asObj();
			const auto value = m_stack.peek(0);
			const auto rhs = m_stack.peek(1);
			if ((value.isObj() == false) || (m_allocator.get(value.as.obj)->isInstance() == false))
			{
				const auto type = typeName(value);
				return error(
					RuntimeErrorType::Type,
					"cannot set field '%s' of %.*s",
					asString(Value(fieldName))->chars.c_str(),
					static_cast<int>(type.size()),
					type.data());
			}
			const auto instance = m_allocator.get(value.as.obj)->asInstance();
			const auto struct_ = m_allocator.get(instance->struct_)->asStruct();
			const auto index = struct_->fieldIndex(fieldName);
			if (index == struct_->fieldNames.size())
			{
				return error(
					RuntimeErrorType::Type,
					"'%s' has no field '%s'",
					asString(Value(struct_->name))->chars.c_str(),
					asString(Value(fieldName))->chars.c_str());
			}
			instance->fields[index] = rhs;
			m_stack.pop();
			break;
		}

		case Op::LoadNil:
			TRY_PUSH(Value::nil());
			break;

		case Op::LoadTrue:
			TRY_PUSH(Value(true));
			break;

		case Op::LoadFalse:
			TRY_PUSH(Value(false));
			break;

		case Op::Closure:
		{
			// The function is kept alive by the constants of the current function.
			const auto function = readConstant().asObj();
			const auto closure = m_allocator.allocateClosure(function);
			TRY_PUSH(Value(closure));

			const auto upvalueCount = readUint8();
			for (uint8_t i = 0; i < upvalueCount; i++)
			{
				const auto index = readUint8();
				const auto isLocal = readUint8();
				const auto upvalue = isLocal
					? captureUpvalue(m_callStack.top().base + index)
					: m_callStack.top().closure->upvalues[index];
				m_allocator.get(closure)->asClosure()->upvalues.push_back(upvalue);
			}
			break;
		}

		case Op::CreateStruct:
		{
			const auto name = readConstant().asObj();
			const auto fieldCount = readUint32();
			std::vector<ObjHandle> fieldNames;
			fieldNames.reserve(fieldCount);
			for (uint32_t i = 0; i < fieldCount; i++)
			{
				fieldNames.push_back(readConstant().asObj());
			}
			const auto struct_ = m_allocator.allocateStruct(name, std::move(fieldNames));
			TRY_PUSH(Value(struct_));
			break;
		}

		case Op::Jump:
		{
			const auto jump = readUint32();
			m_callStack.top().instructionPointer += jump;
			break;
		}

		case Op::JumpIfTrue:
		{
			const auto jump = readUint32();
			const auto condition = m_stack.top();
			TRY(checkCondition(condition));
			m_stack.pop();
			if (condition.asBool())
			{
				m_callStack.top().instructionPointer += jump;
			}
			break;
		}

		case Op::JumpIfFalse:
		{
			const auto jump = readUint32();
			const auto condition = m_stack.top();
			TRY(checkCondition(condition));
			m_stack.pop();
			if (condition.asBool() == false)
			{
				m_callStack.top().instructionPointer += jump;
			}
			break;
		}

		case Op::JumpBack:
		{
			const auto jump = readUint32();
			m_callStack.top().instructionPointer -= jump;
			break;
		}

		case Op::Call:
		{
			const auto argCount = readUint32();
			const auto callee = m_stack.peek(argCount);
			TRY(callValue(callee, static_cast<int>(argCount)));
			break;
		}

		case Op::Return:
		{
			const auto result = m_stack.top();
			const auto frame = m_callStack.top();
			closeUpvalues(frame.base);
			m_callStack.pop();
			// Pop the locals, the arguments and the callee.
			m_stack.shrinkTo(frame.base - 1);

			if (m_callStack.isEmpty())
			{
				m_result = result;
				return Result::Ok;
			}
			TRY_PUSH(result);
			break;
		}

		case Op::CloseUpvalue:
			closeUpvalues(m_stack.size() - 1);
			m_stack.pop();
			break;

		case Op::PopStack:
			m_stack.pop();
			break;

		case Op::CloneTop:
		{
			const auto value = m_stack.top();
			TRY_PUSH(value);
			break;
		}

		case Op::Print:
			m_output << m_allocator.toString(m_stack.top()) << '\n';
			m_stack.pop();
			break;

		default:
			ASSERT_NOT_REACHED();
			return error(RuntimeErrorType::Type, "invalid instruction");
		}
	}
}

uint32_t Vm::readUint32()
{
	auto& instructionPointer = m_callStack.top().instructionPointer;
	uint32_t value = 0;
	for (int i = 0; i < 4; i++)
	{
		value <<= 8;
		value |= *instructionPointer;
		instructionPointer++;
	}
	return value;
}

uint8_t Vm::readUint8()
{
	const auto value = *m_callStack.top().instructionPointer;
	m_callStack.top().instructionPointer++;
	return value;
}

const Value& Vm::readConstant()
{
	const auto index = readUint32();
	return m_callStack.top().function->constants[index];
}

ObjHandle Vm::loadFunction(const std::shared_ptr<const Chunk>& chunk)
{
	const auto handle = m_allocator.allocateFunction(chunk);
	m_functionsBeingLoaded.push_back(handle);

	for (const auto& constant : chunk->constants)
	{
		Value value;
		switch (constant.type)
		{
		case Constant::Type::Number:
			value = Value(constant.numberValue);
			break;
		case Constant::Type::String:
			value = Value(m_allocator.allocateString(constant.stringValue));
			break;
		case Constant::Type::Function:
			value = Value(loadFunction(constant.functionValue));
			break;
		}
		m_allocator.get(handle)->asFunction()->constants.push_back(value);
	}

	return handle;
}

Vm::Result Vm::error(RuntimeErrorType type, const char* format, ...)
{
	va_list args;
	va_start(args, format);
	auto message = formatToString(format, args);
	va_end(args);
	m_error = RuntimeError{ type, std::move(message), stackTrace() };
	return Result::Error;
}

Vm::Result Vm::typeErrorBinary(const char* op, const Value& lhs, const Value& rhs)
{
	const auto lhsType = typeName(lhs);
	const auto rhsType = typeName(rhs);
	return error(
		RuntimeErrorType::Type,
		"cannot apply '%s' to %.*s and %.*s",
		op,
		static_cast<int>(lhsType.size()),
		lhsType.data(),
		static_cast<int>(rhsType.size()),
		rhsType.data());
}

Vm::Result Vm::callValue(const Value& callee, int argCount)
{
	if (callee.isObj())
	{
		const auto obj = m_allocator.get(callee.as.obj);
		switch (obj->type)
		{
		case ObjType::Closure:
			return callClosure(obj->asClosure(), argCount);
		case ObjType::NativeFunction:
			return callNativeFunction(obj->asNativeFunction(), argCount);
		case ObjType::Struct:
			return constructInstance(callee.as.obj, argCount);
		default:
			break;
		}
	}

	const auto type = typeName(callee);
	return error(RuntimeErrorType::Type, "%.*s is not callable", static_cast<int>(type.size()), type.data());
}

Vm::Result Vm::callClosure(ObjClosure* closure, int argCount)
{
	const auto function = m_allocator.get(closure->function)->asFunction();
	if (argCount != function->argCount())
	{
		return error(
			RuntimeErrorType::Arity,
			"%s() expected %d arguments but got %d",
			function->name().c_str(),
			function->argCount(),
			argCount);
	}

	TRY_PUSH_CALL_STACK();
	auto& frame = m_callStack.top();
	frame.instructionPointer = function->chunk->byteCode.code.data();
	frame.base = m_stack.size() - static_cast<size_t>(argCount);
	frame.closure = closure;
	frame.function = function;
	return Result::Ok;
}

Vm::Result Vm::callNativeFunction(ObjNativeFunction* function, int argCount)
{
	// Negative argCount means any number of arguments.
	if ((function->argCount >= 0) && (argCount != function->argCount))
	{
		return error(
			RuntimeErrorType::Arity,
			"%s() expected %d arguments but got %d",
			function->name.c_str(),
			function->argCount,
			argCount);
	}

	Context context(m_stack.end() - argCount, argCount, m_allocator, function->context);
	Value result;
	try
	{
		result = function->function(context);
	}
	catch (const NativeException& exception)
	{
		return error(exception.type, "%s(): %s", function->name.c_str(), exception.message.c_str());
	}

	m_stack.shrinkTo(m_stack.size() - static_cast<size_t>(argCount) - 1);
	TRY_PUSH(result);
	return Result::Ok;
}

Vm::Result Vm::constructInstance(ObjHandle structHandle, int argCount)
{
	const auto fieldCount = m_allocator.get(structHandle)->asStruct()->fieldNames.size();
	if (static_cast<size_t>(argCount) != fieldCount)
	{
		return error(
			RuntimeErrorType::Arity,
			"%s() expected %zu arguments but got %d",
			asString(Value(m_allocator.get(structHandle)->asStruct()->name))->chars.c_str(),
			fieldCount,
			argCount);
	}

	// The struct and the arguments are still on the stack.
	const auto instanceHandle = m_allocator.allocateInstance(structHandle);
	auto instance = m_allocator.get(instanceHandle)->asInstance();
	const auto firstArgument = m_stack.size() - fieldCount;
	for (size_t i = 0; i < fieldCount; i++)
	{
		instance->fields[i] = m_stack[firstArgument + i];
	}

	m_stack.shrinkTo(firstArgument - 1);
	TRY_PUSH(Value(instanceHandle));
	return Result::Ok;
}

Vm::Result Vm::checkCondition(const Value& value)
{
	if (value.isBool())
		return Result::Ok;

	const auto type = typeName(value);
	return error(RuntimeErrorType::Type, "condition must be a bool, found %.*s", static_cast<int>(type.size()), type.data());
}

ObjHandle Vm::captureUpvalue(size_t stackIndex)
{
	for (const auto handle : m_openUpvalues)
	{
		if (m_allocator.get(handle)->asUpvalue()->stackIndex == stackIndex)
			return handle;
	}

	const auto upvalue = m_allocator.allocateUpvalue(stackIndex);
	m_openUpvalues.push_back(upvalue);
	return upvalue;
}

void Vm::closeUpvalues(size_t stackIndex)
{
	const auto isClosed = [this, stackIndex](ObjHandle handle)
	{
		auto upvalue = m_allocator.get(handle)->asUpvalue();
		if (upvalue->stackIndex < stackIndex)
			return false;

		upvalue->value = m_stack[upvalue->stackIndex];
		upvalue->stackIndex = ObjUpvalue::CLOSED;
		return true;
	};
	m_openUpvalues.erase(std::remove_if(m_openUpvalues.begin(), m_openUpvalues.end(), isClosed), m_openUpvalues.end());
}

bool Vm::isString(const Value& value) const
{
	return value.isObj() && m_allocator.get(value.as.obj)->isString();
}

ObjString* Vm::asString(const Value& value)
{
	return m_allocator.get(value.asObj())->asString();
}

std::string_view Vm::typeName(const Value& value) const
{
	return m_allocator.typeName(value);
}

std::vector<StackTraceEntry> Vm::stackTrace() const
{
	std::vector<StackTraceEntry> trace;
	for (auto frame = m_callStack.end(); frame != m_callStack.begin();)
	{
		frame--;
		const auto& byteCode = frame->function->chunk->byteCode;
		// The instruction pointer is already past the start of the instruction that is executing.
		const auto offset = static_cast<size_t>(frame->instructionPointer - byteCode.code.data());
		const auto line = (offset == 0) ? byteCode.lineNumberAtOffset[0] : byteCode.lineNumberAtOffset[offset - 1];
		trace.push_back(StackTraceEntry{ frame->function->name(), line });
	}
	return trace;
}

void Vm::debugPrintStack()
{
	std::cout << "[ ";
	for (const auto& value : m_stack)
	{
		std::cout << m_allocator.toString(value) << ' ';
	}
	std::cout << "]\n";
}

void Vm::mark(Vm* vm, Allocator& allocator)
{
	for (const auto& value : vm->m_stack)
	{
		allocator.addValue(value);
	}

	for (const auto& frame : vm->m_callStack)
	{
		allocator.addObj(frame.closure->function);
		for (const auto upvalue : frame.closure->upvalues)
		{
			allocator.addObj(upvalue);
		}
	}

	for (const auto upvalue : vm->m_openUpvalues)
	{
		allocator.addObj(upvalue);
	}

	for (const auto function : vm->m_functionsBeingLoaded)
	{
		allocator.addObj(function);
	}

	allocator.addValue(vm->m_result);
}
