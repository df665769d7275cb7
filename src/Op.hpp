#pragma once

#include <stdint.h>

namespace Lla
{
	// Operands are encoded big endian. u32 operands unless noted otherwise.
	// Jump offsets are relative to the end of the jump instruction.
	enum class Op : uint8_t
	{
		// [lhs, rhs] -> [result]
		// {
		Add,
		Subtract,
		Multiply,
		Divide,
		Modulo,
		Less,
		LessEqual,
		More,
		MoreEqual,
		Equals,
		NotEquals,
		// }

		// [value] -> [result]
		// {
		Negate,
		Not,
		// }

		// get -> [value]
		// set -> [rhs]
		GetConstant, // constantIndex
		GetLocal, // index
		SetLocal, // index [rhs]
		DefineGlobal, // nameConstantIndex [initializer] -> []
		GetGlobal, // nameConstantIndex
		SetGlobal, // nameConstantIndex [rhs]
		GetUpvalue, // index
		SetUpvalue, // index [rhs]
		GetField, // nameConstantIndex [instance] -> [field]
		SetField, // nameConstantIndex [rhs, instance] -> [rhs]

		// -> [constant]
		LoadNil,
		LoadTrue,
		LoadFalse,

		Closure, // functionConstantIndex upvalueCountU8 (upvalueCount * { indexU8, isLocalU8 }) -> [closure]
		CreateStruct, // nameConstantIndex fieldCount (fieldCount * fieldNameConstantIndex) -> [struct]

		// -> []
		// {
		Jump, // bytesToJumpForward
		JumpIfTrue, // bytesToJumpForward [condition] -> []
		JumpIfFalse, // bytesToJumpForward [condition] -> []
		// }
		JumpBack, // bytesToJumpBack

		Call, // argCount [callee, args...] -> [result]
		Return, // [result] -> 
		CloseUpvalue, // [value] -> []
		PopStack, // [value] -> []
		CloneTop, // [value] -> [value value]
		Print, // [value] -> []
	};
}
