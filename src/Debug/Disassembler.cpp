#include <Debug/Disassembler.hpp>
#include <Format.hpp>
#include <Asserts.hpp>

#include <iomanip>

using namespace Lla;

static size_t justOp(std::string_view name, std::ostream& out)
{
	out << name;
	return 1;
}

static size_t opNumber(std::string_view name, const Chunk& chunk, size_t offset, std::ostream& out)
{
	out << name << ' ' << chunk.byteCode.readUint32(offset + 1);
	return 5;
}

static size_t opConstant(std::string_view name, const Chunk& chunk, size_t offset, std::ostream& out)
{
	const auto index = chunk.byteCode.readUint32(offset + 1);
	out << name << " c[" << index << "] -> ";
	debugPrintConstant(chunk.constants[index], out);
	return 5;
}

static size_t jump(std::string_view name, const Chunk& chunk, size_t offset, int sign, std::ostream& out)
{
	const auto jumpSize = chunk.byteCode.readUint32(offset + 1);
	const auto offsetAfterDecoding = offset + 5;
	out << name << ' ' << offset << " -> " << ((sign == 1) ? (offsetAfterDecoding + jumpSize) : (offsetAfterDecoding - jumpSize));
	return 5;
}

static size_t closureOp(std::string_view name, const Chunk& chunk, size_t offset, std::ostream& out)
{
	opConstant(name, chunk, offset, out);
	const auto& code = chunk.byteCode.code;
	const auto count = code[offset + 5];
	for (size_t i = 0; i < count; i++)
	{
		const auto index = code[offset + 6 + i * 2];
		const auto isLocal = code[offset + 6 + i * 2 + 1];
		out << " |" << (isLocal ? "local" : "upvalue") << '-' << static_cast<int>(index);
	}
	return 6 + static_cast<size_t>(count) * 2;
}

static size_t createStructOp(std::string_view name, const Chunk& chunk, size_t offset, std::ostream& out)
{
	opConstant(name, chunk, offset, out);
	const auto fieldCount = chunk.byteCode.readUint32(offset + 5);
	for (size_t i = 0; i < fieldCount; i++)
	{
		const auto fieldName = chunk.byteCode.readUint32(offset + 9 + i * 4);
		out << " ." << chunk.constants[fieldName].stringValue;
	}
	return 9 + static_cast<size_t>(fieldCount) * 4;
}

void Lla::debugPrintConstant(const Constant& constant, std::ostream& out)
{
	switch (constant.type)
	{
	case Constant::Type::Number:
		out << numberToString(constant.numberValue);
		break;
	case Constant::Type::String:
		out << '"' << constant.stringValue << '"';
		break;
	case Constant::Type::Function:
		out << "<fn " << constant.functionValue->name << '>';
		break;
	}
}

size_t Lla::disassembleInstruction(const Chunk& chunk, size_t offset, std::ostream& out)
{
	const auto& byteCode = chunk.byteCode;
	out << std::left << std::setw(5) << offset;
	if ((offset > 0) && (byteCode.lineNumberAtOffset[offset] == byteCode.lineNumberAtOffset[offset - 1]))
	{
		out << "     | ";
	}
	else
	{
		out << std::right << std::setw(6) << byteCode.lineNumberAtOffset[offset] << ' ';
	}

	switch (static_cast<Op>(byteCode.code[offset]))
	{
		case Op::Add: return justOp("add", out);
		case Op::Subtract: return justOp("subtract", out);
		case Op::Multiply: return justOp("multiply", out);
		case Op::Divide: return justOp("divide", out);
		case Op::Modulo: return justOp("modulo", out);
		case Op::Less: return justOp("less", out);
		case Op::LessEqual: return justOp("lessEqual", out);
		case Op::More: return justOp("more", out);
		case Op::MoreEqual: return justOp("moreEqual", out);
		case Op::Equals: return justOp("equals", out);
		case Op::NotEquals: return justOp("notEquals", out);
		case Op::Negate: return justOp("negate", out);
		case Op::Not: return justOp("not", out);
		case Op::GetConstant: return opConstant("loadConstant", chunk, offset, out);
		case Op::GetLocal: return opNumber("loadLocal", chunk, offset, out);
		case Op::SetLocal: return opNumber("setLocal", chunk, offset, out);
		case Op::DefineGlobal: return opConstant("defineGlobal", chunk, offset, out);
		case Op::GetGlobal: return opConstant("loadGlobal", chunk, offset, out);
		case Op::SetGlobal: return opConstant("setGlobal", chunk, offset, out);
		case Op::GetUpvalue: return opNumber("getUpvalue", chunk, offset, out);
		case Op::SetUpvalue: return opNumber("setUpvalue", chunk, offset, out);
		case Op::GetField: return opConstant("getField", chunk, offset, out);
		case Op::SetField: return opConstant("setField", chunk, offset, out);
		case Op::LoadNil: return justOp("loadNil", out);
		case Op::LoadTrue: return justOp("loadTrue", out);
		case Op::LoadFalse: return justOp("loadFalse", out);
		case Op::Closure: return closureOp("closure", chunk, offset, out);
		case Op::CreateStruct: return createStructOp("createStruct", chunk, offset, out);
		case Op::Jump: return jump("jump", chunk, offset, 1, out);
		case Op::JumpIfTrue: return jump("jumpIfTrue", chunk, offset, 1, out);
		case Op::JumpIfFalse: return jump("jumpIfFalse", chunk, offset, 1, out);
		case Op::JumpBack: return jump("jumpBack", chunk, offset, -1, out);
		case Op::Call: return opNumber("call", chunk, offset, out);
		case Op::Return: return justOp("return", out);
		case Op::CloseUpvalue: return justOp("closeUpvalue", out);
		case Op::PopStack: return justOp("popStack", out);
		case Op::CloneTop: return justOp("cloneTop", out);
		case Op::Print: return justOp("print", out);
	}

	out << "invalid op";
	return 1;
}

void Lla::disassembleChunk(const Chunk& chunk, std::ostream& out)
{
	size_t offset = 0;
	while (offset < chunk.byteCode.code.size())
	{
		offset += disassembleInstruction(chunk, offset, out);
		out << '\n';
	}
}
