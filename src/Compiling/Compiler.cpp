#include <Compiling/Compiler.hpp>
#include <Debug/DebugOptions.hpp>
#include <Debug/Disassembler.hpp>
#include <Asserts.hpp>
#include <Format.hpp>
#include <algorithm>
#include <iostream>
#include <limits>
#include <string.h>

#define TRY(somethingThatReturnsStatus) \
	do \
	{ \
		if ((somethingThatReturnsStatus) == Status::Error) \
		{ \
			return Status::Error; \
		} \
	} while (false)

using namespace Lla;

Compiler::Compiler()
	: m_errorReporter(nullptr)
	, m_sourceInfo(nullptr)
{}

Compiler::Result Compiler::compile(const StmtList& ast, const SourceInfo& sourceInfo, ErrorReporter* errorReporter)
{
	m_error = std::nullopt;
	m_errorReporter = errorReporter;
	m_sourceInfo = &sourceInfo;
	m_scopes.clear();
	m_loops.clear();
	m_functions.clear();
	m_lineNumberStack.clear();
	m_globalNames.clear();

	auto program = std::make_shared<Chunk>();
	program->name = "script";
	program->argCount = 0;
	program->upvalueCount = 0;
	m_functions.push_back(Function{ program.get(), {}, 0, 0 });

	bool returnedValue = false;
	for (size_t i = 0; i < ast.size(); i++)
	{
		const auto& stmt = ast[i];
		// The value of the program is the value of the last expression statement.
		if ((i == ast.size() - 1) && (stmt->type == StmtType::Expr))
		{
			m_lineNumberStack.push_back(m_sourceInfo->getLine(stmt->start));
			if (compile(static_cast<const ExprStmt&>(*stmt).expr) == Status::Error)
				break;
			emitOp(Op::Return);
			m_lineNumberStack.pop_back();
			returnedValue = true;
		}
		else if (compile(stmt) == Status::Error)
		{
			break;
		}
	}

	if (m_error.has_value())
	{
		m_functions.clear();
		return Result{ true, std::move(m_error), nullptr };
	}

	if (returnedValue == false)
	{
		// The implicit return is on the last line of the file.
		m_lineNumberStack.push_back(std::max(m_sourceInfo->lineCount(), static_cast<size_t>(1)));
		emitOp(Op::LoadNil);
		emitOp(Op::Return);
		m_lineNumberStack.pop_back();
	}

	ASSERT(m_functions.back().unpatchedJumpCount == 0);
	m_functions.pop_back();

#ifdef LLA_DEBUG_PRINT_COMPILED_FUNCTIONS
	std::cout << "----<script>\n";
	disassembleChunk(*program, std::cout);
#endif

	return Result{ false, std::nullopt, std::move(program) };
}

Compiler::Status Compiler::compileFunction(
	std::string_view name,
	const std::vector<std::string_view>& arguments,
	const StmtList& stmts,
	const SourceLocation& location)
{
	auto chunk = std::make_shared<Chunk>();
	chunk->name = std::string(name);
	chunk->argCount = static_cast<int>(arguments.size());
	chunk->upvalueCount = 0;

	m_functions.push_back(Function{ chunk.get(), {}, 0, 0 });
	beginScope();
	currentScope().isFunctionScope = true;

	for (const auto& argument : arguments)
	{
		TRY(declareVariable(argument, location));
	}

	TRY(compile(stmts));
	emitOp(Op::LoadNil);
	emitOp(Op::Return);

	endScope();

	ASSERT(m_functions.back().unpatchedJumpCount == 0);
	const auto upvalues = std::move(m_functions.back().upvalues);
	chunk->upvalueCount = static_cast<int>(upvalues.size());
	m_functions.pop_back();

#ifdef LLA_DEBUG_PRINT_COMPILED_FUNCTIONS
	std::cout << "----" << chunk->name << '\n';
	disassembleChunk(*chunk, std::cout);
#endif

	uint32_t functionConstant;
	TRY(addConstant(Constant::function(std::move(chunk)), functionConstant, location));
	emitOpArg(Op::Closure, functionConstant);
	// Checked by addUpvalue.
	emitUint8(static_cast<uint8_t>(upvalues.size()));
	for (const auto& upvalue : upvalues)
	{
		emitUint8(static_cast<uint8_t>(upvalue.index));
		emitUint8(static_cast<uint8_t>(upvalue.isLocal));
	}

	return Status::Ok;
}

Compiler::Status Compiler::compile(const std::unique_ptr<Stmt>& stmt)
{
#define CASE_STMT_TYPE(stmtType, stmtFunction) \
	case StmtType::stmtType: TRY(stmtFunction(*static_cast<stmtType##Stmt*>(stmt.get()))); break;

	m_lineNumberStack.push_back(m_sourceInfo->getLine(stmt->start));
	switch (stmt->type)
	{
		CASE_STMT_TYPE(Expr, exprStmt)
		CASE_STMT_TYPE(Print, printStmt)
		CASE_STMT_TYPE(VariableDeclaration, variableDeclarationStmt)
		CASE_STMT_TYPE(Block, blockStmt)
		CASE_STMT_TYPE(Fn, fnStmt)
		CASE_STMT_TYPE(Struct, structStmt)
		CASE_STMT_TYPE(Ret, retStmt)
		CASE_STMT_TYPE(If, ifStmt)
		CASE_STMT_TYPE(Loop, loopStmt)
		CASE_STMT_TYPE(Break, breakStmt)
		CASE_STMT_TYPE(Continue, continueStmt)
	}
#undef CASE_STMT_TYPE
	m_lineNumberStack.pop_back();
	return Status::Ok;
}

Compiler::Status Compiler::compile(const StmtList& stmts)
{
	for (const auto& stmt : stmts)
	{
		TRY(compile(stmt));
	}
	return Status::Ok;
}

Compiler::Status Compiler::exprStmt(const ExprStmt& stmt)
{
	TRY(compile(stmt.expr));
	emitOp(Op::PopStack);
	return Status::Ok;
}

Compiler::Status Compiler::printStmt(const PrintStmt& stmt)
{
	TRY(compile(stmt.expr));
	emitOp(Op::Print);
	return Status::Ok;
}

Compiler::Status Compiler::variableDeclarationStmt(const VariableDeclarationStmt& stmt)
{
	// Local variables are created by just leaving the result of the initializer on top of the stack.
	if (stmt.initializer.has_value())
	{
		TRY(compile(*stmt.initializer));
	}
	else
	{
		emitOp(Op::LoadNil);
	}

	// The initializer is evaluated before declaring the variable so a variable from an outer scope with the same name can be used.
	TRY(declareVariable(stmt.name, stmt.location()));
	TRY(defineVariable(stmt.name, stmt.location()));
	return Status::Ok;
}

Compiler::Status Compiler::blockStmt(const BlockStmt& stmt)
{
	return compileBlock(stmt.stmts);
}

Compiler::Status Compiler::fnStmt(const FnStmt& stmt)
{
	// Declared before compiling the body so the function can call itself.
	TRY(declareVariable(stmt.name, stmt.location()));
	TRY(compileFunction(stmt.name, stmt.arguments, stmt.stmts, stmt.location()));
	TRY(defineVariable(stmt.name, stmt.location()));
	return Status::Ok;
}

Compiler::Status Compiler::structStmt(const StructStmt& stmt)
{
	std::vector<uint32_t> fieldNameConstants;
	for (size_t i = 0; i < stmt.fieldNames.size(); i++)
	{
		const auto& fieldName = stmt.fieldNames[i];
		const auto begin = stmt.fieldNames.begin();
		if (std::find(begin, begin + i, fieldName) != begin + i)
		{
			return errorAt(
				stmt.location(),
				CompileErrorType::DuplicateDeclaration,
				"redeclaration of field '%.*s'",
				static_cast<int>(fieldName.size()),
				fieldName.data());
		}
		uint32_t constant;
		TRY(stringConstant(fieldName, constant, stmt.location()));
		fieldNameConstants.push_back(constant);
	}

	uint32_t nameConstant;
	TRY(stringConstant(stmt.name, nameConstant, stmt.location()));

	TRY(declareVariable(stmt.name, stmt.location()));
	emitOpArg(Op::CreateStruct, nameConstant);
	emitUint32(static_cast<uint32_t>(fieldNameConstants.size()));
	for (const auto constant : fieldNameConstants)
	{
		emitUint32(constant);
	}
	TRY(defineVariable(stmt.name, stmt.location()));
	return Status::Ok;
}

Compiler::Status Compiler::retStmt(const RetStmt& stmt)
{
	if (m_functions.size() <= 1)
	{
		return errorAt(stmt.location(), CompileErrorType::Semantic, "cannot return outside of a function");
	}

	if (stmt.returnValue.has_value())
	{
		TRY(compile(*stmt.returnValue));
	}
	else
	{
		emitOp(Op::LoadNil);
	}
	// Return discards the locals and closes the upvalues of the whole frame.
	emitOp(Op::Return);
	return Status::Ok;
}

Compiler::Status Compiler::ifStmt(const IfStmt& stmt)
{
	TRY(compile(stmt.condition));

	const auto jumpToElse = emitJump(Op::JumpIfFalse);

	TRY(compileBlock(stmt.ifThen));

	if (stmt.elseThen.has_value() == false)
	{
		TRY(setJumpToHere(jumpToElse, stmt.location()));
		return Status::Ok;
	}

	const auto jumpToEndOfElse = emitJump(Op::Jump);
	TRY(setJumpToHere(jumpToElse, stmt.location()));
	TRY(compileBlock(*stmt.elseThen));
	TRY(setJumpToHere(jumpToEndOfElse, stmt.location()));

	return Status::Ok;
}

Compiler::Status Compiler::loopStmt(const LoopStmt& stmt)
{
	const auto beginning = currentLocation();
	m_loops.push_back(Loop{ beginning, m_scopes.size(), currentFunctionDepth(), {} });

	size_t jumpToEnd = 0; // Won't be used if there is no condition.
	if (stmt.condition.has_value())
	{
		TRY(compile(*stmt.condition));
		jumpToEnd = emitJump(Op::JumpIfFalse);
	}

	TRY(compileBlock(stmt.block));
	TRY(emitJumpBack(beginning, stmt.location()));

	if (stmt.condition.has_value())
	{
		TRY(setJumpToHere(jumpToEnd, stmt.location()));
	}

	// Not using a reference because compiling can reallocate m_loops.
	const auto breakJumpLocations = std::move(m_loops.back().breakJumpLocations);
	m_loops.pop_back();
	for (const auto location : breakJumpLocations)
	{
		TRY(setJumpToHere(location, stmt.location()));
	}

	return Status::Ok;
}

Compiler::Status Compiler::breakStmt(const BreakStmt& stmt)
{
	if (m_loops.empty() || (m_loops.back().functionDepth != currentFunctionDepth()))
	{
		return errorAt(stmt.location(), CompileErrorType::Semantic, "cannot use break outside of a loop");
	}

	for (auto i = m_scopes.size(); i > m_loops.back().scopeDepth; i--)
	{
		popOffLocals(m_scopes[i - 1]);
	}
	const auto jump = emitJump(Op::Jump);
	m_loops.back().breakJumpLocations.push_back(jump);
	return Status::Ok;
}

Compiler::Status Compiler::continueStmt(const ContinueStmt& stmt)
{
	if (m_loops.empty() || (m_loops.back().functionDepth != currentFunctionDepth()))
	{
		return errorAt(stmt.location(), CompileErrorType::Semantic, "cannot use continue outside of a loop");
	}

	for (auto i = m_scopes.size(); i > m_loops.back().scopeDepth; i--)
	{
		popOffLocals(m_scopes[i - 1]);
	}
	TRY(emitJumpBack(m_loops.back().loopStartLocation, stmt.location()));
	return Status::Ok;
}

Compiler::Status Compiler::compileBlock(const StmtList& stmts)
{
	beginScope();
	TRY(compile(stmts));
	endScope();
	return Status::Ok;
}

Compiler::Status Compiler::compile(const std::unique_ptr<Expr>& expr)
{
#define CASE_EXPR_TYPE(exprType, exprFunction) \
	case ExprType::exprType: TRY(exprFunction(*static_cast<exprType##Expr*>(expr.get()))); break;

	m_lineNumberStack.push_back(m_sourceInfo->getLine(expr->start));
	switch (expr->type)
	{
		CASE_EXPR_TYPE(NumberConstant, numberConstantExpr)
		CASE_EXPR_TYPE(StringConstant, stringConstantExpr)
		CASE_EXPR_TYPE(BoolConstant, boolConstantExpr)
		CASE_EXPR_TYPE(Nil, nilExpr)
		CASE_EXPR_TYPE(Binary, binaryExpr)
		CASE_EXPR_TYPE(Logical, logicalExpr)
		CASE_EXPR_TYPE(Unary, unaryExpr)
		CASE_EXPR_TYPE(Identifier, identifierExpr)
		CASE_EXPR_TYPE(Call, callExpr)
		CASE_EXPR_TYPE(Assignment, assignmentExpr)
		CASE_EXPR_TYPE(GetField, getFieldExpr)
		CASE_EXPR_TYPE(Lambda, lambdaExpr)
	}
#undef CASE_EXPR_TYPE
	m_lineNumberStack.pop_back();
	return Status::Ok;
}

Compiler::Status Compiler::numberConstantExpr(const NumberConstantExpr& expr)
{
	return loadConstant(Constant::number(expr.value), expr.location());
}

Compiler::Status Compiler::stringConstantExpr(const StringConstantExpr& expr)
{
	return loadConstant(Constant::string(expr.value), expr.location());
}

Compiler::Status Compiler::boolConstantExpr(const BoolConstantExpr& expr)
{
	if (expr.value)
	{
		emitOp(Op::LoadTrue);
	}
	else
	{
		emitOp(Op::LoadFalse);
	}
	return Status::Ok;
}

Compiler::Status Compiler::nilExpr(const NilExpr&)
{
	emitOp(Op::LoadNil);
	return Status::Ok;
}

Compiler::Status Compiler::binaryExpr(const BinaryExpr& expr)
{
	TRY(compile(expr.lhs));
	TRY(compile(expr.rhs));

	switch (expr.op)
	{
	case TokenType::Plus: emitOp(Op::Add); break;
	case TokenType::Minus: emitOp(Op::Subtract); break;
	case TokenType::Star: emitOp(Op::Multiply); break;
	case TokenType::Slash: emitOp(Op::Divide); break;
	case TokenType::Percent: emitOp(Op::Modulo); break;
	case TokenType::EqualsEquals: emitOp(Op::Equals); break;
	case TokenType::NotEquals: emitOp(Op::NotEquals); break;
	case TokenType::Less: emitOp(Op::Less); break;
	case TokenType::LessEquals: emitOp(Op::LessEqual); break;
	case TokenType::More: emitOp(Op::More); break;
	case TokenType::MoreEquals: emitOp(Op::MoreEqual); break;
	default:
		ASSERT_NOT_REACHED();
		return Status::Error;
	}

	return Status::Ok;
}

Compiler::Status Compiler::logicalExpr(const LogicalExpr& expr)
{
	// The lhs is the result if it decides the outcome, otherwise it is popped and the rhs is the result.
	TRY(compile(expr.lhs));
	emitOp(Op::CloneTop);
	const auto jumpToEnd = emitJump((expr.op == TokenType::And) ? Op::JumpIfFalse : Op::JumpIfTrue);
	emitOp(Op::PopStack);
	TRY(compile(expr.rhs));
	TRY(setJumpToHere(jumpToEnd, expr.location()));
	return Status::Ok;
}

Compiler::Status Compiler::unaryExpr(const UnaryExpr& expr)
{
	TRY(compile(expr.expr));

	switch (expr.op)
	{
	case TokenType::Minus: emitOp(Op::Negate); break;
	case TokenType::Not: emitOp(Op::Not); break;
	default:
		ASSERT_NOT_REACHED();
		return Status::Error;
	}

	return Status::Ok;
}

Compiler::Status Compiler::identifierExpr(const IdentifierExpr& expr)
{
	return loadVariable(expr.identifier, expr.location());
}

Compiler::Status Compiler::callExpr(const CallExpr& expr)
{
	TRY(compile(expr.callee));
	for (const auto& argument : expr.arguments)
	{
		TRY(compile(argument));
	}
	emitOpArg(Op::Call, static_cast<uint32_t>(expr.arguments.size()));
	return Status::Ok;
}

Compiler::Status Compiler::assignmentExpr(const AssignmentExpr& expr)
{
	if (expr.lhs->type == ExprType::Identifier)
	{
		TRY(compile(expr.rhs));
		const auto& lhs = static_cast<const IdentifierExpr&>(*expr.lhs);
		return setVariable(lhs.identifier, expr.location());
	}
	else if (expr.lhs->type == ExprType::GetField)
	{
		const auto& lhs = static_cast<const GetFieldExpr&>(*expr.lhs);
		TRY(compile(expr.rhs));
		TRY(compile(lhs.lhs));
		uint32_t fieldNameConstant;
		TRY(stringConstant(lhs.fieldName, fieldNameConstant, expr.location()));
		emitOpArg(Op::SetField, fieldNameConstant);
		return Status::Ok;
	}

	return errorAt(expr.lhs->location(), CompileErrorType::Semantic, "invalid left side of assignment");
}

Compiler::Status Compiler::getFieldExpr(const GetFieldExpr& expr)
{
	TRY(compile(expr.lhs));
	uint32_t fieldNameConstant;
	TRY(stringConstant(expr.fieldName, fieldNameConstant, expr.location()));
	emitOpArg(Op::GetField, fieldNameConstant);
	return Status::Ok;
}

Compiler::Status Compiler::lambdaExpr(const LambdaExpr& expr)
{
	static constexpr std::string_view ANONYMOUS_FUNCTION_NAME = "anonymous";
	return compileFunction(ANONYMOUS_FUNCTION_NAME, expr.arguments, expr.stmts, expr.location());
}

Compiler::Status Compiler::declareVariable(std::string_view name, const SourceLocation& location)
{
	if (m_scopes.empty())
	{
		if (m_globalNames.count(name) != 0)
		{
			return errorAt(
				location,
				CompileErrorType::DuplicateDeclaration,
				"redeclaration of global '%.*s'",
				static_cast<int>(name.size()),
				name.data());
		}
		m_globalNames.insert(name);
		return Status::Ok;
	}

	auto& locals = currentScope().locals;
	const auto isSameName = [name](const Local& local) { return local.name == name; };
	if (std::find_if(locals.begin(), locals.end(), isSameName) != locals.end())
	{
		return errorAt(
			location,
			CompileErrorType::DuplicateDeclaration,
			"redeclaration of variable '%.*s'",
			static_cast<int>(name.size()),
			name.data());
	}

	auto& function = m_functions.back();
	if (function.localCount >= MAX_LOCALS)
	{
		return errorAt(location, CompileErrorType::Semantic, "too many local variables in function");
	}
	locals.push_back(Local{ name, static_cast<uint32_t>(function.localCount), false });
	function.localCount++;
	return Status::Ok;
}

Compiler::Status Compiler::defineVariable(std::string_view name, const SourceLocation& location)
{
	if (m_scopes.empty() == false)
	{
		return Status::Ok;
	}

	uint32_t nameConstant;
	TRY(stringConstant(name, nameConstant, location));
	emitOpArg(Op::DefineGlobal, nameConstant);
	return Status::Ok;
}

void Compiler::beginScope()
{
	m_scopes.push_back(Scope{ {}, currentFunctionDepth(), false });
}

void Compiler::endScope()
{
	ASSERT(m_scopes.empty() == false);

	const auto& scope = currentScope();
	if (scope.isFunctionScope == false)
	{
		popOffLocals(scope);
	}
	m_functions[scope.functionDepth].localCount -= scope.locals.size();
	m_scopes.pop_back();
}

Compiler::Scope& Compiler::currentScope()
{
	return m_scopes.back();
}

void Compiler::popOffLocals(const Scope& scope)
{
	for (auto local = scope.locals.crbegin(); local != scope.locals.crend(); local++)
	{
		if (local->isCaptured)
		{
			emitOp(Op::CloseUpvalue);
		}
		else
		{
			emitOp(Op::PopStack);
		}
	}
}

std::optional<uint32_t> Compiler::resolveLocal(size_t functionDepth, std::string_view name)
{
	for (auto scope = m_scopes.rbegin(); scope != m_scopes.rend(); scope++)
	{
		if (scope->functionDepth < functionDepth)
			break;
		if (scope->functionDepth != functionDepth)
			continue;

		for (auto local = scope->locals.rbegin(); local != scope->locals.rend(); local++)
		{
			if (local->name == name)
			{
				return local->index;
			}
		}
	}
	return std::nullopt;
}

Compiler::Status Compiler::resolveUpvalue(
	size_t functionDepth,
	std::string_view name,
	std::optional<uint32_t>& result,
	const SourceLocation& location)
{
	result = std::nullopt;
	if (functionDepth == 0)
	{
		return Status::Ok;
	}

	const auto enclosingDepth = functionDepth - 1;
	if (const auto local = resolveLocal(enclosingDepth, name); local.has_value())
	{
		for (auto& scope : m_scopes)
		{
			if (scope.functionDepth != enclosingDepth)
				continue;
			for (auto& variable : scope.locals)
			{
				if (variable.index == *local)
					variable.isCaptured = true;
			}
		}
		uint32_t index;
		TRY(addUpvalue(functionDepth, *local, true, index, location));
		result = index;
		return Status::Ok;
	}

	std::optional<uint32_t> upvalue;
	TRY(resolveUpvalue(enclosingDepth, name, upvalue, location));
	if (upvalue.has_value())
	{
		uint32_t index;
		TRY(addUpvalue(functionDepth, *upvalue, false, index, location));
		result = index;
	}
	return Status::Ok;
}

Compiler::Status Compiler::addUpvalue(size_t functionDepth, uint32_t index, bool isLocal, uint32_t& result, const SourceLocation& location)
{
	auto& upvalues = m_functions[functionDepth].upvalues;
	for (size_t i = 0; i < upvalues.size(); i++)
	{
		if ((upvalues[i].index == index) && (upvalues[i].isLocal == isLocal))
		{
			result = static_cast<uint32_t>(i);
			return Status::Ok;
		}
	}

	if (upvalues.size() >= MAX_UPVALUES)
	{
		return errorAt(location, CompileErrorType::Semantic, "too many captured variables in function");
	}
	upvalues.push_back(Upvalue{ index, isLocal });
	result = static_cast<uint32_t>(upvalues.size() - 1);
	return Status::Ok;
}

Compiler::Status Compiler::variable(std::string_view name, bool trueIfLoadFalseIfSet, const SourceLocation& location)
{
	const auto functionDepth = m_functions.size() - 1;
	if (const auto local = resolveLocal(functionDepth, name); local.has_value())
	{
		emitOpArg(trueIfLoadFalseIfSet ? Op::GetLocal : Op::SetLocal, *local);
		return Status::Ok;
	}

	std::optional<uint32_t> upvalue;
	TRY(resolveUpvalue(functionDepth, name, upvalue, location));
	if (upvalue.has_value())
	{
		emitOpArg(trueIfLoadFalseIfSet ? Op::GetUpvalue : Op::SetUpvalue, *upvalue);
		return Status::Ok;
	}

	uint32_t nameConstant;
	TRY(stringConstant(name, nameConstant, location));
	emitOpArg(trueIfLoadFalseIfSet ? Op::GetGlobal : Op::SetGlobal, nameConstant);
	return Status::Ok;
}

Compiler::Status Compiler::loadVariable(std::string_view name, const SourceLocation& location)
{
	return variable(name, true, location);
}

Compiler::Status Compiler::setVariable(std::string_view name, const SourceLocation& location)
{
	return variable(name, false, location);
}

Compiler::Status Compiler::addConstant(Constant constant, uint32_t& result, const SourceLocation& location)
{
	auto& constants = currentChunk().constants;

	for (size_t i = 0; i < constants.size(); i++)
	{
		const auto& existing = constants[i];
		if (existing.type != constant.type)
			continue;

		// Numbers are compared bitwise so 0.0 and -0.0 get different slots.
		if ((constant.type == Constant::Type::Number)
			&& (memcmp(&existing.numberValue, &constant.numberValue, sizeof(Float)) == 0))
		{
			result = static_cast<uint32_t>(i);
			return Status::Ok;
		}
		if ((constant.type == Constant::Type::String) && (existing.stringValue == constant.stringValue))
		{
			result = static_cast<uint32_t>(i);
			return Status::Ok;
		}
	}

	if (constants.size() >= std::numeric_limits<uint32_t>::max())
	{
		return errorAt(location, CompileErrorType::Semantic, "too many constants in function");
	}
	constants.push_back(std::move(constant));
	result = static_cast<uint32_t>(constants.size() - 1);
	return Status::Ok;
}

Compiler::Status Compiler::stringConstant(std::string_view string, uint32_t& result, const SourceLocation& location)
{
	return addConstant(Constant::string(std::string(string)), result, location);
}

Compiler::Status Compiler::loadConstant(Constant constant, const SourceLocation& location)
{
	uint32_t index;
	TRY(addConstant(std::move(constant), index, location));
	emitOpArg(Op::GetConstant, index);
	return Status::Ok;
}

Chunk& Compiler::currentChunk()
{
	return *m_functions.back().chunk;
}

ByteCode& Compiler::currentByteCode()
{
	return currentChunk().byteCode;
}

void Compiler::emitOp(Op op)
{
	emitUint8(static_cast<uint8_t>(op));
}

void Compiler::emitOpArg(Op op, uint32_t arg)
{
	emitOp(op);
	emitUint32(arg);
}

void Compiler::emitUint8(uint8_t value)
{
	auto& code = currentByteCode();
	code.code.push_back(value);
	code.lineNumberAtOffset.push_back(m_lineNumberStack.back());
}

void Compiler::emitUint32(uint32_t value)
{
	emitUint8(static_cast<uint8_t>((value >> 24) & 0xFF));
	emitUint8(static_cast<uint8_t>((value >> 16) & 0xFF));
	emitUint8(static_cast<uint8_t>((value >> 8) & 0xFF));
	emitUint8(static_cast<uint8_t>(value & 0xFF));
}

size_t Compiler::emitJump(Op op)
{
	emitOp(op);
	const auto placeToPatch = currentLocation();
	emitUint32(0);
	m_functions.back().unpatchedJumpCount++;
	return placeToPatch;
}

Compiler::Status Compiler::emitJumpBack(size_t location, const SourceLocation& errorLocation)
{
	const auto jumpSize = (currentLocation() + 1 + sizeof(uint32_t)) - location;
	if (jumpSize > std::numeric_limits<uint32_t>::max())
	{
		return errorAt(errorLocation, CompileErrorType::Semantic, "jump too large");
	}
	emitOpArg(Op::JumpBack, static_cast<uint32_t>(jumpSize));
	return Status::Ok;
}

Compiler::Status Compiler::setJumpToHere(size_t placeToPatch, const SourceLocation& errorLocation)
{
	const auto jumpSize = currentLocation() - (placeToPatch + sizeof(uint32_t));
	if (jumpSize > std::numeric_limits<uint32_t>::max())
	{
		return errorAt(errorLocation, CompileErrorType::Semantic, "jump too large");
	}
	patch(placeToPatch, static_cast<uint32_t>(jumpSize));
	m_functions.back().unpatchedJumpCount--;
	return Status::Ok;
}

void Compiler::patch(size_t placeToPatch, uint32_t value)
{
	uint8_t* jumpLocation = &currentByteCode().code[placeToPatch];
	jumpLocation[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
	jumpLocation[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
	jumpLocation[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
	jumpLocation[3] = static_cast<uint8_t>(value & 0xFF);
}

size_t Compiler::currentLocation()
{
	return currentByteCode().code.size();
}

size_t Compiler::currentFunctionDepth()
{
	return m_functions.size() - 1;
}

Compiler::Status Compiler::errorAt(const SourceLocation& location, CompileErrorType type, const char* format, ...)
{
	if (m_error.has_value())
		return Status::Error;

	va_list args;
	va_start(args, format);
	CompileError error;
	error.type = type;
	error.message = formatToString(format, args);
	va_end(args);
	error.position = m_sourceInfo->getPosition(location.start);
	error.start = location.start;
	error.end = location.end;
	m_error = std::move(error);

	if (m_errorReporter != nullptr)
	{
		m_errorReporter->onCompilerError(*m_error);
	}
	return Status::Error;
}
