#pragma once

#include <Ast.hpp>
#include <Chunk.hpp>
#include <Errors.hpp>
#include <ErrorReporter.hpp>
#include <Parsing/SourceInfo.hpp>
#include <memory>
#include <optional>
#include <unordered_set>

// The compiler only builds Chunks, it never touches the heap. The Vm turns the constants into objects when it loads a function.

namespace Lla
{

class Compiler
{
public:
	class Result
	{
	public:
		bool hadError;
		std::optional<CompileError> error;
		std::shared_ptr<const Chunk> program;
	};

	static constexpr size_t MAX_LOCALS = 256;
	static constexpr size_t MAX_UPVALUES = 255;

private:
	struct Local
	{
		std::string_view name;
		uint32_t index;
		bool isCaptured;
	};

	struct Scope
	{
		std::vector<Local> locals;
		size_t functionDepth;
		// The locals of the outermost scope of a function are discarded by Return so they don't need to be popped.
		bool isFunctionScope;
	};

	struct Loop
	{
		size_t loopStartLocation;
		// Number of scopes when the loop started. Scopes above this are exited by break and continue.
		size_t scopeDepth;
		size_t functionDepth;
		std::vector<size_t> breakJumpLocations;
	};

	struct Upvalue
	{
		uint32_t index;
		bool isLocal;
	};

	struct Function
	{
		Chunk* chunk;
		std::vector<Upvalue> upvalues;
		size_t localCount;
		size_t unpatchedJumpCount;
	};

	enum class [[nodiscard]] Status
	{
		Ok,
		Error
	};

public:
	Compiler();

	Result compile(const StmtList& ast, const SourceInfo& sourceInfo, ErrorReporter* errorReporter = nullptr);

private:
	// Compiles the function and emits a Closure instruction creating it inside the enclosing function.
	// [] -> [closure]
	Status compileFunction(
		std::string_view name,
		const std::vector<std::string_view>& arguments,
		const StmtList& stmts,
		const SourceLocation& location);
	Status compile(const std::unique_ptr<Stmt>& stmt);
	Status compile(const StmtList& stmts);
	Status exprStmt(const ExprStmt& stmt);
	Status printStmt(const PrintStmt& stmt);
	Status variableDeclarationStmt(const VariableDeclarationStmt& stmt);
	Status blockStmt(const BlockStmt& stmt);
	Status fnStmt(const FnStmt& stmt);
	Status structStmt(const StructStmt& stmt);
	Status retStmt(const RetStmt& stmt);
	Status ifStmt(const IfStmt& stmt);
	Status loopStmt(const LoopStmt& stmt);
	Status breakStmt(const BreakStmt& stmt);
	Status continueStmt(const ContinueStmt& stmt);
	Status compileBlock(const StmtList& stmts);

	// [] -> [result]
	Status compile(const std::unique_ptr<Expr>& expr);
	Status numberConstantExpr(const NumberConstantExpr& expr);
	Status stringConstantExpr(const StringConstantExpr& expr);
	Status boolConstantExpr(const BoolConstantExpr& expr);
	Status nilExpr(const NilExpr& expr);
	Status binaryExpr(const BinaryExpr& expr);
	Status logicalExpr(const LogicalExpr& expr);
	Status unaryExpr(const UnaryExpr& expr);
	Status identifierExpr(const IdentifierExpr& expr);
	Status callExpr(const CallExpr& expr);
	Status assignmentExpr(const AssignmentExpr& expr);
	Status getFieldExpr(const GetFieldExpr& expr);
	Status lambdaExpr(const LambdaExpr& expr);

	// Declares a variable in the current scope. Locals take the stack slot the value is going to be pushed into,
	// so it has to be called just before or after the value is pushed.
	Status declareVariable(std::string_view name, const SourceLocation& location);
	// Must be called after declareVariable once the value is on top of the stack.
	// [value] -> [] for globals, [value] -> [value] for locals.
	Status defineVariable(std::string_view name, const SourceLocation& location);
	void beginScope();
	void endScope();
	Scope& currentScope();
	// Emits the code discarding the locals of the scope without removing them from the compiler state.
	void popOffLocals(const Scope& scope);
	std::optional<uint32_t> resolveLocal(size_t functionDepth, std::string_view name);
	Status resolveUpvalue(size_t functionDepth, std::string_view name, std::optional<uint32_t>& result, const SourceLocation& location);
	Status addUpvalue(size_t functionDepth, uint32_t index, bool isLocal, uint32_t& result, const SourceLocation& location);
	// Could make the function return a sum type with all the possible variable locations but a flag is simpler.
	Status variable(std::string_view name, bool trueIfLoadFalseIfSet, const SourceLocation& location);
	Status loadVariable(std::string_view name, const SourceLocation& location);
	Status setVariable(std::string_view name, const SourceLocation& location);

	Status addConstant(Constant constant, uint32_t& result, const SourceLocation& location);
	Status stringConstant(std::string_view string, uint32_t& result, const SourceLocation& location);
	Status loadConstant(Constant constant, const SourceLocation& location);

	Chunk& currentChunk();
	ByteCode& currentByteCode();
	void emitOp(Op op);
	void emitOpArg(Op op, uint32_t arg);
	void emitUint8(uint8_t value);
	void emitUint32(uint32_t value);
	// Returns the location of the operand to patch.
	size_t emitJump(Op op);
	Status emitJumpBack(size_t location, const SourceLocation& errorLocation);
	Status setJumpToHere(size_t placeToPatch, const SourceLocation& errorLocation);
	void patch(size_t placeToPatch, uint32_t value);
	size_t currentLocation();
	size_t currentFunctionDepth();

	Status errorAt(const SourceLocation& location, CompileErrorType type, const char* format, ...);

private:
	std::vector<Scope> m_scopes;
	std::vector<Loop> m_loops;
	std::vector<Function> m_functions;

	// Stores the line numbers of the currently compiled things. Expressions might be on a different lines
	// than the statements they are in so a stack is needed.
	std::vector<size_t> m_lineNumberStack;

	// Globals declared in the current compilation unit.
	std::unordered_set<std::string_view> m_globalNames;

	std::optional<CompileError> m_error;
	ErrorReporter* m_errorReporter;
	const SourceInfo* m_sourceInfo;
};

}
