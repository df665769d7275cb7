#pragma once

#include <Value.hpp>
#include <Parsing/Token.hpp>
#include <memory>
#include <vector>
#include <optional>
#include <string>
#include <string_view>

// Names are string views into the source so the source has to outlive the tree.

namespace Lla
{

enum class ExprType
{
	NumberConstant,
	StringConstant,
	BoolConstant,
	Nil,
	Binary,
	Logical,
	Unary,
	Identifier,
	Call,
	Assignment,
	GetField,
	Lambda,
};

struct Expr
{
	Expr(size_t start, size_t end, ExprType type);
	virtual ~Expr() = default;

	SourceLocation location() const;
	size_t end() const;

	const size_t start;
	const size_t length;
	const ExprType type;
};

enum class StmtType
{
	Expr,
	Print,
	VariableDeclaration,
	Block,
	Fn,
	Struct,
	Ret,
	If,
	Loop,
	Break,
	Continue,
};

struct Stmt
{
	Stmt(size_t start, size_t end, StmtType type);
	virtual ~Stmt() = default;

	SourceLocation location() const;
	size_t end() const;

	const size_t start;
	const size_t length;
	const StmtType type;
};

using StmtList = std::vector<std::unique_ptr<Stmt>>;

struct NumberConstantExpr final : public Expr
{
	NumberConstantExpr(Float value, size_t start, size_t end);

	Float value;
};

struct StringConstantExpr final : public Expr
{
	StringConstantExpr(std::string value, size_t start, size_t end);

	// Escape sequences are already decoded.
	std::string value;
};

struct BoolConstantExpr final : public Expr
{
	BoolConstantExpr(bool value, size_t start, size_t end);

	bool value;
};

struct NilExpr final : public Expr
{
	NilExpr(size_t start, size_t end);
};

struct BinaryExpr final : public Expr
{
	BinaryExpr(std::unique_ptr<Expr> lhs, TokenType op, std::unique_ptr<Expr> rhs, size_t start, size_t end);

	TokenType op;
	std::unique_ptr<Expr> lhs;
	std::unique_ptr<Expr> rhs;
};

// 'and' and 'or'. The rhs is only evaluated if needed.
struct LogicalExpr final : public Expr
{
	LogicalExpr(std::unique_ptr<Expr> lhs, TokenType op, std::unique_ptr<Expr> rhs, size_t start, size_t end);

	TokenType op;
	std::unique_ptr<Expr> lhs;
	std::unique_ptr<Expr> rhs;
};

struct UnaryExpr final : public Expr
{
	UnaryExpr(std::unique_ptr<Expr> expr, TokenType op, size_t start, size_t end);
	
	TokenType op;
	std::unique_ptr<Expr> expr;
};

struct IdentifierExpr final : public Expr
{
	IdentifierExpr(std::string_view identifier, size_t start, size_t end);

	std::string_view identifier;
};

struct CallExpr final : public Expr
{
	CallExpr(std::unique_ptr<Expr> callee, std::vector<std::unique_ptr<Expr>> arguments, size_t start, size_t end);

	std::unique_ptr<Expr> callee;
	std::vector<std::unique_ptr<Expr>> arguments;
};

struct AssignmentExpr final : public Expr
{
	AssignmentExpr(std::unique_ptr<Expr> lhs, std::unique_ptr<Expr> rhs, size_t start, size_t end);

	std::unique_ptr<Expr> lhs;
	std::unique_ptr<Expr> rhs;
};

struct GetFieldExpr final : public Expr
{
	GetFieldExpr(std::unique_ptr<Expr> lhs, std::string_view fieldName, size_t start, size_t end);

	std::unique_ptr<Expr> lhs;
	std::string_view fieldName;
};

struct LambdaExpr final : public Expr
{
	LambdaExpr(std::vector<std::string_view> arguments, StmtList stmts, size_t start, size_t end);

	std::vector<std::string_view> arguments;
	StmtList stmts;
};

struct ExprStmt final : public Stmt
{
	ExprStmt(std::unique_ptr<Expr> expr, size_t start, size_t end);

	std::unique_ptr<Expr> expr;
};

struct PrintStmt final : public Stmt
{
	PrintStmt(std::unique_ptr<Expr> expr, size_t start, size_t end);

	std::unique_ptr<Expr> expr;
};

struct VariableDeclarationStmt final : public Stmt
{
	VariableDeclarationStmt(
		std::string_view name,
		std::optional<std::unique_ptr<Expr>> initializer,
		size_t start,
		size_t end);

	std::string_view name;
	std::optional<std::unique_ptr<Expr>> initializer;
};

struct BlockStmt final : public Stmt
{
	BlockStmt(StmtList stmts, size_t start, size_t end);

	StmtList stmts;
};

struct FnStmt final : public Stmt
{
	FnStmt(
		std::string_view name,
		std::vector<std::string_view> arguments,
		StmtList stmts,
		size_t start,
		size_t end);

	std::string_view name;
	std::vector<std::string_view> arguments;
	StmtList stmts;
};

struct StructStmt final : public Stmt
{
	StructStmt(std::string_view name, std::vector<std::string_view> fieldNames, size_t start, size_t end);

	std::string_view name;
	std::vector<std::string_view> fieldNames;
};

struct RetStmt final : public Stmt
{
	RetStmt(std::optional<std::unique_ptr<Expr>> returnValue, size_t start, size_t end);

	std::optional<std::unique_ptr<Expr>> returnValue;
};

// elif is parsed as an else block containing a single IfStmt.
struct IfStmt final : public Stmt
{
	IfStmt(
		std::unique_ptr<Expr> condition,
		StmtList ifThen,
		std::optional<StmtList> elseThen,
		size_t start,
		size_t end);

	std::unique_ptr<Expr> condition;
	StmtList ifThen;
	std::optional<StmtList> elseThen;
};

// Both 'loop' and 'while'. A loop without a condition only stops on break or return.
struct LoopStmt final : public Stmt
{
	LoopStmt(
		std::optional<std::unique_ptr<Expr>> condition,
		StmtList block,
		size_t start,
		size_t end);

	std::optional<std::unique_ptr<Expr>> condition;
	StmtList block;
};

struct BreakStmt final : public Stmt
{
	BreakStmt(size_t start, size_t end);
};

struct ContinueStmt final : public Stmt
{
	ContinueStmt(size_t start, size_t end);
};

}
