#include <Ast.hpp>

using namespace Lla;

Expr::Expr(size_t start, size_t end, ExprType type)
	: start(start)
	, length(end - start)
	, type(type)
{}

SourceLocation Expr::location() const
{
	return SourceLocation(start, end());
}

size_t Expr::end() const
{
	return start + length;
}

Stmt::Stmt(size_t start, size_t end, StmtType type)
	: start(start)
	, length(end - start)
	, type(type)
{}

SourceLocation Stmt::location() const
{
	return SourceLocation(start, end());
}

size_t Stmt::end() const
{
	return start + length;
}

NumberConstantExpr::NumberConstantExpr(Float value, size_t start, size_t end)
	: Expr(start, end, ExprType::NumberConstant)
	, value(value)
{}

StringConstantExpr::StringConstantExpr(std::string value, size_t start, size_t end)
	: Expr(start, end, ExprType::StringConstant)
	, value(std::move(value))
{}

BoolConstantExpr::BoolConstantExpr(bool value, size_t start, size_t end)
	: Expr(start, end, ExprType::BoolConstant)
	, value(value)
{}

NilExpr::NilExpr(size_t start, size_t end)
	: Expr(start, end, ExprType::Nil)
{}

BinaryExpr::BinaryExpr(std::unique_ptr<Expr> lhs, TokenType op, std::unique_ptr<Expr> rhs, size_t start, size_t end)
	: Expr(start, end, ExprType::Binary)
	, op(op)
	, lhs(std::move(lhs))
	, rhs(std::move(rhs))
{}

LogicalExpr::LogicalExpr(std::unique_ptr<Expr> lhs, TokenType op, std::unique_ptr<Expr> rhs, size_t start, size_t end)
	: Expr(start, end, ExprType::Logical)
	, op(op)
	, lhs(std::move(lhs))
	, rhs(std::move(rhs))
{}

UnaryExpr::UnaryExpr(std::unique_ptr<Expr> expr, TokenType op, size_t start, size_t end)
	: Expr(start, end, ExprType::Unary)
	, op(op)
	, expr(std::move(expr))
{}

IdentifierExpr::IdentifierExpr(std::string_view identifier, size_t start, size_t end)
	: Expr(start, end, ExprType::Identifier)
	, identifier(identifier)
{}

CallExpr::CallExpr(std::unique_ptr<Expr> callee, std::vector<std::unique_ptr<Expr>> arguments, size_t start, size_t end)
	: Expr(start, end, ExprType::Call)
	, callee(std::move(callee))
	, arguments(std::move(arguments))
{}

AssignmentExpr::AssignmentExpr(std::unique_ptr<Expr> lhs, std::unique_ptr<Expr> rhs, size_t start, size_t end)
	: Expr(start, end, ExprType::Assignment)
	, lhs(std::move(lhs))
	, rhs(std::move(rhs))
{}

GetFieldExpr::GetFieldExpr(std::unique_ptr<Expr> lhs, std::string_view fieldName, size_t start, size_t end)
	: Expr(start, end, ExprType::GetField)
	, lhs(std::move(lhs))
	, fieldName(fieldName)
{}

LambdaExpr::LambdaExpr(std::vector<std::string_view> arguments, StmtList stmts, size_t start, size_t end)
	: Expr(start, end, ExprType::Lambda)
	, arguments(std::move(arguments))
	, stmts(std::move(stmts))
{}

ExprStmt::ExprStmt(std::unique_ptr<Expr> expr, size_t start, size_t end)
	: Stmt(start, end, StmtType::Expr)
	, expr(std::move(expr))
{}

PrintStmt::PrintStmt(std::unique_ptr<Expr> expr, size_t start, size_t end)
	: Stmt(start, end, StmtType::Print)
	, expr(std::move(expr))
{}

VariableDeclarationStmt::VariableDeclarationStmt(
	std::string_view name,
	std::optional<std::unique_ptr<Expr>> initializer,
	size_t start,
	size_t end)
	: Stmt(start, end, StmtType::VariableDeclaration)
	, name(name)
	, initializer(std::move(initializer))
{}

BlockStmt::BlockStmt(StmtList stmts, size_t start, size_t end)
	: Stmt(start, end, StmtType::Block)
	, stmts(std::move(stmts))
{}

FnStmt::FnStmt(
	std::string_view name,
	std::vector<std::string_view> arguments,
	StmtList stmts,
	size_t start,
	size_t end)
	: Stmt(start, end, StmtType::Fn)
	, name(name)
	, arguments(std::move(arguments))
	, stmts(std::move(stmts))
{}

StructStmt::StructStmt(std::string_view name, std::vector<std::string_view> fieldNames, size_t start, size_t end)
	: Stmt(start, end, StmtType::Struct)
	, name(name)
	, fieldNames(std::move(fieldNames))
{}

RetStmt::RetStmt(std::optional<std::unique_ptr<Expr>> returnValue, size_t start, size_t end)
	: Stmt(start, end, StmtType::Ret)
	, returnValue(std::move(returnValue))
{}

IfStmt::IfStmt(
	std::unique_ptr<Expr> condition,
	StmtList ifThen,
	std::optional<StmtList> elseThen,
	size_t start,
	size_t end)
	: Stmt(start, end, StmtType::If)
	, condition(std::move(condition))
	, ifThen(std::move(ifThen))
	, elseThen(std::move(elseThen))
{}

LoopStmt::LoopStmt(
	std::optional<std::unique_ptr<Expr>> condition,
	StmtList block,
	size_t start,
	size_t end)
	: Stmt(start, end, StmtType::Loop)
	, condition(std::move(condition))
	, block(std::move(block))
{}

BreakStmt::BreakStmt(size_t start, size_t end)
	: Stmt(start, end, StmtType::Break)
{}

ContinueStmt::ContinueStmt(size_t start, size_t end)
	: Stmt(start, end, StmtType::Continue)
{}
