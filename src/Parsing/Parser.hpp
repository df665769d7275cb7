#pragma once

#include <Ast.hpp>
#include <Errors.hpp>
#include <Parsing/Scanner.hpp>
#include <Parsing/Token.hpp>
#include <Parsing/SourceInfo.hpp>
#include <ErrorReporter.hpp>

#include <optional>
#include <vector>

namespace Lla
{

// Stops at the first error.
class Parser
{
public:
	class ParsingError
	{};

	class Result
	{
	public:
		bool hadError;
		// True if the error happened because the source ended too early.
		bool errorAtEof;
		std::optional<CompileError> error;
		StmtList ast;
	};

	static constexpr int MAX_NESTING_DEPTH = 256;

public:
	Parser();

	// The scanner has to be initialized with the same source info. The error reporter can be nullptr.
	Result parse(Scanner& scanner, const SourceInfo& sourceInfo, ErrorReporter* errorReporter);

private:
	std::unique_ptr<Stmt> stmt();
	std::unique_ptr<Stmt> exprStmt();
	std::unique_ptr<Stmt> printStmt();
	std::unique_ptr<Stmt> blockStmt();
	std::unique_ptr<Stmt> fnStmt();
	std::unique_ptr<Stmt> structStmt();
	std::unique_ptr<Stmt> retStmt();
	std::unique_ptr<Stmt> ifStmt();
	std::unique_ptr<Stmt> loopStmt();
	std::unique_ptr<Stmt> whileStmt();
	std::unique_ptr<Stmt> breakStmt();
	std::unique_ptr<Stmt> continueStmt();
	std::unique_ptr<Stmt> variableDeclarationStmt();

	std::vector<std::string_view> parameters();
	StmtList block();

	std::unique_ptr<Expr> expr();
	std::unique_ptr<Expr> assignment();
	std::unique_ptr<Expr> orExpr();
	std::unique_ptr<Expr> andExpr();
	std::unique_ptr<Expr> equality();
	std::unique_ptr<Expr> comparison();
	std::unique_ptr<Expr> term();
	std::unique_ptr<Expr> factor();
	std::unique_ptr<Expr> unary();
	std::unique_ptr<Expr> callOrFieldAccess();
	std::unique_ptr<Expr> primary();

	const Token& peek() const;
	const Token& peekPrevious() const;
	const Token& peekNext() const;
	void advance();
	bool isAtEnd() const;
	bool match(TokenType type);
	bool check(TokenType type) const;
	void expect(TokenType type, const char* format, ...);
	// A ';' can be left out before a '}' or at the end of the source.
	void expectTerminator();
	void enterNesting();
	void exitNesting(int levels = 1);
	// Returning the value so it can be thrown at the call site.
	ParsingError errorAt(const Token& token, std::optional<TokenType> expected, const char* format, ...);
	void errorAtImplementation(const Token& token, std::optional<TokenType> expected, const char* format, va_list args);
	ParsingError scannerError();

private:
	Scanner* m_scanner;
	Token m_previous;
	Token m_current;
	Token m_next;

	int m_nestingDepth;

	std::optional<CompileError> m_error;
	const SourceInfo* m_sourceInfo;
	ErrorReporter* m_errorReporter;
};

}
