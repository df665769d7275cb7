#include <Parsing/Parser.hpp>
#include <Format.hpp>
#include <Asserts.hpp>

using namespace Lla;

Parser::Parser()
	: m_scanner(nullptr)
	, m_previous(TokenType::Eof, 0, 0)
	, m_current(TokenType::Eof, 0, 0)
	, m_next(TokenType::Eof, 0, 0)
	, m_nestingDepth(0)
	, m_sourceInfo(nullptr)
	, m_errorReporter(nullptr)
{}

Parser::Result Parser::parse(Scanner& scanner, const SourceInfo& sourceInfo, ErrorReporter* errorReporter)
{
	m_scanner = &scanner;
	m_sourceInfo = &sourceInfo;
	m_errorReporter = errorReporter;
	m_nestingDepth = 0;
	m_error = std::nullopt;

	m_previous = Token(TokenType::Eof, 0, 0);
	m_current = m_scanner->nextToken();
	m_next = m_scanner->nextToken();

	StmtList ast;
	try
	{
		if (check(TokenType::Error))
		{
			throw scannerError();
		}

		while (isAtEnd() == false)
		{
			if (match(TokenType::Semicolon))
				; // Null statement like this line
			else
				ast.push_back(stmt());
		}
	}
	catch (const ParsingError&)
	{
		ast.clear();
	}

	const auto errorAtEof = m_error.has_value()
		&& (m_error->type == CompileErrorType::Parse)
		&& (m_error->found == TokenType::Eof);
	return Result{ m_error.has_value(), errorAtEof, std::move(m_error), std::move(ast) };
}

std::unique_ptr<Stmt> Parser::stmt()
{
	if (match(TokenType::LeftBrace))
		return blockStmt();
	// 'fun' followed by '(' is a lambda expression.
	if (check(TokenType::Fun) && (peekNext().type == TokenType::Identifier))
	{
		advance();
		return fnStmt();
	}
	if (match(TokenType::Var))
		return variableDeclarationStmt();
	if (match(TokenType::Struct))
		return structStmt();
	if (match(TokenType::Print))
		return printStmt();
	if (match(TokenType::Return))
		return retStmt();
	if (match(TokenType::If))
		return ifStmt();
	if (match(TokenType::Loop))
		return loopStmt();
	if (match(TokenType::While))
		return whileStmt();
	if (match(TokenType::Break))
		return breakStmt();
	if (match(TokenType::Continue))
		return continueStmt();

	return exprStmt();
}

std::unique_ptr<Stmt> Parser::exprStmt()
{
	const auto start = peek().start;
	auto expression = expr();
	const auto end = peekPrevious().end;
	expectTerminator();

	return std::make_unique<ExprStmt>(std::move(expression), start, end);
}

std::unique_ptr<Stmt> Parser::printStmt()
{
	const auto start = peekPrevious().start;
	auto expression = expr();
	const auto end = peekPrevious().end;
	expectTerminator();

	return std::make_unique<PrintStmt>(std::move(expression), start, end);
}

std::unique_ptr<Stmt> Parser::blockStmt()
{
	const auto start = peekPrevious().start;
	enterNesting();
	StmtList stmts;
	while ((isAtEnd() == false) && (check(TokenType::RightBrace) == false))
	{
		if (match(TokenType::Semicolon))
			continue;
		stmts.push_back(stmt());
	}
	expect(TokenType::RightBrace, "expected '}'");
	exitNesting();

	return std::make_unique<BlockStmt>(std::move(stmts), start, peekPrevious().end);
}

std::unique_ptr<Stmt> Parser::fnStmt()
{
	const auto start = peekPrevious().start;
	expect(TokenType::Identifier, "expected function name");
	const auto name = peekPrevious().lexeme;

	auto arguments = parameters();
	auto stmts = block();

	return std::make_unique<FnStmt>(name, std::move(arguments), std::move(stmts), start, peekPrevious().end);
}

std::unique_ptr<Stmt> Parser::structStmt()
{
	const auto start = peekPrevious().start;
	expect(TokenType::Identifier, "expected struct name");
	const auto name = peekPrevious().lexeme;

	std::vector<std::string_view> fieldNames;
	expect(TokenType::LeftBrace, "expected '{'");
	while (check(TokenType::RightBrace) == false)
	{
		expect(TokenType::Identifier, "expected field name");
		fieldNames.push_back(peekPrevious().lexeme);
		if (match(TokenType::Comma) == false)
			break;
	}
	expect(TokenType::RightBrace, "expected '}'");

	return std::make_unique<StructStmt>(name, std::move(fieldNames), start, peekPrevious().end);
}

std::unique_ptr<Stmt> Parser::retStmt()
{
	const auto start = peekPrevious().start;

	std::optional<std::unique_ptr<Expr>> returnValue = std::nullopt;
	if ((check(TokenType::Semicolon) || check(TokenType::RightBrace) || check(TokenType::Eof)) == false)
	{
		returnValue = expr();
	}
	const auto end = peekPrevious().end;
	expectTerminator();

	return std::make_unique<RetStmt>(std::move(returnValue), start, end);
}

std::unique_ptr<Stmt> Parser::ifStmt()
{
	const auto start = peekPrevious().start;
	auto condition = expr();
	auto ifThen = block();

	std::optional<StmtList> elseThen;
	if (match(TokenType::Elif))
	{
		StmtList elseBlock;
		enterNesting();
		elseBlock.push_back(ifStmt());
		exitNesting();
		elseThen = std::move(elseBlock);
	}
	else if (match(TokenType::Else))
	{
		elseThen = block();
	}

	return std::make_unique<IfStmt>(std::move(condition), std::move(ifThen), std::move(elseThen), start, peekPrevious().end);
}

std::unique_ptr<Stmt> Parser::loopStmt()
{
	const auto start = peekPrevious().start;
	auto stmts = block();
	return std::make_unique<LoopStmt>(std::nullopt, std::move(stmts), start, peekPrevious().end);
}

std::unique_ptr<Stmt> Parser::whileStmt()
{
	const auto start = peekPrevious().start;
	auto condition = expr();
	auto stmts = block();
	return std::make_unique<LoopStmt>(std::move(condition), std::move(stmts), start, peekPrevious().end);
}

std::unique_ptr<Stmt> Parser::breakStmt()
{
	const auto start = peekPrevious().start;
	const auto end = peekPrevious().end;
	expectTerminator();
	return std::make_unique<BreakStmt>(start, end);
}

std::unique_ptr<Stmt> Parser::continueStmt()
{
	const auto start = peekPrevious().start;
	const auto end = peekPrevious().end;
	expectTerminator();
	return std::make_unique<ContinueStmt>(start, end);
}

std::unique_ptr<Stmt> Parser::variableDeclarationStmt()
{
	const auto start = peekPrevious().start;
	expect(TokenType::Identifier, "expected variable name");
	const auto name = peekPrevious().lexeme;

	std::optional<std::unique_ptr<Expr>> initializer;
	if (match(TokenType::Equals))
	{
		initializer = expr();
	}
	const auto end = peekPrevious().end;
	expectTerminator();

	return std::make_unique<VariableDeclarationStmt>(name, std::move(initializer), start, end);
}

std::vector<std::string_view> Parser::parameters()
{
	std::vector<std::string_view> arguments;
	expect(TokenType::LeftParen, "expected '('");
	if (check(TokenType::RightParen) == false)
	{
		do
		{
			expect(TokenType::Identifier, "expected parameter name");
			arguments.push_back(peekPrevious().lexeme);
		} while (match(TokenType::Comma));
	}
	expect(TokenType::RightParen, "expected ')'");
	return arguments;
}

StmtList Parser::block()
{
	expect(TokenType::LeftBrace, "expected '{'");
	enterNesting();
	StmtList stmts;

	while ((isAtEnd() == false) && (check(TokenType::RightBrace) == false))
	{
		if (match(TokenType::Semicolon))
			continue;
		stmts.push_back(stmt());
	}
	expect(TokenType::RightBrace, "expected '}'");
	exitNesting();
	
	return stmts;
}

std::unique_ptr<Expr> Parser::expr()
{
	enterNesting();
	auto expression = assignment();
	exitNesting();
	return expression;
}

std::unique_ptr<Expr> Parser::assignment()
{
	const auto start = peek().start;
	auto lhs = orExpr();

	if (match(TokenType::Equals))
	{
		// Right associative.
		enterNesting();
		auto rhs = assignment();
		exitNesting();
		return std::make_unique<AssignmentExpr>(std::move(lhs), std::move(rhs), start, peekPrevious().end);
	}

	return lhs;
}

#define PARSE_LEFT_RECURSIVE_BINARY_EXPR(matches, lowerPrecedenceFunction, ExprStruct) \
	const auto start = peek().start; \
	auto expr = lowerPrecedenceFunction(); \
	/* Every operator deepens the left spine of the tree. */ \
	int chainLength = 0; \
	while (matches) \
	{ \
		enterNesting(); \
		chainLength++; \
		TokenType op = peekPrevious().type; \
		auto rhs = lowerPrecedenceFunction(); \
		const auto end = peekPrevious().end; \
		expr = std::make_unique<ExprStruct>(std::move(expr), op, std::move(rhs), start, end); \
	} \
	exitNesting(chainLength); \
	return expr;

std::unique_ptr<Expr> Parser::orExpr()
{
	PARSE_LEFT_RECURSIVE_BINARY_EXPR(match(TokenType::Or), andExpr, LogicalExpr)
}

std::unique_ptr<Expr> Parser::andExpr()
{
	PARSE_LEFT_RECURSIVE_BINARY_EXPR(match(TokenType::And), equality, LogicalExpr)
}

std::unique_ptr<Expr> Parser::equality()
{
	PARSE_LEFT_RECURSIVE_BINARY_EXPR(match(TokenType::EqualsEquals) || match(TokenType::NotEquals), comparison, BinaryExpr)
}

std::unique_ptr<Expr> Parser::comparison()
{
	PARSE_LEFT_RECURSIVE_BINARY_EXPR(
		match(TokenType::Less) || match(TokenType::LessEquals) || match(TokenType::More) || match(TokenType::MoreEquals),
		term,
		BinaryExpr)
}

std::unique_ptr<Expr> Parser::term()
{
	PARSE_LEFT_RECURSIVE_BINARY_EXPR(match(TokenType::Plus) || match(TokenType::Minus), factor, BinaryExpr)
}

std::unique_ptr<Expr> Parser::factor()
{
	PARSE_LEFT_RECURSIVE_BINARY_EXPR(match(TokenType::Star) || match(TokenType::Slash) || match(TokenType::Percent), unary, BinaryExpr)
}

#undef PARSE_LEFT_RECURSIVE_BINARY_EXPR

std::unique_ptr<Expr> Parser::unary()
{
	const auto start = peek().start;

	if (match(TokenType::Minus) || match(TokenType::Not))
	{
		const auto op = peekPrevious().type;
		enterNesting();
		auto expression = unary();
		exitNesting();
		return std::make_unique<UnaryExpr>(std::move(expression), op, start, peekPrevious().end);
	}

	return callOrFieldAccess();
}

std::unique_ptr<Expr> Parser::callOrFieldAccess()
{
	const auto start = peek().start;
	auto expression = primary();

	int chainLength = 0;
	for (;;)
	{
		if (check(TokenType::LeftParen) || check(TokenType::Dot))
		{
			enterNesting();
			chainLength++;
		}

		if (match(TokenType::LeftParen))
		{
			std::vector<std::unique_ptr<Expr>> arguments;
			if (check(TokenType::RightParen) == false)
			{
				do
				{
					arguments.push_back(expr());
				} while (match(TokenType::Comma));
			}
			expect(TokenType::RightParen, "expected ')'");
			expression = std::make_unique<CallExpr>(std::move(expression), std::move(arguments), start, peekPrevious().end);
		}
		else if (match(TokenType::Dot))
		{
			expect(TokenType::Identifier, "expected field name");
			const auto name = peekPrevious().lexeme;
			expression = std::make_unique<GetFieldExpr>(std::move(expression), name, start, peekPrevious().end);
		}
		else
		{
			exitNesting(chainLength);
			return expression;
		}
	}
}

std::unique_ptr<Expr> Parser::primary()
{
	if (match(TokenType::Number))
	{
		return std::make_unique<NumberConstantExpr>(peekPrevious().number, peekPrevious().start, peekPrevious().end);
	}
	if (match(TokenType::String))
	{
		return std::make_unique<StringConstantExpr>(peekPrevious().string, peekPrevious().start, peekPrevious().end);
	}
	if (match(TokenType::Identifier))
	{
		return std::make_unique<IdentifierExpr>(peekPrevious().lexeme, peekPrevious().start, peekPrevious().end);
	}
	if (match(TokenType::True))
	{
		return std::make_unique<BoolConstantExpr>(true, peekPrevious().start, peekPrevious().end);
	}
	if (match(TokenType::False))
	{
		return std::make_unique<BoolConstantExpr>(false, peekPrevious().start, peekPrevious().end);
	}
	if (match(TokenType::Nil))
	{
		return std::make_unique<NilExpr>(peekPrevious().start, peekPrevious().end);
	}
	if (match(TokenType::LeftParen))
	{
		auto expression = expr();
		expect(TokenType::RightParen, "expected ')'");
		return expression;
	}
	if (match(TokenType::Fun))
	{
		const auto start = peekPrevious().start;
		auto arguments = parameters();
		auto stmts = block();
		return std::make_unique<LambdaExpr>(std::move(arguments), std::move(stmts), start, peekPrevious().end);
	}

	throw errorAt(peek(), std::nullopt, "expected expression");
}

const Token& Parser::peek() const
{
	return m_current;
}

const Token& Parser::peekPrevious() const
{
	return m_previous;
}

const Token& Parser::peekNext() const
{
	return m_next;
}

void Parser::advance()
{
	if (isAtEnd())
		return;

	m_previous = std::move(m_current);
	m_current = std::move(m_next);
	m_next = m_scanner->nextToken();

	if (m_current.type == TokenType::Error)
	{
		throw scannerError();
	}
}

bool Parser::isAtEnd() const
{
	return m_current.type == TokenType::Eof;
}

bool Parser::match(TokenType type)
{
	if (check(type))
	{
		advance();
		return true;
	}
	return false;
}

bool Parser::check(TokenType type) const
{
	return m_current.type == type;
}

void Parser::expect(TokenType type, const char* format, ...)
{
	if (check(type))
	{
		advance();
		return;
	}

	va_list args;
	va_start(args, format);
	errorAtImplementation(peek(), type, format, args);
	va_end(args);
	throw ParsingError{};
}

void Parser::expectTerminator()
{
	if (match(TokenType::Semicolon) || check(TokenType::RightBrace) || check(TokenType::Eof))
		return;

	throw errorAt(peek(), TokenType::Semicolon, "expected ';'");
}

void Parser::enterNesting()
{
	m_nestingDepth++;
	if (m_nestingDepth > MAX_NESTING_DEPTH)
	{
		throw errorAt(peek(), std::nullopt, "nesting too deep");
	}
}

void Parser::exitNesting(int levels)
{
	ASSERT(m_nestingDepth >= levels);
	m_nestingDepth -= levels;
}

Parser::ParsingError Parser::errorAt(const Token& token, std::optional<TokenType> expected, const char* format, ...)
{
	va_list args;
	va_start(args, format);
	errorAtImplementation(token, expected, format, args);
	va_end(args);
	return ParsingError{};
}

void Parser::errorAtImplementation(const Token& token, std::optional<TokenType> expected, const char* format, va_list args)
{
	if (m_error.has_value())
		return;

	CompileError error;
	error.type = CompileErrorType::Parse;
	error.message = formatToString(format, args);
	if (expected.has_value() == false)
	{
		error.message += formatToString(", found %s", tokenTypeToString(token.type));
	}
	else
	{
		error.message += formatToString(" but found %s", tokenTypeToString(token.type));
	}
	error.position = token.position;
	error.start = token.start;
	error.end = token.end;
	error.expected = expected;
	error.found = token.type;
	m_error = std::move(error);

	if (m_errorReporter != nullptr)
	{
		m_errorReporter->onParserError(*m_error);
	}
}

Parser::ParsingError Parser::scannerError()
{
	ASSERT(m_scanner->error().has_value());
	if (m_error.has_value() == false)
	{
		m_error = m_scanner->error();
		if (m_errorReporter != nullptr)
		{
			m_errorReporter->onScannerError(*m_error);
		}
	}
	return ParsingError{};
}
