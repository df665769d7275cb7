#pragma once

#include <ErrorReporter.hpp>
#include <Parsing/SourceInfo.hpp>
#include <ostream>

namespace Lla
{

class TerminalErrorReporter final : public ErrorReporter
{
public:
	TerminalErrorReporter(std::ostream& errorOut, const SourceInfo& sourceInfo, size_t tabWidth);

	void onScannerError(const CompileError& error) override;
	void onParserError(const CompileError& error) override;
	void onCompilerError(const CompileError& error) override;
	void onVmError(const RuntimeError& error) override;

private:
	void errorAt(const CompileError& error);
	void printErrorStart(std::string_view position, std::string_view typeName, std::string_view message);

	static std::string_view trimLine(std::string_view line);

private:
	std::ostream& m_out;
	const SourceInfo& m_sourceInfo;
	const size_t m_tabWidth;
};

}
