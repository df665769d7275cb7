#include <TerminalErrorReporter.hpp>
#include <TerminalColors.hpp>
#include <string>

using namespace Lla;

TerminalErrorReporter::TerminalErrorReporter(std::ostream& errorOut, const SourceInfo& sourceInfo, size_t tabWidth)
	: m_out(errorOut)
	, m_sourceInfo(sourceInfo)
	, m_tabWidth(tabWidth)
{}

void TerminalErrorReporter::onScannerError(const CompileError& error)
{
	errorAt(error);
}

void TerminalErrorReporter::onParserError(const CompileError& error)
{
	errorAt(error);
}

void TerminalErrorReporter::onCompilerError(const CompileError& error)
{
	errorAt(error);
}

void TerminalErrorReporter::onVmError(const RuntimeError& error)
{
	auto position = m_sourceInfo.displayedFilename;
	if (error.stackTrace.empty() == false)
	{
		position += ':' + std::to_string(error.stackTrace.front().line);
	}
	printErrorStart(position, runtimeErrorTypeName(error.type), error.message);

	for (const auto& entry : error.stackTrace)
	{
		m_out << "line " << entry.line << " in " << entry.functionName << "()\n";
	}
}

void TerminalErrorReporter::errorAt(const CompileError& error)
{
	const auto position = m_sourceInfo.displayedFilename
		+ ':' + std::to_string(error.position.line)
		+ ':' + std::to_string(error.position.column);
	printErrorStart(position, compileErrorTypeName(error.type), error.message);

	const auto startLine = m_sourceInfo.getLine(error.start);
	// The end is one past the last character.
	const auto endLine = m_sourceInfo.getLine((error.end > error.start) ? (error.end - 1) : error.start);

	for (auto currentLine = startLine; currentLine <= endLine; currentLine++)
	{
		const auto lineText = m_sourceInfo.getLineText(currentLine);
		if (trimLine(lineText).empty() && (startLine != endLine))
		{
			continue;
		}
		m_out << lineText << '\n';

		const auto lineStart = m_sourceInfo.lineStartOffsets[currentLine - 1];
		for (size_t i = lineStart; i < lineStart + lineText.size(); i++)
		{
			const auto isTab = m_sourceInfo.source[i] == '\t';
			const auto width = isTab ? m_tabWidth : 1;
			const auto isHighlighted = (i >= error.start) && (i < error.end);
			if (isHighlighted)
				m_out << TerminalColors::RED;
			for (size_t _ = 0; _ < width; _++)
			{
				m_out << (isHighlighted ? '~' : ' ');
			}
			if (isHighlighted)
				m_out << TerminalColors::RESET;
		}
		// Errors at the end of the source point past the last character.
		if ((error.start == error.end) || (error.start >= lineStart + lineText.size()))
		{
			m_out << TerminalColors::RED << '~' << TerminalColors::RESET;
		}
		m_out << '\n';
	}
}

void TerminalErrorReporter::printErrorStart(std::string_view position, std::string_view typeName, std::string_view message)
{
	m_out << position
		<< ": " << TerminalColors::RED << "error: " << TerminalColors::RESET
		<< TerminalColors::CYAN << typeName << ": " << message << TerminalColors::RESET << '\n';
}

std::string_view TerminalErrorReporter::trimLine(std::string_view line)
{
	static const char* WHITESPACE = " \t\n\r\f\v";

	const auto prefixOffset = line.find_first_not_of(WHITESPACE);
	if (prefixOffset == std::string_view::npos)
	{
		return line.substr(0, 0);
	}
	line.remove_prefix(prefixOffset);

	const auto suffixOffset = line.find_last_not_of(WHITESPACE);
	line.remove_suffix(line.size() - suffixOffset - 1);

	return line;
}
