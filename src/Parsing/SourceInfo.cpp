#include <Parsing/SourceInfo.hpp>
#include <Asserts.hpp>
#include <algorithm>

using namespace Lla;

SourceLocation::SourceLocation(size_t start, size_t end)
	: start(start)
	, end(end)
{}

SourceInfo::SourceInfo(std::string_view displayedFilename, std::string_view source)
	: displayedFilename(displayedFilename)
	, source(source)
{
	lineStartOffsets.push_back(0);
	for (size_t i = 0; i < source.size(); i++)
	{
		if (source[i] == '\n')
		{
			lineStartOffsets.push_back(i + 1);
		}
	}
}

std::string_view SourceInfo::getLineText(size_t line) const
{
	ASSERT((line >= 1) && (line <= lineStartOffsets.size()));

	const auto lineStart = lineStartOffsets[line - 1];
	auto lineEnd = (line == lineStartOffsets.size())
		? source.size()
		: lineStartOffsets[line];

	if ((lineEnd > lineStart) && (source[lineEnd - 1] == '\n'))
		lineEnd--;
	if ((lineEnd > lineStart) && (source[lineEnd - 1] == '\r'))
		lineEnd--;

	return source.substr(lineStart, lineEnd - lineStart);
}

size_t SourceInfo::getLine(size_t offsetInFile) const
{
	// + 1 because end offset points one element past position.
	ASSERT(offsetInFile < source.length() + 1);

	const auto nextLineStart = std::upper_bound(lineStartOffsets.begin(), lineStartOffsets.end(), offsetInFile);
	return static_cast<size_t>(nextLineStart - lineStartOffsets.begin());
}

SourcePosition SourceInfo::getPosition(size_t offsetInFile) const
{
	const auto line = getLine(offsetInFile);
	return SourcePosition{ line, offsetInFile - lineStartOffsets[line - 1] + 1 };
}

size_t SourceInfo::lineCount() const
{
	return lineStartOffsets.size();
}
