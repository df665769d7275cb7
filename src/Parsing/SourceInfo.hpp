#pragma once 

#include <string_view>
#include <string>
#include <vector>

namespace Lla
{

// Lines and columns start from 1. Columns count bytes.
struct SourcePosition
{
	size_t line;
	size_t column;
};

struct SourceLocation
{
	SourceLocation(size_t start, size_t end);

	size_t start;
	size_t end;
};

// The source text has to outlive the SourceInfo.
struct SourceInfo
{
public:
	SourceInfo(std::string_view displayedFilename, std::string_view source);

	std::string_view getLineText(size_t line) const;
	size_t getLine(size_t offsetInFile) const;
	SourcePosition getPosition(size_t offsetInFile) const;
	size_t lineCount() const;

public:
	std::string displayedFilename;
	std::string_view source;
	std::vector<size_t> lineStartOffsets;
};

}
