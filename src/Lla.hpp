#pragma once

#include <Chunk.hpp>
#include <Errors.hpp>
#include <ErrorReporter.hpp>
#include <Parsing/SourceInfo.hpp>
#include <memory>
#include <optional>
#include <string_view>

namespace Lla
{

struct CompileResult
{
	bool hadError() const;

	std::optional<CompileError> error;
	// True if the error happened because the source ended too early.
	bool errorAtEof;
	// nullptr if there was an error.
	std::shared_ptr<const Chunk> program;
};

// Scans, parses and compiles the source. Doesn't depend on any Vm so the result can be executed by any of them.
CompileResult compile(std::string_view source, ErrorReporter* errorReporter = nullptr);
CompileResult compile(const SourceInfo& sourceInfo, ErrorReporter* errorReporter = nullptr);

}
