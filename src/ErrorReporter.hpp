#pragma once

#include <Errors.hpp>

namespace Lla
{

class ErrorReporter
{
public:
	virtual ~ErrorReporter() = default;
	virtual void onScannerError(const CompileError& error) = 0;
	virtual void onParserError(const CompileError& error) = 0;
	virtual void onCompilerError(const CompileError& error) = 0;
	virtual void onVmError(const RuntimeError& error) = 0;
};

}
