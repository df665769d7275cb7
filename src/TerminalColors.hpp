#pragma once

namespace Lla
{

namespace TerminalColors
{
	static const char* const RED = "\x1B[31m";
	static const char* const CYAN = "\x1B[36m";
	static const char* const RESET = "\x1B[0m";
}

}
