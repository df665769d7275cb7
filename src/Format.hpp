#pragma once

#include <string>
#include <stdarg.h>

namespace Lla
{

// Messages longer than MAX_FORMATTED_SIZE are cut off and end with "...".
std::string formatToString(const char* format, va_list args);
std::string formatToString(const char* format, ...);

// Shortest representation that round trips, so 7.0 is formatted as "7".
std::string numberToString(double value);

}
