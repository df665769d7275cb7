#include <Format.hpp>
#include <stdio.h>
#include <string.h>
#include <charconv>
#include <Asserts.hpp>

using namespace Lla;

static constexpr size_t MAX_FORMATTED_SIZE = 2048;

std::string Lla::formatToString(const char* format, va_list args)
{
	char buffer[MAX_FORMATTED_SIZE];

	const auto bytesWritten = vsnprintf(buffer, sizeof(buffer), format, args);
	if (bytesWritten < 0)
	{
		return std::string(format);
	}
	if (static_cast<size_t>(bytesWritten) >= sizeof(buffer))
	{
		static constexpr char DOTS[] = "...";
		static constexpr size_t DOTS_SIZE = sizeof(DOTS) - 1; // Minus null byte
		memcpy(buffer + sizeof(buffer) - 1 - DOTS_SIZE, DOTS, DOTS_SIZE);
		return std::string(buffer, sizeof(buffer) - 1);
	}

	return std::string(buffer, static_cast<size_t>(bytesWritten));
}

std::string Lla::formatToString(const char* format, ...)
{
	va_list args;
	va_start(args, format);
	auto result = formatToString(format, args);
	va_end(args);
	return result;
}

std::string Lla::numberToString(double value)
{
	char buffer[64];
	const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
	ASSERT(result.ec == std::errc());
	return std::string(buffer, result.ptr);
}
