#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Lla
{
	std::optional<std::string> stringFromFile(std::string_view path);
}
