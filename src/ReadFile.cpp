#include <ReadFile.hpp>
#include <fstream>

std::optional<std::string> Lla::stringFromFile(std::string_view path)
{
	std::ifstream file(std::string(path), std::ios::binary);

	if (file.fail())
	{
		return std::nullopt;
	}

	file.seekg(0, std::ios::end);
	const auto end = file.tellg();
	file.seekg(0, std::ios::beg);
	if ((end < 0) || file.fail())
	{
		return std::nullopt;
	}

	std::string result;
	result.resize(static_cast<size_t>(end));

	file.read(result.data(), static_cast<std::streamsize>(result.size()));
	if (file.fail())
	{
		return std::nullopt;
	}

	return result;
}
