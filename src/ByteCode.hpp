#pragma once

#include <Op.hpp>

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace Lla
{

	struct ByteCode
	{
		uint32_t readUint32(size_t offset) const;

		std::vector<uint8_t> code;
		// One entry per byte of code. Lines start from 1.
		std::vector<size_t> lineNumberAtOffset;
	};

}
