#include <ByteCode.hpp>
#include <Asserts.hpp>

using namespace Lla;

uint32_t ByteCode::readUint32(size_t offset) const
{
	ASSERT(offset + 4 <= code.size());
	uint32_t value = 0;
	for (size_t i = 0; i < 4; i++)
	{
		value <<= 8;
		value |= static_cast<uint32_t>(code[offset + i]);
	}
	return value;
}
