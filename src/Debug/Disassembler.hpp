#pragma once

#include <Chunk.hpp>
#include <ostream>

namespace Lla
{

void debugPrintConstant(const Constant& constant, std::ostream& out);
// Returns the size of the instruction.
size_t disassembleInstruction(const Chunk& chunk, size_t offset, std::ostream& out);
void disassembleChunk(const Chunk& chunk, std::ostream& out);

}
