#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "r8_opcode.hpp"

namespace r8::disassembler {

// Assembly-style rendering, e.g. "DRW V1, V2, 0x5". Invalid words are
// rendered as their four nibbles.
std::string mnemonic(const instruction& instr);

// One "0xADDR  WORD  MNEMONIC" line per 2-byte word of `rom`, with the first
// word placed at `origin`. A trailing odd byte is ignored.
std::vector<std::string> disassemble(const uint8_t* rom, size_t count, uint16_t origin);

} // namespace r8::disassembler
