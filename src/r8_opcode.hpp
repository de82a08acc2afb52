#pragma once

#include <cstdint>
#include <tuple>

#include "r8_prelude.hpp"

namespace r8 {

// One raw, big-endian CHIP-8 instruction word.
class opcode {
    uint16_t word;

public:
    constexpr explicit opcode(uint16_t w) : word(w) {}
    constexpr opcode(uint8_t upper, uint8_t lower)
        : word(static_cast<uint16_t>((upper << 8) | lower))
    {
    }

    constexpr uint16_t raw(void) const { return word; }

    std::tuple<uint8_t, uint8_t, uint8_t, uint8_t> nibbles(void) const
    {
        return {ith_hex_digit<0>(word), ith_hex_digit<1>(word), ith_hex_digit<2>(word),
                ith_hex_digit<3>(word)};
    }

    constexpr uint16_t nnn(void) const { return word & 0x0FFF; }
    constexpr uint8_t kk(void) const { return static_cast<uint8_t>(word & 0x00FF); }
    constexpr uint8_t x(void) const { return ith_hex_digit<1>(word); }
    constexpr uint8_t y(void) const { return ith_hex_digit<2>(word); }
    constexpr uint8_t n(void) const { return ith_hex_digit<3>(word); }
};

// One kind per base CHIP-8 instruction, named after its mnemonic.
enum class op {
    cls,          // 00E0
    ret,          // 00EE
    sys,          // 0NNN
    jp,           // 1NNN
    call,         // 2NNN
    se_byte,      // 3XKK
    sne_byte,     // 4XKK
    se_register,  // 5XY0
    ld_byte,      // 6XKK
    add_byte,     // 7XKK
    ld_register,  // 8XY0
    or_,          // 8XY1
    and_,         // 8XY2
    xor_,         // 8XY3
    add_register, // 8XY4
    sub,          // 8XY5
    shr,          // 8XY6
    subn,         // 8XY7
    shl,          // 8XYE
    sne_register, // 9XY0
    ld_i,         // ANNN
    jp_v0,        // BNNN
    rnd,          // CXKK
    drw,          // DXYN
    skp,          // EX9E
    sknp,         // EXA1
    ld_vx_dt,     // FX07
    ld_vx_k,      // FX0A
    ld_dt_vx,     // FX15
    ld_st_vx,     // FX18
    add_i_vx,     // FX1E
    ld_f_vx,      // FX29
    ld_b_vx,      // FX33
    ld_i_vx,      // FX55
    ld_vx_i,      // FX65
    invalid,
};

// A decoded instruction: its kind plus every operand field of the word.
// Fields the kind doesn't use are still filled in from the raw word.
struct instruction {
    op kind;
    uint16_t raw;
    uint16_t nnn;
    uint8_t kk;
    uint8_t x;
    uint8_t y;
    uint8_t n;
};

instruction decode(opcode code);

} // namespace r8
