#pragma once

#include <cstdint>

#include "r8_prelude.hpp"

namespace r8 {

// Hex keypad state as a 16-bit mask, bit k set while key k is held.
// Written by the front-end, only read by the emulator.
class keyboard {
    uint16_t mask = 0;

public:
    void set(uint8_t key, bool pressed)
    {
        if (key >= user_input_key_count) return;
        const uint16_t bit = static_cast<uint16_t>(1u << key);
        mask = pressed ? (mask | bit) : (mask & ~bit);
    }

    bool is_set(uint8_t key) const
    {
        return key < user_input_key_count && (mask & (1u << key)) != 0;
    }

    void clear(void) { mask = 0; }

    uint16_t bits(void) const { return mask; }
};

} // namespace r8
