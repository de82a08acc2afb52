#pragma once

#include <cstdint>

#include "r8_error.hpp"
#include "r8_prelude.hpp"

namespace r8 {

// A pointer into the 12-bit CHIP-8 address space.
class address {
    uint16_t value = 0;

public:
    static constexpr uint16_t entry_point = rom_memory_offset;

    constexpr address() = default;
    // bits above the 12-bit space are dropped
    constexpr explicit address(uint16_t raw) : value(raw & max_address) {}

    // Checked conversion from a wider value. `out` is untouched on failure.
    static error from(uint32_t raw, address& out);

    // Fails without modifying the address if the sum leaves the address space.
    error add_assign(uint32_t delta);

    constexpr uint16_t inner(void) const { return value; }

    constexpr bool operator==(const address& rhs) const { return value == rhs.value; }
    constexpr bool operator!=(const address& rhs) const { return value != rhs.value; }
};

} // namespace r8
