#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "r8_address.hpp"
#include "r8_error.hpp"
#include "r8_prelude.hpp"

namespace r8 {

// 4 KiB of guest memory. The hex-digit font lives at address 0, programs are
// loaded at address::entry_point.
class memory {
    std::array<uint8_t, memory_size_bytes> bytes;

public:
    memory(void);

    // Zero everything, rewrite the font and copy `count` bytes to 0x200.
    // Memory is left untouched when the image doesn't fit.
    error load_rom(const uint8_t* rom, size_t count);

    // Copies caller data into memory starting at `addr`.
    error read_range(address addr, const uint8_t* src, size_t count);

    // Copies memory starting at `addr` out into the caller's buffer.
    error write_range(address addr, uint8_t* dst, size_t count) const;

    uint8_t operator[](address addr) const { return bytes[addr.inner()]; }

    const uint8_t* data(void) const { return bytes.data(); }
};

} // namespace r8
