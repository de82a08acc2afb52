#include "r8_memory.hpp"

#include <cstring>

namespace r8 {

namespace {

constexpr uint8_t fontset[16 * font_glyph_bytes] = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80  // F
};

bool range_fits(address addr, size_t count)
{
    return count <= static_cast<size_t>(memory_size_bytes - addr.inner());
}

} // namespace

memory::memory(void)
{
    bytes.fill(0);
    memcpy(bytes.data(), fontset, sizeof(fontset));
}

error memory::load_rom(const uint8_t* rom, size_t count)
{
    if (count > static_cast<size_t>(allowed_rom_memory)) return error::rom_too_large;

    bytes.fill(0);
    memcpy(bytes.data(), fontset, sizeof(fontset));
    if (count > 0) memcpy(bytes.data() + rom_memory_offset, rom, count);

    return error::none;
}

error memory::read_range(address addr, const uint8_t* src, size_t count)
{
    if (!range_fits(addr, count)) return error::memory_out_of_bounds;
    if (count > 0) memcpy(bytes.data() + addr.inner(), src, count);
    return error::none;
}

error memory::write_range(address addr, uint8_t* dst, size_t count) const
{
    if (!range_fits(addr, count)) return error::memory_out_of_bounds;
    if (count > 0) memcpy(dst, bytes.data() + addr.inner(), count);
    return error::none;
}

} // namespace r8
