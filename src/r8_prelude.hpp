#pragma once

#include <chrono>
#include <cstdint>
#include <type_traits>

namespace r8 {

// see https://en.wikipedia.org/wiki/CHIP-8#Virtual_machine_description
constexpr auto memory_size_bytes = 4096;
constexpr auto rom_memory_offset = 0x200;
constexpr auto allowed_rom_memory = memory_size_bytes - rom_memory_offset;
constexpr auto max_address = 0x0FFF;
constexpr auto display_grid_width = 64;
constexpr auto display_grid_height = 32;
constexpr auto pixel_count = display_grid_width * display_grid_height;
constexpr auto max_stack_depth = 16;
constexpr auto user_input_key_count = 16;
constexpr auto register_count = 16;
constexpr auto flags_register = 0xF;
constexpr auto font_glyph_bytes = 5;

// typedef for the highest resolution steady clock
using clock = std::conditional<
    std::chrono::high_resolution_clock::is_steady, std::chrono::high_resolution_clock,
    std::conditional<std::chrono::system_clock::period::den <=
                         std::chrono::steady_clock::period::den,
                     std::chrono::system_clock, std::chrono::steady_clock>::type>::type;

// Extract individual digits from the hex representation.
// ith_hex_digit<0>(0xABCD) = A
// ith_hex_digit<1>(0xABCD) = B
// ith_hex_digit<2>(0xABCD) = C
// ith_hex_digit<3>(0xABCD) = D
template <uint16_t index>
constexpr uint8_t ith_hex_digit(uint16_t word)
{
    static_assert(index <= 3);
    constexpr uint16_t offset = 12 - index * 4;
    constexpr uint16_t mask = 0x000F << offset;
    return static_cast<uint8_t>((mask & word) >> offset);
}

} // namespace r8
