#include "r8_display.hpp"

#include <cstring>

namespace r8 {

display::display(void) { memset(vram, false, sizeof(vram)); }

void display::clear(void)
{
    memset(vram, false, sizeof(vram));
    updated = true;
}

uint8_t display::set(uint8_t x, uint8_t y, uint8_t byte)
{
    updated = true;

    const size_t row = y % display_grid_height;
    uint8_t collision = 0;

    for (unsigned bit = 0; bit < 8; bit++) {
        const size_t column = (static_cast<size_t>(x) + bit) % display_grid_width;
        const bool sprite_pixel = (byte & (0x80 >> bit)) != 0;

        bool& pixel_state = vram[column][row];
        const bool new_pixel_state = pixel_state ^ sprite_pixel;
        if (pixel_state && !new_pixel_state) collision = 1;
        pixel_state = new_pixel_state;
    }

    return collision;
}

} // namespace r8
