#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>

#include "r8_prelude.hpp"

namespace r8 {

// 64x32 monochrome framebuffer. `updated` is raised by every mutation and is
// only ever lowered by whoever consumes the frame.
class display {
    bool vram[display_grid_width][display_grid_height];

public:
    bool updated = false;

    // Raster-order view over every cell: row 0 left to right, then row 1, ...
    class grid_view {
        const display* owner;

    public:
        class iterator {
            const display* owner;
            size_t index;

        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = bool;
            using difference_type = std::ptrdiff_t;
            using pointer = const bool*;
            using reference = bool;

            iterator(const display* d, size_t i) : owner(d), index(i) {}

            bool operator*() const
            {
                return owner->get(index % display_grid_width, index / display_grid_width);
            }

            iterator& operator++()
            {
                index++;
                return *this;
            }

            iterator operator++(int)
            {
                iterator prev = *this;
                index++;
                return prev;
            }

            bool operator==(const iterator& rhs) const
            {
                return owner == rhs.owner && index == rhs.index;
            }
            bool operator!=(const iterator& rhs) const { return !(*this == rhs); }
        };

        explicit grid_view(const display* d) : owner(d) {}

        iterator begin() const { return iterator(owner, 0); }
        iterator end() const { return iterator(owner, pixel_count); }
        size_t size() const { return pixel_count; }
    };

    display(void);

    void clear(void);

    // XOR the 8 bits of `byte` (MSB first) into row `y` starting at column `x`,
    // wrapping both axes. Returns 1 if any lit pixel was switched off.
    uint8_t set(uint8_t x, uint8_t y, uint8_t byte);

    bool get(size_t x, size_t y) const { return vram[x][y]; }

    grid_view grid(void) const { return grid_view(this); }
};

} // namespace r8
