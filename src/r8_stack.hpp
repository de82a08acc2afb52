#pragma once

#include <array>
#include <cstddef>

#include "r8_error.hpp"

namespace r8 {

// Fixed-capacity LIFO used for subroutine return addresses.
template <typename T, size_t capacity>
class stack {
    std::array<T, capacity> entries{};
    size_t sp = 0; // stack "pointer", index of the next free slot

public:
    error push(const T& value)
    {
        if (sp == capacity) return error::stack_overflow;
        entries[sp] = value;
        sp++;
        return error::none;
    }

    error pop(T& out)
    {
        if (sp == 0) return error::stack_underflow;
        sp--;
        out = entries[sp];
        return error::none;
    }

    void clear(void) { sp = 0; }

    size_t size(void) const { return sp; }
    bool empty(void) const { return sp == 0; }
};

} // namespace r8
