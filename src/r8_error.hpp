#pragma once

namespace r8 {

// Every fallible core operation reports one of these. error::none is success.
enum class error {
    none,
    address_out_of_range, // arithmetic left the 12-bit address space
    memory_out_of_bounds, // range access ran past the end of memory
    stack_overflow,
    stack_underflow,
    rom_too_large, // image does not fit between 0x200 and the end of memory
};

inline const char* error_string(error err)
{
    switch (err) {
        case error::none:
            return "no error";
        case error::address_out_of_range:
            return "address out of range";
        case error::memory_out_of_bounds:
            return "memory access out of bounds";
        case error::stack_overflow:
            return "stack overflow";
        case error::stack_underflow:
            return "stack underflow";
        case error::rom_too_large:
            return "ROM too large";
    }
    return "unknown error";
}

} // namespace r8
