#include "r8_address.hpp"

namespace r8 {

error address::from(uint32_t raw, address& out)
{
    if (raw > max_address) return error::address_out_of_range;
    out = address(static_cast<uint16_t>(raw));
    return error::none;
}

error address::add_assign(uint32_t delta)
{
    const uint32_t sum = static_cast<uint32_t>(value) + delta;
    if (delta > max_address || sum > max_address) return error::address_out_of_range;
    value = static_cast<uint16_t>(sum);
    return error::none;
}

} // namespace r8
