#include "r8_opcode.hpp"

namespace r8 {

namespace {

op decode_0x8XYN(uint8_t n)
{
    switch (n) {
        case 0x0:
            return op::ld_register;
        case 0x1:
            return op::or_;
        case 0x2:
            return op::and_;
        case 0x3:
            return op::xor_;
        case 0x4:
            return op::add_register;
        case 0x5:
            return op::sub;
        case 0x6:
            return op::shr;
        case 0x7:
            return op::subn;
        case 0xE:
            return op::shl;
        default:
            return op::invalid;
    }
}

op decode_0xFXKK(uint8_t kk)
{
    switch (kk) {
        case 0x07:
            return op::ld_vx_dt;
        case 0x0A:
            return op::ld_vx_k;
        case 0x15:
            return op::ld_dt_vx;
        case 0x18:
            return op::ld_st_vx;
        case 0x1E:
            return op::add_i_vx;
        case 0x29:
            return op::ld_f_vx;
        case 0x33:
            return op::ld_b_vx;
        case 0x55:
            return op::ld_i_vx;
        case 0x65:
            return op::ld_vx_i;
        default:
            return op::invalid;
    }
}

op decode_kind(opcode code)
{
    const auto [n0, x, y, n] = code.nibbles();
    (void)x;

    switch (n0) {
        case 0x0: {
            if (code.raw() == 0x00E0) return op::cls;
            if (code.raw() == 0x00EE) return op::ret;
            return op::sys;
        }
        case 0x1:
            return op::jp;
        case 0x2:
            return op::call;
        case 0x3:
            return op::se_byte;
        case 0x4:
            return op::sne_byte;
        case 0x5:
            return n == 0 ? op::se_register : op::invalid;
        case 0x6:
            return op::ld_byte;
        case 0x7:
            return op::add_byte;
        case 0x8:
            return decode_0x8XYN(n);
        case 0x9:
            return n == 0 ? op::sne_register : op::invalid;
        case 0xA:
            return op::ld_i;
        case 0xB:
            return op::jp_v0;
        case 0xC:
            return op::rnd;
        case 0xD:
            return op::drw;
        case 0xE: {
            if (y == 0x9 && n == 0xE) return op::skp;
            if (y == 0xA && n == 0x1) return op::sknp;
            return op::invalid;
        }
        case 0xF:
            return decode_0xFXKK(code.kk());
        default:
            return op::invalid;
    }
}

} // namespace

instruction decode(opcode code)
{
    instruction instr;
    instr.kind = decode_kind(code);
    instr.raw = code.raw();
    instr.nnn = code.nnn();
    instr.kk = code.kk();
    instr.x = code.x();
    instr.y = code.y();
    instr.n = code.n();
    return instr;
}

} // namespace r8
