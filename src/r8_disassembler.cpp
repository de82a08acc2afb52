#include "r8_disassembler.hpp"

#include "r8_log.hpp"

namespace r8::disassembler {

std::string mnemonic(const instruction& instr)
{
    const unsigned X = instr.x;
    const unsigned Y = instr.y;
    const unsigned N = instr.n;
    const unsigned KK = instr.kk;
    const unsigned NNN = instr.nnn;

    switch (instr.kind) {
        case op::cls:
            return "CLS";
        case op::ret:
            return "RET";
        case op::sys:
            return log::format("SYS 0x%03X", NNN);
        case op::jp:
            return log::format("JP 0x%03X", NNN);
        case op::call:
            return log::format("CALL 0x%03X", NNN);
        case op::se_byte:
            return log::format("SE V%01X, 0x%02X", X, KK);
        case op::sne_byte:
            return log::format("SNE V%01X, 0x%02X", X, KK);
        case op::se_register:
            return log::format("SE V%01X, V%01X", X, Y);
        case op::ld_byte:
            return log::format("LD V%01X, 0x%02X", X, KK);
        case op::add_byte:
            return log::format("ADD V%01X, 0x%02X", X, KK);
        case op::ld_register:
            return log::format("LD V%01X, V%01X", X, Y);
        case op::or_:
            return log::format("OR V%01X, V%01X", X, Y);
        case op::and_:
            return log::format("AND V%01X, V%01X", X, Y);
        case op::xor_:
            return log::format("XOR V%01X, V%01X", X, Y);
        case op::add_register:
            return log::format("ADD V%01X, V%01X", X, Y);
        case op::sub:
            return log::format("SUB V%01X, V%01X", X, Y);
        case op::shr:
            return log::format("SHR V%01X", X);
        case op::subn:
            return log::format("SUBN V%01X, V%01X", X, Y);
        case op::shl:
            return log::format("SHL V%01X", X);
        case op::sne_register:
            return log::format("SNE V%01X, V%01X", X, Y);
        case op::ld_i:
            return log::format("LD I, 0x%03X", NNN);
        case op::jp_v0:
            return log::format("JP V0, 0x%03X", NNN);
        case op::rnd:
            return log::format("RND V%01X, 0x%02X", X, KK);
        case op::drw:
            return log::format("DRW V%01X, V%01X, 0x%01X", X, Y, N);
        case op::skp:
            return log::format("SKP V%01X", X);
        case op::sknp:
            return log::format("SKNP V%01X", X);
        case op::ld_vx_dt:
            return log::format("LD V%01X, DT", X);
        case op::ld_vx_k:
            return log::format("LD V%01X, K", X);
        case op::ld_dt_vx:
            return log::format("LD DT, V%01X", X);
        case op::ld_st_vx:
            return log::format("LD ST, V%01X", X);
        case op::add_i_vx:
            return log::format("ADD I, V%01X", X);
        case op::ld_f_vx:
            return log::format("LD F, V%01X", X);
        case op::ld_b_vx:
            return log::format("LD B, V%01X", X);
        case op::ld_i_vx:
            return log::format("LD [I], V%01X", X);
        case op::ld_vx_i:
            return log::format("LD V%01X, [I]", X);
        case op::invalid:
            break;
    }

    const unsigned N0 = (instr.raw >> 12) & 0xFu;
    return log::format("0x%01X 0x%01X 0x%01X 0x%01X", N0, X, Y, N);
}

std::vector<std::string> disassemble(const uint8_t* rom, size_t count, uint16_t origin)
{
    std::vector<std::string> lines;
    lines.reserve(count / 2);

    for (size_t i = 0; i + 1 < count; i += 2) {
        const opcode code(rom[i], rom[i + 1]);
        const unsigned addr = origin + static_cast<unsigned>(i);
        lines.push_back(log::format("0x%03X  %04X  %s", addr, code.raw(),
                                    mnemonic(decode(code)).c_str()));
    }

    return lines;
}

} // namespace r8::disassembler
