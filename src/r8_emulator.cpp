#include "r8_emulator.hpp"

#include <cstring>
#include <istream>
#include <iterator>
#include <vector>

#include "r8_disassembler.hpp"
#include "r8_log.hpp"

namespace r8::core {

namespace {

void record_instr(emulator& emu, address pc, const instruction& instr)
{
    if (emu.history_size == 0 && !log::enabled(log::level::debug)) return;

    std::string line =
        log::format("| 0x%03X | %s", pc.inner(), disassembler::mnemonic(instr).c_str());
    log::debug("%s", line.c_str());

    if (emu.history_size == 0) return;

    emu.instr_history.push_back(std::move(line));
    while (emu.instr_history.size() > emu.history_size) {
        emu.instr_history.pop_front();
    }
}

error skip_next_if(emulator& emu, bool condition)
{
    return condition ? emu.pc.add_assign(2) : error::none;
}

error draw_sprite(emulator& emu, const instruction& instr)
{
    uint8_t& Vf = emu.V[flags_register];
    Vf = 0;

    // read after clearing VF, DRW VF, ... sees the cleared flag
    const uint8_t x = emu.V[instr.x];
    const uint8_t y = emu.V[instr.y] % display_grid_height;

    for (uint8_t row = 0; row < instr.n; row++) {
        address sprite_addr;
        const error err = address::from(emu.idx.inner() + row, sprite_addr);
        if (err != error::none) return err;

        Vf |= emu.gfx.set(x, static_cast<uint8_t>(y + row), emu.ram[sprite_addr]);
    }

    return error::none;
}

error emulate_0x8XYN(emulator& emu, const instruction& instr)
{
    uint8_t& Vx = emu.V[instr.x];
    uint8_t& Vy = emu.V[instr.y];
    uint8_t& Vf = emu.V[flags_register];

    // Each step reads the registers as left by the previous one, so X or Y
    // being F sees the freshly written flag.
    switch (instr.kind) {
        case op::ld_register: { // 0x8XY0
            Vx = Vy;
            break;
        }
        case op::or_: { // 0x8XY1
            Vx |= Vy;
            break;
        }
        case op::and_: { // 0x8XY2
            Vx &= Vy;
            break;
        }
        case op::xor_: { // 0x8XY3
            Vx ^= Vy;
            break;
        }
        case op::add_register: { // 0x8XY4: carry lands in VF after the sum is stored
            const uint16_t sum = static_cast<uint16_t>(Vx + Vy);
            Vx = static_cast<uint8_t>(sum & 0xFF);
            Vf = sum > 0xFF ? 1 : 0;
            break;
        }
        case op::sub: { // 0x8XY5: VF = NOT borrow
            Vf = Vx > Vy ? 1 : 0;
            Vx = static_cast<uint8_t>(Vx - Vy);
            break;
        }
        case op::shr: { // 0x8XY6: VF = bit shifted out
            Vf = Vx & 1;
            Vx = static_cast<uint8_t>(Vx >> 1);
            break;
        }
        case op::subn: { // 0x8XY7: VX = VY - VX, VF = NOT borrow
            Vf = Vy > Vx ? 1 : 0;
            Vx = static_cast<uint8_t>(Vy - Vx);
            break;
        }
        case op::shl: { // 0x8XYE: VF = bit shifted out
            Vf = (Vx >> 7) & 1;
            Vx = static_cast<uint8_t>(Vx << 1);
            break;
        }
        default:
            break;
    }

    return error::none;
}

error emulate_0xFXKK(emulator& emu, const instruction& instr)
{
    const uint8_t X = instr.x;
    uint8_t& Vx = emu.V[X];

    switch (instr.kind) {
        case op::ld_vx_dt: {
            Vx = emu.delay_timer;
            return error::none;
        }
        case op::ld_vx_k: { // resolved by a later tick once a key is held
            emu.state = machine_state::waiting_key;
            emu.register_awaiting_input = X;
            return error::none;
        }
        case op::ld_dt_vx: {
            emu.delay_timer = Vx;
            return error::none;
        }
        case op::ld_st_vx: {
            emu.sound_timer = Vx;
            return error::none;
        }
        case op::add_i_vx: {
            return emu.idx.add_assign(Vx);
        }
        case op::ld_f_vx: { // point I at the font glyph for digit Vx
            emu.idx = address(static_cast<uint16_t>(Vx * font_glyph_bytes));
            return error::none;
        }
        case op::ld_b_vx: {
            const uint8_t bcd[3] = {static_cast<uint8_t>(Vx / 100),
                                    static_cast<uint8_t>((Vx / 10) % 10),
                                    static_cast<uint8_t>(Vx % 10)};
            return emu.ram.read_range(emu.idx, bcd, 3);
        }
        case op::ld_i_vx: {
            return emu.ram.read_range(emu.idx, emu.V, static_cast<size_t>(X) + 1);
        }
        case op::ld_vx_i: {
            return emu.ram.write_range(emu.idx, emu.V, static_cast<size_t>(X) + 1);
        }
        default:
            return error::none;
    }
}

} // namespace

error load_rom(emulator& emu, const uint8_t* rom, size_t count)
{
    if (count > static_cast<size_t>(allowed_rom_memory)) {
        log::error("ROM of %zu bytes doesn't fit in CHIP-8 memory (limit %d)", count,
                   allowed_rom_memory);
        return error::rom_too_large;
    }

    const error err = emu.ram.load_rom(rom, count);
    if (err != error::none) return err;

    emu.pc = address(address::entry_point);
    emu.idx = address(0);
    memset(emu.V, 0, sizeof(emu.V));
    emu.delay_timer = 0;
    emu.sound_timer = 0;
    emu.stack_trace.clear();
    emu.gfx.clear();
    emu.register_awaiting_input = 0;
    emu.cycles_emulated = 0;
    emu.instr_history.clear();
    emu.state = machine_state::running;

    log::info("Loaded %zu bytes into memory", count);

    return error::none;
}

error load_rom(emulator& emu, std::istream& rom)
{
    const std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(rom)),
                                      std::istreambuf_iterator<char>());
    return load_rom(emu, buffer.data(), buffer.size());
}

error tick(emulator& emu)
{
    switch (emu.state) {
        case machine_state::created:
            return error::none;

        case machine_state::waiting_key: {
            uint8_t key = 0;
            while (key < user_input_key_count && !emu.input.is_set(key)) {
                key++;
            }
            if (key == user_input_key_count) return error::none;

            emu.V[emu.register_awaiting_input] = key;
            emu.state = machine_state::running;
            break;
        }

        case machine_state::running:
            break;
    }

    if (emu.sound_timer > 0) emu.sound_timer--;
    if (emu.delay_timer > 0) emu.delay_timer--;

    opcode code(0);
    const error err = fetch_opcode(emu, code);
    if (err != error::none) return err;

    return execute_opcode(emu, code);
}

error fetch_opcode(const emulator& emu, opcode& out)
{
    uint8_t word[2] = {0, 0};
    const error err = emu.ram.write_range(emu.pc, word, 2);
    if (err != error::none) return err;

    out = opcode(word[0], word[1]);
    return error::none;
}

error execute_opcode(emulator& emu, opcode code)
{
    const instruction instr = decode(code);
    const address instr_pc = emu.pc;

    record_instr(emu, instr_pc, instr);

    error err = emu.pc.add_assign(2);
    if (err != error::none) return err;

    uint8_t& Vx = emu.V[instr.x];
    const uint8_t Vy = emu.V[instr.y];

    switch (instr.kind) {
        case op::cls: {
            emu.gfx.clear();
            break;
        }
        case op::ret: {
            err = emu.stack_trace.pop(emu.pc);
            break;
        }
        case op::sys:
        case op::call: {
            err = emu.stack_trace.push(emu.pc);
            if (err == error::none) emu.pc = address(instr.nnn);
            break;
        }
        case op::jp: {
            emu.pc = address(instr.nnn);
            break;
        }
        case op::se_byte: {
            err = skip_next_if(emu, Vx == instr.kk);
            break;
        }
        case op::sne_byte: {
            err = skip_next_if(emu, Vx != instr.kk);
            break;
        }
        case op::se_register: {
            err = skip_next_if(emu, Vx == Vy);
            break;
        }
        case op::ld_byte: {
            Vx = instr.kk;
            break;
        }
        case op::add_byte: { // no carry flag
            Vx = static_cast<uint8_t>(Vx + instr.kk);
            break;
        }
        case op::ld_register:
        case op::or_:
        case op::and_:
        case op::xor_:
        case op::add_register:
        case op::sub:
        case op::shr:
        case op::subn:
        case op::shl: {
            err = emulate_0x8XYN(emu, instr);
            break;
        }
        case op::sne_register: {
            err = skip_next_if(emu, Vx != Vy);
            break;
        }
        case op::ld_i: {
            emu.idx = address(instr.nnn);
            break;
        }
        case op::jp_v0: { // relative to the already bumped pc
            err = emu.pc.add_assign(static_cast<uint32_t>(instr.nnn) + emu.V[0]);
            break;
        }
        case op::rnd: {
            Vx = emu.rng.next() & instr.kk;
            break;
        }
        case op::drw: {
            err = draw_sprite(emu, instr);
            break;
        }
        case op::skp: {
            err = skip_next_if(emu, emu.input.is_set(Vx));
            break;
        }
        case op::sknp: {
            err = skip_next_if(emu, !emu.input.is_set(Vx));
            break;
        }
        case op::ld_vx_dt:
        case op::ld_vx_k:
        case op::ld_dt_vx:
        case op::ld_st_vx:
        case op::add_i_vx:
        case op::ld_f_vx:
        case op::ld_b_vx:
        case op::ld_i_vx:
        case op::ld_vx_i: {
            err = emulate_0xFXKK(emu, instr);
            break;
        }
        case op::invalid: {
            log::error("Unrecognized opcode: | 0x%03X | %04X", instr_pc.inner(), instr.raw);
            break;
        }
    }

    if (err != error::none) return err;

    emu.cycles_emulated++;
    return error::none;
}

} // namespace r8::core
