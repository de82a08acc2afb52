#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <string>

#include "r8_address.hpp"
#include "r8_display.hpp"
#include "r8_error.hpp"
#include "r8_keyboard.hpp"
#include "r8_memory.hpp"
#include "r8_opcode.hpp"
#include "r8_prelude.hpp"
#include "r8_rand.hpp"
#include "r8_stack.hpp"

namespace r8::core {

enum class machine_state {
    created,     // no ROM loaded yet, ticks do nothing
    running,
    waiting_key, // blocked on FX0A until a key is held
};

// see https://en.wikipedia.org/wiki/CHIP-8#Virtual_machine_description
struct emulator {
    static constexpr size_t default_history_size = 64;

    address pc{address::entry_point}; // program counter
    address idx;                      // index register
    uint8_t V[register_count] = {0};
    uint8_t delay_timer = 0;
    uint8_t sound_timer = 0;

    r8::stack<address, max_stack_depth> stack_trace;
    r8::memory ram;

    // devices
    r8::display gfx;
    r8::keyboard input; // owned by the front-end, only read here

    rand_gen rng;

    machine_state state = machine_state::created;
    uint8_t register_awaiting_input = 0; // meaningful only while waiting_key

    uint64_t cycles_emulated = 0;

    // most recent executed instructions, oldest first
    std::deque<std::string> instr_history;
    size_t history_size = default_history_size;
};

// Reset registers, timers, stack and screen and load `count` bytes at 0x200.
// On error::rom_too_large the emulator is left exactly as it was.
error load_rom(emulator& emu, const uint8_t* rom, size_t count);
error load_rom(emulator& emu, std::istream& rom);

// Run one fetch-decode-execute step (see machine_state for when it's a no-op).
error tick(emulator& emu);

// Read the instruction word at pc without executing it.
error fetch_opcode(const emulator& emu, opcode& out);

// Bump pc past the instruction, then execute it.
error execute_opcode(emulator& emu, opcode code);

} // namespace r8::core
