/****************************** LICENSE *************************************
Copyright (c) 2020 Zachary A. Meadows

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
******************************************************************************/

/*
r8: a graphical emulator for the CHIP-8 Virtual Machine.
See https://en.wikipedia.org/wiki/CHIP-8
or http://devernay.free.fr/hacks/chip8/C8TECH10.HTM for more details.

usage: r8 [--debug] [--disassemble] [ROM] [instructions-per-frame]
*/

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include "r8_audio.hpp"
#include "r8_config.h"
#include "r8_disassembler.hpp"
#include "r8_emulator.hpp"
#include "r8_glfw.hpp"
#include "r8_log.hpp"
#include "r8_rom.hpp"
#include "r8_timer.hpp"

namespace r8 {

constexpr auto FRAMES_PER_SECOND = 60.0;
constexpr auto DEFAULT_INSTRUCTIONS_PER_FRAME = 10;
constexpr auto MAX_INSTRUCTIONS_PER_FRAME = 1000;
constexpr auto DEFAULT_ROM = "INVADERS";

struct options {
    std::string rom_name = DEFAULT_ROM;
    int instructions_per_frame = DEFAULT_INSTRUCTIONS_PER_FRAME;
    bool disassemble = false;
    bool debug = false;
};

bool parse_options(int argc, char* argv[], options& opts)
{
    int positional = 0;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "--debug") == 0) {
            opts.debug = true;
        }
        else if (strcmp(arg, "--disassemble") == 0) {
            opts.disassemble = true;
        }
        else if (positional == 0) {
            opts.rom_name = arg;
            positional++;
        }
        else if (positional == 1) {
            char* end = nullptr;
            const long ipf = strtol(arg, &end, 10);
            if (end == arg || *end != '\0' || ipf < 1 || ipf > MAX_INSTRUCTIONS_PER_FRAME) {
                log::error("instructions-per-frame must be between 1 and %d, got '%s'",
                           MAX_INSTRUCTIONS_PER_FRAME, arg);
                return false;
            }
            opts.instructions_per_frame = static_cast<int>(ipf);
            positional++;
        }
        else {
            log::error("unexpected argument '%s'", arg);
            return false;
        }
    }

    return true;
}

void dump_history(const core::emulator& emu)
{
    log::error("last %zu instructions:", emu.instr_history.size());
    for (const std::string& line : emu.instr_history) {
        log::error("  %s", line.c_str());
    }
}

int main_loop(core::emulator* emu, glfw::window* gfx, audio::beeper* audio,
              int instructions_per_frame)
{
    timer::cycle frame_timer(FRAMES_PER_SECOND);

    while (!gfx->user_requested_close()) {
        gfx->poll_user_input();

        for (auto i = 0; i < instructions_per_frame; i++) {
            const error err = core::tick(*emu);
            if (err != error::none) {
                log::error("Emulation halted at pc 0x%03X: %s", emu->pc.inner(),
                           error_string(err));
                dump_history(*emu);
                return EXIT_FAILURE;
            }
        }

        audio->update(emu->sound_timer > 0);

        if (emu->gfx.updated) {
            gfx->draw_screen(emu->gfx);
            emu->gfx.updated = false;
        }

        frame_timer.wait_until_ready();
    }

    return EXIT_SUCCESS;
}

} // namespace r8

int main(int argc, char* argv[])
{
    r8::options opts;
    if (!r8::parse_options(argc, argv, opts)) return EXIT_FAILURE;
    if (opts.debug) r8::log::set_level(r8::log::level::debug);

    const std::string rom_path = r8::rom::resolve_path(opts.rom_name, R8_ASSETS_DIR);
    const auto rom = r8::rom::read_file(rom_path.c_str());
    if (!rom) return EXIT_FAILURE;

    if (opts.disassemble) {
        for (const std::string& line :
             r8::disassembler::disassemble(rom->data(), rom->size(), r8::rom_memory_offset)) {
            printf("%s\n", line.c_str());
        }
        return EXIT_SUCCESS;
    }

    auto emu = std::make_unique<r8::core::emulator>();
    const r8::error err = r8::core::load_rom(*emu, rom->data(), rom->size());
    if (err != r8::error::none) {
        r8::log::error("Failed to load %s: %s", rom_path.c_str(), r8::error_string(err));
        return EXIT_FAILURE;
    }

    auto gfx = r8::glfw::window::create(&emu->input);
    if (!gfx) return EXIT_FAILURE;

    auto audio = r8::audio::beeper::create();
    if (!audio) return EXIT_FAILURE;

    return r8::main_loop(emu.get(), gfx.get(), audio.get(), opts.instructions_per_frame);
}
