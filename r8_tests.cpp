#define CATCH_CONFIG_MAIN  // This tells Catch to provide a main() - only do this in one cpp
                           // file
#include <catch2/catch.hpp>

#include <cstdio>
#include <cstring>
#include <thread>
#include <vector>

#include "r8_address.hpp"
#include "r8_disassembler.hpp"
#include "r8_display.hpp"
#include "r8_keyboard.hpp"
#include "r8_log.hpp"
#include "r8_memory.hpp"
#include "r8_opcode.hpp"
#include "r8_rand.hpp"
#include "r8_rom.hpp"
#include "r8_stack.hpp"
#include "r8_timer.hpp"

using namespace r8;

TEST_CASE("ith_hex_digit", "[opcode]")
{
    REQUIRE(ith_hex_digit<3>(0xF123) == 0x3);
    REQUIRE(ith_hex_digit<2>(0xF123) == 0x2);
    REQUIRE(ith_hex_digit<1>(0xF123) == 0x1);
    REQUIRE(ith_hex_digit<0>(0xF123) == 0xF);

    REQUIRE(ith_hex_digit<3>(0x0AB0) == 0x0);
    REQUIRE(ith_hex_digit<2>(0x0AB0) == 0xB);
    REQUIRE(ith_hex_digit<1>(0x0AB0) == 0xA);
    REQUIRE(ith_hex_digit<0>(0x0AB0) == 0x0);

    REQUIRE(ith_hex_digit<3>(0xFFFF) == 0xF);
    REQUIRE(ith_hex_digit<0>(0x0000) == 0x0);
}

TEST_CASE("opcode operand accessors", "[opcode]")
{
    const opcode code(0xD1, 0x2A);

    REQUIRE(code.raw() == 0xD12A);
    REQUIRE(code.nibbles() == std::make_tuple(uint8_t{0xD}, uint8_t{0x1}, uint8_t{0x2},
                                              uint8_t{0xA}));
    REQUIRE(code.nnn() == 0x12A);
    REQUIRE(code.kk() == 0x2A);
    REQUIRE(code.x() == 0x1);
    REQUIRE(code.y() == 0x2);
    REQUIRE(code.n() == 0xA);
}

TEST_CASE("decode recognises every base instruction", "[opcode]")
{
    const std::pair<uint16_t, op> table[] = {
        {0x00E0, op::cls},          {0x00EE, op::ret},      {0x0123, op::sys},
        {0x1ABC, op::jp},           {0x2ABC, op::call},     {0x3A12, op::se_byte},
        {0x4A12, op::sne_byte},     {0x5AB0, op::se_register}, {0x6A12, op::ld_byte},
        {0x7A12, op::add_byte},     {0x8AB0, op::ld_register}, {0x8AB1, op::or_},
        {0x8AB2, op::and_},         {0x8AB3, op::xor_},     {0x8AB4, op::add_register},
        {0x8AB5, op::sub},          {0x8AB6, op::shr},      {0x8AB7, op::subn},
        {0x8ABE, op::shl},          {0x9AB0, op::sne_register}, {0xA123, op::ld_i},
        {0xB123, op::jp_v0},        {0xCA12, op::rnd},      {0xDAB5, op::drw},
        {0xEA9E, op::skp},          {0xEAA1, op::sknp},     {0xFA07, op::ld_vx_dt},
        {0xFA0A, op::ld_vx_k},      {0xFA15, op::ld_dt_vx}, {0xFA18, op::ld_st_vx},
        {0xFA1E, op::add_i_vx},     {0xFA29, op::ld_f_vx},  {0xFA33, op::ld_b_vx},
        {0xFA55, op::ld_i_vx},      {0xFA65, op::ld_vx_i},
    };

    for (const auto& [word, kind] : table) {
        INFO("word 0x" << std::hex << word);
        REQUIRE(decode(opcode(word)).kind == kind);
    }
}

TEST_CASE("decode rejects words outside the base table", "[opcode]")
{
    for (const uint16_t word : {0x5AB1, 0x9AB7, 0x8AB8, 0x8ABF, 0xE000, 0xEA9F, 0xF000,
                                0xFAFF, 0xFA56}) {
        INFO("word 0x" << std::hex << word);
        REQUIRE(decode(opcode(word)).kind == op::invalid);
    }
}

TEST_CASE("decode keeps every operand field", "[opcode]")
{
    const instruction instr = decode(opcode(0x8F14));
    REQUIRE(instr.kind == op::add_register);
    REQUIRE(instr.raw == 0x8F14);
    REQUIRE(instr.x == 0xF);
    REQUIRE(instr.y == 0x1);
    REQUIRE(instr.n == 0x4);
    REQUIRE(instr.kk == 0x14);
    REQUIRE(instr.nnn == 0xF14);
}

TEST_CASE("mnemonics", "[disassembler]")
{
    auto m = [](uint16_t word) { return disassembler::mnemonic(decode(opcode(word))); };

    REQUIRE(m(0x00E0) == "CLS");
    REQUIRE(m(0x00EE) == "RET");
    REQUIRE(m(0x0123) == "SYS 0x123");
    REQUIRE(m(0x1ABC) == "JP 0xABC");
    REQUIRE(m(0x2208) == "CALL 0x208");
    REQUIRE(m(0x3A12) == "SE VA, 0x12");
    REQUIRE(m(0x5AB0) == "SE VA, VB");
    REQUIRE(m(0x6A12) == "LD VA, 0x12");
    REQUIRE(m(0x8AB4) == "ADD VA, VB");
    REQUIRE(m(0x8AB6) == "SHR VA");
    REQUIRE(m(0x8ABE) == "SHL VA");
    REQUIRE(m(0xB123) == "JP V0, 0x123");
    REQUIRE(m(0xD125) == "DRW V1, V2, 0x5");
    REQUIRE(m(0xE39E) == "SKP V3");
    REQUIRE(m(0xE3A1) == "SKNP V3");
    REQUIRE(m(0xF30A) == "LD V3, K");
    REQUIRE(m(0xF355) == "LD [I], V3");
    REQUIRE(m(0xF365) == "LD V3, [I]");
    REQUIRE(m(0x5121) == "0x5 0x1 0x2 0x1");
}

TEST_CASE("disassemble lists one line per word", "[disassembler]")
{
    const uint8_t rom[] = {0x00, 0xE0, 0xA2, 0x2A, 0xFF};
    const auto lines = disassembler::disassemble(rom, sizeof(rom), 0x200);

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "0x200  00E0  CLS");
    REQUIRE(lines[1] == "0x202  A22A  LD I, 0x22A");
}

TEST_CASE("address construction masks to 12 bits", "[address]")
{
    REQUIRE(address(0x0123).inner() == 0x123);
    REQUIRE(address(0xF123).inner() == 0x123);
    REQUIRE(address().inner() == 0);
    REQUIRE(address::entry_point == 0x200);
}

TEST_CASE("address arithmetic is checked", "[address]")
{
    address a(0xFFC);

    REQUIRE(a.add_assign(2) == error::none);
    REQUIRE(a.inner() == 0xFFE);

    REQUIRE(a.add_assign(1) == error::none);
    REQUIRE(a.inner() == 0xFFF);

    REQUIRE(a.add_assign(1) == error::address_out_of_range);
    REQUIRE(a.inner() == 0xFFF);

    address b(0);
    REQUIRE(b.add_assign(0x10000) == error::address_out_of_range);
    REQUIRE(b.inner() == 0);
}

TEST_CASE("address conversion from wider values", "[address]")
{
    address out(0x42);

    REQUIRE(address::from(0xFFF, out) == error::none);
    REQUIRE(out.inner() == 0xFFF);

    REQUIRE(address::from(0x1000, out) == error::address_out_of_range);
    REQUIRE(out.inner() == 0xFFF);
}

TEST_CASE("memory holds the font at address zero", "[memory]")
{
    const memory mem;

    // glyph 0
    REQUIRE(mem[address(0)] == 0xF0);
    REQUIRE(mem[address(1)] == 0x90);
    REQUIRE(mem[address(4)] == 0xF0);
    // glyph F starts at F * 5
    REQUIRE(mem[address(0xF * 5)] == 0xF0);
    REQUIRE(mem[address(0xF * 5 + 4)] == 0x80);
    REQUIRE(mem[address(0x200)] == 0x00);
}

TEST_CASE("memory rom loading", "[memory]")
{
    memory mem;

    SECTION("program lands at the entry point")
    {
        const uint8_t rom[] = {0x12, 0x34, 0x56};
        REQUIRE(mem.load_rom(rom, sizeof(rom)) == error::none);
        REQUIRE(mem[address(0x200)] == 0x12);
        REQUIRE(mem[address(0x201)] == 0x34);
        REQUIRE(mem[address(0x202)] == 0x56);
        REQUIRE(mem[address(0x203)] == 0x00);
    }

    SECTION("reloading wipes the previous program")
    {
        const uint8_t big[] = {1, 2, 3, 4};
        const uint8_t small[] = {9};
        REQUIRE(mem.load_rom(big, sizeof(big)) == error::none);
        REQUIRE(mem.load_rom(small, sizeof(small)) == error::none);
        REQUIRE(mem[address(0x200)] == 9);
        REQUIRE(mem[address(0x201)] == 0);
        REQUIRE(mem[address(0)] == 0xF0);
    }

    SECTION("a program filling all of memory fits")
    {
        const std::vector<uint8_t> rom(memory_size_bytes - rom_memory_offset, 0xAB);
        REQUIRE(mem.load_rom(rom.data(), rom.size()) == error::none);
        REQUIRE(mem[address(0xFFF)] == 0xAB);
    }

    SECTION("an oversized program is rejected without touching memory")
    {
        const uint8_t first[] = {0x77};
        REQUIRE(mem.load_rom(first, sizeof(first)) == error::none);

        const std::vector<uint8_t> rom(memory_size_bytes - rom_memory_offset + 1, 0xAB);
        REQUIRE(mem.load_rom(rom.data(), rom.size()) == error::rom_too_large);
        REQUIRE(mem[address(0x200)] == 0x77);
        REQUIRE(mem[address(0x201)] == 0x00);
    }
}

TEST_CASE("memory range access", "[memory]")
{
    memory mem;

    SECTION("read_range copies caller bytes into memory")
    {
        const uint8_t src[] = {1, 2, 3};
        REQUIRE(mem.read_range(address(0x300), src, 3) == error::none);
        REQUIRE(mem[address(0x300)] == 1);
        REQUIRE(mem[address(0x302)] == 3);
    }

    SECTION("write_range copies memory out to the caller")
    {
        uint8_t dst[2] = {0, 0};
        REQUIRE(mem.write_range(address(0), dst, 2) == error::none);
        REQUIRE(dst[0] == 0xF0);
        REQUIRE(dst[1] == 0x90);
    }

    SECTION("ranges ending exactly at the last byte are fine")
    {
        const uint8_t src[] = {0xAA, 0xBB};
        REQUIRE(mem.read_range(address(0xFFE), src, 2) == error::none);
        uint8_t dst[2] = {0, 0};
        REQUIRE(mem.write_range(address(0xFFE), dst, 2) == error::none);
        REQUIRE(dst[0] == 0xAA);
        REQUIRE(dst[1] == 0xBB);
    }

    SECTION("ranges past the end fail and copy nothing")
    {
        const uint8_t src[] = {0xAA, 0xBB, 0xCC};
        REQUIRE(mem.read_range(address(0xFFE), src, 3) == error::memory_out_of_bounds);
        REQUIRE(mem[address(0xFFE)] == 0);

        uint8_t dst[3] = {7, 7, 7};
        REQUIRE(mem.write_range(address(0xFFE), dst, 3) == error::memory_out_of_bounds);
        REQUIRE(dst[0] == 7);
    }
}

TEST_CASE("stack is a bounded LIFO", "[stack]")
{
    r8::stack<address, max_stack_depth> s;
    address out;

    REQUIRE(s.empty());
    REQUIRE(s.pop(out) == error::stack_underflow);

    for (uint16_t i = 0; i < max_stack_depth; i++) {
        REQUIRE(s.push(address(0x200 + 2 * i)) == error::none);
    }
    REQUIRE(s.size() == max_stack_depth);
    REQUIRE(s.push(address(0x300)) == error::stack_overflow);
    REQUIRE(s.size() == max_stack_depth);

    REQUIRE(s.pop(out) == error::none);
    REQUIRE(out.inner() == 0x200 + 2 * (max_stack_depth - 1));
    REQUIRE(s.pop(out) == error::none);
    REQUIRE(out.inner() == 0x200 + 2 * (max_stack_depth - 2));

    s.clear();
    REQUIRE(s.empty());
    REQUIRE(s.pop(out) == error::stack_underflow);
}

TEST_CASE("display starts blank", "[display]")
{
    const display d;
    REQUIRE_FALSE(d.updated);
    for (const bool lit : d.grid()) {
        REQUIRE_FALSE(lit);
    }
}

TEST_CASE("display set plots most significant bit first", "[display]")
{
    display d;

    REQUIRE(d.set(10, 4, 0b10100001) == 0);
    REQUIRE(d.updated);
    REQUIRE(d.get(10, 4));
    REQUIRE_FALSE(d.get(11, 4));
    REQUIRE(d.get(12, 4));
    REQUIRE_FALSE(d.get(16, 4));
    REQUIRE(d.get(17, 4));
    REQUIRE_FALSE(d.get(18, 4));
}

TEST_CASE("display collision flag", "[display]")
{
    display d;

    SECTION("plotting the same byte twice erases it and reports a collision")
    {
        REQUIRE(d.set(0, 0, 0xFF) == 0);
        REQUIRE(d.set(0, 0, 0xFF) == 1);
        for (const bool lit : d.grid()) {
            REQUIRE_FALSE(lit);
        }
    }

    SECTION("lighting extra pixels next to lit ones is not a collision")
    {
        REQUIRE(d.set(0, 0, 0xF0) == 0);
        REQUIRE(d.set(0, 0, 0x0F) == 0);
        for (size_t x = 0; x < 8; x++) {
            REQUIRE(d.get(x, 0));
        }
    }

    SECTION("a single erased pixel is enough")
    {
        REQUIRE(d.set(0, 0, 0x01) == 0);
        REQUIRE(d.set(0, 0, 0x81) == 1);
        REQUIRE(d.get(0, 0));
        REQUIRE_FALSE(d.get(7, 0));
    }

    SECTION("blank bytes never collide")
    {
        REQUIRE(d.set(0, 0, 0xFF) == 0);
        REQUIRE(d.set(0, 0, 0x00) == 0);
    }
}

TEST_CASE("display wraps both axes", "[display]")
{
    display d;

    REQUIRE(d.set(63, 0, 0xFF) == 0);
    REQUIRE(d.get(63, 0));
    for (size_t x = 0; x < 7; x++) {
        REQUIRE(d.get(x, 0));
    }
    REQUIRE_FALSE(d.get(7, 0));
    REQUIRE_FALSE(d.get(62, 0));

    REQUIRE(d.set(0, 32 + 5, 0x80) == 0);
    REQUIRE(d.get(0, 5));
}

TEST_CASE("display clear", "[display]")
{
    display d;
    d.set(20, 20, 0xFF);
    d.updated = false;

    d.clear();

    REQUIRE(d.updated);
    for (const bool lit : d.grid()) {
        REQUIRE_FALSE(lit);
    }
}

TEST_CASE("display grid is row-major raster order and restartable", "[display]")
{
    display d;
    d.set(1, 0, 0x80);  // cell 1
    d.set(0, 1, 0x80);  // cell 64
    d.set(63, 31, 0x80); // last cell

    const auto grid = d.grid();
    std::vector<size_t> lit_cells;
    size_t index = 0;
    for (const bool lit : grid) {
        if (lit) lit_cells.push_back(index);
        index++;
    }

    REQUIRE(index == pixel_count);
    REQUIRE(grid.size() == pixel_count);
    REQUIRE(lit_cells == std::vector<size_t>{1, 64, pixel_count - 1});

    size_t second_pass = 0;
    for (auto it = grid.begin(); it != grid.end(); ++it) {
        second_pass++;
    }
    REQUIRE(second_pass == pixel_count);
}

TEST_CASE("keyboard bitmask", "[keyboard]")
{
    keyboard k;

    REQUIRE(k.bits() == 0);
    k.set(0x0, true);
    k.set(0xF, true);
    REQUIRE(k.is_set(0x0));
    REQUIRE(k.is_set(0xF));
    REQUIRE_FALSE(k.is_set(0x5));
    REQUIRE(k.bits() == 0x8001);

    k.set(0x0, false);
    REQUIRE_FALSE(k.is_set(0x0));

    // out of range keys are ignored and never reported as held
    k.set(0x10, true);
    REQUIRE_FALSE(k.is_set(0x10));
    REQUIRE_FALSE(k.is_set(0xFF));

    k.clear();
    REQUIRE(k.bits() == 0);
}

TEST_CASE("rand_gen is a deterministic LCG for a given seed", "[rand]")
{
    rand_gen a(42);
    rand_gen b(42);

    uint64_t state = 42;
    for (int i = 0; i < 100; i++) {
        state = 6364136223846793005ULL * state + 1442695040888963407ULL;
        const uint8_t expected = static_cast<uint8_t>(state & 0xFF);
        REQUIRE(a.next() == expected);
        REQUIRE(b.next() == expected);
    }
}

TEST_CASE("rand_gen seeded from the clock produces varied bytes", "[rand]")
{
    rand_gen r;
    std::vector<bool> seen(256, false);
    size_t distinct = 0;
    for (int i = 0; i < 1024; i++) {
        const uint8_t value = r.next();
        if (!seen[value]) distinct++;
        seen[value] = true;
    }
    REQUIRE(distinct > 16);
}

TEST_CASE("log::format", "[log]")
{
    REQUIRE(log::format("| 0x%03X | %s", 0x200u, "CLS") == "| 0x200 | CLS");
    REQUIRE(log::format("%s", "").empty());
}

TEST_CASE("log level filtering", "[log]")
{
    const log::level orig = log::get_level();

    log::set_level(log::level::error);
    REQUIRE_FALSE(log::enabled(log::level::debug));
    REQUIRE_FALSE(log::enabled(log::level::info));
    REQUIRE(log::enabled(log::level::error));

    log::set_level(log::level::off);
    REQUIRE_FALSE(log::enabled(log::level::error));

    log::set_level(orig);
}

TEST_CASE("rom files are read whole", "[rom]")
{
    const std::string path = "r8_tests_rom.ch8";
    const uint8_t bytes[] = {0x00, 0xE0, 0x12, 0x00};

    FILE* f = fopen(path.c_str(), "wb");
    REQUIRE(f != nullptr);
    REQUIRE(fwrite(bytes, 1, sizeof(bytes), f) == sizeof(bytes));
    fclose(f);

    const auto contents = rom::read_file(path.c_str());
    REQUIRE(contents.has_value());
    REQUIRE(*contents == std::vector<uint8_t>(bytes, bytes + sizeof(bytes)));

    REQUIRE(rom::resolve_path(path, "/nowhere") == path);

    std::remove(path.c_str());
    REQUIRE_FALSE(rom::read_file(path.c_str()).has_value());
}

TEST_CASE("rom names resolve into the assets directory", "[rom]")
{
    const std::string resolved = rom::resolve_path("NO_SUCH_ROM", "assets");
    REQUIRE(resolved.find("assets") == 0);
    REQUIRE(resolved.find("roms") != std::string::npos);
    REQUIRE(resolved.rfind("NO_SUCH_ROM") == resolved.size() - std::strlen("NO_SUCH_ROM"));
}

TEST_CASE("cycle timer", "[timer]")
{
    SECTION("a slow cycle isn't ready straight away")
    {
        timer::cycle slow(1.0);
        REQUIRE_FALSE(slow.is_ready());
    }

    SECTION("a fast cycle becomes ready")
    {
        timer::cycle fast(1000.0);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        REQUIRE(fast.is_ready());
    }

    SECTION("wait_until_ready blocks for roughly one period")
    {
        timer::cycle c(100.0);
        const auto start = r8::clock::now();
        c.wait_until_ready();
        const auto elapsed = r8::clock::now() - start;
        REQUIRE(elapsed >= std::chrono::milliseconds(9));
    }
}
