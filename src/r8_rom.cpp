#include "r8_rom.hpp"

#include <cstdio>
#include <filesystem>

#include "r8_log.hpp"

namespace fs = std::filesystem;

namespace r8::rom {

namespace {

// Defer macro by Arthur O'Dwyer:
// https://quuxplusone.github.io/blog/2018/08/11/the-auto-macro/
template <class L>
class AtScopeExit {
    L& m_lambda;

public:
    AtScopeExit(L& action) : m_lambda(action) {}
    ~AtScopeExit() { m_lambda(); }
};

#define R8_TOKEN_PASTEx(x, y) x##y
#define R8_TOKEN_PASTE(x, y) R8_TOKEN_PASTEx(x, y)

#define R8_Auto_INTERNAL1(lname, aname, ...)                                                  \
    auto lname = [&]() { __VA_ARGS__; };                                                      \
    AtScopeExit<decltype(lname)> aname(lname);

#define R8_Auto_INTERNAL2(ctr, ...)                                                           \
    R8_Auto_INTERNAL1(R8_TOKEN_PASTE(Auto_func_, ctr), R8_TOKEN_PASTE(Auto_instance_, ctr),   \
                      __VA_ARGS__)

#define Defer(...) R8_Auto_INTERNAL2(__COUNTER__, __VA_ARGS__)

} // namespace

std::optional<std::vector<uint8_t>> read_file(const char* rom_path)
{
    FILE* rom_file = nullptr;

#ifdef _MSC_VER
    if (fopen_s(&rom_file, rom_path, "rb") != 0) rom_file = nullptr;
#else
    rom_file = fopen(rom_path, "rb");
#endif

    if (rom_file == nullptr) {
        log::error("Failed to open ROM file: %s", rom_path);
        return std::nullopt;
    }
    Defer(fclose(rom_file));

    if (fseek(rom_file, 0, SEEK_END) != 0) {
        log::error("Error seeking to the end of ROM file: %s", rom_path);
        return std::nullopt;
    }
    const long ftell_ret = ftell(rom_file);
    rewind(rom_file);
    if (ftell_ret < 0) {
        log::error("Error determining size of ROM file: %s", rom_path);
        return std::nullopt;
    }

    std::vector<uint8_t> buffer(static_cast<size_t>(ftell_ret));
    const size_t bytes_read = fread(buffer.data(), 1, buffer.size(), rom_file);
    if (bytes_read != buffer.size()) {
        log::error("Error reading ROM file: %s (%zu of %zu bytes)", rom_path, bytes_read,
                   buffer.size());
        return std::nullopt;
    }

    log::info("Read %zu bytes from %s", buffer.size(), rom_path);
    return buffer;
}

std::string resolve_path(const std::string& name, const std::string& assets_dir)
{
    std::error_code ec;
    if (fs::is_regular_file(fs::path(name), ec)) return name;

    // clang-format off
    return ( fs::path(assets_dir)
           / fs::path("roms")
           / fs::path(name)
           ).string();
    // clang-format on
}

} // namespace r8::rom
