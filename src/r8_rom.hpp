#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace r8::rom {

// Whole-file read of a ROM image. Problems are reported on stderr and
// yield an empty optional. Size limits are left to the emulator.
std::optional<std::vector<uint8_t>> read_file(const char* rom_path);

// `name` itself when it names an existing file, otherwise
// <assets_dir>/roms/<name>.
std::string resolve_path(const std::string& name, const std::string& assets_dir);

} // namespace r8::rom
