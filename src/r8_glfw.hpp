#pragma once

#include <memory>

#include "r8_display.hpp"
#include "r8_keyboard.hpp"

struct GLFWwindow;

namespace r8::glfw {

class window {
    static constexpr auto GRID_CELL_PIXELS = 10;

    GLFWwindow* emu_window = nullptr;

    window(void) = default;

public:
    static constexpr auto screen_width_pixels = display_grid_width * GRID_CELL_PIXELS;
    static constexpr auto screen_height_pixels = display_grid_height * GRID_CELL_PIXELS;

    // Opens the window and routes key presses into `keys`, which must outlive
    // the window. Returns nullptr on failure.
    static std::unique_ptr<window> create(r8::keyboard* keys);
    ~window();

    window(const window&) = delete;
    window& operator=(const window&) = delete;

    // Handles pending window events, updating the keyboard.
    void poll_user_input(void);

    void draw_screen(const r8::display& gfx);

    bool user_requested_close(void) const;
};

} // namespace r8::glfw
