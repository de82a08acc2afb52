#include "r8_glfw.hpp"

#include <cstdio>

#include <GL/glew.h>    // http://glew.sourceforge.net/
#include <GLFW/glfw3.h> // https://www.glfw.org/

#include "r8_config.h"
#include "r8_log.hpp"

namespace r8::glfw {

namespace {

struct key_binding {
    int glfw_key;
    uint8_t chip8_key;
};

// COSMAC VIP keypad laid over the left-hand block of a QWERTY keyboard:
//   1 2 3 C      1 2 3 4
//   4 5 6 D  <-  Q W E R
//   7 8 9 E      A S D F
//   A 0 B F      Z X C V
constexpr key_binding key_map[user_input_key_count] = {
    {GLFW_KEY_1, 0x1}, {GLFW_KEY_2, 0x2}, {GLFW_KEY_3, 0x3}, {GLFW_KEY_4, 0xC},
    {GLFW_KEY_Q, 0x4}, {GLFW_KEY_W, 0x5}, {GLFW_KEY_E, 0x6}, {GLFW_KEY_R, 0xD},
    {GLFW_KEY_A, 0x7}, {GLFW_KEY_S, 0x8}, {GLFW_KEY_D, 0x9}, {GLFW_KEY_F, 0xE},
    {GLFW_KEY_Z, 0xA}, {GLFW_KEY_X, 0x0}, {GLFW_KEY_C, 0xB}, {GLFW_KEY_V, 0xF},
};

void key_callback(GLFWwindow* win, int key, int /* scancode */, int action, int /* mods */)
{
    if (action == GLFW_REPEAT) return;

    if (key == GLFW_KEY_ESCAPE && action == GLFW_PRESS) {
        glfwSetWindowShouldClose(win, GLFW_TRUE);
        return;
    }

    auto* keys = static_cast<r8::keyboard*>(glfwGetWindowUserPointer(win));
    if (keys == nullptr) return;

    for (const key_binding& binding : key_map) {
        if (binding.glfw_key == key) {
            keys->set(binding.chip8_key, action == GLFW_PRESS);
            return;
        }
    }
}

} // namespace

std::unique_ptr<window> window::create(r8::keyboard* keys)
{
    if (glfwInit() != GLFW_TRUE) {
        log::error("Failed to initialize glfw!");
        return nullptr;
    }

    // from here on the destructor is responsible for glfwTerminate
    auto ctx = std::unique_ptr<window>(new window());

#ifdef __APPLE__
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
#endif

    glfwWindowHint(GLFW_RESIZABLE, GL_FALSE);

    char window_name_buffer[64];
    snprintf(window_name_buffer, sizeof(window_name_buffer), "r8 CHIP-8 (version %d.%d)",
             R8_VERSION_MAJOR, R8_VERSION_MINOR);

    ctx->emu_window = glfwCreateWindow(screen_width_pixels, screen_height_pixels,
                                       window_name_buffer, NULL, NULL);
    if (ctx->emu_window == nullptr) {
        log::error("Failed to create the emulator window!");
        return nullptr;
    }

    glfwMakeContextCurrent(ctx->emu_window);

    const GLenum err = glewInit();
    if (err != GLEW_OK) {
        log::error("GLEW Error: %s", reinterpret_cast<const char*>(glewGetErrorString(err)));
        return nullptr;
    }

    glMatrixMode(GL_MODELVIEW);
    glLoadIdentity();
    glClearColor(0.34375f, 0.29296875f, 0.32421875f, 1.0f);

    log::info("OpenGL Renderer Device: %s",
              reinterpret_cast<const char*>(glGetString(GL_RENDERER)));
    log::info("OpenGL Version Supported: %s",
              reinterpret_cast<const char*>(glGetString(GL_VERSION)));

    glfwSetWindowUserPointer(ctx->emu_window, keys);
    glfwSetKeyCallback(ctx->emu_window, key_callback);

    glfwSwapInterval(1); // enable vertical sync

    return ctx;
}

window::~window()
{
    if (emu_window) glfwDestroyWindow(emu_window);
    glfwTerminate();
}

void window::poll_user_input(void) { glfwPollEvents(); }

void window::draw_screen(const r8::display& gfx)
{
    constexpr float grid_spacing_x = 2.f / display_grid_width;
    constexpr float grid_spacing_y = 2.f / display_grid_height;

    glClear(GL_COLOR_BUFFER_BIT);
    glColor3f(0.96484375f, 0.62109375f, 0.47265625f);

    glBegin(GL_QUADS);
    size_t cell = 0;
    for (const bool lit : gfx.grid()) {
        if (lit) {
            const size_t ix = cell % display_grid_width;
            const size_t iy = cell / display_grid_width;
            const float x0 = -1.f + ix * grid_spacing_x;
            const float y0 = 1.f - iy * grid_spacing_y;

            glVertex2f(x0, y0);
            glVertex2f(x0 + grid_spacing_x, y0);
            glVertex2f(x0 + grid_spacing_x, y0 - grid_spacing_y);
            glVertex2f(x0, y0 - grid_spacing_y);
        }
        cell++;
    }
    glEnd();

    glfwSwapBuffers(emu_window);
}

bool window::user_requested_close(void) const
{
    return glfwWindowShouldClose(emu_window) == GLFW_TRUE;
}

} // namespace r8::glfw
