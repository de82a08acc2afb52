#pragma once

#include <memory>

namespace r8::audio {

class beeper_impl;

// 250 Hz tone played while the sound timer is nonzero.
class beeper {
    std::unique_ptr<beeper_impl> impl;
    bool beeping = false;

    beeper(void);

public:
    // nullptr if no playback device could be opened
    static std::unique_ptr<beeper> create(void);
    ~beeper();

    // Start or stop the tone so it follows `sound_timer > 0`.
    void update(bool requesting_beep);

    bool is_beeping(void) const { return beeping; }
};

} // namespace r8::audio
