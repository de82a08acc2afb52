#include "r8_audio.hpp"

#define MA_NO_DECODING
#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio/miniaudio.h" // https://miniaud.io/

#include "r8_log.hpp"

namespace r8::audio {

class beeper_impl {
public:
    static constexpr auto DEVICE_FORMAT = ma_format_f32;
    static constexpr auto DEVICE_CHANNELS = 2;
    static constexpr auto DEVICE_SAMPLE_RATE = 48000;
    static constexpr auto SINE_WAVE_FREQUENCY = 250;

    ma_device device;
    ma_device_config device_config;
    ma_waveform sine_wave;
    ma_waveform_config sine_wave_config;
    bool init_success = false;

    ~beeper_impl()
    {
        if (init_success) ma_device_uninit(&device);
    }
};

beeper::beeper(void) : impl(new beeper_impl()) {}

beeper::~beeper() = default;

std::unique_ptr<beeper> beeper::create(void)
{
    auto ctx = std::unique_ptr<beeper>(new beeper());
    beeper_impl& a = *ctx->impl;

    a.sine_wave_config = ma_waveform_config_init(
        beeper_impl::DEVICE_FORMAT, beeper_impl::DEVICE_CHANNELS,
        beeper_impl::DEVICE_SAMPLE_RATE, ma_waveform_type_sine, 0.2,
        beeper_impl::SINE_WAVE_FREQUENCY);

    if (ma_waveform_init(&a.sine_wave_config, &a.sine_wave) != MA_SUCCESS) {
        log::error("Failed to initialize the beep waveform.");
        return nullptr;
    }

    a.device_config = ma_device_config_init(ma_device_type_playback);
    a.device_config.playback.format = beeper_impl::DEVICE_FORMAT;
    a.device_config.playback.channels = beeper_impl::DEVICE_CHANNELS;
    a.device_config.sampleRate = beeper_impl::DEVICE_SAMPLE_RATE;
    a.device_config.pUserData = &a.sine_wave;

    // runs on miniaudio's thread and only touches the waveform it was handed
    a.device_config.dataCallback = [](ma_device* pDevice, void* pOutput,
                                      const void* /* pInput */, ma_uint32 frameCount) {
        auto* pSineWave = static_cast<ma_waveform*>(pDevice->pUserData);
        if (pSineWave == nullptr) return;
        ma_waveform_read_pcm_frames(pSineWave, pOutput, frameCount);
    };

    if (ma_device_init(NULL, &a.device_config, &a.device) != MA_SUCCESS) {
        log::error("Failed to open audio playback device.");
        return nullptr;
    }

    a.init_success = true;

    log::info("Audio Device Name: %s", a.device.playback.name);

    return ctx;
}

void beeper::update(bool requesting_beep)
{
    if (requesting_beep == beeping) return;

    if (requesting_beep) {
        if (ma_device_start(&impl->device) != MA_SUCCESS) {
            log::error("Failed to start playback device.");
            return;
        }
    }
    else {
        if (ma_device_stop(&impl->device) != MA_SUCCESS) {
            log::error("Failed to stop playback device.");
            return;
        }
    }

    beeping = requesting_beep;
}

} // namespace r8::audio
