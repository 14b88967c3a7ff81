#pragma once

#include "audio_output_device.hpp"
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace audio {

/**
 * @brief Output device that renders in real time and discards the audio
 *
 * A thread pulls fixed blocks (10 ms by default) on a steady-clock schedule,
 * which keeps the mixer clock running at wall-clock speed without sound
 * hardware. Subclasses receive each rendered block through on_block().
 */
class AudioOutputDevice_Null : public IAudioOutputDevice {
public:
    explicit AudioOutputDevice_Null(int block_ms = 10);
    ~AudioOutputDevice_Null() override;

    bool start(int sample_rate, RenderCallback render) override;
    void stop() override;
    bool is_running() const override { return is_running_.load(); }
    std::string name() const override { return "Null Output (paced)"; }

protected:
    /// Hook for each rendered block, called on the device thread.
    virtual void on_block(const int16_t* samples, size_t frames);

    /// Called from start() before the thread runs; false aborts start.
    virtual bool open_sink(int sample_rate);

    /// Called from stop() after the thread is joined.
    virtual void close_sink();

private:
    void render_thread_func();

    int block_ms_;
    int sample_rate_ = 0;
    RenderCallback render_;
    std::vector<int16_t> block_;

    std::unique_ptr<std::thread> render_thread_;
    std::atomic<bool> is_running_{false};
    std::atomic<bool> should_stop_{false};
};

} // namespace audio
