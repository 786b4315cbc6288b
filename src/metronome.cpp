/**
 * @file metronome.cpp
 * @brief Direct-drive demo: one node tree rendered by frequency, no engine or notes.
 *
 * Usage: voicegraph_metronome [config.json] [bpm]
 *
 * Beat 1 is accented (C6, louder), beats 2-4 play C5.
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <span>
#include <thread>
#include "DemoSupport.hpp"
#include "Logger.hpp"
#include "RenderContext.hpp"
#include "envelope/AdsrEnvelope.hpp"
#include "oscillator/Oscillator.hpp"
#include "routing/Amplify.hpp"
#include "alsa/AlsaDriver.hpp"

using namespace voicegraph;

namespace {

constexpr float ACCENT_HZ = 1046.5f;
constexpr float BEAT_HZ = 523.25f;
constexpr double CLICK_SECONDS = 0.03;
constexpr auto RUN_TIME = std::chrono::seconds(5);

/**
 * @brief Sample-accurate click scheduler driving a single tree.
 */
class Metronome {
public:
    Metronome(float sample_rate, double bpm, AudioLogger& telemetry)
        : sample_rate_(sample_rate)
        , samples_per_beat_(static_cast<uint64_t>(sample_rate * 60.0 / bpm))
        , click_samples_(static_cast<uint64_t>(sample_rate * CLICK_SECONDS))
        , telemetry_(telemetry)
        , click_(std::make_unique<Oscillator>(Waveform::Sine),
                 std::make_unique<AdsrEnvelope>(0.001f, 0.04f, 0.0f, 0.02f))
        , ctx_(RenderContext::from_frequency(sample_rate, BEAT_HZ, 0.5f))
    {
    }

    void render(std::span<float> output) {
        size_t offset = 0;
        while (offset < output.size()) {
            // Split the block at the next beat or gate-off boundary
            const uint64_t to_beat = samples_per_beat_ - (position_ % samples_per_beat_);
            const uint64_t in_beat = position_ % samples_per_beat_;
            uint64_t frames = std::min<uint64_t>(to_beat, output.size() - offset);
            if (in_beat < click_samples_) {
                frames = std::min<uint64_t>(frames, click_samples_ - in_beat);
            }

            if (in_beat == 0) {
                start_click();
            } else if (in_beat == click_samples_) {
                click_.note_off();
            }

            auto chunk = output.subspan(offset, static_cast<size_t>(frames));
            click_.render_block(chunk, ctx_);
            offset += chunk.size();
            position_ += frames;
        }
    }

private:
    void start_click() {
        const bool accent = (beat_ % 4) == 0;
        ctx_ = RenderContext::from_frequency(sample_rate_, accent ? ACCENT_HZ : BEAT_HZ, accent ? 0.8f : 0.5f);
        click_.note_on(ctx_);
        telemetry_.log_event("TICK", static_cast<float>(beat_ % 4 + 1));
        ++beat_;
    }

    float sample_rate_;
    uint64_t samples_per_beat_;
    uint64_t click_samples_;
    AudioLogger& telemetry_;
    Amplify click_;
    RenderContext ctx_;
    uint64_t position_ = 0;
    uint64_t beat_ = 0;
};

} // namespace

int main(int argc, char** argv) {
    demo::install_signal_handler();

    const auto config = demo::load_config(argc, argv);
    if (!config) {
        return 1;
    }
    const double bpm = (argc > 2) ? std::clamp(std::atof(argv[2]), 20.0, 300.0) : 120.0;

    std::cout << "--- Audible Metronome Test (5 Seconds) ---" << std::endl;
    std::cout << "Cadence: C6 (High) on Beat 1, C5 (Low) on Beats 2, 3, 4 at " << bpm << " BPM." << std::endl;

    AudioLogger telemetry;
    hal::AlsaDriver driver(static_cast<int>(config->sample_rate), 256, 2, "default", &telemetry);
    Metronome metronome(config->sample_rate, bpm, telemetry);

    driver.set_callback([&metronome](std::span<float> output) {
        metronome.render(output);
    });

    if (!driver.start()) {
        std::cerr << "Failed to start audio driver!" << std::endl;
        return 1;
    }

    const auto end_time = std::chrono::steady_clock::now() + RUN_TIME;
    while (demo::g_keep_running && std::chrono::steady_clock::now() < end_time) {
        demo::spool_telemetry(telemetry);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    driver.stop();
    demo::spool_telemetry(telemetry);

    std::cout << "--- Metronome Test Finished ---" << std::endl;
    return 0;
}
