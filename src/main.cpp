/**
 * @file main.cpp
 * @brief Polyphonic demo: a producer thread plays an arpeggio through the control channel.
 *
 * Usage: voicegraph_demo [config.json] [patch]
 */

#include <array>
#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <thread>
#include "ControlMessage.hpp"
#include "DemoSupport.hpp"
#include "Logger.hpp"
#include "Patches.hpp"
#include "PolySynth.hpp"
#include "alsa/AlsaDriver.hpp"

using namespace voicegraph;

namespace {

constexpr std::array<int, 8> ARPEGGIO = {48, 55, 60, 64, 67, 72, 67, 64};
constexpr auto STEP = std::chrono::milliseconds(150);
constexpr auto GATE = std::chrono::milliseconds(110);
constexpr auto RUN_TIME = std::chrono::seconds(8);

void push_or_warn(PolySynth& synth, const ControlMessage& message) {
    if (!synth.try_push(message)) {
        std::cerr << "[Demo] Control channel full, message dropped" << std::endl;
    }
}

} // namespace

int main(int argc, char** argv) {
    demo::install_signal_handler();

    const auto config = demo::load_config(argc, argv);
    if (!config) {
        return 1;
    }
    const std::string patch = (argc > 2) ? argv[2] : "lead";

    AudioLogger telemetry;
    std::unique_ptr<PolySynth> synth;
    try {
        synth = std::make_unique<PolySynth>(*config, patches::factory(patch, config->sample_rate), &telemetry);
    } catch (const std::exception& e) {
        std::cerr << "[Demo] " << e.what() << std::endl;
        return 1;
    }

    hal::AlsaDriver driver(static_cast<int>(config->sample_rate), 256, 2, "default", &telemetry);
    driver.set_callback([&synth](std::span<float> output) {
        synth->render(output);
    });

    if (!driver.start()) {
        std::cerr << "Failed to start audio driver!" << std::endl;
        return 1;
    }
    if (driver.sample_rate() != static_cast<int>(config->sample_rate)) {
        std::cerr << "[Demo] Device runs at " << driver.sample_rate() << " Hz, engine at "
                  << config->sample_rate << " Hz; pitch will be off" << std::endl;
    }

    std::cout << "--- voicegraph demo: patch '" << patch << "', " << synth->max_polyphony()
              << " voices (Ctrl+C to stop) ---" << std::endl;

    std::atomic<bool> producer_done{false};
    std::thread producer([&synth, &producer_done]() {
        const auto end_time = std::chrono::steady_clock::now() + RUN_TIME;
        size_t step = 0;
        while (demo::g_keep_running && std::chrono::steady_clock::now() < end_time) {
            const int note = ARPEGGIO[step % ARPEGGIO.size()];
            push_or_warn(*synth, ControlMessage::note_on(note, 100));
            std::this_thread::sleep_for(GATE);
            push_or_warn(*synth, ControlMessage::note_off(note));
            std::this_thread::sleep_for(STEP - GATE);
            ++step;
        }
        push_or_warn(*synth, ControlMessage::all_notes_off());
        producer_done = true;
    });

    // Spool logs from the audio thread to the console
    while (!producer_done) {
        demo::spool_telemetry(telemetry);
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    producer.join();

    // Let release tails ring out
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    driver.stop();
    demo::spool_telemetry(telemetry);

    // Zero unless built with VOICEGRAPH_ENABLE_PROFILING
    const PerformanceMetrics metrics = synth->get_metrics();
    if (metrics.total_blocks_processed > 0 && driver.sample_rate() > 0) {
        const auto budget = std::chrono::nanoseconds(
            static_cast<long long>(1e9 * driver.block_size() / driver.sample_rate()));
        std::cout << "[Demo] " << metrics.total_blocks_processed << " periods rendered, worst "
                  << metrics.max_execution_time.count() << " ns against a " << budget.count()
                  << " ns period" << std::endl;
    }

    std::cout << "--- Demo Finished ---" << std::endl;
    return 0;
}
