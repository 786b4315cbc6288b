/**
 * @file PolySynth.hpp
 * @brief Fixed-pool polyphonic engine fed by a lock-free control channel.
 */

#ifndef VOICEGRAPH_POLY_SYNTH_HPP
#define VOICEGRAPH_POLY_SYNTH_HPP

#include <cstdint>
#include <span>
#include <vector>
#include "ControlMessage.hpp"
#include "EngineConfig.hpp"
#include "Logger.hpp"
#include "PerformanceProfiler.hpp"
#include "SpscQueue.hpp"
#include "Voice.hpp"

namespace voicegraph {

/**
 * @brief Polyphonic voice engine.
 *
 * Threading: exactly one producer thread calls try_push(); exactly one audio
 * thread calls render(). The inspection accessors are meant for tests and
 * the audio thread itself; they read plain (non-atomic) voice state.
 *
 * Allocation policy for NoteOn: lowest-index Free voice, else the oldest
 * Releasing voice, else the oldest Active voice. A steal re-triggers the
 * tree with note_on and is reported to the telemetry sink as "VoiceSteal".
 */
class PolySynth {
public:
    /**
     * @param config Engine parameters, validated here.
     * @param factory Builds one node tree per voice (called max_polyphony times).
     * @param telemetry Optional RT-safe sink for engine events. Not owned.
     * @throws std::invalid_argument on a bad config, an empty factory, or a
     *         factory that returns null.
     */
    PolySynth(const EngineConfig& config, const PatchFactory& factory, AudioLogger* telemetry = nullptr);

    PolySynth(const PolySynth&) = delete;
    PolySynth& operator=(const PolySynth&) = delete;

    /**
     * @brief Producer side of the control channel. Never blocks.
     * @return false if the channel is full.
     */
    bool try_push(const ControlMessage& message);

    /**
     * @brief Drain pending messages, render and mix every sounding voice.
     *
     * Overwrites output. Any length is accepted; it is processed in chunks
     * of at most max_block_size frames. RT-safe.
     */
    void render(std::span<float> output);

    /**
     * @brief Return every voice to Free and drop pending messages. Not RT-safe
     *        with respect to a concurrent render().
     */
    void reset();

    size_t max_polyphony() const { return voices_.size(); }
    float sample_rate() const { return config_.sample_rate; }
    const EngineConfig& config() const { return config_; }

    Voice::State voice_state(size_t index) const { return voices_.at(index).state(); }
    int voice_note(size_t index) const { return voices_.at(index).note(); }
    uint64_t voice_age(size_t index) const { return voices_.at(index).age(); }

    /**
     * @brief Number of voices that are not Free.
     */
    size_t active_voice_count() const;
    size_t count_in_state(Voice::State state) const;

    /**
     * @brief Current pitch-bend offset in cents.
     */
    float pitch_bend() const { return bend_cents_; }

    PerformanceMetrics get_metrics() const { return profiler_.metrics(); }

private:
    void drain_messages();
    void handle(const ControlMessage& message);
    void note_on(int note, int velocity);
    void note_off(int note);
    void all_notes_off();
    void set_pitch_bend(float cents);

    /**
     * @brief Voice index for a new note; steals when none is Free.
     */
    size_t allocate_voice(bool& stolen) const;

    uint64_t next_timestamp() { return ++timestamp_counter_; }

    EngineConfig config_;
    std::vector<Voice> voices_;
    SpscQueue<ControlMessage> channel_;
    std::vector<float> scratch_;
    AudioLogger* telemetry_;

    uint64_t timestamp_counter_ = 0;
    float bend_cents_ = 0.0f;
    float bend_ratio_ = 1.0f;

    PerformanceProfiler profiler_;
};

} // namespace voicegraph

#endif // VOICEGRAPH_POLY_SYNTH_HPP
