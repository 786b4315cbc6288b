/**
 * @file RenderContext.hpp
 * @brief Immutable per-block parameters handed to every SignalNode.
 */

#ifndef VOICEGRAPH_RENDER_CONTEXT_HPP
#define VOICEGRAPH_RENDER_CONTEXT_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>

namespace voicegraph {

/**
 * @brief Parameters for one render call.
 *
 * Built by the caller (PolySynth or a direct-drive host) and borrowed by
 * nodes for the duration of render_block().
 */
struct RenderContext {
    float sample_rate = 48000.0f;
    float frequency = 440.0f;
    float amplitude = 1.0f;
    size_t block_size = 0;

    /**
     * @brief Equal-tempered pitch, A4 (note 69) = 440 Hz.
     */
    static float note_to_frequency(int note) {
        return static_cast<float>(440.0 * std::pow(2.0, (note - 69) / 12.0));
    }

    /**
     * @brief Context for a MIDI-style note and velocity (both 0-127).
     * @throws std::invalid_argument for a non-positive sample rate.
     */
    static RenderContext from_note(float sample_rate, int note, int velocity, size_t block_size = 0) {
        require_positive_rate(sample_rate);
        const int n = std::clamp(note, 0, 127);
        const int v = std::clamp(velocity, 0, 127);
        return RenderContext{sample_rate, note_to_frequency(n), static_cast<float>(v) / 127.0f, block_size};
    }

    /**
     * @brief Direct drive: explicit frequency and amplitude, no note number.
     * @throws std::invalid_argument for a non-positive sample rate.
     */
    static RenderContext from_frequency(float sample_rate, float frequency, float amplitude = 1.0f,
                                        size_t block_size = 0) {
        require_positive_rate(sample_rate);
        const float nyquist = sample_rate * 0.5f;
        return RenderContext{sample_rate,
                             std::clamp(frequency, 0.0f, nyquist),
                             std::clamp(amplitude, 0.0f, 1.0f),
                             block_size};
    }

    RenderContext with_frequency(float hz) const {
        RenderContext copy = *this;
        // An aggregate-initialized context may carry a zero rate
        copy.frequency = std::clamp(hz, 0.0f, std::max(0.0f, nyquist()));
        return copy;
    }

    RenderContext with_block_size(size_t frames) const {
        RenderContext copy = *this;
        copy.block_size = frames;
        return copy;
    }

    float nyquist() const { return sample_rate * 0.5f; }

private:
    static void require_positive_rate(float sample_rate) {
        if (!(sample_rate > 0.0f)) {
            throw std::invalid_argument("RenderContext: sample_rate must be positive");
        }
    }
};

} // namespace voicegraph

#endif // VOICEGRAPH_RENDER_CONTEXT_HPP
