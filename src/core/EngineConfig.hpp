/**
 * @file EngineConfig.hpp
 * @brief Construction-time parameters for PolySynth.
 */

#ifndef VOICEGRAPH_ENGINE_CONFIG_HPP
#define VOICEGRAPH_ENGINE_CONFIG_HPP

#include <cstddef>
#include <stdexcept>

namespace voicegraph {

/**
 * @brief Largest chunk any node renders in one do_render() call.
 *
 * Scratch buffers are sized to this once; longer requests are split.
 */
constexpr size_t MAX_BLOCK_SIZE = 1024;

constexpr size_t MAX_POLYPHONY = 256;
constexpr size_t MAX_CHANNEL_CAPACITY = 65536;

struct EngineConfig {
    float sample_rate = 48000.0f;
    size_t max_block_size = MAX_BLOCK_SIZE;
    size_t max_polyphony = 8;
    size_t channel_capacity = 256;
    float master_gain = 1.0f;

    /**
     * @throws std::invalid_argument describing the first bad field.
     */
    void validate() const {
        if (!(sample_rate > 0.0f)) {
            throw std::invalid_argument("EngineConfig: sample_rate must be positive");
        }
        if (max_block_size == 0 || max_block_size > MAX_BLOCK_SIZE) {
            throw std::invalid_argument("EngineConfig: max_block_size must be in [1, 1024]");
        }
        if (max_polyphony == 0 || max_polyphony > MAX_POLYPHONY) {
            throw std::invalid_argument("EngineConfig: max_polyphony must be in [1, 256]");
        }
        if (channel_capacity == 0 || channel_capacity > MAX_CHANNEL_CAPACITY) {
            throw std::invalid_argument("EngineConfig: channel_capacity must be in [1, 65536]");
        }
        if (!(master_gain >= 0.0f)) {
            throw std::invalid_argument("EngineConfig: master_gain must be non-negative");
        }
    }
};

} // namespace voicegraph

#endif // VOICEGRAPH_ENGINE_CONFIG_HPP
