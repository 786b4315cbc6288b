/**
 * @file SignalNode.hpp
 * @brief Base class for every node in a voice's signal tree.
 */

#ifndef VOICEGRAPH_SIGNAL_NODE_HPP
#define VOICEGRAPH_SIGNAL_NODE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include "EngineConfig.hpp"
#include "PerformanceProfiler.hpp"
#include "RenderContext.hpp"

namespace voicegraph {

/**
 * @brief Named, modulatable node parameters.
 */
enum class Parameter {
    Frequency,  // Hz
    Detune,     // cents
    Cutoff,     // Hz
    Resonance,  // 0..0.98
    DelayTime,  // seconds
    Feedback,   // 0..0.95
    Mix,        // wet/dry 0..1
    Drive,      // input gain
    RoomSize,   // 0..1
    Damping,    // 0..1
    Rate,       // Hz
    Depth       // milliseconds
};

inline const char* to_string(Parameter p) {
    switch (p) {
        case Parameter::Frequency: return "frequency";
        case Parameter::Detune: return "detune";
        case Parameter::Cutoff: return "cutoff";
        case Parameter::Resonance: return "resonance";
        case Parameter::DelayTime: return "delay_time";
        case Parameter::Feedback: return "feedback";
        case Parameter::Mix: return "mix";
        case Parameter::Drive: return "drive";
        case Parameter::RoomSize: return "room_size";
        case Parameter::Damping: return "damping";
        case Parameter::Rate: return "rate";
        case Parameter::Depth: return "depth";
    }
    return "unknown";
}

/**
 * @brief A base value plus a modulation offset, clamped to a domain.
 *
 * The base is what set_parameter() stores; the offset is replaced on each
 * modulate() call. value() is what the DSP actually uses.
 */
struct ModulatableValue {
    float base;
    float min;
    float max;
    float offset = 0.0f;

    ModulatableValue(float initial, float lo, float hi)
        : base(std::clamp(initial, lo, hi)), min(lo), max(hi) {}

    void set_base(float v) { base = std::clamp(v, min, max); }
    void set_offset(float v) { offset = v; }
    float value() const { return std::clamp(base + offset, min, max); }
};

/**
 * @brief Abstract signal node (pull model).
 *
 * Generators overwrite the output span; processors (filter, delay,
 * distortion) treat the span's current contents as their input and work in
 * place. Combinators own their children through std::unique_ptr.
 *
 * render_block() must not allocate, lock, or throw. Any scratch memory a
 * node needs is allocated in its constructor, sized to MAX_BLOCK_SIZE.
 */
class SignalNode {
public:
    virtual ~SignalNode() = default;

    /**
     * @brief Render (or process) one block of any length.
     *
     * Requests longer than MAX_BLOCK_SIZE are split into chunks, so
     * do_render() never sees more than MAX_BLOCK_SIZE frames.
     *
     * @param output Buffer to fill.
     * @param ctx Per-block parameters (borrowed for the call).
     */
    void render_block(std::span<float> output, const RenderContext& ctx) {
        profiler_.start();

        size_t offset = 0;
        while (offset < output.size()) {
            const size_t frames = std::min(MAX_BLOCK_SIZE, output.size() - offset);
            do_render(output.subspan(offset, frames), ctx.with_block_size(frames));
            offset += frames;
        }

        profiler_.stop();
    }

    /**
     * @brief Start a new note. Resets phase/stage state as appropriate.
     */
    virtual void note_on(const RenderContext& /* ctx */) {}

    /**
     * @brief Begin release. No-op for stateless generators.
     */
    virtual void note_off() {}

    /**
     * @brief True once output has permanently decayed to silence.
     */
    virtual bool is_finished() const { return false; }

    /**
     * @brief Return to the freshly-constructed state.
     */
    virtual void reset() = 0;

    /**
     * @brief Reseed any pseudo-random source in the tree.
     */
    virtual void set_seed(uint32_t /* seed */) {}

    virtual bool supports(Parameter /* p */) const { return false; }

    /**
     * @brief Base (unmodulated) value of a parameter, 0 if unsupported.
     */
    virtual float parameter(Parameter /* p */) const { return 0.0f; }

    /**
     * @brief Set the base value. Clamped to the parameter's domain.
     */
    virtual void set_parameter(Parameter /* p */, float /* value */) {}

    /**
     * @brief Set the modulation offset; effective value is clamp(base + offset).
     */
    virtual void modulate(Parameter /* p */, float /* offset */) {}

    PerformanceMetrics get_metrics() const {
        return profiler_.metrics();
    }

protected:
    /**
     * @brief Fill (or process) at most MAX_BLOCK_SIZE frames.
     */
    virtual void do_render(std::span<float> output, const RenderContext& ctx) = 0;

    PerformanceProfiler profiler_;
};

} // namespace voicegraph

#endif // VOICEGRAPH_SIGNAL_NODE_HPP
