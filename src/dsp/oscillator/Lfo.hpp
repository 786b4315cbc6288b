/**
 * @file Lfo.hpp
 * @brief Low Frequency Oscillator for modulation.
 */

#ifndef VOICEGRAPH_LFO_HPP
#define VOICEGRAPH_LFO_HPP

#include <span>
#include "SignalNode.hpp"
#include "oscillator/PhaseAccumulator.hpp"

namespace voicegraph {

/**
 * @brief Bipolar [-1, 1] control-rate oscillator.
 *
 * Runs at its own rate and ignores ctx.frequency and ctx.amplitude. The
 * waveforms are left naive since the output only drives parameters.
 * Phase restarts on every note_on.
 */
class Lfo : public SignalNode {
public:
    static constexpr float MAX_RATE_HZ = 100.0f;

    explicit Lfo(float rate_hz = 1.0f, Waveform waveform = Waveform::Sine)
        : rate_(rate_hz, 0.0f, MAX_RATE_HZ)
        , waveform_(waveform == Waveform::Noise ? Waveform::Sine : waveform)
    {
    }

    void set_rate(float hz) { rate_.set_base(hz); }
    float rate() const { return rate_.value(); }

    /**
     * @brief Noise is not a valid LFO shape and falls back to Sine.
     */
    void set_waveform(Waveform waveform) {
        waveform_ = (waveform == Waveform::Noise) ? Waveform::Sine : waveform;
    }

    void note_on(const RenderContext& /* ctx */) override {
        phase_.reset();
    }

    void reset() override {
        phase_.reset();
        rate_.set_offset(0.0f);
    }

    bool supports(Parameter p) const override {
        return p == Parameter::Frequency;
    }

    float parameter(Parameter p) const override {
        return p == Parameter::Frequency ? rate_.base : 0.0f;
    }

    void set_parameter(Parameter p, float value) override {
        if (p == Parameter::Frequency) rate_.set_base(value);
    }

    void modulate(Parameter p, float offset) override {
        if (p == Parameter::Frequency) rate_.set_offset(offset);
    }

protected:
    void do_render(std::span<float> output, const RenderContext& ctx) override {
        phase_.set_increment(static_cast<double>(rate_.value()) / ctx.sample_rate);

        for (auto& sample : output) {
            sample = static_cast<float>(calculate_waveform(phase_.advance()));
        }
    }

private:
    double calculate_waveform(double t) const {
        switch (waveform_) {
            case Waveform::Sine:
                return waveform::sine(t);
            case Waveform::Triangle:
                return waveform::triangle(t);
            case Waveform::Square:
                return waveform::square(t);
            case Waveform::Saw:
                return waveform::saw(t);
            case Waveform::Noise:
                break;
        }
        return 0.0;
    }

    ModulatableValue rate_;
    Waveform waveform_;
    PhaseAccumulator phase_;
};

} // namespace voicegraph

#endif // VOICEGRAPH_LFO_HPP
