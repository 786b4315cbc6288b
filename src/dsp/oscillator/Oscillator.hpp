/**
 * @file Oscillator.hpp
 * @brief Band-limited audio oscillator (sine, saw, square, triangle, noise).
 */

#ifndef VOICEGRAPH_OSCILLATOR_HPP
#define VOICEGRAPH_OSCILLATOR_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include "SignalNode.hpp"
#include "oscillator/PhaseAccumulator.hpp"

namespace voicegraph {

/**
 * @brief Phase-accumulator oscillator.
 *
 * Saw and square are corrected with PolyBLEP at each discontinuity and the
 * triangle with PolyBLAMP at each corner. Noise is a seeded xorshift32, so
 * two oscillators with the same seed produce identical output.
 *
 * By default the pitch tracks ctx.frequency. A fixed frequency (> 0) makes
 * the oscillator ignore the note. Output is scaled by ctx.amplitude.
 *
 * The output sample for frame n is taken before the phase advances, so a
 * freshly triggered sine renders sin(2*pi*f*n/sr).
 */
class Oscillator : public SignalNode {
public:
    static constexpr float MAX_DETUNE_CENTS = 1200.0f;
    static constexpr uint32_t DEFAULT_SEED = 0x12345678u;

    explicit Oscillator(Waveform waveform = Waveform::Sine, float fixed_frequency = 0.0f,
                        float detune_cents = 0.0f)
        : waveform_(waveform)
        , fixed_frequency_(fixed_frequency, 0.0f, 20000.0f)
        , detune_(detune_cents, -MAX_DETUNE_CENTS, MAX_DETUNE_CENTS)
    {
    }

    void set_waveform(Waveform waveform) { waveform_ = waveform; }
    Waveform waveform() const { return waveform_; }

    /**
     * @brief Pin the pitch to hz. 0 returns to tracking ctx.frequency.
     */
    void set_fixed_frequency(float hz) { fixed_frequency_.set_base(hz); }
    void set_detune(float cents) { detune_.set_base(cents); }

    void note_on(const RenderContext& /* ctx */) override {
        phase_.reset();
    }

    void reset() override {
        phase_.reset();
        noise_state_ = seed_;
        current_freq_ = -1.0;
        frequency_offset_ = 0.0f;
        detune_.set_offset(0.0f);
    }

    void set_seed(uint32_t seed) override {
        seed_ = (seed == 0) ? DEFAULT_SEED : seed;
        noise_state_ = seed_;
    }

    bool supports(Parameter p) const override {
        return p == Parameter::Frequency || p == Parameter::Detune;
    }

    float parameter(Parameter p) const override {
        switch (p) {
            case Parameter::Frequency: return fixed_frequency_.base;
            case Parameter::Detune: return detune_.base;
            default: return 0.0f;
        }
    }

    void set_parameter(Parameter p, float value) override {
        switch (p) {
            case Parameter::Frequency: fixed_frequency_.set_base(value); break;
            case Parameter::Detune: detune_.set_base(value); break;
            default: break;
        }
    }

    /**
     * @brief Frequency offsets are in Hz, detune offsets in cents.
     */
    void modulate(Parameter p, float offset) override {
        switch (p) {
            case Parameter::Frequency: frequency_offset_ = offset; break;
            case Parameter::Detune: detune_.set_offset(offset); break;
            default: break;
        }
    }

    /**
     * @brief Effective pitch for a context, after fixed pitch, offset and detune.
     */
    double effective_frequency(const RenderContext& ctx) const {
        const double base = (fixed_frequency_.base > 0.0f) ? fixed_frequency_.base : ctx.frequency;
        double hz = base + frequency_offset_;
        const float cents = detune_.value();
        if (cents != 0.0f) {
            hz *= std::pow(2.0, cents / 1200.0);
        }
        return std::clamp(hz, 0.0, static_cast<double>(ctx.nyquist()));
    }

    double phase() const { return phase_.phase(); }

protected:
    void do_render(std::span<float> output, const RenderContext& ctx) override {
        update_increment(ctx);
        const double dt = phase_.increment();
        const float amplitude = ctx.amplitude;

        for (auto& sample : output) {
            sample = static_cast<float>(generate_sample(dt)) * amplitude;
        }
    }

private:
    void update_increment(const RenderContext& ctx) {
        const double hz = effective_frequency(ctx);
        if (hz != current_freq_ || ctx.sample_rate != current_rate_) {
            current_freq_ = hz;
            current_rate_ = ctx.sample_rate;
            phase_.set_increment(hz / ctx.sample_rate);
        }
    }

    double generate_sample(double dt) {
        if (waveform_ == Waveform::Noise) {
            const uint32_t r = waveform::xorshift32(noise_state_);
            return (static_cast<double>(r) / 4294967295.0) * 2.0 - 1.0;
        }

        const double t = phase_.advance();
        switch (waveform_) {
            case Waveform::Sine:
                return waveform::sine(t);
            case Waveform::Saw:
                return waveform::saw(t) - waveform::poly_blep(t, dt);
            case Waveform::Square:
                return waveform::square(t)
                    + waveform::poly_blep(t, dt)
                    - waveform::poly_blep(waveform::wrap(t + 0.5), dt);
            case Waveform::Triangle:
                return waveform::triangle(t)
                    - 4.0 * dt * waveform::poly_blamp(t, dt)
                    + 4.0 * dt * waveform::poly_blamp(waveform::wrap(t + 0.5), dt);
            case Waveform::Noise:
                break;
        }
        return 0.0;
    }

    Waveform waveform_;
    PhaseAccumulator phase_;
    ModulatableValue fixed_frequency_;
    ModulatableValue detune_;
    float frequency_offset_ = 0.0f;

    double current_freq_ = -1.0;
    float current_rate_ = 0.0f;

    uint32_t seed_ = DEFAULT_SEED;
    uint32_t noise_state_ = DEFAULT_SEED;
};

} // namespace voicegraph

#endif // VOICEGRAPH_OSCILLATOR_HPP
