/**
 * @file StateVariableFilter.hpp
 * @brief Topology-preserving-transform (trapezoidal) state-variable filter.
 */

#ifndef VOICEGRAPH_STATE_VARIABLE_FILTER_HPP
#define VOICEGRAPH_STATE_VARIABLE_FILTER_HPP

#include <algorithm>
#include <cmath>
#include <numbers>
#include <span>
#include "SignalNode.hpp"

namespace voicegraph {

/**
 * @brief Two-integrator TPT SVF with selectable output tap.
 *
 * Processes the contents of the output span in place. Coefficients are
 * recomputed only when the effective cutoff, resonance or sample rate
 * changes. Resonance is clamped below 1 so the damping term k never reaches
 * zero, which keeps the filter stable at any cutoff.
 */
class StateVariableFilter : public SignalNode {
public:
    enum class Mode {
        LowPass,
        HighPass,
        BandPass,
        Notch
    };

    static constexpr float MIN_CUTOFF = 20.0f;
    static constexpr float MAX_CUTOFF = 20000.0f;
    static constexpr float MAX_RESONANCE = 0.98f;
    // Fraction of the sample rate the cutoff may reach.
    static constexpr float MAX_CUTOFF_RATIO = 0.49f;

    explicit StateVariableFilter(Mode mode = Mode::LowPass, float cutoff = 1000.0f, float resonance = 0.0f)
        : mode_(mode)
        , cutoff_(cutoff, MIN_CUTOFF, MAX_CUTOFF)
        , resonance_(resonance, 0.0f, MAX_RESONANCE)
    {
    }

    void set_mode(Mode mode) { mode_ = mode; }
    Mode mode() const { return mode_; }

    void set_cutoff(float frequency) { cutoff_.set_base(frequency); }
    void set_resonance(float resonance) { resonance_.set_base(resonance); }

    float cutoff() const { return cutoff_.value(); }
    float resonance() const { return resonance_.value(); }

    /**
     * @brief Damping term of the current coefficient set.
     */
    double damping() const { return k_; }

    void note_on(const RenderContext& /* ctx */) override {
        ic1eq_ = 0.0;
        ic2eq_ = 0.0;
    }

    void reset() override {
        ic1eq_ = 0.0;
        ic2eq_ = 0.0;
        cutoff_.set_offset(0.0f);
        resonance_.set_offset(0.0f);
        coeff_rate_ = 0.0f;
    }

    bool supports(Parameter p) const override {
        return p == Parameter::Cutoff || p == Parameter::Resonance;
    }

    float parameter(Parameter p) const override {
        switch (p) {
            case Parameter::Cutoff: return cutoff_.base;
            case Parameter::Resonance: return resonance_.base;
            default: return 0.0f;
        }
    }

    void set_parameter(Parameter p, float value) override {
        switch (p) {
            case Parameter::Cutoff: cutoff_.set_base(value); break;
            case Parameter::Resonance: resonance_.set_base(value); break;
            default: break;
        }
    }

    void modulate(Parameter p, float offset) override {
        switch (p) {
            case Parameter::Cutoff: cutoff_.set_offset(offset); break;
            case Parameter::Resonance: resonance_.set_offset(offset); break;
            default: break;
        }
    }

protected:
    void do_render(std::span<float> output, const RenderContext& ctx) override {
        update_coefficients(ctx.sample_rate);

        for (auto& sample : output) {
            sample = static_cast<float>(process_sample(sample));
        }
    }

private:
    double process_sample(double x) {
        const double v3 = x - ic2eq_;
        const double v1 = a1_ * ic1eq_ + a2_ * v3;
        const double v2 = ic2eq_ + a2_ * ic1eq_ + a3_ * v3;
        ic1eq_ = 2.0 * v1 - ic1eq_;
        ic2eq_ = 2.0 * v2 - ic2eq_;

        const double low = v2;
        const double band = v1;
        const double high = x - k_ * v1 - v2;

        switch (mode_) {
            case Mode::LowPass: return low;
            case Mode::HighPass: return high;
            case Mode::BandPass: return band;
            case Mode::Notch: return low + high;
        }
        return low;
    }

    void update_coefficients(float sample_rate) {
        const float max_cutoff = std::max(MIN_CUTOFF, MAX_CUTOFF_RATIO * sample_rate);
        const float fc = std::clamp(cutoff_.value(), MIN_CUTOFF, max_cutoff);
        const float res = resonance_.value();

        if (fc == coeff_cutoff_ && res == coeff_resonance_ && sample_rate == coeff_rate_) {
            return;
        }
        coeff_cutoff_ = fc;
        coeff_resonance_ = res;
        coeff_rate_ = sample_rate;

        g_ = std::tan(std::numbers::pi * fc / sample_rate);
        k_ = 2.0 - 2.0 * res;
        a1_ = 1.0 / (1.0 + g_ * (g_ + k_));
        a2_ = g_ * a1_;
        a3_ = g_ * a2_;
    }

    Mode mode_;
    ModulatableValue cutoff_;
    ModulatableValue resonance_;

    double ic1eq_ = 0.0;
    double ic2eq_ = 0.0;

    double g_ = 0.0;
    double k_ = 2.0;
    double a1_ = 1.0;
    double a2_ = 0.0;
    double a3_ = 0.0;

    float coeff_cutoff_ = -1.0f;
    float coeff_resonance_ = -1.0f;
    float coeff_rate_ = 0.0f;
};

} // namespace voicegraph

#endif // VOICEGRAPH_STATE_VARIABLE_FILTER_HPP
