/**
 * @file PhaseAccumulator.hpp
 * @brief Normalized phase core and waveform kernels shared by Oscillator and Lfo.
 */

#ifndef VOICEGRAPH_PHASE_ACCUMULATOR_HPP
#define VOICEGRAPH_PHASE_ACCUMULATOR_HPP

#include <cmath>
#include <cstdint>
#include <numbers>

namespace voicegraph {

enum class Waveform {
    Sine,
    Saw,
    Square,
    Triangle,
    Noise
};

/**
 * @brief Phase accumulator in cycles, always in [0.0, 1.0).
 */
class PhaseAccumulator {
public:
    /**
     * @param increment Cycles per sample (frequency / sample_rate).
     *        Whole cycles are discarded; negative values wrap.
     */
    void set_increment(double increment) {
        increment_ = increment - std::floor(increment);
        if (!(increment_ < 1.0)) {
            increment_ = 0.0;
        }
    }

    /**
     * @brief Return the current phase, then advance by one sample.
     */
    double advance() {
        const double current = phase_;
        phase_ += increment_;
        if (phase_ >= 1.0) {
            phase_ -= 1.0;
        }
        return current;
    }

    void reset(double phase = 0.0) {
        phase_ = phase - std::floor(phase);
        if (!(phase_ < 1.0)) {
            phase_ = 0.0;
        }
    }

    double phase() const { return phase_; }
    double increment() const { return increment_; }

private:
    double phase_ = 0.0;
    double increment_ = 0.0;
};

namespace waveform {

inline double sine(double t) {
    return std::sin(2.0 * std::numbers::pi * t);
}

inline double saw(double t) {
    return 2.0 * t - 1.0;
}

inline double square(double t) {
    return (t < 0.5) ? 1.0 : -1.0;
}

/**
 * @brief Peak (+1) at t = 0, trough (-1) at t = 0.5.
 */
inline double triangle(double t) {
    return 2.0 * std::abs(2.0 * t - 1.0) - 1.0;
}

/**
 * @brief PolyBLEP residual for a step of height 2.
 *
 * @param t Current phase (0 to 1)
 * @param dt Phase increment (freq / sample_rate)
 */
inline double poly_blep(double t, double dt) {
    if (dt <= 0.0) {
        return 0.0;
    }
    if (t < dt) {
        t /= dt;
        return t + t - t * t - 1.0;
    } else if (t > 1.0 - dt) {
        t = (t - 1.0) / dt;
        return t * t + t + t + 1.0;
    }
    return 0.0;
}

/**
 * @brief PolyBLAMP residual (integrated PolyBLEP) for a slope change of 2 per sample.
 */
inline double poly_blamp(double t, double dt) {
    if (dt <= 0.0) {
        return 0.0;
    }
    if (t < dt) {
        const double x = t / dt - 1.0;
        return -(x * x * x) / 3.0;
    } else if (t > 1.0 - dt) {
        const double x = (t - 1.0) / dt + 1.0;
        return (x * x * x) / 3.0;
    }
    return 0.0;
}

inline double wrap(double t) {
    return t - std::floor(t);
}

/**
 * @brief xorshift32 step. State must be non-zero.
 */
inline uint32_t xorshift32(uint32_t& state) {
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

} // namespace waveform

} // namespace voicegraph

#endif // VOICEGRAPH_PHASE_ACCUMULATOR_HPP
