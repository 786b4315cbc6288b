/**
 * @file Chorus.hpp
 * @brief Short delay whose read position is swept by an internal sine LFO.
 */

#ifndef VOICEGRAPH_CHORUS_HPP
#define VOICEGRAPH_CHORUS_HPP

#include <algorithm>
#include <cmath>
#include <span>
#include <stdexcept>
#include <vector>
#include "SignalNode.hpp"
#include "oscillator/PhaseAccumulator.hpp"

namespace voicegraph {

/**
 * @brief Mono chorus, processed in place.
 *
 * delay(t) = base_delay + depth * sin(2 pi rate t), both in milliseconds.
 * The wet path is the linearly interpolated delayed input, without
 * feedback.
 */
class Chorus : public SignalNode {
public:
    static constexpr float MIN_RATE = 0.1f;
    static constexpr float MAX_RATE = 10.0f;
    static constexpr float MIN_DEPTH_MS = 0.5f;
    static constexpr float MAX_DEPTH_MS = 10.0f;
    static constexpr float MIN_BASE_DELAY_MS = 5.0f;
    static constexpr float MAX_BASE_DELAY_MS = 50.0f;

    /**
     * @param sample_rate Sample rate in Hz.
     * @param rate LFO rate in Hz, clamped to [0.1, 10].
     * @param depth_ms Sweep depth in milliseconds, clamped to [0.5, 10].
     * @param mix Wet/dry mix (0 = dry, 1 = wet).
     * @param base_delay_ms Centre delay, clamped to [5, 50].
     * @throws std::invalid_argument for a non-positive sample rate.
     */
    explicit Chorus(float sample_rate, float rate = 1.0f, float depth_ms = 3.0f, float mix = 0.5f,
                    float base_delay_ms = 20.0f)
        : sample_rate_(sample_rate)
        , buffer_(capacity_for(sample_rate), 0.0f)
        , base_delay_ms_(std::clamp(base_delay_ms, MIN_BASE_DELAY_MS, MAX_BASE_DELAY_MS))
        , rate_(rate, MIN_RATE, MAX_RATE)
        , depth_(depth_ms, MIN_DEPTH_MS, MAX_DEPTH_MS)
        , mix_(mix, 0.0f, 1.0f)
    {
    }

    void set_rate(float hz) { rate_.set_base(hz); }
    void set_depth(float ms) { depth_.set_base(ms); }
    void set_mix(float mix) { mix_.set_base(mix); }

    float rate() const { return rate_.value(); }
    float depth() const { return depth_.value(); }
    float mix() const { return mix_.value(); }
    float base_delay() const { return base_delay_ms_; }
    size_t capacity() const { return buffer_.size(); }

    void note_on(const RenderContext& /* ctx */) override {
        clear();
        lfo_.reset();
    }

    void reset() override {
        clear();
        lfo_.reset();
        rate_.set_offset(0.0f);
        depth_.set_offset(0.0f);
        mix_.set_offset(0.0f);
    }

    bool supports(Parameter p) const override {
        return p == Parameter::Rate || p == Parameter::Depth || p == Parameter::Mix;
    }

    float parameter(Parameter p) const override {
        switch (p) {
            case Parameter::Rate: return rate_.base;
            case Parameter::Depth: return depth_.base;
            case Parameter::Mix: return mix_.base;
            default: return 0.0f;
        }
    }

    void set_parameter(Parameter p, float value) override {
        switch (p) {
            case Parameter::Rate: rate_.set_base(value); break;
            case Parameter::Depth: depth_.set_base(value); break;
            case Parameter::Mix: mix_.set_base(value); break;
            default: break;
        }
    }

    void modulate(Parameter p, float offset) override {
        switch (p) {
            case Parameter::Rate: rate_.set_offset(offset); break;
            case Parameter::Depth: depth_.set_offset(offset); break;
            case Parameter::Mix: mix_.set_offset(offset); break;
            default: break;
        }
    }

protected:
    void do_render(std::span<float> output, const RenderContext& /* ctx */) override {
        lfo_.set_increment(static_cast<double>(rate_.value()) / sample_rate_);
        const double samples_per_ms = sample_rate_ / 1000.0;
        const double base = base_delay_ms_ * samples_per_ms;
        const double depth = depth_.value() * samples_per_ms;
        const float mix = mix_.value();

        for (auto& sample : output) {
            const double delay = base + depth * waveform::sine(lfo_.advance());
            const float input = sample;
            const float delayed = read_interpolated(delay);

            buffer_[write_pos_] = input;
            write_pos_ = (write_pos_ + 1) % buffer_.size();

            sample = input * (1.0f - mix) + delayed * mix;
        }
    }

private:
    static size_t capacity_for(float sample_rate) {
        if (!(sample_rate > 0.0f)) {
            throw std::invalid_argument("Chorus: sample_rate must be positive");
        }
        const double max_ms = MAX_BASE_DELAY_MS + MAX_DEPTH_MS;
        return static_cast<size_t>(std::ceil(max_ms * sample_rate / 1000.0)) + 2;
    }

    float read_interpolated(double delay_samples) const {
        const double buf_size = static_cast<double>(buffer_.size());
        const double d = std::clamp(delay_samples, 1.0, buf_size - 2.0);

        double read_pos = static_cast<double>(write_pos_) - d;
        if (read_pos < 0.0) {
            read_pos += buf_size;
        }

        const size_t i0 = static_cast<size_t>(read_pos) % buffer_.size();
        const size_t i1 = (i0 + 1) % buffer_.size();
        const float frac = static_cast<float>(read_pos - std::floor(read_pos));

        return buffer_[i0] + frac * (buffer_[i1] - buffer_[i0]);
    }

    void clear() {
        std::fill(buffer_.begin(), buffer_.end(), 0.0f);
        write_pos_ = 0;
    }

    float sample_rate_;
    std::vector<float> buffer_;
    size_t write_pos_ = 0;
    PhaseAccumulator lfo_;
    float base_delay_ms_;

    ModulatableValue rate_;
    ModulatableValue depth_;
    ModulatableValue mix_;
};

} // namespace voicegraph

#endif // VOICEGRAPH_CHORUS_HPP
