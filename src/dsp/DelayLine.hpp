/**
 * @file DelayLine.hpp
 * @brief Fixed-capacity feedback delay with fractional reads.
 */

#ifndef VOICEGRAPH_DELAY_LINE_HPP
#define VOICEGRAPH_DELAY_LINE_HPP

#include <algorithm>
#include <cmath>
#include <span>
#include <stdexcept>
#include <vector>
#include "SignalNode.hpp"

namespace voicegraph {

/**
 * @brief Mono delay line with feedback and wet/dry mix.
 *
 * The buffer is sized once from the sample rate and maximum delay given to
 * the constructor. Delay-time changes ramp linearly across the next block
 * to avoid zipper noise. Processes the output span in place.
 */
class DelayLine : public SignalNode {
public:
    static constexpr float MAX_FEEDBACK = 0.95f;

    /**
     * @param sample_rate Sample rate in Hz.
     * @param max_delay_seconds Maximum delay time in seconds.
     * @param delay_seconds Initial delay time.
     * @param feedback Initial feedback, clamped to [0, 0.95].
     * @param mix Initial wet/dry mix (0 = dry, 1 = wet).
     * @throws std::invalid_argument for a non-positive rate or maximum delay.
     */
    DelayLine(float sample_rate, float max_delay_seconds = 2.0f, float delay_seconds = 0.25f,
              float feedback = 0.3f, float mix = 0.5f)
        : sample_rate_(sample_rate)
        , buffer_(capacity_for(sample_rate, max_delay_seconds), 0.0f)
        , delay_time_(delay_seconds, 1.0f / sample_rate, max_delay_seconds)
        , feedback_(feedback, 0.0f, MAX_FEEDBACK)
        , mix_(mix, 0.0f, 1.0f)
    {
        current_delay_ = target_delay_samples();
    }

    void set_delay_time(float seconds) { delay_time_.set_base(seconds); }
    void set_feedback(float feedback) { feedback_.set_base(feedback); }
    void set_mix(float mix) { mix_.set_base(mix); }

    float delay_time() const { return delay_time_.value(); }
    float feedback() const { return feedback_.value(); }
    float mix() const { return mix_.value(); }
    size_t capacity() const { return buffer_.size(); }

    /**
     * @brief Clears the line so a new note never hears the previous one's tail.
     */
    void note_on(const RenderContext& /* ctx */) override {
        clear();
        current_delay_ = target_delay_samples();
    }

    void reset() override {
        clear();
        delay_time_.set_offset(0.0f);
        feedback_.set_offset(0.0f);
        mix_.set_offset(0.0f);
        current_delay_ = target_delay_samples();
    }

    bool supports(Parameter p) const override {
        return p == Parameter::DelayTime || p == Parameter::Feedback || p == Parameter::Mix;
    }

    float parameter(Parameter p) const override {
        switch (p) {
            case Parameter::DelayTime: return delay_time_.base;
            case Parameter::Feedback: return feedback_.base;
            case Parameter::Mix: return mix_.base;
            default: return 0.0f;
        }
    }

    void set_parameter(Parameter p, float value) override {
        switch (p) {
            case Parameter::DelayTime: delay_time_.set_base(value); break;
            case Parameter::Feedback: feedback_.set_base(value); break;
            case Parameter::Mix: mix_.set_base(value); break;
            default: break;
        }
    }

    void modulate(Parameter p, float offset) override {
        switch (p) {
            case Parameter::DelayTime: delay_time_.set_offset(offset); break;
            case Parameter::Feedback: feedback_.set_offset(offset); break;
            case Parameter::Mix: mix_.set_offset(offset); break;
            default: break;
        }
    }

    /**
     * @brief Linear-interpolated read, delay_samples behind the write head.
     */
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

protected:
    void do_render(std::span<float> output, const RenderContext& /* ctx */) override {
        const double target = target_delay_samples();
        const double step = output.empty() ? 0.0 : (target - current_delay_) / static_cast<double>(output.size());
        const float feedback = feedback_.value();
        const float mix = mix_.value();

        for (auto& sample : output) {
            current_delay_ += step;
            const float input = sample;
            const float delayed_sample = read_interpolated(current_delay_);

            buffer_[write_pos_] = input + (delayed_sample * feedback);
            write_pos_ = (write_pos_ + 1) % buffer_.size();

            sample = (input * (1.0f - mix)) + (delayed_sample * mix);
        }
        current_delay_ = target;
    }

private:
    static size_t capacity_for(float sample_rate, float max_delay_seconds) {
        if (!(sample_rate > 0.0f)) {
            throw std::invalid_argument("DelayLine: sample_rate must be positive");
        }
        if (!(max_delay_seconds > 0.0f)) {
            throw std::invalid_argument("DelayLine: max_delay_seconds must be positive");
        }
        return static_cast<size_t>(std::ceil(static_cast<double>(max_delay_seconds) * sample_rate)) + 2;
    }

    double target_delay_samples() const {
        return static_cast<double>(delay_time_.value()) * sample_rate_;
    }

    void clear() {
        std::fill(buffer_.begin(), buffer_.end(), 0.0f);
        write_pos_ = 0;
    }

    float sample_rate_;
    std::vector<float> buffer_;
    size_t write_pos_ = 0;
    double current_delay_ = 0.0;

    ModulatableValue delay_time_;
    ModulatableValue feedback_;
    ModulatableValue mix_;
};

} // namespace voicegraph

#endif // VOICEGRAPH_DELAY_LINE_HPP
