/**
 * @file Reverb.hpp
 * @brief Schroeder reverb: four parallel combs into two series allpasses.
 */

#ifndef VOICEGRAPH_REVERB_HPP
#define VOICEGRAPH_REVERB_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <span>
#include <stdexcept>
#include <vector>
#include "SignalNode.hpp"

namespace voicegraph {

/**
 * @brief Room simulation with a damped comb bank, processed in place.
 *
 * Room size maps to comb feedback in [0.7, 0.98]; damping is the
 * coefficient of the one-pole lowpass inside each comb's feedback path.
 * Delay buffers are sized from the sample rate in the constructor.
 */
class Reverb : public SignalNode {
public:
    static constexpr std::array<float, 4> COMB_DELAYS_MS = {29.7f, 37.1f, 41.1f, 43.7f};
    static constexpr std::array<float, 2> ALLPASS_DELAYS_MS = {5.0f, 1.7f};
    static constexpr float ALLPASS_FEEDBACK = 0.5f;
    static constexpr float MIN_FEEDBACK = 0.7f;
    static constexpr float FEEDBACK_RANGE = 0.28f;

    /**
     * @param sample_rate Sample rate in Hz.
     * @param room_size 0 (small room) to 1 (large hall).
     * @param damping 0 (bright) to 1 (dark).
     * @param mix Wet/dry mix (0 = dry, 1 = wet).
     * @throws std::invalid_argument for a non-positive sample rate.
     */
    explicit Reverb(float sample_rate, float room_size = 0.5f, float damping = 0.5f, float mix = 0.3f)
        : room_size_(room_size, 0.0f, 1.0f)
        , damping_(damping, 0.0f, 1.0f)
        , mix_(mix, 0.0f, 1.0f)
    {
        if (!(sample_rate > 0.0f)) {
            throw std::invalid_argument("Reverb: sample_rate must be positive");
        }
        for (size_t i = 0; i < combs_.size(); ++i) {
            combs_[i].buffer.assign(delay_samples(COMB_DELAYS_MS[i], sample_rate), 0.0f);
        }
        for (size_t i = 0; i < allpasses_.size(); ++i) {
            allpasses_[i].buffer.assign(delay_samples(ALLPASS_DELAYS_MS[i], sample_rate), 0.0f);
        }
    }

    void set_room_size(float size) { room_size_.set_base(size); }
    void set_damping(float damping) { damping_.set_base(damping); }
    void set_mix(float mix) { mix_.set_base(mix); }

    float room_size() const { return room_size_.value(); }
    float damping() const { return damping_.value(); }
    float mix() const { return mix_.value(); }

    /**
     * @brief Comb feedback for the current room size.
     */
    float comb_feedback() const {
        return MIN_FEEDBACK + room_size_.value() * FEEDBACK_RANGE;
    }

    /**
     * @brief Clears the tails so a new note starts from silence.
     */
    void note_on(const RenderContext& /* ctx */) override {
        clear();
    }

    void reset() override {
        clear();
        room_size_.set_offset(0.0f);
        damping_.set_offset(0.0f);
        mix_.set_offset(0.0f);
    }

    bool supports(Parameter p) const override {
        return p == Parameter::RoomSize || p == Parameter::Damping || p == Parameter::Mix;
    }

    float parameter(Parameter p) const override {
        switch (p) {
            case Parameter::RoomSize: return room_size_.base;
            case Parameter::Damping: return damping_.base;
            case Parameter::Mix: return mix_.base;
            default: return 0.0f;
        }
    }

    void set_parameter(Parameter p, float value) override {
        switch (p) {
            case Parameter::RoomSize: room_size_.set_base(value); break;
            case Parameter::Damping: damping_.set_base(value); break;
            case Parameter::Mix: mix_.set_base(value); break;
            default: break;
        }
    }

    void modulate(Parameter p, float offset) override {
        switch (p) {
            case Parameter::RoomSize: room_size_.set_offset(offset); break;
            case Parameter::Damping: damping_.set_offset(offset); break;
            case Parameter::Mix: mix_.set_offset(offset); break;
            default: break;
        }
    }

protected:
    void do_render(std::span<float> output, const RenderContext& /* ctx */) override {
        const float feedback = comb_feedback();
        const float damp = damping_.value();
        const float mix = mix_.value();

        for (auto& sample : output) {
            const float input = sample;

            float wet = 0.0f;
            for (auto& comb : combs_) {
                wet += comb.process(input, feedback, damp);
            }
            wet *= 0.25f;

            for (auto& allpass : allpasses_) {
                wet = allpass.process(wet);
            }

            sample = input * (1.0f - mix) + wet * mix;
        }
    }

private:
    struct Comb {
        std::vector<float> buffer;
        size_t pos = 0;
        float filter_state = 0.0f;

        float process(float input, float feedback, float damp) {
            const float out = buffer[pos];
            filter_state = out * (1.0f - damp) + filter_state * damp;
            buffer[pos] = input + filter_state * feedback;
            pos = (pos + 1) % buffer.size();
            return out;
        }
    };

    struct Allpass {
        std::vector<float> buffer;
        size_t pos = 0;

        float process(float input) {
            const float delayed = buffer[pos];
            const float out = -ALLPASS_FEEDBACK * input + delayed;
            buffer[pos] = input + ALLPASS_FEEDBACK * out;
            pos = (pos + 1) % buffer.size();
            return out;
        }
    };

    static size_t delay_samples(float ms, float sample_rate) {
        return std::max<size_t>(1, static_cast<size_t>(ms * sample_rate / 1000.0f));
    }

    void clear() {
        for (auto& comb : combs_) {
            std::fill(comb.buffer.begin(), comb.buffer.end(), 0.0f);
            comb.pos = 0;
            comb.filter_state = 0.0f;
        }
        for (auto& allpass : allpasses_) {
            std::fill(allpass.buffer.begin(), allpass.buffer.end(), 0.0f);
            allpass.pos = 0;
        }
    }

    std::array<Comb, 4> combs_;
    std::array<Allpass, 2> allpasses_;

    ModulatableValue room_size_;
    ModulatableValue damping_;
    ModulatableValue mix_;
};

} // namespace voicegraph

#endif // VOICEGRAPH_REVERB_HPP
