/**
 * @file AdsrEnvelope.hpp
 * @brief Linear ADSR (Attack, Decay, Sustain, Release) envelope.
 */

#ifndef VOICEGRAPH_ADSR_ENVELOPE_HPP
#define VOICEGRAPH_ADSR_ENVELOPE_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include "SignalNode.hpp"

namespace voicegraph {

/**
 * @brief ADSR envelope generator producing a unipolar [0, 1] control signal.
 *
 * All ramps are linear:
 * - Attack rises by 1 / (attack * sr) per sample from wherever the level is.
 * - Decay falls by (1 - sustain) / (decay * sr) per sample to the sustain level.
 * - Release falls from the level at note_off to 0 in round(release * sr) samples.
 *
 * The level is continuous across every transition, including a retrigger
 * during release. Output does not depend on ctx.amplitude.
 */
class AdsrEnvelope : public SignalNode {
public:
    /**
     * @brief ADSR stages.
     */
    enum class State {
        Idle,
        Attack,
        Decay,
        Sustain,
        Release
    };

    AdsrEnvelope(float attack = 0.01f, float decay = 0.1f, float sustain = 0.7f, float release = 0.3f)
        : attack_time_(std::max(0.0f, attack))
        , decay_time_(std::max(0.0f, decay))
        , sustain_level_(std::clamp(sustain, 0.0f, 1.0f))
        , release_time_(std::max(0.0f, release))
    {
        update_rates();
    }

    void note_on(const RenderContext& ctx) override {
        set_sample_rate(ctx.sample_rate);
        attack_start_ = current_level_;
        stage_samples_ = 0;
        state_ = State::Attack;
    }

    void note_off() override {
        if (state_ == State::Idle || state_ == State::Release) {
            return;
        }
        release_start_ = current_level_;
        stage_samples_ = 0;
        state_ = State::Release;
        if (release_samples_ == 0) {
            current_level_ = 0.0f;
            state_ = State::Idle;
        }
    }

    bool is_finished() const override {
        return state_ == State::Idle;
    }

    void reset() override {
        state_ = State::Idle;
        current_level_ = 0.0f;
        stage_samples_ = 0;
        attack_start_ = 0.0f;
        release_start_ = 0.0f;
    }

    void set_attack_time(float seconds) { attack_time_ = std::max(0.0f, seconds); update_rates(); }
    void set_decay_time(float seconds) { decay_time_ = std::max(0.0f, seconds); update_rates(); }
    void set_sustain_level(float level) { sustain_level_ = std::clamp(level, 0.0f, 1.0f); update_rates(); }
    void set_release_time(float seconds) { release_time_ = std::max(0.0f, seconds); update_rates(); }

    State state() const { return state_; }
    float level() const { return current_level_; }
    bool is_releasing() const { return state_ == State::Release; }

    /**
     * @brief Length of a full release in samples at the current rate.
     */
    uint64_t release_samples() const { return release_samples_; }

protected:
    void do_render(std::span<float> output, const RenderContext& ctx) override {
        set_sample_rate(ctx.sample_rate);
        for (auto& sample : output) {
            sample = process_sample();
        }
    }

private:
    float process_sample() {
        switch (state_) {
            case State::Attack:
                if (attack_rate_ <= 0.0) {
                    current_level_ = 1.0f;
                } else {
                    ++stage_samples_;
                    current_level_ = static_cast<float>(attack_start_ + stage_samples_ * attack_rate_);
                }
                if (current_level_ >= 1.0f) {
                    current_level_ = 1.0f;
                    stage_samples_ = 0;
                    state_ = State::Decay;
                }
                break;

            case State::Decay:
                if (decay_rate_ <= 0.0) {
                    current_level_ = sustain_level_;
                } else {
                    ++stage_samples_;
                    current_level_ = static_cast<float>(1.0 - stage_samples_ * decay_rate_);
                }
                if (current_level_ <= sustain_level_) {
                    current_level_ = sustain_level_;
                    stage_samples_ = 0;
                    state_ = State::Sustain;
                }
                break;

            case State::Sustain:
                current_level_ = sustain_level_;
                break;

            case State::Release:
                ++stage_samples_;
                if (stage_samples_ >= release_samples_) {
                    current_level_ = 0.0f;
                    stage_samples_ = 0;
                    state_ = State::Idle;
                } else {
                    const double remaining = 1.0 - static_cast<double>(stage_samples_) / release_samples_;
                    current_level_ = static_cast<float>(release_start_ * remaining);
                }
                break;

            case State::Idle:
                current_level_ = 0.0f;
                break;
        }
        return current_level_;
    }

    void set_sample_rate(float sample_rate) {
        if (sample_rate > 0.0f && sample_rate != sample_rate_) {
            sample_rate_ = sample_rate;
            update_rates();
        }
    }

    void update_rates() {
        const double attack_samples = static_cast<double>(attack_time_) * sample_rate_;
        const double decay_samples = static_cast<double>(decay_time_) * sample_rate_;
        attack_rate_ = (attack_samples > 0.0) ? 1.0 / attack_samples : 0.0;
        decay_rate_ = (decay_samples > 0.0) ? (1.0 - sustain_level_) / decay_samples : 0.0;
        release_samples_ = static_cast<uint64_t>(std::llround(static_cast<double>(release_time_) * sample_rate_));
    }

    float sample_rate_ = 48000.0f;
    State state_ = State::Idle;
    float current_level_ = 0.0f;
    uint64_t stage_samples_ = 0;
    float attack_start_ = 0.0f;
    float release_start_ = 0.0f;

    float attack_time_;
    float decay_time_;
    float sustain_level_;
    float release_time_;

    double attack_rate_ = 0.0;
    double decay_rate_ = 0.0;
    uint64_t release_samples_ = 0;
};

} // namespace voicegraph

#endif // VOICEGRAPH_ADSR_ENVELOPE_HPP
