/**
 * @file Distortion.hpp
 * @brief Memoryless waveshaper (soft clip, hard clip, foldback).
 */

#ifndef VOICEGRAPH_DISTORTION_HPP
#define VOICEGRAPH_DISTORTION_HPP

#include <algorithm>
#include <cmath>
#include <span>
#include "SignalNode.hpp"

namespace voicegraph {

/**
 * @brief Applies drive then a fixed transfer curve, in place.
 */
class Distortion : public SignalNode {
public:
    enum class Curve {
        SoftClip,
        HardClip,
        Foldback
    };

    static constexpr float MIN_DRIVE = 0.1f;
    static constexpr float MAX_DRIVE = 100.0f;
    static constexpr int MAX_FOLDS = 32;

    explicit Distortion(Curve curve = Curve::SoftClip, float drive = 1.0f, float threshold = 1.0f)
        : curve_(curve)
        , drive_(drive, MIN_DRIVE, MAX_DRIVE)
        , threshold_(std::max(1e-3f, threshold))
    {
    }

    void set_curve(Curve curve) { curve_ = curve; }
    void set_drive(float drive) { drive_.set_base(drive); }
    float drive() const { return drive_.value(); }

    void reset() override {
        drive_.set_offset(0.0f);
    }

    bool supports(Parameter p) const override {
        return p == Parameter::Drive;
    }

    float parameter(Parameter p) const override {
        return p == Parameter::Drive ? drive_.base : 0.0f;
    }

    void set_parameter(Parameter p, float value) override {
        if (p == Parameter::Drive) drive_.set_base(value);
    }

    void modulate(Parameter p, float offset) override {
        if (p == Parameter::Drive) drive_.set_offset(offset);
    }

    static float soft_clip(float x) {
        return x / (1.0f + std::abs(x));
    }

    static float hard_clip(float x, float threshold) {
        return std::clamp(x, -threshold, threshold);
    }

    /**
     * @brief Reflects the signal back inside +/-threshold, at most MAX_FOLDS times.
     */
    static float foldback(float x, float threshold) {
        for (int i = 0; i < MAX_FOLDS; ++i) {
            if (x > threshold) {
                x = 2.0f * threshold - x;
            } else if (x < -threshold) {
                x = -2.0f * threshold - x;
            } else {
                return x;
            }
        }
        return std::clamp(x, -threshold, threshold);
    }

protected:
    void do_render(std::span<float> output, const RenderContext& /* ctx */) override {
        const float drive = drive_.value();
        for (auto& sample : output) {
            const float x = sample * drive;
            switch (curve_) {
                case Curve::SoftClip: sample = soft_clip(x); break;
                case Curve::HardClip: sample = hard_clip(x, threshold_); break;
                case Curve::Foldback: sample = foldback(x, threshold_); break;
            }
        }
    }

private:
    Curve curve_;
    ModulatableValue drive_;
    float threshold_;
};

} // namespace voicegraph

#endif // VOICEGRAPH_DISTORTION_HPP
