/**
 * @file Modulate.hpp
 * @brief Drives one parameter of a carrier node from a modulator node.
 */

#ifndef VOICEGRAPH_MODULATE_HPP
#define VOICEGRAPH_MODULATE_HPP

#include <algorithm>
#include <array>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include "SignalNode.hpp"

namespace voicegraph {

/**
 * @brief Control-rate parameter modulation.
 *
 * Updates happen every CONTROL_PERIOD frames, counted from note_on() or
 * reset() and independent of how the host splits its render calls. At each
 * update the modulator renders one control period ahead; that period's
 * average times depth becomes the carrier's modulation offset for the
 * target parameter. The carrier clamps the result to its own domain.
 *
 * Parameter calls are forwarded to the carrier. A Modulate wrapped in
 * another Modulate on the same parameter adds the outer offset to its own.
 */
class Modulate : public SignalNode {
public:
    static constexpr size_t CONTROL_PERIOD = 64;

    /**
     * @param carrier Node whose parameter is modulated (audio path).
     * @param modulator Control source (LFO, envelope, ...).
     * @param target Parameter on the carrier.
     * @param depth Offset per unit of modulator output, in the parameter's units.
     * @throws std::invalid_argument on null nodes or an unsupported target.
     */
    Modulate(std::unique_ptr<SignalNode> carrier, std::unique_ptr<SignalNode> modulator,
             Parameter target, float depth)
        : carrier_(std::move(carrier))
        , modulator_(std::move(modulator))
        , target_(target)
        , depth_(depth)
    {
        if (!carrier_ || !modulator_) {
            throw std::invalid_argument("Modulate: carrier and modulator must not be null");
        }
        if (!carrier_->supports(target_)) {
            throw std::invalid_argument(std::string("Modulate: carrier does not support parameter '")
                                        + to_string(target_) + "'");
        }
    }

    void set_depth(float depth) { depth_ = depth; }
    float depth() const { return depth_; }
    Parameter target() const { return target_; }

    /**
     * @brief Offset applied to the carrier during the current control period.
     */
    float last_offset() const { return last_offset_; }

    void note_on(const RenderContext& ctx) override {
        carrier_->note_on(ctx);
        modulator_->note_on(ctx);
        period_position_ = 0;
    }

    void note_off() override {
        carrier_->note_off();
        modulator_->note_off();
    }

    bool is_finished() const override {
        return carrier_->is_finished();
    }

    void reset() override {
        carrier_->reset();
        modulator_->reset();
        outer_offset_ = 0.0f;
        last_offset_ = 0.0f;
        period_position_ = 0;
    }

    void set_seed(uint32_t seed) override {
        carrier_->set_seed(seed);
        modulator_->set_seed(seed ^ 0x5bd1e995u);
    }

    bool supports(Parameter p) const override {
        return carrier_->supports(p);
    }

    float parameter(Parameter p) const override {
        return carrier_->parameter(p);
    }

    void set_parameter(Parameter p, float value) override {
        carrier_->set_parameter(p, value);
    }

    void modulate(Parameter p, float offset) override {
        if (p == target_) {
            outer_offset_ = offset;
        } else {
            carrier_->modulate(p, offset);
        }
    }

protected:
    void do_render(std::span<float> output, const RenderContext& ctx) override {
        size_t offset = 0;
        while (offset < output.size()) {
            if (period_position_ == 0) {
                update_offset(ctx);
            }
            const size_t frames = std::min(output.size() - offset, CONTROL_PERIOD - period_position_);
            carrier_->render_block(output.subspan(offset, frames), ctx.with_block_size(frames));
            offset += frames;
            period_position_ = (period_position_ + frames) % CONTROL_PERIOD;
        }
    }

private:
    void update_offset(const RenderContext& ctx) {
        std::span<float> scratch(scratch_.data(), scratch_.size());
        modulator_->render_block(scratch, ctx.with_block_size(CONTROL_PERIOD));

        double sum = 0.0;
        for (float v : scratch) {
            sum += v;
        }
        const float average = static_cast<float>(sum / static_cast<double>(CONTROL_PERIOD));

        last_offset_ = depth_ * average + outer_offset_;
        carrier_->modulate(target_, last_offset_);
    }

    std::unique_ptr<SignalNode> carrier_;
    std::unique_ptr<SignalNode> modulator_;
    Parameter target_;
    float depth_;
    float outer_offset_ = 0.0f;
    float last_offset_ = 0.0f;
    size_t period_position_ = 0;
    std::array<float, CONTROL_PERIOD> scratch_{};
};

} // namespace voicegraph

#endif // VOICEGRAPH_MODULATE_HPP
