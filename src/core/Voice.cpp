/**
 * @file Voice.cpp
 * @brief Implementation of the Voice lifecycle.
 */

#include "Voice.hpp"
#include <stdexcept>
#include <utility>

namespace voicegraph {

Voice::Voice(size_t slot, std::unique_ptr<SignalNode> tree)
    : slot_(slot)
    , tree_(std::move(tree))
{
    if (!tree_) {
        throw std::invalid_argument("Voice: patch factory returned a null tree");
    }
    tree_->set_seed(static_cast<uint32_t>(slot_ + 1) * 2654435761u);
}

void Voice::start(int note, int velocity, uint64_t age, const RenderContext& ctx) {
    note_ = note;
    velocity_ = velocity;
    age_ = age;
    state_ = State::Active;
    tree_->note_on(ctx);
}

void Voice::release() {
    if (state_ != State::Active) {
        return;
    }
    state_ = State::Releasing;
    tree_->note_off();
}

void Voice::render(std::span<float> output, float sample_rate, float pitch_ratio) {
    tree_->render_block(output, context(sample_rate, pitch_ratio, output.size()));
}

bool Voice::retire_if_finished() {
    if (state_ == State::Free || !tree_->is_finished()) {
        return false;
    }
    state_ = State::Free;
    note_ = -1;
    velocity_ = 0;
    return true;
}

void Voice::reset() {
    tree_->reset();
    state_ = State::Free;
    note_ = -1;
    velocity_ = 0;
    age_ = 0;
}

RenderContext Voice::context(float sample_rate, float pitch_ratio, size_t block_size) const {
    RenderContext ctx = RenderContext::from_note(sample_rate, note_, velocity_, block_size);
    if (pitch_ratio != 1.0f) {
        ctx = ctx.with_frequency(ctx.frequency * pitch_ratio);
    }
    return ctx;
}

} // namespace voicegraph
