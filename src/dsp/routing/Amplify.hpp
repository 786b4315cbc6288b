/**
 * @file Amplify.hpp
 * @brief Sample-wise product of two nodes (ring modulation / VCA).
 */

#ifndef VOICEGRAPH_AMPLIFY_HPP
#define VOICEGRAPH_AMPLIFY_HPP

#include <array>
#include <memory>
#include <span>
#include "routing/CompositeNode.hpp"

namespace voicegraph {

/**
 * @brief out[i] = a[i] * b[i].
 *
 * Typical use is oscillator times envelope. Finished as soon as either side
 * is finished, since the product is silent from then on.
 */
class Amplify : public CompositeNode {
public:
    Amplify(std::unique_ptr<SignalNode> a, std::unique_ptr<SignalNode> b)
        : CompositeNode(pair(std::move(a), std::move(b)), "Amplify")
    {
    }

    bool is_finished() const override {
        return children_[0]->is_finished() || children_[1]->is_finished();
    }

protected:
    void do_render(std::span<float> output, const RenderContext& ctx) override {
        std::span<float> scratch(scratch_.data(), output.size());

        children_[0]->render_block(output, ctx);
        children_[1]->render_block(scratch, ctx);

        for (size_t i = 0; i < output.size(); ++i) {
            output[i] *= scratch[i];
        }
    }

private:
    std::array<float, MAX_BLOCK_SIZE> scratch_{};
};

} // namespace voicegraph

#endif // VOICEGRAPH_AMPLIFY_HPP
