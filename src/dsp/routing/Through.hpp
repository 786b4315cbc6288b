/**
 * @file Through.hpp
 * @brief Serial chain: a's output is processed by b.
 */

#ifndef VOICEGRAPH_THROUGH_HPP
#define VOICEGRAPH_THROUGH_HPP

#include <memory>
#include <span>
#include "routing/CompositeNode.hpp"

namespace voicegraph {

/**
 * @brief Renders a into the output, then lets b process it in place.
 *
 * b is expected to be a processor (filter, delay, distortion). The output
 * span doubles as the intermediate buffer, so no scratch memory is needed.
 * Finished when the source a is finished; a delay tail after the source
 * ends is cut at that point.
 */
class Through : public CompositeNode {
public:
    Through(std::unique_ptr<SignalNode> a, std::unique_ptr<SignalNode> b)
        : CompositeNode(pair(std::move(a), std::move(b)), "Through")
    {
    }

    bool is_finished() const override {
        return children_[0]->is_finished();
    }

protected:
    void do_render(std::span<float> output, const RenderContext& ctx) override {
        children_[0]->render_block(output, ctx);
        children_[1]->render_block(output, ctx);
    }
};

} // namespace voicegraph

#endif // VOICEGRAPH_THROUGH_HPP
