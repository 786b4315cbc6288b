/**
 * @file Mix.hpp
 * @brief Weighted sum of child nodes.
 */

#ifndef VOICEGRAPH_MIX_HPP
#define VOICEGRAPH_MIX_HPP

#include <algorithm>
#include <array>
#include <memory>
#include <span>
#include <stdexcept>
#include <vector>
#include "routing/CompositeNode.hpp"

namespace voicegraph {

/**
 * @brief out[i] = sum_k weight_k * child_k[i].
 *
 * Weights are applied as given: no normalization and no clipping, so
 * headroom is the patch author's responsibility.
 */
class Mix : public CompositeNode {
public:
    /**
     * @throws std::invalid_argument if there are no children or the weight
     *         count does not match the child count.
     */
    Mix(std::vector<std::unique_ptr<SignalNode>> children, std::vector<float> weights)
        : CompositeNode(std::move(children), "Mix")
        , weights_(std::move(weights))
    {
        if (children_.empty()) {
            throw std::invalid_argument("Mix: at least one child is required");
        }
        if (weights_.size() != children_.size()) {
            throw std::invalid_argument("Mix: weight count must match child count");
        }
    }

    Mix(std::unique_ptr<SignalNode> a, std::unique_ptr<SignalNode> b,
        float weight_a = 1.0f, float weight_b = 1.0f)
        : Mix(pair(std::move(a), std::move(b)), std::vector<float>{weight_a, weight_b})
    {
    }

    void set_weight(size_t index, float weight) {
        if (index < weights_.size()) {
            weights_[index] = weight;
        }
    }

    float weight(size_t index) const {
        return index < weights_.size() ? weights_[index] : 0.0f;
    }

    bool is_finished() const override {
        return std::all_of(children_.begin(), children_.end(),
                           [](const auto& child) { return child->is_finished(); });
    }

protected:
    void do_render(std::span<float> output, const RenderContext& ctx) override {
        std::fill(output.begin(), output.end(), 0.0f);
        std::span<float> scratch(scratch_.data(), output.size());

        for (size_t k = 0; k < children_.size(); ++k) {
            children_[k]->render_block(scratch, ctx);
            const float w = weights_[k];
            for (size_t i = 0; i < output.size(); ++i) {
                output[i] += w * scratch[i];
            }
        }
    }

private:
    std::vector<float> weights_;
    std::array<float, MAX_BLOCK_SIZE> scratch_{};
};

} // namespace voicegraph

#endif // VOICEGRAPH_MIX_HPP
