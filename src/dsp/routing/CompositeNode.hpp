/**
 * @file CompositeNode.hpp
 * @brief Shared ownership and event forwarding for combinator nodes.
 */

#ifndef VOICEGRAPH_COMPOSITE_NODE_HPP
#define VOICEGRAPH_COMPOSITE_NODE_HPP

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "SignalNode.hpp"

namespace voicegraph {

/**
 * @brief Base for nodes built from child nodes.
 *
 * Owns the children exclusively. Note events, reset and seeding go to every
 * child. Parameter calls go to every child that supports the parameter, so
 * modulating the cutoff of Through(osc, filter) reaches the filter.
 */
class CompositeNode : public SignalNode {
public:
    void note_on(const RenderContext& ctx) override {
        for (auto& child : children_) {
            child->note_on(ctx);
        }
    }

    void note_off() override {
        for (auto& child : children_) {
            child->note_off();
        }
    }

    void reset() override {
        for (auto& child : children_) {
            child->reset();
        }
    }

    /**
     * @brief Each child gets a distinct seed derived from this one.
     */
    void set_seed(uint32_t seed) override {
        for (size_t i = 0; i < children_.size(); ++i) {
            children_[i]->set_seed(seed + static_cast<uint32_t>(i) * 0x9E3779B9u);
        }
    }

    bool supports(Parameter p) const override {
        for (const auto& child : children_) {
            if (child->supports(p)) return true;
        }
        return false;
    }

    float parameter(Parameter p) const override {
        for (const auto& child : children_) {
            if (child->supports(p)) return child->parameter(p);
        }
        return 0.0f;
    }

    void set_parameter(Parameter p, float value) override {
        for (auto& child : children_) {
            if (child->supports(p)) child->set_parameter(p, value);
        }
    }

    void modulate(Parameter p, float offset) override {
        for (auto& child : children_) {
            if (child->supports(p)) child->modulate(p, offset);
        }
    }

    size_t child_count() const { return children_.size(); }

protected:
    CompositeNode(std::vector<std::unique_ptr<SignalNode>> children, const char* name)
        : children_(std::move(children))
    {
        for (const auto& child : children_) {
            if (!child) {
                throw std::invalid_argument(std::string(name) + ": child node must not be null");
            }
        }
    }

    /**
     * @brief Convenience for the two-input combinators.
     */
    static std::vector<std::unique_ptr<SignalNode>> pair(std::unique_ptr<SignalNode> a,
                                                         std::unique_ptr<SignalNode> b) {
        std::vector<std::unique_ptr<SignalNode>> v;
        v.reserve(2);
        v.push_back(std::move(a));
        v.push_back(std::move(b));
        return v;
    }

    std::vector<std::unique_ptr<SignalNode>> children_;
};

} // namespace voicegraph

#endif // VOICEGRAPH_COMPOSITE_NODE_HPP
