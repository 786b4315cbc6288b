/**
 * @file Voice.hpp
 * @brief Represents a single synthesizer voice.
 */

#ifndef VOICEGRAPH_VOICE_HPP
#define VOICEGRAPH_VOICE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include "RenderContext.hpp"
#include "SignalNode.hpp"

namespace voicegraph {

/**
 * @brief Builds one voice's signal tree. Called only at engine construction.
 */
using PatchFactory = std::function<std::unique_ptr<SignalNode>()>;

/**
 * @brief One slot of the voice pool: a node tree plus lifecycle state.
 *
 * Free -> Active on start(), Active -> Releasing on release(), and back to
 * Free once the tree reports is_finished(). The tree is created once and
 * reused for every note the slot plays.
 */
class Voice {
public:
    enum class State {
        Free,
        Active,
        Releasing
    };

    Voice(size_t slot, std::unique_ptr<SignalNode> tree);

    /**
     * @brief Assign a note (also used when stealing).
     */
    void start(int note, int velocity, uint64_t age, const RenderContext& ctx);

    /**
     * @brief Active -> Releasing. Ignored in any other state.
     */
    void release();

    /**
     * @brief Render the tree for this voice's note. Overwrites output.
     */
    void render(std::span<float> output, float sample_rate, float pitch_ratio);

    /**
     * @brief Returns to Free if the tree has finished.
     * @return true if the voice was freed by this call.
     */
    bool retire_if_finished();

    void reset();

    /**
     * @brief Context this voice renders with at the given rate and pitch ratio.
     */
    RenderContext context(float sample_rate, float pitch_ratio, size_t block_size = 0) const;

    size_t slot() const { return slot_; }
    State state() const { return state_; }
    bool is_free() const { return state_ == State::Free; }
    int note() const { return note_; }
    int velocity() const { return velocity_; }
    uint64_t age() const { return age_; }

private:
    size_t slot_;
    std::unique_ptr<SignalNode> tree_;
    State state_ = State::Free;
    int note_ = -1;
    int velocity_ = 0;
    uint64_t age_ = 0;
};

} // namespace voicegraph

#endif // VOICEGRAPH_VOICE_HPP
