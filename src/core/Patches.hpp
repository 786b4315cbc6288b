/**
 * @file Patches.hpp
 * @brief Factory patch library: named, ready-made voice trees.
 */

#ifndef VOICEGRAPH_PATCHES_HPP
#define VOICEGRAPH_PATCHES_HPP

#include <memory>
#include <string>
#include <vector>
#include "SignalNode.hpp"
#include "Voice.hpp"

namespace voicegraph::patches {

/**
 * @brief Names accepted by make() and factory().
 */
const std::vector<std::string>& names();

/**
 * @brief Build a fresh tree for a named patch.
 *
 * Only the delay-based patches depend on sample_rate (buffer sizing).
 * @throws std::invalid_argument for an unknown name.
 */
std::unique_ptr<SignalNode> make(const std::string& name, float sample_rate);

/**
 * @brief PatchFactory for PolySynth. The name is checked immediately.
 */
PatchFactory factory(const std::string& name, float sample_rate);

} // namespace voicegraph::patches

#endif // VOICEGRAPH_PATCHES_HPP
