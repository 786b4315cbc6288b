/**
 * @file ConfigLoader.hpp
 * @brief Human-readable JSON engine configuration.
 */

#ifndef VOICEGRAPH_CONFIG_LOADER_HPP
#define VOICEGRAPH_CONFIG_LOADER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include "EngineConfig.hpp"

namespace voicegraph {

using json = nlohmann::json;

/**
 * @brief Reads and writes EngineConfig as JSON.
 *
 * Example:
 * @code
 * { "sample_rate": 48000, "max_polyphony": 16, "master_gain": 0.5 }
 * @endcode
 * Missing keys keep their defaults and unknown keys are ignored. A value of
 * the wrong type, or a config that fails EngineConfig::validate(), is
 * rejected with a message on std::cerr.
 */
class ConfigLoader {
public:
    static std::optional<EngineConfig> parse(std::string_view text);
    static std::optional<EngineConfig> load_from_file(const std::string& path);

    static std::string serialize(const EngineConfig& config);
    static bool save_to_file(const EngineConfig& config, const std::string& path);
};

} // namespace voicegraph

#endif // VOICEGRAPH_CONFIG_LOADER_HPP
