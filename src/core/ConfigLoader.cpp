#include "ConfigLoader.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace voicegraph {

namespace {

template<typename T>
void read_field(const json& j, const char* key, T& field) {
    if (j.contains(key)) {
        field = j.at(key).get<T>();
    }
}

void read_count(const json& j, const char* key, size_t& field) {
    if (!j.contains(key)) {
        return;
    }
    const json& value = j.at(key);
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }
    field = value.get<size_t>();
}

} // namespace

std::optional<EngineConfig> ConfigLoader::parse(std::string_view text) {
    try {
        const json j = json::parse(text.begin(), text.end());
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] Top-level JSON value must be an object" << std::endl;
            return std::nullopt;
        }

        EngineConfig config;
        read_field(j, "sample_rate", config.sample_rate);
        read_count(j, "max_block_size", config.max_block_size);
        read_count(j, "max_polyphony", config.max_polyphony);
        read_count(j, "channel_capacity", config.channel_capacity);
        read_field(j, "master_gain", config.master_gain);

        config.validate();
        return config;
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Invalid JSON: " << e.what() << std::endl;
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ConfigLoader] Rejected config: " << e.what() << std::endl;
        return std::nullopt;
    }
}

std::optional<EngineConfig> ConfigLoader::load_from_file(const std::string& path) {
    std::cout << "[ConfigLoader] Attempting to load: " << path << std::endl;
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigLoader] Failed to open file: " << path << std::endl;
        return std::nullopt;
    }
    const std::string content((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    auto config = parse(content);
    if (config) {
        std::cout << "[ConfigLoader] Loaded config from: " << path << std::endl;
    } else {
        std::cerr << "[ConfigLoader] Failed to load config from: " << path << std::endl;
    }
    return config;
}

std::string ConfigLoader::serialize(const EngineConfig& config) {
    const json j = {
        {"sample_rate", config.sample_rate},
        {"max_block_size", config.max_block_size},
        {"max_polyphony", config.max_polyphony},
        {"channel_capacity", config.channel_capacity},
        {"master_gain", config.master_gain}
    };
    return j.dump(4);
}

bool ConfigLoader::save_to_file(const EngineConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[ConfigLoader] Failed to open file for writing: " << path << std::endl;
        return false;
    }
    file << serialize(config);
    return static_cast<bool>(file);
}

} // namespace voicegraph
