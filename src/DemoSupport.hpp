/**
 * @file DemoSupport.hpp
 * @brief Shared plumbing for the ALSA demo programs.
 */

#ifndef VOICEGRAPH_DEMO_SUPPORT_HPP
#define VOICEGRAPH_DEMO_SUPPORT_HPP

#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include "ConfigLoader.hpp"
#include "EngineConfig.hpp"
#include "Logger.hpp"

namespace demo {

inline std::atomic<bool> g_keep_running{true};

inline void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_keep_running = false;
    }
}

inline void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
}

/**
 * @brief Config from a JSON file when a path is given, defaults otherwise.
 */
inline std::optional<voicegraph::EngineConfig> load_config(int argc, char** argv) {
    if (argc > 1) {
        return voicegraph::ConfigLoader::load_from_file(argv[1]);
    }
    return voicegraph::EngineConfig{};
}

/**
 * @brief Print everything the audio thread has logged so far.
 */
inline void spool_telemetry(voicegraph::AudioLogger& logger) {
    while (auto entry = logger.pop_entry()) {
        if (entry->type == voicegraph::LogEntry::Type::Event) {
            std::cout << "[" << entry->tag << "] " << entry->value << std::endl;
        } else {
            std::cout << "[" << entry->tag << "] " << entry->message << std::endl;
        }
    }
}

} // namespace demo

#endif // VOICEGRAPH_DEMO_SUPPORT_HPP
