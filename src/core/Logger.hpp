#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include "SpscQueue.hpp"

namespace voicegraph {

/**
 * @brief Represents a single telemetry event.
 * Fixed-size to ensure RT-safety (no allocations).
 */
struct LogEntry {
    enum class Type {
        Message,
        Event
    };

    Type type = Type::Message;
    char tag[32] = {};      // Category or Tag
    float value = 0.0f;     // Numeric value (for Type::Event)
    char message[64] = {};  // Static message (for Type::Message)
    uint64_t sequence = 0;
};

/**
 * @brief RT-safe telemetry sink.
 *
 * The audio thread produces with log_message()/log_event(); one background
 * thread drains with pop_entry(). Entries are dropped when the queue is full.
 * Owned by whoever needs it, usually next to the engine it observes.
 */
class AudioLogger {
public:
    static constexpr size_t DEFAULT_CAPACITY = 1024;

    explicit AudioLogger(size_t capacity = DEFAULT_CAPACITY)
        : queue_(capacity)
    {
    }

    // Audio Thread Methods (RT-Safe)
    bool log_message(const char* tag, const char* msg) {
        LogEntry entry;
        entry.type = LogEntry::Type::Message;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        std::strncpy(entry.message, msg, sizeof(entry.message) - 1);
        return push(entry);
    }

    bool log_event(const char* tag, float value) {
        LogEntry entry;
        entry.type = LogEntry::Type::Event;
        std::strncpy(entry.tag, tag, sizeof(entry.tag) - 1);
        entry.value = value;
        return push(entry);
    }

    // Background Thread Methods
    std::optional<LogEntry> pop_entry() {
        return queue_.try_pop();
    }

    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    bool push(LogEntry& entry) {
        entry.sequence = next_sequence_++;
        if (!queue_.try_push(entry)) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }
        return true;
    }

    SpscQueue<LogEntry> queue_;
    uint64_t next_sequence_ = 0; // producer only
    std::atomic<uint64_t> dropped_{0};
};

} // namespace voicegraph
