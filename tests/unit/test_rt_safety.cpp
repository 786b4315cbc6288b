#include <gtest/gtest.h>
#include "Logger.hpp"
#include "Patches.hpp"
#include "PolySynth.hpp"
#include "TestHelper.hpp"
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string>
#include <vector>

// Global allocation counting for this executable only. Counting is off
// except inside a HeapCounter scope.

namespace {

std::atomic<bool> g_counting{false};
std::atomic<size_t> g_allocations{0};
std::atomic<size_t> g_deallocations{0};

void* counted_alloc(std::size_t size) {
    if (g_counting.load(std::memory_order_relaxed)) {
        g_allocations.fetch_add(1, std::memory_order_relaxed);
    }
    if (void* p = std::malloc(size == 0 ? 1 : size)) {
        return p;
    }
    throw std::bad_alloc();
}

void counted_free(void* p) noexcept {
    if (p && g_counting.load(std::memory_order_relaxed)) {
        g_deallocations.fetch_add(1, std::memory_order_relaxed);
    }
    std::free(p);
}

} // namespace

void* operator new(std::size_t size) { return counted_alloc(size); }
void* operator new[](std::size_t size) { return counted_alloc(size); }
void operator delete(void* p) noexcept { counted_free(p); }
void operator delete[](void* p) noexcept { counted_free(p); }
void operator delete(void* p, std::size_t) noexcept { counted_free(p); }
void operator delete[](void* p, std::size_t) noexcept { counted_free(p); }

using namespace voicegraph;

namespace {

constexpr float SR = 48000.0f;

/**
 * @brief Counts heap calls between construction and stop().
 */
class HeapCounter {
public:
    HeapCounter() {
        g_allocations = 0;
        g_deallocations = 0;
        g_counting = true;
    }

    ~HeapCounter() { g_counting = false; }

    void stop() { g_counting = false; }

    size_t allocations() const { return g_allocations.load(); }
    size_t deallocations() const { return g_deallocations.load(); }
};

} // namespace

class RtSafetyTest : public ::testing::TestWithParam<std::string> {};

TEST_P(RtSafetyTest, RenderPathNeverTouchesTheHeap) {
    EngineConfig config;
    config.sample_rate = SR;
    config.max_polyphony = 3;
    AudioLogger telemetry;
    PolySynth synth(config, patches::factory(GetParam(), SR), &telemetry);
    std::vector<float> buffer(3000, 0.0f);

    bool all_pushed = true;
    float loudest = 0.0f;

    HeapCounter counter;
    for (int round = 0; round < 20; ++round) {
        const int root = 48 + (round % 12);
        // Four notes into three voices forces a steal every round
        for (int offset : {0, 4, 7, 11}) {
            all_pushed &= synth.try_push(ControlMessage::note_on(root + offset, 100));
        }
        synth.render(buffer);
        loudest = std::max(loudest, test::peak(buffer));

        all_pushed &= synth.try_push(ControlMessage::pitch_bend((round % 2 == 0) ? 150.0f : -150.0f));
        all_pushed &= synth.try_push(ControlMessage::note_off(root + 7));
        all_pushed &= synth.try_push(ControlMessage::note_off(root + 11));
        synth.render(buffer);

        if (round % 5 == 4) {
            all_pushed &= synth.try_push(ControlMessage::all_notes_off());
            synth.render(buffer);
        }
    }
    counter.stop();

    EXPECT_EQ(counter.allocations(), 0u);
    EXPECT_EQ(counter.deallocations(), 0u);
    EXPECT_TRUE(all_pushed);
    EXPECT_GT(loudest, 0.0f);

    size_t steals = 0;
    while (auto entry = telemetry.pop_entry()) {
        if (std::strcmp(entry->tag, "VoiceSteal") == 0) {
            ++steals;
        }
    }
    EXPECT_GE(steals, 20u);
}

INSTANTIATE_TEST_SUITE_P(FactoryPatches, RtSafetyTest, ::testing::ValuesIn(patches::names()),
                         [](const ::testing::TestParamInfo<std::string>& info) { return info.param; });

TEST(HeapCounterTest, SeesAllocationsWhileCounting) {
    HeapCounter counter;
    void* block = ::operator new(64);
    ::operator delete(block);
    counter.stop();
    EXPECT_EQ(counter.allocations(), 1u);
    EXPECT_EQ(counter.deallocations(), 1u);
}
