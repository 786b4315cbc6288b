#include <gtest/gtest.h>
#include "Logger.hpp"
#include "Patches.hpp"
#include "PolySynth.hpp"
#include "Voice.hpp"
#include "TestHelper.hpp"
#include <cstring>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace voicegraph;

namespace {

EngineConfig config_with(size_t polyphony) {
    EngineConfig config;
    config.sample_rate = 48000.0f;
    config.max_polyphony = polyphony;
    return config;
}

void render_block(PolySynth& synth, size_t frames = 64) {
    std::vector<float> buffer(frames);
    synth.render(buffer);
}

} // namespace

TEST(VoiceTest, LifecycleFollowsTree) {
    auto node = std::make_unique<test::ConstantNode>(1.0f);
    auto* node_ptr = node.get();
    Voice voice(3, std::move(node));
    EXPECT_EQ(voice.slot(), 3u);
    EXPECT_TRUE(voice.is_free());

    voice.start(60, 100, 1, RenderContext::from_note(48000.0f, 60, 100));
    EXPECT_EQ(voice.state(), Voice::State::Active);
    EXPECT_EQ(voice.note(), 60);
    EXPECT_EQ(node_ptr->note_ons, 1);
    EXPECT_FALSE(voice.retire_if_finished());

    voice.release();
    voice.release();
    EXPECT_EQ(voice.state(), Voice::State::Releasing);
    EXPECT_EQ(node_ptr->note_offs, 1);

    node_ptr->set_finished(true);
    EXPECT_TRUE(voice.retire_if_finished());
    EXPECT_TRUE(voice.is_free());
    EXPECT_EQ(voice.note(), -1);
}

TEST(VoiceTest, ContextAppliesPitchRatio) {
    Voice voice(0, std::make_unique<test::ConstantNode>(1.0f));
    voice.start(57, 127, 1, RenderContext::from_note(48000.0f, 57, 127));
    const auto ctx = voice.context(48000.0f, 2.0f, 32);
    EXPECT_FLOAT_EQ(ctx.frequency, 440.0f);
    EXPECT_FLOAT_EQ(ctx.amplitude, 1.0f);
    EXPECT_EQ(ctx.block_size, 32u);
}

TEST(VoiceTest, NullTreeThrows) {
    EXPECT_THROW(Voice(0, nullptr), std::invalid_argument);
}

TEST(VoiceStressTest, StealingWithOneVoiceKeepsNewestNote) {
    PolySynth synth(config_with(1), patches::factory("sine", 48000.0f));
    synth.try_push(ControlMessage::note_on(60, 100));
    synth.try_push(ControlMessage::note_on(64, 100));
    render_block(synth);

    EXPECT_EQ(synth.voice_state(0), Voice::State::Active);
    EXPECT_EQ(synth.voice_note(0), 64);
    EXPECT_EQ(synth.active_voice_count(), 1u);
}

TEST(VoiceStressTest, LruStealing) {
    AudioLogger telemetry;
    PolySynth synth(config_with(16), patches::factory("sine", 48000.0f), &telemetry);

    // 1. Fill all 16 voices
    for (int i = 0; i < 16; ++i) {
        synth.try_push(ControlMessage::note_on(60 + i, 64));
    }
    render_block(synth);
    EXPECT_EQ(synth.count_in_state(Voice::State::Active), 16u);

    // 2. Trigger one more note (should steal note 60, the oldest)
    synth.try_push(ControlMessage::note_on(80, 64));
    render_block(synth);

    bool note_60_found = false;
    bool note_80_found = false;
    for (size_t i = 0; i < synth.max_polyphony(); ++i) {
        if (synth.voice_note(i) == 60) note_60_found = true;
        if (synth.voice_note(i) == 80) note_80_found = true;
    }
    EXPECT_FALSE(note_60_found);
    EXPECT_TRUE(note_80_found);
    EXPECT_EQ(synth.voice_note(0), 80);

    auto entry = telemetry.pop_entry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->type, LogEntry::Type::Event);
    EXPECT_STREQ(entry->tag, "VoiceSteal");
    EXPECT_EQ(entry->value, 60.0f);
    EXPECT_FALSE(telemetry.pop_entry().has_value());
}

TEST(VoiceStressTest, ReleasePriorityStealing) {
    PolySynth synth(config_with(16), patches::factory("sine", 48000.0f));

    // Fill voices
    for (int i = 0; i < 16; ++i) {
        synth.try_push(ControlMessage::note_on(60 + i, 64));
    }
    // Put note 65 into release
    synth.try_push(ControlMessage::note_off(65));

    // Even if 60 is oldest, 65 is releasing and should be stolen first
    synth.try_push(ControlMessage::note_on(90, 64));
    render_block(synth);

    bool note_65_found = false;
    bool note_60_found = false;
    bool note_90_found = false;
    for (size_t i = 0; i < synth.max_polyphony(); ++i) {
        if (synth.voice_note(i) == 65) note_65_found = true;
        if (synth.voice_note(i) == 60) note_60_found = true;
        if (synth.voice_note(i) == 90) note_90_found = true;
    }
    EXPECT_FALSE(note_65_found);
    EXPECT_TRUE(note_60_found);
    EXPECT_TRUE(note_90_found);
    EXPECT_EQ(synth.voice_note(5), 90);
    EXPECT_EQ(synth.voice_state(5), Voice::State::Active);
}

TEST(VoiceStressTest, OldestReleasingVoiceIsStolenFirst) {
    PolySynth synth(config_with(4), patches::factory("sine", 48000.0f));
    for (int i = 0; i < 4; ++i) {
        synth.try_push(ControlMessage::note_on(60 + i, 64));
    }
    synth.try_push(ControlMessage::note_off(63));
    synth.try_push(ControlMessage::note_off(61));
    synth.try_push(ControlMessage::note_on(70, 64));
    render_block(synth);

    // 61 started before 63, so it goes first regardless of release order
    EXPECT_EQ(synth.voice_note(1), 70);
    EXPECT_EQ(synth.voice_note(3), 63);
    EXPECT_EQ(synth.voice_state(3), Voice::State::Releasing);
}

TEST(VoiceStressTest, LowestFreeVoiceIsUsed) {
    PolySynth synth(config_with(4), patches::factory("sine", 48000.0f));
    synth.try_push(ControlMessage::note_on(60, 64));
    synth.try_push(ControlMessage::note_on(62, 64));
    render_block(synth);
    EXPECT_EQ(synth.voice_note(0), 60);
    EXPECT_EQ(synth.voice_note(1), 62);
    EXPECT_EQ(synth.voice_state(2), Voice::State::Free);
    EXPECT_LT(synth.voice_age(0), synth.voice_age(1));
}

TEST(VoiceStressTest, UnmatchedNoteOffIsIgnored) {
    AudioLogger telemetry;
    PolySynth synth(config_with(4), patches::factory("sine", 48000.0f), &telemetry);
    synth.try_push(ControlMessage::note_on(60, 64));
    synth.try_push(ControlMessage::note_off(61));
    render_block(synth);

    EXPECT_EQ(synth.voice_state(0), Voice::State::Active);
    EXPECT_EQ(synth.active_voice_count(), 1u);
    EXPECT_FALSE(telemetry.pop_entry().has_value());
}

TEST(VoiceStressTest, DuplicateNoteReleasesOldestFirst) {
    PolySynth synth(config_with(4), patches::factory("sine", 48000.0f));
    synth.try_push(ControlMessage::note_on(60, 64));
    synth.try_push(ControlMessage::note_on(60, 64));
    synth.try_push(ControlMessage::note_off(60));
    render_block(synth);

    EXPECT_EQ(synth.voice_state(0), Voice::State::Releasing);
    EXPECT_EQ(synth.voice_state(1), Voice::State::Active);
}
