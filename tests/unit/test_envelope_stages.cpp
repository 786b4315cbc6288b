#include <gtest/gtest.h>
#include "envelope/AdsrEnvelope.hpp"
#include <cmath>
#include <vector>

using namespace voicegraph;

namespace {

constexpr float SR = 48000.0f;

RenderContext ctx() {
    return RenderContext::from_frequency(SR, 440.0f, 1.0f);
}

std::vector<float> pull(AdsrEnvelope& env, size_t frames) {
    std::vector<float> buffer(frames);
    env.render_block(buffer, ctx());
    return buffer;
}

} // namespace

TEST(EnvelopeTest, IdleUntilTriggered) {
    AdsrEnvelope env;
    EXPECT_TRUE(env.is_finished());
    auto out = pull(env, 64);
    for (float v : out) {
        EXPECT_EQ(v, 0.0f);
    }
}

TEST(EnvelopeTest, AttackReachesPeakOnTimeAndNeverFalls) {
    const float attack = 0.01f;
    AdsrEnvelope env(attack, 0.1f, 0.7f, 0.3f);
    env.note_on(ctx());

    const size_t attack_samples = static_cast<size_t>(attack * SR);
    auto out = pull(env, attack_samples + 16);

    size_t first_peak = out.size();
    for (size_t i = 0; i < out.size(); ++i) {
        if (out[i] >= 1.0f) {
            first_peak = i;
            break;
        }
        if (i > 0) {
            EXPECT_GE(out[i], out[i - 1]) << "attack fell at sample " << i;
        }
    }
    ASSERT_LT(first_peak, out.size());
    // Sample index k holds the level after k + 1 steps.
    EXPECT_NEAR(static_cast<double>(first_peak + 1), attack_samples, 1.0);
    EXPECT_FLOAT_EQ(out[0], 1.0f / attack_samples);
}

TEST(EnvelopeTest, DecaysToSustain) {
    AdsrEnvelope env(0.001f, 0.01f, 0.5f, 0.1f);
    env.note_on(ctx());
    auto out = pull(env, 4800);

    EXPECT_EQ(env.state(), AdsrEnvelope::State::Sustain);
    EXPECT_FLOAT_EQ(out.back(), 0.5f);
    EXPECT_FALSE(env.is_finished());
}

TEST(EnvelopeTest, ReleaseIsMonotoneAndTimed) {
    const float release = 0.05f;
    AdsrEnvelope env(0.001f, 0.001f, 0.8f, release);
    env.note_on(ctx());
    pull(env, 2000);
    ASSERT_FLOAT_EQ(env.level(), 0.8f);

    env.note_off();
    EXPECT_TRUE(env.is_releasing());
    const size_t release_samples = static_cast<size_t>(std::lround(release * SR));
    EXPECT_EQ(env.release_samples(), release_samples);

    auto out = pull(env, release_samples + 32);
    size_t zero_at = out.size();
    for (size_t i = 0; i < out.size(); ++i) {
        if (i > 0) {
            EXPECT_LE(out[i], out[i - 1]) << "release rose at sample " << i;
        }
        if (out[i] == 0.0f && zero_at == out.size()) {
            zero_at = i;
        }
    }
    ASSERT_LT(zero_at, out.size());
    EXPECT_NEAR(static_cast<double>(zero_at + 1), release_samples, 1.0);
    EXPECT_TRUE(env.is_finished());
}

TEST(EnvelopeTest, ReleaseFromMidAttackStartsAtCurrentLevel) {
    AdsrEnvelope env(0.1f, 0.1f, 0.7f, 0.01f);
    env.note_on(ctx());
    pull(env, 480); // 10% of the attack
    const float level = env.level();
    ASSERT_NEAR(level, 0.1f, 1e-4f);

    env.note_off();
    auto out = pull(env, 1);
    EXPECT_LT(out[0], level);
    EXPECT_GT(out[0], level * 0.9f);
}

TEST(EnvelopeTest, NoteOffIsIdempotent) {
    AdsrEnvelope env(0.001f, 0.01f, 0.6f, 0.1f);

    // Idle: nothing happens
    env.note_off();
    EXPECT_EQ(env.state(), AdsrEnvelope::State::Idle);
    EXPECT_EQ(pull(env, 8)[7], 0.0f);

    env.note_on(ctx());
    pull(env, 2000);
    env.note_off();
    pull(env, 100);
    const float mid_release = env.level();

    // Second note_off neither raises the level nor restarts the release
    env.note_off();
    EXPECT_EQ(env.state(), AdsrEnvelope::State::Release);
    auto out = pull(env, 1);
    EXPECT_LT(out[0], mid_release);
}

TEST(EnvelopeTest, RetriggerIsContinuous) {
    AdsrEnvelope env(0.01f, 0.05f, 0.5f, 0.2f);
    env.note_on(ctx());
    pull(env, 4000);
    env.note_off();
    pull(env, 1000);
    const float before = env.level();
    ASSERT_GT(before, 0.0f);

    env.note_on(ctx());
    auto out = pull(env, 1);
    EXPECT_EQ(env.state(), AdsrEnvelope::State::Attack);
    EXPECT_GT(out[0], before);
    EXPECT_LT(out[0] - before, 2.0f / (0.01f * SR));
}

TEST(EnvelopeTest, ZeroTimesJumpToTargets) {
    AdsrEnvelope env(0.0f, 0.0f, 0.25f, 0.0f);
    env.note_on(ctx());
    auto out = pull(env, 3);
    EXPECT_EQ(out[0], 1.0f);
    EXPECT_EQ(out[1], 0.25f);
    EXPECT_EQ(out[2], 0.25f);

    env.note_off();
    EXPECT_TRUE(env.is_finished());
    EXPECT_EQ(env.level(), 0.0f);
}

TEST(EnvelopeTest, IgnoresAmplitude) {
    AdsrEnvelope env(0.0f, 0.0f, 1.0f, 0.1f);
    const auto quiet = RenderContext::from_frequency(SR, 440.0f, 0.1f);
    env.note_on(quiet);
    std::vector<float> out(4);
    env.render_block(out, quiet);
    EXPECT_EQ(out[3], 1.0f);
}
