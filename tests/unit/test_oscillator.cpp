#include <gtest/gtest.h>
#include "oscillator/Oscillator.hpp"
#include "oscillator/PhaseAccumulator.hpp"
#include "TestHelper.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

using namespace voicegraph;

class OscillatorTest : public ::testing::Test {
protected:
    const float sample_rate = 48000.0f;
    const size_t block_size = 512;

    RenderContext ctx(float frequency, float amplitude = 1.0f) const {
        return RenderContext::from_frequency(sample_rate, frequency, amplitude);
    }
};

TEST(PhaseAccumulatorTest, StaysInUnitInterval) {
    const std::vector<double> increments = {0.0, 1e-9, 0.001, 0.1, 0.25, 0.3333333, 0.4999999, 0.5,
                                            0.75, 0.999999, 1.0, 1.5, -0.1, -2.25, 1e6 + 0.37};
    for (double inc : increments) {
        PhaseAccumulator phase;
        phase.set_increment(inc);
        for (int i = 0; i < 10000; ++i) {
            const double t = phase.advance();
            ASSERT_GE(t, 0.0) << "increment " << inc;
            ASSERT_LT(t, 1.0) << "increment " << inc;
        }
        EXPECT_GE(phase.phase(), 0.0);
        EXPECT_LT(phase.phase(), 1.0);
    }
}

TEST_F(OscillatorTest, SineMatchesAnalytic) {
    Oscillator osc(Waveform::Sine);
    const float freq = 440.0f;
    auto c = ctx(freq);
    osc.note_on(c);

    std::vector<float> buffer(block_size);
    osc.render_block(buffer, c);

    for (size_t n = 0; n < block_size; ++n) {
        const double expected = std::sin(2.0 * std::numbers::pi * freq * n / sample_rate);
        EXPECT_NEAR(buffer[n], expected, 1e-6) << "sample " << n;
    }
}

TEST_F(OscillatorTest, PhaseContinuesAcrossBlocks) {
    Oscillator split(Waveform::Sine);
    Oscillator whole(Waveform::Sine);
    auto c = ctx(1000.0f);

    std::vector<float> a(1000);
    std::vector<float> b(1000);
    whole.render_block(a, c);
    split.render_block(std::span<float>(b).subspan(0, 333), c);
    split.render_block(std::span<float>(b).subspan(333), c);

    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_FLOAT_EQ(a[i], b[i]);
    }
}

TEST_F(OscillatorTest, BandLimitedShapesStayInRange) {
    for (Waveform w : {Waveform::Saw, Waveform::Square, Waveform::Triangle}) {
        Oscillator osc(w);
        std::vector<float> buffer(4096);
        osc.render_block(buffer, ctx(1234.5f));

        EXPECT_TRUE(test::all_finite(buffer));
        EXPECT_LE(test::peak(buffer), 1.05f);
        EXPECT_GT(test::rms(buffer), 0.3f);
    }
}

TEST_F(OscillatorTest, SawIsSmoothedAtWrap) {
    // With PolyBLEP the jump at the wrap is split over neighbouring samples,
    // so no single step reaches the naive 2.0 drop.
    Oscillator osc(Waveform::Saw);
    std::vector<float> buffer(2048);
    osc.render_block(buffer, ctx(3000.0f));

    float largest_step = 0.0f;
    for (size_t i = 1; i < buffer.size(); ++i) {
        largest_step = std::max(largest_step, std::abs(buffer[i] - buffer[i - 1]));
    }
    EXPECT_LT(largest_step, 1.9f);
}

TEST_F(OscillatorTest, AmplitudeScalesOutput) {
    Oscillator full(Waveform::Square);
    Oscillator half(Waveform::Square);
    std::vector<float> a(block_size);
    std::vector<float> b(block_size);
    full.render_block(a, ctx(200.0f, 1.0f));
    half.render_block(b, ctx(200.0f, 0.5f));

    for (size_t i = 0; i < block_size; ++i) {
        EXPECT_NEAR(b[i], 0.5f * a[i], 1e-6f);
    }
}

TEST_F(OscillatorTest, NoiseIsDeterministicPerSeed) {
    Oscillator a(Waveform::Noise);
    Oscillator b(Waveform::Noise);
    Oscillator c(Waveform::Noise);
    a.set_seed(42);
    b.set_seed(42);
    c.set_seed(7);

    std::vector<float> buf_a(block_size);
    std::vector<float> buf_b(block_size);
    std::vector<float> buf_c(block_size);
    a.render_block(buf_a, ctx(440.0f));
    b.render_block(buf_b, ctx(440.0f));
    c.render_block(buf_c, ctx(440.0f));

    EXPECT_EQ(buf_a, buf_b);
    EXPECT_NE(buf_a, buf_c);
    EXPECT_LE(test::peak(buf_a), 1.0f);

    // reset() rewinds to the seed
    a.reset();
    std::vector<float> again(block_size);
    a.render_block(again, ctx(440.0f));
    EXPECT_EQ(again, buf_b);
}

TEST_F(OscillatorTest, FixedFrequencyIgnoresContext) {
    Oscillator fixed(Waveform::Sine, 100.0f);
    EXPECT_DOUBLE_EQ(fixed.effective_frequency(ctx(880.0f)), 100.0);

    fixed.set_fixed_frequency(0.0f);
    EXPECT_NEAR(fixed.effective_frequency(ctx(880.0f)), 880.0, 1e-3);
}

TEST_F(OscillatorTest, DetuneShiftsPitch) {
    Oscillator osc(Waveform::Sine, 0.0f, 1200.0f);
    EXPECT_NEAR(osc.effective_frequency(ctx(220.0f)), 440.0, 1e-3);

    osc.set_detune(5000.0f); // clamped to one octave
    EXPECT_FLOAT_EQ(osc.parameter(Parameter::Detune), Oscillator::MAX_DETUNE_CENTS);
}

TEST_F(OscillatorTest, FrequencyClampedToNyquist) {
    Oscillator osc(Waveform::Sine);
    osc.modulate(Parameter::Frequency, 1e6f);
    EXPECT_DOUBLE_EQ(osc.effective_frequency(ctx(440.0f)), sample_rate / 2.0);

    osc.modulate(Parameter::Frequency, -1e6f);
    EXPECT_DOUBLE_EQ(osc.effective_frequency(ctx(440.0f)), 0.0);
}

TEST_F(OscillatorTest, NoteOnRestartsPhase) {
    Oscillator osc(Waveform::Sine);
    std::vector<float> first(block_size);
    std::vector<float> second(block_size);
    auto c = ctx(440.0f);

    osc.render_block(first, c);
    EXPECT_GT(osc.phase(), 0.0);
    osc.note_on(c);
    EXPECT_DOUBLE_EQ(osc.phase(), 0.0);
    osc.render_block(second, c);

    EXPECT_EQ(first, second);
}
