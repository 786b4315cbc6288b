/**
 * @file Patches.cpp
 * @brief Signal paths of the factory patches.
 */

#include "Patches.hpp"
#include <stdexcept>
#include <utility>
#include "DelayLine.hpp"
#include "envelope/AdsrEnvelope.hpp"
#include "filter/StateVariableFilter.hpp"
#include "fx/Chorus.hpp"
#include "fx/Distortion.hpp"
#include "fx/Reverb.hpp"
#include "oscillator/Lfo.hpp"
#include "oscillator/Oscillator.hpp"
#include "routing/Amplify.hpp"
#include "routing/Mix.hpp"
#include "routing/Modulate.hpp"
#include "routing/Through.hpp"

namespace voicegraph::patches {

namespace {

using NodePtr = std::unique_ptr<SignalNode>;
using Mode = StateVariableFilter::Mode;

NodePtr osc(Waveform waveform, float fixed_frequency = 0.0f, float detune_cents = 0.0f) {
    return std::make_unique<Oscillator>(waveform, fixed_frequency, detune_cents);
}

NodePtr adsr(float a, float d, float s, float r) {
    return std::make_unique<AdsrEnvelope>(a, d, s, r);
}

NodePtr svf(Mode mode, float cutoff, float resonance) {
    return std::make_unique<StateVariableFilter>(mode, cutoff, resonance);
}

NodePtr amplify(NodePtr a, NodePtr b) {
    return std::make_unique<Amplify>(std::move(a), std::move(b));
}

NodePtr through(NodePtr a, NodePtr b) {
    return std::make_unique<Through>(std::move(a), std::move(b));
}

NodePtr sine() {
    return amplify(osc(Waveform::Sine), adsr(0.01f, 0.1f, 0.7f, 0.3f));
}

// Two saws 7 cents apart into an LFO-swept lowpass.
NodePtr lead() {
    auto saws = std::make_unique<Mix>(osc(Waveform::Saw), osc(Waveform::Saw, 0.0f, 7.0f), 0.5f, 0.5f);
    auto filter = std::make_unique<Modulate>(svf(Mode::LowPass, 1800.0f, 0.3f),
                                             std::make_unique<Lfo>(5.0f, Waveform::Sine),
                                             Parameter::Cutoff, 600.0f);
    return amplify(through(std::move(saws), std::move(filter)), adsr(0.01f, 0.2f, 0.6f, 0.3f));
}

NodePtr bass() {
    return amplify(through(osc(Waveform::Square), svf(Mode::LowPass, 400.0f, 0.7f)),
                   adsr(0.005f, 0.15f, 0.5f, 0.1f));
}

NodePtr pluck(float sample_rate) {
    auto echo = std::make_unique<DelayLine>(sample_rate, 1.0f, 0.18f, 0.4f, 0.35f);
    return amplify(through(osc(Waveform::Triangle), std::move(echo)), adsr(0.002f, 0.25f, 0.0f, 0.1f));
}

NodePtr pad() {
    std::vector<NodePtr> saws;
    saws.push_back(osc(Waveform::Saw, 0.0f, -10.0f));
    saws.push_back(osc(Waveform::Saw));
    saws.push_back(osc(Waveform::Saw, 0.0f, 10.0f));
    auto stack = std::make_unique<Mix>(std::move(saws), std::vector<float>{0.33f, 0.33f, 0.33f});
    return amplify(through(std::move(stack), svf(Mode::LowPass, 2000.0f, 0.2f)),
                   adsr(0.6f, 0.5f, 0.8f, 1.2f));
}

// Fixed 50 Hz body with a fast downward pitch sweep.
NodePtr kick() {
    auto body = std::make_unique<Modulate>(osc(Waveform::Sine, 50.0f), adsr(0.0f, 0.05f, 0.0f, 0.05f),
                                           Parameter::Frequency, 150.0f);
    return amplify(std::move(body), adsr(0.001f, 0.3f, 0.0f, 0.1f));
}

NodePtr hihat() {
    return amplify(through(osc(Waveform::Noise), svf(Mode::HighPass, 7000.0f, 0.2f)),
                   adsr(0.001f, 0.05f, 0.0f, 0.03f));
}

NodePtr fuzz() {
    auto driven = through(osc(Waveform::Saw), std::make_unique<Distortion>(Distortion::Curve::SoftClip, 4.0f));
    return amplify(through(std::move(driven), svf(Mode::LowPass, 3000.0f, 0.1f)),
                   adsr(0.01f, 0.1f, 0.8f, 0.2f));
}

// Saw pair through a slow chorus, softened by a lowpass.
NodePtr strings(float sample_rate) {
    auto saws = std::make_unique<Mix>(osc(Waveform::Saw), osc(Waveform::Saw, 0.0f, 5.0f), 0.5f, 0.5f);
    auto chorus = std::make_unique<Chorus>(sample_rate, 0.8f, 2.5f, 0.45f);
    auto wide = through(std::move(saws), std::move(chorus));
    return amplify(through(std::move(wide), svf(Mode::LowPass, 2500.0f, 0.1f)),
                   adsr(0.3f, 0.3f, 0.8f, 0.8f));
}

NodePtr bell(float sample_rate) {
    auto room = std::make_unique<Reverb>(sample_rate, 0.6f, 0.4f, 0.3f);
    return amplify(through(osc(Waveform::Sine), std::move(room)), adsr(0.002f, 0.8f, 0.0f, 0.6f));
}

} // namespace

const std::vector<std::string>& names() {
    static const std::vector<std::string> all = {
        "sine", "lead", "bass", "pluck", "pad", "kick", "hihat", "fuzz", "strings", "bell"
    };
    return all;
}

std::unique_ptr<SignalNode> make(const std::string& name, float sample_rate) {
    if (name == "sine") return sine();
    if (name == "lead") return lead();
    if (name == "bass") return bass();
    if (name == "pluck") return pluck(sample_rate);
    if (name == "pad") return pad();
    if (name == "kick") return kick();
    if (name == "hihat") return hihat();
    if (name == "fuzz") return fuzz();
    if (name == "strings") return strings(sample_rate);
    if (name == "bell") return bell(sample_rate);
    throw std::invalid_argument("patches: unknown patch '" + name + "'");
}

PatchFactory factory(const std::string& name, float sample_rate) {
    // Fail here rather than inside the PolySynth constructor loop.
    make(name, sample_rate);
    return [name, sample_rate]() { return make(name, sample_rate); };
}

} // namespace voicegraph::patches
