/**
 * @file PolySynth.cpp
 * @brief Implementation of the polyphonic engine with voice stealing.
 */

#include "PolySynth.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace voicegraph {

namespace {

const EngineConfig& validated(const EngineConfig& config) {
    config.validate();
    return config;
}

} // namespace

PolySynth::PolySynth(const EngineConfig& config, const PatchFactory& factory, AudioLogger* telemetry)
    : config_(validated(config))
    , channel_(config.channel_capacity)
    , scratch_(config.max_block_size, 0.0f)
    , telemetry_(telemetry)
{
    if (!factory) {
        throw std::invalid_argument("PolySynth: patch factory must not be empty");
    }

    voices_.reserve(config_.max_polyphony);
    for (size_t i = 0; i < config_.max_polyphony; ++i) {
        voices_.emplace_back(i, factory());
    }
}

bool PolySynth::try_push(const ControlMessage& message) {
    return channel_.try_push(message);
}

void PolySynth::render(std::span<float> output) {
    profiler_.start();

    drain_messages();

    size_t offset = 0;
    while (offset < output.size()) {
        const size_t frames = std::min(config_.max_block_size, output.size() - offset);
        std::span<float> chunk = output.subspan(offset, frames);
        std::span<float> voice_span(scratch_.data(), frames);

        std::fill(chunk.begin(), chunk.end(), 0.0f);

        for (auto& voice : voices_) {
            if (voice.is_free()) {
                continue;
            }
            voice.render(voice_span, config_.sample_rate, bend_ratio_);
            for (size_t j = 0; j < frames; ++j) {
                chunk[j] += voice_span[j];
            }
            voice.retire_if_finished();
        }

        offset += frames;
    }

    if (config_.master_gain != 1.0f) {
        for (auto& sample : output) {
            sample *= config_.master_gain;
        }
    }

    profiler_.stop();
}

void PolySynth::reset() {
    while (channel_.try_pop()) {}
    for (auto& voice : voices_) {
        voice.reset();
    }
    timestamp_counter_ = 0;
    set_pitch_bend(0.0f);
}

size_t PolySynth::active_voice_count() const {
    return static_cast<size_t>(std::count_if(voices_.begin(), voices_.end(),
                                             [](const Voice& v) { return !v.is_free(); }));
}

size_t PolySynth::count_in_state(Voice::State state) const {
    return static_cast<size_t>(std::count_if(voices_.begin(), voices_.end(),
                                             [state](const Voice& v) { return v.state() == state; }));
}

void PolySynth::drain_messages() {
    // Bounded so a flooding producer cannot starve the render.
    const size_t limit = channel_.capacity();
    for (size_t i = 0; i < limit; ++i) {
        auto message = channel_.try_pop();
        if (!message) {
            break;
        }
        handle(*message);
    }
}

void PolySynth::handle(const ControlMessage& message) {
    switch (message.type) {
        case ControlMessage::Type::NoteOn:
            note_on(message.note, message.velocity);
            break;
        case ControlMessage::Type::NoteOff:
            note_off(message.note);
            break;
        case ControlMessage::Type::AllNotesOff:
            all_notes_off();
            break;
        case ControlMessage::Type::PitchBend:
            set_pitch_bend(message.cents);
            break;
    }
}

void PolySynth::note_on(int note, int velocity) {
    bool stolen = false;
    const size_t index = allocate_voice(stolen);
    auto& voice = voices_[index];

    if (stolen && telemetry_) {
        telemetry_->log_event("VoiceSteal", static_cast<float>(voice.note()));
    }

    RenderContext ctx = RenderContext::from_note(config_.sample_rate, note, velocity);
    ctx = ctx.with_frequency(ctx.frequency * bend_ratio_);
    voice.start(note, velocity, next_timestamp(), ctx);
}

void PolySynth::note_off(int note) {
    // Oldest Active voice holding this note; unmatched NoteOff is ignored.
    Voice* target = nullptr;
    for (auto& voice : voices_) {
        if (voice.state() == Voice::State::Active && voice.note() == note) {
            if (target == nullptr || voice.age() < target->age()) {
                target = &voice;
            }
        }
    }
    if (target != nullptr) {
        target->release();
    }
}

void PolySynth::all_notes_off() {
    for (auto& voice : voices_) {
        voice.release();
    }
}

void PolySynth::set_pitch_bend(float cents) {
    bend_cents_ = std::clamp(cents, -ControlMessage::MAX_BEND_CENTS, ControlMessage::MAX_BEND_CENTS);
    bend_ratio_ = static_cast<float>(std::pow(2.0, bend_cents_ / 1200.0));
}

size_t PolySynth::allocate_voice(bool& stolen) const {
    stolen = false;

    // 1. Lowest-index Free voice
    for (size_t i = 0; i < voices_.size(); ++i) {
        if (voices_[i].is_free()) {
            return i;
        }
    }

    stolen = true;

    // 2. Oldest Releasing voice, 3. otherwise oldest Active voice
    for (Voice::State state : {Voice::State::Releasing, Voice::State::Active}) {
        size_t candidate = voices_.size();
        uint64_t oldest_time = std::numeric_limits<uint64_t>::max();
        for (size_t i = 0; i < voices_.size(); ++i) {
            if (voices_[i].state() == state && voices_[i].age() < oldest_time) {
                oldest_time = voices_[i].age();
                candidate = i;
            }
        }
        if (candidate != voices_.size()) {
            return candidate;
        }
    }

    // Unreachable: with no Free voice every voice is Active or Releasing.
    return 0;
}

} // namespace voicegraph
