/**
 * @file ControlMessage.hpp
 * @brief Note and performance events carried from the control thread to the audio thread.
 */

#ifndef VOICEGRAPH_CONTROL_MESSAGE_HPP
#define VOICEGRAPH_CONTROL_MESSAGE_HPP

#include <algorithm>
#include <cstdint>

namespace voicegraph {

/**
 * @brief Plain-value control event.
 *
 * Fields are validated by the factory functions, so the render thread can
 * consume them without further checks.
 */
struct ControlMessage {
    enum class Type : uint8_t {
        NoteOn,
        NoteOff,
        AllNotesOff,
        PitchBend
    };

    static constexpr float MAX_BEND_CENTS = 2400.0f;

    Type type = Type::NoteOff;
    uint8_t note = 0;      // 0-127
    uint8_t velocity = 0;  // 0-127
    float cents = 0.0f;    // PitchBend only

    static ControlMessage note_on(int note, int velocity) {
        ControlMessage msg;
        msg.type = Type::NoteOn;
        msg.note = static_cast<uint8_t>(std::clamp(note, 0, 127));
        msg.velocity = static_cast<uint8_t>(std::clamp(velocity, 0, 127));
        return msg;
    }

    static ControlMessage note_off(int note) {
        ControlMessage msg;
        msg.type = Type::NoteOff;
        msg.note = static_cast<uint8_t>(std::clamp(note, 0, 127));
        return msg;
    }

    static ControlMessage all_notes_off() {
        ControlMessage msg;
        msg.type = Type::AllNotesOff;
        return msg;
    }

    static ControlMessage pitch_bend(float cents) {
        ControlMessage msg;
        msg.type = Type::PitchBend;
        msg.cents = std::clamp(cents, -MAX_BEND_CENTS, MAX_BEND_CENTS);
        return msg;
    }
};

} // namespace voicegraph

#endif // VOICEGRAPH_CONTROL_MESSAGE_HPP
