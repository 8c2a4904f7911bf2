// src/midi/channel_voice.hpp
// Channel voice messages: notes, pressure, CC, program change, pitch bend.
// The high resolution note forms travel as a note message followed by a
// CC 88 carrying the velocity LSB on the same channel.

#pragma once
#include <cstdint>
#include <optional>
#include <variant>

#include "midi/channel.hpp"
#include "midi/control_change.hpp"
#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

struct NoteOff {
  std::uint8_t note = 0;
  std::uint8_t velocity = 0;
};

struct NoteOn {
  std::uint8_t note = 0;
  std::uint8_t velocity = 0;
};

struct HighResNoteOff {
  std::uint8_t note = 0;
  std::uint16_t velocity = 0; // 0-16383
};

struct HighResNoteOn {
  std::uint8_t note = 0;
  std::uint16_t velocity = 0; // 0-16383
};

struct PolyPressure {
  std::uint8_t note = 0;
  std::uint8_t pressure = 0;
};

struct ControlChange {
  Control control;
};

struct ChannelPressure {
  std::uint8_t pressure = 0;
};

struct ProgramChange {
  std::uint8_t program = 0;
};

// 8192 is centre.
struct PitchBend {
  std::uint16_t bend = 8192;
};

using ChannelVoiceMsg =
    std::variant<NoteOff, NoteOn, HighResNoteOff, HighResNoteOn, PolyPressure,
                 ControlChange, ChannelPressure, ProgramChange, PitchBend>;

bool operator==(const NoteOff &a, const NoteOff &b);
bool operator==(const NoteOn &a, const NoteOn &b);
bool operator==(const HighResNoteOff &a, const HighResNoteOff &b);
bool operator==(const HighResNoteOn &a, const HighResNoteOn &b);
bool operator==(const PolyPressure &a, const PolyPressure &b);
bool operator==(const ControlChange &a, const ControlChange &b);
bool operator==(const ChannelPressure &a, const ChannelPressure &b);
bool operator==(const ProgramChange &a, const ProgramChange &b);
bool operator==(const PitchBend &a, const PitchBend &b);

// High nibble of the status byte: 0x8..0xE.
std::uint8_t voice_status_nibble(const ChannelVoiceMsg &msg);

// Status byte (unless running) and data bytes. High resolution notes
// append `0xBn 0x58 lsb`.
void write_channel_voice(ByteVec &out, Channel ch, const ChannelVoiceMsg &msg,
                         bool running);

// Data bytes for the given status nibble. For 0xB the controller number
// must be below 120 (channel mode is handled separately).
ChannelVoiceMsg read_channel_voice(std::uint8_t nibble, Bytes &r,
                                   bool complex_cc);

// Number of data bytes that follow a status with this high nibble.
int channel_data_length(std::uint8_t nibble);

// Combine a note with a velocity LSB. Empty for non-note messages.
std::optional<ChannelVoiceMsg> with_velocity_lsb(const ChannelVoiceMsg &note,
                                                 std::uint8_t lsb);

inline bool is_note(const ChannelVoiceMsg &msg) {
  return std::holds_alternative<NoteOn>(msg) ||
         std::holds_alternative<NoteOff>(msg);
}

} // namespace midi
