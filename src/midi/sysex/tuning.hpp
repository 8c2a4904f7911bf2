// src/midi/sysex/tuning.hpp
// MIDI Tuning Standard payloads: single note changes, bulk dumps and
// scale/octave tunings.
//
// A note tuning is three bytes, semitone then a 14-bit fraction of a
// semitone sent MSB first. `7F 7F 7F` means "no change".

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

struct Tuning {
  std::uint8_t semitone = 0;
  std::uint16_t fraction = 0; // 1/16384ths of a semitone above `semitone`

  // Nearest tuning for a frequency in Hz. Below 8.1758 Hz (note 0) and
  // above 13289.73 Hz (note 127 + 16383) the range ends are returned.
  static Tuning from_freq(double hz);
};

inline bool operator==(const Tuning &a, const Tuning &b) {
  return a.semitone == b.semitone && a.fraction == b.fraction;
}
inline bool operator!=(const Tuning &a, const Tuning &b) { return !(a == b); }

// Empty optional is the "no change" sentinel.
void write_tuning(ByteVec &out, const std::optional<Tuning> &t);
std::optional<Tuning> read_tuning(Bytes &r);

// Channels 1..16 addressed by scale tunings, packed into three bytes:
// `000000 16 15`, `14..8`, `7..1`.
struct ChannelBitMap {
  std::uint16_t bits = 0; // bit n = channel n+1

  static ChannelBitMap all() { return ChannelBitMap{0xFFFF}; }
  static ChannelBitMap none() { return ChannelBitMap{}; }
  bool has(int channel_index) const { return (bits >> channel_index) & 1; }
  void set(int channel_index) {
    bits = static_cast<std::uint16_t>(bits | (1u << channel_index));
  }
};

inline bool operator==(const ChannelBitMap &a, const ChannelBitMap &b) {
  return a.bits == b.bits;
}

void write_channel_bit_map(ByteVec &out, const ChannelBitMap &m);
ChannelBitMap read_channel_bit_map(Bytes &r);

struct TuningNoteChange {
  std::uint8_t tuning_program_num = 0;
  std::optional<std::uint8_t> tuning_bank_num;
  // (key, tuning); at most 127 entries
  std::vector<std::pair<std::uint8_t, std::optional<Tuning>>> tunings;
};

inline bool operator==(const TuningNoteChange &a, const TuningNoteChange &b) {
  return a.tuning_program_num == b.tuning_program_num &&
         a.tuning_bank_num == b.tuning_bank_num && a.tunings == b.tunings;
}

// `pp nn (kk tt tt tt)*`; the bank byte is written by the caller.
void write_tuning_note_change(ByteVec &out, const TuningNoteChange &c);
TuningNoteChange read_tuning_note_change(Bytes &r,
                                         std::optional<std::uint8_t> bank);

using TuningName = std::array<std::uint8_t, 16>;

// Pad or truncate an ASCII name to 16 bytes.
TuningName tuning_name(const std::string &s);

struct KeyBasedTuningDump {
  std::uint8_t tuning_program_num = 0;
  std::optional<std::uint8_t> tuning_bank_num;
  TuningName name{};
  // One entry per key. Missing keys are written as equal temperament.
  std::vector<std::optional<Tuning>> tunings;
};

inline bool operator==(const KeyBasedTuningDump &a,
                       const KeyBasedTuningDump &b) {
  return a.tuning_program_num == b.tuning_program_num &&
         a.tuning_bank_num == b.tuning_bank_num && a.name == b.name &&
         a.tunings == b.tunings;
}

// `[bb] pp name*16 (tt tt tt)*128 cs`, checksum written as 0.
void write_key_based_tuning_dump(ByteVec &out, const KeyBasedTuningDump &d);
// Reads up to (not including) the checksum.
KeyBasedTuningDump read_key_based_tuning_dump(Bytes &r, bool with_bank);

struct ScaleTuningDump1Byte {
  std::uint8_t tuning_program_num = 0;
  std::uint8_t tuning_bank_num = 0;
  TuningName name{};
  std::array<std::int8_t, 12> tuning{}; // cents, -64..63
};

inline bool operator==(const ScaleTuningDump1Byte &a,
                       const ScaleTuningDump1Byte &b) {
  return a.tuning_program_num == b.tuning_program_num &&
         a.tuning_bank_num == b.tuning_bank_num && a.name == b.name &&
         a.tuning == b.tuning;
}

struct ScaleTuningDump2Byte {
  std::uint8_t tuning_program_num = 0;
  std::uint8_t tuning_bank_num = 0;
  TuningName name{};
  std::array<std::int16_t, 12> tuning{}; // -8192..8191, 0.012 cent steps
};

inline bool operator==(const ScaleTuningDump2Byte &a,
                       const ScaleTuningDump2Byte &b) {
  return a.tuning_program_num == b.tuning_program_num &&
         a.tuning_bank_num == b.tuning_bank_num && a.name == b.name &&
         a.tuning == b.tuning;
}

// `bb pp name*16 <12 tunings> cs`, checksum written as 0.
void write_scale_tuning_dump_1byte(ByteVec &out,
                                   const ScaleTuningDump1Byte &d);
void write_scale_tuning_dump_2byte(ByteVec &out,
                                   const ScaleTuningDump2Byte &d);
ScaleTuningDump1Byte read_scale_tuning_dump_1byte(Bytes &r);
ScaleTuningDump2Byte read_scale_tuning_dump_2byte(Bytes &r);

struct ScaleTuning1Byte {
  ChannelBitMap channels;
  std::array<std::int8_t, 12> tuning{};
};

inline bool operator==(const ScaleTuning1Byte &a, const ScaleTuning1Byte &b) {
  return a.channels == b.channels && a.tuning == b.tuning;
}

struct ScaleTuning2Byte {
  ChannelBitMap channels;
  std::array<std::int16_t, 12> tuning{};
};

inline bool operator==(const ScaleTuning2Byte &a, const ScaleTuning2Byte &b) {
  return a.channels == b.channels && a.tuning == b.tuning;
}

void write_scale_tuning_1byte(ByteVec &out, const ScaleTuning1Byte &t);
void write_scale_tuning_2byte(ByteVec &out, const ScaleTuning2Byte &t);
ScaleTuning1Byte read_scale_tuning_1byte(Bytes &r);
ScaleTuning2Byte read_scale_tuning_2byte(Bytes &r);

} // namespace midi
