// src/midi/sysex/notation.hpp
// Bar markers and time signatures sent as universal real-time messages.

#pragma once
#include <cstdint>
#include <vector>

#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

// Two's complement 14-bit bar number: the most negative value means the
// sequence is stopped, the most positive means running but unknown,
// other negatives count in.
struct BarMarker {
  enum class Kind { NotRunning, CountIn, Number, RunningUnknown };
  Kind kind = Kind::NotRunning;
  std::uint16_t bar = 0; // CountIn up to 8191, Number up to 8190

  static BarMarker not_running() { return {}; }
  static BarMarker count_in(std::uint16_t bars) {
    return {Kind::CountIn, bars};
  }
  static BarMarker number(std::uint16_t n) { return {Kind::Number, n}; }
  static BarMarker running_unknown() { return {Kind::RunningUnknown, 0}; }
};

inline bool operator==(const BarMarker &a, const BarMarker &b) {
  const bool numbered = a.kind == BarMarker::Kind::CountIn ||
                        a.kind == BarMarker::Kind::Number;
  return a.kind == b.kind && (!numbered || a.bar == b.bar);
}

void write_bar_marker(ByteVec &out, const BarMarker &m);
BarMarker read_bar_marker(Bytes &r);

// Denominator as a power of two: 0 = whole note ... 6 = 64th.
enum class BeatValue : std::uint8_t {
  Whole = 0,
  Half = 1,
  Quarter = 2,
  Eighth = 3,
  Sixteenth = 4,
  ThirtySecond = 5,
  SixtyFourth = 6
};

struct Signature {
  std::uint8_t beats = 4;
  std::uint8_t beat_value = static_cast<std::uint8_t>(BeatValue::Quarter);
};

inline bool operator==(const Signature &a, const Signature &b) {
  return a.beats == b.beats && a.beat_value == b.beat_value;
}

struct NotationTimeSignature {
  Signature signature;
  std::uint8_t midi_clocks_in_metronome_click = 24;
  std::uint8_t thirty_second_notes_in_midi_quarter_note = 8;
  std::vector<Signature> compound; // up to 61 further signatures
};

inline bool operator==(const NotationTimeSignature &a,
                       const NotationTimeSignature &b) {
  return a.signature == b.signature &&
         a.midi_clocks_in_metronome_click ==
             b.midi_clocks_in_metronome_click &&
         a.thirty_second_notes_in_midi_quarter_note ==
             b.thirty_second_notes_in_midi_quarter_note &&
         a.compound == b.compound;
}

// `ln nn dd qq [nn dd ...]`, ln counting the bytes that follow.
void write_notation_time_signature(ByteVec &out,
                                   const NotationTimeSignature &ts);
NotationTimeSignature read_notation_time_signature(Bytes &r);

} // namespace midi
