// src/midi/system_common.hpp
// System common messages (0xF1-0xF6) other than system exclusive.

#pragma once
#include <cstdint>
#include <variant>

#include "midi/primitives.hpp"
#include "midi/time_code.hpp"

struct Bytes;

namespace midi {

// One of the eight MTC quarter-frame pieces of time_code.
struct QuarterFrame {
  std::uint8_t index = 0; // 0-7
  TimeCode time_code;
};

struct SongPosition {
  std::uint16_t beats = 0; // MIDI beats (6 clocks) since song start
};

struct SongSelect {
  std::uint8_t song = 0;
};

struct TuneRequest {};

using SystemCommonMsg =
    std::variant<QuarterFrame, SongPosition, SongSelect, TuneRequest>;

inline bool operator==(const QuarterFrame &a, const QuarterFrame &b) {
  return a.index == b.index && a.time_code == b.time_code;
}
inline bool operator==(const SongPosition &a, const SongPosition &b) {
  return a.beats == b.beats;
}
inline bool operator==(const SongSelect &a, const SongSelect &b) {
  return a.song == b.song;
}
inline bool operator==(const TuneRequest &, const TuneRequest &) {
  return true;
}

void write_system_common(ByteVec &out, const SystemCommonMsg &msg);

// `status` has already been consumed. A quarter frame updates `clock` and
// the returned message carries the updated value.
SystemCommonMsg read_system_common(std::uint8_t status, Bytes &r,
                                   TimeCode &clock);

} // namespace midi
