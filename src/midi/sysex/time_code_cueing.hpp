// src/midi/sysex/time_code_cueing.hpp
// MIDI cueing: real-time cue events (universal real-time 05 nn) and the
// cue list setup messages (universal non-real-time 04 nn).

#pragma once
#include <cstdint>
#include <vector>

#include "midi/primitives.hpp"
#include "midi/time_code.hpp"

struct Bytes;

namespace midi {

enum class CueingType : std::uint8_t {
  Special = 0x00,
  PunchIn = 0x01,
  PunchOut = 0x02,
  DeletePunchIn = 0x03,
  DeletePunchOut = 0x04,
  EventStart = 0x05,
  EventStop = 0x06,
  EventStartWithInfo = 0x07,
  EventStopWithInfo = 0x08,
  DeleteEventStart = 0x09,
  DeleteEventStop = 0x0A,
  CuePoint = 0x0B,
  CuePointWithInfo = 0x0C,
  DeleteCuePoint = 0x0D,
  EventName = 0x0E
};

// Sent at the moment the cue happens.
struct TimeCodeCueing {
  CueingType type = CueingType::CuePoint;
  std::uint16_t event_number = 0;
  // Raw 8-bit info; travels as nibbles, low nibble first.
  std::vector<std::uint8_t> additional_info;
};

// Loads a cue at a given time ahead of playback.
struct TimeCodeCueingSetup {
  CueingType type = CueingType::CuePoint;
  HighResTimeCode time_code;
  std::uint16_t event_number = 0;
  std::vector<std::uint8_t> additional_info;
};

inline bool operator==(const TimeCodeCueing &a, const TimeCodeCueing &b) {
  return a.type == b.type && a.event_number == b.event_number &&
         a.additional_info == b.additional_info;
}
inline bool operator==(const TimeCodeCueingSetup &a,
                       const TimeCodeCueingSetup &b) {
  return a.type == b.type && a.time_code == b.time_code &&
         a.event_number == b.event_number &&
         a.additional_info == b.additional_info;
}

// Bodies start at the type byte (nn); the 05 / 04 sub-id is the caller's.
void write_time_code_cueing(ByteVec &out, const TimeCodeCueing &c);
TimeCodeCueing read_time_code_cueing(Bytes &r);
void write_time_code_cueing_setup(ByteVec &out, const TimeCodeCueingSetup &c);
TimeCodeCueingSetup read_time_code_cueing_setup(Bytes &r);

} // namespace midi
