// src/midi/sysex/machine_control.hpp
// MIDI Machine Control commands (universal real-time sub-id 06).
// Transport commands and LOCATE are decoded; everything else is carried
// as raw command bytes.

#pragma once
#include <cstdint>
#include <variant>
#include <vector>

#include "midi/primitives.hpp"
#include "midi/time_code.hpp"

struct Bytes;

namespace midi {

enum class MachineCommand : std::uint8_t {
  Stop = 0x01,
  Play = 0x02,
  DeferredPlay = 0x03,
  FastForward = 0x04,
  Rewind = 0x05,
  RecordStrobe = 0x06,
  RecordExit = 0x07,
  RecordPause = 0x08,
  Pause = 0x09,
  Eject = 0x0A,
  Chase = 0x0B,
  CommandErrorReset = 0x0C,
  MmcReset = 0x0D,
  Wait = 0x7C,
  Resume = 0x7F
};

enum class InformationField : std::uint8_t {
  SelectedTimeCode = 0x01,
  SelectedMasterCode = 0x02,
  RequestedOffset = 0x03,
  ActualOffset = 0x04,
  LockDeviation = 0x05,
  GeneratorTimeCode = 0x06,
  MidiTimeCodeInput = 0x07,
  Gp0 = 0x08,
  Gp1 = 0x09,
  Gp2 = 0x0A,
  Gp3 = 0x0B,
  Gp4 = 0x0C,
  Gp5 = 0x0D,
  Gp6 = 0x0E,
  Gp7 = 0x0F
};

// LOCATE [I/F]: move to the time held in an information field.
struct LocateInformationField {
  InformationField field = InformationField::SelectedTimeCode;
};

// LOCATE [TARGET]: move to an explicit time.
struct LocateTarget {
  StandardTimeCode target;
};

struct UnknownMachineCommand {
  std::vector<std::uint8_t> data;
};

using MachineControlCommandMsg =
    std::variant<MachineCommand, LocateInformationField, LocateTarget,
                 UnknownMachineCommand>;

inline bool operator==(const LocateInformationField &a,
                       const LocateInformationField &b) {
  return a.field == b.field;
}
inline bool operator==(const LocateTarget &a, const LocateTarget &b) {
  return a.target == b.target;
}
inline bool operator==(const UnknownMachineCommand &a,
                       const UnknownMachineCommand &b) {
  return a.data == b.data;
}

void write_machine_control(ByteVec &out, const MachineControlCommandMsg &msg);
MachineControlCommandMsg read_machine_control(Bytes &r);

} // namespace midi
