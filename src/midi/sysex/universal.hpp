// src/midi/sysex/universal.hpp
// Universal system exclusive payloads: everything after `F0 7F dev` (real
// time) or `F0 7E dev` (non-real time), up to but excluding F7.
//
// Sub-id pairs select the payload; the per-family writers and readers
// live beside this file. Non-real-time packets that carry a checksum end
// with a zero placeholder here, patched by the sysex envelope.

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "midi/general_midi.hpp"
#include "midi/primitives.hpp"
#include "midi/sysex/controller_destination.hpp"
#include "midi/sysex/file_dump.hpp"
#include "midi/sysex/file_reference.hpp"
#include "midi/sysex/global_parameter.hpp"
#include "midi/sysex/ids.hpp"
#include "midi/sysex/machine_control.hpp"
#include "midi/sysex/notation.hpp"
#include "midi/sysex/sample_dump.hpp"
#include "midi/sysex/time_code_cueing.hpp"
#include "midi/sysex/tuning.hpp"
#include "midi/time_code.hpp"

struct Bytes;

namespace midi {

// ---------------------------------------------------------------------------
// Real time (F0 7F)

struct TimeCodeFull {
  TimeCode time_code;
};

struct TimeCodeUserBits {
  UserBits user_bits;
};

// MIDI Show Control. Carried opaquely, starting with the command format.
struct ShowControl {
  std::vector<std::uint8_t> data;
};

// Takes effect at once, or (delayed) at the next bar marker.
struct TimeSignatureChange {
  NotationTimeSignature signature;
  bool delayed = false;
};

struct MasterVolume {
  std::uint16_t volume = 0x3FFF;
};

// 0 hard left, 8192 centre, 16383 hard right.
struct MasterBalance {
  std::uint16_t balance = 0x2000;
};

// -8192..8191, like the fine tuning RPN.
struct MasterFineTuning {
  std::int16_t value = 0;
};

// -64..63 semitones.
struct MasterCoarseTuning {
  std::int8_t semitones = 0;
};

struct MachineControlCommand {
  MachineControlCommandMsg command;
};

// Machine control responses, carried opaquely.
struct MachineControlResponse {
  std::vector<std::uint8_t> data;
};

using UniversalRealTimeMsg =
    std::variant<TimeCodeFull, TimeCodeUserBits, ShowControl, BarMarker,
                 TimeSignatureChange, MasterVolume, MasterBalance,
                 MasterFineTuning, MasterCoarseTuning, GlobalParameterControl,
                 TimeCodeCueing, MachineControlCommand, MachineControlResponse,
                 TuningNoteChange, ScaleTuning1Byte, ScaleTuning2Byte,
                 ControllerDestination, ControlChangeControllerDestination,
                 KeyBasedInstrumentControl>;

// ---------------------------------------------------------------------------
// Non-real time (F0 7E)

struct IdentityRequest {};

struct IdentityReply {
  ManufacturerId id;
  std::uint16_t family = 0;
  std::uint16_t family_member = 0;
  std::array<std::uint8_t, 4> software_revision{};
};

// Bank form when `bank` is set.
struct TuningBulkDumpRequest {
  std::uint8_t program = 0;
  std::optional<std::uint8_t> bank;
};

// Handshake messages shared by sample and file dumps.
struct EndOfFile {};
struct Wait {};
struct Cancel {};
struct Nak {
  std::uint8_t packet = 0;
};
struct Ack {
  std::uint8_t packet = 0;
};

using UniversalNonRealTimeMsg = std::variant<
    SampleDumpHeader, SampleDumpPacket, SampleDumpRequest,
    LoopPointTransmission, LoopPointsRequest, ExtendedSampleDumpHeader,
    SampleName, SampleNameRequest, ExtendedLoopPointTransmission,
    ExtendedLoopPointsRequest, TimeCodeCueingSetup, IdentityRequest,
    IdentityReply, FileDumpHeader, FileDumpPacket, FileDumpRequest,
    TuningBulkDumpRequest, KeyBasedTuningDump, ScaleTuningDump1Byte,
    ScaleTuningDump2Byte, TuningNoteChange, ScaleTuning1Byte,
    ScaleTuning2Byte, GeneralMidi, FileReferenceOpen,
    FileReferenceSelectContents, FileReferenceOpenSelectContents,
    FileReferenceClose, EndOfFile, Wait, Cancel, Nak, Ack>;

inline bool operator==(const TimeCodeFull &a, const TimeCodeFull &b) {
  return a.time_code == b.time_code;
}
inline bool operator==(const TimeCodeUserBits &a, const TimeCodeUserBits &b) {
  return a.user_bits == b.user_bits;
}
inline bool operator==(const ShowControl &a, const ShowControl &b) {
  return a.data == b.data;
}
inline bool operator==(const TimeSignatureChange &a,
                       const TimeSignatureChange &b) {
  return a.signature == b.signature && a.delayed == b.delayed;
}
inline bool operator==(const MasterVolume &a, const MasterVolume &b) {
  return a.volume == b.volume;
}
inline bool operator==(const MasterBalance &a, const MasterBalance &b) {
  return a.balance == b.balance;
}
inline bool operator==(const MasterFineTuning &a, const MasterFineTuning &b) {
  return a.value == b.value;
}
inline bool operator==(const MasterCoarseTuning &a,
                       const MasterCoarseTuning &b) {
  return a.semitones == b.semitones;
}
inline bool operator==(const MachineControlCommand &a,
                       const MachineControlCommand &b) {
  return a.command == b.command;
}
inline bool operator==(const MachineControlResponse &a,
                       const MachineControlResponse &b) {
  return a.data == b.data;
}
inline bool operator==(const IdentityRequest &, const IdentityRequest &) {
  return true;
}
inline bool operator==(const IdentityReply &a, const IdentityReply &b) {
  return a.id == b.id && a.family == b.family &&
         a.family_member == b.family_member &&
         a.software_revision == b.software_revision;
}
inline bool operator==(const TuningBulkDumpRequest &a,
                       const TuningBulkDumpRequest &b) {
  return a.program == b.program && a.bank == b.bank;
}
inline bool operator==(const EndOfFile &, const EndOfFile &) { return true; }
inline bool operator==(const Wait &, const Wait &) { return true; }
inline bool operator==(const Cancel &, const Cancel &) { return true; }
inline bool operator==(const Nak &a, const Nak &b) {
  return a.packet == b.packet;
}
inline bool operator==(const Ack &a, const Ack &b) {
  return a.packet == b.packet;
}

// Sub-ids and body.
void write_universal_real_time(ByteVec &out, const UniversalRealTimeMsg &msg);
void write_universal_non_real_time(ByteVec &out,
                                   const UniversalNonRealTimeMsg &msg);

// Whether the message ends with a packet checksum.
bool has_checksum(const UniversalNonRealTimeMsg &msg);
// Same question asked of the two sub-id bytes of an incoming message.
bool nrt_has_checksum(std::uint8_t sub_id1, std::uint8_t sub_id2);

// `r` spans the sub-ids and body; a checksum, if any, is already removed.
// A full time code updates `clock`.
UniversalRealTimeMsg read_universal_real_time(Bytes &r, TimeCode &clock);
UniversalNonRealTimeMsg read_universal_non_real_time(Bytes &r);

// Type name of the payload, e.g. "MasterVolume".
const char *message_name(const UniversalRealTimeMsg &msg);
const char *message_name(const UniversalNonRealTimeMsg &msg);

} // namespace midi
