// src/midi/sysex/universal.cpp
// Sub-id tables for universal real-time and non-real-time messages.

#include "midi/sysex/universal.hpp"

#include <iterator>
#include <string>
#include <utility>

#include "common/reader.hpp"

namespace midi {

namespace {

void push_ids(ByteVec &out, std::uint8_t sub1, std::uint8_t sub2) {
  out.push_back(sub1);
  out.push_back(sub2);
}

void push_raw(ByteVec &out, const std::vector<std::uint8_t> &data) {
  for (auto b : data)
    out.push_back(encode_u7(b));
}

struct RealTimeWriter {
  ByteVec &out;

  void operator()(const TimeCodeFull &m) const {
    push_ids(out, 0x01, 0x01);
    write_time_code(out, m.time_code);
  }
  void operator()(const TimeCodeUserBits &m) const {
    push_ids(out, 0x01, 0x02);
    write_user_bits(out, m.user_bits);
  }
  void operator()(const ShowControl &m) const {
    out.push_back(0x02);
    push_raw(out, m.data);
  }
  void operator()(const BarMarker &m) const {
    push_ids(out, 0x03, 0x01);
    write_bar_marker(out, m);
  }
  void operator()(const TimeSignatureChange &m) const {
    push_ids(out, 0x03, m.delayed ? 0x42 : 0x02);
    write_notation_time_signature(out, m.signature);
  }
  void operator()(const MasterVolume &m) const {
    push_ids(out, 0x04, 0x01);
    push_u14(out, m.volume);
  }
  void operator()(const MasterBalance &m) const {
    push_ids(out, 0x04, 0x02);
    push_u14(out, m.balance);
  }
  void operator()(const MasterFineTuning &m) const {
    push_ids(out, 0x04, 0x03);
    push_i14(out, m.value);
  }
  void operator()(const MasterCoarseTuning &m) const {
    push_ids(out, 0x04, 0x04);
    out.push_back(i_to_u7(m.semitones));
  }
  void operator()(const GlobalParameterControl &m) const {
    push_ids(out, 0x04, 0x05);
    write_global_parameter_control(out, m);
  }
  void operator()(const TimeCodeCueing &m) const {
    out.push_back(0x05);
    write_time_code_cueing(out, m);
  }
  void operator()(const MachineControlCommand &m) const {
    out.push_back(0x06);
    write_machine_control(out, m.command);
  }
  void operator()(const MachineControlResponse &m) const {
    out.push_back(0x07);
    push_raw(out, m.data);
  }
  void operator()(const TuningNoteChange &m) const {
    push_ids(out, 0x08, m.tuning_bank_num ? 0x07 : 0x02);
    if (m.tuning_bank_num)
      out.push_back(encode_u7(*m.tuning_bank_num));
    write_tuning_note_change(out, m);
  }
  void operator()(const ScaleTuning1Byte &m) const {
    push_ids(out, 0x08, 0x08);
    write_scale_tuning_1byte(out, m);
  }
  void operator()(const ScaleTuning2Byte &m) const {
    push_ids(out, 0x08, 0x09);
    write_scale_tuning_2byte(out, m);
  }
  void operator()(const ControllerDestination &m) const {
    push_ids(out, 0x09, static_cast<std::uint8_t>(m.source));
    write_controller_destination(out, m);
  }
  void operator()(const ControlChangeControllerDestination &m) const {
    push_ids(out, 0x09, 0x03);
    write_cc_controller_destination(out, m);
  }
  void operator()(const KeyBasedInstrumentControl &m) const {
    push_ids(out, 0x0A, 0x01);
    write_key_based_instrument_control(out, m);
  }
};

struct NonRealTimeWriter {
  ByteVec &out;

  // The sample dump, file dump and file reference families write their
  // own trailing sub-ids.
  void operator()(const SampleDumpHeader &m) const {
    write_sample_dump(out, m);
  }
  void operator()(const SampleDumpPacket &m) const {
    write_sample_dump(out, m);
  }
  void operator()(const SampleDumpRequest &m) const {
    write_sample_dump(out, m);
  }
  void operator()(const LoopPointTransmission &m) const {
    write_sample_dump(out, m);
  }
  void operator()(const LoopPointsRequest &m) const {
    write_sample_dump(out, m);
  }
  void operator()(const ExtendedSampleDumpHeader &m) const {
    write_extended_sample_dump(out, m);
  }
  void operator()(const SampleName &m) const {
    write_extended_sample_dump(out, m);
  }
  void operator()(const SampleNameRequest &m) const {
    write_extended_sample_dump(out, m);
  }
  void operator()(const ExtendedLoopPointTransmission &m) const {
    write_extended_sample_dump(out, m);
  }
  void operator()(const ExtendedLoopPointsRequest &m) const {
    write_extended_sample_dump(out, m);
  }
  void operator()(const TimeCodeCueingSetup &m) const {
    out.push_back(0x04);
    write_time_code_cueing_setup(out, m);
  }
  void operator()(const IdentityRequest &) const { push_ids(out, 0x06, 0x01); }
  void operator()(const IdentityReply &m) const {
    push_ids(out, 0x06, 0x02);
    write_manufacturer_id(out, m.id);
    push_u14(out, m.family);
    push_u14(out, m.family_member);
    for (auto b : m.software_revision)
      out.push_back(encode_u7(b));
  }
  void operator()(const FileDumpHeader &m) const {
    out.push_back(0x07);
    write_file_dump(out, m);
  }
  void operator()(const FileDumpPacket &m) const {
    out.push_back(0x07);
    write_file_dump(out, m);
  }
  void operator()(const FileDumpRequest &m) const {
    out.push_back(0x07);
    write_file_dump(out, m);
  }
  void operator()(const TuningBulkDumpRequest &m) const {
    push_ids(out, 0x08, m.bank ? 0x03 : 0x00);
    if (m.bank)
      out.push_back(encode_u7(*m.bank));
    out.push_back(encode_u7(m.program));
  }
  void operator()(const KeyBasedTuningDump &m) const {
    push_ids(out, 0x08, m.tuning_bank_num ? 0x04 : 0x01);
    write_key_based_tuning_dump(out, m);
  }
  void operator()(const ScaleTuningDump1Byte &m) const {
    push_ids(out, 0x08, 0x05);
    write_scale_tuning_dump_1byte(out, m);
  }
  void operator()(const ScaleTuningDump2Byte &m) const {
    push_ids(out, 0x08, 0x06);
    write_scale_tuning_dump_2byte(out, m);
  }
  void operator()(const TuningNoteChange &m) const {
    // The non-real-time form always names a bank; bank 0 when unset.
    push_ids(out, 0x08, 0x07);
    out.push_back(encode_u7(m.tuning_bank_num.value_or(0)));
    write_tuning_note_change(out, m);
  }
  void operator()(const ScaleTuning1Byte &m) const {
    push_ids(out, 0x08, 0x08);
    write_scale_tuning_1byte(out, m);
  }
  void operator()(const ScaleTuning2Byte &m) const {
    push_ids(out, 0x08, 0x09);
    write_scale_tuning_2byte(out, m);
  }
  void operator()(GeneralMidi m) const {
    push_ids(out, 0x09, static_cast<std::uint8_t>(m));
  }
  void operator()(const FileReferenceOpen &m) const {
    out.push_back(0x0B);
    write_file_reference(out, m);
  }
  void operator()(const FileReferenceSelectContents &m) const {
    out.push_back(0x0B);
    write_file_reference(out, m);
  }
  void operator()(const FileReferenceOpenSelectContents &m) const {
    out.push_back(0x0B);
    write_file_reference(out, m);
  }
  void operator()(const FileReferenceClose &m) const {
    out.push_back(0x0B);
    write_file_reference(out, m);
  }
  void operator()(const EndOfFile &) const { push_ids(out, 0x7B, 0x00); }
  void operator()(const Wait &) const { push_ids(out, 0x7C, 0x00); }
  void operator()(const Cancel &) const { push_ids(out, 0x7D, 0x00); }
  void operator()(const Nak &m) const {
    push_ids(out, 0x7E, encode_u7(m.packet));
  }
  void operator()(const Ack &m) const {
    push_ids(out, 0x7F, encode_u7(m.packet));
  }
};

// Re-wrap a family variant as the flat non-real-time variant.
template <typename Family>
UniversalNonRealTimeMsg flatten(Family &&family) {
  return std::visit(
      [](auto &&m) -> UniversalNonRealTimeMsg { return std::move(m); },
      std::forward<Family>(family));
}

[[noreturn]] void unknown_sub_id(const char *family) {
  throw ParseError(ParseError::Kind::Invalid,
                   std::string("unknown sub-id in ") + family);
}

UniversalRealTimeMsg read_real_time_body(Bytes &r, TimeCode &clock) {
  const std::uint8_t sub1 = r.u7();
  switch (sub1) {
  case 0x01: {
    const std::uint8_t sub2 = r.u7();
    if (sub2 == 0x01) {
      const TimeCode tc = read_time_code(r);
      clock = tc;
      return TimeCodeFull{tc};
    }
    if (sub2 == 0x02)
      return TimeCodeUserBits{read_user_bits(r)};
    unknown_sub_id("time code");
  }
  case 0x02:
    return ShowControl{r.rest()};
  case 0x03: {
    const std::uint8_t sub2 = r.u7();
    if (sub2 == 0x01)
      return read_bar_marker(r);
    if (sub2 == 0x02 || sub2 == 0x42)
      return TimeSignatureChange{read_notation_time_signature(r),
                                 sub2 == 0x42};
    unknown_sub_id("notation");
  }
  case 0x04: {
    const std::uint8_t sub2 = r.u7();
    switch (sub2) {
    case 0x01:
      return MasterVolume{r.u14()};
    case 0x02:
      return MasterBalance{r.u14()};
    case 0x03:
      return MasterFineTuning{r.i14()};
    case 0x04:
      return MasterCoarseTuning{u7_to_i(r.u7())};
    case 0x05:
      return read_global_parameter_control(r);
    default:
      unknown_sub_id("device control");
    }
  }
  case 0x05:
    return read_time_code_cueing(r);
  case 0x06:
    return MachineControlCommand{read_machine_control(r)};
  case 0x07:
    return MachineControlResponse{r.rest()};
  case 0x08: {
    const std::uint8_t sub2 = r.u7();
    switch (sub2) {
    case 0x02:
      return read_tuning_note_change(r, std::nullopt);
    case 0x07: {
      const std::uint8_t bank = r.u7();
      return read_tuning_note_change(r, bank);
    }
    case 0x08:
      return read_scale_tuning_1byte(r);
    case 0x09:
      return read_scale_tuning_2byte(r);
    default:
      unknown_sub_id("real-time tuning");
    }
  }
  case 0x09: {
    const std::uint8_t sub2 = r.u7();
    if (sub2 == 0x01 || sub2 == 0x02)
      return read_controller_destination(static_cast<PressureSource>(sub2),
                                         r);
    if (sub2 == 0x03)
      return read_cc_controller_destination(r);
    unknown_sub_id("controller destination");
  }
  case 0x0A: {
    if (r.u7() != 0x01)
      unknown_sub_id("key-based instrument control");
    return read_key_based_instrument_control(r);
  }
  default:
    unknown_sub_id("universal real-time message");
  }
}

UniversalNonRealTimeMsg read_non_real_time_body(Bytes &r) {
  const std::uint8_t sub1 = r.u7();
  switch (sub1) {
  case 0x01:
    return read_sample_dump_header(r);
  case 0x02:
    return read_sample_dump_packet(r);
  case 0x03:
    return read_sample_dump_request(r);
  case 0x04:
    return read_time_code_cueing_setup(r);
  case 0x05: {
    const std::uint8_t sub2 = r.u7();
    if (sub2 == 0x01)
      return read_loop_point_transmission(r);
    if (sub2 == 0x02)
      return read_loop_points_request(r);
    return flatten(read_extended_sample_dump(sub2, r));
  }
  case 0x06: {
    const std::uint8_t sub2 = r.u7();
    if (sub2 == 0x01)
      return IdentityRequest{};
    if (sub2 == 0x02) {
      IdentityReply reply;
      reply.id = read_manufacturer_id(r);
      reply.family = r.u14();
      reply.family_member = r.u14();
      for (auto &b : reply.software_revision)
        b = r.u7();
      return reply;
    }
    unknown_sub_id("general information");
  }
  case 0x07:
    return flatten(read_file_dump(r.u7(), r));
  case 0x08: {
    const std::uint8_t sub2 = r.u7();
    switch (sub2) {
    case 0x00:
      return TuningBulkDumpRequest{r.u7(), std::nullopt};
    case 0x03: {
      const std::uint8_t bank = r.u7();
      return TuningBulkDumpRequest{r.u7(), bank};
    }
    case 0x01:
      return read_key_based_tuning_dump(r, false);
    case 0x04:
      return read_key_based_tuning_dump(r, true);
    case 0x05:
      return read_scale_tuning_dump_1byte(r);
    case 0x06:
      return read_scale_tuning_dump_2byte(r);
    case 0x07: {
      const std::uint8_t bank = r.u7();
      return read_tuning_note_change(r, bank);
    }
    case 0x08:
      return read_scale_tuning_1byte(r);
    case 0x09:
      return read_scale_tuning_2byte(r);
    default:
      unknown_sub_id("tuning standard");
    }
  }
  case 0x09: {
    const std::uint8_t sub2 = r.u7();
    if (sub2 < 0x01 || sub2 > 0x03)
      unknown_sub_id("general MIDI");
    return static_cast<GeneralMidi>(sub2);
  }
  case 0x0A:
    throw ParseError(ParseError::Kind::NotImplemented, "downloadable sounds");
  case 0x0B:
    return flatten(read_file_reference(r.u7(), r));
  case 0x0D:
    throw ParseError(ParseError::Kind::NotImplemented, "capability inquiry");
  case 0x7B:
    (void)r.u7();
    return EndOfFile{};
  case 0x7C:
    (void)r.u7();
    return Wait{};
  case 0x7D:
    (void)r.u7();
    return Cancel{};
  case 0x7E:
    return Nak{r.u7()};
  case 0x7F:
    return Ack{r.u7()};
  default:
    unknown_sub_id("universal non-real-time message");
  }
}

} // namespace

void write_universal_real_time(ByteVec &out, const UniversalRealTimeMsg &msg) {
  std::visit(RealTimeWriter{out}, msg);
}

void write_universal_non_real_time(ByteVec &out,
                                   const UniversalNonRealTimeMsg &msg) {
  std::visit(NonRealTimeWriter{out}, msg);
}

bool has_checksum(const UniversalNonRealTimeMsg &msg) {
  return std::holds_alternative<SampleDumpPacket>(msg) ||
         std::holds_alternative<FileDumpPacket>(msg) ||
         std::holds_alternative<KeyBasedTuningDump>(msg) ||
         std::holds_alternative<ScaleTuningDump1Byte>(msg) ||
         std::holds_alternative<ScaleTuningDump2Byte>(msg);
}

bool nrt_has_checksum(std::uint8_t sub_id1, std::uint8_t sub_id2) {
  switch (sub_id1) {
  case 0x02:
    return true;
  case 0x07:
    return sub_id2 == 0x02;
  case 0x08:
    return sub_id2 == 0x01 || sub_id2 == 0x04 || sub_id2 == 0x05 ||
           sub_id2 == 0x06;
  default:
    return false;
  }
}

UniversalRealTimeMsg read_universal_real_time(Bytes &r, TimeCode &clock) {
  // Decode into a scratch clock so a malformed message leaves it alone.
  TimeCode updated = clock;
  UniversalRealTimeMsg msg = read_real_time_body(r, updated);
  r.expect_end("universal real-time message");
  clock = updated;
  return msg;
}

UniversalNonRealTimeMsg read_universal_non_real_time(Bytes &r) {
  UniversalNonRealTimeMsg msg = read_non_real_time_body(r);
  r.expect_end("universal non-real-time message");
  return msg;
}

namespace {

constexpr const char *kRealTimeNames[] = {
    "TimeCodeFull",
    "TimeCodeUserBits",
    "ShowControl",
    "BarMarker",
    "TimeSignatureChange",
    "MasterVolume",
    "MasterBalance",
    "MasterFineTuning",
    "MasterCoarseTuning",
    "GlobalParameterControl",
    "TimeCodeCueing",
    "MachineControlCommand",
    "MachineControlResponse",
    "TuningNoteChange",
    "ScaleTuning1Byte",
    "ScaleTuning2Byte",
    "ControllerDestination",
    "ControlChangeControllerDestination",
    "KeyBasedInstrumentControl"};

constexpr const char *kNonRealTimeNames[] = {
    "SampleDumpHeader",
    "SampleDumpPacket",
    "SampleDumpRequest",
    "LoopPointTransmission",
    "LoopPointsRequest",
    "ExtendedSampleDumpHeader",
    "SampleName",
    "SampleNameRequest",
    "ExtendedLoopPointTransmission",
    "ExtendedLoopPointsRequest",
    "TimeCodeCueingSetup",
    "IdentityRequest",
    "IdentityReply",
    "FileDumpHeader",
    "FileDumpPacket",
    "FileDumpRequest",
    "TuningBulkDumpRequest",
    "KeyBasedTuningDump",
    "ScaleTuningDump1Byte",
    "ScaleTuningDump2Byte",
    "TuningNoteChange",
    "ScaleTuning1Byte",
    "ScaleTuning2Byte",
    "GeneralMidi",
    "FileReferenceOpen",
    "FileReferenceSelectContents",
    "FileReferenceOpenSelectContents",
    "FileReferenceClose",
    "EndOfFile",
    "Wait",
    "Cancel",
    "Nak",
    "Ack"};

static_assert(std::size(kRealTimeNames) ==
                  std::variant_size_v<UniversalRealTimeMsg>,
              "one name per real time message");
static_assert(std::size(kNonRealTimeNames) ==
                  std::variant_size_v<UniversalNonRealTimeMsg>,
              "one name per non-real time message");

} // namespace

const char *message_name(const UniversalRealTimeMsg &msg) {
  return kRealTimeNames[msg.index()];
}

const char *message_name(const UniversalNonRealTimeMsg &msg) {
  return kNonRealTimeNames[msg.index()];
}

} // namespace midi
