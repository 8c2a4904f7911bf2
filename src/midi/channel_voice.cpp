// src/midi/channel_voice.cpp

#include "midi/channel_voice.hpp"
#include "common/reader.hpp"
#include "midi/error.hpp"

namespace midi {

bool operator==(const NoteOff &a, const NoteOff &b) {
  return a.note == b.note && a.velocity == b.velocity;
}
bool operator==(const NoteOn &a, const NoteOn &b) {
  return a.note == b.note && a.velocity == b.velocity;
}
bool operator==(const HighResNoteOff &a, const HighResNoteOff &b) {
  return a.note == b.note && a.velocity == b.velocity;
}
bool operator==(const HighResNoteOn &a, const HighResNoteOn &b) {
  return a.note == b.note && a.velocity == b.velocity;
}
bool operator==(const PolyPressure &a, const PolyPressure &b) {
  return a.note == b.note && a.pressure == b.pressure;
}
bool operator==(const ControlChange &a, const ControlChange &b) {
  return a.control == b.control;
}
bool operator==(const ChannelPressure &a, const ChannelPressure &b) {
  return a.pressure == b.pressure;
}
bool operator==(const ProgramChange &a, const ProgramChange &b) {
  return a.program == b.program;
}
bool operator==(const PitchBend &a, const PitchBend &b) {
  return a.bend == b.bend;
}

std::uint8_t voice_status_nibble(const ChannelVoiceMsg &msg) {
  switch (msg.index()) {
  case 0: // NoteOff
  case 2: // HighResNoteOff
    return 0x8;
  case 1: // NoteOn
  case 3: // HighResNoteOn
    return 0x9;
  case 4:
    return 0xA;
  case 5:
    return 0xB;
  case 6:
    return 0xD;
  case 7:
    return 0xC;
  default:
    return 0xE;
  }
}

int channel_data_length(std::uint8_t nibble) {
  return (nibble == 0xC || nibble == 0xD) ? 1 : 2;
}

namespace {

void write_high_res_note(ByteVec &out, Channel ch, std::uint8_t note,
                         std::uint16_t velocity) {
  const auto [msb, lsb] = to_u14(velocity);
  out.push_back(encode_u7(note));
  out.push_back(msb);
  out.push_back(static_cast<std::uint8_t>(0xB0 | channel_index(ch)));
  out.push_back(static_cast<std::uint8_t>(ByteCc::HighResVelocity));
  out.push_back(lsb);
}

} // namespace

void write_channel_voice(ByteVec &out, Channel ch, const ChannelVoiceMsg &msg,
                         bool running) {
  if (!running) {
    out.push_back(static_cast<std::uint8_t>((voice_status_nibble(msg) << 4) |
                                            channel_index(ch)));
  }

  if (const auto *m = std::get_if<NoteOff>(&msg)) {
    out.push_back(encode_u7(m->note));
    out.push_back(encode_u7(m->velocity));
  } else if (const auto *m = std::get_if<NoteOn>(&msg)) {
    out.push_back(encode_u7(m->note));
    out.push_back(encode_u7(m->velocity));
  } else if (const auto *m = std::get_if<HighResNoteOff>(&msg)) {
    write_high_res_note(out, ch, m->note, m->velocity);
  } else if (const auto *m = std::get_if<HighResNoteOn>(&msg)) {
    write_high_res_note(out, ch, m->note, m->velocity);
  } else if (const auto *m = std::get_if<PolyPressure>(&msg)) {
    out.push_back(encode_u7(m->note));
    out.push_back(encode_u7(m->pressure));
  } else if (const auto *m = std::get_if<ControlChange>(&msg)) {
    write_control(out, m->control);
  } else if (const auto *m = std::get_if<ChannelPressure>(&msg)) {
    out.push_back(encode_u7(m->pressure));
  } else if (const auto *m = std::get_if<ProgramChange>(&msg)) {
    out.push_back(encode_u7(m->program));
  } else if (const auto *m = std::get_if<PitchBend>(&msg)) {
    push_u14(out, m->bend);
  }
}

ChannelVoiceMsg read_channel_voice(std::uint8_t nibble, Bytes &r,
                                   bool complex_cc) {
  switch (nibble) {
  case 0x8: {
    const std::uint8_t note = r.u7();
    return NoteOff{note, r.u7()};
  }
  case 0x9: {
    const std::uint8_t note = r.u7();
    return NoteOn{note, r.u7()};
  }
  case 0xA: {
    const std::uint8_t note = r.u7();
    return PolyPressure{note, r.u7()};
  }
  case 0xB: {
    const std::uint8_t number = r.u7();
    if (number >= 120) {
      throw ParseError(ParseError::Kind::Invalid,
                       "controller number reserved for channel mode");
    }
    return ControlChange{read_control(number, r.u7(), complex_cc)};
  }
  case 0xC:
    return ProgramChange{r.u7()};
  case 0xD:
    return ChannelPressure{r.u7()};
  case 0xE:
    return PitchBend{r.u14()};
  default:
    throw ParseError(ParseError::Kind::Invalid, "not a channel voice status");
  }
}

std::optional<ChannelVoiceMsg> with_velocity_lsb(const ChannelVoiceMsg &note,
                                                 std::uint8_t lsb) {
  if (const auto *on = std::get_if<NoteOn>(&note))
    return HighResNoteOn{on->note, u14_from_u7s(on->velocity, lsb)};
  if (const auto *off = std::get_if<NoteOff>(&note))
    return HighResNoteOff{off->note, u14_from_u7s(off->velocity, lsb)};
  return std::nullopt;
}

} // namespace midi
