// src/midi/sysex/notation.cpp

#include "midi/sysex/notation.hpp"

#include <algorithm>

#include "common/reader.hpp"

namespace midi {

void write_bar_marker(ByteVec &out, const BarMarker &m) {
  switch (m.kind) {
  case BarMarker::Kind::NotRunning:
    out.push_back(0x00);
    out.push_back(0x40);
    break;
  case BarMarker::Kind::CountIn:
  case BarMarker::Kind::Number: {
    // 8191 and -8192 are reserved for the two sentinel kinds.
    const int value = m.kind == BarMarker::Kind::CountIn
                          ? -std::min<int>(m.bar, 8191)
                          : std::min<int>(m.bar, 8190);
    const auto [msb, lsb] = to_i14(value);
    out.push_back(lsb);
    out.push_back(msb);
    break;
  }
  case BarMarker::Kind::RunningUnknown:
    out.push_back(0x7F);
    out.push_back(0x3F);
    break;
  }
}

BarMarker read_bar_marker(Bytes &r) {
  const std::uint8_t lsb = r.u7();
  const std::uint8_t msb = r.u7();
  const int value = twos_i14_from_u7s(msb, lsb);
  if (value == -8192)
    return BarMarker::not_running();
  if (value == 8191)
    return BarMarker::running_unknown();
  if (value < 0)
    return BarMarker::count_in(static_cast<std::uint16_t>(-value));
  return BarMarker::number(static_cast<std::uint16_t>(value));
}

namespace {

void write_signature(ByteVec &out, const Signature &s) {
  out.push_back(encode_u7(s.beats));
  out.push_back(encode_u7(s.beat_value));
}

Signature read_signature(Bytes &r) {
  Signature s;
  s.beats = r.u7();
  s.beat_value = r.u7();
  return s;
}

} // namespace

void write_notation_time_signature(ByteVec &out,
                                   const NotationTimeSignature &ts) {
  const std::size_t count = std::min<std::size_t>(ts.compound.size(), 61);
  out.push_back(static_cast<std::uint8_t>(4 + count * 2));
  write_signature(out, ts.signature);
  out.push_back(encode_u7(ts.midi_clocks_in_metronome_click));
  out.push_back(encode_u7(ts.thirty_second_notes_in_midi_quarter_note));
  for (std::size_t i = 0; i < count; ++i)
    write_signature(out, ts.compound[i]);
}

NotationTimeSignature read_notation_time_signature(Bytes &r) {
  const std::uint8_t length = r.u7();
  if (length < 4 || (length % 2) != 0)
    throw ParseError(ParseError::Kind::Invalid,
                     "bad time signature length");
  Bytes body = r.slice(length);
  NotationTimeSignature ts;
  ts.signature = read_signature(body);
  ts.midi_clocks_in_metronome_click = body.u7();
  ts.thirty_second_notes_in_midi_quarter_note = body.u7();
  while (!body.at_end())
    ts.compound.push_back(read_signature(body));
  return ts;
}

} // namespace midi
