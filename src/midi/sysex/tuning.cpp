// src/midi/sysex/tuning.cpp

#include "midi/sysex/tuning.hpp"

#include <algorithm>
#include <cmath>

#include "common/reader.hpp"

namespace midi {

Tuning Tuning::from_freq(double hz) {
  if (hz < 8.17358)
    return Tuning{0, 0};
  if (hz > 13289.73)
    return Tuning{127, 0x3FFF};

  const double note = 12.0 * std::log2(hz / 440.0) + 69.0;
  const double semitone = std::floor(note);
  const double cents = std::clamp((note - semitone) * 100.0, 0.0, 100.0);
  const auto fraction = static_cast<long>(std::lround(cents / 100.0 * 0x3FFF));
  return Tuning{static_cast<std::uint8_t>(semitone),
                static_cast<std::uint16_t>(std::min(fraction, 0x3FFEL))};
}

void write_tuning(ByteVec &out, const std::optional<Tuning> &t) {
  if (!t) {
    out.insert(out.end(), {0x7F, 0x7F, 0x7F});
    return;
  }
  out.push_back(encode_u7(t->semitone));
  push_u14_msb_first(out, t->fraction);
}

std::optional<Tuning> read_tuning(Bytes &r) {
  const std::uint8_t semitone = r.u7();
  const std::uint16_t fraction = r.u14_msb_first();
  if (semitone == 0x7F && fraction == 0x3FFF)
    return std::nullopt;
  return Tuning{semitone, fraction};
}

void write_channel_bit_map(ByteVec &out, const ChannelBitMap &m) {
  out.push_back(static_cast<std::uint8_t>((m.bits >> 14) & 0x03));
  out.push_back(static_cast<std::uint8_t>((m.bits >> 7) & 0x7F));
  out.push_back(static_cast<std::uint8_t>(m.bits & 0x7F));
}

ChannelBitMap read_channel_bit_map(Bytes &r) {
  const std::uint8_t hi = r.u7();
  const std::uint8_t mid = r.u7();
  const std::uint8_t lo = r.u7();
  if (hi > 0x03)
    throw ParseError(ParseError::Kind::Invalid, "channel bit map overflow");
  return ChannelBitMap{
      static_cast<std::uint16_t>((hi << 14) | (mid << 7) | lo)};
}

void write_tuning_note_change(ByteVec &out, const TuningNoteChange &c) {
  const std::size_t count = std::min<std::size_t>(c.tunings.size(), 127);
  out.push_back(encode_u7(c.tuning_program_num));
  out.push_back(static_cast<std::uint8_t>(count));
  for (std::size_t i = 0; i < count; ++i) {
    out.push_back(encode_u7(c.tunings[i].first));
    write_tuning(out, c.tunings[i].second);
  }
}

TuningNoteChange read_tuning_note_change(Bytes &r,
                                         std::optional<std::uint8_t> bank) {
  TuningNoteChange c;
  c.tuning_bank_num = bank;
  c.tuning_program_num = r.u7();
  const std::uint8_t count = r.u7();
  for (int i = 0; i < count; ++i) {
    const std::uint8_t key = r.u7();
    c.tunings.emplace_back(key, read_tuning(r));
  }
  return c;
}

TuningName tuning_name(const std::string &s) {
  TuningName name;
  name.fill(' ');
  for (std::size_t i = 0; i < name.size() && i < s.size(); ++i)
    name[i] = encode_u7(static_cast<unsigned char>(s[i]));
  return name;
}

namespace {

void write_name(ByteVec &out, const TuningName &name) {
  for (auto c : name)
    out.push_back(encode_u7(c));
}

TuningName read_name(Bytes &r) {
  TuningName name;
  for (auto &c : name)
    c = r.u7();
  return name;
}

} // namespace

void write_key_based_tuning_dump(ByteVec &out, const KeyBasedTuningDump &d) {
  if (d.tuning_bank_num)
    out.push_back(encode_u7(*d.tuning_bank_num));
  out.push_back(encode_u7(d.tuning_program_num));
  write_name(out, d.name);
  for (std::size_t key = 0; key < 128; ++key) {
    if (key < d.tunings.size())
      write_tuning(out, d.tunings[key]);
    else
      write_tuning(out, Tuning{static_cast<std::uint8_t>(key), 0});
  }
  out.push_back(0); // checksum
}

KeyBasedTuningDump read_key_based_tuning_dump(Bytes &r, bool with_bank) {
  KeyBasedTuningDump d;
  if (with_bank)
    d.tuning_bank_num = r.u7();
  d.tuning_program_num = r.u7();
  d.name = read_name(r);
  d.tunings.reserve(128);
  for (int key = 0; key < 128; ++key)
    d.tunings.push_back(read_tuning(r));
  return d;
}

void write_scale_tuning_dump_1byte(ByteVec &out,
                                   const ScaleTuningDump1Byte &d) {
  out.push_back(encode_u7(d.tuning_bank_num));
  out.push_back(encode_u7(d.tuning_program_num));
  write_name(out, d.name);
  for (auto t : d.tuning)
    out.push_back(i_to_u7(t));
  out.push_back(0); // checksum
}

void write_scale_tuning_dump_2byte(ByteVec &out,
                                   const ScaleTuningDump2Byte &d) {
  out.push_back(encode_u7(d.tuning_bank_num));
  out.push_back(encode_u7(d.tuning_program_num));
  write_name(out, d.name);
  for (auto t : d.tuning)
    push_i14(out, t);
  out.push_back(0); // checksum
}

ScaleTuningDump1Byte read_scale_tuning_dump_1byte(Bytes &r) {
  ScaleTuningDump1Byte d;
  d.tuning_bank_num = r.u7();
  d.tuning_program_num = r.u7();
  d.name = read_name(r);
  for (auto &t : d.tuning)
    t = u7_to_i(r.u7());
  return d;
}

ScaleTuningDump2Byte read_scale_tuning_dump_2byte(Bytes &r) {
  ScaleTuningDump2Byte d;
  d.tuning_bank_num = r.u7();
  d.tuning_program_num = r.u7();
  d.name = read_name(r);
  for (auto &t : d.tuning)
    t = r.i14();
  return d;
}

void write_scale_tuning_1byte(ByteVec &out, const ScaleTuning1Byte &t) {
  write_channel_bit_map(out, t.channels);
  for (auto x : t.tuning)
    out.push_back(i_to_u7(x));
}

void write_scale_tuning_2byte(ByteVec &out, const ScaleTuning2Byte &t) {
  write_channel_bit_map(out, t.channels);
  for (auto x : t.tuning)
    push_i14(out, x);
}

ScaleTuning1Byte read_scale_tuning_1byte(Bytes &r) {
  ScaleTuning1Byte t;
  t.channels = read_channel_bit_map(r);
  for (auto &x : t.tuning)
    x = u7_to_i(r.u7());
  return t;
}

ScaleTuning2Byte read_scale_tuning_2byte(Bytes &r) {
  ScaleTuning2Byte t;
  t.channels = read_channel_bit_map(r);
  for (auto &x : t.tuning)
    x = r.i14();
  return t;
}

} // namespace midi
