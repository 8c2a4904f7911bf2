// src/midi/sysex/controller_destination.cpp

#include "midi/sysex/controller_destination.hpp"

#include <algorithm>

#include "common/reader.hpp"

namespace midi {

namespace {

Channel read_channel(Bytes &r) {
  const std::uint8_t ch = r.u7();
  if (ch > 15)
    throw ParseError(ParseError::Kind::Invalid, "channel out of range");
  return channel_from_u8(ch);
}

void write_ranges(ByteVec &out, const std::vector<ParameterRange> &ranges) {
  for (const auto &[param, range] : ranges) {
    out.push_back(static_cast<std::uint8_t>(param));
    out.push_back(encode_u7(range));
  }
}

std::vector<ParameterRange> read_ranges(Bytes &r) {
  std::vector<ParameterRange> ranges;
  while (!r.at_end()) {
    const std::uint8_t param = r.u7();
    if (param > 5)
      throw ParseError(ParseError::Kind::Invalid,
                       "unknown controlled parameter");
    ranges.emplace_back(static_cast<ControlledParameter>(param), r.u7());
  }
  return ranges;
}

bool key_based_allowed(std::uint8_t cc) {
  return cc != 0x06 && cc != 0x26 && !(cc >= 0x60 && cc <= 0x65) &&
         cc < 0x78;
}

} // namespace

void write_controller_destination(ByteVec &out,
                                  const ControllerDestination &d) {
  out.push_back(channel_index(d.channel));
  write_ranges(out, d.param_ranges);
}

ControllerDestination read_controller_destination(PressureSource source,
                                                  Bytes &r) {
  ControllerDestination d;
  d.source = source;
  d.channel = read_channel(r);
  d.param_ranges = read_ranges(r);
  return d;
}

void write_cc_controller_destination(
    ByteVec &out, const ControlChangeControllerDestination &d) {
  out.push_back(channel_index(d.channel));
  if (d.control_number < 0x40)
    out.push_back(std::clamp<std::uint8_t>(d.control_number, 0x01, 0x1F));
  else
    out.push_back(std::clamp<std::uint8_t>(d.control_number, 0x40, 0x5F));
  write_ranges(out, d.param_ranges);
}

ControlChangeControllerDestination read_cc_controller_destination(Bytes &r) {
  ControlChangeControllerDestination d;
  d.channel = read_channel(r);
  d.control_number = r.u7();
  d.param_ranges = read_ranges(r);
  return d;
}

void write_key_based_instrument_control(ByteVec &out,
                                        const KeyBasedInstrumentControl &k) {
  out.push_back(channel_index(k.channel));
  out.push_back(encode_u7(k.key));
  for (const auto &[cc, value] : k.control_values) {
    out.push_back(key_based_allowed(cc) ? cc : 1);
    out.push_back(encode_u7(value));
  }
}

KeyBasedInstrumentControl read_key_based_instrument_control(Bytes &r) {
  KeyBasedInstrumentControl k;
  k.channel = read_channel(r);
  k.key = r.u7();
  while (!r.at_end()) {
    const std::uint8_t cc = r.u7();
    k.control_values.emplace_back(cc, r.u7());
  }
  return k;
}

} // namespace midi
