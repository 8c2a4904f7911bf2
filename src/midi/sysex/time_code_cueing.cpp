// src/midi/sysex/time_code_cueing.cpp

#include "midi/sysex/time_code_cueing.hpp"

#include "common/reader.hpp"

namespace midi {

namespace {

CueingType read_type(Bytes &r) {
  const std::uint8_t t = r.u7();
  if (t > 0x0E)
    throw ParseError(ParseError::Kind::Invalid, "unknown cueing type");
  return static_cast<CueingType>(t);
}

void write_info(ByteVec &out, const std::vector<std::uint8_t> &info) {
  for (std::uint8_t b : info) {
    out.push_back(b & 0x0F);
    out.push_back(b >> 4);
  }
}

std::vector<std::uint8_t> read_info(Bytes &r) {
  if (r.remaining() % 2 != 0)
    throw ParseError(ParseError::Kind::Invalid,
                     "odd number of cueing info nibbles");
  std::vector<std::uint8_t> info;
  info.reserve(r.remaining() / 2);
  while (!r.at_end()) {
    const std::uint8_t lo = r.u7();
    const std::uint8_t hi = r.u7();
    if (lo > 0x0F || hi > 0x0F)
      throw ParseError(ParseError::Kind::Invalid, "cueing info nibble > 0x0F");
    info.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return info;
}

} // namespace

void write_time_code_cueing(ByteVec &out, const TimeCodeCueing &c) {
  out.push_back(static_cast<std::uint8_t>(c.type));
  push_u14(out, c.event_number);
  write_info(out, c.additional_info);
}

TimeCodeCueing read_time_code_cueing(Bytes &r) {
  TimeCodeCueing c;
  c.type = read_type(r);
  c.event_number = r.u14();
  c.additional_info = read_info(r);
  return c;
}

void write_time_code_cueing_setup(ByteVec &out, const TimeCodeCueingSetup &c) {
  out.push_back(static_cast<std::uint8_t>(c.type));
  write_high_res_time_code(out, c.time_code);
  push_u14(out, c.event_number);
  write_info(out, c.additional_info);
}

TimeCodeCueingSetup read_time_code_cueing_setup(Bytes &r) {
  TimeCodeCueingSetup c;
  c.type = read_type(r);
  c.time_code = read_high_res_time_code(r);
  c.event_number = r.u14();
  c.additional_info = read_info(r);
  return c;
}

} // namespace midi
