// src/midi/time_code.cpp
// Byte layouts for the SMPTE time code family.

#include "midi/time_code.hpp"
#include "common/reader.hpp"
#include "midi/error.hpp"

#include <algorithm>
#include <cstdlib>

namespace {

std::uint8_t hour_byte(std::uint8_t hours, midi::TimeCodeType type) {
  return static_cast<std::uint8_t>(std::min<unsigned>(hours, 23) |
                                   (static_cast<unsigned>(type) << 5));
}

midi::TimeCodeType type_from_hour_byte(std::uint8_t hr) {
  return static_cast<midi::TimeCodeType>((hr >> 5) & 0x03);
}

std::uint8_t nibble(Bytes &r) {
  const std::uint8_t b = r.u7();
  if (b > 0x0F) {
    throw midi::ParseError(midi::ParseError::Kind::Invalid,
                           "user bits nibble out of range");
  }
  return b;
}

} // namespace

namespace midi {

double frames_per_second(TimeCodeType t) {
  switch (t) {
  case TimeCodeType::FPS24:
    return 24.0;
  case TimeCodeType::FPS25:
    return 25.0;
  case TimeCodeType::DF30:
    return 29.97;
  case TimeCodeType::NDF30:
    return 30.0;
  }
  return 30.0;
}

std::array<std::uint8_t, 4> time_code_fields(const TimeCode &tc) {
  return {static_cast<std::uint8_t>(std::min<unsigned>(tc.frames, 29)),
          static_cast<std::uint8_t>(std::min<unsigned>(tc.seconds, 59)),
          static_cast<std::uint8_t>(std::min<unsigned>(tc.minutes, 59)),
          hour_byte(tc.hours, tc.code_type)};
}

void write_time_code(ByteVec &out, const TimeCode &tc) {
  const auto [fr, sc, mn, hr] = time_code_fields(tc);
  out.push_back(hr);
  out.push_back(mn);
  out.push_back(sc);
  out.push_back(fr);
}

TimeCode read_time_code(Bytes &r) {
  TimeCode tc;
  const std::uint8_t hr = r.u7();
  tc.hours = hr & 0x1F;
  tc.code_type = type_from_hour_byte(hr);
  tc.minutes = r.u7();
  tc.seconds = r.u7();
  tc.frames = r.u7();
  return tc;
}

std::array<std::uint8_t, 8> quarter_frame_pieces(const TimeCode &tc) {
  const auto fields = time_code_fields(tc);
  std::array<std::uint8_t, 8> out{};
  for (int i = 0; i < 4; ++i) {
    const auto [hi, lo] = to_nibbles(fields[i]);
    out[2 * i] = static_cast<std::uint8_t>(((2 * i) << 4) | lo);
    out[2 * i + 1] = static_cast<std::uint8_t>(((2 * i + 1) << 4) | hi);
  }
  return out;
}

int apply_quarter_frame(TimeCode &tc, std::uint8_t data) {
  const int index = (data >> 4) & 0x07;
  const std::uint8_t n = data & 0x0F;
  auto low = [n](std::uint8_t v) {
    return static_cast<std::uint8_t>((v & 0xF0) | n);
  };
  auto high = [n](std::uint8_t v) {
    return static_cast<std::uint8_t>((v & 0x0F) | (n << 4));
  };
  switch (index) {
  case 0:
    tc.frames = low(tc.frames);
    break;
  case 1:
    tc.frames = high(tc.frames);
    break;
  case 2:
    tc.seconds = low(tc.seconds);
    break;
  case 3:
    tc.seconds = high(tc.seconds);
    break;
  case 4:
    tc.minutes = low(tc.minutes);
    break;
  case 5:
    tc.minutes = high(tc.minutes);
    break;
  case 6:
    tc.hours = low(tc.hours);
    break;
  default:
    // (code_type << 1) | hours bit 4
    tc.hours = static_cast<std::uint8_t>((tc.hours & 0x0F) | ((n & 0x01) << 4));
    tc.code_type = static_cast<TimeCodeType>((n >> 1) & 0x03);
    break;
  }
  return index;
}

void write_high_res_time_code(ByteVec &out, const HighResTimeCode &tc) {
  out.push_back(hour_byte(tc.hours, tc.code_type));
  out.push_back(static_cast<std::uint8_t>(std::min<unsigned>(tc.minutes, 59)));
  out.push_back(static_cast<std::uint8_t>(std::min<unsigned>(tc.seconds, 59)));
  out.push_back(static_cast<std::uint8_t>(std::min<unsigned>(tc.frames, 29)));
  out.push_back(
      static_cast<std::uint8_t>(std::min<unsigned>(tc.fractional_frames, 99)));
}

HighResTimeCode read_high_res_time_code(Bytes &r) {
  HighResTimeCode tc;
  const std::uint8_t hr = r.u7();
  tc.hours = hr & 0x1F;
  tc.code_type = type_from_hour_byte(hr);
  tc.minutes = r.u7();
  tc.seconds = r.u7();
  tc.frames = r.u7();
  tc.fractional_frames = r.u7();
  return tc;
}

void write_standard_time_code(ByteVec &out, const StandardTimeCode &tc) {
  out.push_back(hour_byte(tc.hours, tc.code_type));
  out.push_back(static_cast<std::uint8_t>(std::min<unsigned>(tc.minutes, 59)));
  out.push_back(static_cast<std::uint8_t>(std::min<unsigned>(tc.seconds, 59)));

  std::uint8_t fr =
      static_cast<std::uint8_t>(std::min(std::abs(int(tc.frames)), 29));
  if (tc.frames < 0)
    fr |= 0x40;
  if (tc.status)
    fr |= 0x20;
  out.push_back(fr);

  if (tc.status) {
    std::uint8_t st = 0;
    if (tc.status->estimated_code)
      st |= 0x40;
    if (tc.status->invalid_code)
      st |= 0x20;
    if (tc.status->video_field1)
      st |= 0x10;
    if (tc.status->no_time_code)
      st |= 0x08;
    out.push_back(st);
  } else {
    out.push_back(static_cast<std::uint8_t>(
        std::min<unsigned>(tc.fractional_frames, 99)));
  }
}

StandardTimeCode read_standard_time_code(Bytes &r) {
  StandardTimeCode tc;
  const std::uint8_t hr = r.u7();
  tc.hours = hr & 0x1F;
  tc.code_type = type_from_hour_byte(hr);
  tc.minutes = r.u7();
  tc.seconds = r.u7();
  const std::uint8_t fr = r.u7();
  const std::uint8_t ff = r.u7();

  const int frames = fr & 0x1F;
  tc.frames = static_cast<std::int8_t>((fr & 0x40) ? -frames : frames);
  if (fr & 0x20) {
    TimeCodeStatus st;
    st.estimated_code = (ff & 0x40) != 0;
    st.invalid_code = (ff & 0x20) != 0;
    st.video_field1 = (ff & 0x10) != 0;
    st.no_time_code = (ff & 0x08) != 0;
    tc.status = st;
  } else {
    tc.fractional_frames = ff;
  }
  return tc;
}

std::array<std::uint8_t, 9> user_bits_nibbles(const UserBits &bits) {
  std::array<std::uint8_t, 9> out{};
  // bytes[0] holds uh:ug, bytes[3] holds ub:ua.
  for (int i = 0; i < 4; ++i) {
    const auto [hi, lo] = to_nibbles(bits.bytes[3 - i]);
    out[2 * i] = lo;
    out[2 * i + 1] = hi;
  }
  out[8] = static_cast<std::uint8_t>((bits.flag1 ? 1 : 0) |
                                     (bits.flag2 ? 2 : 0));
  return out;
}

void write_user_bits(ByteVec &out, const UserBits &bits) {
  const auto n = user_bits_nibbles(bits);
  out.insert(out.end(), n.begin(), n.end());
}

UserBits read_user_bits(Bytes &r) {
  UserBits bits;
  for (int i = 0; i < 4; ++i) {
    const std::uint8_t lo = nibble(r);
    const std::uint8_t hi = nibble(r);
    bits.bytes[3 - i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  const std::uint8_t flags = nibble(r);
  if (flags > 3) {
    throw ParseError(ParseError::Kind::Invalid, "user bits flags out of range");
  }
  bits.flag1 = (flags & 1) != 0;
  bits.flag2 = (flags & 2) != 0;
  return bits;
}

} // namespace midi
