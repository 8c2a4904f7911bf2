// src/midi/primitives.cpp
// Clamping encoders for the MIDI field widths, plus VLQ and checksum.

#include "midi/primitives.hpp"
#include "common/reader.hpp"
#include "midi/error.hpp"

#include <algorithm>

namespace midi {

std::uint8_t encode_u7(unsigned x) {
  return static_cast<std::uint8_t>(std::min(x, 127u));
}

std::uint8_t decode_u7(std::uint8_t b) {
  if (b > 127) {
    throw ParseError(ParseError::Kind::ByteOverflow);
  }
  return b;
}

std::uint8_t i_to_u7(int x) {
  return static_cast<std::uint8_t>(std::clamp(x, -64, 63) + 64);
}

std::int8_t u7_to_i(std::uint8_t x) {
  return static_cast<std::int8_t>(static_cast<int>(x & 0x7F) - 64);
}

std::array<std::uint8_t, 2> to_u14(unsigned x) {
  if (x > 0x3FFF) {
    return {0x7F, 0x7F};
  }
  return {static_cast<std::uint8_t>(x >> 7),
          static_cast<std::uint8_t>(x & 0x7F)};
}

std::array<std::uint8_t, 2> i_to_u14(int x) {
  return to_u14(static_cast<unsigned>(std::clamp(x, -8192, 8191) + 8192));
}

std::array<std::uint8_t, 2> to_i14(int x) {
  const int v = std::clamp(x, -8192, 8191);
  const unsigned bits = static_cast<unsigned>(v) & 0x3FFF;
  return {static_cast<std::uint8_t>(bits >> 7),
          static_cast<std::uint8_t>(bits & 0x7F)};
}

std::uint16_t u14_from_u7s(std::uint8_t msb, std::uint8_t lsb) {
  return static_cast<std::uint16_t>(((msb & 0x7F) << 7) | (lsb & 0x7F));
}

std::int16_t i14_from_u7s(std::uint8_t msb, std::uint8_t lsb) {
  return static_cast<std::int16_t>(static_cast<int>(u14_from_u7s(msb, lsb)) -
                                   8192);
}

std::int16_t twos_i14_from_u7s(std::uint8_t msb, std::uint8_t lsb) {
  int v = u14_from_u7s(msb, lsb);
  if (v & 0x2000) {
    v -= 0x4000;
  }
  return static_cast<std::int16_t>(v);
}

std::uint16_t replace_u14_lsb(std::uint16_t value, std::uint8_t lsb) {
  return static_cast<std::uint16_t>((value & 0x3F80) | (lsb & 0x7F));
}

void push_u7(ByteVec &out, unsigned x) { out.push_back(encode_u7(x)); }

void push_u14(ByteVec &out, unsigned x) {
  const auto [msb, lsb] = to_u14(x);
  out.push_back(lsb);
  out.push_back(msb);
}

void push_u14_msb_first(ByteVec &out, unsigned x) {
  const auto [msb, lsb] = to_u14(x);
  out.push_back(msb);
  out.push_back(lsb);
}

void push_i14(ByteVec &out, int x) {
  const auto [msb, lsb] = i_to_u14(x);
  out.push_back(lsb);
  out.push_back(msb);
}

namespace {

void push_septets(ByteVec &out, std::uint64_t x, int count) {
  for (int i = 0; i < count; ++i) {
    out.push_back(static_cast<std::uint8_t>(x & 0x7F));
    x >>= 7;
  }
}

} // namespace

void push_u21(ByteVec &out, std::uint32_t x) {
  push_septets(out, std::min<std::uint32_t>(x, (1u << 21) - 1), 3);
}

void push_u28(ByteVec &out, std::uint32_t x) {
  push_septets(out, std::min<std::uint32_t>(x, (1u << 28) - 1), 4);
}

void push_u35(ByteVec &out, std::uint64_t x) {
  push_septets(out, std::min<std::uint64_t>(x, (1ull << 35) - 1), 5);
}

void push_vlq(ByteVec &out, std::uint32_t x) {
  x = std::min(x, kMaxVlq);
  std::uint8_t groups[4];
  int n = 0;
  do {
    groups[n++] = static_cast<std::uint8_t>(x & 0x7F);
    x >>= 7;
  } while (x != 0);
  // Most significant group first; every byte but the last has bit 7 set.
  while (n > 1) {
    out.push_back(static_cast<std::uint8_t>(groups[--n] | 0x80));
  }
  out.push_back(groups[0]);
}

ByteVec encode_vlq(std::uint32_t x) {
  ByteVec out;
  push_vlq(out, x);
  return out;
}

std::pair<std::uint32_t, std::size_t> decode_vlq(const std::uint8_t *data,
                                                 std::size_t size) {
  Bytes r(data, size);
  const std::uint32_t v = read_vlq(r);
  return {v, r.off};
}

std::uint8_t checksum(const std::uint8_t *data, std::size_t size) {
  std::uint8_t sum = 0;
  for (std::size_t i = 0; i < size; ++i) {
    sum ^= data[i];
  }
  return static_cast<std::uint8_t>(sum & 0x7F);
}

std::array<std::uint8_t, 2> to_nibbles(std::uint8_t x) {
  return {static_cast<std::uint8_t>(x >> 4),
          static_cast<std::uint8_t>(x & 0x0F)};
}

} // namespace midi
