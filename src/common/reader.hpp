// src/common/reader.hpp
// Tiny safe cursor over a byte slice: big-endian reads for SMF chunks,
// 7-bit field reads for the wire protocol, and MIDI VLQ.
// Every read past the end throws midi::ParseError(UnexpectedEnd).
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "midi/error.hpp"

struct Bytes {
  const std::uint8_t *data = nullptr; // not owned
  std::size_t size = 0;
  std::size_t off = 0; // current read position

  Bytes(const std::uint8_t *src, std::size_t n) : data(src), size(n), off(0) {}
  explicit Bytes(const std::vector<std::uint8_t> &src)
      : data(src.data()), size(src.size()), off(0) {}

  [[nodiscard]] std::size_t remaining() const { return size - off; }
  [[nodiscard]] bool at_end() const { return off >= size; }
  [[nodiscard]] const std::uint8_t *here() const { return data + off; }

  [[nodiscard]] std::uint8_t peek() const {
    need(1);
    return data[off];
  }

  [[nodiscard]] std::uint8_t u8() {
    need(1);
    return data[off++];
  }

  // A data byte: top bit must be clear.
  [[nodiscard]] std::uint8_t u7() {
    const std::uint8_t b = u8();
    if (b & 0x80)
      throw midi::ParseError(midi::ParseError::Kind::ByteOverflow);
    return b;
  }

  // Two data bytes, LSB first.
  [[nodiscard]] std::uint16_t u14() {
    const std::uint8_t lsb = u7();
    const std::uint8_t msb = u7();
    return static_cast<std::uint16_t>((msb << 7) | lsb);
  }

  [[nodiscard]] std::uint16_t u14_msb_first() {
    const std::uint8_t msb = u7();
    const std::uint8_t lsb = u7();
    return static_cast<std::uint16_t>((msb << 7) | lsb);
  }

  // Biased by 8192, LSB first.
  [[nodiscard]] std::int16_t i14() {
    return static_cast<std::int16_t>(static_cast<int>(u14()) - 8192);
  }

  // N septets, LSB first (sample dump sizes).
  [[nodiscard]] std::uint64_t septets(int count) {
    std::uint64_t v = 0;
    for (int i = 0; i < count; ++i)
      v |= static_cast<std::uint64_t>(u7()) << (7 * i);
    return v;
  }

  [[nodiscard]] std::uint16_t be16() {
    need(2);
    std::uint16_t hi = data[off], lo = data[off + 1];
    off += 2;
    return static_cast<std::uint16_t>((hi << 8) | lo);
  }

  [[nodiscard]] std::uint32_t be24() {
    need(3);
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2];
    off += 3;
    return (b0 << 16) | (b1 << 8) | b2;
  }

  [[nodiscard]] std::uint32_t be32() {
    need(4);
    std::uint32_t b0 = data[off], b1 = data[off + 1], b2 = data[off + 2],
                  b3 = data[off + 3];
    off += 4;
    return (b0 << 24) | (b1 << 16) | (b2 << 8) | b3;
  }

  void skip(std::size_t n) {
    need(n);
    off += n;
  }

  // Take the next n bytes as their own cursor and step over them.
  [[nodiscard]] Bytes slice(std::size_t n) {
    need(n);
    Bytes sub(data + off, n);
    off += n;
    return sub;
  }

  [[nodiscard]] std::vector<std::uint8_t> take(std::size_t n) {
    need(n);
    std::vector<std::uint8_t> v(data + off, data + off + n);
    off += n;
    return v;
  }

  [[nodiscard]] std::vector<std::uint8_t> rest() { return take(remaining()); }

  // Throw Invalid unless the cursor consumed everything.
  void expect_end(const char *what) const {
    if (!at_end())
      throw midi::ParseError(midi::ParseError::Kind::Invalid,
                             std::string("extra bytes after ") + what);
  }

private:
  void need(std::size_t n) const {
    if (n > size - off)
      throw midi::ParseError(midi::ParseError::Kind::UnexpectedEnd);
  }
};

// Read a MIDI VLQ (Variable Length Quantity): at most 4 bytes.
inline std::uint32_t read_vlq(Bytes &r) {
  std::uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    std::uint8_t b = r.u8();
    v = (v << 7) | (b & 0x7F);
    if ((b & 0x80) == 0)
      return v; // high bit 0 => last byte
  }
  throw midi::ParseError(midi::ParseError::Kind::VlqOverflow);
}
