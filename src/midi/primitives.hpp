// src/midi/primitives.hpp
// Byte-level packing used by every message family:
//  - 7-bit / 14-bit unsigned and biased-signed fields
//  - 21/28/35-bit septet groups (LSB first), used by sample dumps
//  - SMF variable-length quantities
//  - the XOR checksum of packet-style sysex
//
// Encoders clamp to the field width and never fail. Decoders of single
// fields live on the Bytes cursor (common/reader.hpp).
//
// Byte order is a property of the surrounding message, not of the field:
// channel and most sysex fields go LSB first, while tuning fractions and
// time-code hours go MSB first. Each caller picks the helper it needs.

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace midi {

using ByteVec = std::vector<std::uint8_t>;

constexpr std::uint32_t kMaxVlq = 0x0FFFFFFF;

// --- 7 bit ---
[[nodiscard]] std::uint8_t encode_u7(unsigned x);
// Throws ParseError(ByteOverflow) when the top bit is set.
[[nodiscard]] std::uint8_t decode_u7(std::uint8_t b);
// -64..63 biased by 64.
[[nodiscard]] std::uint8_t i_to_u7(int x);
[[nodiscard]] std::int8_t u7_to_i(std::uint8_t x);

// --- 14 bit ---
// Returns {msb, lsb}, saturating at 0x3FFF.
[[nodiscard]] std::array<std::uint8_t, 2> to_u14(unsigned x);
// -8192..8191 biased by 8192, returned as {msb, lsb}.
[[nodiscard]] std::array<std::uint8_t, 2> i_to_u14(int x);
// Two's-complement 14 bit, returned as {msb, lsb}. Used by bar markers.
[[nodiscard]] std::array<std::uint8_t, 2> to_i14(int x);
[[nodiscard]] std::uint16_t u14_from_u7s(std::uint8_t msb, std::uint8_t lsb);
[[nodiscard]] std::int16_t i14_from_u7s(std::uint8_t msb, std::uint8_t lsb);
[[nodiscard]] std::int16_t twos_i14_from_u7s(std::uint8_t msb,
                                             std::uint8_t lsb);
// Keep the upper 7 bits of a 14-bit value and swap in a new low septet.
[[nodiscard]] std::uint16_t replace_u14_lsb(std::uint16_t value,
                                            std::uint8_t lsb);

void push_u7(ByteVec &out, unsigned x);
void push_u14(ByteVec &out, unsigned x); // LSB first
void push_u14_msb_first(ByteVec &out, unsigned x);
void push_i14(ByteVec &out, int x); // biased, LSB first
void push_u21(ByteVec &out, std::uint32_t x);
void push_u28(ByteVec &out, std::uint32_t x);
void push_u35(ByteVec &out, std::uint64_t x);

// --- VLQ ---
void push_vlq(ByteVec &out, std::uint32_t x);
[[nodiscard]] ByteVec encode_vlq(std::uint32_t x);
// Returns {value, bytes consumed}. Throws UnexpectedEnd / VlqOverflow.
[[nodiscard]] std::pair<std::uint32_t, std::size_t>
decode_vlq(const std::uint8_t *data, std::size_t size);

// --- checksum ---
[[nodiscard]] std::uint8_t checksum(const std::uint8_t *data,
                                    std::size_t size);

// --- nibbles ---
// {high, low}
[[nodiscard]] std::array<std::uint8_t, 2> to_nibbles(std::uint8_t x);

} // namespace midi
