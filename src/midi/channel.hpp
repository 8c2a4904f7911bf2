// src/midi/channel.hpp
// MIDI channel 1..16, stored as the 0..15 value that goes in the low
// nibble of a status byte.

#pragma once
#include <cstdint>

namespace midi {

enum class Channel : std::uint8_t {
  Ch1 = 0,
  Ch2,
  Ch3,
  Ch4,
  Ch5,
  Ch6,
  Ch7,
  Ch8,
  Ch9,
  Ch10,
  Ch11,
  Ch12,
  Ch13,
  Ch14,
  Ch15,
  Ch16
};

// Values above 15 map to Ch16.
inline Channel channel_from_u8(std::uint8_t x) {
  return static_cast<Channel>(x > 15 ? 15 : x);
}

inline std::uint8_t channel_index(Channel ch) {
  return static_cast<std::uint8_t>(ch);
}

// 1-based number, as printed on hardware.
inline int channel_number(Channel ch) { return channel_index(ch) + 1; }

} // namespace midi
