// src/midi/system_real_time.hpp
// Single-byte real-time messages (0xF8-0xFF). They may appear anywhere,
// including between the bytes of another message.

#pragma once
#include <cstdint>

namespace midi {

enum class SystemRealTimeMsg : std::uint8_t {
  TimingClock = 0xF8,
  Start = 0xFA,
  Continue = 0xFB,
  Stop = 0xFC,
  ActiveSensing = 0xFE,
  SystemReset = 0xFF
};

inline bool is_real_time_status(std::uint8_t b) { return b >= 0xF8; }

inline std::uint8_t real_time_byte(SystemRealTimeMsg m) {
  return static_cast<std::uint8_t>(m);
}

// Throws ParseError(UndefinedSystemRealTimeMessage) for 0xF9 and 0xFD.
SystemRealTimeMsg read_real_time(std::uint8_t b);

const char *to_string(SystemRealTimeMsg m);

} // namespace midi
