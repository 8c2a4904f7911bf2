// src/midi/system_real_time.cpp

#include "midi/system_real_time.hpp"

#include "midi/error.hpp"

namespace midi {

SystemRealTimeMsg read_real_time(std::uint8_t b) {
  switch (b) {
  case 0xF8:
  case 0xFA:
  case 0xFB:
  case 0xFC:
  case 0xFE:
  case 0xFF:
    return static_cast<SystemRealTimeMsg>(b);
  default:
    throw ParseError(ParseError::Kind::UndefinedSystemRealTimeMessage, b);
  }
}

const char *to_string(SystemRealTimeMsg m) {
  switch (m) {
  case SystemRealTimeMsg::TimingClock:
    return "TimingClock";
  case SystemRealTimeMsg::Start:
    return "Start";
  case SystemRealTimeMsg::Continue:
    return "Continue";
  case SystemRealTimeMsg::Stop:
    return "Stop";
  case SystemRealTimeMsg::ActiveSensing:
    return "ActiveSensing";
  case SystemRealTimeMsg::SystemReset:
    return "SystemReset";
  }
  return "?";
}

} // namespace midi
