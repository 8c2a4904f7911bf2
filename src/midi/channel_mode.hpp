// src/midi/channel_mode.hpp
// Channel mode messages: status 0xBn with controller numbers 120-127.

#pragma once
#include <cstdint>
#include <variant>

#include "midi/channel.hpp"
#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

struct AllSoundOff {};
struct ResetAllControllers {};
struct LocalControl {
  bool on = true;
};
struct AllNotesOff {};
struct OmniMode {
  bool on = true;
};
// Mono mode with a channel count (0 = as many as voices, max 16).
struct MonoMode {
  std::uint8_t channels = 0;
};
struct PolyMode {};

using ChannelModeMsg = std::variant<AllSoundOff, ResetAllControllers,
                                    LocalControl, AllNotesOff, OmniMode,
                                    MonoMode, PolyMode>;

inline bool operator==(const AllSoundOff &, const AllSoundOff &) {
  return true;
}
inline bool operator==(const ResetAllControllers &,
                       const ResetAllControllers &) {
  return true;
}
inline bool operator==(const LocalControl &a, const LocalControl &b) {
  return a.on == b.on;
}
inline bool operator==(const AllNotesOff &, const AllNotesOff &) {
  return true;
}
inline bool operator==(const OmniMode &a, const OmniMode &b) {
  return a.on == b.on;
}
inline bool operator==(const MonoMode &a, const MonoMode &b) {
  return a.channels == b.channels;
}
inline bool operator==(const PolyMode &, const PolyMode &) { return true; }

void write_channel_mode(ByteVec &out, Channel ch, const ChannelModeMsg &msg,
                        bool running);

// Reads `controller value`; the controller must be 120-127.
ChannelModeMsg read_channel_mode(Bytes &r);

} // namespace midi
