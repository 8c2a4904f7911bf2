// src/midi/channel_mode.cpp

#include "midi/channel_mode.hpp"

#include <algorithm>

#include "common/reader.hpp"
#include "midi/error.hpp"

namespace midi {

void write_channel_mode(ByteVec &out, Channel ch, const ChannelModeMsg &msg,
                        bool running) {
  if (!running)
    out.push_back(static_cast<std::uint8_t>(0xB0 | channel_index(ch)));

  std::uint8_t control = 120;
  std::uint8_t value = 0;
  if (std::holds_alternative<AllSoundOff>(msg)) {
    control = 120;
  } else if (std::holds_alternative<ResetAllControllers>(msg)) {
    control = 121;
  } else if (const auto *l = std::get_if<LocalControl>(&msg)) {
    control = 122;
    value = l->on ? 127 : 0;
  } else if (std::holds_alternative<AllNotesOff>(msg)) {
    control = 123;
  } else if (const auto *o = std::get_if<OmniMode>(&msg)) {
    control = o->on ? 125 : 124;
  } else if (const auto *m = std::get_if<MonoMode>(&msg)) {
    control = 126;
    value = std::min<std::uint8_t>(m->channels, 16);
  } else {
    control = 127;
  }
  out.push_back(control);
  out.push_back(value);
}

ChannelModeMsg read_channel_mode(Bytes &r) {
  const std::uint8_t control = r.u7();
  const std::uint8_t value = r.u7();
  switch (control) {
  case 120:
    return AllSoundOff{};
  case 121:
    return ResetAllControllers{};
  case 122:
    return LocalControl{value >= 0x40};
  case 123:
    return AllNotesOff{};
  case 124:
    return OmniMode{false};
  case 125:
    return OmniMode{true};
  case 126:
    return MonoMode{std::min<std::uint8_t>(value, 16)};
  case 127:
    return PolyMode{};
  default:
    throw ParseError(ParseError::Kind::Invalid,
                     "controller number is not a channel mode message");
  }
}

} // namespace midi
