// src/midi/message.hpp
// Top-level MIDI message: one tagged union over every message family,
// plus the encode/decode entry points.
//
// Decoding reads one message from the head of a buffer and reports how
// many bytes it used. decode_with_context() threads receiver state
// (running status, CC assembly, time code, SMF mode) between calls; the
// plain decode() starts from a fresh context each time.
//
// Rules applied by decode_with_context():
//  - A data byte in status position reuses ctx.previous_channel_status.
//  - 0xBn with controller >= 120 is a channel mode message.
//  - With complex_cc, CC pairs (14-bit values, RPN/NRPN selection and data
//    entry) are assembled. Pairs contiguous in the buffer are merged in the
//    same call; a partner arriving in a later call completes the control
//    held in ctx.open_control.
//  - A note followed by `Bn 58 lsb` becomes a HighResNoteOn/Off. A lone
//    CC 88 is kept for the next note on its channel.
//  - A real-time byte inside a channel, system common or system exclusive
//    message is returned on its own; the partial message waits in
//    ctx.interrupted.
//  - With parsing_smf, 0xFF starts a meta event and look-ahead is off.

#pragma once
#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "midi/channel.hpp"
#include "midi/channel_mode.hpp"
#include "midi/channel_voice.hpp"
#include "midi/context.hpp"
#include "midi/meta.hpp"
#include "midi/primitives.hpp"
#include "midi/sysex/sysex.hpp"
#include "midi/system_common.hpp"
#include "midi/system_real_time.hpp"

namespace midi {

struct ChannelVoice {
  Channel channel = Channel::Ch1;
  ChannelVoiceMsg msg;
};

// Sent without a status byte; `channel` is not written.
struct RunningChannelVoice {
  Channel channel = Channel::Ch1;
  ChannelVoiceMsg msg;
};

struct ChannelMode {
  Channel channel = Channel::Ch1;
  ChannelModeMsg msg;
};

struct RunningChannelMode {
  Channel channel = Channel::Ch1;
  ChannelModeMsg msg;
};

struct SystemCommon {
  SystemCommonMsg msg;
};

struct SystemRealTime {
  SystemRealTimeMsg msg = SystemRealTimeMsg::TimingClock;
};

struct SystemExclusive {
  SystemExclusiveMsg msg;
};

// Only inside SMF tracks.
struct Meta {
  MetaMsg msg;
};

using MidiMsg =
    std::variant<ChannelVoice, RunningChannelVoice, ChannelMode,
                 RunningChannelMode, SystemCommon, SystemRealTime,
                 SystemExclusive, Meta>;

inline bool operator==(const ChannelVoice &a, const ChannelVoice &b) {
  return a.channel == b.channel && a.msg == b.msg;
}
inline bool operator==(const RunningChannelVoice &a,
                       const RunningChannelVoice &b) {
  return a.channel == b.channel && a.msg == b.msg;
}
inline bool operator==(const ChannelMode &a, const ChannelMode &b) {
  return a.channel == b.channel && a.msg == b.msg;
}
inline bool operator==(const RunningChannelMode &a,
                       const RunningChannelMode &b) {
  return a.channel == b.channel && a.msg == b.msg;
}
inline bool operator==(const SystemCommon &a, const SystemCommon &b) {
  return a.msg == b.msg;
}
inline bool operator==(const SystemRealTime &a, const SystemRealTime &b) {
  return a.msg == b.msg;
}
inline bool operator==(const SystemExclusive &a, const SystemExclusive &b) {
  return a.msg == b.msg;
}
inline bool operator==(const Meta &a, const Meta &b) { return a.msg == b.msg; }

// True for the four channel forms.
bool is_channel_message(const MidiMsg &msg);

// Append the wire form of msg. Meta events get their FF prefix.
void write_message(ByteVec &out, const MidiMsg &msg);

[[nodiscard]] ByteVec encode(const MidiMsg &msg);
[[nodiscard]] ByteVec encode_many(const std::vector<MidiMsg> &msgs);

struct Decoded {
  MidiMsg msg;
  std::size_t consumed = 0;
};

// Fresh context per call: running status and split sysex fail.
[[nodiscard]] Decoded decode(const std::uint8_t *data, std::size_t size);
[[nodiscard]] Decoded decode(const ByteVec &bytes);

[[nodiscard]] Decoded decode_with_context(const std::uint8_t *data,
                                          std::size_t size,
                                          ReceiverContext &ctx);
[[nodiscard]] Decoded decode_with_context(const ByteVec &bytes,
                                          ReceiverContext &ctx);

} // namespace midi
