// src/midi/context.hpp
// Receiver state threaded through decode_with_context(). One instance per
// input stream; it is plain data and may be copied freely.

#pragma once
#include <cstdint>
#include <optional>

#include "midi/channel.hpp"
#include "midi/control_change.hpp"
#include "midi/primitives.hpp"
#include "midi/time_code.hpp"

namespace midi {

struct ChannelStatus {
  std::uint8_t nibble = 0x8; // 0x8..0xE
  Channel channel = Channel::Ch1;
};

inline bool operator==(const ChannelStatus &a, const ChannelStatus &b) {
  return a.nibble == b.nibble && a.channel == b.channel;
}

// Velocity LSB announced by a standalone CC 88.
struct PendingVelocity {
  Channel channel = Channel::Ch1;
  std::uint8_t lsb = 0;
};

// A decoded control that a later CC on the same channel may complete.
struct OpenControl {
  Channel channel = Channel::Ch1;
  Control control;
};

struct ReceiverContext {
  // Set by every channel message; cleared by system common and sysex.
  std::optional<ChannelStatus> previous_channel_status;
  std::optional<PendingVelocity> pending_high_res_velocity_lsb;
  std::optional<OpenControl> open_control;

  // Bytes of a message cut short by a real-time byte, status included.
  // The next decode call resumes it.
  ByteVec interrupted;

  // Rebuilt from quarter frames and full time code messages.
  TimeCode time_code;

  bool is_smf_sysex = false; // sysex body arrives without its F0
  bool parsing_smf = false;  // 0xFF starts a meta event, not a reset
  bool complex_cc = true;    // assemble CC pairs and parameter numbers

  // The context used for the events of one SMF track.
  static ReceiverContext for_smf() {
    ReceiverContext ctx;
    ctx.parsing_smf = true;
    ctx.complex_cc = false;
    return ctx;
  }

  // Forget everything tied to the previous channel message.
  void clear_channel_state() {
    previous_channel_status.reset();
    open_control.reset();
  }
};

} // namespace midi
