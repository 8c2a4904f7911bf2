// src/midi/message.cpp

#include "midi/message.hpp"

#include <optional>
#include <utility>

#include "common/reader.hpp"

namespace midi {

namespace {

constexpr std::uint8_t kSysexStart = 0xF0;
constexpr std::uint8_t kMetaPrefix = 0xFF;
constexpr std::uint8_t kVelocityLsbCc =
    static_cast<std::uint8_t>(ByteCc::HighResVelocity);

std::uint8_t cc_status(Channel ch) {
  return static_cast<std::uint8_t>(0xB0 | channel_index(ch));
}

// Data bytes after a system common status byte.
int common_data_length(std::uint8_t status) {
  switch (status) {
  case 0xF1:
  case 0xF3:
    return 1;
  case 0xF2:
    return 2;
  default:
    return 0;
  }
}

std::optional<std::size_t> find_real_time(const std::uint8_t *data,
                                          std::size_t size, std::size_t from,
                                          int count) {
  for (std::size_t i = from; i < size && i < from + count; ++i) {
    if (is_real_time_status(data[i]))
      return i;
  }
  return std::nullopt;
}

// First real-time byte inside a sysex body, searching up to its F7. Other
// status bytes are left for read_sysex to reject.
std::optional<std::size_t> find_real_time_in_sysex(const std::uint8_t *data,
                                                   std::size_t size) {
  for (std::size_t i = 1; i < size; ++i) {
    if (is_real_time_status(data[i]))
      return i;
    if (data[i] & 0x80)
      break;
  }
  return std::nullopt;
}

// The real-time byte at data[at] cut a message whose data began at
// data[from]. Hold the partial message and surface the real-time one.
Decoded interrupt(std::uint8_t status, const std::uint8_t *data,
                  std::size_t from, std::size_t at, ReceiverContext &ctx) {
  const SystemRealTimeMsg rt = read_real_time(data[at]);
  ctx.interrupted.assign(1, status);
  ctx.interrupted.insert(ctx.interrupted.end(), data + from, data + at);
  return Decoded{SystemRealTime{rt}, at + 1};
}

void drop_pending_velocity(ReceiverContext &ctx, Channel ch) {
  if (ctx.pending_high_res_velocity_lsb &&
      ctx.pending_high_res_velocity_lsb->channel == ch)
    ctx.pending_high_res_velocity_lsb.reset();
}

struct PeekedControl {
  Control control;
  std::size_t end;
};

// A CC on `ch` at data[at], with or without its status byte.
std::optional<PeekedControl> peek_control(const std::uint8_t *data,
                                          std::size_t size, std::size_t at,
                                          Channel ch) {
  if (at < size && data[at] == cc_status(ch))
    ++at;
  if (at + 2 > size)
    return std::nullopt;
  const std::uint8_t number = data[at];
  const std::uint8_t value = data[at + 1];
  if (number >= 120 || (value & 0x80))
    return std::nullopt;
  return PeekedControl{read_control(number, value, true), at + 2};
}

// Fold a freshly read CC into the control held open by an earlier call,
// then into any partners that follow it in the buffer. Returns the new
// end offset.
std::size_t assemble_control(const std::uint8_t *data, std::size_t size,
                             std::size_t end, Channel ch, Control &control,
                             ReceiverContext &ctx) {
  const auto *byte = std::get_if<ByteControl>(&control);
  if (byte && byte->control == ByteCc::HighResVelocity) {
    ctx.pending_high_res_velocity_lsb = PendingVelocity{ch, byte->value};
    ctx.open_control.reset();
    return end;
  }
  drop_pending_velocity(ctx, ch);

  bool open = control_opens_merge(control);
  if (ctx.open_control && ctx.open_control->channel == ch) {
    if (auto merged = merge_controls(ctx.open_control->control, control)) {
      control = merged->control;
      open = merged->open;
    }
  }

  while (open && !ctx.parsing_smf) {
    const auto next = peek_control(data, size, end, ch);
    if (!next)
      break;
    auto merged = merge_controls(control, next->control);
    if (!merged)
      break;
    control = merged->control;
    open = merged->open;
    end = next->end;
  }

  if (open)
    ctx.open_control = OpenControl{ch, control};
  else
    ctx.open_control.reset();
  return end;
}

// Turn a note into its high resolution form when a velocity LSB is
// waiting for it or follows it directly.
std::size_t attach_velocity_lsb(const std::uint8_t *data, std::size_t size,
                                std::size_t end, Channel ch,
                                ChannelVoiceMsg &msg, ReceiverContext &ctx) {
  if (ctx.pending_high_res_velocity_lsb &&
      ctx.pending_high_res_velocity_lsb->channel == ch) {
    msg = *with_velocity_lsb(msg, ctx.pending_high_res_velocity_lsb->lsb);
    ctx.pending_high_res_velocity_lsb.reset();
    return end;
  }
  if (ctx.parsing_smf || end + 3 > size)
    return end;
  if (data[end] == cc_status(ch) && data[end + 1] == kVelocityLsbCc &&
      data[end + 2] < 0x80) {
    msg = *with_velocity_lsb(msg, data[end + 2]);
    ctx.previous_channel_status = ChannelStatus{0xB, ch};
    return end + 3;
  }
  return end;
}

// `pos` is the first data byte; `status` is the effective status byte.
Decoded decode_channel(const std::uint8_t *data, std::size_t size,
                       std::size_t pos, std::uint8_t status,
                       ReceiverContext &ctx) {
  const std::uint8_t nibble = status >> 4;
  const Channel ch = channel_from_u8(status & 0x0F);

  if (!ctx.parsing_smf) {
    if (const auto at =
            find_real_time(data, size, pos, channel_data_length(nibble)))
      return interrupt(status, data, pos, *at, ctx);
  }

  Bytes r(data + pos, size - pos);
  if (nibble == 0xB && r.peek() >= 120) {
    ChannelModeMsg mode = read_channel_mode(r);
    ctx.previous_channel_status = ChannelStatus{nibble, ch};
    ctx.open_control.reset();
    drop_pending_velocity(ctx, ch);
    return Decoded{ChannelMode{ch, mode}, pos + r.off};
  }

  ChannelVoiceMsg msg = read_channel_voice(nibble, r, ctx.complex_cc);
  ctx.previous_channel_status = ChannelStatus{nibble, ch};
  std::size_t end = pos + r.off;

  if (auto *cc = std::get_if<ControlChange>(&msg)) {
    if (ctx.complex_cc)
      end = assemble_control(data, size, end, ch, cc->control, ctx);
    else
      ctx.open_control.reset();
  } else {
    ctx.open_control.reset();
    if (is_note(msg) && ctx.complex_cc)
      end = attach_velocity_lsb(data, size, end, ch, msg, ctx);
    else
      drop_pending_velocity(ctx, ch);
  }
  return Decoded{ChannelVoice{ch, std::move(msg)}, end};
}

Decoded decode_common(const std::uint8_t *data, std::size_t size,
                      std::uint8_t status, ReceiverContext &ctx) {
  if (!ctx.parsing_smf) {
    if (const auto at =
            find_real_time(data, size, 1, common_data_length(status)))
      return interrupt(status, data, 1, *at, ctx);
  }
  Bytes r(data + 1, size - 1);
  SystemCommonMsg msg = read_system_common(status, r, ctx.time_code);
  ctx.clear_channel_state();
  return Decoded{SystemCommon{msg}, 1 + r.off};
}

// Finish the message held in ctx.interrupted with the new bytes.
Decoded resume(const std::uint8_t *data, std::size_t size,
               ReceiverContext &ctx) {
  ByteVec joined = std::move(ctx.interrupted);
  ctx.interrupted.clear();
  const std::size_t held = joined.size();
  joined.insert(joined.end(), data, data + size);
  try {
    Decoded d = decode_with_context(joined.data(), joined.size(), ctx);
    d.consumed -= held;
    return d;
  } catch (const ParseError &) {
    ctx.interrupted.assign(joined.begin(), joined.begin() + held);
    throw;
  }
}

} // namespace

bool is_channel_message(const MidiMsg &msg) {
  return std::holds_alternative<ChannelVoice>(msg) ||
         std::holds_alternative<RunningChannelVoice>(msg) ||
         std::holds_alternative<ChannelMode>(msg) ||
         std::holds_alternative<RunningChannelMode>(msg);
}

void write_message(ByteVec &out, const MidiMsg &msg) {
  if (const auto *v = std::get_if<ChannelVoice>(&msg)) {
    write_channel_voice(out, v->channel, v->msg, false);
  } else if (const auto *rv = std::get_if<RunningChannelVoice>(&msg)) {
    write_channel_voice(out, rv->channel, rv->msg, true);
  } else if (const auto *m = std::get_if<ChannelMode>(&msg)) {
    write_channel_mode(out, m->channel, m->msg, false);
  } else if (const auto *rm = std::get_if<RunningChannelMode>(&msg)) {
    write_channel_mode(out, rm->channel, rm->msg, true);
  } else if (const auto *c = std::get_if<SystemCommon>(&msg)) {
    write_system_common(out, c->msg);
  } else if (const auto *rt = std::get_if<SystemRealTime>(&msg)) {
    out.push_back(real_time_byte(rt->msg));
  } else if (const auto *sx = std::get_if<SystemExclusive>(&msg)) {
    write_sysex(out, sx->msg);
  } else if (const auto *meta = std::get_if<Meta>(&msg)) {
    out.push_back(kMetaPrefix);
    write_meta(out, meta->msg);
  }
}

ByteVec encode(const MidiMsg &msg) {
  ByteVec out;
  write_message(out, msg);
  return out;
}

ByteVec encode_many(const std::vector<MidiMsg> &msgs) {
  ByteVec out;
  out.reserve(msgs.size() * 3);
  for (const auto &m : msgs)
    write_message(out, m);
  return out;
}

Decoded decode(const std::uint8_t *data, std::size_t size) {
  ReceiverContext ctx;
  return decode_with_context(data, size, ctx);
}

Decoded decode(const ByteVec &bytes) {
  return decode(bytes.data(), bytes.size());
}

Decoded decode_with_context(const std::uint8_t *data, std::size_t size,
                            ReceiverContext &ctx) {
  if (!ctx.interrupted.empty())
    return resume(data, size, ctx);
  if (size == 0)
    throw ParseError(ParseError::Kind::UnexpectedEnd);

  const std::uint8_t first = data[0];
  if (first < 0x80) {
    if (!ctx.previous_channel_status)
      throw ParseError(ParseError::Kind::ContextlessRunningStatus);
    const ChannelStatus prev = *ctx.previous_channel_status;
    const auto status = static_cast<std::uint8_t>(
        (prev.nibble << 4) | channel_index(prev.channel));
    return decode_channel(data, size, 0, status, ctx);
  }
  if (first < 0xF0)
    return decode_channel(data, size, 1, first, ctx);

  if (first == kSysexStart) {
    if (!ctx.parsing_smf) {
      if (const auto at = find_real_time_in_sysex(data, size))
        return interrupt(first, data, 1, *at, ctx);
    }
    Bytes r(data, size);
    SystemExclusiveMsg msg = read_sysex(r, ctx);
    ctx.clear_channel_state();
    return Decoded{SystemExclusive{std::move(msg)}, r.off};
  }
  if (first == kMetaPrefix && ctx.parsing_smf) {
    Bytes r(data + 1, size - 1);
    MetaMsg msg = read_meta(r);
    ctx.clear_channel_state();
    return Decoded{Meta{std::move(msg)}, 1 + r.off};
  }
  if (is_real_time_status(first))
    return Decoded{SystemRealTime{read_real_time(first)}, 1};
  return decode_common(data, size, first, ctx);
}

Decoded decode_with_context(const ByteVec &bytes, ReceiverContext &ctx) {
  return decode_with_context(bytes.data(), bytes.size(), ctx);
}

} // namespace midi
