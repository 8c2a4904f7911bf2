// src/midi/smf.cpp
// Parse and build Standard MIDI Files (SMF) in memory.
// Pure data transformation: no printing, no I/O.

#include "midi/smf.hpp"
#include "common/reader.hpp" // Bytes cursor + read_vlq()

#include <algorithm>
#include <cstdint>
#include <optional>
#include <sstream>
#include <utility>

namespace {

using midi::ParseError;

constexpr std::uint32_t kMThd = 0x4D546864; // "MThd"
constexpr std::uint32_t kMTrk = 0x4D54726B; // "MTrk"
constexpr std::uint8_t kMetaEvent = 0xFF;
constexpr std::uint8_t kSysexEvent = 0xF0;
constexpr std::uint8_t kEscapeEvent = 0xF7;
constexpr std::size_t kNextBytes = 20;

// Where the parser is; reported by SmfParseError.
struct Progress {
  std::size_t offset = 0;
  std::string parsing = "header";
};

void push_be16(midi::ByteVec &out, std::uint16_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 8));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

void push_be32(midi::ByteVec &out, std::uint32_t v) {
  out.push_back(static_cast<std::uint8_t>(v >> 24));
  out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
  out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
  out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

// The high division byte holds -fps in two's complement.
midi::TimeCodeType fps_from_division_byte(std::uint8_t hi) {
  switch (256 - hi) {
  case 24:
    return midi::TimeCodeType::FPS24;
  case 25:
    return midi::TimeCodeType::FPS25;
  case 29:
    return midi::TimeCodeType::DF30;
  case 30:
    return midi::TimeCodeType::NDF30;
  default:
    throw ParseError(ParseError::Kind::Invalid, "invalid SMPTE frame rate");
  }
}

std::uint8_t division_byte_from_fps(midi::TimeCodeType fps) {
  int n = 30;
  switch (fps) {
  case midi::TimeCodeType::FPS24:
    n = 24;
    break;
  case midi::TimeCodeType::FPS25:
    n = 25;
    break;
  case midi::TimeCodeType::DF30:
    n = 29;
    break;
  case midi::TimeCodeType::NDF30:
    n = 30;
    break;
  }
  return static_cast<std::uint8_t>(256 - n);
}

// Parse the MThd chunk.
midi::Header parse_header(Bytes &r) {
  if (r.remaining() < 14) {
    throw ParseError(ParseError::Kind::UnexpectedEnd);
  }
  if (r.be32() != kMThd) {
    throw ParseError(ParseError::Kind::Invalid,
                     "not a MIDI file (missing 'MThd')");
  }
  if (r.be32() != 6) {
    throw ParseError(ParseError::Kind::Invalid,
                     "header chunk length must be 6");
  }

  const std::uint16_t format = r.be16();
  if (format > 2) {
    throw ParseError(ParseError::Kind::Invalid, "invalid SMF format");
  }

  midi::Header h;
  h.format = static_cast<midi::SmfFormat>(format);
  h.num_tracks = r.be16();

  const std::uint8_t hi = r.u8();
  const std::uint8_t lo = r.u8();
  if (hi & 0x80) {
    h.division = midi::Division::time_code(fps_from_division_byte(hi), lo);
  } else {
    h.division = midi::Division::metrical(
        static_cast<std::uint16_t>((hi << 8) | lo));
  }
  return h;
}

// A sysex split into an F0 packet and F7 continuation packets. The
// assembled message is placed at the last packet, with the deltas of all
// packets added up.
struct SplitSysex {
  midi::ByteVec body; // after the F0
  std::uint32_t delta = 0;
};

bool is_end_of_track(const midi::MidiMsg &msg) {
  const auto *meta = std::get_if<midi::Meta>(&msg);
  return meta && std::holds_alternative<midi::EndOfTrack>(meta->msg);
}

// Decode a complete sysex body (no F0, F7 included) with the SMF context.
midi::SystemExclusiveMsg read_smf_sysex(Bytes &body,
                                        midi::ReceiverContext &ctx) {
  ctx.is_smf_sysex = true;
  midi::SystemExclusiveMsg msg = midi::read_sysex(body, ctx);
  ctx.is_smf_sysex = false;
  body.expect_end("system exclusive event");
  ctx.clear_channel_state();
  return msg;
}

bool ends_sysex(const Bytes &body) {
  return body.size > 0 && body.data[body.size - 1] == kEscapeEvent;
}

// One `delta event` pair. `r` runs to the end of the file so that an event
// overrunning its track can be told apart from a truncated file. Returns
// nothing for a sysex packet that is not the last of its message.
std::optional<midi::TrackEvent> read_event(Bytes &r, midi::ReceiverContext &ctx,
                                           const midi::Division &division,
                                           double &last_beat_or_frame,
                                           SplitSysex &split) {
  midi::TrackEvent ev;
  ev.delta_time = read_vlq(r);
  ev.beat_or_frame =
      last_beat_or_frame + division.ticks_to_beats_or_frames(ev.delta_time);
  last_beat_or_frame = ev.beat_or_frame;

  const std::uint8_t first = r.peek();
  if (ctx.is_smf_sysex && first != kEscapeEvent) {
    throw ParseError(ParseError::Kind::Invalid,
                     "split system exclusive interrupted by another event");
  }

  if (first == kMetaEvent) {
    r.skip(1);
    ev.event = midi::Meta{midi::read_meta(r)};
    ctx.clear_channel_state();
  } else if (first == kSysexEvent) {
    r.skip(1);
    const std::uint32_t len = read_vlq(r);
    Bytes body = r.slice(len);
    if (!ends_sysex(body)) {
      split.body = body.rest();
      split.delta = ev.delta_time;
      ctx.is_smf_sysex = true;
      return std::nullopt;
    }
    ev.event = midi::SystemExclusive{read_smf_sysex(body, ctx)};
  } else if (first == kEscapeEvent && ctx.is_smf_sysex) {
    r.skip(1);
    const std::uint32_t len = read_vlq(r);
    Bytes body = r.slice(len);
    split.delta += ev.delta_time;
    split.body.insert(split.body.end(), body.here(), body.here() + len);
    if (!ends_sysex(body))
      return std::nullopt;

    Bytes whole(split.body);
    ev.delta_time = split.delta;
    ev.event = midi::SystemExclusive{read_smf_sysex(whole, ctx)};
    split = SplitSysex{};
  } else if (first == kEscapeEvent) {
    r.skip(1);
    const std::uint32_t len = read_vlq(r);
    Bytes body = r.slice(len);
    // Escaped bytes are plain wire data: 0xFF is a reset, not a meta event.
    ctx.parsing_smf = false;
    midi::Decoded d = midi::decode_with_context(body.here(), len, ctx);
    ctx.parsing_smf = true;
    if (d.consumed != len || !ctx.interrupted.empty()) {
      throw ParseError(ParseError::Kind::Invalid,
                       "escaped event length does not match its contents");
    }
    ev.event = std::move(d.msg);
  } else {
    midi::Decoded d = midi::decode_with_context(r.here(), r.remaining(), ctx);
    r.skip(d.consumed);
    ev.event = std::move(d.msg);
  }
  return ev;
}

// Walk a single chunk and append it to file.tracks.
void walk_one_track(Bytes &r, midi::MidiFile &file, std::uint16_t index,
                    Progress &at) {
  at.offset = r.off;
  at.parsing = "track " + std::to_string(index);
  if (r.remaining() < 8) {
    throw ParseError(ParseError::Kind::UnexpectedEnd);
  }

  const std::size_t chunk_start = r.off;
  const std::uint32_t id = r.be32();
  const std::uint32_t len = r.be32();
  if (r.remaining() < len) {
    throw ParseError(ParseError::Kind::UnexpectedEnd);
  }

  if (id != kMTrk) {
    r.off = chunk_start;
    midi::Track alien;
    alien.alien_chunk = r.take(static_cast<std::size_t>(len) + 8);
    file.tracks.push_back(std::move(alien));
    return;
  }

  file.tracks.emplace_back();
  std::vector<midi::TrackEvent> &events = file.tracks.back().events;
  const std::size_t track_end = r.off + len;
  midi::ReceiverContext ctx = midi::ReceiverContext::for_smf();
  SplitSysex split;
  double last = 0.0;

  for (std::size_t i = 0; r.off < track_end; ++i) {
    at.offset = r.off;
    at.parsing = "track " + std::to_string(index) + " event " +
                 std::to_string(i);

    std::optional<midi::TrackEvent> ev =
        read_event(r, ctx, file.header.division, last, split);
    if (r.off > track_end) {
      if (ev)
        events.push_back(std::move(*ev));
      throw ParseError(ParseError::Kind::Invalid,
                       "track length exceeded the provided length");
    }
    if (!ev)
      continue;

    const bool done = is_end_of_track(ev->event);
    events.push_back(std::move(*ev));
    if (done) {
      r.off = track_end; // anything after EndOfTrack is dropped
      break;
    }
  }

  if (ctx.is_smf_sysex) {
    at.offset = r.off;
    throw ParseError(ParseError::Kind::NoEndOfSystemExclusiveFlag,
                     "track ended inside a split system exclusive");
  }
}

void write_header(midi::ByteVec &out, const midi::Header &h) {
  push_be32(out, kMThd);
  push_be32(out, 6);
  push_be16(out, static_cast<std::uint16_t>(h.format));
  push_be16(out, h.num_tracks);
  if (h.division.is_time_code) {
    out.push_back(division_byte_from_fps(h.division.fps));
    out.push_back(h.division.ticks_per_frame);
  } else {
    push_be16(out, std::min<std::uint16_t>(
                       h.division.ticks_per_quarter_note, 0x7FFF));
  }
}

// A channel message may be several wire messages (14-bit CCs, parameter
// numbers, high resolution notes). Each becomes its own event so that
// every event holds exactly one message.
void write_channel_event(midi::ByteVec &out, std::uint32_t delta,
                         const midi::ByteVec &bytes, std::uint8_t nibble) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    std::size_t len = 0;
    if (bytes[i] & 0x80) {
      nibble = bytes[i] >> 4;
      len = 1;
    }
    len += static_cast<std::size_t>(midi::channel_data_length(nibble));
    const std::size_t end = std::min(i + len, bytes.size());

    midi::push_vlq(out, i == 0 ? delta : 0);
    out.insert(out.end(), bytes.begin() + i, bytes.begin() + end);
    i = end;
  }
}

void write_event(midi::ByteVec &out, const midi::TrackEvent &ev) {
  const midi::MidiMsg &msg = ev.event;

  if (const auto *meta = std::get_if<midi::Meta>(&msg)) {
    midi::push_vlq(out, ev.delta_time);
    out.push_back(kMetaEvent);
    midi::write_meta(out, meta->msg);
    return;
  }

  const midi::ByteVec bytes = midi::encode(msg);
  if (!midi::is_channel_message(msg)) {
    // The escape form works for every system message, not only sysex.
    midi::push_vlq(out, ev.delta_time);
    out.push_back(kEscapeEvent);
    midi::push_vlq(out, static_cast<std::uint32_t>(bytes.size()));
    out.insert(out.end(), bytes.begin(), bytes.end());
    return;
  }

  std::uint8_t nibble = 0xB;
  if (const auto *rv = std::get_if<midi::RunningChannelVoice>(&msg))
    nibble = midi::voice_status_nibble(rv->msg);
  write_channel_event(out, ev.delta_time, bytes, nibble);
}

void write_track(midi::ByteVec &out, const midi::Track &track) {
  if (track.is_alien()) {
    out.insert(out.end(), track.alien_chunk.begin(), track.alien_chunk.end());
    return;
  }

  push_be32(out, kMTrk);
  const std::size_t len_at = out.size();
  push_be32(out, 0); // patched below

  for (const auto &ev : track.events) {
    write_event(out, ev);
  }

  const auto len = static_cast<std::uint32_t>(out.size() - len_at - 4);
  out[len_at] = static_cast<std::uint8_t>(len >> 24);
  out[len_at + 1] = static_cast<std::uint8_t>((len >> 16) & 0xFF);
  out[len_at + 2] = static_cast<std::uint8_t>((len >> 8) & 0xFF);
  out[len_at + 3] = static_cast<std::uint8_t>(len & 0xFF);
}

std::string describe_failure(const ParseError &error, std::size_t offset,
                             const std::string &parsing) {
  std::ostringstream oss;
  oss << "Error parsing MIDI file at offset " << offset << " (" << parsing
      << "): " << error.what();
  return oss.str();
}

} // namespace

namespace midi {

Division Division::metrical(std::uint16_t ticks_per_quarter_note) {
  Division d;
  d.is_time_code = false;
  d.ticks_per_quarter_note = ticks_per_quarter_note;
  return d;
}

Division Division::time_code(TimeCodeType fps, std::uint8_t ticks_per_frame) {
  Division d;
  d.is_time_code = true;
  d.fps = fps;
  d.ticks_per_frame = ticks_per_frame;
  return d;
}

std::uint32_t Division::beat_or_frame_to_tick(double beat_or_frame) const {
  const double per = is_time_code ? ticks_per_frame : ticks_per_quarter_note;
  const double ticks = beat_or_frame * per;
  return ticks <= 0.0 ? 0u : static_cast<std::uint32_t>(ticks);
}

double Division::ticks_to_beats_or_frames(std::uint32_t ticks) const {
  const double per = is_time_code ? ticks_per_frame : ticks_per_quarter_note;
  return per > 0.0 ? ticks / per : 0.0;
}

bool operator==(const Division &a, const Division &b) {
  if (a.is_time_code != b.is_time_code)
    return false;
  if (a.is_time_code)
    return a.fps == b.fps && a.ticks_per_frame == b.ticks_per_frame;
  return a.ticks_per_quarter_note == b.ticks_per_quarter_note;
}

void MidiFile::add_track(Track track) {
  tracks.push_back(std::move(track));
  ++header.num_tracks;
}

void MidiFile::remove_track(std::size_t index) {
  if (index >= tracks.size()) {
    throw std::out_of_range("no track " + std::to_string(index));
  }
  tracks.erase(tracks.begin() + static_cast<std::ptrdiff_t>(index));
  if (header.num_tracks > 0)
    --header.num_tracks;
}

void MidiFile::extend_track(std::size_t index, MidiMsg event,
                            double beat_or_frame) {
  Track &track = tracks.at(index);
  if (track.is_alien()) {
    throw std::invalid_argument("cannot add events to a non-MTrk chunk");
  }

  const double last =
      track.events.empty() ? 0.0 : track.events.back().beat_or_frame;
  const std::uint32_t last_tick = header.division.beat_or_frame_to_tick(last);
  const std::uint32_t tick = header.division.beat_or_frame_to_tick(beat_or_frame);

  TrackEvent ev;
  ev.delta_time = tick > last_tick ? tick - last_tick : 0;
  ev.event = std::move(event);
  ev.beat_or_frame = beat_or_frame;
  track.events.push_back(std::move(ev));
}

SmfParseError::SmfParseError(ParseError error, MidiFile partial,
                             std::size_t offset, std::string parsing,
                             std::size_t remaining, ByteVec next_bytes)
    : std::runtime_error(describe_failure(error, offset, parsing)),
      error_(std::move(error)), file_(std::move(partial)), offset_(offset),
      parsing_(std::move(parsing)), remaining_(remaining),
      next_bytes_(std::move(next_bytes)) {}

MidiFile parse_smf(const std::uint8_t *data, std::size_t size) {
  MidiFile file;
  Bytes r(data, size);
  Progress at;

  try {
    file.header = parse_header(r);
    for (std::uint16_t i = 0; i < file.header.num_tracks; ++i) {
      walk_one_track(r, file, i, at);
    }
  } catch (const ParseError &e) {
    const std::size_t offset = std::min(at.offset, size);
    const std::size_t n = std::min(kNextBytes, size - offset);
    throw SmfParseError(e, std::move(file), offset, at.parsing, size - offset,
                        ByteVec(data + offset, data + offset + n));
  }
  return file;
}

MidiFile parse_smf(const ByteVec &bytes) {
  return parse_smf(bytes.data(), bytes.size());
}

ByteVec encode_smf(const MidiFile &file) {
  ByteVec out;
  write_header(out, file.header);
  for (const auto &track : file.tracks) {
    write_track(out, track);
  }
  return out;
}

} // namespace midi
