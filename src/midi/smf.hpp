// src/midi/smf.hpp
// Standard MIDI File (SMF 1.0): an MThd header chunk followed by track
// chunks. MTrk chunks are decoded into events; any other chunk is kept
// verbatim so it survives a decode/encode cycle.
//
// Track events are `vlq delta` followed by:
//   FF type len data   meta event
//   F0 len data        sysex, body without the leading F0
//   F7 len bytes       escaped bytes (system messages, sysex)
//   anything else      a channel message; running status applies
//
// An F0 event without a closing F7 starts a split sysex. The F7 events
// after it carry the rest, up to one ending in F7; the message is placed
// at that last packet with the packet deltas summed.
//
// The encoder writes meta events with FF, every other system message in the
// F7 escape form, and channel messages that span several wire messages as
// one event per wire message (the extra ones at delta 0).

#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "midi/error.hpp"
#include "midi/message.hpp"
#include "midi/primitives.hpp"
#include "midi/time_code.hpp"

namespace midi {

enum class SmfFormat : std::uint16_t {
  Single = 0,    // one track
  Multi = 1,     // simultaneous tracks
  MultiSong = 2  // independent patterns
};

// Meaning of delta times. Metrical files count ticks per quarter note;
// time code files count ticks per SMPTE frame.
struct Division {
  bool is_time_code = false;
  std::uint16_t ticks_per_quarter_note = 96; // metrical, 15 bits
  TimeCodeType fps = TimeCodeType::FPS24;    // time code
  std::uint8_t ticks_per_frame = 40;         // time code

  static Division metrical(std::uint16_t ticks_per_quarter_note);
  static Division time_code(TimeCodeType fps, std::uint8_t ticks_per_frame);

  // Quarter notes or frames -> ticks (truncating).
  [[nodiscard]] std::uint32_t beat_or_frame_to_tick(double beat_or_frame) const;
  [[nodiscard]] double ticks_to_beats_or_frames(std::uint32_t ticks) const;
};

bool operator==(const Division &a, const Division &b);

struct Header {
  SmfFormat format = SmfFormat::Multi;
  std::uint16_t num_tracks = 0;
  Division division;
};

inline bool operator==(const Header &a, const Header &b) {
  return a.format == b.format && a.num_tracks == b.num_tracks &&
         a.division == b.division;
}

struct TrackEvent {
  std::uint32_t delta_time = 0;
  MidiMsg event;
  // Position in quarter notes or frames. Derived while decoding; not
  // written to the file and not compared.
  double beat_or_frame = 0.0;
};

inline bool operator==(const TrackEvent &a, const TrackEvent &b) {
  return a.delta_time == b.delta_time && a.event == b.event;
}

struct Track {
  std::vector<TrackEvent> events;
  // A non-MTrk chunk, tag and length included. Empty for MIDI tracks.
  ByteVec alien_chunk;

  [[nodiscard]] bool is_alien() const { return !alien_chunk.empty(); }
  // Events in a MIDI track, bytes in an alien chunk.
  [[nodiscard]] std::size_t size() const {
    return is_alien() ? alien_chunk.size() : events.size();
  }
};

inline bool operator==(const Track &a, const Track &b) {
  return a.events == b.events && a.alien_chunk == b.alien_chunk;
}

struct MidiFile {
  Header header;
  std::vector<Track> tracks;

  // Both keep header.num_tracks in step with tracks.
  void add_track(Track track);
  void remove_track(std::size_t index); // throws std::out_of_range

  // Append `event` at an absolute position; the delta time is taken from
  // the previous event of the track. Throws std::out_of_range for a bad
  // index and std::invalid_argument for an alien chunk.
  void extend_track(std::size_t index, MidiMsg event, double beat_or_frame);
};

inline bool operator==(const MidiFile &a, const MidiFile &b) {
  return a.header == b.header && a.tracks == b.tracks;
}

// Thrown by parse_smf. Carries what was decoded before the failure and
// where it happened.
class SmfParseError : public std::runtime_error {
public:
  SmfParseError(ParseError error, MidiFile partial, std::size_t offset,
                std::string parsing, std::size_t remaining,
                ByteVec next_bytes);

  const ParseError &error() const noexcept { return error_; }
  const MidiFile &partial_file() const noexcept { return file_; }
  std::size_t offset() const noexcept { return offset_; }
  // "header", "track 2", "track 2 event 17"
  const std::string &parsing() const noexcept { return parsing_; }
  std::size_t remaining() const noexcept { return remaining_; }
  // Up to 20 bytes starting at offset().
  const ByteVec &next_bytes() const noexcept { return next_bytes_; }

private:
  ParseError error_;
  MidiFile file_;
  std::size_t offset_;
  std::string parsing_;
  std::size_t remaining_;
  ByteVec next_bytes_;
};

// Parse an entire SMF already loaded in memory.
MidiFile parse_smf(const ByteVec &bytes);
MidiFile parse_smf(const std::uint8_t *data, std::size_t size);

ByteVec encode_smf(const MidiFile &file);

} // namespace midi
