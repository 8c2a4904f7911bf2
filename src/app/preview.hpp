// src/app/preview.hpp
// Pretty, compact console preview of a parsed MIDI file.
// - Prints SMF header summary
// - Prints the first N events of every track with timestamps (s)

#pragma once
#include <algorithm>
#include <iomanip>
#include <iostream>

#include "app/describe.hpp"
#include "common/util.hpp"
#include "midi/smf.hpp"
#include "midi/tempo.hpp"

namespace app {

inline const char *format_name(midi::SmfFormat f) {
  switch (f) {
  case midi::SmfFormat::Single:
    return "0 (single track)";
  case midi::SmfFormat::Multi:
    return "1 (multi track)";
  case midi::SmfFormat::MultiSong:
    return "2 (multi song)";
  }
  return "?";
}

inline void print_header(const midi::Header &h) {
  std::cout << "SMF header:\n";
  std::cout << "  format  = " << format_name(h.format) << "\n";
  std::cout << "  nTracks = " << h.num_tracks << "\n";
  if (!h.division.is_time_code) {
    std::cout << "  PPQN    = " << h.division.ticks_per_quarter_note
              << " ticks/qn\n";
  } else {
    std::cout << "  SMPTE   = " << midi::frames_per_second(h.division.fps)
              << " fps, " << int(h.division.ticks_per_frame)
              << " ticks/frame\n";
  }
}

inline void print_preview(const midi::MidiFile &file,
                          const midi::TempoMap &tempo,
                          std::size_t eventsPerTrack) {
  print_header(file.header);

  for (std::size_t t = 0; t < file.tracks.size(); ++t) {
    const auto &track = file.tracks[t];
    if (track.is_alien()) {
      std::cout << "\nChunk " << t << ": foreign, " << track.size()
                << " bytes [" << hex_bytes(track.alien_chunk, 8) << "]\n";
      continue;
    }

    std::cout << "\nTrack " << t << " (" << track.size() << " events)\n";
    const std::size_t limit = std::min(eventsPerTrack, track.events.size());
    std::uint32_t tick = 0;
    for (std::size_t i = 0; i < limit; ++i) {
      const auto &ev = track.events[i];
      tick += ev.delta_time;
      const double s = midi::ticks_to_seconds(tick, tempo);
      std::cout << "t=" << std::fixed << std::setprecision(3) << s << "s  "
                << "tick " << tick << "  " << describe(ev.event) << "\n";
    }
    if (limit < track.events.size()) {
      std::cout << "  ... " << track.events.size() - limit << " more\n";
    }
  }
}

} // namespace app
