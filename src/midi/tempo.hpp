// src/midi/tempo.hpp
// Timing utilities: build a tempo map and convert ticks -> seconds.
//
// Contract:
//  - build_tempo_map(const MidiFile&): collects SetTempo meta events from
//    every MIDI track with their absolute tick.
//      * Metrical files: segments of constant tempo.
//      * SMPTE files: tempo events do not matter; a tick lasts
//        1 / (fps * ticks_per_frame) seconds, drop-frame 30 counting as 29.97.
//  - ticks_to_seconds(tick, TempoMap): converts absolute tick to seconds.

#pragma once
#include <cstdint>
#include <vector>

namespace midi {

struct MidiFile;

// A stretch of constant tempo.
struct TempoSeg {
  std::uint32_t startTick = 0; // segment begins at this absolute tick
  double startSec = 0;         // time in seconds at startTick
  double usPerQN = 500000.0;   // tempo in this segment
};

struct TempoMap {
  unsigned ppqn = 96;             // ticks per quarter note (metrical)
  double ticksPerSecond = 0.0;    // > 0 for SMPTE files
  std::vector<TempoSeg> segments; // ascending by startTick
};

TempoMap build_tempo_map(const MidiFile &file);

// Beyond the last tempo change we continue with the last tempo.
double ticks_to_seconds(std::uint32_t tick, const TempoMap &tempo);

} // namespace midi
