// src/midi/tempo.cpp
// Implementation of timing utilities.

#include "midi/tempo.hpp"
#include "midi/smf.hpp"

#include <algorithm>
#include <vector>

namespace {

struct TempoEv {
  std::uint32_t tick;    // absolute tick where tempo takes effect
  std::uint32_t usPerQN; // microseconds per quarter note
};

std::vector<TempoEv> collect_tempi(const midi::MidiFile &file) {
  std::vector<TempoEv> tempi;
  for (const auto &track : file.tracks) {
    std::uint32_t tick = 0;
    for (const auto &ev : track.events) {
      tick += ev.delta_time;
      const auto *meta = std::get_if<midi::Meta>(&ev.event);
      if (!meta)
        continue;
      if (const auto *t = std::get_if<midi::SetTempo>(&meta->msg))
        tempi.push_back(TempoEv{tick, t->us_per_qn});
    }
  }
  // Stable: events at the same tick keep file order, the last one wins.
  std::stable_sort(
      tempi.begin(), tempi.end(),
      [](const TempoEv &a, const TempoEv &b) { return a.tick < b.tick; });
  return tempi;
}

} // namespace

namespace midi {

TempoMap build_tempo_map(const MidiFile &file) {
  const Division &division = file.header.division;

  TempoMap map;
  if (division.is_time_code) {
    map.ticksPerSecond =
        frames_per_second(division.fps) * division.ticks_per_frame;
    map.segments.push_back(TempoSeg{});
    return map;
  }

  map.ppqn = division.ticks_per_quarter_note ? division.ticks_per_quarter_note
                                             : 96;

  // Default tempo is 120 BPM => 500,000 microseconds per quarter note
  double current_usPerQN = 500000.0;
  double accSec = 0.0;
  std::uint32_t lastTick = 0;
  map.segments.push_back(TempoSeg{0u, 0.0, current_usPerQN});

  for (const auto &t : collect_tempi(file)) {
    // Advance accumulated seconds from lastTick to this tempo-change tick
    const double deltaQN = (t.tick - lastTick) / static_cast<double>(map.ppqn);
    accSec += deltaQN * (current_usPerQN * 1e-6);

    current_usPerQN = static_cast<double>(t.usPerQN);
    lastTick = t.tick;
    if (map.segments.back().startTick == t.tick)
      map.segments.back().usPerQN = current_usPerQN;
    else
      map.segments.push_back(TempoSeg{t.tick, accSec, current_usPerQN});
  }

  return map;
}

double ticks_to_seconds(std::uint32_t tick, const TempoMap &tempo) {
  if (tempo.ticksPerSecond > 0.0)
    return tick / tempo.ticksPerSecond;
  if (tempo.segments.empty())
    return tick / static_cast<double>(tempo.ppqn) * 0.5; // 120 BPM

  // Find the last segment whose startTick <= tick (linear scan is fine; lists
  // are tiny)
  const TempoSeg *seg = &tempo.segments.front();
  for (const auto &s : tempo.segments) {
    if (s.startTick <= tick)
      seg = &s;
    else
      break;
  }

  const double deltaQN =
      (tick - seg->startTick) / static_cast<double>(tempo.ppqn);
  return seg->startSec + deltaQN * (seg->usPerQN * 1e-6);
}

} // namespace midi
