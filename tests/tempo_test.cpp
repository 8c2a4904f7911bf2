// tests/tempo_test.cpp

#include <catch2/catch.hpp>

#include "midi/smf.hpp"
#include "midi/tempo.hpp"

using namespace midi;

namespace {

TrackEvent tempo_event(std::uint32_t delta, std::uint32_t us_per_qn) {
  TrackEvent ev;
  ev.delta_time = delta;
  ev.event = Meta{SetTempo{us_per_qn}};
  return ev;
}

MidiFile metrical_file(std::vector<std::vector<TrackEvent>> tracks) {
  MidiFile file;
  file.header.division = Division::metrical(96);
  for (auto &events : tracks) {
    Track t;
    t.events = std::move(events);
    file.add_track(std::move(t));
  }
  return file;
}

} // namespace

TEST_CASE("default tempo is 120 BPM", "[tempo]") {
  const TempoMap map = build_tempo_map(metrical_file({}));
  CHECK(map.ppqn == 96);
  REQUIRE(map.segments.size() == 1);
  CHECK(ticks_to_seconds(96, map) == Approx(0.5));
  CHECK(ticks_to_seconds(0, map) == Approx(0.0));
}

TEST_CASE("tempo changes split the timeline", "[tempo]") {
  const TempoMap map =
      build_tempo_map(metrical_file({{tempo_event(96, 250000)}}));
  REQUIRE(map.segments.size() == 2);
  CHECK(map.segments[1].startTick == 96);
  CHECK(map.segments[1].startSec == Approx(0.5));
  CHECK(ticks_to_seconds(48, map) == Approx(0.25));
  CHECK(ticks_to_seconds(192, map) == Approx(0.75));
}

TEST_CASE("tempo events from every track are merged", "[tempo]") {
  const TempoMap map = build_tempo_map(metrical_file(
      {{tempo_event(96, 250000)}, {tempo_event(192, 1000000)}}));
  REQUIRE(map.segments.size() == 3);
  CHECK(ticks_to_seconds(288, map) == Approx(1.75));
}

TEST_CASE("the later of two tempos at one tick wins", "[tempo]") {
  const TempoMap map = build_tempo_map(metrical_file(
      {{tempo_event(0, 1000000)}, {tempo_event(0, 250000)}}));
  REQUIRE(map.segments.size() == 1);
  CHECK(map.segments[0].usPerQN == Approx(250000.0));
  CHECK(ticks_to_seconds(96, map) == Approx(0.25));
}

TEST_CASE("time code files ignore tempo", "[tempo]") {
  MidiFile file;
  file.header.division = Division::time_code(TimeCodeType::FPS25, 40);
  Track t;
  t.events.push_back(tempo_event(0, 250000));
  file.add_track(t);

  const TempoMap map = build_tempo_map(file);
  CHECK(map.ticksPerSecond == Approx(1000.0));
  CHECK(ticks_to_seconds(500, map) == Approx(0.5));

  file.header.division = Division::time_code(TimeCodeType::DF30, 80);
  CHECK(build_tempo_map(file).ticksPerSecond == Approx(29.97 * 80));
}
