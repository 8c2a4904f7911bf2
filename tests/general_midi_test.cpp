// tests/general_midi_test.cpp

#include <catch2/catch.hpp>

#include <string>

#include "midi/general_midi.hpp"

using namespace midi;

TEST_CASE("program names", "[general_midi]") {
  CHECK(std::string(to_string(GMSoundSet::AcousticGrandPiano)) ==
        "Acoustic Grand Piano");
  CHECK(std::string(to_string(GMSoundSet::Violin)) == "Violin");
  CHECK(std::string(to_string(GMSoundSet::Gunshot)) == "Gunshot");
  CHECK(static_cast<int>(GMSoundSet::Violin) == 40);
  CHECK(static_cast<int>(GMSoundSet::Gunshot) == 127);
}

TEST_CASE("percussion names", "[general_midi]") {
  CHECK(std::string(to_string(GMPercussionMap::AcousticBassDrum)) ==
        "Acoustic Bass Drum");
  CHECK(std::string(to_string(GMPercussionMap::OpenTriangle)) ==
        "Open Triangle");
  CHECK(static_cast<int>(GMPercussionMap::OpenTriangle) == 81);
  CHECK(std::string(to_string(static_cast<GMPercussionMap>(34))).empty());
  CHECK(std::string(to_string(static_cast<GMPercussionMap>(82))).empty());
}

TEST_CASE("system on/off values", "[general_midi]") {
  CHECK(static_cast<int>(GeneralMidi::GM1) == 1);
  CHECK(static_cast<int>(GeneralMidi::Off) == 2);
  CHECK(static_cast<int>(GeneralMidi::GM2) == 3);
}
