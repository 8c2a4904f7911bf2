// tests/channel_mode_test.cpp

#include <catch2/catch.hpp>

#include "common/reader.hpp"
#include "midi/channel_mode.hpp"
#include "test_util.hpp"

using namespace midi;

namespace {

ByteVec written(const ChannelModeMsg &msg) {
  ByteVec out;
  write_channel_mode(out, Channel::Ch1, msg, false);
  return out;
}

ChannelModeMsg read(std::uint8_t control, std::uint8_t value) {
  const ByteVec data{control, value};
  Bytes r(data);
  return read_channel_mode(r);
}

} // namespace

TEST_CASE("channel mode messages use controllers 120-127", "[channel_mode]") {
  CHECK(written(AllSoundOff{}) == test::bytes({0xB0, 120, 0}));
  CHECK(written(ResetAllControllers{}) == test::bytes({0xB0, 121, 0}));
  CHECK(written(LocalControl{false}) == test::bytes({0xB0, 122, 0}));
  CHECK(written(LocalControl{true}) == test::bytes({0xB0, 122, 127}));
  CHECK(written(AllNotesOff{}) == test::bytes({0xB0, 123, 0}));
  CHECK(written(OmniMode{false}) == test::bytes({0xB0, 124, 0}));
  CHECK(written(OmniMode{true}) == test::bytes({0xB0, 125, 0}));
  CHECK(written(MonoMode{20}) == test::bytes({0xB0, 126, 16}));
  CHECK(written(PolyMode{}) == test::bytes({0xB0, 127, 0}));

  ByteVec running;
  write_channel_mode(running, Channel::Ch5, AllNotesOff{}, true);
  CHECK(running == test::bytes({123, 0}));
}

TEST_CASE("reading channel mode", "[channel_mode]") {
  CHECK(read(122, 0x40) == ChannelModeMsg{LocalControl{true}});
  CHECK(read(122, 0x3F) == ChannelModeMsg{LocalControl{false}});
  CHECK(read(126, 4) == ChannelModeMsg{MonoMode{4}});
  CHECK(read(126, 100) == ChannelModeMsg{MonoMode{16}});
  CHECK(read(125, 0) == ChannelModeMsg{OmniMode{true}});
  CHECK(test::thrown_kind([] { (void)read(119, 0); }) ==
        ParseError::Kind::Invalid);
}
