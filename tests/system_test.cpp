// tests/system_test.cpp

#include <catch2/catch.hpp>

#include "common/reader.hpp"
#include "midi/system_common.hpp"
#include "midi/system_real_time.hpp"
#include "test_util.hpp"

using namespace midi;

TEST_CASE("system common messages", "[system]") {
  ByteVec out;
  write_system_common(out, SongPosition{1000});
  write_system_common(out, SongSelect{3});
  write_system_common(out, TuneRequest{});
  CHECK(out == test::bytes({0xF2, 0x68, 0x07, 0xF3, 0x03, 0xF6}));

  TimeCode clock;
  Bytes r(out);
  REQUIRE(r.u8() == 0xF2);
  CHECK(read_system_common(0xF2, r, clock) ==
        SystemCommonMsg{SongPosition{1000}});
  REQUIRE(r.u8() == 0xF3);
  CHECK(read_system_common(0xF3, r, clock) == SystemCommonMsg{SongSelect{3}});
  REQUIRE(r.u8() == 0xF6);
  CHECK(read_system_common(0xF6, r, clock) == SystemCommonMsg{TuneRequest{}});
}

TEST_CASE("quarter frames rebuild the clock", "[system]") {
  TimeCode tc;
  tc.hours = 10;
  tc.minutes = 11;
  tc.seconds = 12;
  tc.frames = 13;
  tc.code_type = TimeCodeType::DF30;

  TimeCode clock;
  for (std::uint8_t i = 0; i < 8; ++i) {
    ByteVec out;
    write_system_common(out, QuarterFrame{i, tc});
    REQUIRE(out.size() == 2);
    CHECK(out[0] == 0xF1);
    CHECK((out[1] >> 4) == i);

    Bytes r(out.data() + 1, 1);
    const auto msg = read_system_common(0xF1, r, clock);
    const auto &q = std::get<QuarterFrame>(msg);
    CHECK(q.index == i);
    CHECK(q.time_code == clock);
  }
  CHECK(clock == tc);
}

TEST_CASE("undefined system common status bytes", "[system]") {
  TimeCode clock;
  const ByteVec none;
  Bytes r(none);
  CHECK(test::thrown_kind([&] { (void)read_system_common(0xF4, r, clock); }) ==
        ParseError::Kind::UndefinedSystemCommonMessage);
  CHECK(test::thrown_kind([&] { (void)read_system_common(0xF5, r, clock); }) ==
        ParseError::Kind::UndefinedSystemCommonMessage);
  CHECK(test::thrown_kind([&] { (void)read_system_common(0xF7, r, clock); }) ==
        ParseError::Kind::UnexpectedEndOfSystemExclusiveFlag);
}

TEST_CASE("real time bytes", "[system]") {
  CHECK(read_real_time(0xF8) == SystemRealTimeMsg::TimingClock);
  CHECK(read_real_time(0xFA) == SystemRealTimeMsg::Start);
  CHECK(read_real_time(0xFB) == SystemRealTimeMsg::Continue);
  CHECK(read_real_time(0xFC) == SystemRealTimeMsg::Stop);
  CHECK(read_real_time(0xFE) == SystemRealTimeMsg::ActiveSensing);
  CHECK(read_real_time(0xFF) == SystemRealTimeMsg::SystemReset);
  CHECK(real_time_byte(SystemRealTimeMsg::Stop) == 0xFC);
  CHECK(is_real_time_status(0xF8));
  CHECK_FALSE(is_real_time_status(0xF7));

  CHECK(test::thrown_kind([] { (void)read_real_time(0xF9); }) ==
        ParseError::Kind::UndefinedSystemRealTimeMessage);
  CHECK(test::thrown_kind([] { (void)read_real_time(0xFD); }) ==
        ParseError::Kind::UndefinedSystemRealTimeMessage);
  CHECK(std::string(to_string(SystemRealTimeMsg::Start)) == "Start");
}
