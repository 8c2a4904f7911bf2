// tests/meta_test.cpp

#include <catch2/catch.hpp>

#include "common/reader.hpp"
#include "midi/meta.hpp"
#include "test_util.hpp"

using namespace midi;

namespace {

ByteVec written(const MetaMsg &msg) {
  ByteVec out;
  write_meta(out, msg);
  return out;
}

MetaMsg read(const ByteVec &bytes) {
  Bytes r(bytes);
  MetaMsg msg = read_meta(r);
  REQUIRE(r.at_end());
  return msg;
}

void check_both_ways(const MetaMsg &msg, const ByteVec &bytes) {
  CHECK(written(msg) == bytes);
  CHECK(read(bytes) == msg);
}

} // namespace

TEST_CASE("text events", "[meta]") {
  check_both_ways(TrackName{"Piano"},
                  test::bytes({0x03, 0x05, 'P', 'i', 'a', 'n', 'o'}));
  check_both_ways(Text{""}, test::bytes({0x01, 0x00}));
  check_both_ways(Copyright{"(c)"}, test::bytes({0x02, 0x03, '(', 'c', ')'}));
  check_both_ways(Lyric{"la"}, test::bytes({0x05, 0x02, 'l', 'a'}));
  check_both_ways(Marker{"A"}, test::bytes({0x06, 0x01, 'A'}));
  check_both_ways(CuePoint{"B"}, test::bytes({0x07, 0x01, 'B'}));
  check_both_ways(InstrumentName{"C"}, test::bytes({0x04, 0x01, 'C'}));

  SECTION("text is kept as raw bytes") {
    const MetaMsg msg = read(test::bytes({0x01, 0x02, 0xC3, 0xA9}));
    CHECK(std::get<Text>(msg).text == "\xC3\xA9");
  }

  SECTION("long text uses a multi-byte length") {
    const Text t{std::string(200, 'x')};
    const ByteVec bytes = written(t);
    REQUIRE(bytes.size() == 1 + 2 + 200);
    CHECK(bytes[1] == 0x81);
    CHECK(bytes[2] == 0x48);
    CHECK(read(bytes) == MetaMsg{t});
  }
}

TEST_CASE("fixed layout events", "[meta]") {
  check_both_ways(SequenceNumber{0x0102}, test::bytes({0x00, 0x02, 0x01, 0x02}));
  check_both_ways(ChannelPrefix{Channel::Ch10}, test::bytes({0x20, 0x01, 0x09}));
  check_both_ways(EndOfTrack{}, test::bytes({0x2F, 0x00}));
  check_both_ways(SetTempo{500000}, test::bytes({0x51, 0x03, 0x07, 0xA1, 0x20}));
  check_both_ways(KeySignature{-3, 1}, test::bytes({0x59, 0x02, 0xFD, 0x01}));
  check_both_ways(KeySignature{2, 0}, test::bytes({0x59, 0x02, 0x02, 0x00}));

  HighResTimeCode tc;
  tc.hours = 1;
  tc.minutes = 2;
  tc.seconds = 3;
  tc.frames = 4;
  tc.fractional_frames = 5;
  tc.code_type = TimeCodeType::FPS25;
  check_both_ways(SmpteOffset{tc},
                  test::bytes({0x54, 0x05, 0x21, 0x02, 0x03, 0x04, 0x05}));

  check_both_ways(SequencerSpecific{{0x41, 0x01}},
                  test::bytes({0x7F, 0x02, 0x41, 0x01}));
  check_both_ways(UnknownMeta{0x60, {0x01}}, test::bytes({0x60, 0x01, 0x01}));
}

TEST_CASE("tempo saturates at 24 bits", "[meta]") {
  CHECK(written(SetTempo{0x12345678}) ==
        test::bytes({0x51, 0x03, 0xFF, 0xFF, 0xFF}));
}

TEST_CASE("time signature denominators are powers of two", "[meta]") {
  FileTimeSignature ts;
  ts.numerator = 6;
  ts.denominator = 8;
  check_both_ways(ts, test::bytes({0x58, 0x04, 0x06, 0x03, 0x18, 0x08}));

  CHECK(written(FileTimeSignature{}) ==
        test::bytes({0x58, 0x04, 0x04, 0x02, 0x18, 0x08}));

  // A denominator that is not a power of two is written as the power
  // below it.
  ts.denominator = 12;
  CHECK(written(ts)[3] == 0x03);
}

TEST_CASE("malformed fixed layout events are kept as unknown", "[meta]") {
  CHECK(read(test::bytes({0x51, 0x02, 0x07, 0xA1})) ==
        MetaMsg{UnknownMeta{0x51, {0x07, 0xA1}}});
  CHECK(read(test::bytes({0x2F, 0x01, 0x00})) ==
        MetaMsg{UnknownMeta{0x2F, {0x00}}});
  CHECK(read(test::bytes({0x20, 0x01, 0x10})) ==
        MetaMsg{UnknownMeta{0x20, {0x10}}});
  CHECK(read(test::bytes({0x58, 0x04, 0x04, 0x10, 0x18, 0x08})) ==
        MetaMsg{UnknownMeta{0x58, {0x04, 0x10, 0x18, 0x08}}});
}

TEST_CASE("truncated meta events", "[meta]") {
  const ByteVec cut = test::bytes({0x03, 0x05, 'P', 'i'});
  Bytes r(cut);
  CHECK(test::thrown_kind([&] { (void)read_meta(r); }) ==
        ParseError::Kind::UnexpectedEnd);
}
