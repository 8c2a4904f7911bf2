// tests/tuning_test.cpp

#include <catch2/catch.hpp>

#include <cmath>
#include <cstdlib>

#include "common/reader.hpp"
#include "midi/context.hpp"
#include "midi/sysex/sysex.hpp"
#include "test_util.hpp"

using namespace midi;

namespace {

ByteVec encoded(const UniversalNonRealTimeMsg &msg) {
  ByteVec out;
  write_sysex(out, UniversalNonRealTime{DeviceId::all_call(), msg});
  return out;
}

UniversalNonRealTimeMsg decoded(const ByteVec &bytes) {
  Bytes r(bytes);
  ReceiverContext ctx;
  const SystemExclusiveMsg msg = read_sysex(r, ctx);
  REQUIRE(r.at_end());
  return std::get<UniversalNonRealTime>(msg).msg;
}

// Checksum byte sits just before F7 and covers 7E through the payload.
bool checksum_holds(const ByteVec &bytes) {
  return bytes[bytes.size() - 2] ==
         checksum(bytes.data() + 1, bytes.size() - 3);
}

} // namespace

TEST_CASE("tunings from frequencies", "[tuning]") {
  CHECK(Tuning::from_freq(440.0) == Tuning{69, 0});
  CHECK(Tuning::from_freq(4.0) == Tuning{0, 0});
  CHECK(Tuning::from_freq(20000.0) == Tuning{127, 0x3FFF});

  const Tuning quarter = Tuning::from_freq(440.0 * std::pow(2.0, 0.25 / 12));
  CHECK(quarter.semitone == 69);
  CHECK(std::abs(int(quarter.fraction) - 4096) <= 1);
}

TEST_CASE("note tunings are semitone then MSB-first fraction", "[tuning]") {
  ByteVec out;
  write_tuning(out, Tuning{60, 0x2001});
  write_tuning(out, std::nullopt);
  CHECK(out == test::bytes({0x3C, 0x40, 0x01, 0x7F, 0x7F, 0x7F}));

  Bytes r(out);
  CHECK(read_tuning(r) == std::optional<Tuning>{Tuning{60, 0x2001}});
  CHECK_FALSE(read_tuning(r));

  const ByteVec almost = test::bytes({0x7F, 0x7F, 0x7E});
  Bytes r2(almost);
  CHECK(read_tuning(r2) == std::optional<Tuning>{Tuning{127, 0x3FFE}});
}

TEST_CASE("channel bit maps", "[tuning]") {
  ByteVec out;
  write_channel_bit_map(out, ChannelBitMap::all());
  CHECK(out == test::bytes({0x03, 0x7F, 0x7F}));

  ChannelBitMap m;
  m.set(0);
  m.set(15);
  out.clear();
  write_channel_bit_map(out, m);
  CHECK(out == test::bytes({0x02, 0x00, 0x01}));
  CHECK(m.has(15));
  CHECK_FALSE(m.has(7));

  Bytes r(out);
  CHECK(read_channel_bit_map(r) == m);

  const ByteVec overflow = test::bytes({0x04, 0x00, 0x00});
  Bytes r2(overflow);
  CHECK(test::thrown_kind([&] { (void)read_channel_bit_map(r2); }) ==
        ParseError::Kind::Invalid);
}

TEST_CASE("tuning names pad to sixteen characters", "[tuning]") {
  const TuningName name = tuning_name("Equal");
  CHECK(name[0] == 'E');
  CHECK(name[4] == 'l');
  CHECK(name[5] == ' ');
  CHECK(name[15] == ' ');

  const TuningName longer = tuning_name("A very long tuning name");
  CHECK(longer[15] == 'i');
}

TEST_CASE("key based tuning dump", "[tuning]") {
  KeyBasedTuningDump dump;
  dump.tuning_program_num = 3;
  dump.name = tuning_name("Stretched");
  dump.tunings = {Tuning{0, 100}, std::nullopt};

  const ByteVec bytes = encoded(dump);
  // F0 7E dev 08 01 pp name*16 (tt tt tt)*128 cs F7
  REQUIRE(bytes.size() == 3 + 2 + 1 + 16 + 384 + 1 + 1);
  CHECK(bytes[3] == 0x08);
  CHECK(bytes[4] == 0x01);
  CHECK(checksum_holds(bytes));

  const auto back = std::get<KeyBasedTuningDump>(decoded(bytes));
  CHECK(back.tuning_program_num == 3);
  CHECK_FALSE(back.tuning_bank_num);
  CHECK(back.name == dump.name);
  REQUIRE(back.tunings.size() == 128);
  CHECK(back.tunings[0] == std::optional<Tuning>{Tuning{0, 100}});
  CHECK_FALSE(back.tunings[1]);
  // Keys left out are written in equal temperament.
  CHECK(back.tunings[2] == std::optional<Tuning>{Tuning{2, 0}});
  CHECK(back.tunings[127] == std::optional<Tuning>{Tuning{127, 0}});

  SECTION("bank form") {
    dump.tuning_bank_num = 9;
    const ByteVec banked = encoded(dump);
    CHECK(banked[4] == 0x04);
    CHECK(banked[5] == 9);
    CHECK(checksum_holds(banked));
    const auto b = std::get<KeyBasedTuningDump>(decoded(banked));
    CHECK(b.tuning_bank_num == std::optional<std::uint8_t>{9});
  }

  SECTION("checksum mismatch") {
    ByteVec bad = bytes;
    bad[bad.size() - 2] ^= 0x10;
    CHECK(test::thrown_kind([&] { (void)decoded(bad); }) ==
          ParseError::Kind::Invalid);
  }
}

TEST_CASE("scale tuning dumps", "[tuning]") {
  ScaleTuningDump1Byte one;
  one.tuning_bank_num = 1;
  one.tuning_program_num = 2;
  one.name = tuning_name("Werckmeister");
  one.tuning = {0, -10, 4, -6, 2, 2, -8, 0, -8, 0, -2, -4};
  const ByteVec bytes1 = encoded(one);
  REQUIRE(bytes1.size() == 3 + 2 + 2 + 16 + 12 + 1 + 1);
  CHECK(bytes1[4] == 0x05);
  CHECK(checksum_holds(bytes1));
  CHECK(decoded(bytes1) == UniversalNonRealTimeMsg{one});

  ScaleTuningDump2Byte two;
  two.tuning_bank_num = 1;
  two.tuning_program_num = 2;
  two.name = tuning_name("Fine");
  two.tuning = {-8192, 8191, 0, 1, -1, 100, -100, 0, 0, 0, 0, 0};
  const ByteVec bytes2 = encoded(two);
  REQUIRE(bytes2.size() == 3 + 2 + 2 + 16 + 24 + 1 + 1);
  CHECK(bytes2[4] == 0x06);
  CHECK(checksum_holds(bytes2));
  CHECK(decoded(bytes2) == UniversalNonRealTimeMsg{two});
}

TEST_CASE("scale tunings", "[tuning]") {
  ScaleTuning2Byte t;
  t.channels.set(9);
  t.tuning[0] = -8192;
  t.tuning[1] = 8191;
  const ByteVec bytes = encoded(t);
  CHECK(bytes[3] == 0x08);
  CHECK(bytes[4] == 0x09);
  CHECK(decoded(bytes) == UniversalNonRealTimeMsg{t});

  ScaleTuning1Byte o;
  o.channels = ChannelBitMap::all();
  o.tuning[3] = -20;
  CHECK(decoded(encoded(o)) == UniversalNonRealTimeMsg{o});
}
