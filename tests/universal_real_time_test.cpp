// tests/universal_real_time_test.cpp

#include <catch2/catch.hpp>

#include "common/reader.hpp"
#include "midi/context.hpp"
#include "midi/sysex/sysex.hpp"
#include "test_util.hpp"

using namespace midi;

namespace {

ByteVec encoded(const UniversalRealTimeMsg &msg,
                DeviceId device = DeviceId::all_call()) {
  ByteVec out;
  write_sysex(out, UniversalRealTime{device, msg});
  return out;
}

// F0 7F 7F <payload> F7
ByteVec framed(std::initializer_list<int> payload) {
  ByteVec out = test::bytes({0xF0, 0x7F, 0x7F});
  const ByteVec body = test::bytes(payload);
  out.insert(out.end(), body.begin(), body.end());
  out.push_back(0xF7);
  return out;
}

UniversalRealTimeMsg decoded(const ByteVec &bytes) {
  Bytes r(bytes);
  ReceiverContext ctx;
  const SystemExclusiveMsg msg = read_sysex(r, ctx);
  REQUIRE(r.at_end());
  const auto *rt = std::get_if<UniversalRealTime>(&msg);
  REQUIRE(rt);
  return rt->msg;
}

void check_both_ways(const UniversalRealTimeMsg &msg, const ByteVec &bytes) {
  CHECK(encoded(msg) == bytes);
  CHECK(decoded(bytes) == msg);
}

} // namespace

TEST_CASE("device control", "[universal][real_time]") {
  CHECK(encoded(MasterVolume{1000}, DeviceId::device(3)) ==
        test::bytes({0xF0, 0x7F, 0x03, 0x04, 0x01, 0x68, 0x07, 0xF7}));
  check_both_ways(MasterBalance{0x2000}, framed({0x04, 0x02, 0x00, 0x40}));
  check_both_ways(MasterFineTuning{-8192}, framed({0x04, 0x03, 0x00, 0x00}));
  check_both_ways(MasterFineTuning{0}, framed({0x04, 0x03, 0x00, 0x40}));
  check_both_ways(MasterCoarseTuning{-64}, framed({0x04, 0x04, 0x00}));
  check_both_ways(MasterCoarseTuning{63}, framed({0x04, 0x04, 0x7F}));
}

TEST_CASE("global parameter control", "[universal][real_time]") {
  GlobalParameterControl gp;
  gp.slot_paths = {UnregisteredSlot{0x01, 0x47}, UnregisteredSlot{0x02, 0x03}};
  gp.param_id_width = 1;
  gp.value_width = 2;
  gp.params = {GlobalParameter{{0x04}, {0x05, 0x06}},
               GlobalParameter{{0x04}, {0x01, 0x00}}};
  check_both_ways(gp, framed({0x04, 0x05, 0x02, 0x01, 0x02, 0x01, 0x47, 0x02,
                              0x03, 0x04, 0x06, 0x05, 0x04, 0x00, 0x01}));

  SECTION("GM2 reverb and chorus slots") {
    const ByteVec reverb =
        encoded(gm2_reverb(ReverbType::LargeHall, std::nullopt));
    CHECK(reverb == framed({0x04, 0x05, 0x01, 0x01, 0x01, 0x01, 0x01, 0x00,
                            0x04}));

    const GlobalParameterControl chorus =
        gm2_chorus(ChorusType::Flanger, std::nullopt, std::nullopt,
                   std::nullopt, std::nullopt);
    REQUIRE(chorus.slot_paths.size() == 1);
    CHECK(chorus.slot_paths[0] == SlotPath{ChorusSlot{}});
    CHECK(decoded(encoded(chorus)) == UniversalRealTimeMsg{chorus});
  }

  SECTION("ragged parameter list") {
    CHECK(test::thrown_kind([] {
            (void)decoded(framed({0x04, 0x05, 0x00, 0x01, 0x02, 0x01}));
          }) == ParseError::Kind::Invalid);
  }
}

TEST_CASE("time code", "[universal][real_time]") {
  TimeCode tc;
  tc.hours = 1;
  tc.minutes = 2;
  tc.seconds = 3;
  tc.frames = 4;
  tc.code_type = TimeCodeType::FPS24;
  check_both_ways(TimeCodeFull{tc}, framed({0x01, 0x01, 0x01, 0x02, 0x03,
                                            0x04}));

  SECTION("a full message updates the receiver clock") {
    const ByteVec bytes = encoded(TimeCodeFull{tc});
    Bytes r(bytes);
    ReceiverContext ctx;
    (void)read_sysex(r, ctx);
    CHECK(ctx.time_code == tc);
  }

  UserBits bits;
  bits.bytes = {0x00, 0x00, 0x00, 0x21};
  bits.flag2 = true;
  check_both_ways(TimeCodeUserBits{bits},
                  framed({0x01, 0x02, 1, 2, 0, 0, 0, 0, 0, 0, 2}));
}

TEST_CASE("notation", "[universal][real_time]") {
  check_both_ways(BarMarker::not_running(), framed({0x03, 0x01, 0x00, 0x40}));
  check_both_ways(BarMarker::count_in(2), framed({0x03, 0x01, 0x7E, 0x7F}));
  check_both_ways(BarMarker::number(5), framed({0x03, 0x01, 0x05, 0x00}));
  check_both_ways(BarMarker::running_unknown(),
                  framed({0x03, 0x01, 0x7F, 0x3F}));

  TimeSignatureChange ts;
  ts.signature.signature = Signature{3, 2};
  check_both_ways(ts, framed({0x03, 0x02, 0x04, 0x03, 0x02, 0x18, 0x08}));

  ts.delayed = true;
  ts.signature.compound = {Signature{2, 3}};
  check_both_ways(ts, framed({0x03, 0x42, 0x06, 0x03, 0x02, 0x18, 0x08, 0x02,
                              0x03}));
}

TEST_CASE("opaque show control and machine control responses",
          "[universal][real_time]") {
  check_both_ways(ShowControl{{0x01, 0x02, 0x03}}, framed({0x02, 1, 2, 3}));
  check_both_ways(MachineControlResponse{{0x01, 0x05}},
                  framed({0x07, 0x01, 0x05}));
}

TEST_CASE("cueing", "[universal][real_time]") {
  TimeCodeCueing c;
  c.type = CueingType::PunchIn;
  c.event_number = 5;
  c.additional_info = {0xAB};
  check_both_ways(c, framed({0x05, 0x01, 0x05, 0x00, 0x0B, 0x0A}));

  CHECK(test::thrown_kind([] {
          (void)decoded(framed({0x05, 0x0F, 0x00, 0x00}));
        }) == ParseError::Kind::Invalid);
  CHECK(test::thrown_kind([] {
          (void)decoded(framed({0x05, 0x01, 0x00, 0x00, 0x01}));
        }) == ParseError::Kind::Invalid);
}

TEST_CASE("real time tuning", "[universal][real_time]") {
  TuningNoteChange change;
  change.tuning_program_num = 1;
  change.tunings = {{60, Tuning{60, 0x2000}}, {61, std::nullopt}};
  check_both_ways(change, framed({0x08, 0x02, 0x01, 0x02, 0x3C, 0x3C, 0x40,
                                  0x00, 0x3D, 0x7F, 0x7F, 0x7F}));

  change.tuning_bank_num = 4;
  change.tunings.resize(1);
  check_both_ways(change, framed({0x08, 0x07, 0x04, 0x01, 0x01, 0x3C, 0x3C,
                                  0x40, 0x00}));

  ScaleTuning1Byte scale;
  scale.channels = ChannelBitMap::all();
  scale.tuning[0] = -64;
  scale.tuning[11] = 63;
  const ByteVec bytes = encoded(scale);
  REQUIRE(bytes.size() == 3 + 2 + 3 + 12 + 1);
  CHECK(bytes[5] == 0x03);
  CHECK(bytes[8] == 0x00);
  CHECK(bytes[19] == 0x7F);
  CHECK(decoded(bytes) == UniversalRealTimeMsg{scale});
}

TEST_CASE("controller destinations", "[universal][real_time]") {
  ControllerDestination d;
  d.source = PressureSource::PolyPressure;
  d.channel = Channel::Ch2;
  d.param_ranges = {{ControlledParameter::PitchControl, 0x40}};
  check_both_ways(d, framed({0x09, 0x02, 0x01, 0x00, 0x40}));

  d.source = PressureSource::ChannelPressure;
  check_both_ways(d, framed({0x09, 0x01, 0x01, 0x00, 0x40}));

  ControlChangeControllerDestination cc;
  cc.control_number = 0x50;
  cc.param_ranges = {{ControlledParameter::AmplitudeControl, 0x7F}};
  check_both_ways(cc, framed({0x09, 0x03, 0x00, 0x50, 0x02, 0x7F}));

  CHECK(test::thrown_kind([] {
          (void)decoded(framed({0x09, 0x01, 0x00, 0x06, 0x00}));
        }) == ParseError::Kind::Invalid);
}

TEST_CASE("key based instrument control", "[universal][real_time]") {
  KeyBasedInstrumentControl k;
  k.key = 60;
  k.control_values = {{7, 100}, {6, 5}};
  CHECK(encoded(k) == framed({0x0A, 0x01, 0x00, 0x3C, 0x07, 0x64, 0x01, 0x05}));

  k.control_values = {{7, 100}, {10, 5}};
  CHECK(decoded(encoded(k)) == UniversalRealTimeMsg{k});
}

TEST_CASE("unknown real time sub-ids", "[universal][real_time]") {
  CHECK(test::thrown_kind([] { (void)decoded(framed({0x04, 0x09})); }) ==
        ParseError::Kind::Invalid);
  CHECK(test::thrown_kind([] { (void)decoded(framed({0x0B})); }) ==
        ParseError::Kind::Invalid);
  CHECK(test::thrown_kind([] {
          (void)decoded(framed({0x04, 0x01, 0x00, 0x00, 0x00}));
        }) == ParseError::Kind::Invalid);
}

TEST_CASE("message names", "[universal][real_time]") {
  CHECK(std::string(message_name(UniversalRealTimeMsg{MasterVolume{}})) ==
        "MasterVolume");
  CHECK(std::string(message_name(UniversalRealTimeMsg{
            KeyBasedInstrumentControl{}})) == "KeyBasedInstrumentControl");
}
