// tests/control_change_test.cpp

#include <catch2/catch.hpp>

#include "midi/control_change.hpp"
#include "test_util.hpp"

using namespace midi;

namespace {

ByteVec written(const Control &c) {
  ByteVec out;
  write_control(out, c);
  return out;
}

} // namespace

TEST_CASE("14-bit controllers are written MSB controller first",
          "[control_change]") {
  CHECK(written(HighResControl{HighResCc::Volume, 1000}) ==
        test::bytes({0x07, 0x07, 0x27, 0x68}));
  CHECK(written(HighResControl{HighResCc::Pan, 0xFFFF}) ==
        test::bytes({0x0A, 0x7F, 0x2A, 0x7F}));
  CHECK(written(UndefinedHighResControl{3, 35, 129}) ==
        test::bytes({3, 1, 35, 1}));
}

TEST_CASE("single byte controllers", "[control_change]") {
  CHECK(written(ByteControl{ByteCc::Hold, 127}) == test::bytes({64, 127}));
  CHECK(written(ByteControl{ByteCc::ReverbSendLevel, 200}) ==
        test::bytes({91, 127}));
  CHECK(written(UndefinedControl{102, 9}) == test::bytes({102, 9}));
  // Controller numbers above 119 belong to channel mode.
  CHECK(written(UndefinedControl{125, 9}) == test::bytes({119, 9}));
}

TEST_CASE("parameters are written as selection then data entry",
          "[control_change]") {
  SECTION("registered, two byte entry") {
    CHECK(written(param::pitch_bend_sensitivity(2, 0)) ==
          test::bytes({100, 0, 101, 0, 6, 2, 38, 0}));
    CHECK(written(param::fine_tuning(0)) ==
          test::bytes({100, 1, 101, 0, 6, 0x40, 38, 0}));
    CHECK(written(param::coarse_tuning(-64)) ==
          test::bytes({100, 2, 101, 0, 6, 0, 38, 0}));
  }

  SECTION("registered, MSB-only entry") {
    CHECK(written(param::tuning_program_select(3)) ==
          test::bytes({100, 3, 101, 0, 6, 3}));
    CHECK(written(param::polyphonic_expression(20)) ==
          test::bytes({100, 6, 101, 0, 6, 16}));
  }

  SECTION("3D sound parameters") {
    CHECK(written(param::with_entry(ParameterId::Gain3DSound, 0x2000)) ==
          test::bytes({100, 2, 101, 61, 6, 0x40, 38, 0}));
  }

  SECTION("unregistered") {
    CHECK(written(param::unregistered(0x0101, 5)) ==
          test::bytes({98, 1, 99, 2, 6, 0, 38, 5}));
    CHECK(written(param::unregistered(0x0101)) ==
          test::bytes({98, 1, 99, 2}));
  }

  SECTION("null parameter never carries an entry") {
    Parameter p = param::select(ParameterId::Null);
    p.entry = 100;
    CHECK(written(p) == test::bytes({100, 0x7F, 101, 0x7F}));

    const Parameter built = param::with_entry(ParameterId::Null, 100);
    CHECK_FALSE(built.entry);
    CHECK(written(built) == test::bytes({100, 0x7F, 101, 0x7F}));
  }
}

TEST_CASE("single CC interpretation", "[control_change]") {
  CHECK(read_control(7, 7, true) ==
        Control{HighResControl{HighResCc::Volume, 896}});
  CHECK(read_control(64, 127, true) ==
        Control{ByteControl{ByteCc::Hold, 127}});
  CHECK(read_control(84, 1, true) ==
        Control{ByteControl{ByteCc::PortamentoControl, 1}});
  CHECK(read_control(3, 1, true) ==
        Control{UndefinedHighResControl{3, 35, 128}});
  CHECK(read_control(39, 0x68, true) == Control{UndefinedControl{39, 0x68}});
  CHECK(read_control(7, 7, false) == Control{UndefinedControl{7, 7}});
}

TEST_CASE("merging", "[control_change]") {
  SECTION("MSB and LSB of a pair") {
    const auto merged = merge_controls(HighResControl{HighResCc::Volume, 896},
                                       UndefinedControl{39, 0x68});
    REQUIRE(merged);
    CHECK(merged->control == Control{HighResControl{HighResCc::Volume, 1000}});
    CHECK_FALSE(merged->open);

    CHECK_FALSE(merge_controls(HighResControl{HighResCc::Volume, 896},
                               UndefinedControl{40, 1}));
  }

  SECTION("RPN selection followed by data entry") {
    auto step = merge_controls(UndefinedControl{101, 0},
                               UndefinedControl{100, 0});
    REQUIRE(step);
    CHECK(step->control ==
          Control{param::select(ParameterId::PitchBendSensitivity)});
    CHECK(step->open);

    step = merge_controls(step->control,
                          HighResControl{HighResCc::DataEntry, 2 << 7});
    REQUIRE(step);
    CHECK(step->open);

    step = merge_controls(step->control, UndefinedControl{38, 50});
    REQUIRE(step);
    CHECK(step->control == Control{param::pitch_bend_sensitivity(2, 50)});
    CHECK_FALSE(step->open);
  }

  SECTION("NRPN numbers in either order") {
    const auto a =
        merge_controls(UndefinedControl{99, 2}, UndefinedControl{98, 1});
    const auto b =
        merge_controls(UndefinedControl{98, 1}, UndefinedControl{99, 2});
    REQUIRE(a);
    REQUIRE(b);
    CHECK(a->control == Control{param::unregistered(0x0101)});
    CHECK(b->control == a->control);
  }

  SECTION("MSB-only entry closes the parameter") {
    const auto m =
        merge_controls(param::select(ParameterId::TuningBankSelect),
                       HighResControl{HighResCc::DataEntry, 4 << 7});
    REQUIRE(m);
    CHECK(m->control == Control{param::tuning_bank_select(4)});
    CHECK_FALSE(m->open);
  }

  SECTION("the null parameter takes no data entry") {
    const auto null =
        merge_controls(UndefinedControl{101, 0x7F}, UndefinedControl{100, 0x7F});
    REQUIRE(null);
    CHECK(null->control == Control{param::select(ParameterId::Null)});
    CHECK_FALSE(null->open);
    CHECK_FALSE(merge_controls(param::select(ParameterId::Null),
                               HighResControl{HighResCc::DataEntry, 2 << 7}));
    CHECK_FALSE(control_opens_merge(param::select(ParameterId::Null)));
  }

  SECTION("pairs that do not combine") {
    CHECK_FALSE(
        merge_controls(UndefinedControl{101, 0}, UndefinedControl{98, 0}));
    CHECK_FALSE(
        merge_controls(UndefinedControl{101, 5}, UndefinedControl{100, 5}));
    CHECK_FALSE(merge_controls(ByteControl{ByteCc::Hold, 0},
                               UndefinedControl{39, 0}));
  }

  SECTION("which controls stay open") {
    CHECK(control_opens_merge(HighResControl{}));
    CHECK(control_opens_merge(UndefinedControl{100, 0}));
    CHECK_FALSE(control_opens_merge(UndefinedControl{102, 0}));
    CHECK_FALSE(control_opens_merge(ByteControl{}));
    CHECK_FALSE(control_opens_merge(param::tuning_program_select(1)));
    CHECK(control_opens_merge(param::select(ParameterId::FineTuning)));
  }
}
