// tests/message_test.cpp
// Whole-message encode/decode and the receiver context rules.

#include <catch2/catch.hpp>

#include <string>
#include <utility>

#include "midi/message.hpp"
#include "test_util.hpp"

using namespace midi;

namespace {

MidiMsg note_on(Channel ch, std::uint8_t note, std::uint8_t velocity) {
  return ChannelVoice{ch, NoteOn{note, velocity}};
}

MidiMsg cc(Channel ch, Control control) {
  return ChannelVoice{ch, ControlChange{std::move(control)}};
}

} // namespace

TEST_CASE("note on and off (S1)", "[message]") {
  const std::vector<MidiMsg> msgs{
      note_on(Channel::Ch1, 60, 100),
      ChannelVoice{Channel::Ch1, NoteOff{60, 0}}};
  const ByteVec bytes = encode_many(msgs);
  CHECK(bytes == test::bytes({0x90, 0x3C, 0x64, 0x80, 0x3C, 0x00}));

  ReceiverContext ctx;
  const Decoded first = decode_with_context(bytes, ctx);
  CHECK(first.msg == msgs[0]);
  CHECK(first.consumed == 3);
  const Decoded second =
      decode_with_context(bytes.data() + 3, bytes.size() - 3, ctx);
  CHECK(second.msg == msgs[1]);
  CHECK(second.consumed == 3);
}

TEST_CASE("running status (S2)", "[message]") {
  const ByteVec bytes = test::bytes({0x90, 0x3C, 0x64, 0x3D, 0x64});

  ReceiverContext ctx;
  const Decoded first = decode_with_context(bytes, ctx);
  CHECK(first.consumed == 3);
  REQUIRE(ctx.previous_channel_status);
  CHECK(ctx.previous_channel_status->nibble == 0x9);

  const Decoded second = decode_with_context(bytes.data() + 3, 2, ctx);
  CHECK(second.msg == note_on(Channel::Ch1, 61, 100));
  CHECK(second.consumed == 2);

  SECTION("encoding the running form omits the status") {
    CHECK(encode(RunningChannelVoice{Channel::Ch1, NoteOn{61, 100}}) ==
          test::bytes({0x3D, 0x64}));
    CHECK(encode(RunningChannelMode{Channel::Ch1, AllNotesOff{}}) ==
          test::bytes({0x7B, 0x00}));
  }

  SECTION("a fresh context rejects a data byte") {
    CHECK(test::thrown_kind([&] { (void)decode(bytes.data() + 3, 2); }) ==
          ParseError::Kind::ContextlessRunningStatus);
  }

  SECTION("system exclusive and system common clear running status") {
    ReceiverContext c;
    (void)decode_with_context(test::bytes({0x90, 0x3C, 0x64}), c);
    (void)decode_with_context(test::bytes({0xF6}), c);
    CHECK_FALSE(c.previous_channel_status);
    CHECK(test::thrown_kind([&] {
            (void)decode_with_context(test::bytes({0x3C, 0x64}), c);
          }) == ParseError::Kind::ContextlessRunningStatus);

    (void)decode_with_context(test::bytes({0x90, 0x3C, 0x64}), c);
    (void)decode_with_context(test::bytes({0xF0, 0x7D, 0x01, 0xF7}), c);
    CHECK_FALSE(c.previous_channel_status);
  }

  SECTION("real time messages leave running status alone") {
    ReceiverContext c;
    (void)decode_with_context(test::bytes({0x90, 0x3C, 0x64}), c);
    (void)decode_with_context(test::bytes({0xF8}), c);
    CHECK(decode_with_context(test::bytes({0x3E, 0x64}), c).msg ==
          note_on(Channel::Ch1, 62, 100));
  }
}

TEST_CASE("14-bit control change (S3)", "[message][cc]") {
  const ByteVec bytes = test::bytes({0xB1, 0x07, 0x07, 0xB1, 0x27, 0x68});
  const MidiMsg volume =
      cc(Channel::Ch2, HighResControl{HighResCc::Volume, 1000});

  const Decoded d = decode(bytes);
  CHECK(d.msg == volume);
  CHECK(d.consumed == 6);
  CHECK(encode(volume) == test::bytes({0xB1, 0x07, 0x07, 0x27, 0x68}));

  SECTION("the LSB may use running status") {
    const Decoded r = decode(test::bytes({0xB1, 0x07, 0x07, 0x27, 0x68}));
    CHECK(r.msg == volume);
    CHECK(r.consumed == 5);
  }

  SECTION("an LSB on another channel is not merged") {
    const Decoded r = decode(test::bytes({0xB1, 0x07, 0x07, 0xB2, 0x27, 0x68}));
    CHECK(r.msg == cc(Channel::Ch2, HighResControl{HighResCc::Volume, 896}));
    CHECK(r.consumed == 3);
  }

  SECTION("the LSB can arrive in a later call") {
    ReceiverContext ctx;
    const Decoded msb = decode_with_context(test::bytes({0xB1, 0x07, 0x07}), ctx);
    CHECK(msb.msg == cc(Channel::Ch2, HighResControl{HighResCc::Volume, 896}));
    REQUIRE(ctx.open_control);

    const Decoded lsb = decode_with_context(test::bytes({0x27, 0x68}), ctx);
    CHECK(lsb.msg == volume);
    CHECK(lsb.consumed == 2);
    CHECK_FALSE(ctx.open_control);
  }

  SECTION("without complex CC every controller is raw") {
    ReceiverContext ctx;
    ctx.complex_cc = false;
    const Decoded r = decode_with_context(bytes, ctx);
    CHECK(r.msg == cc(Channel::Ch2, UndefinedControl{7, 7}));
    CHECK(r.consumed == 3);
  }
}

TEST_CASE("registered parameters with data entry", "[message][cc]") {
  const MidiMsg pbs = cc(Channel::Ch1, param::pitch_bend_sensitivity(2, 0));
  const ByteVec bytes = encode(pbs);
  CHECK(bytes ==
        test::bytes({0xB0, 0x64, 0x00, 0x65, 0x00, 0x06, 0x02, 0x26, 0x00}));

  const Decoded d = decode(bytes);
  CHECK(d.msg == pbs);
  CHECK(d.consumed == bytes.size());

  SECTION("selection sent MSB first, each CC with its status") {
    const Decoded r = decode(test::bytes(
        {0xB0, 0x65, 0x00, 0xB0, 0x64, 0x00, 0xB0, 0x06, 0x02}));
    const MidiMsg expected = cc(
        Channel::Ch1,
        param::with_entry(ParameterId::PitchBendSensitivity, 2 << 7));
    CHECK(r.msg == expected);
    CHECK(r.consumed == 9);
  }

  SECTION("NRPN selection alone") {
    const MidiMsg nrpn = cc(Channel::Ch1, param::unregistered(0x0101));
    const Decoded r = decode(encode(nrpn));
    CHECK(r.msg == nrpn);
  }

  SECTION("data entry arriving later") {
    ReceiverContext ctx;
    (void)decode_with_context(test::bytes({0xB0, 0x65, 0x00, 0x64, 0x00}),
                              ctx);
    REQUIRE(ctx.open_control);
    const Decoded entry =
        decode_with_context(test::bytes({0x06, 0x02, 0x26, 0x00}), ctx);
    CHECK(entry.msg == pbs);
    CHECK(entry.consumed == 4);
  }
}

TEST_CASE("high resolution velocity", "[message][cc]") {
  const MidiMsg note =
      ChannelVoice{Channel::Ch1, HighResNoteOn{60, 1000}};
  const ByteVec bytes = encode(note);
  CHECK(bytes == test::bytes({0x90, 0x3C, 0x07, 0xB0, 0x58, 0x68}));

  SECTION("note followed by its CC 88") {
    ReceiverContext ctx;
    const Decoded d = decode_with_context(bytes, ctx);
    CHECK(d.msg == note);
    CHECK(d.consumed == 6);
    REQUIRE(ctx.previous_channel_status);
    CHECK(ctx.previous_channel_status->nibble == 0xB);
  }

  SECTION("CC 88 announced before the note") {
    ReceiverContext ctx;
    const Decoded lsb =
        decode_with_context(test::bytes({0xB0, 0x58, 0x68}), ctx);
    CHECK(lsb.msg ==
          cc(Channel::Ch1, ByteControl{ByteCc::HighResVelocity, 0x68}));
    REQUIRE(ctx.pending_high_res_velocity_lsb);

    const Decoded d =
        decode_with_context(test::bytes({0x90, 0x3C, 0x07}), ctx);
    CHECK(d.msg == note);
    CHECK_FALSE(ctx.pending_high_res_velocity_lsb);
  }

  SECTION("a different message on the channel drops the pending LSB") {
    ReceiverContext ctx;
    (void)decode_with_context(test::bytes({0xB0, 0x58, 0x68}), ctx);
    (void)decode_with_context(test::bytes({0xC0, 0x01}), ctx);
    CHECK_FALSE(ctx.pending_high_res_velocity_lsb);
    CHECK(decode_with_context(test::bytes({0x90, 0x3C, 0x07}), ctx).msg ==
          note_on(Channel::Ch1, 60, 7));
  }

  SECTION("a pending LSB only applies to its own channel") {
    ReceiverContext ctx;
    (void)decode_with_context(test::bytes({0xB0, 0x58, 0x68}), ctx);
    CHECK(decode_with_context(test::bytes({0x91, 0x3C, 0x07}), ctx).msg ==
          note_on(Channel::Ch2, 60, 7));
    REQUIRE(ctx.pending_high_res_velocity_lsb);
  }
}

TEST_CASE("channel mode messages", "[message]") {
  const ByteVec bytes = test::bytes({0xB3, 0x7B, 0x00});
  const Decoded d = decode(bytes);
  CHECK(d.msg == MidiMsg{ChannelMode{Channel::Ch4, AllNotesOff{}}});
  CHECK(encode(d.msg) == bytes);
  CHECK(is_channel_message(d.msg));

  ReceiverContext ctx;
  (void)decode_with_context(bytes, ctx);
  CHECK(decode_with_context(test::bytes({0x7E, 0x02}), ctx).msg ==
        MidiMsg{ChannelMode{Channel::Ch4, MonoMode{2}}});
}

TEST_CASE("system messages through the top level", "[message]") {
  CHECK(decode(test::bytes({0xF2, 0x68, 0x07})).msg ==
        MidiMsg{SystemCommon{SongPosition{1000}}});
  CHECK(decode(test::bytes({0xFA})).msg ==
        MidiMsg{SystemRealTime{SystemRealTimeMsg::Start}});
  CHECK_FALSE(is_channel_message(SystemRealTime{}));

  const MidiMsg identity{SystemExclusive{
      UniversalNonRealTime{DeviceId::all_call(), IdentityRequest{}}}};
  const Decoded d = decode(test::bytes({0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7}));
  CHECK(d.msg == identity);
  CHECK(d.consumed == 6);

  SECTION("0xFF is a reset outside a file and a meta event inside one") {
    CHECK(decode(test::bytes({0xFF, 0x2F, 0x00})).msg ==
          MidiMsg{SystemRealTime{SystemRealTimeMsg::SystemReset}});

    ReceiverContext smf = ReceiverContext::for_smf();
    const Decoded meta =
        decode_with_context(test::bytes({0xFF, 0x2F, 0x00}), smf);
    CHECK(meta.msg == MidiMsg{Meta{EndOfTrack{}}});
    CHECK(meta.consumed == 3);
    CHECK(encode(meta.msg) == test::bytes({0xFF, 0x2F, 0x00}));
  }

  SECTION("a full time code message sets the clock") {
    ReceiverContext ctx;
    (void)decode_with_context(
        test::bytes({0xF0, 0x7F, 0x7F, 0x01, 0x01, 0x61, 0x02, 0x03, 0x04,
                     0xF7}),
        ctx);
    CHECK(ctx.time_code.hours == 1);
    CHECK(ctx.time_code.frames == 4);
    CHECK(ctx.time_code.code_type == TimeCodeType::NDF30);
  }
}

TEST_CASE("real time bytes inside other messages", "[message][real_time]") {
  SECTION("inside a note") {
    ReceiverContext ctx;
    const ByteVec bytes = test::bytes({0x90, 0x3C, 0xF8, 0x64});
    const Decoded clock = decode_with_context(bytes, ctx);
    CHECK(clock.msg == MidiMsg{SystemRealTime{SystemRealTimeMsg::TimingClock}});
    CHECK(clock.consumed == 3);
    CHECK(ctx.interrupted == test::bytes({0x90, 0x3C}));

    const Decoded note =
        decode_with_context(bytes.data() + 3, bytes.size() - 3, ctx);
    CHECK(note.msg == note_on(Channel::Ch1, 60, 100));
    CHECK(note.consumed == 1);
    CHECK(ctx.interrupted.empty());
  }

  SECTION("right after the status byte") {
    ReceiverContext ctx;
    const Decoded clock =
        decode_with_context(test::bytes({0xE0, 0xFE, 0x00, 0x40}), ctx);
    CHECK(clock.msg ==
          MidiMsg{SystemRealTime{SystemRealTimeMsg::ActiveSensing}});
    CHECK(clock.consumed == 2);
    const Decoded bend =
        decode_with_context(test::bytes({0x00, 0x40}), ctx);
    CHECK(bend.msg == MidiMsg{ChannelVoice{Channel::Ch1, PitchBend{8192}}});
  }

  SECTION("inside a system common message") {
    ReceiverContext ctx;
    CHECK(decode_with_context(test::bytes({0xF2, 0x68, 0xFC, 0x07}), ctx).msg ==
          MidiMsg{SystemRealTime{SystemRealTimeMsg::Stop}});
    CHECK(decode_with_context(test::bytes({0x07}), ctx).msg ==
          MidiMsg{SystemCommon{SongPosition{1000}}});
  }

  SECTION("inside a system exclusive body") {
    ReceiverContext ctx;
    const ByteVec bytes = test::bytes({0xF0, 0x7D, 0x01, 0xF8, 0x02, 0xF7});
    const Decoded clock = decode_with_context(bytes, ctx);
    CHECK(clock.msg == MidiMsg{SystemRealTime{SystemRealTimeMsg::TimingClock}});
    CHECK(clock.consumed == 4);
    CHECK(ctx.interrupted == test::bytes({0xF0, 0x7D, 0x01}));

    const Decoded sysex =
        decode_with_context(bytes.data() + 4, bytes.size() - 4, ctx);
    CHECK(sysex.msg == MidiMsg{SystemExclusive{NonCommercial{{0x01, 0x02}}}});
    CHECK(sysex.consumed == 2);
    CHECK(ctx.interrupted.empty());
  }

  SECTION("twice inside one system exclusive body") {
    ReceiverContext ctx;
    const ByteVec bytes =
        test::bytes({0xF0, 0x7D, 0xFE, 0x01, 0xF8, 0x02, 0xF7});
    std::vector<MidiMsg> seen;
    std::size_t at = 0;
    while (at < bytes.size()) {
      const Decoded d =
          decode_with_context(bytes.data() + at, bytes.size() - at, ctx);
      seen.push_back(d.msg);
      at += d.consumed;
    }
    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == MidiMsg{SystemRealTime{SystemRealTimeMsg::ActiveSensing}});
    CHECK(seen[1] == MidiMsg{SystemRealTime{SystemRealTimeMsg::TimingClock}});
    CHECK(seen[2] == MidiMsg{SystemExclusive{NonCommercial{{0x01, 0x02}}}});
  }

  SECTION("other status bytes still end a system exclusive body") {
    CHECK(test::thrown_kind([] {
            (void)decode(test::bytes({0xF0, 0x7D, 0x01, 0x90, 0x02, 0xF7}));
          }) == ParseError::Kind::ByteOverflow);
  }

  SECTION("a failed resume keeps the partial message") {
    ReceiverContext ctx;
    (void)decode_with_context(test::bytes({0x90, 0xF8}), ctx);
    const ByteVec held = ctx.interrupted;
    CHECK(test::thrown_kind([&] {
            (void)decode_with_context(ByteVec{}, ctx);
          }) == ParseError::Kind::UnexpectedEnd);
    CHECK(ctx.interrupted == held);
  }
}

TEST_CASE("decoding errors", "[message]") {
  CHECK(test::thrown_kind([] { (void)decode(ByteVec{}); }) ==
        ParseError::Kind::UnexpectedEnd);
  CHECK(test::thrown_kind([] { (void)decode(test::bytes({0x90, 0x3C})); }) ==
        ParseError::Kind::UnexpectedEnd);
  CHECK(test::thrown_kind([] { (void)decode(test::bytes({0xF4})); }) ==
        ParseError::Kind::UndefinedSystemCommonMessage);
  CHECK(test::thrown_kind([] { (void)decode(test::bytes({0xF7})); }) ==
        ParseError::Kind::UnexpectedEndOfSystemExclusiveFlag);
  CHECK(test::thrown_kind([] { (void)decode(test::bytes({0xF9})); }) ==
        ParseError::Kind::UndefinedSystemRealTimeMessage);
  CHECK(test::thrown_kind([] {
          (void)decode(test::bytes({0xF0, 0x01, 0x02}));
        }) == ParseError::Kind::NoEndOfSystemExclusiveFlag);
  CHECK(test::thrown_kind([] {
          (void)decode(test::bytes({0x90, 0x3C, 0x80}));
        }) == ParseError::Kind::ByteOverflow);
}

TEST_CASE("parse errors name their kind", "[message]") {
  const ParseError e(ParseError::Kind::Invalid, "bad thing");
  CHECK(e.kind() == ParseError::Kind::Invalid);
  CHECK(e.detail() == "bad thing");
  CHECK(std::string(e.what()).find("bad thing") != std::string::npos);

  const ParseError u(ParseError::Kind::UndefinedSystemCommonMessage,
                     std::uint8_t{0xF4});
  CHECK(u.detail() == "0xf4");
  CHECK(std::string(to_string(ParseError::Kind::VlqOverflow)).size() > 0);
}
