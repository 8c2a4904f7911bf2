// tests/primitives_test.cpp

#include <catch2/catch.hpp>

#include "common/reader.hpp"
#include "midi/primitives.hpp"

using namespace midi;

TEST_CASE("7-bit fields clamp on encode and reject the top bit on decode",
          "[primitives]") {
  CHECK(encode_u7(0) == 0);
  CHECK(encode_u7(127) == 127);
  CHECK(encode_u7(128) == 127);
  CHECK(encode_u7(100000) == 127);

  CHECK(decode_u7(0x7F) == 0x7F);
  CHECK_THROWS_AS(decode_u7(0x80), ParseError);

  CHECK(i_to_u7(0) == 64);
  CHECK(i_to_u7(-64) == 0);
  CHECK(i_to_u7(-100) == 0);
  CHECK(i_to_u7(200) == 127);
  CHECK(u7_to_i(0) == -64);
  CHECK(u7_to_i(127) == 63);
}

TEST_CASE("14-bit fields", "[primitives]") {
  SECTION("unsigned saturates at 0x3FFF") {
    CHECK(to_u14(1000) == std::array<std::uint8_t, 2>{0x07, 0x68});
    CHECK(to_u14(0x4000) == std::array<std::uint8_t, 2>{0x7F, 0x7F});
    CHECK(u14_from_u7s(0x07, 0x68) == 1000);
  }

  SECTION("biased signed") {
    CHECK(i_to_u14(0) == std::array<std::uint8_t, 2>{0x40, 0x00});
    CHECK(i_to_u14(-9000) == std::array<std::uint8_t, 2>{0x00, 0x00});
    CHECK(i_to_u14(9000) == std::array<std::uint8_t, 2>{0x7F, 0x7F});
    CHECK(i14_from_u7s(0x40, 0x00) == 0);
    CHECK(i14_from_u7s(0x00, 0x00) == -8192);
  }

  SECTION("two's complement") {
    CHECK(to_i14(-1) == std::array<std::uint8_t, 2>{0x7F, 0x7F});
    CHECK(twos_i14_from_u7s(0x7F, 0x7F) == -1);
    CHECK(twos_i14_from_u7s(0x40, 0x00) == -8192);
    CHECK(twos_i14_from_u7s(0x3F, 0x7F) == 8191);
  }

  SECTION("byte order is chosen by the caller") {
    ByteVec lsb_first, msb_first;
    push_u14(lsb_first, 1000);
    push_u14_msb_first(msb_first, 1000);
    CHECK(lsb_first == ByteVec{0x68, 0x07});
    CHECK(msb_first == ByteVec{0x07, 0x68});

    Bytes r(lsb_first);
    CHECK(r.u14() == 1000);
    Bytes m(msb_first);
    CHECK(m.u14_msb_first() == 1000);
  }

  SECTION("replacing the low septet keeps the high one") {
    CHECK(replace_u14_lsb(0x3F80, 0x05) == 0x3F85);
    CHECK(replace_u14_lsb(1000, 0) == 896);
  }
}

TEST_CASE("septet groups are written LSB first", "[primitives]") {
  ByteVec out;
  push_u21(out, 0x1FFFFF + 10);
  CHECK(out == ByteVec{0x7F, 0x7F, 0x7F});

  out.clear();
  push_u28(out, 0x123456);
  REQUIRE(out.size() == 4);
  Bytes r(out);
  CHECK(r.septets(4) == 0x123456);

  out.clear();
  push_u35(out, 1ull << 40);
  CHECK(out == ByteVec{0x7F, 0x7F, 0x7F, 0x7F, 0x7F});
}

TEST_CASE("VLQ law", "[primitives][vlq]") {
  SECTION("S5: 0x200000 <-> 81 80 80 00") {
    CHECK(encode_vlq(0x200000) == ByteVec{0x81, 0x80, 0x80, 0x00});
    const ByteVec in{0x81, 0x80, 0x80, 0x00};
    const auto [value, len] = decode_vlq(in.data(), in.size());
    CHECK(value == 0x200000);
    CHECK(len == 4);
  }

  SECTION("shortest form for every boundary") {
    const std::uint32_t values[] = {0,        1,          0x7F,      0x80,
                                    0x3FFF,   0x4000,     0x1FFFFF,  0x200000,
                                    0xFFFFFFF};
    const std::size_t lengths[] = {1, 1, 1, 2, 2, 3, 3, 4, 4};
    for (std::size_t i = 0; i < 9; ++i) {
      const ByteVec enc = encode_vlq(values[i]);
      CHECK(enc.size() == lengths[i]);
      const auto [v, n] = decode_vlq(enc.data(), enc.size());
      CHECK(v == values[i]);
      CHECK(n == lengths[i]);
    }
  }

  SECTION("values above 28 bits clamp") {
    CHECK(encode_vlq(0xFFFFFFFF) == ByteVec{0xFF, 0xFF, 0xFF, 0x7F});
  }

  SECTION("errors") {
    const ByteVec too_long{0x81, 0x80, 0x80, 0x80, 0x00};
    try {
      (void)decode_vlq(too_long.data(), too_long.size());
      FAIL("expected VlqOverflow");
    } catch (const ParseError &e) {
      CHECK(e.kind() == ParseError::Kind::VlqOverflow);
    }

    const ByteVec cut{0x81, 0x80};
    try {
      (void)decode_vlq(cut.data(), cut.size());
      FAIL("expected UnexpectedEnd");
    } catch (const ParseError &e) {
      CHECK(e.kind() == ParseError::Kind::UnexpectedEnd);
    }
  }
}

TEST_CASE("checksum is a 7-bit XOR", "[primitives]") {
  const ByteVec data{0x7E, 0x00, 0x07, 0x03, 0x05};
  CHECK(checksum(data.data(), data.size()) == (0x7E ^ 0x07 ^ 0x03 ^ 0x05));
  const ByteVec high{0xF0, 0x01};
  CHECK(checksum(high.data(), high.size()) == ((0xF0 ^ 0x01) & 0x7F));
  CHECK(checksum(nullptr, 0) == 0);
}

TEST_CASE("nibbles", "[primitives]") {
  CHECK(to_nibbles(0xA5) == std::array<std::uint8_t, 2>{0x0A, 0x05});
}

TEST_CASE("Bytes cursor bounds", "[primitives]") {
  const ByteVec data{0x00, 0x01, 0x02};
  Bytes r(data);
  CHECK(r.be16() == 0x0001);
  CHECK(r.remaining() == 1);
  CHECK_THROWS_AS(r.be16(), ParseError);
  CHECK(r.u8() == 0x02);
  CHECK(r.at_end());
  CHECK_NOTHROW(r.expect_end("test"));

  Bytes again(data);
  CHECK_THROWS_AS(again.expect_end("test"), ParseError);
}
