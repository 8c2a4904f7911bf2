// tests/util_test.cpp

#include <catch2/catch.hpp>

#include <filesystem>
#include <stdexcept>

#include "common/util.hpp"
#include "test_util.hpp"

TEST_CASE("whole file write and read", "[util]") {
  const auto path =
      (std::filesystem::temp_directory_path() / "midicodec_util_test.mid")
          .string();
  const midi::ByteVec bytes = test::bytes({'M', 'T', 'h', 'd', 0x00, 0xFF});

  write_all(path, bytes);
  CHECK(read_all(path) == bytes);

  write_all(path, midi::ByteVec{});
  CHECK(read_all(path).empty());
  std::filesystem::remove(path);

  CHECK_THROWS_AS(read_all(path), std::runtime_error);
}

TEST_CASE("hex dumps", "[util]") {
  const midi::ByteVec bytes = test::bytes({0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7});
  CHECK(hex_bytes(bytes) == "f0 7e 7f 06 01 f7");
  CHECK(hex_bytes(bytes, 2) == "f0 7e ...");
  CHECK(hex_bytes(midi::ByteVec{}).empty());
}
