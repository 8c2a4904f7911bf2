// tests/test_util.hpp
// Small helpers shared by the unit tests.

#pragma once
#include <initializer_list>
#include <optional>

#include "midi/error.hpp"
#include "midi/primitives.hpp"

namespace test {

// Runs f and returns the kind of the ParseError it threw, if any.
template <typename F>
std::optional<midi::ParseError::Kind> thrown_kind(F &&f) {
  try {
    f();
  } catch (const midi::ParseError &e) {
    return e.kind();
  }
  return std::nullopt;
}

inline midi::ByteVec bytes(std::initializer_list<int> values) {
  midi::ByteVec out;
  out.reserve(values.size());
  for (int v : values)
    out.push_back(static_cast<std::uint8_t>(v));
  return out;
}

} // namespace test
