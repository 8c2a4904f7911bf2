// src/midi/sysex/ids.hpp
// Manufacturer and device identifiers carried by system exclusive messages.

#pragma once
#include <cstdint>
#include <optional>

#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

// One byte id (1..0x7C), or the three byte form `00 first second`.
struct ManufacturerId {
  std::uint8_t first = 0x01;
  std::optional<std::uint8_t> second;
};

inline bool operator==(const ManufacturerId &a, const ManufacturerId &b) {
  return a.first == b.first && a.second == b.second;
}
inline bool operator!=(const ManufacturerId &a, const ManufacturerId &b) {
  return !(a == b);
}

void write_manufacturer_id(ByteVec &out, const ManufacturerId &id);
ManufacturerId read_manufacturer_id(Bytes &r);

// Target of a universal message: a device number 0..0x7E or all call.
struct DeviceId {
  static constexpr std::uint8_t kAllCall = 0x7F;
  std::uint8_t id = kAllCall;

  static DeviceId all_call() { return DeviceId{}; }
  static DeviceId device(std::uint8_t n) {
    return DeviceId{static_cast<std::uint8_t>(n > 0x7E ? 0x7E : n)};
  }
  bool is_all_call() const { return id == kAllCall; }
};

inline bool operator==(const DeviceId &a, const DeviceId &b) {
  return a.id == b.id;
}
inline bool operator!=(const DeviceId &a, const DeviceId &b) {
  return !(a == b);
}

} // namespace midi
