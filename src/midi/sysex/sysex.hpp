// src/midi/sysex/sysex.hpp
// The system exclusive envelope: `F0 <id> ... F7`.
//
//  - Commercial     : manufacturer id (1 or 3 bytes), then opaque data
//  - NonCommercial  : `7D`, then opaque data
//  - Universal RT   : `7F dev <sub-ids> <body>`
//  - Universal NRT  : `7E dev <sub-ids> <body> [checksum]`
//
// The checksum is the XOR of every byte from 7E through the last body byte.

#pragma once
#include <cstdint>
#include <variant>
#include <vector>

#include "midi/primitives.hpp"
#include "midi/sysex/ids.hpp"
#include "midi/sysex/universal.hpp"

struct Bytes;

namespace midi {

struct ReceiverContext;

struct Commercial {
  ManufacturerId id;
  std::vector<std::uint8_t> data;
};

struct NonCommercial {
  std::vector<std::uint8_t> data;
};

struct UniversalRealTime {
  DeviceId device;
  UniversalRealTimeMsg msg;
};

struct UniversalNonRealTime {
  DeviceId device;
  UniversalNonRealTimeMsg msg;
};

using SystemExclusiveMsg = std::variant<Commercial, NonCommercial,
                                        UniversalRealTime,
                                        UniversalNonRealTime>;

inline bool operator==(const Commercial &a, const Commercial &b) {
  return a.id == b.id && a.data == b.data;
}
inline bool operator==(const NonCommercial &a, const NonCommercial &b) {
  return a.data == b.data;
}
inline bool operator==(const UniversalRealTime &a,
                       const UniversalRealTime &b) {
  return a.device == b.device && a.msg == b.msg;
}
inline bool operator==(const UniversalNonRealTime &a,
                       const UniversalNonRealTime &b) {
  return a.device == b.device && a.msg == b.msg;
}

// Whole message, F0 through F7, with the checksum patched in.
void write_sysex(ByteVec &out, const SystemExclusiveMsg &msg);

// Reads through the closing F7. The leading F0 is expected unless
// ctx.is_smf_sysex is set. A full time code message updates ctx.time_code.
SystemExclusiveMsg read_sysex(Bytes &r, ReceiverContext &ctx);

} // namespace midi
