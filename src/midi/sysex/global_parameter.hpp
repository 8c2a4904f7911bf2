// src/midi/sysex/global_parameter.hpp
// Global Parameter Control (universal real-time 04 05, CA-024).
// GM2 reverb and chorus parameters are built with the helpers below.

#pragma once
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

struct ReverbSlot {};
struct ChorusSlot {};
// Any other slot path, MSB first on the wire.
struct UnregisteredSlot {
  std::uint8_t msb = 0;
  std::uint8_t lsb = 0;
};

using SlotPath = std::variant<ReverbSlot, ChorusSlot, UnregisteredSlot>;

inline bool operator==(const ReverbSlot &, const ReverbSlot &) { return true; }
inline bool operator==(const ChorusSlot &, const ChorusSlot &) { return true; }
inline bool operator==(const UnregisteredSlot &a, const UnregisteredSlot &b) {
  return a.msb == b.msb && a.lsb == b.lsb;
}

struct GlobalParameter {
  std::vector<std::uint8_t> id;    // MSB first
  std::vector<std::uint8_t> value; // MSB first; sent LSB first
};

inline bool operator==(const GlobalParameter &a, const GlobalParameter &b) {
  return a.id == b.id && a.value == b.value;
}

struct GlobalParameterControl {
  std::vector<SlotPath> slot_paths;
  std::uint8_t param_id_width = 1; // bytes
  std::uint8_t value_width = 1;    // bytes
  std::vector<GlobalParameter> params;
};

inline bool operator==(const GlobalParameterControl &a,
                       const GlobalParameterControl &b) {
  return a.slot_paths == b.slot_paths &&
         a.param_id_width == b.param_id_width &&
         a.value_width == b.value_width && a.params == b.params;
}

enum class ReverbType : std::uint8_t {
  SmallRoom = 0,
  MediumRoom = 1,
  LargeRoom = 2,
  MediumHall = 3,
  LargeHall = 4,
  Plate = 8
};

enum class ChorusType : std::uint8_t {
  Chorus1 = 0,
  Chorus2 = 1,
  Chorus3 = 2,
  Chorus4 = 3,
  FbChorus = 4,
  Flanger = 5
};

// Reverb time in seconds.
GlobalParameterControl gm2_reverb(std::optional<ReverbType> type,
                                  std::optional<double> time);

// Rate in Hz, depth in ms, feedback and send in percent.
GlobalParameterControl gm2_chorus(std::optional<ChorusType> type,
                                  std::optional<double> mod_rate,
                                  std::optional<double> mod_depth,
                                  std::optional<double> feedback,
                                  std::optional<double> send_to_reverb);

void write_global_parameter_control(ByteVec &out,
                                    const GlobalParameterControl &gp);
GlobalParameterControl read_global_parameter_control(Bytes &r);

} // namespace midi
