// src/midi/sysex/controller_destination.hpp
// Controller destination setting (universal real-time 09, CA-022) and
// key-based instrument control (0A 01, CA-023).

#pragma once
#include <cstdint>
#include <utility>
#include <vector>

#include "midi/channel.hpp"
#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

enum class ControlledParameter : std::uint8_t {
  PitchControl = 0,
  FilterCutoffControl = 1,
  AmplitudeControl = 2,
  LfoPitchDepth = 3,
  LfoFilterDepth = 4,
  LfoAmplitudeDepth = 5
};

using ParameterRange = std::pair<ControlledParameter, std::uint8_t>;

enum class PressureSource : std::uint8_t {
  ChannelPressure = 0x01,
  PolyPressure = 0x02
};

// Destination of channel pressure or poly pressure on one channel.
struct ControllerDestination {
  PressureSource source = PressureSource::ChannelPressure;
  Channel channel = Channel::Ch1;
  std::vector<ParameterRange> param_ranges;
};

// Destination of one controller (1..31 or 64..95) on one channel.
struct ControlChangeControllerDestination {
  Channel channel = Channel::Ch1;
  std::uint8_t control_number = 1;
  std::vector<ParameterRange> param_ranges;
};

inline bool operator==(const ControllerDestination &a,
                       const ControllerDestination &b) {
  return a.source == b.source && a.channel == b.channel &&
         a.param_ranges == b.param_ranges;
}
inline bool operator==(const ControlChangeControllerDestination &a,
                       const ControlChangeControllerDestination &b) {
  return a.channel == b.channel && a.control_number == b.control_number &&
         a.param_ranges == b.param_ranges;
}

// The source selects the 09 01 / 09 02 sub-id; bodies start at the channel.
void write_controller_destination(ByteVec &out,
                                  const ControllerDestination &d);
ControllerDestination read_controller_destination(PressureSource source,
                                                  Bytes &r);
void write_cc_controller_destination(
    ByteVec &out, const ControlChangeControllerDestination &d);
ControlChangeControllerDestination read_cc_controller_destination(Bytes &r);

// Controller values applied to a single key.
struct KeyBasedInstrumentControl {
  Channel channel = Channel::Ch1;
  std::uint8_t key = 60;
  // (controller, value). Controllers that cannot be key based (6, 38,
  // 96..101, 120+) are sent as controller 1.
  std::vector<std::pair<std::uint8_t, std::uint8_t>> control_values;
};

inline bool operator==(const KeyBasedInstrumentControl &a,
                       const KeyBasedInstrumentControl &b) {
  return a.channel == b.channel && a.key == b.key &&
         a.control_values == b.control_values;
}

void write_key_based_instrument_control(ByteVec &out,
                                        const KeyBasedInstrumentControl &k);
KeyBasedInstrumentControl read_key_based_instrument_control(Bytes &r);

} // namespace midi
