// src/midi/control_change.hpp
// Control Change (CC) payloads: the data bytes that follow a 0xBn status
// when the controller number is below 120.
//
// Three shapes share the wire:
//  - 14-bit pairs: an MSB controller (0..31) and its LSB partner (+32)
//  - single-byte controllers (64..97)
//  - RPN/NRPN parameter selection (101/100, 99/98) with an optional
//    data entry (6/38)
//
// A decoder sees one CC at a time. merge_controls() folds a following CC
// into an earlier one so that a pair surfaces as a single value.

#pragma once
#include <cstdint>
#include <optional>
#include <variant>

#include "midi/primitives.hpp"

namespace midi {

// Controllers carried as an MSB/LSB pair. The LSB controller is value + 32.
enum class HighResCc : std::uint8_t {
  BankSelect = 0,
  ModWheel = 1,
  Breath = 2,
  Foot = 4,
  Portamento = 5,
  DataEntry = 6,
  Volume = 7,
  Balance = 8,
  Pan = 10,
  Expression = 11,
  Effect1 = 12,
  Effect2 = 13,
  GeneralPurpose1 = 16,
  GeneralPurpose2 = 17,
  GeneralPurpose3 = 18,
  GeneralPurpose4 = 19
};

// Controllers carried in a single data byte.
enum class ByteCc : std::uint8_t {
  Hold = 64, // sustain
  TogglePortamento = 65,
  Sostenuto = 66,
  SoftPedal = 67,
  ToggleLegato = 68,
  Hold2 = 69,
  SoundControl1 = 70,
  SoundControl2 = 71,
  SoundControl3 = 72,
  SoundControl4 = 73,
  SoundControl5 = 74,
  SoundControl6 = 75,
  SoundControl7 = 76,
  SoundControl8 = 77,
  SoundControl9 = 78,
  SoundControl10 = 79,
  GeneralPurpose5 = 80,
  GeneralPurpose6 = 81,
  GeneralPurpose7 = 82,
  GeneralPurpose8 = 83,
  PortamentoControl = 84,
  HighResVelocity = 88, // LSB of the next note's velocity
  Effects1Depth = 91,
  Effects2Depth = 92,
  Effects3Depth = 93,
  Effects4Depth = 94,
  Effects5Depth = 95,
  DataIncrement = 96,
  DataDecrement = 97,

  // RP-021 / RP-023 names for the same numbers
  SoundVariation = SoundControl1,
  Timbre = SoundControl2,
  ReleaseTime = SoundControl3,
  AttackTime = SoundControl4,
  Brightness = SoundControl5,
  DecayTime = SoundControl6,
  VibratoRate = SoundControl7,
  VibratoDepth = SoundControl8,
  VibratoDelay = SoundControl9,
  ReverbSendLevel = Effects1Depth,
  TremoloDepth = Effects2Depth,
  ChorusSendLevel = Effects3Depth,
  CelesteDepth = Effects4Depth,
  PhaserDepth = Effects5Depth
};

// Controller numbers used by parameter selection.
constexpr std::uint8_t kDataEntryLsb = 38;
constexpr std::uint8_t kNrpnLsb = 98;
constexpr std::uint8_t kNrpnMsb = 99;
constexpr std::uint8_t kRpnLsb = 100;
constexpr std::uint8_t kRpnMsb = 101;

struct HighResControl {
  HighResCc control = HighResCc::BankSelect;
  std::uint16_t value = 0; // 0-16383
};

struct ByteControl {
  ByteCc control = ByteCc::Hold;
  std::uint8_t value = 0;
};

// Any controller number 0-119 carried raw.
struct UndefinedControl {
  std::uint8_t control = 0;
  std::uint8_t value = 0;
};

// An unassigned pair: control1 carries the MSB, control2 the LSB.
struct UndefinedHighResControl {
  std::uint8_t control1 = 0;
  std::uint8_t control2 = 0;
  std::uint16_t value = 0;
};

enum class ParameterId {
  Unregistered, // NRPN, numbered by Parameter::number
  Null,
  PitchBendSensitivity,
  FineTuning,
  CoarseTuning,
  TuningProgramSelect,
  TuningBankSelect,
  ModulationDepthRange,
  PolyphonicExpression,
  AzimuthAngle3DSound,
  ElevationAngle3DSound,
  Gain3DSound,
  DistanceRatio3DSound,
  MaximumDistance3DSound,
  GainAtMaximumDistance3DSound,
  ReferenceDistanceRatio3DSound,
  PanSpreadAngle3DSound,
  RollAngle3DSound
};

// A parameter selection, optionally followed by a data entry.
// `entry` holds the raw 14-bit data entry value (MSB << 7 | LSB); the
// helpers in namespace param build it from physical units.
// The Null parameter deselects and has no data entry: the helpers never
// give it one and an entry set by hand is not written.
struct Parameter {
  ParameterId id = ParameterId::Null;
  std::uint16_t number = 0; // NRPN number, Unregistered only
  std::optional<std::uint16_t> entry;
};

// True for parameters whose data entry is sent as the MSB alone.
bool entry_is_msb_only(ParameterId id);

namespace param {

Parameter select(ParameterId id);
Parameter unregistered(std::uint16_t number,
                       std::optional<std::uint16_t> entry = std::nullopt);
// Range in semitones and cents (cents clamped to 100).
Parameter pitch_bend_sensitivity(std::uint8_t semitones, std::uint8_t cents);
// -8192..8191 in 1/8192ths of a semitone (100/8192 cents).
Parameter fine_tuning(int value);
// -64..63 semitones.
Parameter coarse_tuning(int semitones);
Parameter tuning_program_select(std::uint8_t program);
Parameter tuning_bank_select(std::uint8_t bank);
Parameter modulation_depth_range(std::uint16_t value);
// Number of MPE zone member channels, 0..16.
Parameter polyphonic_expression(std::uint8_t channels);
// Any registered parameter with a raw 14-bit entry (the 3D sound set).
Parameter with_entry(ParameterId id, std::uint16_t value);

} // namespace param

using Control = std::variant<HighResControl, ByteControl, UndefinedControl,
                             UndefinedHighResControl, Parameter>;

bool operator==(const HighResControl &a, const HighResControl &b);
bool operator==(const ByteControl &a, const ByteControl &b);
bool operator==(const UndefinedControl &a, const UndefinedControl &b);
bool operator==(const UndefinedHighResControl &a,
                const UndefinedHighResControl &b);
bool operator==(const Parameter &a, const Parameter &b);
inline bool operator!=(const HighResControl &a, const HighResControl &b) {
  return !(a == b);
}
inline bool operator!=(const ByteControl &a, const ByteControl &b) {
  return !(a == b);
}
inline bool operator!=(const UndefinedControl &a, const UndefinedControl &b) {
  return !(a == b);
}
inline bool operator!=(const UndefinedHighResControl &a,
                       const UndefinedHighResControl &b) {
  return !(a == b);
}
inline bool operator!=(const Parameter &a, const Parameter &b) {
  return !(a == b);
}

// Data bytes only (no status): `cc value [cc value ...]`.
void write_control(ByteVec &out, const Control &c);

// Interpret a single CC. With complex == false every controller is
// surfaced as UndefinedControl. Expects number < 120.
Control read_control(std::uint8_t number, std::uint8_t value, bool complex);

// Whether a freshly decoded control can absorb a following CC.
bool control_opens_merge(const Control &c);

struct MergedControl {
  Control control;
  bool open; // may absorb yet another CC
};

// Fold `next` into an open `prev`. Empty when the pair does not combine.
std::optional<MergedControl> merge_controls(const Control &prev,
                                            const Control &next);

} // namespace midi
