// src/midi/control_change.cpp
// CC encoding, single-CC interpretation and the pairing rules.

#include "midi/control_change.hpp"

#include <algorithm>
#include <array>

namespace {

using midi::ParameterId;

bool is_high_res_msb(std::uint8_t n) {
  switch (n) {
  case 0:
  case 1:
  case 2:
  case 4:
  case 5:
  case 6:
  case 7:
  case 8:
  case 10:
  case 11:
  case 12:
  case 13:
  case 16:
  case 17:
  case 18:
  case 19:
    return true;
  default:
    return false;
  }
}

// MSB controllers with no assigned meaning: 3, 9, 14, 15, 20-31.
bool is_undefined_high_res_msb(std::uint8_t n) {
  return n == 3 || n == 9 || n == 14 || n == 15 || (n >= 20 && n <= 31);
}

bool is_byte_cc(std::uint8_t n) {
  return (n >= 64 && n <= 84) || n == 88 || (n >= 91 && n <= 97);
}

struct RpnEntry {
  ParameterId id;
  std::uint8_t msb;
  std::uint8_t lsb;
};

// Registered parameter numbers (CC 101 / CC 100 values).
constexpr std::array<RpnEntry, 17> kRpns{{
    {ParameterId::Null, 0x7F, 0x7F},
    {ParameterId::PitchBendSensitivity, 0, 0},
    {ParameterId::FineTuning, 0, 1},
    {ParameterId::CoarseTuning, 0, 2},
    {ParameterId::TuningProgramSelect, 0, 3},
    {ParameterId::TuningBankSelect, 0, 4},
    {ParameterId::ModulationDepthRange, 0, 5},
    {ParameterId::PolyphonicExpression, 0, 6},
    {ParameterId::AzimuthAngle3DSound, 61, 0},
    {ParameterId::ElevationAngle3DSound, 61, 1},
    {ParameterId::Gain3DSound, 61, 2},
    {ParameterId::DistanceRatio3DSound, 61, 3},
    {ParameterId::MaximumDistance3DSound, 61, 4},
    {ParameterId::GainAtMaximumDistance3DSound, 61, 5},
    {ParameterId::ReferenceDistanceRatio3DSound, 61, 6},
    {ParameterId::PanSpreadAngle3DSound, 61, 7},
    {ParameterId::RollAngle3DSound, 61, 8},
}};

std::optional<ParameterId> rpn_from_wire(std::uint8_t msb, std::uint8_t lsb) {
  for (const auto &e : kRpns) {
    if (e.msb == msb && e.lsb == lsb)
      return e.id;
  }
  return std::nullopt;
}

RpnEntry rpn_to_wire(ParameterId id) {
  for (const auto &e : kRpns) {
    if (e.id == id)
      return e;
  }
  return kRpns.front(); // Null
}

void push_cc(midi::ByteVec &out, std::uint8_t control, std::uint8_t value) {
  out.push_back(control);
  out.push_back(value);
}

void write_parameter(midi::ByteVec &out, const midi::Parameter &p) {
  if (p.id == ParameterId::Unregistered) {
    const auto [msb, lsb] = midi::to_u14(p.number);
    push_cc(out, midi::kNrpnLsb, lsb);
    push_cc(out, midi::kNrpnMsb, msb);
  } else {
    const RpnEntry e = rpn_to_wire(p.id);
    push_cc(out, midi::kRpnLsb, e.lsb);
    push_cc(out, midi::kRpnMsb, e.msb);
  }

  if (!p.entry || p.id == ParameterId::Null)
    return;
  const auto [msb, lsb] = midi::to_u14(*p.entry);
  push_cc(out, static_cast<std::uint8_t>(midi::HighResCc::DataEntry), msb);
  if (!midi::entry_is_msb_only(p.id))
    push_cc(out, midi::kDataEntryLsb, lsb);
}

std::uint16_t msb_entry(unsigned msb) {
  return static_cast<std::uint16_t>(std::min(msb, 127u) << 7);
}

} // namespace

namespace midi {

bool entry_is_msb_only(ParameterId id) {
  return id == ParameterId::TuningProgramSelect ||
         id == ParameterId::TuningBankSelect ||
         id == ParameterId::PolyphonicExpression;
}

namespace param {

Parameter select(ParameterId id) {
  Parameter p;
  p.id = id;
  return p;
}

Parameter unregistered(std::uint16_t number,
                       std::optional<std::uint16_t> entry) {
  Parameter p;
  p.id = ParameterId::Unregistered;
  p.number = std::min<std::uint16_t>(number, 0x3FFF);
  if (entry)
    p.entry = std::min<std::uint16_t>(*entry, 0x3FFF);
  return p;
}

Parameter pitch_bend_sensitivity(std::uint8_t semitones, std::uint8_t cents) {
  Parameter p = select(ParameterId::PitchBendSensitivity);
  p.entry = static_cast<std::uint16_t>(msb_entry(semitones) |
                                       std::min<std::uint8_t>(cents, 100));
  return p;
}

Parameter fine_tuning(int value) {
  Parameter p = select(ParameterId::FineTuning);
  const auto [msb, lsb] = i_to_u14(value);
  p.entry = u14_from_u7s(msb, lsb);
  return p;
}

Parameter coarse_tuning(int semitones) {
  Parameter p = select(ParameterId::CoarseTuning);
  p.entry = msb_entry(i_to_u7(semitones));
  return p;
}

Parameter tuning_program_select(std::uint8_t program) {
  Parameter p = select(ParameterId::TuningProgramSelect);
  p.entry = msb_entry(program);
  return p;
}

Parameter tuning_bank_select(std::uint8_t bank) {
  Parameter p = select(ParameterId::TuningBankSelect);
  p.entry = msb_entry(bank);
  return p;
}

Parameter modulation_depth_range(std::uint16_t value) {
  return with_entry(ParameterId::ModulationDepthRange, value);
}

Parameter polyphonic_expression(std::uint8_t channels) {
  Parameter p = select(ParameterId::PolyphonicExpression);
  p.entry = msb_entry(std::min<std::uint8_t>(channels, 16));
  return p;
}

Parameter with_entry(ParameterId id, std::uint16_t value) {
  Parameter p = select(id);
  if (id != ParameterId::Null)
    p.entry = std::min<std::uint16_t>(value, 0x3FFF);
  return p;
}

} // namespace param

bool operator==(const HighResControl &a, const HighResControl &b) {
  return a.control == b.control && a.value == b.value;
}

bool operator==(const ByteControl &a, const ByteControl &b) {
  return a.control == b.control && a.value == b.value;
}

bool operator==(const UndefinedControl &a, const UndefinedControl &b) {
  return a.control == b.control && a.value == b.value;
}

bool operator==(const UndefinedHighResControl &a,
                const UndefinedHighResControl &b) {
  return a.control1 == b.control1 && a.control2 == b.control2 &&
         a.value == b.value;
}

bool operator==(const Parameter &a, const Parameter &b) {
  return a.id == b.id && a.number == b.number && a.entry == b.entry;
}

void write_control(ByteVec &out, const Control &c) {
  if (const auto *h = std::get_if<HighResControl>(&c)) {
    const auto n = static_cast<std::uint8_t>(h->control);
    const auto [msb, lsb] = to_u14(h->value);
    push_cc(out, n, msb);
    push_cc(out, static_cast<std::uint8_t>(n + 32), lsb);
  } else if (const auto *b = std::get_if<ByteControl>(&c)) {
    push_cc(out, static_cast<std::uint8_t>(b->control), encode_u7(b->value));
  } else if (const auto *u = std::get_if<UndefinedControl>(&c)) {
    push_cc(out, std::min<std::uint8_t>(u->control, 119), encode_u7(u->value));
  } else if (const auto *uh = std::get_if<UndefinedHighResControl>(&c)) {
    const auto [msb, lsb] = to_u14(uh->value);
    push_cc(out, std::min<std::uint8_t>(uh->control1, 119), msb);
    push_cc(out, std::min<std::uint8_t>(uh->control2, 119), lsb);
  } else {
    write_parameter(out, std::get<Parameter>(c));
  }
}

Control read_control(std::uint8_t number, std::uint8_t value, bool complex) {
  if (!complex)
    return UndefinedControl{number, value};
  const auto coarse = static_cast<std::uint16_t>(value << 7);
  if (is_high_res_msb(number))
    return HighResControl{static_cast<HighResCc>(number), coarse};
  if (is_undefined_high_res_msb(number))
    return UndefinedHighResControl{number,
                                   static_cast<std::uint8_t>(number + 32),
                                   coarse};
  if (is_byte_cc(number))
    return ByteControl{static_cast<ByteCc>(number), value};
  return UndefinedControl{number, value};
}

bool control_opens_merge(const Control &c) {
  if (std::holds_alternative<HighResControl>(c) ||
      std::holds_alternative<UndefinedHighResControl>(c))
    return true;
  if (const auto *u = std::get_if<UndefinedControl>(&c))
    return u->control >= kNrpnLsb && u->control <= kRpnMsb;
  if (const auto *p = std::get_if<Parameter>(&c))
    return p->id != ParameterId::Null &&
           (!p->entry || !entry_is_msb_only(p->id));
  return false;
}

std::optional<MergedControl> merge_controls(const Control &prev,
                                            const Control &next) {
  const auto *lsb = std::get_if<UndefinedControl>(&next);

  if (const auto *h = std::get_if<HighResControl>(&prev)) {
    if (lsb && lsb->control == static_cast<std::uint8_t>(h->control) + 32) {
      return MergedControl{
          HighResControl{h->control, replace_u14_lsb(h->value, lsb->value)},
          false};
    }
    return std::nullopt;
  }

  if (const auto *uh = std::get_if<UndefinedHighResControl>(&prev)) {
    if (lsb && lsb->control == uh->control2) {
      return MergedControl{
          UndefinedHighResControl{uh->control1, uh->control2,
                                  replace_u14_lsb(uh->value, lsb->value)},
          false};
    }
    return std::nullopt;
  }

  if (const auto *first = std::get_if<UndefinedControl>(&prev)) {
    if (!lsb)
      return std::nullopt;
    // Parameter numbers may arrive LSB-first or MSB-first.
    const UndefinedControl &lo = first->control < lsb->control ? *first : *lsb;
    const UndefinedControl &hi = first->control < lsb->control ? *lsb : *first;
    if (lo.control == kNrpnLsb && hi.control == kNrpnMsb) {
      return MergedControl{
          param::unregistered(u14_from_u7s(hi.value, lo.value)), true};
    }
    if (lo.control == kRpnLsb && hi.control == kRpnMsb) {
      if (const auto id = rpn_from_wire(hi.value, lo.value))
        return MergedControl{param::select(*id), *id != ParameterId::Null};
    }
    return std::nullopt;
  }

  if (const auto *p = std::get_if<Parameter>(&prev)) {
    if (p->id == ParameterId::Null)
      return std::nullopt;
    if (const auto *h = std::get_if<HighResControl>(&next)) {
      if (h->control != HighResCc::DataEntry || p->entry)
        return std::nullopt;
      Parameter out = *p;
      out.entry = h->value;
      return MergedControl{out, !entry_is_msb_only(out.id)};
    }
    if (lsb && lsb->control == kDataEntryLsb) {
      Parameter out = *p;
      out.entry = replace_u14_lsb(p->entry.value_or(0), lsb->value);
      return MergedControl{out, false};
    }
  }
  return std::nullopt;
}

} // namespace midi
