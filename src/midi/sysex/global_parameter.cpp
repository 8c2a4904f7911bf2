// src/midi/sysex/global_parameter.cpp

#include "midi/sysex/global_parameter.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "common/reader.hpp"

namespace midi {

namespace {

std::uint8_t scaled(double x) {
  if (!(x > 0.0))
    return 0;
  return encode_u7(static_cast<unsigned>(std::min(x, 255.0)));
}

GlobalParameter param(std::uint8_t id, std::uint8_t value) {
  return GlobalParameter{{id}, {value}};
}

GlobalParameterControl single_slot(SlotPath slot,
                                   std::vector<GlobalParameter> params) {
  GlobalParameterControl gp;
  gp.slot_paths.push_back(slot);
  gp.params = std::move(params);
  return gp;
}

} // namespace

GlobalParameterControl gm2_reverb(std::optional<ReverbType> type,
                                  std::optional<double> time) {
  std::vector<GlobalParameter> params;
  if (type)
    params.push_back(param(0, static_cast<std::uint8_t>(*type)));
  if (time)
    params.push_back(param(1, scaled(std::log(*time) / 0.025 + 40.0)));
  return single_slot(ReverbSlot{}, std::move(params));
}

GlobalParameterControl gm2_chorus(std::optional<ChorusType> type,
                                  std::optional<double> mod_rate,
                                  std::optional<double> mod_depth,
                                  std::optional<double> feedback,
                                  std::optional<double> send_to_reverb) {
  std::vector<GlobalParameter> params;
  if (type)
    params.push_back(param(0, static_cast<std::uint8_t>(*type)));
  if (mod_rate)
    params.push_back(param(1, scaled(*mod_rate / 0.122)));
  if (mod_depth)
    params.push_back(param(2, scaled(*mod_depth * 3.2 - 1.0)));
  if (feedback)
    params.push_back(param(3, scaled(*feedback / 0.763)));
  if (send_to_reverb)
    params.push_back(param(4, scaled(*send_to_reverb / 0.787)));
  return single_slot(ChorusSlot{}, std::move(params));
}

void write_global_parameter_control(ByteVec &out,
                                    const GlobalParameterControl &gp) {
  const std::size_t slots = std::min<std::size_t>(gp.slot_paths.size(), 127);
  const std::uint8_t id_width =
      std::max<std::uint8_t>(encode_u7(gp.param_id_width), 1);
  const std::uint8_t value_width =
      std::max<std::uint8_t>(encode_u7(gp.value_width), 1);
  out.push_back(static_cast<std::uint8_t>(slots));
  out.push_back(id_width);
  out.push_back(value_width);

  for (std::size_t i = 0; i < slots; ++i) {
    const SlotPath &slot = gp.slot_paths[i];
    if (std::holds_alternative<ReverbSlot>(slot)) {
      out.push_back(1);
      out.push_back(1);
    } else if (std::holds_alternative<ChorusSlot>(slot)) {
      out.push_back(1);
      out.push_back(2);
    } else {
      const auto &u = std::get<UnregisteredSlot>(slot);
      push_u7(out, u.msb);
      push_u7(out, u.lsb);
    }
  }

  // Missing bytes are sent as zero, extra bytes are dropped.
  for (const auto &p : gp.params) {
    for (std::size_t i = 0; i < id_width; ++i)
      out.push_back(i < p.id.size() ? encode_u7(p.id[i]) : 0);
    for (std::size_t i = value_width; i-- > 0;)
      out.push_back(i < p.value.size() ? encode_u7(p.value[i]) : 0);
  }
}

GlobalParameterControl read_global_parameter_control(Bytes &r) {
  GlobalParameterControl gp;
  const std::uint8_t slots = r.u7();
  gp.param_id_width = r.u7();
  gp.value_width = r.u7();
  if (gp.param_id_width == 0 || gp.value_width == 0)
    throw ParseError(ParseError::Kind::Invalid,
                     "global parameter width of zero");

  for (int i = 0; i < slots; ++i) {
    const std::uint8_t msb = r.u7();
    const std::uint8_t lsb = r.u7();
    if (msb == 1 && lsb == 1)
      gp.slot_paths.emplace_back(ReverbSlot{});
    else if (msb == 1 && lsb == 2)
      gp.slot_paths.emplace_back(ChorusSlot{});
    else
      gp.slot_paths.emplace_back(UnregisteredSlot{msb, lsb});
  }

  const std::size_t stride = gp.param_id_width + gp.value_width;
  if (r.remaining() % stride != 0)
    throw ParseError(ParseError::Kind::Invalid,
                     "global parameter list is not a whole number of entries");
  while (!r.at_end()) {
    GlobalParameter p;
    p.id = r.take(gp.param_id_width);
    p.value = r.take(gp.value_width);
    std::reverse(p.value.begin(), p.value.end());
    gp.params.push_back(std::move(p));
  }
  return gp;
}

} // namespace midi
