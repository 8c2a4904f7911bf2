// src/midi/sysex/machine_control.cpp

#include "midi/sysex/machine_control.hpp"

#include "common/reader.hpp"

namespace midi {

namespace {

constexpr std::uint8_t kLocate = 0x44;

bool is_transport_command(std::uint8_t b) {
  return (b >= 0x01 && b <= 0x0D) || b == 0x7C || b == 0x7F;
}

} // namespace

void write_machine_control(ByteVec &out, const MachineControlCommandMsg &msg) {
  if (const auto *c = std::get_if<MachineCommand>(&msg)) {
    out.push_back(static_cast<std::uint8_t>(*c));
  } else if (const auto *f = std::get_if<LocateInformationField>(&msg)) {
    out.push_back(kLocate);
    out.push_back(2); // byte count
    out.push_back(0); // sub command: I/F
    out.push_back(static_cast<std::uint8_t>(f->field));
  } else if (const auto *t = std::get_if<LocateTarget>(&msg)) {
    out.push_back(kLocate);
    out.push_back(6); // byte count
    out.push_back(1); // sub command: target
    write_standard_time_code(out, t->target);
  } else if (const auto *u = std::get_if<UnknownMachineCommand>(&msg)) {
    for (auto b : u->data)
      out.push_back(encode_u7(b));
  }
}

MachineControlCommandMsg read_machine_control(Bytes &r) {
  const std::uint8_t first = r.peek();
  if (r.remaining() == 1 && is_transport_command(first))
    return static_cast<MachineCommand>(r.u8());

  if (first == kLocate && r.remaining() >= 3) {
    const std::uint8_t count = r.here()[1];
    const std::uint8_t sub = r.here()[2];
    if (sub == 0 && count == 2 && r.remaining() == 4) {
      const std::uint8_t field = r.here()[3];
      if (field >= 0x01 && field <= 0x0F) {
        r.skip(4);
        return LocateInformationField{static_cast<InformationField>(field)};
      }
    } else if (sub == 1 && count == 6 && r.remaining() == 8) {
      r.skip(3);
      return LocateTarget{read_standard_time_code(r)};
    }
  }
  return UnknownMachineCommand{r.rest()};
}

} // namespace midi
