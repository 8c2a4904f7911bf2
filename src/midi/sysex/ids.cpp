// src/midi/sysex/ids.cpp

#include "midi/sysex/ids.hpp"

#include <algorithm>

#include "common/reader.hpp"

namespace midi {

void write_manufacturer_id(ByteVec &out, const ManufacturerId &id) {
  if (id.second) {
    out.push_back(0x00);
    out.push_back(encode_u7(id.first));
    out.push_back(encode_u7(*id.second));
  } else {
    out.push_back(std::min<std::uint8_t>(id.first, 0x7C));
  }
}

ManufacturerId read_manufacturer_id(Bytes &r) {
  const std::uint8_t b = r.u7();
  if (b != 0x00)
    return ManufacturerId{b, std::nullopt};
  const std::uint8_t first = r.u7();
  return ManufacturerId{first, r.u7()};
}

} // namespace midi
