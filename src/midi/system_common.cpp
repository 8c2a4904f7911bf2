// src/midi/system_common.cpp

#include "midi/system_common.hpp"

#include <algorithm>

#include "common/reader.hpp"
#include "midi/error.hpp"

namespace midi {

void write_system_common(ByteVec &out, const SystemCommonMsg &msg) {
  if (const auto *q = std::get_if<QuarterFrame>(&msg)) {
    out.push_back(0xF1);
    const auto pieces = quarter_frame_pieces(q->time_code);
    out.push_back(pieces[std::min<std::uint8_t>(q->index, 7)]);
  } else if (const auto *p = std::get_if<SongPosition>(&msg)) {
    out.push_back(0xF2);
    push_u14(out, p->beats);
  } else if (const auto *s = std::get_if<SongSelect>(&msg)) {
    out.push_back(0xF3);
    out.push_back(encode_u7(s->song));
  } else {
    out.push_back(0xF6);
  }
}

SystemCommonMsg read_system_common(std::uint8_t status, Bytes &r,
                                   TimeCode &clock) {
  switch (status) {
  case 0xF1: {
    const int index = apply_quarter_frame(clock, r.u7());
    return QuarterFrame{static_cast<std::uint8_t>(index), clock};
  }
  case 0xF2:
    return SongPosition{r.u14()};
  case 0xF3:
    return SongSelect{r.u7()};
  case 0xF6:
    return TuneRequest{};
  case 0xF7:
    throw ParseError(ParseError::Kind::UnexpectedEndOfSystemExclusiveFlag);
  default:
    throw ParseError(ParseError::Kind::UndefinedSystemCommonMessage, status);
  }
}

} // namespace midi
