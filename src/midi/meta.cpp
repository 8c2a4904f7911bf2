// src/midi/meta.cpp

#include "midi/meta.hpp"

#include <algorithm>

#include "common/reader.hpp"

namespace midi {

namespace {

void push_block(ByteVec &out, std::uint8_t type, const std::uint8_t *data,
                std::size_t size) {
  out.push_back(type);
  push_vlq(out, static_cast<std::uint32_t>(std::min<std::size_t>(size, kMaxVlq)));
  out.insert(out.end(), data, data + std::min<std::size_t>(size, kMaxVlq));
}

void push_block(ByteVec &out, std::uint8_t type, const ByteVec &data) {
  push_block(out, type, data.data(), data.size());
}

template <std::uint8_t Type>
bool write_text(ByteVec &out, const MetaMsg &msg) {
  const auto *t = std::get_if<TextMeta<Type>>(&msg);
  if (!t)
    return false;
  push_block(out, Type, reinterpret_cast<const std::uint8_t *>(t->text.data()),
             t->text.size());
  return true;
}

std::uint8_t denominator_power(std::uint16_t denominator) {
  std::uint8_t power = 0;
  while (power < 15 && (1u << (power + 1)) <= denominator)
    ++power;
  return power;
}

template <typename T> MetaMsg text_from(Bytes &data) {
  T t;
  t.text.assign(reinterpret_cast<const char *>(data.here()), data.remaining());
  return t;
}

} // namespace

void write_meta(ByteVec &out, const MetaMsg &msg) {
  if (write_text<0x01>(out, msg) || write_text<0x02>(out, msg) ||
      write_text<0x03>(out, msg) || write_text<0x04>(out, msg) ||
      write_text<0x05>(out, msg) || write_text<0x06>(out, msg) ||
      write_text<0x07>(out, msg))
    return;

  if (const auto *s = std::get_if<SequenceNumber>(&msg)) {
    push_block(out, 0x00,
               {static_cast<std::uint8_t>(s->number >> 8),
                static_cast<std::uint8_t>(s->number & 0xFF)});
  } else if (const auto *c = std::get_if<ChannelPrefix>(&msg)) {
    push_block(out, 0x20, {channel_index(c->channel)});
  } else if (std::holds_alternative<EndOfTrack>(msg)) {
    push_block(out, 0x2F, ByteVec{});
  } else if (const auto *t = std::get_if<SetTempo>(&msg)) {
    const std::uint32_t us = std::min<std::uint32_t>(t->us_per_qn, 0xFFFFFF);
    push_block(out, 0x51,
               {static_cast<std::uint8_t>(us >> 16),
                static_cast<std::uint8_t>((us >> 8) & 0xFF),
                static_cast<std::uint8_t>(us & 0xFF)});
  } else if (const auto *o = std::get_if<SmpteOffset>(&msg)) {
    ByteVec data;
    write_high_res_time_code(data, o->time_code);
    push_block(out, 0x54, data);
  } else if (const auto *ts = std::get_if<FileTimeSignature>(&msg)) {
    push_block(out, 0x58,
               {ts->numerator, denominator_power(ts->denominator),
                ts->clocks_per_metronome_tick,
                ts->thirty_second_notes_per_24_clocks});
  } else if (const auto *k = std::get_if<KeySignature>(&msg)) {
    push_block(out, 0x59,
               {static_cast<std::uint8_t>(k->key), k->scale});
  } else if (const auto *q = std::get_if<SequencerSpecific>(&msg)) {
    push_block(out, 0x7F, q->data);
  } else if (const auto *u = std::get_if<UnknownMeta>(&msg)) {
    push_block(out, u->meta_type, u->data);
  }
}

MetaMsg read_meta(Bytes &r) {
  const std::uint8_t type = r.u8();
  const std::uint32_t len = read_vlq(r);
  Bytes data = r.slice(len);

  switch (type) {
  case 0x01:
    return text_from<Text>(data);
  case 0x02:
    return text_from<Copyright>(data);
  case 0x03:
    return text_from<TrackName>(data);
  case 0x04:
    return text_from<InstrumentName>(data);
  case 0x05:
    return text_from<Lyric>(data);
  case 0x06:
    return text_from<Marker>(data);
  case 0x07:
    return text_from<CuePoint>(data);
  case 0x7F:
    return SequencerSpecific{data.rest()};
  default:
    break;
  }

  switch (len) {
  case 0:
    if (type == 0x2F)
      return EndOfTrack{};
    break;
  case 1:
    if (type == 0x20 && data.peek() <= 15)
      return ChannelPrefix{channel_from_u8(data.u8())};
    break;
  case 2:
    if (type == 0x00)
      return SequenceNumber{data.be16()};
    if (type == 0x59) {
      KeySignature k;
      k.key = static_cast<std::int8_t>(data.u8());
      k.scale = data.u8();
      return k;
    }
    break;
  case 3:
    if (type == 0x51)
      return SetTempo{data.be24()};
    break;
  case 4:
    if (type == 0x58 && data.here()[1] <= 15) {
      FileTimeSignature ts;
      ts.numerator = data.u8();
      ts.denominator = static_cast<std::uint16_t>(1u << data.u8());
      ts.clocks_per_metronome_tick = data.u8();
      ts.thirty_second_notes_per_24_clocks = data.u8();
      return ts;
    }
    break;
  case 5:
    if (type == 0x54)
      return SmpteOffset{read_high_res_time_code(data)};
    break;
  default:
    break;
  }
  return UnknownMeta{type, data.rest()};
}

} // namespace midi
