// src/midi/meta.hpp
// SMF meta events: `FF <type> <vlq length> <data>`.
// Only found inside track chunks; never sent on the wire.
//
// Fixed-size events (tempo, time signature, ...) whose length field does
// not match their layout are kept as UnknownMeta so the file still
// round-trips byte for byte.

#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "midi/channel.hpp"
#include "midi/primitives.hpp"
#include "midi/time_code.hpp"

struct Bytes;

namespace midi {

struct SequenceNumber {
  std::uint16_t number = 0;
};

// Text events 0x01-0x07 share a layout and differ only by type.
template <std::uint8_t Type> struct TextMeta {
  static constexpr std::uint8_t kType = Type;
  std::string text;
};

using Text = TextMeta<0x01>;
using Copyright = TextMeta<0x02>;
using TrackName = TextMeta<0x03>;
using InstrumentName = TextMeta<0x04>;
using Lyric = TextMeta<0x05>;
using Marker = TextMeta<0x06>;
using CuePoint = TextMeta<0x07>;

template <std::uint8_t Type>
bool operator==(const TextMeta<Type> &a, const TextMeta<Type> &b) {
  return a.text == b.text;
}

struct ChannelPrefix {
  Channel channel = Channel::Ch1;
};

struct EndOfTrack {};

// Microseconds per quarter note (24 bits).
struct SetTempo {
  std::uint32_t us_per_qn = 500000;
};

struct SmpteOffset {
  HighResTimeCode time_code;
};

struct FileTimeSignature {
  std::uint8_t numerator = 4;
  std::uint16_t denominator = 4; // as notated; stored as a power of two
  std::uint8_t clocks_per_metronome_tick = 24;
  std::uint8_t thirty_second_notes_per_24_clocks = 8;
};

struct KeySignature {
  std::int8_t key = 0;    // sharps positive, flats negative
  std::uint8_t scale = 0; // 0 major, 1 minor
};

struct SequencerSpecific {
  std::vector<std::uint8_t> data;
};

struct UnknownMeta {
  std::uint8_t meta_type = 0;
  std::vector<std::uint8_t> data;
};

using MetaMsg =
    std::variant<SequenceNumber, Text, Copyright, TrackName, InstrumentName,
                 Lyric, Marker, CuePoint, ChannelPrefix, EndOfTrack, SetTempo,
                 SmpteOffset, FileTimeSignature, KeySignature,
                 SequencerSpecific, UnknownMeta>;

inline bool operator==(const SequenceNumber &a, const SequenceNumber &b) {
  return a.number == b.number;
}
inline bool operator==(const ChannelPrefix &a, const ChannelPrefix &b) {
  return a.channel == b.channel;
}
inline bool operator==(const EndOfTrack &, const EndOfTrack &) { return true; }
inline bool operator==(const SetTempo &a, const SetTempo &b) {
  return a.us_per_qn == b.us_per_qn;
}
inline bool operator==(const SmpteOffset &a, const SmpteOffset &b) {
  return a.time_code == b.time_code;
}
inline bool operator==(const FileTimeSignature &a,
                       const FileTimeSignature &b) {
  return a.numerator == b.numerator && a.denominator == b.denominator &&
         a.clocks_per_metronome_tick == b.clocks_per_metronome_tick &&
         a.thirty_second_notes_per_24_clocks ==
             b.thirty_second_notes_per_24_clocks;
}
inline bool operator==(const KeySignature &a, const KeySignature &b) {
  return a.key == b.key && a.scale == b.scale;
}
inline bool operator==(const SequencerSpecific &a,
                       const SequencerSpecific &b) {
  return a.data == b.data;
}
inline bool operator==(const UnknownMeta &a, const UnknownMeta &b) {
  return a.meta_type == b.meta_type && a.data == b.data;
}

// `type len data`; the FF prefix is the caller's.
void write_meta(ByteVec &out, const MetaMsg &msg);
// Starts at the type byte.
MetaMsg read_meta(Bytes &r);

} // namespace midi
