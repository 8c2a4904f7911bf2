// src/midi/sysex/file_dump.hpp
// File Dump (non-real-time sub-id 07): header, data packets and request.
//
// Packets move 8-bit file data over the 7-bit wire in groups of eight
// bytes: one byte holding the top bits of the next seven (bit 6 for the
// first), then the seven bytes with their top bit cleared.

#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

constexpr std::size_t kFileDumpPacketMax = 112; // raw bytes per packet

struct FileDumpHeader {
  std::uint8_t sender = 0;       // device id of the sender
  std::string file_type = "MIDI"; // four ASCII characters
  std::uint32_t length = 0;      // file length in bytes
  std::string name;
};

struct FileDumpPacket {
  std::uint8_t running_count = 0;
  std::vector<std::uint8_t> data; // raw 8-bit bytes, up to 112
};

struct FileDumpRequest {
  std::uint8_t requester = 0;
  std::string file_type = "MIDI";
  std::string name;
};

using FileDumpMsg = std::variant<FileDumpHeader, FileDumpPacket, FileDumpRequest>;

bool operator==(const FileDumpHeader &a, const FileDumpHeader &b);
bool operator==(const FileDumpPacket &a, const FileDumpPacket &b);
bool operator==(const FileDumpRequest &a, const FileDumpRequest &b);

// 7-bit coding of raw packet data. Input beyond 112 bytes is dropped.
ByteVec encode_file_dump_data(const std::vector<std::uint8_t> &raw);
std::vector<std::uint8_t> decode_file_dump_data(const std::uint8_t *coded,
                                                std::size_t size);

// `<sub-id> <body>`; packets end with a zero checksum placeholder.
void write_file_dump(ByteVec &out, const FileDumpMsg &msg);
// `r` is positioned after the sub-id and excludes any checksum.
FileDumpMsg read_file_dump(std::uint8_t sub_id, Bytes &r);

} // namespace midi
