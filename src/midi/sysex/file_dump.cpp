// src/midi/sysex/file_dump.cpp

#include "midi/sysex/file_dump.hpp"

#include <algorithm>

#include "common/reader.hpp"

namespace midi {

namespace {

void write_file_type(ByteVec &out, const std::string &type) {
  for (std::size_t i = 0; i < 4; ++i) {
    const char c = i < type.size() ? type[i] : ' ';
    out.push_back(encode_u7(static_cast<unsigned char>(c)));
  }
}

std::string read_file_type(Bytes &r) {
  std::string type;
  for (int i = 0; i < 4; ++i)
    type.push_back(static_cast<char>(r.u7()));
  return type;
}

void write_name(ByteVec &out, const std::string &name) {
  for (char c : name)
    out.push_back(encode_u7(static_cast<unsigned char>(c)));
}

std::string read_name(Bytes &r) {
  std::string name;
  while (!r.at_end())
    name.push_back(static_cast<char>(r.u7()));
  return name;
}

} // namespace

bool operator==(const FileDumpHeader &a, const FileDumpHeader &b) {
  return a.sender == b.sender && a.file_type == b.file_type &&
         a.length == b.length && a.name == b.name;
}
bool operator==(const FileDumpPacket &a, const FileDumpPacket &b) {
  return a.running_count == b.running_count && a.data == b.data;
}
bool operator==(const FileDumpRequest &a, const FileDumpRequest &b) {
  return a.requester == b.requester && a.file_type == b.file_type &&
         a.name == b.name;
}

ByteVec encode_file_dump_data(const std::vector<std::uint8_t> &raw) {
  const std::size_t n = std::min(raw.size(), kFileDumpPacketMax);
  ByteVec coded;
  coded.reserve(n + (n + 6) / 7);
  for (std::size_t group = 0; group < n; group += 7) {
    const std::size_t end = std::min(group + 7, n);
    std::uint8_t top_bits = 0;
    for (std::size_t i = group; i < end; ++i) {
      if (raw[i] & 0x80)
        top_bits |= static_cast<std::uint8_t>(1 << (6 - (i - group)));
    }
    coded.push_back(top_bits);
    for (std::size_t i = group; i < end; ++i)
      coded.push_back(raw[i] & 0x7F);
  }
  return coded;
}

std::vector<std::uint8_t> decode_file_dump_data(const std::uint8_t *coded,
                                                std::size_t size) {
  std::vector<std::uint8_t> raw;
  raw.reserve(size);
  for (std::size_t group = 0; group < size; group += 8) {
    const std::uint8_t top_bits = coded[group];
    const std::size_t end = std::min(group + 8, size);
    for (std::size_t i = group + 1; i < end; ++i) {
      const int bit = (top_bits >> (6 - (i - group - 1))) & 1;
      raw.push_back(static_cast<std::uint8_t>(coded[i] | (bit << 7)));
    }
  }
  return raw;
}

void write_file_dump(ByteVec &out, const FileDumpMsg &msg) {
  if (const auto *h = std::get_if<FileDumpHeader>(&msg)) {
    out.push_back(0x01);
    out.push_back(encode_u7(h->sender));
    write_file_type(out, h->file_type);
    push_u28(out, h->length);
    write_name(out, h->name);
  } else if (const auto *p = std::get_if<FileDumpPacket>(&msg)) {
    out.push_back(0x02);
    out.push_back(encode_u7(p->running_count));
    const ByteVec coded = encode_file_dump_data(p->data);
    // Byte count is the coded length minus one; an empty packet still
    // sends a zero here.
    out.push_back(
        static_cast<std::uint8_t>(coded.empty() ? 0 : coded.size() - 1));
    out.insert(out.end(), coded.begin(), coded.end());
    out.push_back(0); // checksum
  } else if (const auto *q = std::get_if<FileDumpRequest>(&msg)) {
    out.push_back(0x03);
    out.push_back(encode_u7(q->requester));
    write_file_type(out, q->file_type);
    write_name(out, q->name);
  }
}

FileDumpMsg read_file_dump(std::uint8_t sub_id, Bytes &r) {
  switch (sub_id) {
  case 0x01: {
    FileDumpHeader h;
    h.sender = r.u7();
    h.file_type = read_file_type(r);
    h.length = static_cast<std::uint32_t>(r.septets(4));
    h.name = read_name(r);
    return h;
  }
  case 0x02: {
    FileDumpPacket p;
    p.running_count = r.u7();
    const std::size_t count = static_cast<std::size_t>(r.u7()) + 1;
    if (count != r.remaining() && !(count == 1 && r.at_end()))
      throw ParseError(ParseError::Kind::Invalid,
                       "file dump packet length mismatch");
    p.data = decode_file_dump_data(r.here(), r.remaining());
    r.skip(r.remaining());
    return p;
  }
  case 0x03: {
    FileDumpRequest q;
    q.requester = r.u7();
    q.file_type = read_file_type(r);
    q.name = read_name(r);
    return q;
  }
  default:
    throw ParseError(ParseError::Kind::Invalid, "unknown file dump sub-id");
  }
}

} // namespace midi
