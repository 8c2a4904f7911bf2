// src/midi/sysex/sample_dump.cpp

#include "midi/sysex/sample_dump.hpp"

#include <algorithm>
#include <cmath>

#include "common/reader.hpp"

namespace midi {

namespace {

constexpr std::size_t kPacketDataSize = 120;
constexpr double kRateFractionScale = 268435456.0; // 2^28
constexpr std::uint32_t kMaxU28 = 0x0FFFFFFF;

LoopType read_loop_type(Bytes &r) {
  const std::uint8_t b = r.u7();
  switch (b) {
  case 0x00:
  case 0x01:
  case 0x7F:
    return static_cast<LoopType>(b);
  default:
    throw ParseError(ParseError::Kind::Invalid, "unknown sample loop type");
  }
}

ExtendedLoopType read_extended_loop_type(Bytes &r) {
  const std::uint8_t b = r.u7();
  switch (b) {
  case 0x00:
  case 0x01:
  case 0x02:
  case 0x03:
  case 0x40:
  case 0x41:
  case 0x42:
  case 0x43:
  case 0x7E:
  case 0x7F:
    return static_cast<ExtendedLoopType>(b);
  default:
    throw ParseError(ParseError::Kind::Invalid,
                     "unknown extended sample loop type");
  }
}

void write_ascii(ByteVec &out, const std::string &s) {
  const std::size_t n = std::min<std::size_t>(s.size(), 127);
  out.push_back(static_cast<std::uint8_t>(n));
  for (std::size_t i = 0; i < n; ++i)
    out.push_back(encode_u7(static_cast<unsigned char>(s[i])));
}

std::string read_ascii(Bytes &r) {
  const std::uint8_t n = r.u7();
  std::string s;
  s.reserve(n);
  for (int i = 0; i < n; ++i)
    s.push_back(static_cast<char>(r.u7()));
  return s;
}

} // namespace

bool operator==(const SampleDumpHeader &a, const SampleDumpHeader &b) {
  return a.sample_num == b.sample_num && a.format == b.format &&
         a.period == b.period && a.length == b.length &&
         a.sustain_loop_start == b.sustain_loop_start &&
         a.sustain_loop_end == b.sustain_loop_end &&
         a.loop_type == b.loop_type;
}
bool operator==(const SampleDumpPacket &a, const SampleDumpPacket &b) {
  return a.running_count == b.running_count && a.data == b.data;
}
bool operator==(const SampleDumpRequest &a, const SampleDumpRequest &b) {
  return a.sample_num == b.sample_num;
}
bool operator==(const LoopPointTransmission &a,
                const LoopPointTransmission &b) {
  return a.sample_num == b.sample_num && a.loop_num == b.loop_num &&
         a.loop_type == b.loop_type && a.start_addr == b.start_addr &&
         a.end_addr == b.end_addr;
}
bool operator==(const LoopPointsRequest &a, const LoopPointsRequest &b) {
  return a.sample_num == b.sample_num && a.loop_num == b.loop_num;
}

void write_sample_dump(ByteVec &out, const SampleDumpMsg &msg) {
  if (const auto *h = std::get_if<SampleDumpHeader>(&msg)) {
    out.push_back(0x01);
    push_u14(out, h->sample_num);
    out.push_back(std::clamp<std::uint8_t>(h->format, 8, 28));
    push_u21(out, h->period);
    push_u21(out, h->length);
    push_u21(out, h->sustain_loop_start);
    push_u21(out, h->sustain_loop_end);
    out.push_back(static_cast<std::uint8_t>(h->loop_type));
  } else if (const auto *p = std::get_if<SampleDumpPacket>(&msg)) {
    out.push_back(0x02);
    out.push_back(encode_u7(p->running_count));
    for (std::size_t i = 0; i < kPacketDataSize; ++i)
      out.push_back(i < p->data.size() ? encode_u7(p->data[i]) : 0);
    out.push_back(0); // checksum
  } else if (const auto *q = std::get_if<SampleDumpRequest>(&msg)) {
    out.push_back(0x03);
    push_u14(out, q->sample_num);
  } else if (const auto *l = std::get_if<LoopPointTransmission>(&msg)) {
    out.push_back(0x05);
    out.push_back(0x01);
    push_u14(out, l->sample_num);
    push_u14(out, l->loop_num);
    out.push_back(static_cast<std::uint8_t>(l->loop_type));
    push_u21(out, l->start_addr);
    push_u21(out, l->end_addr);
  } else if (const auto *lr = std::get_if<LoopPointsRequest>(&msg)) {
    out.push_back(0x05);
    out.push_back(0x02);
    push_u14(out, lr->sample_num);
    push_u14(out, lr->loop_num);
  }
}

SampleDumpHeader read_sample_dump_header(Bytes &r) {
  SampleDumpHeader h;
  h.sample_num = r.u14();
  h.format = r.u7();
  h.period = static_cast<std::uint32_t>(r.septets(3));
  h.length = static_cast<std::uint32_t>(r.septets(3));
  h.sustain_loop_start = static_cast<std::uint32_t>(r.septets(3));
  h.sustain_loop_end = static_cast<std::uint32_t>(r.septets(3));
  h.loop_type = read_loop_type(r);
  return h;
}

SampleDumpPacket read_sample_dump_packet(Bytes &r) {
  SampleDumpPacket p;
  p.running_count = r.u7();
  p.data = r.rest();
  return p;
}

SampleDumpRequest read_sample_dump_request(Bytes &r) {
  return SampleDumpRequest{r.u14()};
}

LoopPointTransmission read_loop_point_transmission(Bytes &r) {
  LoopPointTransmission l;
  l.sample_num = r.u14();
  l.loop_num = r.u14();
  l.loop_type = read_loop_type(r);
  l.start_addr = static_cast<std::uint32_t>(r.septets(3));
  l.end_addr = static_cast<std::uint32_t>(r.septets(3));
  return l;
}

LoopPointsRequest read_loop_points_request(Bytes &r) {
  LoopPointsRequest l;
  l.sample_num = r.u14();
  l.loop_num = r.u14();
  return l;
}

bool operator==(const ExtendedSampleDumpHeader &a,
                const ExtendedSampleDumpHeader &b) {
  return a.sample_num == b.sample_num && a.format == b.format &&
         a.sample_rate == b.sample_rate && a.length == b.length &&
         a.sustain_loop_start == b.sustain_loop_start &&
         a.sustain_loop_end == b.sustain_loop_end &&
         a.loop_type == b.loop_type && a.num_channels == b.num_channels;
}
bool operator==(const SampleName &a, const SampleName &b) {
  return a.sample_num == b.sample_num && a.language_tag == b.language_tag &&
         a.name == b.name;
}
bool operator==(const SampleNameRequest &a, const SampleNameRequest &b) {
  return a.sample_num == b.sample_num;
}
bool operator==(const ExtendedLoopPointTransmission &a,
                const ExtendedLoopPointTransmission &b) {
  return a.sample_num == b.sample_num && a.loop_num == b.loop_num &&
         a.loop_type == b.loop_type && a.start_addr == b.start_addr &&
         a.end_addr == b.end_addr;
}
bool operator==(const ExtendedLoopPointsRequest &a,
                const ExtendedLoopPointsRequest &b) {
  return a.sample_num == b.sample_num && a.loop_num == b.loop_num;
}

void write_extended_sample_dump(ByteVec &out,
                                const ExtendedSampleDumpMsg &msg) {
  out.push_back(0x05);
  if (const auto *n = std::get_if<SampleName>(&msg)) {
    out.push_back(0x03);
    push_u14(out, n->sample_num);
    write_ascii(out, n->language_tag);
    write_ascii(out, n->name);
  } else if (const auto *nr = std::get_if<SampleNameRequest>(&msg)) {
    out.push_back(0x04);
    push_u14(out, nr->sample_num);
  } else if (const auto *h = std::get_if<ExtendedSampleDumpHeader>(&msg)) {
    out.push_back(0x05);
    push_u14(out, h->sample_num);
    out.push_back(std::clamp<std::uint8_t>(h->format, 8, 28));
    const double rate = std::max(h->sample_rate, 0.0);
    const double whole = std::floor(rate);
    auto fraction = static_cast<std::uint64_t>(
        std::llround((rate - whole) * kRateFractionScale));
    fraction = std::min<std::uint64_t>(fraction, kMaxU28);
    push_u28(out, static_cast<std::uint32_t>(
                      std::min(whole, static_cast<double>(kMaxU28))));
    push_u28(out, static_cast<std::uint32_t>(fraction));
    push_u35(out, h->length);
    push_u35(out, h->sustain_loop_start);
    push_u35(out, h->sustain_loop_end);
    out.push_back(static_cast<std::uint8_t>(h->loop_type));
    out.push_back(encode_u7(h->num_channels));
  } else if (const auto *l =
                 std::get_if<ExtendedLoopPointTransmission>(&msg)) {
    out.push_back(0x06);
    push_u14(out, l->sample_num);
    push_u14(out, l->loop_num);
    out.push_back(static_cast<std::uint8_t>(l->loop_type));
    push_u35(out, l->start_addr);
    push_u35(out, l->end_addr);
  } else if (const auto *lr = std::get_if<ExtendedLoopPointsRequest>(&msg)) {
    out.push_back(0x07);
    push_u14(out, lr->sample_num);
    push_u14(out, lr->loop_num);
  }
}

ExtendedSampleDumpMsg read_extended_sample_dump(std::uint8_t sub_id,
                                                Bytes &r) {
  switch (sub_id) {
  case 0x03: {
    SampleName n;
    n.sample_num = r.u14();
    n.language_tag = read_ascii(r);
    n.name = read_ascii(r);
    return n;
  }
  case 0x04:
    return SampleNameRequest{r.u14()};
  case 0x05: {
    ExtendedSampleDumpHeader h;
    h.sample_num = r.u14();
    h.format = r.u7();
    const auto whole = r.septets(4);
    const auto fraction = r.septets(4);
    h.sample_rate = static_cast<double>(whole) +
                    static_cast<double>(fraction) / kRateFractionScale;
    h.length = r.septets(5);
    h.sustain_loop_start = r.septets(5);
    h.sustain_loop_end = r.septets(5);
    h.loop_type = read_extended_loop_type(r);
    h.num_channels = r.u7();
    return h;
  }
  case 0x06: {
    ExtendedLoopPointTransmission l;
    l.sample_num = r.u14();
    l.loop_num = r.u14();
    l.loop_type = read_extended_loop_type(r);
    l.start_addr = r.septets(5);
    l.end_addr = r.septets(5);
    return l;
  }
  case 0x07: {
    ExtendedLoopPointsRequest l;
    l.sample_num = r.u14();
    l.loop_num = r.u14();
    return l;
  }
  default:
    throw ParseError(ParseError::Kind::Invalid,
                     "unknown extended sample dump sub-id");
  }
}

} // namespace midi
