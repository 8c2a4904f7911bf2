// src/midi/sysex/sample_dump.hpp
// Sample Dump Standard (non-real-time sub-ids 01, 02, 03, 05 01/02) and
// its CA-019 extensions (05 03..07).
//
// Sizes and loop positions are word counts carried as LSB-first septet
// groups: 21 bits in the standard messages, 35 bits in the extended ones.

#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

enum class LoopType : std::uint8_t {
  Forward = 0x00,
  BiDirectional = 0x01,
  Off = 0x7F
};

struct SampleDumpHeader {
  std::uint16_t sample_num = 0;
  std::uint8_t format = 16;      // significant bits per sample, 8..28
  std::uint32_t period = 0;      // sample period in ns
  std::uint32_t length = 0;      // words
  std::uint32_t sustain_loop_start = 0;
  std::uint32_t sustain_loop_end = 0;
  LoopType loop_type = LoopType::Off;
};

// 120 data bytes per packet. The running packet count wraps at 128.
struct SampleDumpPacket {
  std::uint8_t running_count = 0;
  std::vector<std::uint8_t> data;
};

struct SampleDumpRequest {
  std::uint16_t sample_num = 0;
};

// Loop number 0x7F7F addresses every loop of the sample.
struct LoopPointTransmission {
  std::uint16_t sample_num = 0;
  std::uint16_t loop_num = 0;
  LoopType loop_type = LoopType::Forward;
  std::uint32_t start_addr = 0;
  std::uint32_t end_addr = 0;
};

struct LoopPointsRequest {
  std::uint16_t sample_num = 0;
  std::uint16_t loop_num = 0;
};

using SampleDumpMsg =
    std::variant<SampleDumpHeader, SampleDumpPacket, SampleDumpRequest,
                 LoopPointTransmission, LoopPointsRequest>;

bool operator==(const SampleDumpHeader &a, const SampleDumpHeader &b);
bool operator==(const SampleDumpPacket &a, const SampleDumpPacket &b);
bool operator==(const SampleDumpRequest &a, const SampleDumpRequest &b);
bool operator==(const LoopPointTransmission &a,
                const LoopPointTransmission &b);
bool operator==(const LoopPointsRequest &a, const LoopPointsRequest &b);

// Sub-ids and body. Packets end with a zero checksum placeholder.
void write_sample_dump(ByteVec &out, const SampleDumpMsg &msg);

SampleDumpHeader read_sample_dump_header(Bytes &r);
// Reads up to (not including) the checksum.
SampleDumpPacket read_sample_dump_packet(Bytes &r);
SampleDumpRequest read_sample_dump_request(Bytes &r);
LoopPointTransmission read_loop_point_transmission(Bytes &r);
LoopPointsRequest read_loop_points_request(Bytes &r);

enum class ExtendedLoopType : std::uint8_t {
  Forward = 0x00,
  BiDirectional = 0x01,
  ForwardRelease = 0x02,
  BiDirectionalRelease = 0x03,
  Backward = 0x40,
  BackwardBiDirectional = 0x41,
  BackwardRelease = 0x42,
  BackwardBiDirectionalRelease = 0x43,
  BackwardOneShot = 0x7E,
  ForwardOneShot = 0x7F
};

struct ExtendedSampleDumpHeader {
  std::uint16_t sample_num = 0;
  std::uint8_t format = 16;
  double sample_rate = 44100.0; // Hz; fraction kept to 1/2^28
  std::uint64_t length = 0;
  std::uint64_t sustain_loop_start = 0;
  std::uint64_t sustain_loop_end = 0;
  ExtendedLoopType loop_type = ExtendedLoopType::Forward;
  std::uint8_t num_channels = 1;
};

struct SampleName {
  std::uint16_t sample_num = 0;
  std::string language_tag; // empty = default (English)
  std::string name;
};

struct SampleNameRequest {
  std::uint16_t sample_num = 0;
};

struct ExtendedLoopPointTransmission {
  std::uint16_t sample_num = 0;
  std::uint16_t loop_num = 0;
  ExtendedLoopType loop_type = ExtendedLoopType::Forward;
  std::uint64_t start_addr = 0;
  std::uint64_t end_addr = 0;
};

struct ExtendedLoopPointsRequest {
  std::uint16_t sample_num = 0;
  std::uint16_t loop_num = 0;
};

using ExtendedSampleDumpMsg =
    std::variant<ExtendedSampleDumpHeader, SampleName, SampleNameRequest,
                 ExtendedLoopPointTransmission, ExtendedLoopPointsRequest>;

bool operator==(const ExtendedSampleDumpHeader &a,
                const ExtendedSampleDumpHeader &b);
bool operator==(const SampleName &a, const SampleName &b);
bool operator==(const SampleNameRequest &a, const SampleNameRequest &b);
bool operator==(const ExtendedLoopPointTransmission &a,
                const ExtendedLoopPointTransmission &b);
bool operator==(const ExtendedLoopPointsRequest &a,
                const ExtendedLoopPointsRequest &b);

// `05 <sub-id> <body>`
void write_extended_sample_dump(ByteVec &out, const ExtendedSampleDumpMsg &msg);
// `r` is positioned after `05 <sub-id>`.
ExtendedSampleDumpMsg read_extended_sample_dump(std::uint8_t sub_id,
                                                Bytes &r);

} // namespace midi
