// src/midi/time_code.hpp
// SMPTE time code values and their byte layouts.
//
//  - TimeCode          : hh:mm:ss:ff + frame rate. Sent whole in a universal
//                        real-time message or piecewise as 8 quarter frames.
//  - HighResTimeCode   : adds fractional frames (1/100). SMF SMPTE offsets,
//                        cueing setup messages.
//  - StandardTimeCode  : the machine-control form, signed, with an optional
//                        status byte in place of the fractional frames.
//  - UserBits          : the 32 SMPTE user bits plus the two binary-group flags.

#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

enum class TimeCodeType : std::uint8_t {
  FPS24 = 0,
  FPS25 = 1,
  DF30 = 2, // 29.97 drop frame
  NDF30 = 3
};

// Nominal frame rate: 24, 25, 29.97 or 30.
double frames_per_second(TimeCodeType t);

struct TimeCode {
  std::uint8_t frames = 0;  // 0-29
  std::uint8_t seconds = 0; // 0-59
  std::uint8_t minutes = 0; // 0-59
  std::uint8_t hours = 0;   // 0-23
  TimeCodeType code_type = TimeCodeType::NDF30;
};

inline bool operator==(const TimeCode &a, const TimeCode &b) {
  return a.frames == b.frames && a.seconds == b.seconds &&
         a.minutes == b.minutes && a.hours == b.hours &&
         a.code_type == b.code_type;
}
inline bool operator!=(const TimeCode &a, const TimeCode &b) {
  return !(a == b);
}

// Clamped {frames, seconds, minutes, hours | type << 5}.
std::array<std::uint8_t, 4> time_code_fields(const TimeCode &tc);

// hr mn sc fr
void write_time_code(ByteVec &out, const TimeCode &tc);
TimeCode read_time_code(Bytes &r);

// The eight quarter-frame data bytes; piece i is (i << 4) | nibble.
std::array<std::uint8_t, 8> quarter_frame_pieces(const TimeCode &tc);

// Fold one quarter-frame data byte into tc. Returns the piece index 0..7.
int apply_quarter_frame(TimeCode &tc, std::uint8_t data);

struct HighResTimeCode {
  std::uint8_t fractional_frames = 0; // 0-99
  std::uint8_t frames = 0;
  std::uint8_t seconds = 0;
  std::uint8_t minutes = 0;
  std::uint8_t hours = 0;
  TimeCodeType code_type = TimeCodeType::NDF30;
};

inline bool operator==(const HighResTimeCode &a, const HighResTimeCode &b) {
  return a.fractional_frames == b.fractional_frames && a.frames == b.frames &&
         a.seconds == b.seconds && a.minutes == b.minutes &&
         a.hours == b.hours && a.code_type == b.code_type;
}
inline bool operator!=(const HighResTimeCode &a, const HighResTimeCode &b) {
  return !(a == b);
}

// hr mn sc fr ff
void write_high_res_time_code(ByteVec &out, const HighResTimeCode &tc);
HighResTimeCode read_high_res_time_code(Bytes &r);

// Status flags carried in the last byte of a StandardTimeCode.
struct TimeCodeStatus {
  bool estimated_code = false;
  bool invalid_code = false;
  bool video_field1 = false;
  bool no_time_code = false;
};

inline bool operator==(const TimeCodeStatus &a, const TimeCodeStatus &b) {
  return a.estimated_code == b.estimated_code &&
         a.invalid_code == b.invalid_code &&
         a.video_field1 == b.video_field1 && a.no_time_code == b.no_time_code;
}

struct StandardTimeCode {
  std::int8_t frames = 0; // -29..29; negative sets the sign bit
  std::uint8_t seconds = 0;
  std::uint8_t minutes = 0;
  std::uint8_t hours = 0;
  TimeCodeType code_type = TimeCodeType::NDF30;
  // When set, the last byte carries status flags instead of fractional frames.
  std::optional<TimeCodeStatus> status;
  std::uint8_t fractional_frames = 0; // 0-99, used when status is empty
};

inline bool operator==(const StandardTimeCode &a, const StandardTimeCode &b) {
  return a.frames == b.frames && a.seconds == b.seconds &&
         a.minutes == b.minutes && a.hours == b.hours &&
         a.code_type == b.code_type && a.status == b.status &&
         (a.status || a.fractional_frames == b.fractional_frames);
}
inline bool operator!=(const StandardTimeCode &a, const StandardTimeCode &b) {
  return !(a == b);
}

void write_standard_time_code(ByteVec &out, const StandardTimeCode &tc);
StandardTimeCode read_standard_time_code(Bytes &r);

struct UserBits {
  // Four bytes of user bits, most significant group first.
  std::array<std::uint8_t, 4> bytes{};
  bool flag1 = false; // binary group flag bit 1
  bool flag2 = false; // binary group flag bit 2
};

inline bool operator==(const UserBits &a, const UserBits &b) {
  return a.bytes == b.bytes && a.flag1 == b.flag1 && a.flag2 == b.flag2;
}
inline bool operator!=(const UserBits &a, const UserBits &b) {
  return !(a == b);
}

// Nine nibble bytes: ua ub uc ud ue uf ug uh flags.
std::array<std::uint8_t, 9> user_bits_nibbles(const UserBits &bits);
void write_user_bits(ByteVec &out, const UserBits &bits);
UserBits read_user_bits(Bytes &r);

} // namespace midi
