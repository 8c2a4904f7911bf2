// src/midi/sysex/sysex.cpp

#include "midi/sysex/sysex.hpp"

#include "common/reader.hpp"
#include "midi/context.hpp"

namespace midi {

namespace {

constexpr std::uint8_t kSysexStart = 0xF0;
constexpr std::uint8_t kSysexEnd = 0xF7;
constexpr std::uint8_t kNonCommercial = 0x7D;
constexpr std::uint8_t kNonRealTime = 0x7E;
constexpr std::uint8_t kRealTime = 0x7F;

void push_data(ByteVec &out, const std::vector<std::uint8_t> &data) {
  for (auto b : data)
    out.push_back(encode_u7(b));
}

// Length of the body up to (not including) F7.
std::size_t find_end(const Bytes &r) {
  for (std::size_t i = 0; i < r.remaining(); ++i) {
    const std::uint8_t b = r.here()[i];
    if (b == kSysexEnd)
      return i;
    if (b & 0x80)
      throw ParseError(ParseError::Kind::ByteOverflow);
  }
  throw ParseError(ParseError::Kind::NoEndOfSystemExclusiveFlag);
}

// `body` starts at 7E and ends before F7.
UniversalNonRealTime read_non_real_time(Bytes &body) {
  const std::uint8_t *start = body.here();
  const std::size_t total = body.remaining();
  body.skip(1);
  const DeviceId device{body.u7()};
  if (body.remaining() >= 2 &&
      nrt_has_checksum(body.here()[0], body.here()[1])) {
    if (checksum(start, total - 1) != start[total - 1])
      throw ParseError(ParseError::Kind::Invalid, "sysex checksum mismatch");
    Bytes payload = body.slice(body.remaining() - 1);
    return UniversalNonRealTime{device, read_universal_non_real_time(payload)};
  }
  return UniversalNonRealTime{device, read_universal_non_real_time(body)};
}

} // namespace

void write_sysex(ByteVec &out, const SystemExclusiveMsg &msg) {
  out.push_back(kSysexStart);
  if (const auto *c = std::get_if<Commercial>(&msg)) {
    write_manufacturer_id(out, c->id);
    push_data(out, c->data);
  } else if (const auto *n = std::get_if<NonCommercial>(&msg)) {
    out.push_back(kNonCommercial);
    push_data(out, n->data);
  } else if (const auto *rt = std::get_if<UniversalRealTime>(&msg)) {
    out.push_back(kRealTime);
    out.push_back(rt->device.id & 0x7F);
    write_universal_real_time(out, rt->msg);
  } else if (const auto *nrt = std::get_if<UniversalNonRealTime>(&msg)) {
    const std::size_t start = out.size();
    out.push_back(kNonRealTime);
    out.push_back(nrt->device.id & 0x7F);
    write_universal_non_real_time(out, nrt->msg);
    if (has_checksum(nrt->msg))
      out.back() = checksum(out.data() + start, out.size() - start - 1);
  }
  out.push_back(kSysexEnd);
}

SystemExclusiveMsg read_sysex(Bytes &r, ReceiverContext &ctx) {
  if (!ctx.is_smf_sysex) {
    const std::uint8_t status = r.u8();
    if (status != kSysexStart)
      throw ParseError(ParseError::Kind::UndefinedSystemExclusiveMessage,
                       status);
  }
  Bytes body = r.slice(find_end(r));
  r.skip(1); // F7

  const std::uint8_t first = body.peek();
  if (first == kNonCommercial) {
    body.skip(1);
    return NonCommercial{body.rest()};
  }
  if (first == kRealTime) {
    body.skip(1);
    const DeviceId device{body.u7()};
    return UniversalRealTime{device,
                             read_universal_real_time(body, ctx.time_code)};
  }
  if (first == kNonRealTime)
    return read_non_real_time(body);
  Commercial c;
  c.id = read_manufacturer_id(body);
  c.data = body.rest();
  return c;
}

} // namespace midi
