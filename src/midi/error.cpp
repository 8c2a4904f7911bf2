// src/midi/error.cpp
// Message formatting for ParseError.

#include "midi/error.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace {

std::string hex_byte(std::uint8_t b) {
  char buf[8];
  std::snprintf(buf, sizeof buf, "0x%02x", static_cast<unsigned>(b));
  return buf;
}

std::string render(midi::ParseError::Kind kind, const std::string &detail) {
  using Kind = midi::ParseError::Kind;
  std::string msg = "Error parsing MIDI input: ";
  switch (kind) {
  case Kind::UnexpectedEnd:
    msg += "the input ended before a message could be fully formed";
    break;
  case Kind::ByteOverflow:
    msg += "a byte exceeded 7 bits";
    break;
  case Kind::ContextlessRunningStatus:
    msg += "received a non-status byte with no prior channel message";
    break;
  case Kind::NoEndOfSystemExclusiveFlag:
    msg += "reached the end of a system exclusive message without 0xF7";
    break;
  case Kind::UnexpectedEndOfSystemExclusiveFlag:
    msg += "encountered an unexpected 0xF7";
    break;
  case Kind::VlqOverflow:
    msg += "variable-length quantity longer than 4 bytes";
    break;
  case Kind::UndefinedSystemCommonMessage:
    msg += "undefined system common message " + detail;
    break;
  case Kind::UndefinedSystemRealTimeMessage:
    msg += "undefined system real time message " + detail;
    break;
  case Kind::UndefinedSystemExclusiveMessage:
    msg += "undefined system exclusive message " + detail;
    break;
  case Kind::Invalid:
    msg += detail;
    break;
  case Kind::NotImplemented:
    msg += detail + " is not implemented";
    break;
  }
  return msg;
}

} // namespace

namespace midi {

ParseError::ParseError(Kind kind, std::string detail)
    : std::runtime_error(render(kind, detail)), kind_(kind),
      detail_(std::move(detail)) {}

ParseError::ParseError(Kind kind, std::uint8_t byte)
    : ParseError(kind, hex_byte(byte)) {}

const char *to_string(ParseError::Kind kind) {
  switch (kind) {
  case ParseError::Kind::UnexpectedEnd:
    return "UnexpectedEnd";
  case ParseError::Kind::ByteOverflow:
    return "ByteOverflow";
  case ParseError::Kind::ContextlessRunningStatus:
    return "ContextlessRunningStatus";
  case ParseError::Kind::NoEndOfSystemExclusiveFlag:
    return "NoEndOfSystemExclusiveFlag";
  case ParseError::Kind::UnexpectedEndOfSystemExclusiveFlag:
    return "UnexpectedEndOfSystemExclusiveFlag";
  case ParseError::Kind::VlqOverflow:
    return "VlqOverflow";
  case ParseError::Kind::UndefinedSystemCommonMessage:
    return "UndefinedSystemCommonMessage";
  case ParseError::Kind::UndefinedSystemRealTimeMessage:
    return "UndefinedSystemRealTimeMessage";
  case ParseError::Kind::UndefinedSystemExclusiveMessage:
    return "UndefinedSystemExclusiveMessage";
  case ParseError::Kind::Invalid:
    return "Invalid";
  case ParseError::Kind::NotImplemented:
    return "NotImplemented";
  }
  return "?";
}

} // namespace midi
