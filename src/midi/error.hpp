// src/midi/error.hpp
// The one exception type thrown by every decoder in the library.
// Encoders never throw: they clamp.

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace midi {

class ParseError : public std::runtime_error {
public:
  enum class Kind {
    UnexpectedEnd,            // input exhausted mid-message
    ByteOverflow,             // a 7-bit field had its top bit set
    ContextlessRunningStatus, // data byte with no prior channel status
    NoEndOfSystemExclusiveFlag,
    UnexpectedEndOfSystemExclusiveFlag,
    VlqOverflow, // VLQ longer than 4 bytes
    UndefinedSystemCommonMessage,
    UndefinedSystemRealTimeMessage,
    UndefinedSystemExclusiveMessage,
    Invalid,       // any other structural violation
    NotImplemented // recognised but unsupported payload class
  };

  explicit ParseError(Kind kind, std::string detail = {});

  // Convenience for the three "undefined status byte" kinds.
  ParseError(Kind kind, std::uint8_t byte);

  [[nodiscard]] Kind kind() const noexcept { return kind_; }

  // Reason for Invalid, feature name for NotImplemented, hex byte for the
  // undefined-message kinds; empty otherwise.
  [[nodiscard]] const std::string &detail() const noexcept { return detail_; }

private:
  Kind kind_;
  std::string detail_;
};

const char *to_string(ParseError::Kind kind);

} // namespace midi
