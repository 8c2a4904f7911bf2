// src/midi/sysex/file_reference.hpp
// File Reference (non-real-time sub-id 0B, CA-018): open a DLS, SF2 or
// WAV file by URL and map its contents onto banks and programs.
//
// Every message starts with a 14-bit context number and a 14-bit byte
// count of what follows.

#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "midi/primitives.hpp"

struct Bytes;

namespace midi {

enum class FileReferenceType { DLS, SF2, WAV };

struct SoundFileMap {
  std::uint16_t dst_bank = 0;
  std::uint8_t dst_prog = 0;
  std::uint16_t src_bank = 0;
  std::uint8_t src_prog = 0;
  bool src_drum = false;
  bool dst_drum = false;
  std::uint8_t volume = 0x7F;
};

struct WavMap {
  std::uint16_t dst_bank = 0;
  std::uint8_t dst_prog = 0;
  std::uint8_t base = 60;
  std::uint8_t lokey = 0;
  std::uint8_t hikey = 0x7F;
  std::int16_t fine = 0; // -8192..8191
  std::uint8_t volume = 0x7F;
};

bool operator==(const SoundFileMap &a, const SoundFileMap &b);
bool operator==(const WavMap &a, const WavMap &b);

struct SoundFileSelect {
  std::vector<SoundFileMap> maps; // up to 127
};

struct WavSelect {
  WavMap map;
};

// Bank offset extension applied to a whole sound file.
struct SoundFileBankOffset {
  std::uint16_t bank_offset = 0;
  bool src_drum = false;
};

struct WavBankOffset {
  WavMap map;
  std::uint16_t bank_offset = 0;
  bool src_drum = false;
};

using SelectMap =
    std::variant<SoundFileSelect, WavSelect, SoundFileBankOffset, WavBankOffset>;

bool operator==(const SoundFileSelect &a, const SoundFileSelect &b);
bool operator==(const WavSelect &a, const WavSelect &b);
bool operator==(const SoundFileBankOffset &a, const SoundFileBankOffset &b);
bool operator==(const WavBankOffset &a, const WavBankOffset &b);

struct FileReferenceOpen {
  std::uint16_t ctx = 0;
  FileReferenceType file_type = FileReferenceType::DLS;
  std::string url; // ASCII, up to 260 characters
};

struct FileReferenceSelectContents {
  std::uint16_t ctx = 0;
  SelectMap map;
};

struct FileReferenceOpenSelectContents {
  std::uint16_t ctx = 0;
  FileReferenceType file_type = FileReferenceType::DLS;
  std::string url;
  SelectMap map;
};

struct FileReferenceClose {
  std::uint16_t ctx = 0;
};

using FileReferenceMsg =
    std::variant<FileReferenceOpen, FileReferenceSelectContents,
                 FileReferenceOpenSelectContents, FileReferenceClose>;

bool operator==(const FileReferenceOpen &a, const FileReferenceOpen &b);
bool operator==(const FileReferenceSelectContents &a,
                const FileReferenceSelectContents &b);
bool operator==(const FileReferenceOpenSelectContents &a,
                const FileReferenceOpenSelectContents &b);
bool operator==(const FileReferenceClose &a, const FileReferenceClose &b);

// `<sub-id 01..04> ctx ctx len len <body>`
void write_file_reference(ByteVec &out, const FileReferenceMsg &msg);
// `r` is positioned after the sub-id.
FileReferenceMsg read_file_reference(std::uint8_t sub_id, Bytes &r);

} // namespace midi
