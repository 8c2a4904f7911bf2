// src/midi/sysex/file_reference.cpp

#include "midi/sysex/file_reference.hpp"

#include <algorithm>
#include <optional>

#include "common/reader.hpp"

namespace midi {

namespace {

constexpr std::size_t kMaxUrl = 260;
constexpr std::size_t kWavMapSize = 9;

void write_type(ByteVec &out, FileReferenceType t) {
  const char *tag = "DLS ";
  if (t == FileReferenceType::SF2)
    tag = "SF2 ";
  else if (t == FileReferenceType::WAV)
    tag = "WAV ";
  out.insert(out.end(), tag, tag + 4);
}

FileReferenceType read_type(Bytes &r) {
  const auto tag = r.take(4);
  const std::string s(tag.begin(), tag.end());
  if (s == "DLS ")
    return FileReferenceType::DLS;
  if (s == "SF2 ")
    return FileReferenceType::SF2;
  if (s == "WAV ")
    return FileReferenceType::WAV;
  throw ParseError(ParseError::Kind::Invalid, "unknown file reference type");
}

void write_url(ByteVec &out, const std::string &url) {
  const std::size_t n = std::min(url.size(), kMaxUrl);
  for (std::size_t i = 0; i < n; ++i)
    out.push_back(encode_u7(static_cast<unsigned char>(url[i])));
  out.push_back(0);
}

std::string read_url(Bytes &r) {
  std::string url;
  for (std::uint8_t c = r.u7(); c != 0; c = r.u7())
    url.push_back(static_cast<char>(c));
  return url;
}

void write_sound_file_map(ByteVec &out, const SoundFileMap &m) {
  push_u14(out, m.dst_bank);
  push_u7(out, m.dst_prog);
  push_u14(out, m.src_bank);
  push_u7(out, m.src_prog);
  out.push_back(static_cast<std::uint8_t>((m.src_drum ? 1 : 0) |
                                          (m.dst_drum ? 2 : 0)));
  push_u7(out, m.volume);
}

SoundFileMap read_sound_file_map(Bytes &r) {
  SoundFileMap m;
  m.dst_bank = r.u14();
  m.dst_prog = r.u7();
  m.src_bank = r.u14();
  m.src_prog = r.u7();
  const std::uint8_t flags = r.u7();
  m.src_drum = flags & 1;
  m.dst_drum = flags & 2;
  m.volume = r.u7();
  return m;
}

void write_wav_map(ByteVec &out, const WavMap &m) {
  push_u14(out, m.dst_bank);
  push_u7(out, m.dst_prog);
  push_u7(out, m.base);
  push_u7(out, m.lokey);
  push_u7(out, m.hikey);
  push_i14(out, m.fine);
  push_u7(out, m.volume);
}

WavMap read_wav_map(Bytes &r) {
  WavMap m;
  m.dst_bank = r.u14();
  m.dst_prog = r.u7();
  m.base = r.u7();
  m.lokey = r.u7();
  m.hikey = r.u7();
  m.fine = r.i14();
  m.volume = r.u7();
  return m;
}

// Zero map count followed by extension 00 01, three bytes long.
void write_bank_offset(ByteVec &out, std::uint16_t bank_offset,
                       bool src_drum) {
  out.insert(out.end(), {0x00, 0x00, 0x01, 0x03});
  push_u14(out, bank_offset);
  out.push_back(src_drum ? 1 : 0);
}

void read_bank_offset(Bytes &r, std::uint16_t &bank_offset, bool &src_drum) {
  if (r.u7() != 0 || r.u7() != 0x00 || r.u7() != 0x01 || r.u7() != 0x03)
    throw ParseError(ParseError::Kind::Invalid,
                     "unknown file reference map extension");
  bank_offset = r.u14();
  src_drum = r.u7() & 1;
}

void write_select_map(ByteVec &out, const SelectMap &map) {
  if (const auto *sf = std::get_if<SoundFileSelect>(&map)) {
    const std::size_t count = std::min<std::size_t>(sf->maps.size(), 127);
    out.push_back(static_cast<std::uint8_t>(count));
    for (std::size_t i = 0; i < count; ++i)
      write_sound_file_map(out, sf->maps[i]);
  } else if (const auto *w = std::get_if<WavSelect>(&map)) {
    write_wav_map(out, w->map);
  } else if (const auto *sb = std::get_if<SoundFileBankOffset>(&map)) {
    write_bank_offset(out, sb->bank_offset, sb->src_drum);
  } else if (const auto *wb = std::get_if<WavBankOffset>(&map)) {
    write_wav_map(out, wb->map);
    write_bank_offset(out, wb->bank_offset, wb->src_drum);
  }
}

bool starts_bank_offset(const Bytes &r) {
  return r.remaining() == 7 && r.here()[0] == 0 && r.here()[1] == 0 &&
         r.here()[2] == 1;
}

// The map shape follows the file type when the message names one.
// SelectContents does not, so the shape is inferred from the length.
SelectMap read_select_map(Bytes &r, std::optional<FileReferenceType> type) {
  const std::size_t n = r.remaining();
  const bool wav = type ? *type == FileReferenceType::WAV
                        : (n == kWavMapSize || n == kWavMapSize + 7) &&
                              !(n == kWavMapSize && !r.at_end() &&
                                r.here()[0] == 1);
  if (wav) {
    const WavMap map = read_wav_map(r);
    if (r.at_end())
      return WavSelect{map};
    WavBankOffset wb;
    wb.map = map;
    read_bank_offset(r, wb.bank_offset, wb.src_drum);
    return wb;
  }
  if (starts_bank_offset(r)) {
    SoundFileBankOffset sb;
    read_bank_offset(r, sb.bank_offset, sb.src_drum);
    return sb;
  }
  SoundFileSelect sf;
  const std::uint8_t count = r.u7();
  for (int i = 0; i < count; ++i)
    sf.maps.push_back(read_sound_file_map(r));
  return sf;
}

void write_body(ByteVec &out, std::uint16_t ctx, const ByteVec &body) {
  push_u14(out, ctx);
  push_u14(out, static_cast<unsigned>(body.size()));
  out.insert(out.end(), body.begin(), body.end());
}

} // namespace

bool operator==(const SoundFileMap &a, const SoundFileMap &b) {
  return a.dst_bank == b.dst_bank && a.dst_prog == b.dst_prog &&
         a.src_bank == b.src_bank && a.src_prog == b.src_prog &&
         a.src_drum == b.src_drum && a.dst_drum == b.dst_drum &&
         a.volume == b.volume;
}
bool operator==(const WavMap &a, const WavMap &b) {
  return a.dst_bank == b.dst_bank && a.dst_prog == b.dst_prog &&
         a.base == b.base && a.lokey == b.lokey && a.hikey == b.hikey &&
         a.fine == b.fine && a.volume == b.volume;
}
bool operator==(const SoundFileSelect &a, const SoundFileSelect &b) {
  return a.maps == b.maps;
}
bool operator==(const WavSelect &a, const WavSelect &b) {
  return a.map == b.map;
}
bool operator==(const SoundFileBankOffset &a, const SoundFileBankOffset &b) {
  return a.bank_offset == b.bank_offset && a.src_drum == b.src_drum;
}
bool operator==(const WavBankOffset &a, const WavBankOffset &b) {
  return a.map == b.map && a.bank_offset == b.bank_offset &&
         a.src_drum == b.src_drum;
}
bool operator==(const FileReferenceOpen &a, const FileReferenceOpen &b) {
  return a.ctx == b.ctx && a.file_type == b.file_type && a.url == b.url;
}
bool operator==(const FileReferenceSelectContents &a,
                const FileReferenceSelectContents &b) {
  return a.ctx == b.ctx && a.map == b.map;
}
bool operator==(const FileReferenceOpenSelectContents &a,
                const FileReferenceOpenSelectContents &b) {
  return a.ctx == b.ctx && a.file_type == b.file_type && a.url == b.url &&
         a.map == b.map;
}
bool operator==(const FileReferenceClose &a, const FileReferenceClose &b) {
  return a.ctx == b.ctx;
}

void write_file_reference(ByteVec &out, const FileReferenceMsg &msg) {
  ByteVec body;
  if (const auto *o = std::get_if<FileReferenceOpen>(&msg)) {
    out.push_back(0x01);
    write_type(body, o->file_type);
    write_url(body, o->url);
    write_body(out, o->ctx, body);
  } else if (const auto *s = std::get_if<FileReferenceSelectContents>(&msg)) {
    out.push_back(0x02);
    write_select_map(body, s->map);
    write_body(out, s->ctx, body);
  } else if (const auto *os =
                 std::get_if<FileReferenceOpenSelectContents>(&msg)) {
    out.push_back(0x03);
    write_type(body, os->file_type);
    write_url(body, os->url);
    write_select_map(body, os->map);
    write_body(out, os->ctx, body);
  } else if (const auto *c = std::get_if<FileReferenceClose>(&msg)) {
    out.push_back(0x04);
    write_body(out, c->ctx, body);
  }
}

FileReferenceMsg read_file_reference(std::uint8_t sub_id, Bytes &r) {
  const std::uint16_t ctx = r.u14();
  const std::uint16_t length = r.u14();
  Bytes body = r.slice(length);

  switch (sub_id) {
  case 0x01: {
    FileReferenceOpen o;
    o.ctx = ctx;
    o.file_type = read_type(body);
    o.url = read_url(body);
    body.expect_end("file reference open");
    return o;
  }
  case 0x02: {
    FileReferenceSelectContents s;
    s.ctx = ctx;
    s.map = read_select_map(body, std::nullopt);
    body.expect_end("file reference select");
    return s;
  }
  case 0x03: {
    FileReferenceOpenSelectContents os;
    os.ctx = ctx;
    os.file_type = read_type(body);
    os.url = read_url(body);
    os.map = read_select_map(body, os.file_type);
    body.expect_end("file reference select");
    return os;
  }
  case 0x04:
    body.expect_end("file reference close");
    return FileReferenceClose{ctx};
  default:
    throw ParseError(ParseError::Kind::Invalid,
                     "unknown file reference sub-id");
  }
}

} // namespace midi
