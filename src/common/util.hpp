// src/common/util.hpp
// Small helpers shared by the tools: whole-file binary read and write, and
// hex formatting for diagnostics.
#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <ios>
#include <stdexcept>
#include <string>
#include <vector>

inline std::vector<std::uint8_t> read_all(const std::string &path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    throw std::runtime_error("Could not open file: " + path);
  }
  f.seekg(0, std::ios::end);
  std::streamsize sz = f.tellg();
  if (sz < 0) {
    throw std::runtime_error("Could not get size of file: " + path);
  }
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(sz));
  f.seekg(0, std::ios::beg);
  if (sz && !f.read(reinterpret_cast<char *>(buf.data()), sz)) {
    throw std::runtime_error("Could not read file: " + path);
  }
  return buf;
}

inline void write_all(const std::string &path,
                      const std::vector<std::uint8_t> &bytes) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    throw std::runtime_error("Could not create file: " + path);
  }
  if (!bytes.empty() &&
      !f.write(reinterpret_cast<const char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()))) {
    throw std::runtime_error("Could not write file: " + path);
  }
}

// "f0 7e 7f 06 01 f7"; at most `limit` bytes, then "...".
inline std::string hex_bytes(const std::uint8_t *data, std::size_t size,
                             std::size_t limit = 16) {
  std::string out;
  char buf[4];
  for (std::size_t i = 0; i < size && i < limit; ++i) {
    std::snprintf(buf, sizeof buf, "%02x", static_cast<unsigned>(data[i]));
    if (!out.empty())
      out += ' ';
    out += buf;
  }
  if (size > limit)
    out += " ...";
  return out;
}

inline std::string hex_bytes(const std::vector<std::uint8_t> &bytes,
                             std::size_t limit = 16) {
  return hex_bytes(bytes.data(), bytes.size(), limit);
}
