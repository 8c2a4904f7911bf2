// src/app/cli.hpp
// Command line parsing for smfdump.
// Responsibilities:
//  - Extract the positional MIDI path.
//  - Parse --events N, --check and --write <path>.
//  - Validate that the MIDI file exists (fail early with a clear error).
//
// Header-only; throws std::runtime_error on problems, main() catches and
// prints.
//
// Usage from main.cpp:
//   app::Cli cli = app::parse_cli(argc, argv);
//   cli.midiPath        --> std::filesystem::path to the .mid file
//   cli.eventsPerTrack  --> events listed per track (0 = header only)
//   cli.check           --> re-encode and compare
//   cli.writePath       --> where to store the re-encoded file, if given

#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace app {

struct Cli {
  std::filesystem::path midiPath;
  std::size_t eventsPerTrack = 20;
  bool check = false;
  std::optional<std::filesystem::path> writePath;
};

// Small helper: true if s looks like a flag (starts with '-' and not just "-")
inline bool is_flag_like(const std::string &s) {
  return !s.empty() && s[0] == '-' && s != "-";
}

inline std::string usage(const char *argv0) {
  return "Usage:\n  " + std::string(argv0) +
         " <file.mid> [--events N] [--check] [--write <out.mid>]\n"
         "Options:\n"
         "  --events N         list at most N events per track (default 20)\n"
         "  --check            re-encode the file and verify it decodes equal\n"
         "  --write <out.mid>  store the re-encoded file\n";
}

inline std::size_t parse_count(const std::string &flag, const std::string &v) {
  std::size_t used = 0;
  unsigned long n = 0;
  try {
    n = std::stoul(v, &used);
  } catch (const std::exception &) {
    throw std::runtime_error(flag + " expects a number, got '" + v + "'");
  }
  if (used != v.size()) {
    throw std::runtime_error(flag + " expects a number, got '" + v + "'");
  }
  return static_cast<std::size_t>(n);
}

// Parse argv into our Cli struct.
// Contract:
//  - argv[1] must be the MIDI file path (positional).
//  - Throws std::runtime_error on any invalid input.
inline Cli parse_cli(int argc, char **argv) {
  if (argc < 2) {
    throw std::runtime_error(usage(argv[0]));
  }

  // 1) Positional MIDI path
  std::filesystem::path midiPath = argv[1];
  if (midiPath == "--help" || midiPath == "-h") {
    throw std::runtime_error(usage(argv[0]));
  }
  if (is_flag_like(midiPath.string())) {
    throw std::runtime_error(
        "First argument must be a MIDI file path, not a flag.");
  }
  if (!std::filesystem::exists(midiPath) ||
      !std::filesystem::is_regular_file(midiPath)) {
    throw std::runtime_error("MIDI file not found: " + midiPath.string());
  }

  // 2) Optional flags
  Cli cli;
  for (int i = 2; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") {
      throw std::runtime_error(usage(argv[0]));
    } else if (a == "--events") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--events requires a value");
      }
      cli.eventsPerTrack = parse_count(a, argv[++i]);
    } else if (a == "--check") {
      cli.check = true;
    } else if (a == "--write") {
      if (i + 1 >= argc) {
        throw std::runtime_error("--write requires a path");
      }
      cli.writePath = std::filesystem::path(argv[++i]);
    } else {
      throw std::runtime_error("Unknown option: " + a);
    }
  }

  cli.midiPath = std::filesystem::canonical(midiPath);
  return cli;
}

} // namespace app
