// src/main.cpp
// smfdump: decode a Standard MIDI File and print what is in it.
// Optionally re-encode it and check that nothing was lost.

#include <iostream>
#include <stdexcept>

#include "app/cli.hpp"
#include "app/preview.hpp"
#include "common/util.hpp"
#include "midi/smf.hpp"
#include "midi/tempo.hpp"

namespace {

// Re-encode `file` and decode the result again. Returns the new bytes.
midi::ByteVec check_round_trip(const midi::MidiFile &file,
                               const midi::ByteVec &original) {
  const midi::ByteVec encoded = midi::encode_smf(file);
  const midi::MidiFile again = midi::parse_smf(encoded);

  std::cout << "\nRound trip: ";
  if (again == file) {
    std::cout << "OK";
  } else {
    std::cout << "MISMATCH";
  }
  std::cout << " (" << original.size() << " -> " << encoded.size()
            << " bytes" << (encoded == original ? ", identical" : "")
            << ")\n";
  if (!(again == file)) {
    throw std::runtime_error("re-encoded file does not decode to the same "
                             "content");
  }
  return encoded;
}

} // namespace

int main(int argc, char **argv) {
  try {
    const app::Cli cli = app::parse_cli(argc, argv);

    const auto bytes = read_all(cli.midiPath.string());
    const midi::MidiFile file = midi::parse_smf(bytes);
    const midi::TempoMap tempo = midi::build_tempo_map(file);

    app::print_preview(file, tempo, cli.eventsPerTrack);

    if (cli.check || cli.writePath) {
      const midi::ByteVec encoded = cli.check ? check_round_trip(file, bytes)
                                              : midi::encode_smf(file);
      if (cli.writePath) {
        write_all(cli.writePath->string(), encoded);
        std::cout << "Wrote " << cli.writePath->string() << "\n";
      }
    }
    return 0;
  } catch (const midi::SmfParseError &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    std::cerr << "  " << ex.remaining() << " bytes remain; next: ["
              << hex_bytes(ex.next_bytes(), 20) << "]\n";
    return 1;
  } catch (const std::exception &ex) {
    std::cerr << "error: " << ex.what() << "\n";
    return 1;
  }
}
