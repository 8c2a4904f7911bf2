// src/midi/general_midi.hpp
// General MIDI: the system on/off universal message and the GM1 program
// and percussion key catalogue.

#pragma once
#include <cstdint>

namespace midi {

// Universal non-real-time 09 nn.
enum class GeneralMidi : std::uint8_t { GM1 = 0x01, Off = 0x02, GM2 = 0x03 };

// GM1 program numbers (0-based, as sent in ProgramChange).
enum class GMSoundSet : std::uint8_t {
  AcousticGrandPiano = 0,
  BrightAcousticPiano,
  ElectricGrandPiano,
  HonkytonkPiano,
  ElectricPiano1,
  ElectricPiano2,
  Harpsichord,
  Clavi,
  Celesta,
  Glockenspiel,
  MusicBox,
  Vibraphone,
  Marimba,
  Xylophone,
  TubularBells,
  Dulcimer,
  DrawbarOrgan,
  PercussiveOrgan,
  RockOrgan,
  ChurchOrgan,
  ReedOrgan,
  Accordion,
  Harmonica,
  TangoAccordion,
  AcousticGuitarNylon,
  AcousticGuitarSteel,
  ElectricGuitarJazz,
  ElectricGuitarClean,
  ElectricGuitarMuted,
  OverdrivenGuitar,
  DistortionGuitar,
  GuitarHarmonics,
  AcousticBass,
  ElectricBassFinger,
  ElectricBassPick,
  FretlessBass,
  SlapBass1,
  SlapBass2,
  SynthBass1,
  SynthBass2,
  Violin,
  Viola,
  Cello,
  Contrabass,
  TremoloStrings,
  PizzicatoStrings,
  OrchestralHarp,
  Timpani,
  StringEnsemble1,
  StringEnsemble2,
  SynthStrings1,
  SynthStrings2,
  ChoirAahs,
  VoiceOohs,
  SynthVoice,
  OrchestraHit,
  Trumpet,
  Trombone,
  Tuba,
  MutedTrumpet,
  FrenchHorn,
  BrassSection,
  SynthBrass1,
  SynthBrass2,
  SopranoSax,
  AltoSax,
  TenorSax,
  BaritoneSax,
  Oboe,
  EnglishHorn,
  Bassoon,
  Clarinet,
  Piccolo,
  Flute,
  Recorder,
  PanFlute,
  BlownBottle,
  Shakuhachi,
  Whistle,
  Ocarina,
  Lead1Square,
  Lead2Sawtooth,
  Lead3Calliope,
  Lead4Chiff,
  Lead5Charang,
  Lead6Voice,
  Lead7Fifths,
  Lead8BassLead,
  Pad1NewAge,
  Pad2Warm,
  Pad3Polysynth,
  Pad4Choir,
  Pad5Bowed,
  Pad6Metallic,
  Pad7Halo,
  Pad8Sweep,
  Fx1Rain,
  Fx2Soundtrack,
  Fx3Crystal,
  Fx4Atmosphere,
  Fx5Brightness,
  Fx6Goblins,
  Fx7Echoes,
  Fx8SciFi,
  Sitar,
  Banjo,
  Shamisen,
  Koto,
  Kalimba,
  Bagpipe,
  Fiddle,
  Shanai,
  TinkleBell,
  Agogo,
  SteelDrums,
  Woodblock,
  TaikoDrum,
  MelodicTom,
  SynthDrum,
  ReverseCymbal,
  GuitarFretNoise,
  BreathNoise,
  Seashore,
  BirdTweet,
  TelephoneRing,
  Helicopter,
  Applause,
  Gunshot
};

// GM1 percussion keys on channel 10.
enum class GMPercussionMap : std::uint8_t {
  AcousticBassDrum = 35,
  BassDrum1,
  SideStick,
  AcousticSnare,
  HandClap,
  ElectricSnare,
  LowFloorTom,
  ClosedHiHat,
  HighFloorTom,
  PedalHiHat,
  LowTom,
  OpenHiHat,
  LowMidTom,
  HiMidTom,
  CrashCymbal1,
  HighTom,
  RideCymbal1,
  ChineseCymbal,
  RideBell,
  Tambourine,
  SplashCymbal,
  Cowbell,
  CrashCymbal2,
  Vibraslap,
  RideCymbal2,
  HiBongo,
  LowBongo,
  MuteHiConga,
  OpenHiConga,
  LowConga,
  HighTimbale,
  LowTimbale,
  HighAgogo,
  LowAgogo,
  Cabasa,
  Maracas,
  ShortWhistle,
  LongWhistle,
  ShortGuiro,
  LongGuiro,
  Claves,
  HiWoodBlock,
  LowWoodBlock,
  MuteCuica,
  OpenCuica,
  MuteTriangle,
  OpenTriangle
};

// Display names. Out-of-range percussion keys give "".
const char *to_string(GMSoundSet program);
const char *to_string(GMPercussionMap key);

} // namespace midi
