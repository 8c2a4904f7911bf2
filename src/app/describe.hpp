// src/app/describe.hpp
// One-line, human readable rendering of decoded messages for the console
// tools. Not a serialization format: the text may change at any time.

#pragma once
#include <sstream>
#include <string>

#include "common/util.hpp"
#include "midi/general_midi.hpp"
#include "midi/message.hpp"

namespace app {

inline std::string describe_control(const midi::Control &c) {
  std::ostringstream os;
  if (const auto *h = std::get_if<midi::HighResControl>(&c)) {
    os << "CC " << int(h->control) << "/" << int(h->control) + 32 << " = "
       << h->value;
  } else if (const auto *b = std::get_if<midi::ByteControl>(&c)) {
    os << "CC " << int(b->control) << " = " << int(b->value);
  } else if (const auto *u = std::get_if<midi::UndefinedControl>(&c)) {
    os << "CC " << int(u->control) << " = " << int(u->value);
  } else if (const auto *uh = std::get_if<midi::UndefinedHighResControl>(&c)) {
    os << "CC " << int(uh->control1) << "/" << int(uh->control2) << " = "
       << uh->value;
  } else if (const auto *p = std::get_if<midi::Parameter>(&c)) {
    if (p->id == midi::ParameterId::Unregistered)
      os << "NRPN " << p->number;
    else
      os << "RPN #" << int(p->id);
    if (p->entry)
      os << " = " << *p->entry;
  }
  return os.str();
}

inline std::string describe_voice(const midi::ChannelVoiceMsg &msg) {
  std::ostringstream os;
  if (const auto *m = std::get_if<midi::NoteOn>(&msg)) {
    os << "NoteOn  note=" << int(m->note) << " vel=" << int(m->velocity);
  } else if (const auto *m = std::get_if<midi::NoteOff>(&msg)) {
    os << "NoteOff note=" << int(m->note) << " vel=" << int(m->velocity);
  } else if (const auto *m = std::get_if<midi::HighResNoteOn>(&msg)) {
    os << "NoteOn  note=" << int(m->note) << " vel14=" << m->velocity;
  } else if (const auto *m = std::get_if<midi::HighResNoteOff>(&msg)) {
    os << "NoteOff note=" << int(m->note) << " vel14=" << m->velocity;
  } else if (const auto *m = std::get_if<midi::PolyPressure>(&msg)) {
    os << "PolyPressure note=" << int(m->note) << " " << int(m->pressure);
  } else if (const auto *m = std::get_if<midi::ControlChange>(&msg)) {
    os << describe_control(m->control);
  } else if (const auto *m = std::get_if<midi::ProgramChange>(&msg)) {
    os << "Program " << int(m->program) << " ("
       << midi::to_string(static_cast<midi::GMSoundSet>(m->program & 0x7F))
       << ")";
  } else if (const auto *m = std::get_if<midi::ChannelPressure>(&msg)) {
    os << "ChannelPressure " << int(m->pressure);
  } else if (const auto *m = std::get_if<midi::PitchBend>(&msg)) {
    os << "PitchBend " << m->bend;
  }
  return os.str();
}

inline std::string describe_mode(const midi::ChannelModeMsg &msg) {
  if (std::holds_alternative<midi::AllSoundOff>(msg))
    return "AllSoundOff";
  if (std::holds_alternative<midi::ResetAllControllers>(msg))
    return "ResetAllControllers";
  if (const auto *m = std::get_if<midi::LocalControl>(&msg))
    return m->on ? "LocalControl on" : "LocalControl off";
  if (std::holds_alternative<midi::AllNotesOff>(msg))
    return "AllNotesOff";
  if (const auto *m = std::get_if<midi::OmniMode>(&msg))
    return m->on ? "Omni on" : "Omni off";
  if (const auto *m = std::get_if<midi::MonoMode>(&msg))
    return "Mono " + std::to_string(m->channels);
  return "Poly";
}

inline std::string describe_common(const midi::SystemCommonMsg &msg) {
  std::ostringstream os;
  if (const auto *m = std::get_if<midi::QuarterFrame>(&msg)) {
    os << "QuarterFrame " << int(m->index);
  } else if (const auto *m = std::get_if<midi::SongPosition>(&msg)) {
    os << "SongPosition " << m->beats;
  } else if (const auto *m = std::get_if<midi::SongSelect>(&msg)) {
    os << "SongSelect " << int(m->song);
  } else {
    os << "TuneRequest";
  }
  return os.str();
}

inline std::string describe_sysex(const midi::SystemExclusiveMsg &msg) {
  std::ostringstream os;
  if (const auto *m = std::get_if<midi::Commercial>(&msg)) {
    os << "SysEx manufacturer=" << int(m->id.first);
    if (m->id.second)
      os << ":" << int(*m->id.second);
    os << " [" << hex_bytes(m->data) << "]";
  } else if (const auto *m = std::get_if<midi::NonCommercial>(&msg)) {
    os << "SysEx non-commercial [" << hex_bytes(m->data) << "]";
  } else if (const auto *m = std::get_if<midi::UniversalRealTime>(&msg)) {
    os << "SysEx RT dev=" << int(m->device.id) << " "
       << midi::message_name(m->msg);
  } else if (const auto *m = std::get_if<midi::UniversalNonRealTime>(&msg)) {
    os << "SysEx NRT dev=" << int(m->device.id) << " "
       << midi::message_name(m->msg);
  }
  return os.str();
}

inline std::string describe_meta(const midi::MetaMsg &msg) {
  std::ostringstream os;
  if (const auto *m = std::get_if<midi::TrackName>(&msg)) {
    os << "TrackName \"" << m->text << "\"";
  } else if (const auto *m = std::get_if<midi::Text>(&msg)) {
    os << "Text \"" << m->text << "\"";
  } else if (const auto *m = std::get_if<midi::Copyright>(&msg)) {
    os << "Copyright \"" << m->text << "\"";
  } else if (const auto *m = std::get_if<midi::InstrumentName>(&msg)) {
    os << "InstrumentName \"" << m->text << "\"";
  } else if (const auto *m = std::get_if<midi::Lyric>(&msg)) {
    os << "Lyric \"" << m->text << "\"";
  } else if (const auto *m = std::get_if<midi::Marker>(&msg)) {
    os << "Marker \"" << m->text << "\"";
  } else if (const auto *m = std::get_if<midi::CuePoint>(&msg)) {
    os << "CuePoint \"" << m->text << "\"";
  } else if (const auto *m = std::get_if<midi::SequenceNumber>(&msg)) {
    os << "SequenceNumber " << m->number;
  } else if (const auto *m = std::get_if<midi::ChannelPrefix>(&msg)) {
    os << "ChannelPrefix " << midi::channel_number(m->channel);
  } else if (std::holds_alternative<midi::EndOfTrack>(msg)) {
    os << "<End of Track>";
  } else if (const auto *m = std::get_if<midi::SetTempo>(&msg)) {
    os << "Tempo " << m->us_per_qn << " us/qn";
  } else if (const auto *m = std::get_if<midi::SmpteOffset>(&msg)) {
    const auto &tc = m->time_code;
    os << "SmpteOffset " << int(tc.hours) << ":" << int(tc.minutes) << ":"
       << int(tc.seconds) << ":" << int(tc.frames) << "."
       << int(tc.fractional_frames);
  } else if (const auto *m = std::get_if<midi::FileTimeSignature>(&msg)) {
    os << "TimeSignature " << int(m->numerator) << "/" << m->denominator;
  } else if (const auto *m = std::get_if<midi::KeySignature>(&msg)) {
    os << "KeySignature " << int(m->key) << (m->scale ? " minor" : " major");
  } else if (const auto *m = std::get_if<midi::SequencerSpecific>(&msg)) {
    os << "SequencerSpecific [" << hex_bytes(m->data) << "]";
  } else if (const auto *m = std::get_if<midi::UnknownMeta>(&msg)) {
    os << "Meta 0x" << std::hex << int(m->meta_type) << std::dec << " ["
       << hex_bytes(m->data) << "]";
  }
  return os.str();
}

inline std::string describe(const midi::MidiMsg &msg) {
  if (const auto *m = std::get_if<midi::ChannelVoice>(&msg))
    return "ch=" + std::to_string(midi::channel_number(m->channel)) + " " +
           describe_voice(m->msg);
  if (const auto *m = std::get_if<midi::RunningChannelVoice>(&msg))
    return "ch=" + std::to_string(midi::channel_number(m->channel)) + " " +
           describe_voice(m->msg);
  if (const auto *m = std::get_if<midi::ChannelMode>(&msg))
    return "ch=" + std::to_string(midi::channel_number(m->channel)) + " " +
           describe_mode(m->msg);
  if (const auto *m = std::get_if<midi::RunningChannelMode>(&msg))
    return "ch=" + std::to_string(midi::channel_number(m->channel)) + " " +
           describe_mode(m->msg);
  if (const auto *m = std::get_if<midi::SystemCommon>(&msg))
    return describe_common(m->msg);
  if (const auto *m = std::get_if<midi::SystemRealTime>(&msg))
    return midi::to_string(m->msg);
  if (const auto *m = std::get_if<midi::SystemExclusive>(&msg))
    return describe_sysex(m->msg);
  return describe_meta(std::get<midi::Meta>(msg).msg);
}

} // namespace app
