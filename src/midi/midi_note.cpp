#include "midi/midi_note.h"

#include <sstream>

#include "core/json_helpers.h"

namespace chordlab {

const char* midiNoteErrorString(MidiNoteError error) {
  switch (error) {
    case MidiNoteError::OK: return "ok";
    case MidiNoteError::InvalidMidiNumber: return "MIDI note number must be between 0 and 127";
    case MidiNoteError::OutOfPlayableRange: return "MIDI note maps to an octave outside 1-8";
  }
  return "unknown error";
}

MidiNumberResult noteToMidi(const PitchedNote& note) {
  MidiNumberResult result;
  if (!isValidPitchClass(note.pitch_class)) {
    result.error = MidiNoteError::InvalidMidiNumber;
    return result;
  }
  int midi = note.absoluteSemitone();
  if (!isValidMidiNote(midi)) {
    result.error = MidiNoteError::InvalidMidiNumber;
    return result;
  }
  result.midi_note = midi;
  return result;
}

MidiNoteResult midiToNote(int midi_note) {
  MidiNoteResult result;
  if (!isValidMidiNote(midi_note)) {
    result.error = MidiNoteError::InvalidMidiNumber;
    return result;
  }

  int octave = midi_note / PITCH_CLASS_COUNT;
  if (!isValidOctave(octave)) {
    result.error = MidiNoteError::OutOfPlayableRange;
    return result;
  }

  result.note = PitchedNote{pitchClassFromIndex(midi_note % PITCH_CLASS_COUNT), octave};
  return result;
}

std::optional<std::vector<int>> notesToMidi(const std::vector<PitchedNote>& notes) {
  std::vector<int> result;
  result.reserve(notes.size());
  for (const auto& note : notes) {
    MidiNumberResult converted = noteToMidi(note);
    if (!converted.ok()) return std::nullopt;
    result.push_back(converted.midi_note);
  }
  return result;
}

std::optional<MidiMessage> parseMidiMessage(const uint8_t* data, size_t size) {
  if (data == nullptr || size < 2) return std::nullopt;
  MidiMessage message;
  message.status = data[0];
  message.data1 = data[1];
  if (size >= 3) message.data2 = data[2];
  return message;
}

bool isNoteOnMessage(const MidiMessage& message) {
  uint8_t type = message.status & MidiStatus::TYPE_MASK;
  return type == MidiStatus::NOTE_ON && message.data2.value_or(0) > 0;
}

bool isNoteOffMessage(const MidiMessage& message) {
  uint8_t type = message.status & MidiStatus::TYPE_MASK;
  if (type == MidiStatus::NOTE_OFF) return true;
  // Note-on with velocity 0 is a note-off
  return type == MidiStatus::NOTE_ON && message.data2.value_or(0) == 0;
}

std::optional<int> getMidiNoteFromMessage(const MidiMessage& message) {
  if (!isValidMidiNote(message.data1)) return std::nullopt;
  return static_cast<int>(message.data1);
}

std::optional<int> getVelocityFromMessage(const MidiMessage& message) {
  if (!message.data2 || *message.data2 > kMaxMidiNote) return std::nullopt;
  return static_cast<int>(*message.data2);
}

MidiMessage makeNoteOnMessage(uint8_t channel, uint8_t note, uint8_t velocity) {
  MidiMessage message;
  message.status = MidiStatus::NOTE_ON | (channel & MidiStatus::CHANNEL_MASK);
  message.data1 = note & 0x7F;
  message.data2 = static_cast<uint8_t>(velocity & 0x7F);
  return message;
}

MidiMessage makeNoteOffMessage(uint8_t channel, uint8_t note, uint8_t velocity) {
  MidiMessage message;
  message.status = MidiStatus::NOTE_OFF | (channel & MidiStatus::CHANNEL_MASK);
  message.data1 = note & 0x7F;
  message.data2 = static_cast<uint8_t>(velocity & 0x7F);
  return message;
}

std::optional<MidiNoteEvent> decodeNoteEvent(const MidiMessage& message) {
  MidiNoteEvent event;
  if (isNoteOnMessage(message)) {
    event.kind = MidiNoteEventKind::NoteOn;
  } else if (isNoteOffMessage(message)) {
    event.kind = MidiNoteEventKind::NoteOff;
  } else {
    return std::nullopt;
  }

  auto midi_note = getMidiNoteFromMessage(message);
  if (!midi_note) return std::nullopt;

  MidiNoteResult converted = midiToNote(*midi_note);
  if (!converted.ok()) return std::nullopt;

  event.note = converted.note;
  event.midi_note = *midi_note;
  event.velocity = getVelocityFromMessage(message).value_or(0);
  event.channel = getChannelFromMessage(message);
  return event;
}

std::string midiNoteEventToJson(const MidiNoteEvent& event) {
  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject()
      .write("type", event.kind == MidiNoteEventKind::NoteOn ? "note_on" : "note_off")
      .write("note", event.note.toString())
      .write("midi_note", event.midi_note)
      .write("velocity", event.velocity)
      .write("channel", static_cast<int>(event.channel))
      .endObject();
  return oss.str();
}

}  // namespace chordlab
