/**
 * @file midi_note.h
 * @brief MIDI note number conversion and channel-voice note message decoding.
 */

#ifndef CHORDLAB_MIDI_MIDI_NOTE_H
#define CHORDLAB_MIDI_MIDI_NOTE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"

namespace chordlab {

// MIDI note number range
constexpr int kMinMidiNote = 0;
constexpr int kMaxMidiNote = 127;

// Playable range: octave 1 (C1 = 12) through octave 8 (B8 = 107)
constexpr int kMinPlayableMidiNote = kMinOctave * PITCH_CLASS_COUNT;
constexpr int kMaxPlayableMidiNote = kMaxOctave * PITCH_CLASS_COUNT + PITCH_CLASS_COUNT - 1;

// Channel voice status bytes (high nibble; low nibble is the channel)
namespace MidiStatus {
constexpr uint8_t NOTE_OFF = 0x80;
constexpr uint8_t NOTE_ON = 0x90;
constexpr uint8_t TYPE_MASK = 0xF0;
constexpr uint8_t CHANNEL_MASK = 0x0F;
}  // namespace MidiStatus

enum class MidiNoteError : uint8_t {
  OK = 0,
  InvalidMidiNumber,   // Outside [0, 127]
  OutOfPlayableRange   // Valid MIDI number whose octave is outside [1, 8]
};

const char* midiNoteErrorString(MidiNoteError error);

struct MidiNoteResult {
  PitchedNote note;
  MidiNoteError error = MidiNoteError::OK;

  bool ok() const { return error == MidiNoteError::OK; }
};

// True for [0, 127]
constexpr bool isValidMidiNote(int midi_note) {
  return midi_note >= kMinMidiNote && midi_note <= kMaxMidiNote;
}

// True for [12, 107] (octaves 1-8)
constexpr bool isPlayableMidiNote(int midi_note) {
  return midi_note >= kMinPlayableMidiNote && midi_note <= kMaxPlayableMidiNote;
}

struct MidiNumberResult {
  int midi_note = -1;
  MidiNoteError error = MidiNoteError::OK;

  bool ok() const { return error == MidiNoteError::OK; }
};

// MIDI number = octave * 12 + pitch class index (C4 = 48, C5 = 60).
// Fails with InvalidMidiNumber if the pitch class is unknown or the result
// falls outside [0, 127].
MidiNumberResult noteToMidi(const PitchedNote& note);

// octave = n / 12, pitch class = n % 12. A valid number whose octave is not
// playable fails with OutOfPlayableRange, not InvalidMidiNumber.
MidiNoteResult midiToNote(int midi_note);

// MIDI numbers of a note list, or nullopt if any note is unrepresentable.
std::optional<std::vector<int>> notesToMidi(const std::vector<PitchedNote>& notes);

// ============================================================================
// Messages
// ============================================================================

// Raw channel voice message as delivered by a MIDI input API.
// data2 is absent for 2-byte messages.
struct MidiMessage {
  uint8_t status = 0;
  uint8_t data1 = 0;
  std::optional<uint8_t> data2;
};

// Parse 2 or 3 raw bytes. Returns nullopt for null or short input.
std::optional<MidiMessage> parseMidiMessage(const uint8_t* data, size_t size);

// 0x9n with velocity > 0
bool isNoteOnMessage(const MidiMessage& message);

// 0x8n, or 0x9n with velocity 0 (or missing)
bool isNoteOffMessage(const MidiMessage& message);

// data1 if it is a valid note number
std::optional<int> getMidiNoteFromMessage(const MidiMessage& message);

// data2 if present and <= 127
std::optional<int> getVelocityFromMessage(const MidiMessage& message);

// Channel nibble (0-15)
inline uint8_t getChannelFromMessage(const MidiMessage& message) {
  return message.status & MidiStatus::CHANNEL_MASK;
}

// Build note messages (channel masked to 0-15, data bytes to 0-127)
MidiMessage makeNoteOnMessage(uint8_t channel, uint8_t note, uint8_t velocity);
MidiMessage makeNoteOffMessage(uint8_t channel, uint8_t note, uint8_t velocity = 0);

enum class MidiNoteEventKind : uint8_t { NoteOn, NoteOff };

// Decoded note event for the game layer
struct MidiNoteEvent {
  MidiNoteEventKind kind = MidiNoteEventKind::NoteOn;
  PitchedNote note;
  int midi_note = 0;
  int velocity = 0;
  uint8_t channel = 0;
};

// Decode a note-on/note-off message into a playable note event.
// Other message types, invalid note numbers and unplayable notes yield nullopt.
std::optional<MidiNoteEvent> decodeNoteEvent(const MidiMessage& message);

std::string midiNoteEventToJson(const MidiNoteEvent& event);

}  // namespace chordlab

#endif  // CHORDLAB_MIDI_MIDI_NOTE_H
