/**
 * @file chordlab.cpp
 * @brief Implementation of ChordLab high-level API.
 */

#include "chordlab.h"

#include <sstream>

#include "core/json_helpers.h"
#include "core/rng_util.h"

namespace chordlab {

std::string chordToJson(const Chord& chord) {
  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject()
      .write("name", chord.display_name)
      .write("root", pitchClassName(chord.root))
      .write("quality", chordQualityId(chord.quality))
      .write("inversion", chord.inversion);
  {
    json::ArrayScope notes(w, "notes");
    for (const auto& note : chord.notes) w.value(note.toString());
  }
  auto midi_notes = notesToMidi(chord.notes);
  if (midi_notes) {
    json::ArrayScope midi(w, "midi_notes");
    for (int n : *midi_notes) w.value(n);
  } else {
    w.writeNull("midi_notes");
  }
  w.endObject();
  return oss.str();
}

ChordLab::ChordLab(uint32_t seed) { setSeed(seed); }

void ChordLab::setSeed(uint32_t seed) {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  seed_ = rng_util::resolveSeed(seed);
  rng_.seed(seed_);
}

uint32_t ChordLab::getSeed() const {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  return seed_;
}

ChordBuildResult ChordLab::build(PitchClass root, ChordQuality quality, int octave,
                                 int inversion) const {
  return buildChord(root, quality, octave, inversion);
}

std::optional<Chord> ChordLab::identify(const std::vector<PitchedNote>& notes) const {
  return identifyChord(notes);
}

std::optional<Chord> ChordLab::identifyMidiNotes(const std::vector<int>& midi_notes) const {
  std::vector<PitchedNote> notes;
  notes.reserve(midi_notes.size());
  for (int midi_note : midi_notes) {
    MidiNoteResult converted = midiToNote(midi_note);
    if (!converted.ok()) return std::nullopt;
    notes.push_back(converted.note);
  }
  return identifyChord(notes);
}

ChordSampleResult ChordLab::sample(const ChordFilter& filter) {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  return sampler_.sampleRandom(filter, rng_);
}

ChordValidationResult ChordLab::validateGuess(const std::string& guess,
                                              const Chord& target) const {
  return validateChordGuess(guess, target);
}

void ChordLab::clearCache() { sampler_.clearCache(); }

size_t ChordLab::cacheSize() const { return sampler_.cacheSize(); }

const char* ChordLab::version() { return "1.0.0"; }

}  // namespace chordlab
