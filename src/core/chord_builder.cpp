#include "core/chord_builder.h"

#include <algorithm>
#include <utility>

#include "core/chord_inversions.h"
#include "core/pitch_utils.h"

namespace chordlab {

const char* chordErrorString(ChordError error) {
  switch (error) {
    case ChordError::OK: return "ok";
    case ChordError::InvalidQuality: return "invalid chord quality";
    case ChordError::InvalidRoot: return "invalid root";
    case ChordError::OctaveOutOfRange: return "octave out of range";
    case ChordError::InvalidInversion: return "invalid inversion";
    case ChordError::NoValidChords: return "no chords match the filter";
  }
  return "unknown error";
}

bool operator==(const Chord& a, const Chord& b) {
  return a.root == b.root && a.quality == b.quality && a.inversion == b.inversion &&
         a.notes == b.notes && a.display_name == b.display_name;
}

std::string chordDisplayName(PitchClass root, ChordQuality quality, int inversion,
                             PitchClass bass) {
  std::string name = pitchClassName(root);
  name += chordSuffix(quality);
  if (inversion > 0) {
    name += '/';
    name += pitchClassName(bass);
  }
  return name;
}

ChordBuildResult buildChord(PitchClass root, ChordQuality quality, int octave, int inversion) {
  ChordBuildResult result;

  if (!isValidChordQuality(quality)) {
    result.error = ChordError::InvalidQuality;
    return result;
  }
  if (!isValidPitchClass(root)) {
    result.error = ChordError::InvalidRoot;
    return result;
  }
  if (!isValidOctave(octave)) {
    result.error = ChordError::OctaveOutOfRange;
    return result;
  }

  ChordFormula formula = getChordFormula(quality);
  if (inversion < 0 || inversion >= formula.note_count) {
    result.error = ChordError::InvalidInversion;
    return result;
  }

  std::vector<PitchedNote> notes;
  notes.reserve(formula.note_count);
  int root_index = pitchClassIndex(root);
  for (uint8_t i = 0; i < formula.note_count; ++i) {
    int semitone = root_index + formula.intervals[i];
    PitchedNote note{pitchClassFromIndex(semitone), octave + semitone / PITCH_CLASS_COUNT};
    if (!isValidOctave(note.octave)) {
      result.error = ChordError::OctaveOutOfRange;
      return result;
    }
    notes.push_back(note);
  }

  for (int step = 0; step < inversion; ++step) {
    if (!invertOnce(notes, OctavePolicy::Reject)) {
      result.error = ChordError::OctaveOutOfRange;
      return result;
    }
  }

  result.chord.root = root;
  result.chord.quality = quality;
  result.chord.inversion = inversion;
  result.chord.display_name =
      chordDisplayName(root, quality, inversion, notes.front().pitch_class);
  result.chord.notes = std::move(notes);
  return result;
}

int rootPositionOctave(const Chord& chord) {
  if (chord.notes.empty()) return 0;
  for (int octave = kMinOctave; octave <= kMaxOctave; ++octave) {
    ChordBuildResult built = buildChord(chord.root, chord.quality, octave, chord.inversion);
    if (built.ok() && built.chord.notes == chord.notes) return octave;
  }
  return 0;
}

bool isValidChord(const Chord& chord) {
  if (!isValidChordQuality(chord.quality) || !isValidPitchClass(chord.root)) return false;
  if (static_cast<int>(chord.notes.size()) != formulaLength(chord.quality)) return false;
  if (chord.inversion < 0 || chord.inversion > maxInversions(chord.notes)) return false;
  if (!isStrictlyAscending(chord.notes)) return false;

  bool has_root = false;
  for (const auto& note : chord.notes) {
    if (!note.isValid()) return false;
    if (note.pitch_class == chord.root) has_root = true;
  }
  return has_root;
}

std::string chordNotesString(const Chord& chord) {
  std::string out;
  for (const auto& note : chord.notes) {
    if (!out.empty()) out += ' ';
    out += note.toString();
  }
  return out;
}

}  // namespace chordlab
