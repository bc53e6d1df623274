/**
 * @file chord_builder.h
 * @brief Chord value type and construction from (root, quality, octave, inversion).
 */

#ifndef CHORDLAB_CORE_CHORD_BUILDER_H
#define CHORDLAB_CORE_CHORD_BUILDER_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/chord.h"

namespace chordlab {

/// @brief Chord construction and sampling errors.
enum class ChordError : uint8_t {
  OK = 0,
  InvalidQuality,    ///< Quality value outside the enum
  InvalidRoot,       ///< Root pitch class outside the enum
  OctaveOutOfRange,  ///< Requested or derived octave outside [1, 8]
  InvalidInversion,  ///< Inversion outside [0, note count - 1]
  NoValidChords      ///< Filter enumerates to an empty candidate set
};

/// Short description of an error ("octave out of range").
const char* chordErrorString(ChordError error);

/**
 * @brief A fully voiced chord.
 *
 * Invariants (checked by isValidChord()): notes.size() equals the quality's
 * formula length, notes are strictly ascending, the root pitch class is
 * present and inversion lies in [0, notes.size() - 1].
 */
struct Chord {
  PitchClass root = PitchClass::C;               ///< Chord root
  ChordQuality quality = ChordQuality::Major;    ///< Chord quality
  std::vector<PitchedNote> notes;                ///< Voicing, ascending
  int inversion = 0;                             ///< 0 = root position
  std::string display_name;                      ///< e.g. "G7/B"

  /// Lowest note of the voicing (C4 when empty).
  PitchedNote bass() const { return notes.empty() ? PitchedNote{} : notes.front(); }
};

bool operator==(const Chord& a, const Chord& b);
inline bool operator!=(const Chord& a, const Chord& b) { return !(a == b); }

/// @brief Result of buildChord(). `chord` is meaningful only when ok().
struct ChordBuildResult {
  Chord chord;
  ChordError error = ChordError::OK;

  bool ok() const { return error == ChordError::OK; }
};

/**
 * @brief Canonical chord name: root + suffix, plus "/<bass>" when inverted.
 *
 * Used by the builder and by the validator to produce target names.
 *
 * @param root Chord root
 * @param quality Chord quality
 * @param inversion Inversion index
 * @param bass Pitch class of the lowest note (ignored when inversion == 0)
 * @return Name such as "C", "F#m7", "C/E"
 */
std::string chordDisplayName(PitchClass root, ChordQuality quality, int inversion,
                             PitchClass bass);

/**
 * @brief Build a chord.
 *
 * Inputs are validated in order quality, root, octave, inversion before any
 * note is produced. Each formula interval i yields pitch class
 * (root + i) mod 12 at octave + (root + i) / 12; a derived octave outside
 * [1, 8] fails with OctaveOutOfRange rather than being clamped. Inversions
 * repeatedly raise the lowest note an octave (OctavePolicy::Reject).
 *
 * buildChord(G, Dominant7, 3, 1) -> [B3 D4 F4 G4], "G7/B"
 *
 * @param root Chord root
 * @param quality Chord quality
 * @param octave Octave of the root in root position
 * @param inversion Inversion index, 0 = root position
 * @return Chord, or the first validation error
 */
ChordBuildResult buildChord(PitchClass root, ChordQuality quality, int octave,
                            int inversion = 0);

/**
 * @brief Octave the chord was built at (octave of the root in root position).
 *
 * Found by rebuilding the voicing at each octave. Higher inversions of
 * 11th and 13th chords raise the root twice.
 * @return Octave, or 0 if no octave reproduces the notes
 */
int rootPositionOctave(const Chord& chord);

/// True if the chord satisfies every Chord invariant.
bool isValidChord(const Chord& chord);

/// Space separated note names, e.g. "C4 E4 G4".
std::string chordNotesString(const Chord& chord);

}  // namespace chordlab

#endif  // CHORDLAB_CORE_CHORD_BUILDER_H
