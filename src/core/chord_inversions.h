/**
 * @file chord_inversions.h
 * @brief Inversion generation by raising the lowest note an octave.
 */

#ifndef CHORDLAB_CORE_CHORD_INVERSIONS_H
#define CHORDLAB_CORE_CHORD_INVERSIONS_H

#include <cstdint>
#include <vector>

#include "core/basic_types.h"

namespace chordlab {

/**
 * @brief What to do when raising a note would leave octave 8.
 *
 * The builder rejects such voicings; the inversion generator clamps.
 */
enum class OctavePolicy : uint8_t {
  Reject,  ///< Report failure and leave the notes untouched
  Clamp    ///< Keep the note at octave 8
};

/// Note one octave higher, clamped at kMaxOctave.
PitchedNote raiseOctave(const PitchedNote& note);

/// Note one octave lower, clamped at kMinOctave.
PitchedNote lowerOctave(const PitchedNote& note);

/// Maximum inversion index for a voicing (size - 1, never negative).
int maxInversions(const std::vector<PitchedNote>& notes);

/**
 * @brief Apply one inversion step in place.
 *
 * Removes the current lowest note, re-inserts it one octave higher and
 * re-sorts. With OctavePolicy::Reject, a lowest note already at octave 8
 * makes the call return false and leaves `notes` unchanged.
 *
 * @param notes Voicing sorted ascending by pitch
 * @param policy Octave overflow policy
 * @return false only when the step was rejected
 */
bool invertOnce(std::vector<PitchedNote>& notes, OctavePolicy policy);

/**
 * @brief Generate a voicing and its successive inversions.
 *
 * Index 0 is always the sorted root position. The number of inversions is
 * capped at size - 1 without error; a lowest note already at octave 8 is
 * left in place (OctavePolicy::Clamp).
 *
 * C4-E4-G4, 2 -> [C4 E4 G4], [E4 G4 C5], [G4 C5 E5]
 *
 * @param root_position Root position voicing (any order)
 * @param max_inversions Number of inversions requested
 * @return Root position followed by each inversion; empty for empty input
 */
std::vector<std::vector<PitchedNote>> generateInversions(
    const std::vector<PitchedNote>& root_position, int max_inversions);

}  // namespace chordlab

#endif  // CHORDLAB_CORE_CHORD_INVERSIONS_H
