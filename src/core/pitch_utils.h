/**
 * @file pitch_utils.h
 * @brief Pitch arithmetic and scale utilities over the 12-tone cycle.
 */

#ifndef CHORDLAB_CORE_PITCH_UTILS_H
#define CHORDLAB_CORE_PITCH_UTILS_H

#include <array>
#include <cstdint>
#include <vector>

#include "core/basic_types.h"

namespace chordlab {

// ============================================================================
// Interval Constants
// ============================================================================

/// @brief Common musical intervals in semitones.
/// Use these constants instead of magic numbers for interval calculations.
namespace Interval {
constexpr int UNISON = 0;
constexpr int HALF_STEP = 1;   ///< Minor 2nd / semitone
constexpr int WHOLE_STEP = 2;  ///< Major 2nd / tone
constexpr int MINOR_3RD = 3;
constexpr int MAJOR_3RD = 4;
constexpr int PERFECT_4TH = 5;
constexpr int TRITONE = 6;  ///< Augmented 4th / Diminished 5th
constexpr int PERFECT_5TH = 7;
constexpr int MINOR_6TH = 8;
constexpr int MAJOR_6TH = 9;
constexpr int MINOR_7TH = 10;
constexpr int MAJOR_7TH = 11;
constexpr int OCTAVE = 12;
constexpr int NINTH = 14;       ///< Major 2nd + octave
constexpr int ELEVENTH = 17;    ///< Perfect 4th + octave
constexpr int THIRTEENTH = 21;  ///< Major 6th + octave
}  // namespace Interval

// ============================================================================
// Display Utilities
// ============================================================================

/// @brief Note names using sharps, indexed by pitch class.
constexpr const char* NOTE_NAMES[] = {"C",  "C#", "D",  "D#", "E",  "F",
                                      "F#", "G",  "G#", "A",  "A#", "B"};

// ============================================================================
// Scales
// ============================================================================

/// @brief Scale used by key filters.
enum class ScaleType : uint8_t {
  Major,  ///< Ionian
  Minor   ///< Natural minor (Aeolian)
};

/// Major scale intervals from tonic: 0,2,4,5,7,9,11 (W-W-H-W-W-W-H).
constexpr int MAJOR_SCALE[7] = {0, 2, 4, 5, 7, 9, 11};

/// Natural minor scale intervals from tonic: 0,2,3,5,7,8,10 (W-H-W-W-H-W-W).
constexpr int MINOR_SCALE[7] = {0, 2, 3, 5, 7, 8, 10};

/**
 * @brief Pitch classes of a diatonic scale, tonic first.
 * @param tonic Scale tonic
 * @param scale Major or natural minor
 * @return Seven pitch classes in ascending scale order
 */
std::array<PitchClass, 7> scalePitchClasses(PitchClass tonic, ScaleType scale);

/**
 * @brief Check whether a pitch class belongs to a diatonic scale.
 * @param pc Pitch class to test
 * @param tonic Scale tonic
 * @param scale Major or natural minor
 * @return true if pc is one of the seven scale tones
 */
bool isInScale(PitchClass pc, PitchClass tonic, ScaleType scale);

/// "major" / "minor".
const char* scaleTypeName(ScaleType scale);

// ============================================================================
// Pitched Note Arithmetic
// ============================================================================

/// Signed semitone distance from `from` to `to` (positive when `to` is higher).
inline int semitoneDistance(const PitchedNote& from, const PitchedNote& to) {
  return to.absoluteSemitone() - from.absoluteSemitone();
}

/// Reduce a semitone interval into [0, 11].
constexpr int normalizeInterval(int semitones) {
  int r = semitones % Interval::OCTAVE;
  return r < 0 ? r + Interval::OCTAVE : r;
}

/**
 * @brief Return a copy of the notes sorted ascending by pitch.
 *
 * Stable, so equal notes keep their relative input order.
 */
std::vector<PitchedNote> sortByPitch(std::vector<PitchedNote> notes);

/// True if every note is strictly higher than the one before it.
bool isStrictlyAscending(const std::vector<PitchedNote>& notes);

}  // namespace chordlab

#endif  // CHORDLAB_CORE_PITCH_UTILS_H
