/**
 * @file basic_types.h
 * @brief Fundamental types: PitchClass, Octave, PitchedNote.
 */

#ifndef CHORDLAB_CORE_BASIC_TYPES_H
#define CHORDLAB_CORE_BASIC_TYPES_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace chordlab {

/// Number of pitch classes in the chromatic octave.
constexpr int PITCH_CLASS_COUNT = 12;

/// @name Playable Octave Range
/// Octave 1 starts at C1 (MIDI 12); octave 8 ends at B8 (MIDI 107).
/// @{
constexpr int kMinOctave = 1;
constexpr int kMaxOctave = 8;
/// @}

/// @brief Chromatic pitch class, canonical sharp spelling.
enum class PitchClass : uint8_t {
  C = 0, Cs, D, Ds, E, F, Fs, G, Gs, A, As, B
};

/// All pitch classes in chromatic order (C first).
constexpr std::array<PitchClass, PITCH_CLASS_COUNT> kAllPitchClasses = {
    PitchClass::C,  PitchClass::Cs, PitchClass::D,  PitchClass::Ds,
    PitchClass::E,  PitchClass::F,  PitchClass::Fs, PitchClass::G,
    PitchClass::Gs, PitchClass::A,  PitchClass::As, PitchClass::B};

/// Semitone index of a pitch class (C=0 ... B=11).
constexpr int pitchClassIndex(PitchClass pc) { return static_cast<int>(pc); }

/// True if the value is one of the 12 enumerators.
constexpr bool isValidPitchClass(PitchClass pc) {
  return static_cast<uint8_t>(pc) < PITCH_CLASS_COUNT;
}

/// Pitch class for any integer semitone (wraps mod 12, negatives included).
constexpr PitchClass pitchClassFromIndex(int semitone) {
  int wrapped = semitone % PITCH_CLASS_COUNT;
  if (wrapped < 0) wrapped += PITCH_CLASS_COUNT;
  return static_cast<PitchClass>(wrapped);
}

/// Transpose a pitch class by a number of semitones (cyclic).
constexpr PitchClass transpose(PitchClass pc, int semitones) {
  return pitchClassFromIndex(pitchClassIndex(pc) + semitones);
}

/// True if the octave lies inside [kMinOctave, kMaxOctave].
constexpr bool isValidOctave(int octave) { return octave >= kMinOctave && octave <= kMaxOctave; }

/**
 * @brief Canonical name of a pitch class ("C", "C#", ... "B").
 * @param pc Pitch class
 * @return Static string, "?" for out-of-range values
 */
const char* pitchClassName(PitchClass pc);

/**
 * @brief Parse a canonical sharp-spelled pitch class name.
 *
 * Only the twelve canonical spellings are accepted here. Flat and
 * theoretical spellings belong to the text normalizer (chord_name.h).
 *
 * @param name Name such as "F#"
 * @return Pitch class, or nullopt if the name is not canonical
 */
std::optional<PitchClass> pitchClassFromName(const std::string& name);

/// True for C, D, E, F, G, A, B.
bool isWhiteKey(PitchClass pc);

/**
 * @brief A pitch class placed in a concrete octave.
 *
 * Ordered by octave first, then by pitch class index.
 */
struct PitchedNote {
  PitchClass pitch_class = PitchClass::C;  ///< Pitch class
  int octave = 4;                          ///< Octave (1-8 when valid)

  /// Semitones above C0 (octave * 12 + pitch class index).
  constexpr int absoluteSemitone() const { return octave * PITCH_CLASS_COUNT + pitchClassIndex(pitch_class); }

  /// True when the octave is playable and the pitch class is in range.
  constexpr bool isValid() const { return isValidPitchClass(pitch_class) && isValidOctave(octave); }

  /// Display form, e.g. "C#4".
  std::string toString() const;
};

constexpr bool operator==(const PitchedNote& a, const PitchedNote& b) {
  return a.pitch_class == b.pitch_class && a.octave == b.octave;
}

constexpr bool operator!=(const PitchedNote& a, const PitchedNote& b) { return !(a == b); }

constexpr bool operator<(const PitchedNote& a, const PitchedNote& b) {
  if (a.octave != b.octave) return a.octave < b.octave;
  return pitchClassIndex(a.pitch_class) < pitchClassIndex(b.pitch_class);
}

constexpr bool operator>(const PitchedNote& a, const PitchedNote& b) { return b < a; }
constexpr bool operator<=(const PitchedNote& a, const PitchedNote& b) { return !(b < a); }
constexpr bool operator>=(const PitchedNote& a, const PitchedNote& b) { return !(a < b); }

}  // namespace chordlab

#endif  // CHORDLAB_CORE_BASIC_TYPES_H
