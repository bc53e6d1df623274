/**
 * @file chord_name.h
 * @brief Chord-name text normalization and guess validation.
 */

#ifndef CHORDLAB_CORE_CHORD_NAME_H
#define CHORDLAB_CORE_CHORD_NAME_H

#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/chord_builder.h"

namespace chordlab {

/**
 * @brief Root and remaining suffix of a chord name.
 *
 * The suffix is trimmed but not alias-normalized; it may still contain a
 * "/bass" part.
 */
struct ParsedChordName {
  PitchClass root = PitchClass::C;
  std::string suffix;
};

/**
 * @brief Parse a note name in any supported spelling.
 *
 * Case-insensitive on the letter ("db" == "Db"). Accepts canonical sharps,
 * ASCII and Unicode flats/sharps ("Db", "D♭", "C♯") and the theoretical
 * enharmonics B#, Cb, E#, Fb. Surrounding whitespace is ignored.
 *
 * @param name Note name
 * @return Canonical pitch class, or nullopt
 */
std::optional<PitchClass> normalizeNoteName(const std::string& name);

/**
 * @brief Split a chord name into root and suffix.
 *
 * Tries a two code point root token ("C#", "Db", "D♭") before a single
 * letter. A root immediately followed by another accidental ("Dbb",
 * "C# #") is rejected.
 *
 * @param name Chord name text
 * @return Root and trimmed suffix, or nullopt if no root can be read
 */
std::optional<ParsedChordName> parseChordName(const std::string& name);

/**
 * @brief Normalize a chord name to its canonical spelling.
 *
 * Root spellings become canonical sharps; suffix aliases map to the
 * canonical chord suffix (case-insensitively, except the upper-case "M"
 * major forms). Slash chords normalize both sides. Unknown suffixes pass
 * through. Idempotent.
 *
 * "Db maj7" -> "C#maj7", "Bbm7/Ab" -> "A#m7/G#", "xyz" -> ""
 *
 * @param name Chord name text
 * @return Canonical name, empty if unparseable
 */
std::string normalizeChordName(const std::string& name);

/**
 * @brief Spellings of a pitch class that sound the same.
 *
 * Only the five standard sharp/flat pairs are listed.
 * @return {"C#", "Db"} for C#, {"C"} for C
 */
std::vector<std::string> enharmonicEquivalents(PitchClass pc);

/// @brief Outcome of judging a typed chord name against a chord.
struct ChordValidationResult {
  bool is_correct = false;
  std::string normalized_guess;
  std::string normalized_answer;
  bool is_enharmonic = false;             ///< Guess used flats for a sharp answer
  std::string original_guess;             ///< Trimmed guess text
  std::optional<std::string> feedback;    ///< Set only for incorrect guesses
};

/**
 * @brief Judge a typed chord name against a target chord.
 *
 * The target name is built with chordDisplayName(). An exact match after
 * normalization wins first; otherwise roots that are enharmonic
 * equivalents with identical suffixes are also accepted.
 *
 * @param guess User input
 * @param target Chord being asked for
 * @return Verdict with normalized strings and optional feedback
 */
ChordValidationResult validateChordGuess(const std::string& guess, const Chord& target);

/// Serialize a validation result for the UI layer.
std::string validationResultToJson(const ChordValidationResult& result);

}  // namespace chordlab

#endif  // CHORDLAB_CORE_CHORD_NAME_H
