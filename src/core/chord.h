/**
 * @file chord.h
 * @brief Chord qualities and their interval formulas.
 */

#ifndef CHORDLAB_CORE_CHORD_H
#define CHORDLAB_CORE_CHORD_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chordlab {

/**
 * @brief Closed set of chord qualities.
 *
 * Declaration order is the recognition priority order used by
 * identifyChord(): earlier qualities win when a note set could be read
 * more than one way.
 */
enum class ChordQuality : uint8_t {
  // Triads
  Major = 0,
  Minor,
  Diminished,
  Augmented,
  Sus2,
  Sus4,
  // Seventh chords
  Major7,
  Minor7,
  Dominant7,
  HalfDiminished7,
  Diminished7,
  // Extended chords
  Major9,
  Minor9,
  Dominant9,
  Major11,
  Minor11,
  Dominant11,
  Major13,
  Dominant13,
  // Added tone chords
  Add9,
  Add11
};

/// Number of chord qualities.
constexpr uint8_t CHORD_QUALITY_COUNT = 21;

/// Maximum notes in any formula (13th chords).
constexpr uint8_t MAX_CHORD_NOTES = 7;

/// All qualities in recognition priority order.
constexpr std::array<ChordQuality, CHORD_QUALITY_COUNT> kAllChordQualities = {
    ChordQuality::Major,      ChordQuality::Minor,      ChordQuality::Diminished,
    ChordQuality::Augmented,  ChordQuality::Sus2,       ChordQuality::Sus4,
    ChordQuality::Major7,     ChordQuality::Minor7,     ChordQuality::Dominant7,
    ChordQuality::HalfDiminished7, ChordQuality::Diminished7, ChordQuality::Major9,
    ChordQuality::Minor9,     ChordQuality::Dominant9,  ChordQuality::Major11,
    ChordQuality::Minor11,    ChordQuality::Dominant11, ChordQuality::Major13,
    ChordQuality::Dominant13, ChordQuality::Add9,       ChordQuality::Add11};

/// True if the value is one of the declared enumerators.
constexpr bool isValidChordQuality(ChordQuality quality) {
  return static_cast<uint8_t>(quality) < CHORD_QUALITY_COUNT;
}

/**
 * @brief Interval formula of a chord quality.
 *
 * Intervals are ascending semitones from the root; extended tones keep
 * their compound value (9th = 14, 11th = 17, 13th = 21). Unused slots = -1.
 */
struct ChordFormula {
  std::array<int8_t, MAX_CHORD_NOTES> intervals;  ///< Semitones from root
  uint8_t note_count;                             ///< Number of notes

  /// Intervals as a vector (first note_count entries).
  std::vector<int> toVector() const;
};

/**
 * @brief Get the interval formula for a quality.
 *
 * Major(0,4,7), Minor(0,3,7), Dim(0,3,6), Aug(0,4,8), Sus2(0,2,7),
 * Sus4(0,5,7), Maj7(+11), m7(+10), 7(+10), m7b5(0,3,6,10),
 * dim7(0,3,6,9), 9ths(+14), 11ths(+14,+17), 13ths(+14,+17,+21),
 * add9(0,4,7,14), add11(0,4,7,17).
 *
 * @param quality Chord quality
 * @return Formula, note_count = 0 for an invalid quality
 */
ChordFormula getChordFormula(ChordQuality quality);

/// Number of notes a chord of this quality contains (0 if invalid).
int formulaLength(ChordQuality quality);

/**
 * @brief Formula reduced mod 12 and sorted ascending.
 *
 * This is the interval signature the recognizer compares against.
 * @param quality Chord quality
 * @return Sorted pitch-class offsets from the root
 */
std::vector<int> normalizedFormula(ChordQuality quality);

/**
 * @brief Canonical chord-symbol suffix appended to the root.
 *
 * Major is "", Minor "m", Dominant7 "7", HalfDiminished7 "m7♭5" (UTF-8).
 * @param quality Chord quality
 * @return Static string
 */
const char* chordSuffix(ChordQuality quality);

/**
 * @brief Stable identifier used in configuration files ("dominant7").
 * @param quality Chord quality
 * @return Static string, "unknown" for invalid values
 */
const char* chordQualityId(ChordQuality quality);

/**
 * @brief Parse a quality identifier produced by chordQualityId().
 * @param id Identifier such as "halfDiminished7"
 * @return Quality, or nullopt if unknown
 */
std::optional<ChordQuality> chordQualityFromId(const std::string& id);

/// Human readable name for settings screens ("Dominant 7th").
const char* chordQualityDisplayName(ChordQuality quality);

/// @brief Chord category used to group qualities in settings.
enum class ChordCategory : uint8_t {
  Triads,
  SeventhChords,
  ExtendedChords,
  Suspended,
  AddedTones
};

/// Category a quality belongs to.
ChordCategory chordCategory(ChordQuality quality);

/// Display name of a category ("Extended Chords (9ths, 11ths, 13ths)").
const char* chordCategoryDisplayName(ChordCategory category);

/// Qualities in a category, in priority order.
std::vector<ChordQuality> qualitiesInCategory(ChordCategory category);

}  // namespace chordlab

#endif  // CHORDLAB_CORE_CHORD_H
