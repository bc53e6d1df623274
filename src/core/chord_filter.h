/**
 * @file chord_filter.h
 * @brief Chord filter configuration, validation, presets and JSON form.
 */

#ifndef CHORDLAB_CORE_CHORD_FILTER_H
#define CHORDLAB_CORE_CHORD_FILTER_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/basic_types.h"
#include "core/chord.h"
#include "core/chord_builder.h"
#include "core/pitch_utils.h"

namespace chordlab {

/// @brief Restrict candidates to chords whose every tone is diatonic to a key.
struct KeyFilter {
  PitchClass tonic = PitchClass::C;
  ScaleType scale = ScaleType::Major;
};

bool operator==(const KeyFilter& a, const KeyFilter& b);

/**
 * @brief Constraints used by the chord sampler.
 *
 * allowed_roots == nullopt means "any root". It is kept distinct from an
 * explicit list of all twelve pitch classes (they produce different cache
 * keys).
 */
struct ChordFilter {
  std::vector<ChordQuality> allowed_qualities = {ChordQuality::Major, ChordQuality::Minor};
  std::optional<std::vector<PitchClass>> allowed_roots;  ///< nullopt = all 12
  std::vector<int> allowed_octaves = {4};
  bool include_inversions = false;
  std::optional<KeyFilter> key_filter;

  /// Roots to enumerate: the explicit list, or all twelve for the wildcard.
  std::vector<PitchClass> effectiveRoots() const;
};

bool operator==(const ChordFilter& a, const ChordFilter& b);

/// @brief Chord filter validation errors.
enum class ChordFilterError : uint8_t {
  OK = 0,
  NoQualities,     ///< allowed_qualities is empty
  InvalidQuality,  ///< A quality value outside the enum
  EmptyRootList,   ///< allowed_roots is set but empty
  InvalidRoot,     ///< A root value outside the enum or an unknown name
  NoOctaves,       ///< allowed_octaves is empty
  InvalidOctave,   ///< An octave outside [1, 8] or not an integer
  InvalidKey,      ///< Unknown key tonic or scale
  InvalidJson      ///< Input is not a JSON object
};

/// Short description of a filter error.
const char* chordFilterErrorString(ChordFilterError error);

/**
 * @brief Validate a chord filter.
 *
 * Checks qualities, roots, octaves and key filter in that order.
 * @param filter Filter to validate
 * @return OK if valid, otherwise the first error found
 */
ChordFilterError validateChordFilter(const ChordFilter& filter);

/**
 * @brief Check a chord against every filter constraint.
 *
 * Quality, root and root-position octave must be allowed, inversion must be
 * 0 unless inversions are enabled, and with a key filter every note must be
 * diatonic.
 */
bool chordMatchesFilter(const Chord& chord, const ChordFilter& filter);

// ============================================================================
// Presets
// ============================================================================

/// @brief Named filter preset for common training scenarios.
struct ChordFilterPreset {
  const char* key;          ///< Lookup key (e.g., "BASIC_TRIADS")
  const char* name;         ///< Display name (e.g., "Basic Triads")
  const char* description;  ///< Description for UI
  ChordFilter filter;
};

constexpr uint8_t CHORD_FILTER_PRESET_COUNT = 5;

/// All presets in display order.
const std::vector<ChordFilterPreset>& getChordFilterPresets();

/**
 * @brief Find a preset by lookup key.
 * @param key Preset key such as "JAZZ_CHORDS"
 * @return Preset, or nullptr if unknown
 */
const ChordFilterPreset* findChordFilterPreset(const std::string& key);

/// Find a preset by display name ("Basic Triads"); nullptr if unknown.
const ChordFilterPreset* findChordFilterPresetByName(const std::string& name);

/**
 * @brief Create a filter from a preset.
 *
 * Preset values take precedence. When merging with a current filter, the
 * current key filter survives if the preset has none.
 *
 * @param preset Preset to apply
 * @param current Current filter to merge with (optional)
 * @return New filter
 */
ChordFilter applyChordFilterPreset(const ChordFilterPreset& preset,
                                   const ChordFilter* current = nullptr);

// ============================================================================
// JSON
// ============================================================================

/// @brief Result of chordFilterFromJson(). `filter` is meaningful only when ok().
struct ChordFilterParseResult {
  ChordFilter filter;
  ChordFilterError error = ChordFilterError::OK;

  bool ok() const { return error == ChordFilterError::OK; }
};

/**
 * @brief Parse a filter from JSON.
 *
 * Format (all keys optional, defaults from ChordFilter):
 * ```json
 * {"qualities":["major","dominant7"],"roots":null,"octaves":[3,4],
 *  "include_inversions":true,"key":{"tonic":"C","scale":"major"}}
 * ```
 * Roots accept any spelling normalizeNoteName() understands ("Db", "F#").
 * The parsed filter is validated before it is returned.
 *
 * @param json JSON text
 * @return Parsed filter or the first error
 */
ChordFilterParseResult chordFilterFromJson(const std::string& json);

/// Serialize a filter to the JSON form read by chordFilterFromJson().
std::string chordFilterToJson(const ChordFilter& filter);

}  // namespace chordlab

#endif  // CHORDLAB_CORE_CHORD_FILTER_H
