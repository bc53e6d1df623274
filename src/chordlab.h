/**
 * @file chordlab.h
 * @brief High-level API for chord building, recognition, sampling and validation.
 */

#ifndef CHORDLAB_H
#define CHORDLAB_H

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "core/chord_builder.h"
#include "core/chord_filter.h"
#include "core/chord_name.h"
#include "core/chord_recognizer.h"
#include "core/chord_sampler.h"
#include "midi/midi_note.h"

namespace chordlab {

/**
 * @brief Serialize a chord for display/playback.
 *
 * {"name":"G7/B","root":"G","quality":"dominant7","inversion":1,
 *  "notes":["B3","D4","F4","G4"],"midi_notes":[47,50,53,55]}
 *
 * "midi_notes" is null if any note has no MIDI number.
 */
std::string chordToJson(const Chord& chord);

/// @brief High-level API owning the sampler cache and random engine.
class ChordLab {
 public:
  /**
   * @brief Construct with a seed.
   * @param seed Random seed (0 = auto-generate)
   */
  explicit ChordLab(uint32_t seed = 0);

  ChordLab(const ChordLab&) = delete;
  ChordLab& operator=(const ChordLab&) = delete;

  /// Reseed the random engine (0 = auto-generate).
  void setSeed(uint32_t seed);

  /// Seed in use (resolved when 0 was given).
  uint32_t getSeed() const;

  /**
   * @brief Build a chord.
   * @see chordlab::buildChord
   */
  ChordBuildResult build(PitchClass root, ChordQuality quality, int octave,
                         int inversion = 0) const;

  /// Recognize a chord from pitched notes.
  std::optional<Chord> identify(const std::vector<PitchedNote>& notes) const;

  /**
   * @brief Recognize a chord from held MIDI note numbers.
   * @param midi_notes Note numbers, e.g. from note-on events
   * @return nullopt if any note is not playable or no chord matches
   */
  std::optional<Chord> identifyMidiNotes(const std::vector<int>& midi_notes) const;

  /**
   * @brief Draw a random chord matching a filter.
   * @param filter Chord filter
   * @return Chord, or NoValidChords
   */
  ChordSampleResult sample(const ChordFilter& filter);

  /// Judge a typed chord name against a chord.
  ChordValidationResult validateGuess(const std::string& guess, const Chord& target) const;

  /// Drop all cached candidate lists.
  void clearCache();

  /// Number of cached filters.
  size_t cacheSize() const;

  /**
   * @brief Get library version string.
   * @return Version string (e.g., "1.0.0")
   */
  static const char* version();

 private:
  ChordSampler sampler_;
  mutable std::mutex rng_mutex_;
  std::mt19937 rng_;
  uint32_t seed_ = 0;
};

}  // namespace chordlab

#endif  // CHORDLAB_H
