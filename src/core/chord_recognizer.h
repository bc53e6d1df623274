/**
 * @file chord_recognizer.h
 * @brief Identify the chord and inversion formed by a set of pitched notes.
 */

#ifndef CHORDLAB_CORE_CHORD_RECOGNIZER_H
#define CHORDLAB_CORE_CHORD_RECOGNIZER_H

#include <cstddef>
#include <optional>
#include <vector>

#include "core/basic_types.h"
#include "core/chord_builder.h"

namespace chordlab {

/**
 * @brief Mod-12 interval signature of a voicing relative to a candidate root.
 *
 * Walks the notes in rotation order starting at root_index, takes each
 * note's distance from notes[root_index] mod 12 and returns the sorted
 * list. Comparable with normalizedFormula().
 *
 * @param sorted_notes Notes sorted ascending by pitch
 * @param root_index Index of the hypothetical root in sorted_notes
 * @return Sorted offsets in [0, 11]; empty if root_index is out of range
 */
std::vector<int> intervalSignature(const std::vector<PitchedNote>& sorted_notes,
                                   size_t root_index);

/**
 * @brief Recognize a chord from an unordered note set.
 *
 * Notes are sorted first. Resolution order is fixed:
 * 1. Every quality, in ChordQuality declaration order, with the bass note
 *    as root (root position readings win).
 * 2. Every quality in the same order, trying candidate roots 1..n-1.
 * The first match wins. Inversion is 0 for a bass-note root, otherwise
 * notes.size() - root_index.
 *
 * Step 1 runs to completion before any inverted reading is tried, so a
 * root-position voicing always comes back as the chord it was built from,
 * including qualities whose pitch sets are rotations of one another:
 * identifyChord(buildChord(r, q, o, 0).chord.notes) == buildChord(r, q, o, 0).chord.
 * An inverted reading found by root candidate is only reported when no
 * quality matches with the bass note as root.
 *
 * [E4 G4 C5] -> C major, inversion 1, "C/E"
 * [G3 C4 D4] -> G sus4, root position (not C sus2 over G)
 *
 * @param notes Note set in any order
 * @return Matching chord, or nullopt for empty or unmatched input
 */
std::optional<Chord> identifyChord(const std::vector<PitchedNote>& notes);

}  // namespace chordlab

#endif  // CHORDLAB_CORE_CHORD_RECOGNIZER_H
