#include "core/chord_recognizer.h"

#include <algorithm>

#include "core/chord.h"
#include "core/pitch_utils.h"

// Debug flag for recognizer logging (set to 1 to enable)
#ifndef CHORDLAB_RECOGNIZER_DEBUG_LOG
#define CHORDLAB_RECOGNIZER_DEBUG_LOG 0
#endif

#if CHORDLAB_RECOGNIZER_DEBUG_LOG
#include <iostream>
#endif

namespace chordlab {

namespace {

Chord makeRecognizedChord(const std::vector<PitchedNote>& sorted_notes, size_t root_index,
                          ChordQuality quality) {
  Chord chord;
  chord.root = sorted_notes[root_index].pitch_class;
  chord.quality = quality;
  chord.notes = sorted_notes;
  chord.inversion = (root_index == 0) ? 0 : static_cast<int>(sorted_notes.size() - root_index);
  chord.display_name =
      chordDisplayName(chord.root, quality, chord.inversion, sorted_notes.front().pitch_class);
  return chord;
}

}  // namespace

std::vector<int> intervalSignature(const std::vector<PitchedNote>& sorted_notes,
                                   size_t root_index) {
  std::vector<int> signature;
  if (root_index >= sorted_notes.size()) return signature;

  const size_t count = sorted_notes.size();
  const int root_pc = pitchClassIndex(sorted_notes[root_index].pitch_class);
  signature.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    const PitchedNote& note = sorted_notes[(root_index + i) % count];
    signature.push_back(normalizeInterval(pitchClassIndex(note.pitch_class) - root_pc));
  }
  std::sort(signature.begin(), signature.end());
  return signature;
}

std::optional<Chord> identifyChord(const std::vector<PitchedNote>& notes) {
  if (notes.empty()) return std::nullopt;

  std::vector<PitchedNote> sorted = sortByPitch(notes);

  // Root position readings first.
  std::vector<int> bass_signature = intervalSignature(sorted, 0);
  for (ChordQuality quality : kAllChordQualities) {
    if (bass_signature == normalizedFormula(quality)) {
#if CHORDLAB_RECOGNIZER_DEBUG_LOG
      std::cerr << "[recognizer] root position " << chordQualityId(quality) << " on "
                << sorted.front().toString() << "\n";
#endif
      return makeRecognizedChord(sorted, 0, quality);
    }
  }

  // Inverted readings.
  for (ChordQuality quality : kAllChordQualities) {
    std::vector<int> formula = normalizedFormula(quality);
    if (formula.size() != sorted.size()) continue;
    for (size_t p = 1; p < sorted.size(); ++p) {
      if (intervalSignature(sorted, p) == formula) {
#if CHORDLAB_RECOGNIZER_DEBUG_LOG
        std::cerr << "[recognizer] " << chordQualityId(quality) << " rooted at index " << p
                  << "\n";
#endif
        return makeRecognizedChord(sorted, p, quality);
      }
    }
  }

#if CHORDLAB_RECOGNIZER_DEBUG_LOG
  std::cerr << "[recognizer] no match for " << sorted.size() << " notes\n";
#endif
  return std::nullopt;
}

}  // namespace chordlab
