#include "core/chord_inversions.h"

#include <algorithm>

#include "core/pitch_utils.h"

namespace chordlab {

PitchedNote raiseOctave(const PitchedNote& note) {
  return PitchedNote{note.pitch_class, std::min(kMaxOctave, note.octave + 1)};
}

PitchedNote lowerOctave(const PitchedNote& note) {
  return PitchedNote{note.pitch_class, std::max(kMinOctave, note.octave - 1)};
}

int maxInversions(const std::vector<PitchedNote>& notes) {
  return std::max(0, static_cast<int>(notes.size()) - 1);
}

bool invertOnce(std::vector<PitchedNote>& notes, OctavePolicy policy) {
  if (notes.empty()) return true;

  PitchedNote lowest = notes.front();
  if (lowest.octave + 1 > kMaxOctave && policy == OctavePolicy::Reject) {
    return false;
  }

  notes.erase(notes.begin());
  notes.push_back(raiseOctave(lowest));
  std::stable_sort(notes.begin(), notes.end());
  return true;
}

std::vector<std::vector<PitchedNote>> generateInversions(
    const std::vector<PitchedNote>& root_position, int max_inversions) {
  std::vector<std::vector<PitchedNote>> result;
  if (root_position.empty()) return result;

  std::vector<PitchedNote> current = sortByPitch(root_position);
  int count = std::clamp(max_inversions, 0, maxInversions(current));

  result.reserve(static_cast<size_t>(count) + 1);
  result.push_back(current);
  for (int i = 0; i < count; ++i) {
    invertOnce(current, OctavePolicy::Clamp);
    result.push_back(current);
  }
  return result;
}

}  // namespace chordlab
