#include "core/pitch_utils.h"

#include <algorithm>

namespace chordlab {

std::array<PitchClass, 7> scalePitchClasses(PitchClass tonic, ScaleType scale) {
  const int* steps = (scale == ScaleType::Major) ? MAJOR_SCALE : MINOR_SCALE;
  std::array<PitchClass, 7> result{};
  for (size_t i = 0; i < result.size(); ++i) {
    result[i] = transpose(tonic, steps[i]);
  }
  return result;
}

bool isInScale(PitchClass pc, PitchClass tonic, ScaleType scale) {
  int offset = normalizeInterval(pitchClassIndex(pc) - pitchClassIndex(tonic));
  const int* steps = (scale == ScaleType::Major) ? MAJOR_SCALE : MINOR_SCALE;
  return std::find(steps, steps + 7, offset) != steps + 7;
}

const char* scaleTypeName(ScaleType scale) {
  switch (scale) {
    case ScaleType::Major: return "major";
    case ScaleType::Minor: return "minor";
  }
  return "unknown";
}

std::vector<PitchedNote> sortByPitch(std::vector<PitchedNote> notes) {
  std::stable_sort(notes.begin(), notes.end());
  return notes;
}

bool isStrictlyAscending(const std::vector<PitchedNote>& notes) {
  for (size_t i = 1; i < notes.size(); ++i) {
    if (!(notes[i - 1] < notes[i])) return false;
  }
  return true;
}

}  // namespace chordlab
