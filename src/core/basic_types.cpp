#include "core/basic_types.h"

#include "core/pitch_utils.h"

namespace chordlab {

const char* pitchClassName(PitchClass pc) {
  if (!isValidPitchClass(pc)) return "?";
  return NOTE_NAMES[pitchClassIndex(pc)];
}

std::optional<PitchClass> pitchClassFromName(const std::string& name) {
  for (PitchClass pc : kAllPitchClasses) {
    if (name == NOTE_NAMES[pitchClassIndex(pc)]) return pc;
  }
  return std::nullopt;
}

bool isWhiteKey(PitchClass pc) {
  switch (pc) {
    case PitchClass::C:
    case PitchClass::D:
    case PitchClass::E:
    case PitchClass::F:
    case PitchClass::G:
    case PitchClass::A:
    case PitchClass::B:
      return true;
    default:
      return false;
  }
}

std::string PitchedNote::toString() const {
  return std::string(pitchClassName(pitch_class)) + std::to_string(octave);
}

}  // namespace chordlab
