#include "core/chord_filter.h"

#include <algorithm>
#include <sstream>

#include "core/chord_name.h"
#include "core/json_helpers.h"

namespace chordlab {

namespace {

std::vector<PitchClass> whiteKeyRoots() {
  std::vector<PitchClass> roots;
  for (PitchClass pc : kAllPitchClasses) {
    if (isWhiteKey(pc)) roots.push_back(pc);
  }
  return roots;
}

std::vector<ChordQuality> concatQualities(ChordCategory a, ChordCategory b) {
  std::vector<ChordQuality> result = qualitiesInCategory(a);
  std::vector<ChordQuality> rest = qualitiesInCategory(b);
  result.insert(result.end(), rest.begin(), rest.end());
  return result;
}

std::vector<ChordFilterPreset> makePresets() {
  const std::vector<ChordQuality> major_minor = {ChordQuality::Major, ChordQuality::Minor};
  const std::vector<ChordQuality> all_qualities(kAllChordQualities.begin(),
                                                kAllChordQualities.end());

  std::vector<ChordFilterPreset> presets;
  presets.reserve(CHORD_FILTER_PRESET_COUNT);

  presets.push_back({"ALL_MAJOR_MINOR_TRIADS", "All Major & Minor Triads",
                     "Practice all major and minor triads across all notes",
                     ChordFilter{major_minor, std::nullopt, {3, 4}, false, std::nullopt}});

  presets.push_back({"ALL_7TH_CHORDS", "All 7th Chords",
                     "Practice all seventh chord types (major7, dominant7, minor7, etc.)",
                     ChordFilter{qualitiesInCategory(ChordCategory::SeventhChords), std::nullopt,
                                 {3, 4}, false, std::nullopt}});

  presets.push_back({"ALL_CHORDS_C_MAJOR", "All Chords in C Major",
                     "Practice diatonic chords in the key of C major",
                     ChordFilter{all_qualities, std::nullopt, {3, 4}, false,
                                 KeyFilter{PitchClass::C, ScaleType::Major}}});

  presets.push_back(
      {"JAZZ_CHORDS", "Jazz Chords",
       "Practice jazz chords: 7ths, 9ths, 11ths, and 13ths with inversions",
       ChordFilter{concatQualities(ChordCategory::SeventhChords, ChordCategory::ExtendedChords),
                   std::nullopt, {3, 4}, true, std::nullopt}});

  presets.push_back({"BASIC_TRIADS", "Basic Triads",
                     "Beginner-friendly: major and minor triads on white keys only",
                     ChordFilter{major_minor, whiteKeyRoots(), {4}, false, std::nullopt}});

  return presets;
}

std::optional<ScaleType> scaleTypeFromName(const std::string& name) {
  if (name == scaleTypeName(ScaleType::Major)) return ScaleType::Major;
  if (name == scaleTypeName(ScaleType::Minor)) return ScaleType::Minor;
  return std::nullopt;
}

}  // namespace

bool operator==(const KeyFilter& a, const KeyFilter& b) {
  return a.tonic == b.tonic && a.scale == b.scale;
}

bool operator==(const ChordFilter& a, const ChordFilter& b) {
  return a.allowed_qualities == b.allowed_qualities && a.allowed_roots == b.allowed_roots &&
         a.allowed_octaves == b.allowed_octaves && a.include_inversions == b.include_inversions &&
         a.key_filter == b.key_filter;
}

std::vector<PitchClass> ChordFilter::effectiveRoots() const {
  if (allowed_roots) return *allowed_roots;
  return std::vector<PitchClass>(kAllPitchClasses.begin(), kAllPitchClasses.end());
}

const char* chordFilterErrorString(ChordFilterError error) {
  switch (error) {
    case ChordFilterError::OK: return "ok";
    case ChordFilterError::NoQualities: return "no chord qualities selected";
    case ChordFilterError::InvalidQuality: return "invalid chord quality";
    case ChordFilterError::EmptyRootList: return "root list is empty";
    case ChordFilterError::InvalidRoot: return "invalid root";
    case ChordFilterError::NoOctaves: return "no octaves selected";
    case ChordFilterError::InvalidOctave: return "invalid octave";
    case ChordFilterError::InvalidKey: return "invalid key";
    case ChordFilterError::InvalidJson: return "invalid JSON";
  }
  return "unknown error";
}

ChordFilterError validateChordFilter(const ChordFilter& filter) {
  if (filter.allowed_qualities.empty()) {
    return ChordFilterError::NoQualities;
  }
  for (ChordQuality quality : filter.allowed_qualities) {
    if (!isValidChordQuality(quality)) return ChordFilterError::InvalidQuality;
  }

  if (filter.allowed_roots) {
    if (filter.allowed_roots->empty()) return ChordFilterError::EmptyRootList;
    for (PitchClass root : *filter.allowed_roots) {
      if (!isValidPitchClass(root)) return ChordFilterError::InvalidRoot;
    }
  }

  if (filter.allowed_octaves.empty()) {
    return ChordFilterError::NoOctaves;
  }
  for (int octave : filter.allowed_octaves) {
    if (!isValidOctave(octave)) return ChordFilterError::InvalidOctave;
  }

  if (filter.key_filter) {
    if (!isValidPitchClass(filter.key_filter->tonic)) return ChordFilterError::InvalidKey;
    if (filter.key_filter->scale != ScaleType::Major &&
        filter.key_filter->scale != ScaleType::Minor) {
      return ChordFilterError::InvalidKey;
    }
  }

  return ChordFilterError::OK;
}

bool chordMatchesFilter(const Chord& chord, const ChordFilter& filter) {
  const auto& qualities = filter.allowed_qualities;
  if (std::find(qualities.begin(), qualities.end(), chord.quality) == qualities.end()) {
    return false;
  }

  if (filter.allowed_roots) {
    const auto& roots = *filter.allowed_roots;
    if (std::find(roots.begin(), roots.end(), chord.root) == roots.end()) return false;
  }

  const auto& octaves = filter.allowed_octaves;
  if (std::find(octaves.begin(), octaves.end(), rootPositionOctave(chord)) == octaves.end()) {
    return false;
  }

  if (!filter.include_inversions && chord.inversion != 0) return false;

  if (filter.key_filter) {
    for (const auto& note : chord.notes) {
      if (!isInScale(note.pitch_class, filter.key_filter->tonic, filter.key_filter->scale)) {
        return false;
      }
    }
  }
  return true;
}

// ============================================================================
// Presets
// ============================================================================

const std::vector<ChordFilterPreset>& getChordFilterPresets() {
  static const std::vector<ChordFilterPreset> presets = makePresets();
  return presets;
}

const ChordFilterPreset* findChordFilterPreset(const std::string& key) {
  for (const auto& preset : getChordFilterPresets()) {
    if (key == preset.key) return &preset;
  }
  return nullptr;
}

const ChordFilterPreset* findChordFilterPresetByName(const std::string& name) {
  for (const auto& preset : getChordFilterPresets()) {
    if (name == preset.name) return &preset;
  }
  return nullptr;
}

ChordFilter applyChordFilterPreset(const ChordFilterPreset& preset, const ChordFilter* current) {
  ChordFilter result = preset.filter;
  if (current != nullptr && !preset.filter.key_filter) {
    result.key_filter = current->key_filter;
  }
  return result;
}

// ============================================================================
// JSON
// ============================================================================

ChordFilterParseResult chordFilterFromJson(const std::string& json) {
  ChordFilterParseResult result;
  json::Parser p(json);
  if (!p.valid()) {
    result.error = ChordFilterError::InvalidJson;
    return result;
  }

  ChordFilter& filter = result.filter;

  if (p.has("qualities")) {
    if (!p.isArray("qualities")) {
      result.error = ChordFilterError::InvalidQuality;
      return result;
    }
    bool all_strings = false;
    std::vector<std::string> ids = p.getStringArray("qualities", &all_strings);
    if (!all_strings) {
      result.error = ChordFilterError::InvalidQuality;
      return result;
    }
    filter.allowed_qualities.clear();
    for (const auto& id : ids) {
      auto quality = chordQualityFromId(id);
      if (!quality) {
        result.error = ChordFilterError::InvalidQuality;
        return result;
      }
      filter.allowed_qualities.push_back(*quality);
    }
  }

  if (p.has("roots") && !p.isNull("roots")) {
    if (!p.isArray("roots")) {
      result.error = ChordFilterError::InvalidRoot;
      return result;
    }
    bool all_strings = false;
    std::vector<std::string> names = p.getStringArray("roots", &all_strings);
    if (!all_strings) {
      result.error = ChordFilterError::InvalidRoot;
      return result;
    }
    std::vector<PitchClass> roots;
    for (const auto& name : names) {
      auto root = normalizeNoteName(name);
      if (!root) {
        result.error = ChordFilterError::InvalidRoot;
        return result;
      }
      roots.push_back(*root);
    }
    filter.allowed_roots = roots;
  }

  if (p.has("octaves")) {
    bool all_ints = false;
    std::vector<int> octaves = p.getIntArray("octaves", &all_ints);
    if (!p.isArray("octaves") || !all_ints) {
      result.error = ChordFilterError::InvalidOctave;
      return result;
    }
    filter.allowed_octaves = octaves;
  }

  filter.include_inversions = p.getBool("include_inversions", filter.include_inversions);

  if (p.has("key") && !p.isNull("key")) {
    if (!p.isObject("key")) {
      result.error = ChordFilterError::InvalidKey;
      return result;
    }
    json::Parser key = p.getObject("key");
    auto tonic = normalizeNoteName(key.getString("tonic"));
    auto scale = scaleTypeFromName(key.getString("scale", "major"));
    if (!tonic || !scale) {
      result.error = ChordFilterError::InvalidKey;
      return result;
    }
    filter.key_filter = KeyFilter{*tonic, *scale};
  }

  result.error = validateChordFilter(filter);
  return result;
}

std::string chordFilterToJson(const ChordFilter& filter) {
  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject();

  w.beginArray("qualities");
  for (ChordQuality quality : filter.allowed_qualities) w.value(chordQualityId(quality));
  w.endArray();

  if (filter.allowed_roots) {
    w.beginArray("roots");
    for (PitchClass root : *filter.allowed_roots) w.value(pitchClassName(root));
    w.endArray();
  } else {
    w.writeNull("roots");
  }

  w.beginArray("octaves");
  for (int octave : filter.allowed_octaves) w.value(octave);
  w.endArray();

  w.write("include_inversions", filter.include_inversions);

  if (filter.key_filter) {
    w.beginObject("key")
        .write("tonic", pitchClassName(filter.key_filter->tonic))
        .write("scale", scaleTypeName(filter.key_filter->scale))
        .endObject();
  } else {
    w.writeNull("key");
  }

  w.endObject();
  return oss.str();
}

}  // namespace chordlab
