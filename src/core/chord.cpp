#include "core/chord.h"

#include <algorithm>
#include <initializer_list>

#include "core/pitch_utils.h"

namespace chordlab {

namespace {

constexpr ChordFormula makeFormula(std::initializer_list<int> intervals) {
  ChordFormula f{{-1, -1, -1, -1, -1, -1, -1}, 0};
  for (int i : intervals) {
    f.intervals[f.note_count++] = static_cast<int8_t>(i);
  }
  return f;
}

}  // namespace

std::vector<int> ChordFormula::toVector() const {
  return std::vector<int>(intervals.begin(), intervals.begin() + note_count);
}

ChordFormula getChordFormula(ChordQuality quality) {
  using namespace Interval;
  switch (quality) {
    // Triads
    case ChordQuality::Major: return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH});
    case ChordQuality::Minor: return makeFormula({UNISON, MINOR_3RD, PERFECT_5TH});
    case ChordQuality::Diminished: return makeFormula({UNISON, MINOR_3RD, TRITONE});
    case ChordQuality::Augmented: return makeFormula({UNISON, MAJOR_3RD, MINOR_6TH});
    case ChordQuality::Sus2: return makeFormula({UNISON, WHOLE_STEP, PERFECT_5TH});
    case ChordQuality::Sus4: return makeFormula({UNISON, PERFECT_4TH, PERFECT_5TH});

    // Seventh chords
    case ChordQuality::Major7:
      return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH, MAJOR_7TH});
    case ChordQuality::Minor7:
      return makeFormula({UNISON, MINOR_3RD, PERFECT_5TH, MINOR_7TH});
    case ChordQuality::Dominant7:
      return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH, MINOR_7TH});
    case ChordQuality::HalfDiminished7:
      return makeFormula({UNISON, MINOR_3RD, TRITONE, MINOR_7TH});
    case ChordQuality::Diminished7:
      return makeFormula({UNISON, MINOR_3RD, TRITONE, MAJOR_6TH});

    // 9ths
    case ChordQuality::Major9:
      return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH, MAJOR_7TH, NINTH});
    case ChordQuality::Minor9:
      return makeFormula({UNISON, MINOR_3RD, PERFECT_5TH, MINOR_7TH, NINTH});
    case ChordQuality::Dominant9:
      return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH, MINOR_7TH, NINTH});

    // 11ths
    case ChordQuality::Major11:
      return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH, MAJOR_7TH, NINTH, ELEVENTH});
    case ChordQuality::Minor11:
      return makeFormula({UNISON, MINOR_3RD, PERFECT_5TH, MINOR_7TH, NINTH, ELEVENTH});
    case ChordQuality::Dominant11:
      return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH, MINOR_7TH, NINTH, ELEVENTH});

    // 13ths
    case ChordQuality::Major13:
      return makeFormula(
          {UNISON, MAJOR_3RD, PERFECT_5TH, MAJOR_7TH, NINTH, ELEVENTH, THIRTEENTH});
    case ChordQuality::Dominant13:
      return makeFormula(
          {UNISON, MAJOR_3RD, PERFECT_5TH, MINOR_7TH, NINTH, ELEVENTH, THIRTEENTH});

    // Added tone chords
    case ChordQuality::Add9: return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH, NINTH});
    case ChordQuality::Add11: return makeFormula({UNISON, MAJOR_3RD, PERFECT_5TH, ELEVENTH});
  }
  return makeFormula({});
}

int formulaLength(ChordQuality quality) { return getChordFormula(quality).note_count; }

std::vector<int> normalizedFormula(ChordQuality quality) {
  std::vector<int> result = getChordFormula(quality).toVector();
  for (int& interval : result) interval = normalizeInterval(interval);
  std::sort(result.begin(), result.end());
  return result;
}

const char* chordSuffix(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Major: return "";
    case ChordQuality::Minor: return "m";
    case ChordQuality::Diminished: return "dim";
    case ChordQuality::Augmented: return "aug";
    case ChordQuality::Sus2: return "sus2";
    case ChordQuality::Sus4: return "sus4";
    case ChordQuality::Major7: return "maj7";
    case ChordQuality::Minor7: return "m7";
    case ChordQuality::Dominant7: return "7";
    case ChordQuality::HalfDiminished7: return "m7♭5";
    case ChordQuality::Diminished7: return "dim7";
    case ChordQuality::Major9: return "maj9";
    case ChordQuality::Minor9: return "m9";
    case ChordQuality::Dominant9: return "9";
    case ChordQuality::Major11: return "maj11";
    case ChordQuality::Minor11: return "m11";
    case ChordQuality::Dominant11: return "11";
    case ChordQuality::Major13: return "maj13";
    case ChordQuality::Dominant13: return "13";
    case ChordQuality::Add9: return "add9";
    case ChordQuality::Add11: return "add11";
  }
  return "";
}

const char* chordQualityId(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Major: return "major";
    case ChordQuality::Minor: return "minor";
    case ChordQuality::Diminished: return "diminished";
    case ChordQuality::Augmented: return "augmented";
    case ChordQuality::Sus2: return "sus2";
    case ChordQuality::Sus4: return "sus4";
    case ChordQuality::Major7: return "major7";
    case ChordQuality::Minor7: return "minor7";
    case ChordQuality::Dominant7: return "dominant7";
    case ChordQuality::HalfDiminished7: return "halfDiminished7";
    case ChordQuality::Diminished7: return "diminished7";
    case ChordQuality::Major9: return "major9";
    case ChordQuality::Minor9: return "minor9";
    case ChordQuality::Dominant9: return "dominant9";
    case ChordQuality::Major11: return "major11";
    case ChordQuality::Minor11: return "minor11";
    case ChordQuality::Dominant11: return "dominant11";
    case ChordQuality::Major13: return "major13";
    case ChordQuality::Dominant13: return "dominant13";
    case ChordQuality::Add9: return "add9";
    case ChordQuality::Add11: return "add11";
  }
  return "unknown";
}

std::optional<ChordQuality> chordQualityFromId(const std::string& id) {
  for (ChordQuality quality : kAllChordQualities) {
    if (id == chordQualityId(quality)) return quality;
  }
  return std::nullopt;
}

const char* chordQualityDisplayName(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Major: return "Major";
    case ChordQuality::Minor: return "Minor";
    case ChordQuality::Diminished: return "Diminished";
    case ChordQuality::Augmented: return "Augmented";
    case ChordQuality::Sus2: return "Sus2";
    case ChordQuality::Sus4: return "Sus4";
    case ChordQuality::Major7: return "Major 7th";
    case ChordQuality::Minor7: return "Minor 7th";
    case ChordQuality::Dominant7: return "Dominant 7th";
    case ChordQuality::HalfDiminished7: return "Half Diminished 7th";
    case ChordQuality::Diminished7: return "Diminished 7th";
    case ChordQuality::Major9: return "Major 9th";
    case ChordQuality::Minor9: return "Minor 9th";
    case ChordQuality::Dominant9: return "Dominant 9th";
    case ChordQuality::Major11: return "Major 11th";
    case ChordQuality::Minor11: return "Minor 11th";
    case ChordQuality::Dominant11: return "Dominant 11th";
    case ChordQuality::Major13: return "Major 13th";
    case ChordQuality::Dominant13: return "Dominant 13th";
    case ChordQuality::Add9: return "Add9";
    case ChordQuality::Add11: return "Add11";
  }
  return "Unknown";
}

ChordCategory chordCategory(ChordQuality quality) {
  switch (quality) {
    case ChordQuality::Major:
    case ChordQuality::Minor:
    case ChordQuality::Diminished:
    case ChordQuality::Augmented:
      return ChordCategory::Triads;
    case ChordQuality::Sus2:
    case ChordQuality::Sus4:
      return ChordCategory::Suspended;
    case ChordQuality::Major7:
    case ChordQuality::Minor7:
    case ChordQuality::Dominant7:
    case ChordQuality::HalfDiminished7:
    case ChordQuality::Diminished7:
      return ChordCategory::SeventhChords;
    case ChordQuality::Major9:
    case ChordQuality::Minor9:
    case ChordQuality::Dominant9:
    case ChordQuality::Major11:
    case ChordQuality::Minor11:
    case ChordQuality::Dominant11:
    case ChordQuality::Major13:
    case ChordQuality::Dominant13:
      return ChordCategory::ExtendedChords;
    case ChordQuality::Add9:
    case ChordQuality::Add11:
      return ChordCategory::AddedTones;
  }
  return ChordCategory::Triads;
}

const char* chordCategoryDisplayName(ChordCategory category) {
  switch (category) {
    case ChordCategory::Triads: return "Triads";
    case ChordCategory::SeventhChords: return "7th Chords";
    case ChordCategory::ExtendedChords: return "Extended Chords (9ths, 11ths, 13ths)";
    case ChordCategory::Suspended: return "Suspended Chords";
    case ChordCategory::AddedTones: return "Added Tone Chords";
  }
  return "Unknown";
}

std::vector<ChordQuality> qualitiesInCategory(ChordCategory category) {
  std::vector<ChordQuality> result;
  for (ChordQuality quality : kAllChordQualities) {
    if (chordCategory(quality) == category) result.push_back(quality);
  }
  return result;
}

}  // namespace chordlab
