/**
 * @file chord_test.cpp
 * @brief Tests for chord qualities and interval formulas.
 */

#include "core/chord.h"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

namespace chordlab {
namespace {

TEST(ChordTest, MajorTriad) {
  auto f = getChordFormula(ChordQuality::Major);
  EXPECT_EQ(f.note_count, 3);
  EXPECT_EQ(f.intervals[0], 0);  // Root
  EXPECT_EQ(f.intervals[1], 4);  // Major 3rd
  EXPECT_EQ(f.intervals[2], 7);  // Perfect 5th
}

TEST(ChordTest, HalfDiminishedSeventh) {
  EXPECT_EQ(getChordFormula(ChordQuality::HalfDiminished7).toVector(),
            (std::vector<int>{0, 3, 6, 10}));
}

TEST(ChordTest, DiminishedSeventh) {
  EXPECT_EQ(getChordFormula(ChordQuality::Diminished7).toVector(),
            (std::vector<int>{0, 3, 6, 9}));
}

TEST(ChordTest, ExtendedChordsKeepCompoundIntervals) {
  EXPECT_EQ(getChordFormula(ChordQuality::Dominant9).toVector(),
            (std::vector<int>{0, 4, 7, 10, 14}));
  EXPECT_EQ(getChordFormula(ChordQuality::Minor11).toVector(),
            (std::vector<int>{0, 3, 7, 10, 14, 17}));
  EXPECT_EQ(getChordFormula(ChordQuality::Major13).toVector(),
            (std::vector<int>{0, 4, 7, 11, 14, 17, 21}));
  EXPECT_EQ(getChordFormula(ChordQuality::Add11).toVector(),
            (std::vector<int>{0, 4, 7, 17}));
}

TEST(ChordTest, FormulaLengths) {
  for (ChordQuality q : kAllChordQualities) {
    int expected = 0;
    switch (chordCategory(q)) {
      case ChordCategory::Triads:
      case ChordCategory::Suspended:
        expected = 3;
        break;
      case ChordCategory::SeventhChords:
      case ChordCategory::AddedTones:
        expected = 4;
        break;
      case ChordCategory::ExtendedChords: {
        std::string id = chordQualityId(q);
        if (id.back() == '9') {
          expected = 5;
        } else if (id.find("11") != std::string::npos) {
          expected = 6;
        } else {
          expected = 7;
        }
        break;
      }
    }
    EXPECT_EQ(formulaLength(q), expected) << chordQualityId(q);
  }
}

TEST(ChordTest, FormulasStartAtRootAndAscend) {
  for (ChordQuality q : kAllChordQualities) {
    std::vector<int> intervals = getChordFormula(q).toVector();
    ASSERT_FALSE(intervals.empty());
    EXPECT_EQ(intervals.front(), 0) << chordQualityId(q);
    for (size_t i = 1; i < intervals.size(); ++i) {
      EXPECT_LT(intervals[i - 1], intervals[i]) << chordQualityId(q);
    }
  }
}

TEST(ChordTest, NormalizedFormulasAreDistinct) {
  // Two qualities with the same signature could never both be recognized.
  std::set<std::vector<int>> seen;
  for (ChordQuality q : kAllChordQualities) {
    EXPECT_TRUE(seen.insert(normalizedFormula(q)).second) << chordQualityId(q);
  }
}

TEST(ChordTest, NormalizedFormulaReducesAndSorts) {
  EXPECT_EQ(normalizedFormula(ChordQuality::Dominant13),
            (std::vector<int>{0, 2, 4, 5, 7, 9, 10}));
  EXPECT_EQ(normalizedFormula(ChordQuality::Add9), (std::vector<int>{0, 2, 4, 7}));
}

TEST(ChordTest, Suffixes) {
  EXPECT_STREQ(chordSuffix(ChordQuality::Major), "");
  EXPECT_STREQ(chordSuffix(ChordQuality::Minor), "m");
  EXPECT_STREQ(chordSuffix(ChordQuality::Dominant7), "7");
  EXPECT_STREQ(chordSuffix(ChordQuality::Major9), "maj9");
  EXPECT_STREQ(chordSuffix(ChordQuality::HalfDiminished7), "m7\xE2\x99\xAD" "5");
  EXPECT_STREQ(chordSuffix(ChordQuality::Sus4), "sus4");
}

TEST(ChordTest, QualityIdRoundTrip) {
  for (ChordQuality q : kAllChordQualities) {
    auto parsed = chordQualityFromId(chordQualityId(q));
    ASSERT_TRUE(parsed.has_value()) << chordQualityId(q);
    EXPECT_EQ(*parsed, q);
  }
  EXPECT_FALSE(chordQualityFromId("minor13").has_value());
  EXPECT_FALSE(chordQualityFromId("").has_value());
}

TEST(ChordTest, InvalidQuality) {
  auto bogus = static_cast<ChordQuality>(CHORD_QUALITY_COUNT);
  EXPECT_FALSE(isValidChordQuality(bogus));
  EXPECT_EQ(formulaLength(bogus), 0);
  EXPECT_STREQ(chordQualityId(bogus), "unknown");
}

TEST(ChordTest, Categories) {
  EXPECT_EQ(qualitiesInCategory(ChordCategory::Triads).size(), 4u);
  EXPECT_EQ(qualitiesInCategory(ChordCategory::Suspended).size(), 2u);
  EXPECT_EQ(qualitiesInCategory(ChordCategory::SeventhChords).size(), 5u);
  EXPECT_EQ(qualitiesInCategory(ChordCategory::ExtendedChords).size(), 8u);
  EXPECT_EQ(qualitiesInCategory(ChordCategory::AddedTones).size(), 2u);
  EXPECT_STREQ(chordQualityDisplayName(ChordQuality::Dominant7), "Dominant 7th");
  EXPECT_STREQ(chordCategoryDisplayName(ChordCategory::SeventhChords), "7th Chords");
}

}  // namespace
}  // namespace chordlab
