/**
 * @file basic_types_test.cpp
 * @brief Tests for PitchClass and PitchedNote in basic_types.h.
 */

#include "core/basic_types.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <vector>

namespace chordlab {
namespace {

// ============================================================================
// PitchClass
// ============================================================================

TEST(BasicTypesTest, TwelveDistinctPitchClasses) {
  std::set<int> indices;
  for (PitchClass pc : kAllPitchClasses) indices.insert(pitchClassIndex(pc));
  EXPECT_EQ(indices.size(), 12u);
  EXPECT_EQ(*indices.begin(), 0);
  EXPECT_EQ(*indices.rbegin(), 11);
}

TEST(BasicTypesTest, PitchClassNamesAreSharpSpelled) {
  EXPECT_STREQ(pitchClassName(PitchClass::C), "C");
  EXPECT_STREQ(pitchClassName(PitchClass::Cs), "C#");
  EXPECT_STREQ(pitchClassName(PitchClass::As), "A#");
  EXPECT_STREQ(pitchClassName(PitchClass::B), "B");
  EXPECT_STREQ(pitchClassName(static_cast<PitchClass>(12)), "?");
}

TEST(BasicTypesTest, PitchClassFromNameAcceptsCanonicalOnly) {
  EXPECT_EQ(pitchClassFromName("F#"), PitchClass::Fs);
  EXPECT_EQ(pitchClassFromName("G"), PitchClass::G);
  EXPECT_FALSE(pitchClassFromName("Gb").has_value());
  EXPECT_FALSE(pitchClassFromName("f#").has_value());
  EXPECT_FALSE(pitchClassFromName("").has_value());
}

TEST(BasicTypesTest, TransposeIsCyclic) {
  EXPECT_EQ(transpose(PitchClass::A, 3), PitchClass::C);
  EXPECT_EQ(transpose(PitchClass::C, -1), PitchClass::B);
  EXPECT_EQ(transpose(PitchClass::E, 12), PitchClass::E);
  EXPECT_EQ(transpose(PitchClass::E, -25), PitchClass::Ds);
  for (PitchClass pc : kAllPitchClasses) {
    EXPECT_EQ(transpose(transpose(pc, 7), -7), pc);
  }
}

TEST(BasicTypesTest, WhiteKeys) {
  int white = 0;
  for (PitchClass pc : kAllPitchClasses) {
    if (isWhiteKey(pc)) ++white;
  }
  EXPECT_EQ(white, 7);
  EXPECT_TRUE(isWhiteKey(PitchClass::E));
  EXPECT_FALSE(isWhiteKey(PitchClass::Gs));
}

// ============================================================================
// Octave
// ============================================================================

TEST(BasicTypesTest, OctaveRange) {
  EXPECT_FALSE(isValidOctave(0));
  EXPECT_TRUE(isValidOctave(1));
  EXPECT_TRUE(isValidOctave(8));
  EXPECT_FALSE(isValidOctave(9));
  EXPECT_FALSE(isValidOctave(-1));
}

// ============================================================================
// PitchedNote
// ============================================================================

TEST(BasicTypesTest, PitchedNoteOrderIsOctaveThenPitchClass) {
  PitchedNote b3{PitchClass::B, 3};
  PitchedNote c4{PitchClass::C, 4};
  PitchedNote e4{PitchClass::E, 4};

  EXPECT_LT(b3, c4);
  EXPECT_LT(c4, e4);
  EXPECT_GT(e4, b3);
  EXPECT_LE(c4, c4);
  EXPECT_GE(c4, c4);
}

TEST(BasicTypesTest, PitchedNoteEquality) {
  EXPECT_EQ((PitchedNote{PitchClass::Cs, 4}), (PitchedNote{PitchClass::Cs, 4}));
  EXPECT_NE((PitchedNote{PitchClass::Cs, 4}), (PitchedNote{PitchClass::Cs, 5}));
  EXPECT_NE((PitchedNote{PitchClass::Cs, 4}), (PitchedNote{PitchClass::D, 4}));
}

TEST(BasicTypesTest, PitchedNoteSortMatchesAbsoluteSemitone) {
  std::vector<PitchedNote> notes = {
      {PitchClass::G, 4}, {PitchClass::C, 5}, {PitchClass::E, 4}, {PitchClass::As, 2}};
  std::sort(notes.begin(), notes.end());
  for (size_t i = 1; i < notes.size(); ++i) {
    EXPECT_LT(notes[i - 1].absoluteSemitone(), notes[i].absoluteSemitone());
  }
  EXPECT_EQ(notes.front(), (PitchedNote{PitchClass::As, 2}));
}

TEST(BasicTypesTest, PitchedNoteToString) {
  EXPECT_EQ((PitchedNote{PitchClass::Cs, 4}).toString(), "C#4");
  EXPECT_EQ((PitchedNote{PitchClass::A, 1}).toString(), "A1");
}

TEST(BasicTypesTest, PitchedNoteValidity) {
  EXPECT_TRUE((PitchedNote{PitchClass::C, 1}).isValid());
  EXPECT_TRUE((PitchedNote{PitchClass::B, 8}).isValid());
  EXPECT_FALSE((PitchedNote{PitchClass::C, 0}).isValid());
  EXPECT_FALSE((PitchedNote{PitchClass::C, 9}).isValid());
}

}  // namespace
}  // namespace chordlab
