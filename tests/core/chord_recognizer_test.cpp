/**
 * @file chord_recognizer_test.cpp
 * @brief Tests for identifyChord() and interval signatures.
 */

#include "core/chord_recognizer.h"

#include <gtest/gtest.h>

#include "test_support/test_helpers.h"

namespace chordlab {
namespace {

using test::note;
using test::notesString;

TEST(ChordRecognizerTest, CMajorFirstInversion) {
  auto chord = identifyChord({note(PitchClass::E, 4), note(PitchClass::G, 4),
                              note(PitchClass::C, 5)});
  ASSERT_TRUE(chord.has_value());
  EXPECT_EQ(chord->quality, ChordQuality::Major);
  EXPECT_EQ(chord->root, PitchClass::C);
  EXPECT_EQ(chord->inversion, 1);
  EXPECT_EQ(chord->display_name, "C/E");
}

TEST(ChordRecognizerTest, InputOrderDoesNotMatter) {
  auto chord = identifyChord({note(PitchClass::C, 5), note(PitchClass::E, 4),
                              note(PitchClass::G, 4)});
  ASSERT_TRUE(chord.has_value());
  EXPECT_EQ(chord->display_name, "C/E");
  EXPECT_EQ(notesString(chord->notes), "E4 G4 C5");
}

TEST(ChordRecognizerTest, MinorFirstInversion) {
  auto chord = identifyChord({note(PitchClass::C, 4), note(PitchClass::E, 4),
                              note(PitchClass::A, 4)});
  ASSERT_TRUE(chord.has_value());
  EXPECT_EQ(chord->quality, ChordQuality::Minor);
  EXPECT_EQ(chord->root, PitchClass::A);
  EXPECT_EQ(chord->inversion, 1);
  EXPECT_EQ(chord->display_name, "Am/C");
}

TEST(ChordRecognizerTest, DominantSeventhSecondInversion) {
  auto chord = identifyChord({note(PitchClass::D, 4), note(PitchClass::F, 4),
                              note(PitchClass::G, 4), note(PitchClass::B, 4)});
  ASSERT_TRUE(chord.has_value());
  EXPECT_EQ(chord->quality, ChordQuality::Dominant7);
  EXPECT_EQ(chord->root, PitchClass::G);
  EXPECT_EQ(chord->inversion, 2);
  EXPECT_EQ(chord->display_name, "G7/D");
}

// ============================================================================
// Priority order for ambiguous note sets
// ============================================================================

TEST(ChordRecognizerTest, RootPositionReadingWinsOverInvertedOne) {
  // C-D-G is Csus2; G-C-D is Gsus4 rather than Csus2 in 2nd inversion.
  auto csus2 = identifyChord({note(PitchClass::C, 4), note(PitchClass::D, 4),
                              note(PitchClass::G, 4)});
  ASSERT_TRUE(csus2.has_value());
  EXPECT_EQ(csus2->display_name, "Csus2");

  auto gsus4 = identifyChord({note(PitchClass::G, 3), note(PitchClass::C, 4),
                              note(PitchClass::D, 4)});
  ASSERT_TRUE(gsus4.has_value());
  EXPECT_EQ(gsus4->quality, ChordQuality::Sus4);
  EXPECT_EQ(gsus4->root, PitchClass::G);
  EXPECT_EQ(gsus4->inversion, 0);
}

TEST(ChordRecognizerTest, SymmetricChordsAreNamedFromTheBass) {
  auto aug = identifyChord({note(PitchClass::E, 4), note(PitchClass::Gs, 4),
                            note(PitchClass::C, 5)});
  ASSERT_TRUE(aug.has_value());
  EXPECT_EQ(aug->display_name, "Eaug");
  EXPECT_EQ(aug->inversion, 0);

  auto dim7 = identifyChord({note(PitchClass::Ds, 4), note(PitchClass::Fs, 4),
                             note(PitchClass::A, 4), note(PitchClass::C, 5)});
  ASSERT_TRUE(dim7.has_value());
  EXPECT_EQ(dim7->display_name, "D#dim7");
}

// ============================================================================
// No match
// ============================================================================

TEST(ChordRecognizerTest, EmptyInput) { EXPECT_FALSE(identifyChord({}).has_value()); }

TEST(ChordRecognizerTest, UnmatchedSets) {
  EXPECT_FALSE(identifyChord({note(PitchClass::C, 4)}).has_value());
  EXPECT_FALSE(identifyChord({note(PitchClass::C, 4), note(PitchClass::G, 4)}).has_value());
  EXPECT_FALSE(identifyChord({note(PitchClass::C, 4), note(PitchClass::Cs, 4),
                              note(PitchClass::D, 4)})
                   .has_value());
  // Doubled root makes the multiset one note too long for a triad.
  EXPECT_FALSE(identifyChord({note(PitchClass::C, 4), note(PitchClass::E, 4),
                              note(PitchClass::G, 4), note(PitchClass::C, 5)})
                   .has_value());
}

// ============================================================================
// Round trips against the builder
// ============================================================================

TEST(ChordRecognizerTest, RecognizesEveryRootPositionChord) {
  for (ChordQuality q : kAllChordQualities) {
    for (PitchClass root : kAllPitchClasses) {
      for (int octave = kMinOctave; octave <= kMaxOctave; ++octave) {
        auto built = buildChord(root, q, octave, 0);
        if (!built.ok()) continue;
        auto recognized = identifyChord(built.chord.notes);
        ASSERT_TRUE(recognized.has_value()) << built.chord.display_name;
        EXPECT_EQ(*recognized, built.chord)
            << built.chord.display_name << " recognized as " << recognized->display_name;
      }
    }
  }
}

TEST(ChordRecognizerTest, RecognizesInversionsOfUnambiguousQualities) {
  const ChordQuality qualities[] = {ChordQuality::Major,          ChordQuality::Minor,
                                    ChordQuality::Diminished,     ChordQuality::Major7,
                                    ChordQuality::Minor7,         ChordQuality::Dominant7,
                                    ChordQuality::HalfDiminished7};
  for (ChordQuality q : qualities) {
    for (PitchClass root : kAllPitchClasses) {
      for (int inv = 1; inv < formulaLength(q); ++inv) {
        auto built = buildChord(root, q, 3, inv);
        ASSERT_TRUE(built.ok());
        auto recognized = identifyChord(built.chord.notes);
        ASSERT_TRUE(recognized.has_value()) << built.chord.display_name;
        EXPECT_EQ(*recognized, built.chord)
            << built.chord.display_name << " recognized as " << recognized->display_name;
      }
    }
  }
}

TEST(ChordRecognizerTest, InvertedVoicingKeepsNotesAndPitchClasses) {
  for (ChordQuality q : kAllChordQualities) {
    for (int inv = 0; inv < formulaLength(q); ++inv) {
      auto built = buildChord(PitchClass::D, q, 2, inv);
      ASSERT_TRUE(built.ok());
      auto recognized = identifyChord(built.chord.notes);
      ASSERT_TRUE(recognized.has_value()) << built.chord.display_name;
      EXPECT_EQ(recognized->notes, built.chord.notes);
      EXPECT_EQ(recognized->bass(), built.chord.bass());
      EXPECT_EQ(formulaLength(recognized->quality), formulaLength(q));
      EXPECT_TRUE(isValidChord(*recognized)) << recognized->display_name;
    }
  }
}

TEST(ChordRecognizerTest, IntervalSignature) {
  std::vector<PitchedNote> sorted = {note(PitchClass::E, 4), note(PitchClass::G, 4),
                                     note(PitchClass::C, 5)};
  EXPECT_EQ(intervalSignature(sorted, 0), (std::vector<int>{0, 3, 8}));
  EXPECT_EQ(intervalSignature(sorted, 2), (std::vector<int>{0, 4, 7}));
  EXPECT_TRUE(intervalSignature(sorted, 3).empty());
}

}  // namespace
}  // namespace chordlab
