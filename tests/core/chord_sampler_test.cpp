/**
 * @file chord_sampler_test.cpp
 * @brief Tests for filtered chord enumeration, sampling and caching.
 */

#include "core/chord_sampler.h"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace chordlab {
namespace {

ChordFilter cMajorTriadsFilter() {
  ChordFilter filter;
  filter.allowed_qualities = {ChordQuality::Major, ChordQuality::Minor};
  filter.key_filter = KeyFilter{PitchClass::C, ScaleType::Major};
  return filter;
}

// ============================================================================
// Enumeration
// ============================================================================

TEST(ChordSamplerTest, DefaultFilterEnumeratesMajorAndMinorOnEveryRoot) {
  auto chords = enumerateChords(ChordFilter{});
  EXPECT_EQ(chords.size(), 24u);
  for (const auto& chord : chords) {
    EXPECT_EQ(chord.inversion, 0);
    EXPECT_EQ(rootPositionOctave(chord), 4);
  }
}

TEST(ChordSamplerTest, KeyFilterKeepsDiatonicTriads) {
  auto chords = enumerateChords(cMajorTriadsFilter());
  std::set<std::string> names;
  for (const auto& chord : chords) names.insert(chord.display_name);
  EXPECT_EQ(names, (std::set<std::string>{"C", "Dm", "Em", "F", "G", "Am"}));
}

TEST(ChordSamplerTest, InversionsMultiplyCandidates) {
  ChordFilter filter;
  filter.allowed_qualities = {ChordQuality::Dominant7};
  filter.allowed_roots = std::vector<PitchClass>{PitchClass::G};
  filter.allowed_octaves = {3, 4};
  filter.include_inversions = true;
  EXPECT_EQ(enumerateChords(filter).size(), 8u);

  filter.include_inversions = false;
  EXPECT_EQ(enumerateChords(filter).size(), 2u);
}

TEST(ChordSamplerTest, BuilderFailuresAreDropped) {
  ChordFilter filter;
  filter.allowed_qualities = {ChordQuality::Major};
  filter.allowed_roots = std::vector<PitchClass>{PitchClass::C};
  filter.allowed_octaves = {8};
  filter.include_inversions = true;
  // C8 E8 G8 fits; both inversions overflow octave 8.
  auto chords = enumerateChords(filter);
  ASSERT_EQ(chords.size(), 1u);
  EXPECT_EQ(chords[0].inversion, 0);
}

TEST(ChordSamplerTest, DuplicateFilterEntriesDoNotSkewCandidates) {
  ChordFilter filter;
  filter.allowed_qualities = {ChordQuality::Major, ChordQuality::Major};
  filter.allowed_roots = std::vector<PitchClass>{PitchClass::C, PitchClass::C, PitchClass::D};
  filter.allowed_octaves = {4, 4};
  EXPECT_EQ(enumerateChords(filter).size(), 2u);
}

// ============================================================================
// Sampling
// ============================================================================

TEST(ChordSamplerTest, SamplesSatisfyFilter) {
  ChordSampler sampler;
  std::mt19937 rng(42);
  for (const auto& preset : getChordFilterPresets()) {
    for (int i = 0; i < 200; ++i) {
      auto result = sampler.sampleRandom(preset.filter, rng);
      ASSERT_TRUE(result.ok()) << preset.key;
      EXPECT_TRUE(chordMatchesFilter(result.chord, preset.filter))
          << preset.key << ": " << result.chord.display_name;
      EXPECT_TRUE(isValidChord(result.chord)) << result.chord.display_name;
    }
  }
}

TEST(ChordSamplerTest, SamplingCoversCandidates) {
  ChordSampler sampler;
  std::mt19937 rng(7);
  std::set<std::string> seen;
  for (int i = 0; i < 500; ++i) {
    auto result = sampler.sampleRandom(cMajorTriadsFilter(), rng);
    ASSERT_TRUE(result.ok());
    seen.insert(result.chord.display_name);
  }
  EXPECT_EQ(seen.size(), 6u);
}

TEST(ChordSamplerTest, SameSeedSameSequence) {
  ChordSampler a;
  ChordSampler b;
  std::mt19937 rng_a(1234);
  std::mt19937 rng_b(1234);
  ChordFilter filter;
  filter.include_inversions = true;
  for (int i = 0; i < 50; ++i) {
    EXPECT_EQ(a.sampleRandom(filter, rng_a).chord, b.sampleRandom(filter, rng_b).chord);
  }
}

TEST(ChordSamplerTest, EmptyCandidateSetReportsNoValidChords) {
  ChordSampler sampler;
  std::mt19937 rng(1);

  ChordFilter too_high;
  too_high.allowed_qualities = {ChordQuality::Dominant13};
  too_high.allowed_octaves = {8};
  auto result = sampler.sampleRandom(too_high, rng);
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.error, ChordError::NoValidChords);

  ChordFilter not_diatonic;
  not_diatonic.allowed_qualities = {ChordQuality::Augmented};
  not_diatonic.key_filter = KeyFilter{PitchClass::C, ScaleType::Major};
  EXPECT_EQ(sampler.sampleRandom(not_diatonic, rng).error, ChordError::NoValidChords);
}

// ============================================================================
// Cache
// ============================================================================

TEST(ChordSamplerTest, CacheKeyIgnoresOrderAndDuplicates) {
  ChordFilter a;
  a.allowed_qualities = {ChordQuality::Minor, ChordQuality::Major};
  a.allowed_octaves = {4, 3};
  a.allowed_roots = std::vector<PitchClass>{PitchClass::G, PitchClass::C};

  ChordFilter b;
  b.allowed_qualities = {ChordQuality::Major, ChordQuality::Minor, ChordQuality::Major};
  b.allowed_octaves = {3, 4};
  b.allowed_roots = std::vector<PitchClass>{PitchClass::C, PitchClass::G};

  EXPECT_EQ(chordFilterCacheKey(a), chordFilterCacheKey(b));
  EXPECT_EQ(chordFilterCacheKey(a), "q=major,minor;r=C,G;o=3,4;i=0;k=-");
}

TEST(ChordSamplerTest, WildcardRootsDifferFromExplicitTwelve) {
  ChordFilter wildcard;
  ChordFilter explicit_roots;
  explicit_roots.allowed_roots =
      std::vector<PitchClass>(kAllPitchClasses.begin(), kAllPitchClasses.end());

  EXPECT_NE(chordFilterCacheKey(wildcard), chordFilterCacheKey(explicit_roots));
  EXPECT_EQ(chordFilterCacheKey(wildcard), "q=major,minor;r=*;o=4;i=0;k=-");
  EXPECT_EQ(enumerateChords(wildcard).size(), enumerateChords(explicit_roots).size());
}

TEST(ChordSamplerTest, CacheKeyEncodesInversionsAndKey) {
  ChordFilter filter;
  filter.include_inversions = true;
  filter.key_filter = KeyFilter{PitchClass::A, ScaleType::Minor};
  EXPECT_EQ(chordFilterCacheKey(filter), "q=major,minor;r=*;o=4;i=1;k=A:minor");
}

TEST(ChordSamplerTest, CandidatesAreCachedPerFilter) {
  ChordSampler sampler;
  EXPECT_EQ(sampler.cacheSize(), 0u);
  EXPECT_FALSE(sampler.isCached(ChordFilter{}));

  auto first = sampler.candidates(ChordFilter{});
  auto second = sampler.candidates(ChordFilter{});
  EXPECT_EQ(first.get(), second.get());
  EXPECT_EQ(sampler.cacheSize(), 1u);
  EXPECT_TRUE(sampler.isCached(ChordFilter{}));

  sampler.candidates(cMajorTriadsFilter());
  EXPECT_EQ(sampler.cacheSize(), 2u);
}

TEST(ChordSamplerTest, ClearCacheKeepsOutstandingSnapshots) {
  ChordSampler sampler;
  auto snapshot = sampler.candidates(ChordFilter{});
  sampler.clearCache();
  EXPECT_EQ(sampler.cacheSize(), 0u);
  EXPECT_EQ(snapshot->size(), 24u);

  auto fresh = sampler.candidates(ChordFilter{});
  EXPECT_NE(fresh.get(), snapshot.get());
  EXPECT_EQ(*fresh, *snapshot);
}

TEST(ChordSamplerTest, IndependentSamplersHaveIndependentCaches) {
  ChordSampler a;
  ChordSampler b;
  a.candidates(ChordFilter{});
  EXPECT_EQ(a.cacheSize(), 1u);
  EXPECT_EQ(b.cacheSize(), 0u);
}

TEST(ChordSamplerTest, ConcurrentSamplingSharesOneList) {
  ChordSampler sampler;
  const auto& presets = getChordFilterPresets();
  std::atomic<int> failures{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t]() {
      std::mt19937 rng(static_cast<uint32_t>(t + 1));
      for (int i = 0; i < 100; ++i) {
        const ChordFilter& filter = presets[static_cast<size_t>(i) % presets.size()].filter;
        auto result = sampler.sampleRandom(filter, rng);
        if (!result.ok() || !chordMatchesFilter(result.chord, filter)) ++failures;
        if (i == 50 && t == 0) sampler.clearCache();
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_LE(sampler.cacheSize(), presets.size());
}

}  // namespace
}  // namespace chordlab
