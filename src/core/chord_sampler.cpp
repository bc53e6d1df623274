#include "core/chord_sampler.h"

#include <algorithm>
#include <utility>

#include "core/pitch_utils.h"
#include "core/rng_util.h"

// Debug flag for sampler cache logging (set to 1 to enable)
#ifndef CHORDLAB_SAMPLER_DEBUG_LOG
#define CHORDLAB_SAMPLER_DEBUG_LOG 0
#endif

#if CHORDLAB_SAMPLER_DEBUG_LOG
#include <iostream>
#endif

namespace chordlab {

namespace {

template <typename T>
std::vector<T> sortedUnique(std::vector<T> values) {
  std::sort(values.begin(), values.end());
  values.erase(std::unique(values.begin(), values.end()), values.end());
  return values;
}

bool allTonesInKey(PitchClass root, ChordQuality quality, const KeyFilter& key) {
  ChordFormula formula = getChordFormula(quality);
  for (uint8_t i = 0; i < formula.note_count; ++i) {
    if (!isInScale(transpose(root, formula.intervals[i]), key.tonic, key.scale)) return false;
  }
  return true;
}

}  // namespace

std::string chordFilterCacheKey(const ChordFilter& filter) {
  std::string key = "q=";
  bool first = true;
  for (ChordQuality quality : sortedUnique(filter.allowed_qualities)) {
    if (!first) key += ',';
    key += chordQualityId(quality);
    first = false;
  }

  key += ";r=";
  if (!filter.allowed_roots) {
    key += '*';
  } else {
    first = true;
    for (PitchClass root : sortedUnique(*filter.allowed_roots)) {
      if (!first) key += ',';
      key += pitchClassName(root);
      first = false;
    }
  }

  key += ";o=";
  first = true;
  for (int octave : sortedUnique(filter.allowed_octaves)) {
    if (!first) key += ',';
    key += std::to_string(octave);
    first = false;
  }

  key += filter.include_inversions ? ";i=1" : ";i=0";

  key += ";k=";
  if (filter.key_filter) {
    key += pitchClassName(filter.key_filter->tonic);
    key += ':';
    key += scaleTypeName(filter.key_filter->scale);
  } else {
    key += '-';
  }
  return key;
}

std::vector<Chord> enumerateChords(const ChordFilter& filter) {
  std::vector<Chord> result;

  const std::vector<ChordQuality> qualities = sortedUnique(filter.allowed_qualities);
  const std::vector<PitchClass> roots = sortedUnique(filter.effectiveRoots());
  const std::vector<int> octaves = sortedUnique(filter.allowed_octaves);

  for (ChordQuality quality : qualities) {
    const int inversion_count = filter.include_inversions ? formulaLength(quality) : 1;
    for (PitchClass root : roots) {
      if (filter.key_filter && !allTonesInKey(root, quality, *filter.key_filter)) continue;
      for (int octave : octaves) {
        for (int inversion = 0; inversion < inversion_count; ++inversion) {
          ChordBuildResult built = buildChord(root, quality, octave, inversion);
          if (built.ok()) result.push_back(std::move(built.chord));
        }
      }
    }
  }
  return result;
}

std::shared_ptr<const std::vector<Chord>> ChordSampler::candidates(const ChordFilter& filter) {
  const std::string key = chordFilterCacheKey(filter);

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = cache_.find(key);
  if (it != cache_.end()) return it->second;

  auto list = std::make_shared<const std::vector<Chord>>(enumerateChords(filter));
#if CHORDLAB_SAMPLER_DEBUG_LOG
  std::cerr << "[sampler] cache miss " << key << " -> " << list->size() << " chords\n";
#endif
  cache_.emplace(key, list);
  return list;
}

ChordSampleResult ChordSampler::sampleRandom(const ChordFilter& filter, std::mt19937& rng) {
  ChordSampleResult result;
  std::shared_ptr<const std::vector<Chord>> list = candidates(filter);
  if (list->empty()) {
    result.error = ChordError::NoValidChords;
    return result;
  }
  result.chord = rng_util::selectRandom(rng, *list);
  return result;
}

void ChordSampler::clearCache() {
  std::lock_guard<std::mutex> lock(mutex_);
  cache_.clear();
}

size_t ChordSampler::cacheSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

bool ChordSampler::isCached(const ChordFilter& filter) const {
  const std::string key = chordFilterCacheKey(filter);
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.find(key) != cache_.end();
}

}  // namespace chordlab
