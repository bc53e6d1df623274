/**
 * @file chord_sampler.h
 * @brief Filtered random chord selection with a per-filter candidate cache.
 */

#ifndef CHORDLAB_CORE_CHORD_SAMPLER_H
#define CHORDLAB_CORE_CHORD_SAMPLER_H

#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "core/chord_builder.h"
#include "core/chord_filter.h"

namespace chordlab {

/// @brief Result of ChordSampler::sampleRandom(). `chord` is meaningful only when ok().
struct ChordSampleResult {
  Chord chord;
  ChordError error = ChordError::OK;

  bool ok() const { return error == ChordError::OK; }
};

/**
 * @brief Cache key for a filter.
 *
 * Lists are sorted and de-duplicated so filters differing only in order
 * share a key. A wildcard root set encodes as "*", distinct from an
 * explicit list of all twelve roots.
 *
 * @param filter Chord filter
 * @return Key such as "q=major,minor;r=*;o=3,4;i=0;k=-"
 */
std::string chordFilterCacheKey(const ChordFilter& filter);

/**
 * @brief Enumerate every chord the filter allows.
 *
 * With a key filter, a (quality, root) pair is kept only if every formula
 * tone is diatonic. Each kept pair is built for every allowed octave and,
 * if enabled, every inversion; builder failures are dropped. Order is
 * deterministic (quality, root, octave, inversion).
 *
 * @param filter Chord filter
 * @return Candidate chords, possibly empty
 */
std::vector<Chord> enumerateChords(const ChordFilter& filter);

/**
 * @brief Uniform random chord selection over a filter's candidates.
 *
 * Candidate lists are cached per filter key until clearCache(). A missing
 * key is enumerated under the cache lock, so concurrent callers with the
 * same filter share one list; readers get an immutable snapshot.
 *
 * @code
 * ChordSampler sampler;
 * std::mt19937 rng(42);
 * ChordSampleResult r = sampler.sampleRandom(filter, rng);
 * if (!r.ok()) { ... r.error == ChordError::NoValidChords ... }
 * @endcode
 */
class ChordSampler {
 public:
  ChordSampler() = default;
  ChordSampler(const ChordSampler&) = delete;
  ChordSampler& operator=(const ChordSampler&) = delete;

  /**
   * @brief Draw one chord uniformly from the filter's candidates.
   * @param filter Chord filter
   * @param rng Caller-owned random engine
   * @return Chord, or NoValidChords when nothing matches
   */
  ChordSampleResult sampleRandom(const ChordFilter& filter, std::mt19937& rng);

  /// Cached (or freshly enumerated) candidate list for a filter.
  std::shared_ptr<const std::vector<Chord>> candidates(const ChordFilter& filter);

  /// Drop every cached candidate list.
  void clearCache();

  /// Number of cached filter keys.
  size_t cacheSize() const;

  /// True if the filter's key is currently cached.
  bool isCached(const ChordFilter& filter) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<const std::vector<Chord>>> cache_;
};

}  // namespace chordlab

#endif  // CHORDLAB_CORE_CHORD_SAMPLER_H
