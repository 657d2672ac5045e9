#pragma once

#include "takoa/embedding/embedding_provider.h"

#include <cstddef>
#include <functional>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace takoa::embedding {

inline constexpr std::size_t kDefaultEmbeddingCacheCapacity = 4096;

struct EmbeddingOutcome {
  vector::Vector vector;       // NOLINT(readability-identifier-naming)
  bool used_fallback{false};   // NOLINT(readability-identifier-naming)
};

// EmbeddingSource is the only path from text to vectors inside the engine.
//
// Strategy: ask the primary provider; if it fails or returns the wrong dimension,
// substitute the deterministic fallback so callers never fail on an embedding
// outage. Results are cached by lower-cased, trimmed text, keeping at most
// cache_capacity entries and evicting the least recently used one. Fallback
// vectors are not cached, so the primary is retried on the next request for
// that text.
// Empty text maps to the zero vector without calling any provider.
//
// Thread-safe. Provider calls happen outside the cache lock.
class EmbeddingSource {
 public:
  // primary may be nullptr, in which case the fallback is used directly and not
  // reported as a fallback. Both providers must outlive this object. A zero
  // cache_capacity disables caching.
  EmbeddingSource(const IEmbeddingProvider* primary, const IEmbeddingProvider& fallback,
                  std::size_t cache_capacity = kDefaultEmbeddingCacheCapacity);

  EmbeddingSource(const EmbeddingSource&) = delete;
  EmbeddingSource& operator=(const EmbeddingSource&) = delete;

  [[nodiscard]] EmbeddingOutcome embed(std::string_view text);

  [[nodiscard]] std::size_t dimension() const { return fallback_.dimension(); }
  [[nodiscard]] std::size_t cache_size() const;

  // Most recent primary failure, for diagnostics. Empty when none occurred.
  [[nodiscard]] std::string last_error() const;

 private:
  struct CacheEntry {
    vector::Vector vector;                          // NOLINT(readability-identifier-naming)
    std::list<std::string>::iterator recency;       // NOLINT(readability-identifier-naming)
  };

  // Callers hold mutex_.
  std::optional<vector::Vector> cache_lookup(const std::string& key);
  void cache_store(const std::string& key, const vector::Vector& vec);

  const IEmbeddingProvider* primary_;
  const IEmbeddingProvider& fallback_;
  std::size_t cache_capacity_;

  mutable std::mutex mutex_;
  std::map<std::string, CacheEntry, std::less<>> cache_;
  // Most recently used key first.
  std::list<std::string> recency_;
  std::string last_error_;
};

}  // namespace takoa::embedding
