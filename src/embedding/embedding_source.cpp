#include "takoa/embedding/embedding_source.h"

#include "takoa/core/normalization.h"

namespace takoa::embedding {

EmbeddingSource::EmbeddingSource(const IEmbeddingProvider* primary,
                                 const IEmbeddingProvider& fallback,
                                 const std::size_t cache_capacity)
    : primary_(primary), fallback_(fallback), cache_capacity_(cache_capacity) {}

std::optional<vector::Vector> EmbeddingSource::cache_lookup(const std::string& key) {
  const auto it = cache_.find(key);
  if (it == cache_.end()) {
    return std::nullopt;
  }
  recency_.splice(recency_.begin(), recency_, it->second.recency);
  return it->second.vector;
}

void EmbeddingSource::cache_store(const std::string& key, const vector::Vector& vec) {
  if (cache_capacity_ == 0) {
    return;
  }
  const auto it = cache_.find(key);
  if (it != cache_.end()) {
    // Another thread stored it while the provider was running.
    recency_.splice(recency_.begin(), recency_, it->second.recency);
    return;
  }
  while (cache_.size() >= cache_capacity_) {
    cache_.erase(recency_.back());
    recency_.pop_back();
  }
  recency_.push_front(key);
  cache_.emplace(key, CacheEntry{vec, recency_.begin()});
}

EmbeddingOutcome EmbeddingSource::embed(std::string_view text) {
  const std::string key = core::normalize_ascii_lower(core::trim(text));
  if (key.empty()) {
    return EmbeddingOutcome{vector::Vector(dimension(), 0.0f), false};
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto cached = cache_lookup(key); cached.has_value()) {
      return EmbeddingOutcome{std::move(cached.value()), false};
    }
  }

  if (primary_ != nullptr) {
    auto result = primary_->embed_text(key);
    if (result.has_value() && result.value().size() == dimension()) {
      std::lock_guard<std::mutex> lock(mutex_);
      cache_store(key, result.value());
      return EmbeddingOutcome{result.value(), false};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_error_ = result.has_value() ? "primary provider returned " +
                                           std::to_string(result.value().size()) +
                                           " components, expected " + std::to_string(dimension())
                                     : result.error();
  }

  auto fallback = fallback_.embed_text(key);
  vector::Vector vec =
      fallback.has_value() ? fallback.value() : vector::Vector(dimension(), 0.0f);

  if (primary_ == nullptr) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_store(key, vec);
    return EmbeddingOutcome{std::move(vec), false};
  }
  return EmbeddingOutcome{std::move(vec), true};
}

std::size_t EmbeddingSource::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cache_.size();
}

std::string EmbeddingSource::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

}  // namespace takoa::embedding
