#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace takoa::core {

inline constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
inline constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

// FNV-1a 64-bit over the raw bytes. Identical on every platform and run, which
// keeps hash embeddings stable across restarts. Not for integrity (see sha256.h).
[[nodiscard]] std::uint64_t fnv1a64(std::string_view input);

// Slot in [0, buckets) for a token. buckets must be non-zero.
[[nodiscard]] std::size_t hash_bucket(std::string_view token, std::size_t buckets);

}  // namespace takoa::core
