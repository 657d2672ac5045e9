#include "takoa/core/hashing.h"

namespace takoa::core {

std::uint64_t fnv1a64(const std::string_view input) {
  std::uint64_t hash = kFnvOffsetBasis;
  for (const char ch : input) {
    hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(ch));
    hash *= kFnvPrime;
  }
  return hash;
}

std::size_t hash_bucket(const std::string_view token, const std::size_t buckets) {
  return static_cast<std::size_t>(fnv1a64(token) % buckets);
}

}  // namespace takoa::core
