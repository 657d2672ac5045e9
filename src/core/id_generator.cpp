#include "takoa/core/id_generator.h"

#include <iomanip>
#include <sstream>

namespace takoa::core {

std::string format_uuid_v4(std::uint64_t high, std::uint64_t low) {
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  oss << std::setw(8) << (high >> 32) << '-';
  oss << std::setw(4) << ((high >> 16) & 0xFFFF) << '-';
  oss << std::setw(4) << (high & 0xFFFF) << '-';
  oss << std::setw(4) << (low >> 48) << '-';
  oss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
  return oss.str();
}

SystemIdGenerator::SystemIdGenerator() {
  std::random_device rd;
  std::seed_seq seq{rd(), rd(), rd(), rd()};
  rng_.seed(seq);
}

SystemIdGenerator::SystemIdGenerator(const std::uint64_t seed) : rng_(seed) {}

std::string SystemIdGenerator::next(std::string_view prefix) {
  std::uint64_t high = 0;
  std::uint64_t low = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    high = rng_();
    low = rng_();
  }
  return std::string(prefix) + "-" + format_uuid_v4(high, low);
}

std::string DeterministicIdGenerator::next(std::string_view prefix) {
  const auto c = counter_.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + "-" + std::to_string(c);
}

}  // namespace takoa::core
