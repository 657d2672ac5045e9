#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>

namespace takoa::core {

// Source of person, trace and event ids.
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  // Contract: returned ID is non-empty and starts with "<prefix>-".
  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<random UUID v4>". Ids stay unique across processes, so records
// written by separate CLI runs into the same store never collide.
// Thread-safe.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator();
  explicit SystemIdGenerator(std::uint64_t seed);

  std::string next(std::string_view prefix) override;

 private:
  std::mutex mutex_;
  std::mt19937_64 rng_;
};

// "<prefix>-<n>" with a shared counter: the same sequence of next() calls
// yields the same ids.
class DeterministicIdGenerator final : public IIdGenerator {
 public:
  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> counter_{0};
};

// Lower-case RFC 4122 version 4 text form of 128 random bits; the version and
// variant bits are overwritten.
[[nodiscard]] std::string format_uuid_v4(std::uint64_t high, std::uint64_t low);

}  // namespace takoa::core
