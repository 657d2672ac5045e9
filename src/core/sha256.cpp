#include "takoa/core/sha256.h"

#include <array>
#include <cstdint>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <vector>

namespace takoa::core {

namespace {

using Word = std::uint32_t;
using State = std::array<Word, 8>;

// FIPS 180-4 §5.3.3 initial hash value.
constexpr State kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

// FIPS 180-4 §4.2.2 round constants.
constexpr std::array<Word, 64> kRound = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u,
    0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu,
    0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu,
    0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u,
    0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u,
    0xc67178f2u,
};

constexpr Word rotr(const Word x, const unsigned n) noexcept {
  return (x >> n) | (x << (32u - n));
}

Word load_be32(const std::uint8_t* p) noexcept {
  return (static_cast<Word>(p[0]) << 24u) | (static_cast<Word>(p[1]) << 16u) |
         (static_cast<Word>(p[2]) << 8u) | static_cast<Word>(p[3]);
}

void compress(State& state, const std::uint8_t* block) noexcept {
  std::array<Word, 64> w{};
  for (unsigned i = 0; i < 16u; ++i) {
    w[i] = load_be32(block + i * 4u);
  }
  for (unsigned i = 16u; i < 64u; ++i) {
    const Word s0 = rotr(w[i - 15u], 7u) ^ rotr(w[i - 15u], 18u) ^ (w[i - 15u] >> 3u);
    const Word s1 = rotr(w[i - 2u], 17u) ^ rotr(w[i - 2u], 19u) ^ (w[i - 2u] >> 10u);
    w[i] = w[i - 16u] + s0 + w[i - 7u] + s1;
  }

  // v = {a, b, c, d, e, f, g, h}
  State v = state;
  for (unsigned i = 0; i < 64u; ++i) {
    const Word big_s1 = rotr(v[4], 6u) ^ rotr(v[4], 11u) ^ rotr(v[4], 25u);
    const Word choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
    const Word t1 = v[7] + big_s1 + choose + kRound[i] + w[i];
    const Word big_s0 = rotr(v[0], 2u) ^ rotr(v[0], 13u) ^ rotr(v[0], 22u);
    const Word majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    const Word t2 = big_s0 + majority;

    for (unsigned j = 7u; j > 0u; --j) {
      v[j] = v[j - 1u];
    }
    v[4] += t1;
    v[0] = t1 + t2;
  }

  for (unsigned i = 0; i < 8u; ++i) {
    state[i] += v[i];
  }
}

}  // namespace

std::string sha256_hex(std::string_view input) {
  // Pad to a multiple of 64 bytes: message, 0x80, zeroes, 64-bit big-endian bit length.
  const std::uint64_t bit_len = static_cast<std::uint64_t>(input.size()) * 8u;
  const std::size_t padded_size = ((input.size() + 9u + 63u) / 64u) * 64u;

  std::vector<std::uint8_t> msg(padded_size, 0u);
  if (!input.empty()) {
    std::memcpy(msg.data(), input.data(), input.size());
  }
  msg[input.size()] = 0x80u;
  for (unsigned i = 0; i < 8u; ++i) {
    msg[padded_size - 1u - i] = static_cast<std::uint8_t>(bit_len >> (i * 8u));
  }

  State state = kInitialState;
  for (std::size_t offset = 0; offset < padded_size; offset += 64u) {
    compress(state, msg.data() + offset);
  }

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (const Word word : state) {
    oss << std::setw(8) << word;
  }
  return oss.str();
}

}  // namespace takoa::core
