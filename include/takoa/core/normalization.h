#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace takoa::core {

// Deterministic ASCII-only normalization. Locale-independent and byte-stable
// across platforms: A-Z is lowered with explicit char math, everything else is
// passed through untouched.

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// normalize_interest_tag lowercases, trims and collapses inner whitespace runs to a
// single space, so "  Rock   Climbing " and "rock climbing" are the same interest.
inline std::string normalize_interest_tag(const std::string_view tag) {
  const std::string lowered = normalize_ascii_lower(trim(tag));

  std::string result;
  result.reserve(lowered.size());
  bool pending_space = false;
  for (const char ch : lowered) {
    if (is_ascii_space(ch)) {
      pending_space = true;
      continue;
    }
    if (pending_space && !result.empty()) {
      result.push_back(' ');
    }
    pending_space = false;
    result.push_back(ch);
  }
  return result;
}

// normalize_interest_tags normalizes each tag, drops empties, deduplicates and sorts.
inline std::vector<std::string> normalize_interest_tags(const std::vector<std::string>& tags) {
  std::vector<std::string> result;
  result.reserve(tags.size());
  for (const auto& tag : tags) {
    auto normalized = normalize_interest_tag(tag);
    if (!normalized.empty()) {
      result.push_back(std::move(normalized));
    }
  }

  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());
  return result;
}

// tokenize_ascii splits on non-alphanumeric bytes, lowercases, and drops tokens
// shorter than min_length. Tokens are returned in encounter order.
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 2) {
  std::vector<std::string> tokens;
  std::string current;

  const auto flush = [&]() {
    if (current.size() >= min_length) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (const char ch : input) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      current.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

}  // namespace takoa::core
