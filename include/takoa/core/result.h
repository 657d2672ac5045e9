#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace takoa::core {

// Error kinds surfaced by the engine. Degenerate inputs (zero vectors, too few
// points to project) are not errors: they are handled locally and flagged on the
// result types instead.
enum class ErrorKind {
  kValidation,  // mismatched vector lengths, out-of-range confidence, bad config
  kNotFound,    // unknown person id
};

struct EngineError {
  ErrorKind kind{ErrorKind::kValidation};  // NOLINT(readability-identifier-naming)
  std::string message;                     // NOLINT(readability-identifier-naming)
};

inline EngineError validation_error(std::string message) {
  return EngineError{ErrorKind::kValidation, std::move(message)};
}

inline EngineError not_found_error(std::string message) {
  return EngineError{ErrorKind::kNotFound, std::move(message)};
}

inline const char* to_string(const ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kNotFound:
      return "not_found";
  }
  return "unknown";
}

// Result<T, E> follows C++ Core Guidelines E.27: systematic error handling without exceptions.
// This type encodes success (T) or failure (E) explicitly, preventing ignored errors.
// Usage: return Result<Value, ErrorType>::ok(val) or Result<Value, ErrorType>::err(error).
// The has_value() check makes error handling mandatory and visible at call sites.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
  static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

  [[nodiscard]] bool has_value() const { return data_.index() == 0; }
  [[nodiscard]] const T& value() const { return std::get<0>(data_); }
  [[nodiscard]] T& value() { return std::get<0>(data_); }
  [[nodiscard]] const E& error() const { return std::get<1>(data_); }

 private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

  std::variant<T, E> data_;
};

}  // namespace takoa::core
