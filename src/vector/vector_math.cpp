#include "takoa/vector/vector_math.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace takoa::vector {

namespace {

core::EngineError length_mismatch(const Vector& a, const Vector& b) {
  return core::validation_error("vector length mismatch: " + std::to_string(a.size()) +
                                " vs " + std::to_string(b.size()));
}

}  // namespace

double dot(const Vector& a, const Vector& b) {
  const std::size_t n = std::min(a.size(), b.size());
  double acc = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    acc += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return acc;
}

double l2_norm(const Vector& v) {
  return std::sqrt(dot(v, v));
}

bool is_zero(const Vector& v) {
  return std::all_of(v.begin(), v.end(), [](const float x) { return x == 0.0f; });
}

Vector normalize(const Vector& v) {
  const double norm = l2_norm(v);
  if (norm == 0.0) {
    return v;
  }
  Vector out(v.size());
  for (std::size_t i = 0; i < v.size(); ++i) {
    out[i] = static_cast<float>(static_cast<double>(v[i]) / norm);
  }
  return out;
}

core::Result<Vector, core::EngineError> blend(const Vector& base, const Vector& update,
                                              const double factor) {
  using R = core::Result<Vector, core::EngineError>;
  if (base.empty()) {
    return R::ok(normalize(update));
  }
  if (base.size() != update.size()) {
    return R::err(length_mismatch(base, update));
  }

  Vector mixed(base.size());
  for (std::size_t i = 0; i < base.size(); ++i) {
    mixed[i] = static_cast<float>(static_cast<double>(base[i]) * (1.0 - factor) +
                                  static_cast<double>(update[i]) * factor);
  }
  return R::ok(normalize(mixed));
}

core::Result<double, core::EngineError> euclidean_distance(const Vector& a, const Vector& b) {
  using R = core::Result<double, core::EngineError>;
  if (a.size() != b.size()) {
    return R::err(length_mismatch(a, b));
  }
  double acc = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const double diff = static_cast<double>(a[i]) - static_cast<double>(b[i]);
    acc += diff * diff;
  }
  return R::ok(std::sqrt(acc));
}

core::Result<double, core::EngineError> cosine(const Vector& a, const Vector& b) {
  using R = core::Result<double, core::EngineError>;
  if (a.size() != b.size()) {
    return R::err(length_mismatch(a, b));
  }

  const double norm_a = l2_norm(a);
  const double norm_b = l2_norm(b);
  if (norm_a == 0.0 || norm_b == 0.0) {
    return R::ok(0.0);
  }

  const double sim = dot(a, b) / (norm_a * norm_b);
  return R::ok(std::clamp(sim, -1.0, 1.0));
}

}  // namespace takoa::vector
