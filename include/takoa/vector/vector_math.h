#pragma once

#include "takoa/core/result.h"

#include <vector>

namespace takoa::vector {

using Vector = std::vector<float>;

// Accumulation is done in double and stored back as float.

[[nodiscard]] double dot(const Vector& a, const Vector& b);
[[nodiscard]] double l2_norm(const Vector& v);

// True when every component is exactly zero (including the empty vector).
[[nodiscard]] bool is_zero(const Vector& v);

// Unit-length copy of v. A zero vector is returned unchanged.
[[nodiscard]] Vector normalize(const Vector& v);

// Component-wise base * (1 - factor) + update * factor, then normalized.
// An empty base yields the normalized update. Lengths must match otherwise.
[[nodiscard]] core::Result<Vector, core::EngineError> blend(const Vector& base,
                                                            const Vector& update, double factor);

[[nodiscard]] core::Result<double, core::EngineError> euclidean_distance(const Vector& a,
                                                                         const Vector& b);

// Cosine similarity in [-1,1].
// Mismatched lengths are a validation error. A zero-norm operand yields 0: a zero
// vector means "no data yet", which is not an error.
[[nodiscard]] core::Result<double, core::EngineError> cosine(const Vector& a, const Vector& b);

}  // namespace takoa::vector
