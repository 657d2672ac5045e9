#include "takoa/matching/explainer.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace takoa::matching {

double agreement_contribution(const double a, const double b) {
  return (1.0 - std::abs(a - b)) * a * b;
}

core::Result<domain::MatchExplanation, core::EngineError> explain(
    const engine::StoreSnapshot& snapshot, const core::PersonId& a, const core::PersonId& b,
    const ExplainOptions& options) {
  using R = core::Result<domain::MatchExplanation, core::EngineError>;

  const auto* pa = snapshot.find(a);
  if (pa == nullptr) {
    return R::err(core::not_found_error("unknown person: " + a.value));
  }
  const auto* pb = snapshot.find(b);
  if (pb == nullptr) {
    return R::err(core::not_found_error("unknown person: " + b.value));
  }

  auto sim = vector::cosine(pa->profile_vector, pb->profile_vector);
  if (!sim.has_value()) {
    return R::err(sim.error());
  }

  domain::MatchExplanation out;
  out.a = a;
  out.b = b;
  out.similarity = sim.value();
  out.insufficient_data =
      vector::is_zero(pa->profile_vector) || vector::is_zero(pb->profile_vector);

  std::vector<domain::Contribution> pool;

  // Trait terms read the fused vector, so they reflect the same weighting as similarity.
  const std::size_t trait_dims =
      std::min({domain::kTraitCount, pa->profile_vector.size(), pb->profile_vector.size()});
  for (std::size_t i = 0; i < trait_dims; ++i) {
    pool.push_back(domain::Contribution{
        std::string(domain::trait_name(domain::kAllTraits[i])),
        agreement_contribution(pa->profile_vector[i], pb->profile_vector[i]),
        domain::ContributionSource::kTrait,
    });
  }

  if (pa->semantic_memory.has_value() && pb->semantic_memory.has_value()) {
    const auto& sa = pa->semantic_memory.value();
    const auto& sb = pb->semantic_memory.value();
    if (sa.size() != sb.size()) {
      return R::err(core::validation_error("semantic memory length mismatch"));
    }
    for (std::size_t i = 0; i < sa.size(); ++i) {
      pool.push_back(domain::Contribution{
          "interest_embedding_" + std::to_string(i + 1),
          agreement_contribution(sa[i], sb[i]),
          domain::ContributionSource::kSemantic,
      });
    }
  }

  const std::set<std::string> b_interests(pb->interests.begin(), pb->interests.end());
  for (const auto& tag : pa->interests) {
    if (b_interests.count(tag) > 0 &&
        std::find(out.shared_interest_tags.begin(), out.shared_interest_tags.end(), tag) ==
            out.shared_interest_tags.end()) {
      out.shared_interest_tags.push_back(tag);
      pool.push_back(domain::Contribution{
          "interest:" + tag,
          options.interest_bonus,
          domain::ContributionSource::kSharedInterest,
      });
    }
  }

  std::sort(pool.begin(), pool.end(),
            [](const domain::Contribution& x, const domain::Contribution& y) {
              if (x.value != y.value) {
                return x.value > y.value;
              }
              return x.label < y.label;
            });
  if (pool.size() > options.top_n) {
    pool.resize(options.top_n);
  }
  out.contributions = std::move(pool);

  return R::ok(std::move(out));
}

}  // namespace takoa::matching
