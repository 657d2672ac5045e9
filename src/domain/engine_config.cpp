#include "takoa/domain/engine_config.h"

#include <nlohmann/json.hpp>

#include <cmath>

namespace takoa::domain {

namespace {

bool in_unit_interval(const double v) {
  return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

bool positive(const double v) {
  return std::isfinite(v) && v > 0.0;
}

}  // namespace

core::Result<bool, core::EngineError> validate(const EngineConfig& config) {
  using R = core::Result<bool, core::EngineError>;

  if (config.semantic_dim == 0) {
    return R::err(core::validation_error("semantic_dim must be > 0"));
  }
  // Neither block may be starved to zero influence.
  if (!positive(config.trait_weight) || !positive(config.semantic_weight)) {
    return R::err(core::validation_error("trait_weight and semantic_weight must both be > 0"));
  }
  if (!in_unit_interval(config.semantic_blend) || !in_unit_interval(config.vector_blend)) {
    return R::err(core::validation_error("semantic_blend and vector_blend must be in [0,1]"));
  }
  if (!in_unit_interval(config.trait_step) || !in_unit_interval(config.confidence_gain)) {
    return R::err(core::validation_error("trait_step and confidence_gain must be in [0,1]"));
  }
  if (!std::isfinite(config.interest_bonus) || config.interest_bonus < 0.0) {
    return R::err(core::validation_error("interest_bonus must be >= 0"));
  }
  if (config.explain_top_n == 0) {
    return R::err(core::validation_error("explain_top_n must be > 0"));
  }
  if (!positive(config.dbscan_epsilon) || config.dbscan_min_points == 0) {
    return R::err(core::validation_error("dbscan_epsilon must be > 0 and dbscan_min_points >= 1"));
  }
  if (config.projection_neighbors < 2) {
    return R::err(core::validation_error("projection_neighbors must be >= 2"));
  }
  if (!positive(config.projection_spread) || !std::isfinite(config.projection_min_dist) ||
      config.projection_min_dist < 0.0 || config.projection_min_dist > config.projection_spread) {
    return R::err(
        core::validation_error("projection_min_dist must be in [0, projection_spread]"));
  }
  if (config.projection_epochs == 0) {
    return R::err(core::validation_error("projection_epochs must be > 0"));
  }

  return R::ok(true);
}

std::string to_json(const EngineConfig& config) {
  // nlohmann::json objects are std::map-backed, so keys serialize alphabetically.
  nlohmann::json j;
  j["confidence_gain"] = config.confidence_gain;
  j["dbscan_epsilon"] = config.dbscan_epsilon;
  j["dbscan_min_points"] = config.dbscan_min_points;
  j["explain_top_n"] = config.explain_top_n;
  j["interest_bonus"] = config.interest_bonus;
  j["projection_epochs"] = config.projection_epochs;
  j["projection_min_dist"] = config.projection_min_dist;
  j["projection_neighbors"] = config.projection_neighbors;
  j["projection_seed"] = config.projection_seed;
  j["projection_spread"] = config.projection_spread;
  j["semantic_blend"] = config.semantic_blend;
  j["semantic_dim"] = config.semantic_dim;
  j["semantic_weight"] = config.semantic_weight;
  j["trait_step"] = config.trait_step;
  j["trait_weight"] = config.trait_weight;
  j["vector_blend"] = config.vector_blend;
  return j.dump();
}

core::Result<EngineConfig, core::EngineError> engine_config_from_json(const std::string& json_str) {
  using R = core::Result<EngineConfig, core::EngineError>;

  EngineConfig config;
  try {
    const nlohmann::json j = nlohmann::json::parse(json_str);
    if (!j.is_object()) {
      return R::err(core::validation_error("engine config must be a JSON object"));
    }

    config.confidence_gain = j.value("confidence_gain", config.confidence_gain);
    config.dbscan_epsilon = j.value("dbscan_epsilon", config.dbscan_epsilon);
    config.dbscan_min_points = j.value("dbscan_min_points", config.dbscan_min_points);
    config.explain_top_n = j.value("explain_top_n", config.explain_top_n);
    config.interest_bonus = j.value("interest_bonus", config.interest_bonus);
    config.projection_epochs = j.value("projection_epochs", config.projection_epochs);
    config.projection_min_dist = j.value("projection_min_dist", config.projection_min_dist);
    config.projection_neighbors = j.value("projection_neighbors", config.projection_neighbors);
    config.projection_seed = j.value("projection_seed", config.projection_seed);
    config.projection_spread = j.value("projection_spread", config.projection_spread);
    config.semantic_blend = j.value("semantic_blend", config.semantic_blend);
    config.semantic_dim = j.value("semantic_dim", config.semantic_dim);
    config.semantic_weight = j.value("semantic_weight", config.semantic_weight);
    config.trait_step = j.value("trait_step", config.trait_step);
    config.trait_weight = j.value("trait_weight", config.trait_weight);
    config.vector_blend = j.value("vector_blend", config.vector_blend);
  } catch (const nlohmann::json::exception& e) {
    return R::err(core::validation_error(std::string("invalid engine config: ") + e.what()));
  }

  return R::ok(config);
}

}  // namespace takoa::domain
