#include "takoa/profile/semantic_memory.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace takoa;
using Catch::Matchers::WithinAbs;

TEST_CASE("seed_from_interests averages tag embeddings", "[profile][semantic]") {
  const embedding::HashEmbeddingProvider provider;
  embedding::EmbeddingSource source(nullptr, provider);

  const auto seeded = profile::seed_from_interests({"chess", "hiking"}, source);
  CHECK_FALSE(seeded.used_fallback);
  REQUIRE(seeded.memory.size() == 16);
  CHECK_THAT(vector::l2_norm(seeded.memory), WithinAbs(1.0, 1e-5));

  const auto chess = provider.embed_text("chess").value();
  CHECK(vector::cosine(seeded.memory, chess).value() > 0.0);
}

TEST_CASE("seed_from_interests without tags is the zero vector", "[profile][semantic]") {
  const embedding::HashEmbeddingProvider provider;
  embedding::EmbeddingSource source(nullptr, provider);

  const auto seeded = profile::seed_from_interests({}, source);
  CHECK(seeded.memory.size() == 16);
  CHECK(vector::is_zero(seeded.memory));
}

TEST_CASE("update_semantic keeps a valid prior when there is no message", "[profile][semantic]") {
  const embedding::HashEmbeddingProvider provider;
  embedding::EmbeddingSource source(nullptr, provider);

  const auto prior = provider.embed_text("jazz").value();
  const auto out = profile::update_semantic(prior, {"chess"}, std::nullopt, source, 0.25);
  CHECK(out.memory == prior);
}

TEST_CASE("update_semantic reseeds a prior of the wrong dimension", "[profile][semantic]") {
  const embedding::HashEmbeddingProvider provider;
  embedding::EmbeddingSource source(nullptr, provider);

  const vector::Vector stale{1.0f, 0.0f, 0.0f};
  const auto out = profile::update_semantic(stale, {"chess"}, std::nullopt, source, 0.25);
  CHECK(out.memory == profile::seed_from_interests({"chess"}, source).memory);
}

TEST_CASE("update_semantic moves toward the message by a bounded step", "[profile][semantic]") {
  const embedding::HashEmbeddingProvider provider;
  embedding::EmbeddingSource source(nullptr, provider);

  const auto prior = provider.embed_text("quantum physics lectures").value();
  const auto message = provider.embed_text("weekend surfing trips").value();
  const double before = vector::cosine(prior, message).value();

  const auto out = profile::update_semantic(prior, {}, "weekend surfing trips", source, 0.25);
  const double toward = vector::cosine(out.memory, message).value();
  const double kept = vector::cosine(out.memory, prior).value();

  CHECK(toward > before);
  // A single message must not replace the memory.
  CHECK(kept > toward);
  CHECK_THAT(vector::l2_norm(out.memory), WithinAbs(1.0, 1e-5));
}

TEST_CASE("update_semantic ignores a message without tokens", "[profile][semantic]") {
  const embedding::HashEmbeddingProvider provider;
  embedding::EmbeddingSource source(nullptr, provider);

  const auto prior = provider.embed_text("jazz").value();
  const auto out = profile::update_semantic(prior, {}, "!!!", source, 0.25);
  CHECK(out.memory == prior);
}
