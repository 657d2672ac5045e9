#include "takoa/embedding/embedding_source.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>

using namespace takoa;

namespace {

// Counts calls and fails (or returns a wrong dimension) on demand.
class ScriptedProvider final : public embedding::IEmbeddingProvider {
 public:
  explicit ScriptedProvider(std::size_t dim) : dim_(dim) {}

  [[nodiscard]] core::Result<vector::Vector, std::string> embed_text(
      std::string_view /*text*/) const override {
    ++calls;
    if (fail) {
      return core::Result<vector::Vector, std::string>::err("service unavailable");
    }
    vector::Vector v(returned_dim == 0 ? dim_ : returned_dim, 0.0f);
    v[0] = 1.0f;
    return core::Result<vector::Vector, std::string>::ok(v);
  }
  [[nodiscard]] std::size_t dimension() const override { return dim_; }
  [[nodiscard]] std::string provider_id() const override { return "scripted"; }

  mutable std::atomic<int> calls{0};  // NOLINT(readability-identifier-naming)
  bool fail{false};                   // NOLINT(readability-identifier-naming)
  std::size_t returned_dim{0};        // NOLINT(readability-identifier-naming)

 private:
  std::size_t dim_;
};

}  // namespace

TEST_CASE("EmbeddingSource uses the primary and caches by normalized text", "[embedding][source]") {
  ScriptedProvider primary(16);
  const embedding::HashEmbeddingProvider fallback(16);
  embedding::EmbeddingSource source(&primary, fallback);

  const auto first = source.embed("Hiking");
  const auto second = source.embed("  hiking ");
  CHECK_FALSE(first.used_fallback);
  CHECK(first.vector == second.vector);
  CHECK(primary.calls == 1);
  CHECK(source.cache_size() == 1);
}

TEST_CASE("EmbeddingSource falls back when the primary fails", "[embedding][source]") {
  ScriptedProvider primary(16);
  primary.fail = true;
  const embedding::HashEmbeddingProvider fallback(16);
  embedding::EmbeddingSource source(&primary, fallback);

  const auto out = source.embed("chess");
  CHECK(out.used_fallback);
  CHECK(out.vector == fallback.embed_text("chess").value());
  CHECK(source.last_error() == "service unavailable");

  // Fallback results are not cached: the primary is asked again.
  CHECK(source.cache_size() == 0);
  primary.fail = false;
  const auto retry = source.embed("chess");
  CHECK_FALSE(retry.used_fallback);
  CHECK(primary.calls == 2);
}

TEST_CASE("EmbeddingSource treats a wrong dimension as a failure", "[embedding][source]") {
  ScriptedProvider primary(16);
  primary.returned_dim = 4;
  const embedding::HashEmbeddingProvider fallback(16);
  embedding::EmbeddingSource source(&primary, fallback);

  const auto out = source.embed("jazz");
  CHECK(out.used_fallback);
  CHECK(out.vector.size() == 16);
  CHECK(source.last_error().find("expected 16") != std::string::npos);
}

TEST_CASE("EmbeddingSource without a primary uses the fallback silently", "[embedding][source]") {
  const embedding::HashEmbeddingProvider fallback(16);
  embedding::EmbeddingSource source(nullptr, fallback);

  const auto out = source.embed("painting");
  CHECK_FALSE(out.used_fallback);
  CHECK(source.cache_size() == 1);
  CHECK(source.last_error().empty());
}

TEST_CASE("EmbeddingSource maps empty text to zeros without provider calls", "[embedding][source]") {
  ScriptedProvider primary(16);
  const embedding::HashEmbeddingProvider fallback(16);
  embedding::EmbeddingSource source(&primary, fallback);

  const auto out = source.embed("   ");
  CHECK(vector::is_zero(out.vector));
  CHECK(out.vector.size() == 16);
  CHECK(primary.calls == 0);
}

TEST_CASE("EmbeddingSource evicts the least recently used text at capacity", "[embedding][source]") {
  ScriptedProvider primary(16);
  const embedding::HashEmbeddingProvider fallback(16);
  embedding::EmbeddingSource source(&primary, fallback, 2);

  (void)source.embed("chess");
  (void)source.embed("hiking");
  (void)source.embed("chess");  // hiking is now the oldest
  (void)source.embed("jazz");
  CHECK(source.cache_size() == 2);
  CHECK(primary.calls == 3);

  (void)source.embed("chess");
  CHECK(primary.calls == 3);
  (void)source.embed("hiking");
  CHECK(primary.calls == 4);
  CHECK(source.cache_size() == 2);
}

TEST_CASE("EmbeddingSource with zero capacity never caches", "[embedding][source]") {
  ScriptedProvider primary(16);
  const embedding::HashEmbeddingProvider fallback(16);
  embedding::EmbeddingSource source(&primary, fallback, 0);

  (void)source.embed("chess");
  (void)source.embed("chess");
  CHECK(primary.calls == 2);
  CHECK(source.cache_size() == 0);
}
