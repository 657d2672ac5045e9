#include "takoa/embedding/http_embedding_provider.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <nlohmann/json.hpp>

using namespace takoa;
using Catch::Matchers::WithinAbs;

// ── request body ────────────────────────────────────────────────────────────

TEST_CASE("build_embedding_request carries model and input", "[embedding][http]") {
  const auto body = nlohmann::json::parse(
      embedding::build_embedding_request("text-embedding-3-small", "I like \"jazz\""));
  CHECK(body.at("model") == "text-embedding-3-small");
  CHECK(body.at("input") == "I like \"jazz\"");
}

// ── response parsing ────────────────────────────────────────────────────────

TEST_CASE("parse_embedding_response truncates and normalizes", "[embedding][http]") {
  const auto v = embedding::parse_embedding_response(
      R"({"data": [{"embedding": [3.0, 4.0, 12.0, 99.0]}]})", 2);
  REQUIRE(v.has_value());
  REQUIRE(v.value().size() == 2);
  CHECK_THAT(v.value()[0], WithinAbs(0.6, 1e-6));
  CHECK_THAT(v.value()[1], WithinAbs(0.8, 1e-6));
}

TEST_CASE("parse_embedding_response rejects short vectors", "[embedding][http]") {
  const auto v =
      embedding::parse_embedding_response(R"({"data": [{"embedding": [1.0, 0.0]}]})", 16);
  REQUIRE_FALSE(v.has_value());
  CHECK(v.error().find("fewer than 16") != std::string::npos);
}

TEST_CASE("parse_embedding_response surfaces API errors", "[embedding][http]") {
  const auto v = embedding::parse_embedding_response(
      R"({"error": {"message": "quota exceeded", "type": "insufficient_quota"}})", 16);
  REQUIRE_FALSE(v.has_value());
  CHECK(v.error().find("quota exceeded") != std::string::npos);
}

TEST_CASE("parse_embedding_response rejects malformed bodies", "[embedding][http]") {
  CHECK_FALSE(embedding::parse_embedding_response("<html>502</html>", 16).has_value());
  CHECK_FALSE(embedding::parse_embedding_response(R"({"data": []})", 16).has_value());
  CHECK_FALSE(
      embedding::parse_embedding_response(R"({"data": [{"embedding": ["a"]}]})", 1).has_value());
}

// ── provider ────────────────────────────────────────────────────────────────

TEST_CASE("HttpEmbeddingProvider without an API key fails without a request",
          "[embedding][http]") {
  embedding::HttpEmbeddingConfig config;
  config.endpoint = "http://127.0.0.1:1/v1/embeddings";
  config.dimension = 8;
  const embedding::HttpEmbeddingProvider provider(config);

  CHECK(provider.dimension() == 8);
  CHECK(provider.provider_id() == "http:text-embedding-3-small");
  const auto v = provider.embed_text("chess");
  REQUIRE_FALSE(v.has_value());
  CHECK(v.error().find("no API key") != std::string::npos);
}
