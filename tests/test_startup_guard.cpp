#include <catch2/catch_test_macros.hpp>

#include "cli_config.h"
#include "startup_guard.h"

#include <array>

using namespace takoa::cli;

// ── Storage flags ───────────────────────────────────────────────────────────

TEST_CASE("validate_cli_config: no storage flags is accepted", "[startup][config]") {
  const CliConfig config;
  CHECK(validate_cli_config("clusters", config).empty());
}

TEST_CASE("validate_cli_config: --db and --redis together return error", "[startup][config]") {
  CliConfig config;
  config.db_path = "/tmp/takoa.db";
  config.redis_uri = "tcp://127.0.0.1:6379";
  CHECK_FALSE(validate_cli_config("clusters", config).empty());
}

TEST_CASE("validate_cli_config: invalid redis URI returns error", "[startup][config]") {
  CliConfig config;
  config.redis_uri = "not-a-valid-uri";
  CHECK_FALSE(validate_cli_config("export", config).empty());

  config.redis_uri = "redis://localhost:6379/2";
  CHECK(validate_cli_config("export", config).empty());
}

TEST_CASE("validate_cli_config: --embedding-model without --embedding-url returns error",
          "[startup][config]") {
  CliConfig config;
  config.embedding_model = "text-embedding-3-small";
  CHECK_FALSE(validate_cli_config("onboard", config).empty());

  config.embedding_url = "https://api.openai.com/v1/embeddings";
  CHECK(validate_cli_config("onboard", config).empty());
}

// ── Per-command arguments ───────────────────────────────────────────────────

TEST_CASE("validate_cli_config: turn requires --id and --confidence", "[startup][config]") {
  CliConfig config;
  CHECK_FALSE(validate_cli_config("turn", config).empty());
  config.id = "alice";
  CHECK_FALSE(validate_cli_config("turn", config).empty());
  config.confidence = 0.5;
  CHECK(validate_cli_config("turn", config).empty());
}

TEST_CASE("validate_cli_config: explain requires both ids", "[startup][config]") {
  CliConfig config;
  config.id = "alice";
  CHECK_FALSE(validate_cli_config("explain", config).empty());
  config.other_id = "bob";
  CHECK(validate_cli_config("explain", config).empty());
}

TEST_CASE("validate_cli_config: cohesion requires two distinct members", "[startup][config]") {
  CliConfig config;
  config.members = {"alice", "alice"};
  CHECK_FALSE(validate_cli_config("cohesion", config).empty());
  config.members.push_back("bob");
  CHECK(validate_cli_config("cohesion", config).empty());
}

TEST_CASE("validate_cli_config: graph mode must be known", "[startup][config]") {
  CliConfig config;
  config.graph_mode = "spiral";
  CHECK_FALSE(validate_cli_config("graph", config).empty());
  config.graph_mode = "embedding";
  CHECK(validate_cli_config("graph", config).empty());
}

// ── Option parsing ──────────────────────────────────────────────────────────

TEST_CASE("parse_named_number", "[startup][options]") {
  const auto parsed = parse_named_number("social_energy=0.4");
  REQUIRE(parsed.has_value());
  CHECK(parsed->first == "social_energy");
  CHECK(parsed->second == 0.4);

  CHECK_FALSE(parse_named_number("social_energy").has_value());
  CHECK_FALSE(parse_named_number("=0.4").has_value());
  CHECK_FALSE(parse_named_number("x=abc").has_value());
  CHECK_FALSE(parse_named_number("x=nan").has_value());
}

TEST_CASE("cli_options parse repeated and typed flags", "[startup][options]") {
  std::array<std::string, 10> args = {"takoa_cli", "turn",     "--id",     "alice",
                                      "--signal",  "curiosity=0.3", "--signal", "social_energy=-0.2",
                                      "--confidence", "0.75"};
  std::array<char*, 10> argv{};
  for (std::size_t i = 0; i < args.size(); ++i) {
    argv[i] = args[i].data();
  }

  const auto config = takoa::apps::parse_options<CliConfig>(static_cast<int>(argv.size()),
                                                            argv.data(), cli_options(), 2);
  REQUIRE(config.has_value());
  CHECK(config->id == "alice");
  CHECK(config->signals.size() == 2);
  CHECK(config->signals.at("social_energy") == -0.2);
  CHECK(config->confidence == 0.75);
}

TEST_CASE("cli_options reject bad values and unknown flags", "[startup][options]") {
  std::array<std::string, 4> bad_k = {"takoa_cli", "neighbors", "--k", "0"};
  std::array<char*, 4> argv{};
  for (std::size_t i = 0; i < bad_k.size(); ++i) {
    argv[i] = bad_k[i].data();
  }
  CHECK_FALSE(takoa::apps::parse_options<CliConfig>(4, argv.data(), cli_options(), 2).has_value());

  std::array<std::string, 3> unknown = {"takoa_cli", "clusters", "--verbose"};
  std::array<char*, 3> argv2{};
  for (std::size_t i = 0; i < unknown.size(); ++i) {
    argv2[i] = unknown[i].data();
  }
  CHECK_FALSE(
      takoa::apps::parse_options<CliConfig>(3, argv2.data(), cli_options(), 2).has_value());
}
