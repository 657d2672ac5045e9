#include "takoa/clustering/dbscan.h"

#include <catch2/catch_test_macros.hpp>

using namespace takoa;
using clustering::kNoise;

namespace {

std::vector<vector::Vector> two_blobs_and_outlier() {
  return {
      {0.0f, 0.0f}, {0.1f, 0.0f}, {0.0f, 0.1f}, {0.1f, 0.1f},  // blob 0
      {5.0f, 5.0f}, {5.1f, 5.0f}, {5.0f, 5.1f},                // blob 1
      {20.0f, -20.0f},                                         // outlier
  };
}

}  // namespace

TEST_CASE("dbscan finds dense groups and marks outliers as noise", "[clustering][dbscan]") {
  const auto labels = clustering::dbscan(two_blobs_and_outlier(), {0.5, 3});
  REQUIRE(labels.has_value());
  const auto& l = labels.value();
  REQUIRE(l.size() == 8);

  CHECK(l[0] == 0);
  CHECK(l[1] == 0);
  CHECK(l[2] == 0);
  CHECK(l[3] == 0);
  CHECK(l[4] == 1);
  CHECK(l[5] == 1);
  CHECK(l[6] == 1);
  CHECK(l[7] == kNoise);
}

TEST_CASE("dbscan labels are a partition: every point is noise or one cluster",
          "[clustering][dbscan]") {
  const auto labels = clustering::dbscan(two_blobs_and_outlier(), {0.5, 3}).value();
  const auto stats = clustering::cluster_stats(labels);

  std::size_t clustered = 0;
  for (const auto& [id, size] : stats.cluster_sizes) {
    CHECK(id >= 0);
    clustered += size;
  }
  CHECK(clustered + stats.noise_count == labels.size());
  CHECK(stats.num_clusters == 2);
  CHECK(stats.noise_count == 1);
  CHECK(stats.cluster_sizes.at(0) == 4);
}

TEST_CASE("dbscan neighbourhood is strictly below epsilon", "[clustering][dbscan]") {
  const std::vector<vector::Vector> points{{0.0f}, {1.0f}};
  const auto at_epsilon = clustering::dbscan(points, {1.0, 2}).value();
  CHECK(at_epsilon[0] == kNoise);
  CHECK(at_epsilon[1] == kNoise);

  const auto above = clustering::dbscan(points, {1.01, 2}).value();
  CHECK(above[0] == 0);
  CHECK(above[1] == 0);
}

TEST_CASE("dbscan attaches border points to the cluster that reaches them",
          "[clustering][dbscan]") {
  // 0..2 are core points; 3 sees only 2 and itself.
  const std::vector<vector::Vector> points{{0.0f}, {0.4f}, {0.8f}, {1.5f}};
  const auto labels = clustering::dbscan(points, {0.75, 3}).value();
  CHECK(labels[0] == 0);
  CHECK(labels[2] == 0);
  CHECK(labels[3] == 0);
}

TEST_CASE("dbscan is stable for a fixed input order", "[clustering][dbscan]") {
  const auto a = clustering::dbscan(two_blobs_and_outlier(), {0.5, 3}).value();
  const auto b = clustering::dbscan(two_blobs_and_outlier(), {0.5, 3}).value();
  CHECK(a == b);
}

TEST_CASE("dbscan edge cases", "[clustering][dbscan]") {
  CHECK(clustering::dbscan({}, {0.3, 3}).value().empty());

  const auto single = clustering::dbscan({{1.0f, 0.0f}}, {0.3, 3}).value();
  CHECK(single == std::vector<int>{kNoise});

  const auto mismatch = clustering::dbscan({{1.0f}, {1.0f, 0.0f}}, {0.3, 1});
  REQUIRE_FALSE(mismatch.has_value());
  CHECK(mismatch.error().kind == core::ErrorKind::kValidation);
}
