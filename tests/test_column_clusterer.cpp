#include <catch2/catch_all.hpp>

#include "tableocr/ColumnClusterer.hpp"

#include <vector>

using tableocr::ColumnClusterer;
using tableocr::Token;

namespace {

std::vector<Token> tokensAt(const std::vector<int> &xs) {
  std::vector<Token> tokens;
  for (int x : xs) {
    tokens.push_back({"w", 10, x, 0.9f});
  }
  return tokens;
}

} // namespace

TEST_CASE("ColumnClusterer groups close positions", "[columns]") {
  auto anchors = ColumnClusterer::clusterPositions({120, 5, 62, 8, 60}, 20.0);

  REQUIRE(anchors.size() == 3);
  REQUIRE(anchors[0] == Catch::Approx(6.5));
  REQUIRE(anchors[1] == Catch::Approx(61.0));
  REQUIRE(anchors[2] == Catch::Approx(120.0));
}

TEST_CASE("ColumnClusterer derives its threshold from the median gap",
          "[columns]") {
  ColumnClusterer clusterer;
  auto tokens = tokensAt({5, 8, 60, 62, 120});

  // gaps 3, 52, 2, 58 -> median 27.5 -> 55
  auto gap = clusterer.gapThreshold({5, 8, 60, 62, 120});
  REQUIRE(gap.has_value());
  REQUIRE(*gap == Catch::Approx(55.0));

  auto anchors = clusterer.cluster(tokens);
  REQUIRE(anchors.size() == 2);
  REQUIRE(anchors[0] == Catch::Approx(34.0));
  REQUIRE(anchors[1] == Catch::Approx(120.0));
}

TEST_CASE("ColumnClusterer never goes below the minimum gap", "[columns]") {
  ColumnClusterer clusterer;
  auto gap = clusterer.gapThreshold({0, 1, 2});
  REQUIRE(gap.has_value());
  REQUIRE(*gap == Catch::Approx(20.0));
}

TEST_CASE("ColumnClusterer skips clustering without a measurable gap",
          "[columns]") {
  ColumnClusterer clusterer;
  REQUIRE_FALSE(clusterer.gapThreshold({42}).has_value());
  REQUIRE(clusterer.cluster(tokensAt({42})).empty());
  REQUIRE(clusterer.cluster({}).empty());
}

TEST_CASE("ColumnClusterer anchors increase left to right", "[columns]") {
  ColumnClusterer clusterer;
  auto anchors =
      clusterer.cluster(tokensAt({400, 12, 210, 15, 205, 398, 10, 600}));

  REQUIRE(anchors.size() >= 2);
  for (size_t i = 1; i < anchors.size(); i++) {
    REQUIRE(anchors[i] > anchors[i - 1]);
  }
}
