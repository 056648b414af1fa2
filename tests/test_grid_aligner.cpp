#include <catch2/catch_all.hpp>

#include "tableocr/GridAligner.hpp"

#include <string>
#include <utility>
#include <vector>

using tableocr::GridAligner;
using tableocr::Row;

namespace {

Row makeRow(const std::vector<std::pair<std::string, int>> &cells) {
  static size_t nextIndex = 0;
  Row row;
  for (const auto &cell : cells) {
    row.cells.push_back({cell.first, cell.second, 0.9f, nextIndex++});
  }
  return row;
}

} // namespace

TEST_CASE("GridAligner realigns only for 1 < anchors < first row length",
          "[align]") {
  REQUIRE_FALSE(GridAligner::shouldRealign(0, 0));
  REQUIRE_FALSE(GridAligner::shouldRealign(1, 3));
  REQUIRE(GridAligner::shouldRealign(2, 3));
  REQUIRE_FALSE(GridAligner::shouldRealign(3, 3));
  REQUIRE_FALSE(GridAligner::shouldRealign(4, 3));
}

TEST_CASE("GridAligner keeps the row layout when not realigning",
          "[align]") {
  std::vector<Row> rows = {makeRow({{"Name", 5}, {"Age", 60}}),
                           makeRow({{"Alice", 5}, {"30", 62}, {"x", 90}})};

  auto grid = GridAligner().align(rows, {5.0, 60.0});

  REQUIRE(grid.size() == 2);
  REQUIRE(grid[0] == std::vector<std::string>{"Name", "Age"});
  REQUIRE(grid[1] == std::vector<std::string>{"Alice", "30", "x"});
}

TEST_CASE("GridAligner merges cells sharing an anchor", "[align]") {
  std::vector<Row> rows = {
      makeRow({{"Unit", 10}, {"Price", 95}, {"USD", 110}}),
      makeRow({{"Pen", 12}, {"3", 101}}),
      makeRow({{"5", 99}})};

  auto grid = GridAligner().align(rows, {10.0, 100.0});

  REQUIRE(grid.size() == 3);
  REQUIRE(grid[0] == std::vector<std::string>{"Unit", "Price USD"});
  REQUIRE(grid[1] == std::vector<std::string>{"Pen", "3"});
  REQUIRE(grid[2] == std::vector<std::string>{"", "5"});
}

TEST_CASE("GridAligner places duplicate texts by their own position",
          "[align]") {
  std::vector<Row> rows = {makeRow({{"5", 10}, {"5", 100}, {"x", 105}})};

  auto grid = GridAligner().align(rows, {10.0, 100.0});

  REQUIRE(grid.size() == 1);
  REQUIRE(grid[0] == std::vector<std::string>{"5", "5 x"});
}

TEST_CASE("GridAligner picks the first anchor on a distance tie",
          "[align]") {
  REQUIRE(GridAligner::nearestAnchor({0.0, 10.0}, 5.0) == 0);
  REQUIRE(GridAligner::nearestAnchor({0.0, 10.0}, 6.0) == 1);
}

TEST_CASE("GridAligner returns an empty grid for no rows", "[align]") {
  REQUIRE(GridAligner().align({}, {1.0, 2.0, 3.0}).empty());
}
