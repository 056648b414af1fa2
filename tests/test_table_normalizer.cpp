#include <catch2/catch_all.hpp>

#include "tableocr/TableNormalizer.hpp"

#include <string>
#include <vector>

using tableocr::Cell;
using tableocr::ColumnType;
using tableocr::Grid;
using tableocr::Table;
using tableocr::TableNormalizer;

TEST_CASE("modalWidth picks the most common row length", "[normalize]") {
  REQUIRE(TableNormalizer::modalWidth({}) == 0);
  REQUIRE(TableNormalizer::modalWidth({{"a", "b", "c"},
                                       {"a", "b", "c"},
                                       {"a", "b"}}) == 3);
}

TEST_CASE("modalWidth breaks ties with the smaller width", "[normalize]") {
  Grid grid = {{"a", "b"}, {"a", "b", "c"}, {"a", "b", "c"}, {"a", "b"}};
  REQUIRE(TableNormalizer::modalWidth(grid) == 2);
}

TEST_CASE("normalize pads, truncates and splits the header",
          "[normalize]") {
  Grid grid = {{"A", "B", "C"},
               {"1", "2"},
               {"7", "8", "9", "10"},
               {"4", "5", "6"}};

  Table table = TableNormalizer().normalize(grid);

  REQUIRE(table.width() == 3);
  REQUIRE(table.header == std::vector<std::string>{"A", "B", "C"});
  REQUIRE(table.rowCount() == 3);
  for (const auto &row : table.rows) {
    REQUIRE(row.size() == 3);
  }

  // Padded cell becomes missing, the column stays numeric
  REQUIRE(table.rows[0][2].isMissing());
  REQUIRE(table.columnTypes[2] == ColumnType::Numeric);
  REQUIRE(table.rows[1][2] == Cell::number(9));
  REQUIRE(table.rows[2][0] == Cell::number(4));
}

TEST_CASE("numeric coercion is all-or-nothing per column", "[normalize]") {
  Grid grid = {{"Qty", "Code"}, {"10", "10"}, {"20", "abc"}, {"30", "30"}};

  Table table = TableNormalizer().normalize(grid);

  REQUIRE(table.columnTypes[0] == ColumnType::Numeric);
  REQUIRE(table.rows[0][0] == Cell::number(10));
  REQUIRE(table.rows[2][0] == Cell::number(30));

  REQUIRE(table.columnTypes[1] == ColumnType::Text);
  REQUIRE(table.rows[0][1] == Cell::text("10"));
  REQUIRE(table.rows[1][1] == Cell::text("abc"));
  REQUIRE(table.rows[2][1] == Cell::text("30"));
}

TEST_CASE("normalize of 0 or 1 rows gives no data rows", "[normalize]") {
  Table empty = TableNormalizer().normalize({});
  REQUIRE(empty.width() == 0);
  REQUIRE(empty.empty());

  Table headerOnly = TableNormalizer().normalize({{"Name", "Age"}});
  REQUIRE(headerOnly.header == std::vector<std::string>{"Name", "Age"});
  REQUIRE(headerOnly.rowCount() == 0);
}

TEST_CASE("normalize is idempotent", "[normalize]") {
  Grid grid = {{"Item", "", "Price"},
               {"Paper", "A4", "4.50"},
               {"Pens", "", "1.25"},
               {"Stapler", "big one", "-3e2"}};

  Table first = TableNormalizer().normalize(grid);
  Table second = TableNormalizer().normalize(first.toGrid());

  REQUIRE(first == second);
  REQUIRE(first.columnTypes[2] == ColumnType::Numeric);
  REQUIRE(first.rows[2][2] == Cell::number(-300));
}

TEST_CASE("uniform grids are not padded or truncated", "[normalize]") {
  Grid grid = {{"x", "y"}, {"a", "b"}, {"c", "d"}};
  Table table = TableNormalizer().normalize(grid);

  REQUIRE(table.width() == 2);
  REQUIRE(table.toGrid() == grid);
}

TEST_CASE("columnLabel falls back to a positional label", "[normalize]") {
  Table table = TableNormalizer().normalize({{"Name", ""}, {"a", "b"}});
  REQUIRE(table.columnLabel(0) == "Name");
  REQUIRE(table.columnLabel(1) == "Column 2");
}

TEST_CASE("parseNumber accepts plain decimal numbers only", "[normalize]") {
  double value = 0.0;

  REQUIRE(tableocr::parseNumber("42", value));
  REQUIRE(value == 42.0);
  REQUIRE(tableocr::parseNumber("-3.5e2", value));
  REQUIRE(value == -350.0);
  REQUIRE(tableocr::parseNumber(".5", value));
  REQUIRE(value == 0.5);

  REQUIRE_FALSE(tableocr::parseNumber("", value));
  REQUIRE_FALSE(tableocr::parseNumber(".", value));
  REQUIRE_FALSE(tableocr::parseNumber("1,234", value));
  REQUIRE_FALSE(tableocr::parseNumber("0x1A", value));
  REQUIRE_FALSE(tableocr::parseNumber("inf", value));
  REQUIRE_FALSE(tableocr::parseNumber("1.2.3", value));
  REQUIRE_FALSE(tableocr::parseNumber(" 12", value));
}

TEST_CASE("formatNumber drops the fraction of whole numbers",
          "[normalize]") {
  REQUIRE(tableocr::formatNumber(30.0) == "30");
  REQUIRE(tableocr::formatNumber(-2.0) == "-2");
  REQUIRE(tableocr::formatNumber(2.5) == "2.5");
  REQUIRE(tableocr::formatNumber(4.5) == "4.5");
}
