#include "tableocr/TableNormalizer.hpp"

#include <map>

namespace tableocr {

std::size_t TableNormalizer::modalWidth(const Grid &grid) {
  std::map<std::size_t, std::size_t> counts;
  for (const auto &row : grid) {
    counts[row.size()]++;
  }

  // Ascending iteration keeps the smallest width on ties
  std::size_t width = 0;
  std::size_t bestCount = 0;
  for (const auto &entry : counts) {
    if (entry.second > bestCount) {
      bestCount = entry.second;
      width = entry.first;
    }
  }
  return width;
}

Table TableNormalizer::normalize(const Grid &grid) const {
  Table table;

  const std::size_t width = modalWidth(grid);
  if (width == 0) {
    return table;
  }

  std::vector<std::vector<std::string>> normalized;
  normalized.reserve(grid.size());
  for (const auto &row : grid) {
    std::vector<std::string> cells = row;
    cells.resize(width);
    normalized.push_back(std::move(cells));
  }

  table.header = normalized.front();
  table.columnTypes.assign(width, ColumnType::Text);

  for (std::size_t r = 1; r < normalized.size(); r++) {
    std::vector<Cell> cells;
    cells.reserve(width);
    for (const auto &value : normalized[r]) {
      cells.push_back(value.empty() ? Cell::missing() : Cell::text(value));
    }
    table.rows.push_back(std::move(cells));
  }

  // All-or-nothing numeric coercion per column
  for (std::size_t c = 0; c < width; c++) {
    std::vector<double> numbers(table.rows.size(), 0.0);
    bool numeric = true;
    for (std::size_t r = 0; r < table.rows.size() && numeric; r++) {
      const Cell &cell = table.rows[r][c];
      if (!cell.isMissing()) {
        numeric = parseNumber(cell.textValue(), numbers[r]);
      }
    }
    if (!numeric) {
      continue;
    }

    table.columnTypes[c] = ColumnType::Numeric;
    for (std::size_t r = 0; r < table.rows.size(); r++) {
      Cell &cell = table.rows[r][c];
      if (!cell.isMissing()) {
        cell = Cell::number(numbers[r]);
      }
    }
  }

  return table;
}

} // namespace tableocr
