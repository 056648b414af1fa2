#include "tableocr/Table.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace tableocr {

Cell Cell::missing() { return Cell(); }

Cell Cell::text(const std::string &value) {
  Cell cell;
  cell.m_kind = Kind::Text;
  cell.m_text = value;
  return cell;
}

Cell Cell::number(double value) {
  Cell cell;
  cell.m_kind = Kind::Number;
  cell.m_number = value;
  return cell;
}

std::string Cell::toString() const {
  switch (m_kind) {
  case Kind::Text:
    return m_text;
  case Kind::Number:
    return formatNumber(m_number);
  default:
    return "";
  }
}

bool Cell::operator==(const Cell &other) const {
  if (m_kind != other.m_kind) {
    return false;
  }
  switch (m_kind) {
  case Kind::Text:
    return m_text == other.m_text;
  case Kind::Number:
    return m_number == other.m_number;
  default:
    return true;
  }
}

std::string Table::columnLabel(std::size_t column) const {
  if (column < header.size() && !header[column].empty()) {
    return header[column];
  }
  return "Column " + std::to_string(column + 1);
}

Grid Table::toGrid() const {
  Grid grid;
  grid.reserve(rows.size() + 1);
  grid.push_back(header);
  for (const auto &row : rows) {
    std::vector<std::string> rendered;
    rendered.reserve(row.size());
    for (const auto &cell : row) {
      rendered.push_back(cell.toString());
    }
    grid.push_back(std::move(rendered));
  }
  return grid;
}

bool Table::operator==(const Table &other) const {
  return header == other.header && columnTypes == other.columnTypes &&
         rows == other.rows;
}

bool parseNumber(const std::string &text, double &value) {
  if (text.empty()) {
    return false;
  }

  // strtod alone would also take hex, inf, nan and leading whitespace
  bool hasDigit = false;
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
      hasDigit = true;
    } else if (c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') {
      return false;
    }
  }
  if (!hasDigit) {
    return false;
  }

  const char *begin = text.c_str();
  char *end = nullptr;
  double parsed = std::strtod(begin, &end);
  if (end != begin + text.size() || !std::isfinite(parsed)) {
    return false;
  }

  value = parsed;
  return true;
}

std::string formatNumber(double value) {
  if (std::isfinite(value) && value == std::floor(value) &&
      std::abs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }
  std::ostringstream out;
  out << std::setprecision(15) << value;
  return out.str();
}

} // namespace tableocr
