#ifndef TABLEOCR_TABLE_HPP
#define TABLEOCR_TABLE_HPP

#include "tableocr/Token.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace tableocr {

/**
 * @brief Type of every value in one column
 */
enum class ColumnType {
  Text,   ///< Cells hold strings
  Numeric ///< Cells hold numbers
};

/**
 * @brief One table cell: missing, text or number
 */
class Cell {
public:
  enum class Kind { Missing, Text, Number };

  Cell() = default;

  static Cell missing();
  static Cell text(const std::string &value);
  static Cell number(double value);

  Kind kind() const { return m_kind; }
  bool isMissing() const { return m_kind == Kind::Missing; }
  bool isNumber() const { return m_kind == Kind::Number; }

  const std::string &textValue() const { return m_text; }
  double numberValue() const { return m_number; }

  /// Display form: empty for missing, numbers without a trailing ".0"
  std::string toString() const;

  bool operator==(const Cell &other) const;
  bool operator!=(const Cell &other) const { return !(*this == other); }

private:
  Kind m_kind = Kind::Missing;
  std::string m_text;
  double m_number = 0.0;
};

/**
 * @brief Rectangular, typed table with one header row
 */
struct Table {
  std::vector<std::string> header;    ///< Column labels, possibly empty
  std::vector<ColumnType> columnTypes; ///< One entry per column
  std::vector<std::vector<Cell>> rows; ///< Data rows, each of width()

  std::size_t width() const { return header.size(); }
  std::size_t rowCount() const { return rows.size(); }
  bool empty() const { return rows.empty(); }

  /// Header cell, or "Column <n>" (1-based) when the header cell is empty
  std::string columnLabel(std::size_t column) const;

  /// Header followed by the rendered data rows
  Grid toGrid() const;

  bool operator==(const Table &other) const;
  bool operator!=(const Table &other) const { return !(*this == other); }
};

/**
 * @brief Parse a whole cell as a number
 *
 * Accepts an optional sign, digits, one decimal point and an exponent.
 * @return true and sets @p value on success
 */
bool parseNumber(const std::string &text, double &value);

/// Render a number the way Cell::toString does
std::string formatNumber(double value);

} // namespace tableocr

#endif // TABLEOCR_TABLE_HPP
