#ifndef TABLEOCR_TABLE_NORMALIZER_HPP
#define TABLEOCR_TABLE_NORMALIZER_HPP

#include "tableocr/Table.hpp"
#include "tableocr/Token.hpp"

#include <cstddef>

namespace tableocr {

/**
 * @brief Turns a grid into a rectangular typed table
 *
 * Rows are padded or truncated to the modal row length, the first row
 * becomes the header, empty cells become missing and every column is coerced
 * to numbers when all of its present values parse.
 */
class TableNormalizer {
public:
  /**
   * @brief Most frequent row length, smallest length on ties
   * @return 0 for an empty grid
   */
  static std::size_t modalWidth(const Grid &grid);

  /**
   * @brief Normalize a grid
   * @param grid Rows of cell strings, first row is the header
   * @return Table with zero data rows when the grid has 0 or 1 rows
   */
  Table normalize(const Grid &grid) const;
};

} // namespace tableocr

#endif // TABLEOCR_TABLE_NORMALIZER_HPP
