#ifndef TABLEOCR_GRID_ALIGNER_HPP
#define TABLEOCR_GRID_ALIGNER_HPP

#include "tableocr/Token.hpp"

#include <cstddef>
#include <vector>

namespace tableocr {

/**
 * @brief Reconciles row cells with column anchors
 *
 * Realignment only happens when 1 < anchors < cells in the first row. Each
 * cell is placed at the anchor nearest to the x of the token it came from;
 * cells landing on the same anchor are joined with a space in row order.
 */
class GridAligner {
public:
  /// Whether @p anchorCount anchors may realign rows whose first row has
  /// @p firstRowLength cells
  static bool shouldRealign(std::size_t anchorCount,
                            std::size_t firstRowLength);

  /// Index of the anchor closest to @p x (first one on ties)
  static std::size_t nearestAnchor(const std::vector<ColumnAnchor> &anchors,
                                   double x);

  /**
   * @brief Build the grid for the given rows
   * @param rows Output of RowClusterer
   * @param anchors Output of ColumnClusterer
   * @return Realigned grid, or the rows' texts unchanged when the anchor
   * count does not allow realignment
   */
  Grid align(const std::vector<Row> &rows,
             const std::vector<ColumnAnchor> &anchors) const;
};

} // namespace tableocr

#endif // TABLEOCR_GRID_ALIGNER_HPP
