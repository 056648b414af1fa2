#include "tableocr/GridAligner.hpp"

#include <cmath>

namespace tableocr {

bool GridAligner::shouldRealign(std::size_t anchorCount,
                                std::size_t firstRowLength) {
  return anchorCount > 1 && anchorCount < firstRowLength;
}

std::size_t GridAligner::nearestAnchor(const std::vector<ColumnAnchor> &anchors,
                                       double x) {
  std::size_t best = 0;
  double bestDistance = std::abs(x - anchors[0]);
  for (std::size_t i = 1; i < anchors.size(); i++) {
    double distance = std::abs(x - anchors[i]);
    if (distance < bestDistance) {
      bestDistance = distance;
      best = i;
    }
  }
  return best;
}

Grid GridAligner::align(const std::vector<Row> &rows,
                        const std::vector<ColumnAnchor> &anchors) const {
  Grid grid;
  grid.reserve(rows.size());

  if (rows.empty() ||
      !shouldRealign(anchors.size(), rows.front().cells.size())) {
    for (const auto &row : rows) {
      grid.push_back(row.texts());
    }
    return grid;
  }

  for (const auto &row : rows) {
    std::vector<std::string> aligned(anchors.size());

    // Cells keep the x of their own token, so duplicate texts in a row
    // still land in their own columns
    for (const auto &cell : row.cells) {
      std::string &slot = aligned[nearestAnchor(anchors, cell.x)];
      if (slot.empty()) {
        slot = cell.text;
      } else {
        slot += " " + cell.text;
      }
    }

    grid.push_back(std::move(aligned));
  }

  return grid;
}

} // namespace tableocr
