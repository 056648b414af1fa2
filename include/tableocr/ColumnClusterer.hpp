#ifndef TABLEOCR_COLUMN_CLUSTERER_HPP
#define TABLEOCR_COLUMN_CLUSTERER_HPP

#include "tableocr/ReconstructionConfig.hpp"
#include "tableocr/Token.hpp"

#include <optional>
#include <vector>

namespace tableocr {

/**
 * @brief Derives column anchors from the x positions of all tokens
 */
class ColumnClusterer {
public:
  ColumnClusterer() = default;
  explicit ColumnClusterer(const ReconstructionConfig &config);

  /**
   * @brief Gap threshold for a set of x positions
   * @return max(minColumnGap, median gap * columnGapMultiplier), or nothing
   * when fewer than two positions are available
   */
  std::optional<double> gapThreshold(const std::vector<int> &xs) const;

  /**
   * @brief Cluster the x positions of the tokens
   * @param tokens The full token sequence
   * @return Anchors ordered left to right; empty when no gap can be measured
   */
  std::vector<ColumnAnchor> cluster(const std::vector<Token> &tokens) const;

  /**
   * @brief Cluster x positions with an explicit gap threshold
   *
   * A value joins the current cluster while it is closer than
   * @p gapThreshold to the last value added.
   */
  static std::vector<ColumnAnchor> clusterPositions(std::vector<int> xs,
                                                    double gapThreshold);

private:
  ReconstructionConfig m_config;
};

} // namespace tableocr

#endif // TABLEOCR_COLUMN_CLUSTERER_HPP
