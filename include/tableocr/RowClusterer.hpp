#ifndef TABLEOCR_ROW_CLUSTERER_HPP
#define TABLEOCR_ROW_CLUSTERER_HPP

#include "tableocr/ReconstructionConfig.hpp"
#include "tableocr/Token.hpp"

#include <vector>

namespace tableocr {

/**
 * @brief Groups tokens into rows using an adaptive vertical gap threshold
 *
 * The threshold is the median gap between sorted y values scaled by
 * ReconstructionConfig::rowGapMultiplier and clamped to
 * [minRowThreshold, maxRowThreshold]. Tokens are then walked in input order
 * and each one is compared with the token immediately before it, so a single
 * large gap always starts a new row.
 */
class RowClusterer {
public:
  RowClusterer() = default;
  explicit RowClusterer(const ReconstructionConfig &config);

  /**
   * @brief Compute the vertical threshold for a token sequence
   * @param tokens Input tokens
   * @return Threshold in pixels
   */
  double threshold(const std::vector<Token> &tokens) const;

  /**
   * @brief Split tokens into rows
   * @param tokens Tokens in top-to-bottom order
   * @return Rows, each sorted by x; empty for empty input
   */
  std::vector<Row> cluster(const std::vector<Token> &tokens) const;

private:
  ReconstructionConfig m_config;
};

} // namespace tableocr

#endif // TABLEOCR_ROW_CLUSTERER_HPP
