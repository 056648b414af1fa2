#ifndef TABLEOCR_RECONSTRUCTION_CONFIG_HPP
#define TABLEOCR_RECONSTRUCTION_CONFIG_HPP

namespace tableocr {

/**
 * @brief Tuning constants for turning tokens into a table
 */
struct ReconstructionConfig {
  double defaultRowGap = 30.0;   ///< Row gap used when no gap can be measured
  double rowGapMultiplier = 1.3; ///< Applied to the median vertical gap
  double minRowThreshold = 15.0; ///< Lower clamp of the row threshold
  double maxRowThreshold = 50.0; ///< Upper clamp of the row threshold
  double columnGapMultiplier = 2.0; ///< Applied to the median horizontal gap
  double minColumnGap = 20.0;       ///< Lower bound of the column gap threshold
  bool sortTokensByY = false; ///< Stable re-sort by y before row clustering
};

} // namespace tableocr

#endif // TABLEOCR_RECONSTRUCTION_CONFIG_HPP
