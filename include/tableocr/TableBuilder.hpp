#ifndef TABLEOCR_TABLE_BUILDER_HPP
#define TABLEOCR_TABLE_BUILDER_HPP

#include "tableocr/ColumnClusterer.hpp"
#include "tableocr/GridAligner.hpp"
#include "tableocr/LocatorChain.hpp"
#include "tableocr/ReconstructionConfig.hpp"
#include "tableocr/RowClusterer.hpp"
#include "tableocr/Table.hpp"
#include "tableocr/TableNormalizer.hpp"

#include <opencv2/opencv.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace tableocr {

/**
 * @brief Why an extraction failed
 */
enum class ErrorKind {
  None,                     ///< Extraction succeeded
  NoTokensProduced,         ///< The locators found no text
  NoTableStructureDetected, ///< Clustering produced an empty grid
  ReconstructionFailure,    ///< Unexpected fault while building the table
  InvalidInput              ///< Image missing, unreadable or empty
};

/// Human-readable name of an error kind
const char *toString(ErrorKind kind);

/**
 * @brief Outcome of one table extraction
 */
struct ExtractionResult {
  bool success = false;                 ///< Whether a table was produced
  ErrorKind errorKind = ErrorKind::None; ///< Failure category
  std::string errorMessage;             ///< Error message if failed
  int rowsExtracted = 0;                ///< Data rows in the table
  int columnsDetected = 0;              ///< Table width
  std::optional<Table> table;           ///< Normalized table on success
  double confidence = 0.0; ///< Mean token confidence, 4 decimal places
  double elapsedTime = 0.0; ///< Wall-clock seconds, 2 decimal places
  std::string backendName;  ///< Locator that supplied the tokens
  std::string preview;      ///< Text rendering of the first rows
  int tokenCount = 0;       ///< Tokens received from the locator
};

/**
 * @brief Runs the whole reconstruction for one image
 *
 * tokens -> RowClusterer -> ColumnClusterer -> GridAligner ->
 * TableNormalizer. Every failure is reported in the returned
 * ExtractionResult; nothing is thrown to the caller.
 *
 * Example usage:
 * @code
 * tableocr::TableBuilder builder(tableocr::LocatorChain(
 *     {std::make_shared<tableocr::TesseractLocator>()}));
 * auto result = builder.extractTable("scan.png");
 * if (result.success) {
 *     std::cout << result.preview << std::endl;
 * }
 * @endcode
 */
class TableBuilder {
public:
  /// Builder without locators, for callers that supply tokens directly
  explicit TableBuilder(
      const ReconstructionConfig &config = ReconstructionConfig());

  explicit TableBuilder(LocatorChain locators,
                        const ReconstructionConfig &config =
                            ReconstructionConfig());

  /// Load @p imagePath with OpenCV and extract its table
  ExtractionResult extractTable(const std::string &imagePath) const;

  /// Locate tokens in @p image and extract its table
  ExtractionResult extractTable(const cv::Mat &image) const;

  /**
   * @brief Reconstruct a table from tokens that were already located
   * @param tokens Tokens in top-to-bottom order
   * @param backendName Name reported in the result
   */
  ExtractionResult buildFromTokens(const std::vector<Token> &tokens,
                                   const std::string &backendName) const;

  /**
   * @brief Run the four reconstruction stages
   * @return The grid produced by GridAligner, before normalization
   */
  static Grid detectStructure(const std::vector<Token> &tokens,
                              const ReconstructionConfig &config);

  /// Throws std::invalid_argument for empty text or confidence outside [0,1]
  static void validateTokens(const std::vector<Token> &tokens);

private:
  using Clock = std::chrono::high_resolution_clock;

  ExtractionResult extractTable(const cv::Mat &image,
                                Clock::time_point startTime) const;

  ExtractionResult reconstruct(const std::vector<Token> &tokens,
                               const std::string &backendName,
                               Clock::time_point startTime) const;

  std::optional<LocatorChain> m_locators; ///< Empty for token-only builders
  ReconstructionConfig m_config;
};

} // namespace tableocr

#endif // TABLEOCR_TABLE_BUILDER_HPP
