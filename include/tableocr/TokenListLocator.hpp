#ifndef TABLEOCR_TOKEN_LIST_LOCATOR_HPP
#define TABLEOCR_TOKEN_LIST_LOCATOR_HPP

#include "tableocr/TextLocator.hpp"

#include <string>
#include <vector>

namespace tableocr {

/**
 * @brief Parse tokens written one per line as TEXT|Y|X|CONFIDENCE
 *
 * Y and X are grid positions multiplied by @p positionScale; confidence is a
 * percentage with an optional '%'. Lines without '|', with fewer than four
 * fields or with unparsable numbers are skipped, as are tokens with empty
 * text or confidence below @p minConfidence (0-1).
 */
std::vector<Token> parseDelimitedTokens(const std::string &text,
                                        double positionScale = 20.0,
                                        float minConfidence = 0.2f);

/**
 * @brief Locator that replays a recorded token list instead of running OCR
 *
 * The image passed to locate() is ignored.
 */
class TokenListLocator : public TextLocator {
public:
  /**
   * @param path File holding TEXT|Y|X|CONFIDENCE lines
   * @param positionScale Multiplier applied to Y and X
   */
  explicit TokenListLocator(const std::string &path,
                            double positionScale = 20.0);

  /// Locator over an in-memory listing
  static TokenListLocator fromString(const std::string &listing,
                                     double positionScale = 20.0);

  std::string name() const override;

  /// Reads the file; false when it cannot be opened
  bool initialize() override;

  std::vector<Token> locate(const cv::Mat &image) override;

private:
  TokenListLocator() = default;

  std::string m_path;
  std::string m_listing;
  double m_positionScale = 20.0;
  bool m_loaded = false;
};

} // namespace tableocr

#endif // TABLEOCR_TOKEN_LIST_LOCATOR_HPP
