#ifndef TABLEOCR_TEXT_LOCATOR_HPP
#define TABLEOCR_TEXT_LOCATOR_HPP

#include "tableocr/Token.hpp"

#include <opencv2/opencv.hpp>

#include <string>
#include <vector>

namespace tableocr {

/**
 * @brief Backend that turns an image into positioned tokens
 *
 * Implementations must return tokens in top-to-bottom reading order with
 * trimmed, non-empty text and confidence in [0,1]. Backend faults are
 * reported by throwing std::runtime_error.
 */
class TextLocator {
public:
  virtual ~TextLocator() = default;

  /// Backend name reported in extraction results
  virtual std::string name() const = 0;

  /**
   * @brief Prepare the backend
   * @return false when the backend cannot be used
   */
  virtual bool initialize() = 0;

  /// Locate all words in @p image
  virtual std::vector<Token> locate(const cv::Mat &image) = 0;
};

} // namespace tableocr

#endif // TABLEOCR_TEXT_LOCATOR_HPP
