#ifndef TABLEOCR_TOKEN_HPP
#define TABLEOCR_TOKEN_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace tableocr {

/**
 * @brief One recognized word with its position and confidence
 *
 * Tokens are produced by a TextLocator in top-to-bottom reading order and are
 * never modified by the reconstruction stages.
 */
struct Token {
  std::string text;       ///< Trimmed, non-empty word text
  int y = 0;              ///< Vertical centre in pixels
  int x = 0;              ///< Horizontal centre in pixels
  float confidence = 0.f; ///< Recognition confidence (0-1)
};

/**
 * @brief A token placed in a row, remembering where it came from
 */
struct RowCell {
  std::string text;       ///< Token text
  int x = 0;              ///< Horizontal centre of the source token
  float confidence = 0.f; ///< Confidence of the source token
  std::size_t tokenIndex = 0; ///< Index of the source token in the input
};

/**
 * @brief Tokens sharing one row band, ordered left to right by x
 */
struct Row {
  std::vector<RowCell> cells;

  std::vector<std::string> texts() const;
};

/// Horizontal centre of one inferred column
using ColumnAnchor = double;

/// Rows of cell strings, not necessarily rectangular
using Grid = std::vector<std::vector<std::string>>;

/**
 * @brief Trim token text and drop empty or low-confidence tokens
 * @param tokens Raw tokens from a backend
 * @param minConfidence Minimum confidence to keep (0-1)
 * @return Tokens in their original order
 */
std::vector<Token> sanitizeTokens(const std::vector<Token> &tokens,
                                  float minConfidence);

/// Strip leading and trailing whitespace
std::string trimText(const std::string &text);

/// Median of the values (mean of the two middle values for even counts)
double median(std::vector<double> values);

} // namespace tableocr

#endif // TABLEOCR_TOKEN_HPP
