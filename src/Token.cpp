#include "tableocr/Token.hpp"

#include <algorithm>

namespace tableocr {

std::vector<std::string> Row::texts() const {
  std::vector<std::string> result;
  result.reserve(cells.size());
  for (const auto &cell : cells) {
    result.push_back(cell.text);
  }
  return result;
}

std::string trimText(const std::string &text) {
  size_t start = text.find_first_not_of(" \t\n\r\f\v");
  if (start == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(" \t\n\r\f\v");
  return text.substr(start, end - start + 1);
}

double median(std::vector<double> values) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  size_t mid = values.size() / 2;
  if (values.size() % 2 == 1) {
    return values[mid];
  }
  return (values[mid - 1] + values[mid]) / 2.0;
}

std::vector<Token> sanitizeTokens(const std::vector<Token> &tokens,
                                  float minConfidence) {
  std::vector<Token> result;
  result.reserve(tokens.size());
  for (const auto &token : tokens) {
    std::string text = trimText(token.text);
    if (text.empty() || token.confidence < minConfidence) {
      continue;
    }
    Token cleaned = token;
    cleaned.text = text;
    cleaned.confidence = std::min(1.0f, std::max(0.0f, token.confidence));
    result.push_back(cleaned);
  }
  return result;
}

} // namespace tableocr
