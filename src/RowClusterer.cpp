#include "tableocr/RowClusterer.hpp"

#include <algorithm>
#include <cstdlib>

namespace tableocr {

RowClusterer::RowClusterer(const ReconstructionConfig &config)
    : m_config(config) {}

double RowClusterer::threshold(const std::vector<Token> &tokens) const {
  std::vector<int> ys;
  ys.reserve(tokens.size());
  for (const auto &token : tokens) {
    ys.push_back(token.y);
  }
  std::sort(ys.begin(), ys.end());

  std::vector<double> gaps;
  for (size_t i = 1; i < ys.size(); i++) {
    gaps.push_back(static_cast<double>(ys[i] - ys[i - 1]));
  }

  double medianGap = gaps.empty() ? m_config.defaultRowGap : median(gaps);
  return std::max(m_config.minRowThreshold,
                  std::min(m_config.maxRowThreshold,
                           medianGap * m_config.rowGapMultiplier));
}

std::vector<Row> RowClusterer::cluster(const std::vector<Token> &tokens) const {
  std::vector<Row> rows;
  if (tokens.empty()) {
    return rows;
  }

  const double rowThreshold = threshold(tokens);

  Row current;
  bool hasPrevious = false;
  int previousY = 0;

  for (size_t i = 0; i < tokens.size(); i++) {
    const Token &token = tokens[i];

    // Compare against the previous token, not the first token of the row
    if (hasPrevious && std::abs(token.y - previousY) >= rowThreshold) {
      rows.push_back(std::move(current));
      current = Row();
    }
    current.cells.push_back({token.text, token.x, token.confidence, i});
    previousY = token.y;
    hasPrevious = true;
  }
  rows.push_back(std::move(current));

  for (auto &row : rows) {
    std::stable_sort(row.cells.begin(), row.cells.end(),
                     [](const RowCell &a, const RowCell &b) {
                       return a.x < b.x;
                     });
  }

  return rows;
}

} // namespace tableocr
