#include "tableocr/ColumnClusterer.hpp"

#include <algorithm>

namespace tableocr {

ColumnClusterer::ColumnClusterer(const ReconstructionConfig &config)
    : m_config(config) {}

std::optional<double>
ColumnClusterer::gapThreshold(const std::vector<int> &xs) const {
  if (xs.size() < 2) {
    return std::nullopt;
  }

  std::vector<int> sorted = xs;
  std::sort(sorted.begin(), sorted.end());

  std::vector<double> gaps;
  gaps.reserve(sorted.size() - 1);
  for (size_t i = 1; i < sorted.size(); i++) {
    gaps.push_back(static_cast<double>(sorted[i] - sorted[i - 1]));
  }

  return std::max(m_config.minColumnGap,
                  median(gaps) * m_config.columnGapMultiplier);
}

std::vector<ColumnAnchor>
ColumnClusterer::cluster(const std::vector<Token> &tokens) const {
  std::vector<int> xs;
  xs.reserve(tokens.size());
  for (const auto &token : tokens) {
    xs.push_back(token.x);
  }

  std::optional<double> gap = gapThreshold(xs);
  if (!gap) {
    return {};
  }
  return clusterPositions(std::move(xs), *gap);
}

std::vector<ColumnAnchor>
ColumnClusterer::clusterPositions(std::vector<int> xs, double gapThreshold) {
  std::vector<ColumnAnchor> anchors;
  if (xs.empty()) {
    return anchors;
  }

  std::sort(xs.begin(), xs.end());

  std::vector<double> members = {static_cast<double>(xs.front())};
  for (size_t i = 1; i < xs.size(); i++) {
    double x = static_cast<double>(xs[i]);
    if (x - members.back() < gapThreshold) {
      members.push_back(x);
    } else {
      anchors.push_back(median(members));
      members = {x};
    }
  }
  anchors.push_back(median(members));

  return anchors;
}

} // namespace tableocr
