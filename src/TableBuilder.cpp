#include "tableocr/TableBuilder.hpp"
#include "tableocr/TableWriter.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tableocr {

namespace {

double roundTo(double value, int decimals) {
  double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

} // namespace

const char *toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::NoTokensProduced:
    return "NoTokensProduced";
  case ErrorKind::NoTableStructureDetected:
    return "NoTableStructureDetected";
  case ErrorKind::ReconstructionFailure:
    return "ReconstructionFailure";
  case ErrorKind::InvalidInput:
    return "InvalidInput";
  }
  return "Unknown";
}

TableBuilder::TableBuilder(const ReconstructionConfig &config)
    : m_config(config) {}

TableBuilder::TableBuilder(LocatorChain locators,
                           const ReconstructionConfig &config)
    : m_locators(std::move(locators)), m_config(config) {}

ExtractionResult TableBuilder::extractTable(const std::string &imagePath) const {
  auto startTime = Clock::now();

  cv::Mat image;
  std::string loadError;
  try {
    image = cv::imread(imagePath);
  } catch (const cv::Exception &e) {
    loadError = std::string(": ") + e.what();
  }

  if (image.empty()) {
    ExtractionResult result;
    result.errorKind = ErrorKind::InvalidInput;
    result.errorMessage = "Failed to load image: " + imagePath + loadError;
    result.backendName = m_locators ? m_locators->primaryName() : "";
    result.elapsedTime = roundTo(
        std::chrono::duration<double>(Clock::now() - startTime).count(), 2);
    return result;
  }

  return extractTable(image, startTime);
}

ExtractionResult TableBuilder::extractTable(const cv::Mat &image) const {
  return extractTable(image, Clock::now());
}

ExtractionResult TableBuilder::extractTable(const cv::Mat &image,
                                            Clock::time_point startTime) const {
  ExtractionResult result;
  if (!m_locators) {
    result.errorKind = ErrorKind::InvalidInput;
    result.errorMessage = "No locator configured";
  } else if (image.empty()) {
    result.errorKind = ErrorKind::InvalidInput;
    result.errorMessage = "Input image is empty";
    result.backendName = m_locators->primaryName();
  } else {
    LocatedTokens located = m_locators->locate(image);
    return reconstruct(located.tokens, located.backendName, startTime);
  }

  result.elapsedTime = roundTo(
      std::chrono::duration<double>(Clock::now() - startTime).count(), 2);
  return result;
}

ExtractionResult
TableBuilder::buildFromTokens(const std::vector<Token> &tokens,
                              const std::string &backendName) const {
  return reconstruct(tokens, backendName, Clock::now());
}

void TableBuilder::validateTokens(const std::vector<Token> &tokens) {
  for (size_t i = 0; i < tokens.size(); i++) {
    if (tokens[i].text.empty()) {
      throw std::invalid_argument("Token " + std::to_string(i) +
                                  " has empty text");
    }
    if (!(tokens[i].confidence >= 0.0f && tokens[i].confidence <= 1.0f)) {
      throw std::invalid_argument("Token " + std::to_string(i) +
                                  " has confidence outside [0,1]");
    }
  }
}

Grid TableBuilder::detectStructure(const std::vector<Token> &tokens,
                                   const ReconstructionConfig &config) {
  std::vector<Token> ordered = tokens;
  if (config.sortTokensByY) {
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Token &a, const Token &b) { return a.y < b.y; });
  }

  std::vector<Row> rows = RowClusterer(config).cluster(ordered);
  std::vector<ColumnAnchor> anchors = ColumnClusterer(config).cluster(ordered);
  return GridAligner().align(rows, anchors);
}

ExtractionResult TableBuilder::reconstruct(const std::vector<Token> &tokens,
                                           const std::string &backendName,
                                           Clock::time_point startTime) const {
  ExtractionResult result;
  result.backendName = backendName;
  result.tokenCount = static_cast<int>(tokens.size());

  auto elapsed = [&startTime]() {
    return roundTo(
        std::chrono::duration<double>(Clock::now() - startTime).count(), 2);
  };

  if (tokens.empty()) {
    result.errorKind = ErrorKind::NoTokensProduced;
    result.errorMessage = "No text detected";
    result.elapsedTime = elapsed();
    return result;
  }

  try {
    validateTokens(tokens);

    Grid grid = detectStructure(tokens, m_config);
    if (grid.empty()) {
      result.errorKind = ErrorKind::NoTableStructureDetected;
      result.errorMessage = "Could not detect table structure";
      result.elapsedTime = elapsed();
      return result;
    }

    Table table = TableNormalizer().normalize(grid);

    double totalConfidence = 0.0;
    for (const auto &token : tokens) {
      totalConfidence += token.confidence;
    }

    result.rowsExtracted = static_cast<int>(table.rowCount());
    result.columnsDetected = static_cast<int>(table.width());
    result.confidence = roundTo(totalConfidence / tokens.size(), 4);
    result.preview = formatPreview(table);
    result.table = std::move(table);
    result.success = true;
  } catch (const std::exception &e) {
    result = ExtractionResult();
    result.backendName = backendName;
    result.tokenCount = static_cast<int>(tokens.size());
    result.errorKind = ErrorKind::ReconstructionFailure;
    result.errorMessage = e.what();
  } catch (...) {
    result = ExtractionResult();
    result.backendName = backendName;
    result.tokenCount = static_cast<int>(tokens.size());
    result.errorKind = ErrorKind::ReconstructionFailure;
    result.errorMessage = "Unknown reconstruction error";
  }

  result.elapsedTime = elapsed();
  return result;
}

} // namespace tableocr
