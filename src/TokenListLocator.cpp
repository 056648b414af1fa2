#include "tableocr/TokenListLocator.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tableocr {

namespace {

std::vector<std::string> splitFields(const std::string &line) {
  std::vector<std::string> fields;
  std::stringstream stream(line);
  std::string field;
  while (std::getline(stream, field, '|')) {
    fields.push_back(trimText(field));
  }
  return fields;
}

// Whole-field parse; std::stoi alone would accept "12px"
bool parseInt(const std::string &field, int &value) {
  try {
    size_t consumed = 0;
    value = std::stoi(field, &consumed);
    return consumed == field.size();
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

bool parsePercent(std::string field, double &value) {
  if (!field.empty() && field.back() == '%') {
    field.pop_back();
  }
  field = trimText(field);
  try {
    size_t consumed = 0;
    value = std::stod(field, &consumed) / 100.0;
    return consumed == field.size();
  } catch (const std::invalid_argument &) {
    return false;
  } catch (const std::out_of_range &) {
    return false;
  }
}

} // namespace

std::vector<Token> parseDelimitedTokens(const std::string &text,
                                        double positionScale,
                                        float minConfidence) {
  std::vector<Token> tokens;
  std::stringstream stream(text);
  std::string line;

  while (std::getline(stream, line)) {
    line = trimText(line);
    if (line.find('|') == std::string::npos) {
      continue;
    }

    std::vector<std::string> fields = splitFields(line);
    if (fields.size() < 4) {
      continue;
    }

    int y = 0;
    int x = 0;
    double confidence = 0.0;
    if (!parseInt(fields[1], y) || !parseInt(fields[2], x) ||
        !parsePercent(fields[3], confidence)) {
      continue;
    }

    if (fields[0].empty() || confidence < minConfidence) {
      continue;
    }

    Token token;
    token.text = fields[0];
    token.y = static_cast<int>(std::lround(y * positionScale));
    token.x = static_cast<int>(std::lround(x * positionScale));
    token.confidence = static_cast<float>(std::min(1.0, confidence));
    tokens.push_back(token);
  }

  return tokens;
}

TokenListLocator::TokenListLocator(const std::string &path,
                                   double positionScale)
    : m_path(path), m_positionScale(positionScale) {}

TokenListLocator TokenListLocator::fromString(const std::string &listing,
                                              double positionScale) {
  TokenListLocator locator;
  locator.m_listing = listing;
  locator.m_positionScale = positionScale;
  locator.m_loaded = true;
  return locator;
}

std::string TokenListLocator::name() const { return "TOKEN_LIST"; }

bool TokenListLocator::initialize() {
  if (m_loaded) {
    return true;
  }

  std::ifstream ifs(m_path);
  if (!ifs) {
    return false;
  }
  std::stringstream buffer;
  buffer << ifs.rdbuf();
  m_listing = buffer.str();
  m_loaded = true;
  return true;
}

std::vector<Token> TokenListLocator::locate(const cv::Mat & /*image*/) {
  if (!m_loaded) {
    throw std::runtime_error("Token list not loaded: " + m_path);
  }
  return parseDelimitedTokens(m_listing, m_positionScale);
}

} // namespace tableocr
