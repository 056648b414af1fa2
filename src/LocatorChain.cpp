#include "tableocr/LocatorChain.hpp"

#include <iostream>

namespace tableocr {

LocatorChain::LocatorChain(std::vector<std::shared_ptr<TextLocator>> locators) {
  for (auto &locator : locators) {
    if (!locator) {
      continue;
    }
    if (!locator->initialize()) {
      std::cerr << "[TableOCR] Locator " << locator->name()
                << " failed to initialize, skipping" << std::endl;
      continue;
    }
    m_locators.push_back(std::move(locator));
  }

  if (m_locators.empty()) {
    throw BackendUnavailable(
        "No OCR backend available. Check that tessdata is installed "
        "(TESSDATA_PREFIX) or supply a token list.");
  }

  m_primaryName = m_locators.front()->name();
}

LocatedTokens LocatorChain::locate(const cv::Mat &image) const {
  for (size_t i = 0; i < m_locators.size(); i++) {
    const auto &locator = m_locators[i];
    bool hasNext = i + 1 < m_locators.size();

    try {
      std::vector<Token> tokens = locator->locate(image);
      if (!tokens.empty()) {
        return {std::move(tokens), locator->name()};
      }
      if (hasNext) {
        std::cerr << "[TableOCR] " << locator->name()
                  << " returned no results, trying "
                  << m_locators[i + 1]->name() << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "[TableOCR] " << locator->name()
                << " extraction error: " << e.what() << std::endl;
      if (hasNext) {
        std::cerr << "[TableOCR] Falling back to "
                  << m_locators[i + 1]->name() << std::endl;
      }
    }
  }

  return {{}, m_primaryName};
}

std::vector<std::string> LocatorChain::names() const {
  std::vector<std::string> result;
  for (const auto &locator : m_locators) {
    result.push_back(locator->name());
  }
  return result;
}

} // namespace tableocr
