#ifndef TABLEOCR_LOCATOR_CHAIN_HPP
#define TABLEOCR_LOCATOR_CHAIN_HPP

#include "tableocr/TextLocator.hpp"
#include "tableocr/Token.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace tableocr {

/**
 * @brief Raised when no locator in a chain could be initialized
 */
class BackendUnavailable : public std::runtime_error {
public:
  explicit BackendUnavailable(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Tokens together with the backend that produced them
 */
struct LocatedTokens {
  std::vector<Token> tokens;
  std::string backendName;
};

/**
 * @brief Ordered list of locators tried one after another
 *
 * Example usage:
 * @code
 * tableocr::LocatorChain chain({std::make_shared<TesseractLocator>()});
 * auto located = chain.locate(image);
 * @endcode
 */
class LocatorChain {
public:
  /**
   * @brief Initialize every locator, keeping those that succeed
   * @throws BackendUnavailable if none of them initializes
   */
  explicit LocatorChain(std::vector<std::shared_ptr<TextLocator>> locators);

  /**
   * @brief Run locators in order until one returns tokens
   *
   * A locator that throws or finds nothing is skipped. When all of them come
   * up empty the result has no tokens and names the primary locator.
   */
  LocatedTokens locate(const cv::Mat &image) const;

  /// Name of the first available locator
  const std::string &primaryName() const { return m_primaryName; }

  /// Names of the available locators in order
  std::vector<std::string> names() const;

private:
  std::vector<std::shared_ptr<TextLocator>> m_locators;
  std::string m_primaryName;
};

} // namespace tableocr

#endif // TABLEOCR_LOCATOR_CHAIN_HPP
