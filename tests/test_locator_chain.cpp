#include <catch2/catch_all.hpp>

#include "tableocr/LocatorChain.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using tableocr::LocatorChain;
using tableocr::Token;

namespace {

class FakeLocator : public tableocr::TextLocator {
public:
  FakeLocator(std::string name, bool initOk, std::vector<Token> tokens,
              bool fails = false)
      : m_name(std::move(name)), m_initOk(initOk), m_tokens(std::move(tokens)),
        m_fails(fails) {}

  std::string name() const override { return m_name; }
  bool initialize() override { return m_initOk; }

  std::vector<Token> locate(const cv::Mat &) override {
    calls++;
    if (m_fails) {
      throw std::runtime_error(m_name + " is down");
    }
    return m_tokens;
  }

  int calls = 0;

private:
  std::string m_name;
  bool m_initOk;
  std::vector<Token> m_tokens;
  bool m_fails;
};

std::vector<Token> oneToken() { return {{"word", 10, 10, 0.9f}}; }

} // namespace

TEST_CASE("LocatorChain throws when no locator initializes", "[chain]") {
  auto a = std::make_shared<FakeLocator>("A", false, oneToken());
  auto b = std::make_shared<FakeLocator>("B", false, oneToken());

  REQUIRE_THROWS_AS(LocatorChain({a, b}), tableocr::BackendUnavailable);
  REQUIRE_THROWS_AS(LocatorChain({}), tableocr::BackendUnavailable);
}

TEST_CASE("LocatorChain skips locators that fail to initialize",
          "[chain]") {
  auto a = std::make_shared<FakeLocator>("A", false, oneToken());
  auto b = std::make_shared<FakeLocator>("B", true, oneToken());

  LocatorChain chain({a, nullptr, b});

  REQUIRE(chain.names() == std::vector<std::string>{"B"});
  REQUIRE(chain.primaryName() == "B");
}

TEST_CASE("LocatorChain falls back after an error", "[chain]") {
  auto a = std::make_shared<FakeLocator>("A", true, oneToken(), true);
  auto b = std::make_shared<FakeLocator>("B", true, oneToken());

  LocatorChain chain({a, b});
  auto located = chain.locate(cv::Mat());

  REQUIRE(located.backendName == "B");
  REQUIRE(located.tokens.size() == 1);
  REQUIRE(a->calls == 1);
}

TEST_CASE("LocatorChain falls back after an empty result", "[chain]") {
  auto a = std::make_shared<FakeLocator>("A", true, std::vector<Token>());
  auto b = std::make_shared<FakeLocator>("B", true, oneToken());
  auto c = std::make_shared<FakeLocator>("C", true, oneToken());

  LocatorChain chain({a, b, c});
  auto located = chain.locate(cv::Mat());

  REQUIRE(located.backendName == "B");
  REQUIRE(c->calls == 0);
}

TEST_CASE("LocatorChain names the primary locator when all are empty",
          "[chain]") {
  auto a = std::make_shared<FakeLocator>("A", true, std::vector<Token>());
  auto b = std::make_shared<FakeLocator>("B", true, std::vector<Token>(),
                                         true);

  LocatorChain chain({a, b});
  auto located = chain.locate(cv::Mat());

  REQUIRE(located.tokens.empty());
  REQUIRE(located.backendName == "A");
  REQUIRE(b->calls == 1);
}
