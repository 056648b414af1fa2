#include <catch2/catch_all.hpp>

#include "tableocr/TesseractLocator.hpp"

#include <stdexcept>
#include <type_traits>

using tableocr::TesseractLocator;

static_assert(!std::is_copy_constructible<TesseractLocator>::value,
              "TesseractLocator owns a TessBaseAPI");
static_assert(!std::is_move_constructible<TesseractLocator>::value,
              "TesseractLocator is shared through a pointer");

TEST_CASE("TesseractLocator names itself", "[tesseract]") {
  TesseractLocator locator;
  REQUIRE(locator.name() == "TESSERACT");
  REQUIRE_FALSE(TesseractLocator::getTesseractVersion().empty());
}

TEST_CASE("TesseractLocator refuses to locate before initialize",
          "[tesseract]") {
  tableocr::TesseractConfig config;
  config.autoRotate = true;
  TesseractLocator locator(config);

  cv::Mat page(40, 40, CV_8UC1, cv::Scalar(255));
  REQUIRE_THROWS_AS(locator.locate(page), std::runtime_error);
}
