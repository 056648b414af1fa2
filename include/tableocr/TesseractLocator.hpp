#ifndef TABLEOCR_TESSERACT_LOCATOR_HPP
#define TABLEOCR_TESSERACT_LOCATOR_HPP

#include "tableocr/ImagePreprocessor.hpp"
#include "tableocr/TextLocator.hpp"

#include <opencv2/opencv.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace tableocr {

/**
 * @brief Configuration options for the Tesseract locator
 */
struct TesseractConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu+eng")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_AUTO;     ///< Page segmentation mode
  bool preprocessImage = true; ///< Run ImagePreprocessor before OCR
  PreprocessConfig preprocess; ///< Preprocessing steps
  bool autoRotate = false;     ///< Try all four orientations first
  int minConfidence = 30;      ///< Minimum word confidence (0-100)
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX)
};

/**
 * @brief Word-level locator backed by Tesseract
 *
 * Each recognized word becomes a Token placed at the centre of its bounding
 * box, with Tesseract's 0-100 confidence rescaled to 0-1.
 *
 * Example usage:
 * @code
 * auto locator = std::make_shared<tableocr::TesseractLocator>();
 * if (locator->initialize()) {
 *     auto tokens = locator->locate(cv::imread("table.png"));
 * }
 * @endcode
 */
class TesseractLocator : public TextLocator {
public:
  TesseractLocator();
  explicit TesseractLocator(const TesseractConfig &config);
  ~TesseractLocator() override;

  // Tesseract API is not copyable
  TesseractLocator(const TesseractLocator &) = delete;
  TesseractLocator &operator=(const TesseractLocator &) = delete;

  std::string name() const override;

  /**
   * @brief Initialize the Tesseract engine
   * @return true if initialization was successful, false otherwise
   */
  bool initialize() override;

  /**
   * @brief Recognize words in an image
   * @param image BGR, BGRA or greyscale image
   * @return Tokens in Tesseract's reading order
   * @throws std::runtime_error if the engine is not initialized or the image
   * is empty
   */
  std::vector<Token> locate(const cv::Mat &image) override;

  static std::string getTesseractVersion();

private:
  /**
   * @brief Hand an OpenCV image to Tesseract as RGB
   */
  void setImage(const cv::Mat &image);

  /**
   * @brief Find the best rotation for an image by trying all 4 orientations
   * @return Rotation code (-1 = no rotation, or cv::ROTATE_* constant)
   */
  int findBestRotation(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;          ///< Tesseract API instance
  TesseractConfig m_config; ///< Current configuration
  bool m_initialized;       ///< Initialization state
};

} // namespace tableocr

#endif // TABLEOCR_TESSERACT_LOCATOR_HPP
