#ifndef TABLEOCR_IMAGE_PREPROCESSOR_HPP
#define TABLEOCR_IMAGE_PREPROCESSOR_HPP

#include <opencv2/opencv.hpp>

namespace tableocr {

/**
 * @brief Options for preparing a scanned page for OCR
 */
struct PreprocessConfig {
  bool normalizeContrast = true; ///< Stretch grey levels to 0-255
  bool deskew = true;            ///< Rotate by the median Hough line angle
  bool binarize = false;         ///< Adaptive Gaussian threshold
};

/**
 * @brief Greyscale conversion, contrast stretch, deskew and binarization
 */
class ImagePreprocessor {
public:
  ImagePreprocessor() = default;
  explicit ImagePreprocessor(const PreprocessConfig &config);

  /**
   * @brief Apply the configured steps
   * @param image BGR, BGRA or greyscale image
   * @return Single-channel image; empty if @p image is empty
   */
  cv::Mat process(const cv::Mat &image) const;

  /// Convert to a single-channel image
  static cv::Mat toGray(const cv::Mat &image);

  /**
   * @brief Estimate the skew of a greyscale page
   * @return Median angle in degrees of the detected lines within (-45, 45),
   * or 0 when no lines are found
   */
  static double estimateSkew(const cv::Mat &gray);

  /// Rotate a greyscale page by @p angle degrees around its centre
  static cv::Mat rotate(const cv::Mat &gray, double angle);

private:
  PreprocessConfig m_config;
};

} // namespace tableocr

#endif // TABLEOCR_IMAGE_PREPROCESSOR_HPP
