#include "tableocr/ImagePreprocessor.hpp"
#include "tableocr/Token.hpp"

// Define M_PI if not already defined (Windows)
#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace tableocr {

ImagePreprocessor::ImagePreprocessor(const PreprocessConfig &config)
    : m_config(config) {}

cv::Mat ImagePreprocessor::toGray(const cv::Mat &image) {
  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }
  return gray;
}

double ImagePreprocessor::estimateSkew(const cv::Mat &gray) {
  cv::Mat edges;
  cv::Canny(gray, edges, 50, 150, 3);

  std::vector<cv::Vec2f> lines;
  cv::HoughLines(edges, lines, 1, CV_PI / 180, 200);
  if (lines.empty()) {
    return 0.0;
  }

  std::vector<double> angles;
  for (const auto &line : lines) {
    double angle = line[1] * 180.0 / M_PI - 90.0;
    if (angle > -45.0 && angle < 45.0) {
      angles.push_back(angle);
    }
  }
  if (angles.empty()) {
    return 0.0;
  }

  return median(angles);
}

cv::Mat ImagePreprocessor::rotate(const cv::Mat &gray, double angle) {
  cv::Point2f center(gray.cols / 2.0f, gray.rows / 2.0f);
  cv::Mat rotationMatrix = cv::getRotationMatrix2D(center, angle, 1.0);
  cv::Mat rotated;
  cv::warpAffine(gray, rotated, rotationMatrix, gray.size(), cv::INTER_CUBIC,
                 cv::BORDER_REPLICATE);
  return rotated;
}

cv::Mat ImagePreprocessor::process(const cv::Mat &image) const {
  if (image.empty()) {
    return cv::Mat();
  }

  cv::Mat processed = toGray(image);

  if (m_config.normalizeContrast) {
    cv::normalize(processed, processed, 0, 255, cv::NORM_MINMAX);
  }

  if (m_config.deskew) {
    double angle = estimateSkew(processed);
    if (angle != 0.0) {
      processed = rotate(processed, angle);
    }
  }

  if (m_config.binarize) {
    cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);
    cv::adaptiveThreshold(processed, processed, 255,
                          cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY,
                          11, 2);
  }

  return processed;
}

} // namespace tableocr
