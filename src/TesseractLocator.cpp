#include "tableocr/TesseractLocator.hpp"

#include <tesseract/resultiterator.h>

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace tableocr {

TesseractLocator::TesseractLocator()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

TesseractLocator::TesseractLocator(const TesseractConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()),
      m_config(config), m_initialized(false) {}

TesseractLocator::~TesseractLocator() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

std::string TesseractLocator::name() const { return "TESSERACT"; }

bool TesseractLocator::initialize() {
  if (m_initialized) {
    return true;
  }
  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: TESSDATA_PREFIX, otherwise Tesseract's compiled-in default
  else {
    tessDataPath = std::getenv("TESSDATA_PREFIX");
    if (tessDataPath == nullptr) {
      std::cerr << "[TableOCR] TESSDATA_PREFIX not set, using Tesseract's "
                   "default tessdata location"
                << std::endl;
    }
  }

  int result = m_tesseract->Init(tessDataPath, m_config.language.c_str());

  if (result != 0) {
    std::cerr << "[TableOCR] Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_initialized = true;
  return true;
}

std::vector<Token> TesseractLocator::locate(const cv::Mat &image) {
  if (!m_initialized) {
    throw std::runtime_error(
        "OCR engine not initialized. Call initialize() first.");
  }
  if (image.empty()) {
    throw std::runtime_error("Input image is empty");
  }

  cv::Mat workingImage = m_config.preprocessImage
                             ? ImagePreprocessor(m_config.preprocess)
                                   .process(image)
                             : image;

  if (m_config.autoRotate) {
    int bestRotation = findBestRotation(workingImage);
    if (bestRotation != -1) {
      cv::Mat rotated;
      cv::rotate(workingImage, rotated, bestRotation);
      workingImage = rotated;
    }
  }

  setImage(workingImage);

  // Must call Recognize before GetIterator
  if (m_tesseract->Recognize(nullptr) != 0) {
    throw std::runtime_error("Tesseract recognition failed");
  }

  std::vector<Token> tokens;
  tesseract::ResultIterator *ri = m_tesseract->GetIterator();
  tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

  if (ri != nullptr) {
    do {
      const char *word = ri->GetUTF8Text(level);

      if (word != nullptr && *word != '\0') {
        int x1, y1, x2, y2;
        ri->BoundingBox(level, &x1, &y1, &x2, &y2);

        Token token;
        token.text = word;
        token.y = (y1 + y2) / 2;
        token.x = (x1 + x2) / 2;
        token.confidence = ri->Confidence(level) / 100.0f;
        tokens.push_back(token);
      }

      delete[] word;
    } while (ri->Next(level));

    delete ri;
  }

  return sanitizeTokens(tokens, m_config.minConfidence / 100.0f);
}

std::string TesseractLocator::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

void TesseractLocator::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Convert to RGB if necessary (Tesseract expects RGB)
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

int TesseractLocator::findBestRotation(const cv::Mat &image) {
  struct RotationResult {
    int rotationCode;
    double avgConfidence;
    int wordCount;
  };

  std::vector<RotationResult> rotationResults;

  // No rotation, 90 CW, 180, 90 CCW
  std::vector<int> rotations = {-1, cv::ROTATE_90_CLOCKWISE, cv::ROTATE_180,
                                cv::ROTATE_90_COUNTERCLOCKWISE};

  for (int rotationCode : rotations) {
    cv::Mat testImage;
    if (rotationCode == -1) {
      testImage = image;
    } else {
      cv::rotate(image, testImage, rotationCode);
    }

    setImage(testImage);
    if (m_tesseract->Recognize(nullptr) != 0) {
      continue;
    }

    double totalConfidence = 0.0;
    int wordCount = 0;

    tesseract::ResultIterator *ri = m_tesseract->GetIterator();
    if (ri != nullptr) {
      tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
      do {
        const char *word = ri->GetUTF8Text(level);
        if (word != nullptr && *word != '\0') {
          totalConfidence += ri->Confidence(level);
          wordCount++;
        }
        delete[] word;
      } while (ri->Next(level));
      delete ri;
    }

    double avgConf = (wordCount > 0) ? (totalConfidence / wordCount) : 0.0;
    rotationResults.push_back({rotationCode, avgConf, wordCount});
  }

  int bestRotation = -1;
  double bestConfidence = -1.0;
  for (const auto &result : rotationResults) {
    if (result.wordCount >= 1 && result.avgConfidence > bestConfidence) {
      bestConfidence = result.avgConfidence;
      bestRotation = result.rotationCode;
    }
  }

  return bestRotation;
}

} // namespace tableocr
