#include "tableocr/LocatorChain.hpp"
#include "tableocr/TableBuilder.hpp"
#include "tableocr/TesseractLocator.hpp"

#include <iostream>
#include <opencv2/opencv.hpp>

int main() {
  // Draw a small three-column table
  cv::Mat testImage(260, 640, CV_8UC3, cv::Scalar(255, 255, 255));

  const char *cells[4][3] = {{"Item", "Qty", "Price"},
                             {"Paper", "12", "4.50"},
                             {"Pens", "30", "1.25"},
                             {"Stapler", "2", "9.99"}};
  const int columnX[3] = {40, 280, 460};

  for (int r = 0; r < 4; ++r) {
    for (int c = 0; c < 3; ++c) {
      cv::putText(testImage, cells[r][c], cv::Point(columnX[c], 50 + r * 60),
                  cv::FONT_HERSHEY_SIMPLEX, 1.0, cv::Scalar(0, 0, 0), 2);
    }
  }

  cv::imwrite("test_table_generated.png", testImage);
  std::cout << "Created test image: test_table_generated.png\n\n";

  // Clean digital image, no preprocessing needed
  tableocr::TesseractConfig config;
  config.language = "eng";
  config.preprocessImage = false;
  config.pageSegMode = tesseract::PSM_SPARSE_TEXT;

  try {
    tableocr::TableBuilder builder(tableocr::LocatorChain(
        {std::make_shared<tableocr::TesseractLocator>(config)}));

    std::cout << "Tesseract version: "
              << tableocr::TesseractLocator::getTesseractVersion() << "\n";
    std::cout << "Running table extraction on generated image...\n\n";

    auto result = builder.extractTable(testImage);

    if (!result.success) {
      std::cerr << "Extraction failed: " << result.errorMessage << "\n";
      return 1;
    }

    std::cout << "=== Reconstructed Table ===\n";
    std::cout << result.preview << "\n";
    std::cout << "===========================\n\n";

    const auto &table = *result.table;
    for (size_t c = 0; c < table.width(); ++c) {
      std::cout << "  [" << (c + 1) << "] \"" << table.columnLabel(c) << "\" "
                << (table.columnTypes[c] == tableocr::ColumnType::Numeric
                        ? "(numeric)"
                        : "(text)")
                << "\n";
    }

    std::cout << "\nRows: " << result.rowsExtracted
              << ", columns: " << result.columnsDetected
              << ", confidence: " << result.confidence << "\n";
    std::cout << "Processing time: " << result.elapsedTime << " s\n";
  } catch (const tableocr::BackendUnavailable &e) {
    std::cerr << "Failed to initialize OCR engine: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
