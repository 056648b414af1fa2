#include "tableocr/LocatorChain.hpp"
#include "tableocr/TableBuilder.hpp"
#include "tableocr/TableWriter.hpp"
#include "tableocr/TesseractLocator.hpp"
#include "tableocr/TokenListLocator.hpp"

#include <iomanip>
#include <iostream>
#include <memory>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <image_path> [options]\n"
      << "\nOptions:\n"
      << "  -l, --language <lang>   Set OCR language (default: eng)\n"
      << "  -c, --confidence <val>  Minimum word confidence (0-100, "
         "default: 30)\n"
      << "      --psm <mode>        Tesseract page segmentation mode\n"
      << "      --no-preprocess     Skip image preprocessing\n"
      << "      --no-deskew         Skip deskewing\n"
      << "      --tokens <file>     Try a TEXT|Y|X|CONF token list first\n"
      << "      --scale <n>         Position scale for --tokens "
         "(default: 20)\n"
      << "      --sort-rows         Re-sort tokens top to bottom first\n"
      << "  -o, --output <file>     Write the table (.csv or .xml)\n"
      << "  -r, --regions           Show the reconstructed grid cells\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " scan.png -o report.xml\n"
      << "  " << programName << " scan.png --tokens words.txt -o report.csv\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string imagePath;
  std::string tokensPath;
  std::string outputPath;
  double tokenScale = 20.0;
  bool showRegions = false;
  tableocr::TesseractConfig tessConfig;
  tableocr::ReconstructionConfig reconConfig;

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      bool hasValue = i + 1 < argc;

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if ((arg == "-l" || arg == "--language") && hasValue) {
        tessConfig.language = argv[++i];
      } else if ((arg == "-c" || arg == "--confidence") && hasValue) {
        tessConfig.minConfidence = std::stoi(argv[++i]);
      } else if (arg == "--psm" && hasValue) {
        tessConfig.pageSegMode =
            static_cast<tesseract::PageSegMode>(std::stoi(argv[++i]));
      } else if (arg == "--no-preprocess") {
        tessConfig.preprocessImage = false;
      } else if (arg == "--no-deskew") {
        tessConfig.preprocess.deskew = false;
      } else if (arg == "--tokens" && hasValue) {
        tokensPath = argv[++i];
      } else if (arg == "--scale" && hasValue) {
        tokenScale = std::stod(argv[++i]);
      } else if (arg == "--sort-rows") {
        reconConfig.sortTokensByY = true;
      } else if ((arg == "-o" || arg == "--output") && hasValue) {
        outputPath = argv[++i];
      } else if (arg == "-r" || arg == "--regions") {
        showRegions = true;
      } else if (arg[0] != '-') {
        imagePath = arg;
      } else {
        std::cerr << "Unknown option or missing argument: " << arg << "\n";
        printUsage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
    return 1;
  }

  if (imagePath.empty()) {
    std::cerr << "Error: No image path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  std::vector<std::shared_ptr<tableocr::TextLocator>> locators;
  if (!tokensPath.empty()) {
    locators.push_back(
        std::make_shared<tableocr::TokenListLocator>(tokensPath, tokenScale));
  }
  locators.push_back(std::make_shared<tableocr::TesseractLocator>(tessConfig));

  std::unique_ptr<tableocr::TableBuilder> builder;
  try {
    builder = std::make_unique<tableocr::TableBuilder>(
        tableocr::LocatorChain(locators), reconConfig);
  } catch (const tableocr::BackendUnavailable &e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
  }

  std::cout << "=== Table OCR ===\n"
            << "Tesseract version: "
            << tableocr::TesseractLocator::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << tessConfig.language << "\n"
            << "=================\n\n";

  std::cout << "Extracting table from: " << imagePath << "\n";
  std::cout << "-------------------------------------------\n";

  auto result = builder->extractTable(imagePath);

  if (!result.success) {
    std::cerr << "Extraction failed (" << tableocr::toString(result.errorKind)
              << "): " << result.errorMessage << "\n";
    std::cerr << "Backend: " << result.backendName
              << ", time: " << std::fixed << std::setprecision(2)
              << result.elapsedTime << " s\n";
    return 1;
  }

  const tableocr::Table &table = *result.table;

  std::cout << "\n[Preview]\n";
  std::cout << "-------------------------------------------\n";
  std::cout << result.preview << "\n";
  std::cout << "-------------------------------------------\n";

  if (showRegions) {
    std::cout << "\n[Cells]\n";
    std::cout << std::setw(6) << "Row" << std::setw(8) << "Col"
              << std::setw(10) << "Type"
              << "  Value\n";
    std::cout << std::string(60, '-') << "\n";
    for (size_t r = 0; r < table.rowCount(); ++r) {
      for (size_t c = 0; c < table.width(); ++c) {
        const auto &cell = table.rows[r][c];
        const char *type = cell.isMissing()  ? "missing"
                           : cell.isNumber() ? "number"
                                             : "text";
        std::cout << std::setw(6) << (r + 1) << std::setw(8) << (c + 1)
                  << std::setw(10) << type << "  " << cell.toString() << "\n";
      }
    }
  }

  std::cout << "\nBackend: " << result.backendName << "\n"
            << "Tokens: " << result.tokenCount << "\n"
            << "Rows extracted: " << result.rowsExtracted << "\n"
            << "Columns detected: " << result.columnsDetected << "\n"
            << "Mean confidence: " << std::fixed << std::setprecision(4)
            << result.confidence << "\n"
            << "Processing time: " << std::setprecision(2)
            << result.elapsedTime << " s\n";

  if (!outputPath.empty()) {
    try {
      tableocr::writeTable(table, outputPath);
      std::cout << "Saved table to: " << outputPath << "\n";
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  return 0;
}
