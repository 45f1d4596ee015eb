#include "ForcedAligner.hpp"
#include "LayoutErrors.hpp"
#include "LayoutXml.hpp"
#include "LineCropper.hpp"
#include "LogitsStore.hpp"
#include "WordAlignment.hpp"

#include <iostream>
#include <string>
#include <vector>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <layout_xml> [options]\n"
      << "\nOptions:\n"
      << "  --alto-in               Input is ALTO XML (default: PAGE XML)\n"
      << "  -l, --logits <file>     Load line logits snapshot\n"
      << "  -p, --page-out <file>   Write PAGE XML\n"
      << "  -a, --alto-out <file>   Write ALTO XML with word boxes\n"
      << "  --save-logits <file>    Write the logits snapshot again\n"
      << "  --liberal               Narrow repeated labels to blank-1\n"
      << "  --most-confident        Keep the most confident frame of a run\n"
      << "  --crop-height <n>       Line crop height (default: 16)\n"
      << "  --missing-logit <val>   Value of unstored logits (default: -80)\n"
      << "  --date <YYYY-MM-DD>     ALTO processing date (default: today)\n"
      << "  -v, --verbose           Print alignment details\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " page.xml -l page.logits.yml -a alto.xml\n"
      << "  " << programName << " alto.xml --alto-in -p page.xml\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string inputPath;
  std::string logitsPath;
  std::string pageOutPath;
  std::string altoOutPath;
  std::string saveLogitsPath;
  bool altoInput = false;
  layout::LayoutConfig config;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "--alto-in") {
      altoInput = true;
    } else if (arg == "-l" || arg == "--logits") {
      if (i + 1 < argc) {
        logitsPath = argv[++i];
      } else {
        std::cerr << "Error: --logits requires an argument\n";
        return 1;
      }
    } else if (arg == "-p" || arg == "--page-out") {
      if (i + 1 < argc) {
        pageOutPath = argv[++i];
      } else {
        std::cerr << "Error: --page-out requires an argument\n";
        return 1;
      }
    } else if (arg == "-a" || arg == "--alto-out") {
      if (i + 1 < argc) {
        altoOutPath = argv[++i];
      } else {
        std::cerr << "Error: --alto-out requires an argument\n";
        return 1;
      }
    } else if (arg == "--save-logits") {
      if (i + 1 < argc) {
        saveLogitsPath = argv[++i];
      } else {
        std::cerr << "Error: --save-logits requires an argument\n";
        return 1;
      }
    } else if (arg == "--liberal") {
      config.liberalNarrowing = true;
    } else if (arg == "--most-confident") {
      config.narrowingPolicy = layout::NarrowingPolicy::MostConfidentFrame;
    } else if (arg == "--crop-height") {
      if (i + 1 < argc) {
        try {
          config.cropHeight = std::stoi(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: Invalid crop height: " << argv[i] << "\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --crop-height requires an argument\n";
        return 1;
      }
    } else if (arg == "--missing-logit") {
      if (i + 1 < argc) {
        try {
          config.missingLogitValue = std::stof(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: Invalid logit value: " << argv[i] << "\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --missing-logit requires an argument\n";
        return 1;
      }
    } else if (arg == "--date") {
      if (i + 1 < argc) {
        config.processingDate = argv[++i];
      } else {
        std::cerr << "Error: --date requires an argument\n";
        return 1;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg[0] != '-') {
      inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (inputPath.empty()) {
    std::cerr << "Error: No layout file provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (config.cropHeight <= 0) {
    std::cerr << "Error: Crop height must be positive\n";
    return 1;
  }

  try {
    layout::Page page = altoInput ? layout::readAltoXml(inputPath)
                                  : layout::readPageXml(inputPath);

    std::cout << "Loaded " << inputPath << ": page " << page.id << " ("
              << page.width << "x" << page.height << "), "
              << page.regions.size() << " regions, " << page.lines().size()
              << " lines\n";

    layout::LogitsStore store;
    if (!logitsPath.empty()) {
      store = layout::LogitsStore::load(page, logitsPath);
      std::cout << "Loaded logits for " << store.size() << " lines\n";
    }

    if (!saveLogitsPath.empty()) {
      store.save(page, saveLogitsPath);
      std::cout << "Saved logits: " << saveLogitsPath << "\n";
    }

    if (!pageOutPath.empty()) {
      layout::writePageXml(page, pageOutPath);
      std::cout << "Saved PAGE XML: " << pageOutPath << "\n";
    }

    if (!altoOutPath.empty()) {
      layout::CtcForcedAligner aligner;
      layout::BaselineLineCropper cropper(config.polynomialDegree);
      layout::WordGeometryReconstructor reconstructor(store, aligner, cropper,
                                                      config);

      std::vector<std::string> failedLines;
      layout::writeAltoXml(page, reconstructor, altoOutPath, config,
                           &failedLines);
      std::cout << "Saved ALTO XML: " << altoOutPath << "\n";
      if (!failedLines.empty()) {
        std::cout << "Lines without word geometry: " << failedLines.size()
                  << "\n";
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
