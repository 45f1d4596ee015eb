#ifndef LAYOUT_CONFIG_HPP
#define LAYOUT_CONFIG_HPP

#include <string>

namespace layout {

/**
 * @brief Which frame of a run of repeated labels keeps the label
 */
enum class NarrowingPolicy {
  FirstFrame,        ///< Keep the first frame of every run (default)
  MostConfidentFrame ///< Keep the run frame with the highest logit
};

/**
 * @brief Configuration options for word geometry reconstruction and export
 */
struct LayoutConfig {
  float missingLogitValue = -80.0f; ///< Substitute for unstored logits
  NarrowingPolicy narrowingPolicy =
      NarrowingPolicy::FirstFrame; ///< Label narrowing policy
  bool liberalNarrowing = false;   ///< Rewrite runs to blank - 1
  int cropHeight = 16;             ///< Rows of the line coordinate grid
  int polynomialDegree = 2;        ///< Baseline fit degree of the cropper

  // ALTO processing metadata
  std::string softwareCreator = "Project PERO";
  std::string softwareName = "PERO OCR";
  std::string softwareVersion = "v0.1.0";
  std::string processingDate = ""; ///< YYYY-MM-DD (empty = today)

  bool verbose = false; ///< Print DEBUG lines to stderr
};

} // namespace layout

#endif // LAYOUT_CONFIG_HPP
