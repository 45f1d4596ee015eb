#ifndef LAYOUT_PAGE_LAYOUT_HPP
#define LAYOUT_PAGE_LAYOUT_HPP

#include "Geometry.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace layout {

/**
 * @brief Vertical extent of a text line around its baseline, in pixels
 */
struct LineHeights {
  float ascent = 0.0f;  ///< Extent above the baseline
  float descent = 0.0f; ///< Extent below the baseline

  bool operator==(const LineHeights &other) const {
    return ascent == other.ascent && descent == other.descent;
  }
  bool operator!=(const LineHeights &other) const { return !(*this == other); }
};

/**
 * @brief A single line of text inside a region
 *
 * Per-line logits and alphabets are not stored here; they are kept by
 * LogitsStore and keyed by the line id.
 */
struct TextLine {
  std::string id;     ///< Unique within the page (logits key)
  PointList baseline; ///< Writing line, empty when absent
  PointList polygon;  ///< Ink boundary, empty when absent
  std::optional<LineHeights> heights; ///< Ascent/descent around baseline
  std::optional<std::string>
      transcription; ///< Absent = not annotated, empty = annotated blank
};

/**
 * @brief A text region with its bounding polygon and lines
 */
struct Region {
  std::string id;    ///< Unique within the page
  PointList polygon; ///< Bounding polygon, not required to be closed
  std::optional<std::string> transcription; ///< Whole-region text
  std::vector<TextLine> lines;              ///< Lines in document order
};

/**
 * @brief A page of layout: regions in export order
 */
struct Page {
  std::string id; ///< Source image name
  int height = 0; ///< Page height in pixels
  int width = 0;  ///< Page width in pixels
  std::vector<Region> regions;

  /**
   * @brief All lines of the page, region by region
   */
  std::vector<std::reference_wrapper<const TextLine>> lines() const;

  /**
   * @brief Mutable access to all lines of the page, region by region
   */
  std::vector<std::reference_wrapper<TextLine>> lines();

  /**
   * @brief Find a line by id
   * @return Pointer to the line, nullptr if the page has no such line
   */
  const TextLine *findLine(const std::string &lineId) const;
};

/**
 * @brief Check region id and line id uniqueness
 * @throws MalformedDocument naming the first duplicate found
 */
void validateIdentifiers(const Page &page);

} // namespace layout

#endif // LAYOUT_PAGE_LAYOUT_HPP
