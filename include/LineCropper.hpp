#ifndef LAYOUT_LINE_CROPPER_HPP
#define LAYOUT_LINE_CROPPER_HPP

#include "PageLayout.hpp"

#include <opencv2/core.hpp>

namespace layout {

/**
 * @brief Produces the pixel coordinate grid of a curved text line crop
 */
class LineCropper {
public:
  virtual ~LineCropper() = default;

  /**
   * @brief Source pixel coordinates of every crop pixel
   * @param baseline Baseline of the line
   * @param heights Ascent and descent around the baseline
   * @param cropHeight Number of rows of the grid
   * @return CV_32FC2 matrix (cropHeight x crop width) of (x, y) positions
   */
  virtual cv::Mat cropCoordinates(const PointList &baseline,
                                  const LineHeights &heights,
                                  int cropHeight) const = 0;
};

/**
 * @brief Line cropper following a polynomial fit of the baseline
 *
 * The baseline is sampled at every integer x between its leftmost and
 * rightmost points. Grid rows follow the baseline normal from the ascent
 * above the baseline down to the descent below it, and the crop keeps the
 * aspect ratio of the line.
 */
class BaselineLineCropper : public LineCropper {
public:
  /**
   * @param polynomialDegree Degree of the baseline fit (lowered for
   * baselines with few points)
   */
  explicit BaselineLineCropper(int polynomialDegree = 2);

  cv::Mat cropCoordinates(const PointList &baseline,
                          const LineHeights &heights,
                          int cropHeight) const override;

private:
  int m_degree;
};

} // namespace layout

#endif // LAYOUT_LINE_CROPPER_HPP
