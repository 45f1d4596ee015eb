#ifndef LAYOUT_GEOMETRY_HPP
#define LAYOUT_GEOMETRY_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace layout {

/// Ordered sequence of pixel coordinates (polygon or polyline)
using PointList = std::vector<cv::Point>;

/**
 * @brief Axis-aligned bounding box of a point set
 *
 * Width and height are max - min, so a single point gives a zero-size box.
 * @param points Input points
 * @return Bounding box, or an empty rect for an empty point set
 */
cv::Rect boundingBox(const PointList &points);

/**
 * @brief Four corners of a rectangle, clockwise from the top-left corner
 */
PointList rectanglePolygon(const cv::Rect &rect);

/**
 * @brief Average y coordinate of a polyline
 * @return Mean of the y values, 0 for an empty polyline
 */
double averageY(const PointList &points);

/**
 * @brief Parse a PAGE XML points string ("x,y x,y ...")
 *
 * Coordinates may be real numbers; they are rounded to the nearest integer.
 * @throws MalformedDocument if a pair cannot be parsed
 */
PointList stringToPoints(const std::string &points);

/**
 * @brief Format points as a PAGE XML points string
 */
std::string pointsToString(const PointList &points);

} // namespace layout

#endif // LAYOUT_GEOMETRY_HPP
