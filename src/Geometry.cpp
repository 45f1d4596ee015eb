#include "Geometry.hpp"
#include "LayoutErrors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace layout {

cv::Rect boundingBox(const PointList &points) {
  if (points.empty()) {
    return cv::Rect();
  }

  int minX = points[0].x;
  int maxX = points[0].x;
  int minY = points[0].y;
  int maxY = points[0].y;
  for (const auto &p : points) {
    minX = std::min(minX, p.x);
    maxX = std::max(maxX, p.x);
    minY = std::min(minY, p.y);
    maxY = std::max(maxY, p.y);
  }

  return cv::Rect(minX, minY, maxX - minX, maxY - minY);
}

PointList rectanglePolygon(const cv::Rect &rect) {
  return {cv::Point(rect.x, rect.y), cv::Point(rect.x + rect.width, rect.y),
          cv::Point(rect.x + rect.width, rect.y + rect.height),
          cv::Point(rect.x, rect.y + rect.height)};
}

double averageY(const PointList &points) {
  if (points.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto &p : points) {
    sum += p.y;
  }
  return sum / static_cast<double>(points.size());
}

PointList stringToPoints(const std::string &points) {
  PointList result;
  std::istringstream stream(points);
  std::string pair;

  while (stream >> pair) {
    size_t comma = pair.find(',');
    if (comma == std::string::npos) {
      throw MalformedDocument("Invalid point \"" + pair +
                              "\" in points string");
    }

    try {
      size_t usedX = 0;
      size_t usedY = 0;
      std::string xs = pair.substr(0, comma);
      std::string ys = pair.substr(comma + 1);
      double x = std::stod(xs, &usedX);
      double y = std::stod(ys, &usedY);
      if (usedX != xs.size() || usedY != ys.size()) {
        throw std::invalid_argument(pair);
      }
      result.emplace_back(static_cast<int>(std::lround(x)),
                          static_cast<int>(std::lround(y)));
    } catch (const std::logic_error &) {
      // std::invalid_argument and std::out_of_range
      throw MalformedDocument("Invalid point \"" + pair +
                              "\" in points string");
    }
  }

  return result;
}

std::string pointsToString(const PointList &points) {
  std::ostringstream out;
  for (size_t i = 0; i < points.size(); ++i) {
    if (i > 0) {
      out << ' ';
    }
    out << points[i].x << ',' << points[i].y;
  }
  return out.str();
}

} // namespace layout
