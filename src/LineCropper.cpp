#include "LineCropper.hpp"
#include "LayoutErrors.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace layout {

namespace {

double evaluatePolynomial(const cv::Mat &coefficients, double x) {
  double value = 0.0;
  for (int k = coefficients.rows - 1; k >= 0; --k) {
    value = value * x + coefficients.at<double>(k);
  }
  return value;
}

cv::Point2d normalized(const cv::Point2d &v) {
  double length = std::sqrt(v.x * v.x + v.y * v.y);
  if (length == 0.0) {
    return cv::Point2d(0.0, -1.0);
  }
  return cv::Point2d(v.x / length, v.y / length);
}

} // anonymous namespace

BaselineLineCropper::BaselineLineCropper(int polynomialDegree)
    : m_degree(std::max(0, polynomialDegree)) {}

cv::Mat BaselineLineCropper::cropCoordinates(const PointList &baseline,
                                             const LineHeights &heights,
                                             int cropHeight) const {
  if (baseline.empty()) {
    throw MissingPrerequisite("Cannot crop a line without baseline");
  }
  const double totalHeight =
      static_cast<double>(heights.ascent) + static_cast<double>(heights.descent);
  if (totalHeight <= 0.0) {
    throw MissingPrerequisite("Cannot crop a line with non-positive height");
  }
  if (cropHeight <= 0) {
    throw LayoutError("Crop height must be positive");
  }

  int left = baseline[0].x;
  int right = baseline[0].x;
  for (const auto &p : baseline) {
    left = std::min(left, p.x);
    right = std::max(right, p.x);
  }

  // Least squares fit of y = sum c_k * (x - left)^k
  const int degree =
      std::min(m_degree, static_cast<int>(baseline.size()) - 1);
  const int m = static_cast<int>(baseline.size());
  cv::Mat A(m, degree + 1, CV_64F);
  cv::Mat b(m, 1, CV_64F);
  for (int i = 0; i < m; ++i) {
    double u = baseline[i].x - left;
    double power = 1.0;
    for (int k = 0; k <= degree; ++k) {
      A.at<double>(i, k) = power;
      power *= u;
    }
    b.at<double>(i) = baseline[i].y;
  }
  cv::Mat coefficients;
  cv::solve(A, b, coefficients, cv::DECOMP_SVD);

  // Sample the baseline at every integer x
  const int samples = std::max(1, right - left);
  std::vector<cv::Point2d> linePoints(samples);
  for (int i = 0; i < samples; ++i) {
    linePoints[i] = cv::Point2d(left + i, evaluatePolynomial(coefficients, i));
  }

  // Normals pointing up (towards smaller y) from central differences
  std::vector<cv::Point2d> normals(samples);
  for (int i = 0; i < samples; ++i) {
    cv::Point2d tangent(1.0, 0.0);
    if (samples > 1) {
      int prev = std::max(0, i - 1);
      int next = std::min(samples - 1, i + 1);
      tangent = (linePoints[next] - linePoints[prev]) * (1.0 / (next - prev));
    }
    tangent = normalized(tangent);
    normals[i] = cv::Point2d(tangent.y, -tangent.x);
  }

  const double scale = cropHeight / totalHeight;
  const int cropWidth =
      std::max(1, static_cast<int>(std::lround(samples * scale)));

  cv::Mat grid(cropHeight, cropWidth, CV_32FC2);
  for (int c = 0; c < cropWidth; ++c) {
    double s = (c + 0.5) / scale - 0.5;
    s = std::min(std::max(s, 0.0), static_cast<double>(samples - 1));
    int i0 = static_cast<int>(std::floor(s));
    int i1 = std::min(i0 + 1, samples - 1);
    double f = s - i0;

    cv::Point2d point = linePoints[i0] * (1.0 - f) + linePoints[i1] * f;
    cv::Point2d normal = normalized(normals[i0] * (1.0 - f) + normals[i1] * f);

    for (int r = 0; r < cropHeight; ++r) {
      double offset = heights.ascent - (r + 0.5) / scale;
      cv::Point2d source = point + normal * offset;
      grid.at<cv::Vec2f>(r, c) = cv::Vec2f(static_cast<float>(source.x),
                                           static_cast<float>(source.y));
    }
  }

  return grid;
}

} // namespace layout
