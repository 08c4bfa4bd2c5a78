#pragma once

#include <Eigen/Dense>
#include <cmath>
#include <vector>
#include "landmarks/LandmarkSet.h"

namespace jewelry_tryon {

/**
 * Smallest normalized face width treated as a real measurement.
 * Below this, widths are degenerate and must not be divided by.
 */
constexpr double kMinNormalizedWidth = 1e-6;

/**
 * Arithmetic mean of the selected landmarks (x, y, z)
 * @param landmarks Landmark set (indices must be valid)
 * @param indices Landmark indices to average, must be non-empty
 * @return Centroid in normalized coordinates
 */
Eigen::Vector3d computeCentroid(const LandmarkSet& landmarks, const std::vector<int>& indices);

/**
 * Euclidean distance between two landmarks, depth included
 */
double distance3D(const Landmark& a, const Landmark& b);

/**
 * Convert normalized x/y to pixel coordinates
 */
Eigen::Vector2d normalizedToPixel(double x, double y, int width, int height);

inline double radiansToDegrees(double rad) {
    return rad * 180.0 / M_PI;
}

inline bool isFinite(const Eigen::Vector2d& v) {
    return std::isfinite(v.x()) && std::isfinite(v.y());
}

} // namespace jewelry_tryon
