#include "utils/GeometryUtils.h"
#include <cmath>

namespace jewelry_tryon {

Eigen::Vector3d computeCentroid(const LandmarkSet& landmarks, const std::vector<int>& indices) {
    Eigen::Vector3d sum = Eigen::Vector3d::Zero();
    if (indices.empty()) {
        return sum;
    }

    for (int idx : indices) {
        sum += landmarks[idx].toVector();
    }
    return sum / static_cast<double>(indices.size());
}

double distance3D(const Landmark& a, const Landmark& b) {
    return (a.toVector() - b.toVector()).norm();
}

Eigen::Vector2d normalizedToPixel(double x, double y, int width, int height) {
    return Eigen::Vector2d(x * width, y * height);
}

} // namespace jewelry_tryon
