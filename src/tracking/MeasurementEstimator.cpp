#include "tracking/MeasurementEstimator.h"
#include "utils/GeometryUtils.h"
#include <cmath>

namespace jewelry_tryon {

Measurements MeasurementEstimator::estimate(const LandmarkSet& landmarks) const {
    Measurements result;
    if (landmarks.empty() || !landmarks.contains(face_mesh::kRightFaceEdge)) {
        return result;
    }

    const Landmark& left_edge = landmarks[face_mesh::kLeftFaceEdge];
    const Landmark& right_edge = landmarks[face_mesh::kRightFaceEdge];
    const Landmark& chin = landmarks[face_mesh::kChin];
    const Landmark& forehead = landmarks[face_mesh::kForehead];

    double ear_span = distance3D(left_edge, right_edge);
    double vertical = distance3D(chin, forehead);

    result.face_width = ear_span;
    result.ear_width = ear_span * calibration_.ear_width_proportion;
    result.neck_width = vertical * calibration_.neck_width_proportion;

    result.valid = std::isfinite(result.face_width) &&
                   std::isfinite(result.ear_width) &&
                   std::isfinite(result.neck_width) &&
                   result.face_width >= kMinNormalizedWidth;
    return result;
}

bool MeasurementThrottle::offer(const Measurements& measurements, double timestamp) {
    if (!measurements.valid) {
        return false;
    }
    if (has_published_ && timestamp - last_publish_time_ < interval_) {
        return false;
    }

    published_ = measurements;
    last_publish_time_ = timestamp;
    has_published_ = true;
    return true;
}

void MeasurementThrottle::reset() {
    published_ = Measurements();
    last_publish_time_ = 0.0;
    has_published_ = false;
}

} // namespace jewelry_tryon
