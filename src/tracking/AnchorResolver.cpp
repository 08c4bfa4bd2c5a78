/**
 * Anchor Resolver
 *
 * Turns normalized face landmarks into pixel anchors for jewelry.
 * Ear anchors are pushed behind the face silhouette as the head turns,
 * and all anchors follow head tilt.
 */

#include "tracking/AnchorResolver.h"
#include "utils/GeometryUtils.h"
#include <cmath>

namespace jewelry_tryon {

double AnchorResolver::computeFaceWidth(const LandmarkSet& landmarks) {
    const Landmark& left = landmarks[face_mesh::kLeftFaceEdge];
    const Landmark& right = landmarks[face_mesh::kRightFaceEdge];
    return std::abs(right.x - left.x);
}

HeadRotation AnchorResolver::computeHeadRotation(const LandmarkSet& landmarks) {
    const Landmark& chin = landmarks[face_mesh::kChin];
    const Landmark& forehead = landmarks[face_mesh::kForehead];
    const Landmark& left_eye = landmarks[face_mesh::kLeftEye];
    const Landmark& right_eye = landmarks[face_mesh::kRightEye];

    HeadRotation rotation;
    rotation.pitch = radiansToDegrees(std::atan2(forehead.y - chin.y, std::abs(forehead.z - chin.z)));
    rotation.yaw = radiansToDegrees(std::atan2(right_eye.x - left_eye.x, std::abs(right_eye.z - left_eye.z)));
    return rotation;
}

double AnchorResolver::computeHeadTurnRatio(const LandmarkSet& landmarks) {
    return (landmarks[face_mesh::kNoseTip].x - 0.5) * 2.0;
}

bool AnchorResolver::resolve(const LandmarkSet& landmarks,
                             const AnchorDefinition& definition,
                             int width, int height,
                             Anchor& anchor) const {
    if (landmarks.empty() || definition.landmark_indices.empty() || width <= 0 || height <= 0) {
        return false;
    }
    if (!landmarks.containsAll(definition.landmark_indices) ||
        !landmarks.contains(face_mesh::kLeftFaceEdge) ||
        !landmarks.contains(face_mesh::kRightFaceEdge) ||
        !landmarks.contains(face_mesh::kRightEye)) {
        return false;
    }
    if (!landmarks.isFinite()) {
        return false;
    }

    Eigen::Vector3d centroid = computeCentroid(landmarks, definition.landmark_indices);

    const double face_width = computeFaceWidth(landmarks);
    if (face_width < kMinNormalizedWidth) {
        return false;
    }
    const double face_width_px = face_width * width;
    const double depth_factor = std::abs(centroid.z()) / face_width;

    HeadRotation head = computeHeadRotation(landmarks);
    const double turn_ratio = computeHeadTurnRatio(landmarks);

    Eigen::Vector2d pos = normalizedToPixel(centroid.x(), centroid.y(), width, height);

    // Left anchors move back when the head turns right, right anchors
    // when it turns left
    const double shift = depth_factor * calibration_.perspective_shift_px;
    switch (definition.side) {
        case AnchorSide::Left:
            pos.x() -= shift * (1.0 + turn_ratio);
            break;
        case AnchorSide::Right:
            pos.x() += shift * (1.0 - turn_ratio);
            break;
        case AnchorSide::Center:
            break;
    }

    pos.y() += head.pitch * calibration_.pitch_offset_factor;
    pos.y() += definition.vertical_offset * face_width_px;

    if (!isFinite(pos)) {
        return false;
    }

    anchor.name = definition.name;
    anchor.position = pos;
    anchor.scale = face_width_px / calibration_.reference_face_width_px;
    anchor.depth = depth_factor;
    anchor.rotation = head.yaw;
    return true;
}

} // namespace jewelry_tryon
