#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>
#include "config/CalibrationParams.h"
#include "landmarks/LandmarkSet.h"

namespace jewelry_tryon {

enum class AnchorSide {
    Left,
    Right,
    Center
};

/**
 * Semantic attachment point: which landmarks form it and on which side
 * of the face it sits.
 */
struct AnchorDefinition {
    std::string name;
    std::vector<int> landmark_indices;
    AnchorSide side = AnchorSide::Center;
    double vertical_offset = 0.0;  // Extra downward shift in face widths

    AnchorDefinition() = default;
    AnchorDefinition(const std::string& name_, const std::vector<int>& indices,
                     AnchorSide side_, double vertical_offset_ = 0.0)
        : name(name_), landmark_indices(indices), side(side_), vertical_offset(vertical_offset_) {}
};

namespace anchor_names {
constexpr const char* kLeftEar = "left_ear";
constexpr const char* kRightEar = "right_ear";
constexpr const char* kNeckCenter = "neck_center";
}

/**
 * Head orientation in degrees
 */
struct HeadRotation {
    double pitch = 0.0;  // Up/down
    double yaw = 0.0;    // Left/right
};

/**
 * Resolved placement for one frame, pixel space (unmirrored)
 */
struct Anchor {
    std::string name;
    Eigen::Vector2d position = Eigen::Vector2d::Zero();
    double scale = 1.0;     // Face width relative to the reference width
    double depth = 0.0;     // |z| of the anchor relative to face width
    double rotation = 0.0;  // Head yaw, degrees
};

/**
 * Computes anchor positions from one LandmarkSet with depth-based
 * perspective correction and head-tilt compensation.
 *
 * Stateless; safe to call for several anchors on the same set.
 */
class AnchorResolver {
public:
    AnchorResolver() = default;
    explicit AnchorResolver(const CalibrationParams& calibration) : calibration_(calibration) {}

    /**
     * Resolve one anchor.
     * @param landmarks Non-empty landmark set of the current frame
     * @param definition Landmark group and side
     * @param width Frame width in pixels
     * @param height Frame height in pixels
     * @param anchor Output anchor
     * @return false if the anchor cannot be placed this frame (missing
     *         landmarks, non-finite values, degenerate face width)
     */
    bool resolve(const LandmarkSet& landmarks,
                 const AnchorDefinition& definition,
                 int width, int height,
                 Anchor& anchor) const;

    /**
     * Normalized distance between the face-edge landmarks (x only)
     */
    static double computeFaceWidth(const LandmarkSet& landmarks);

    /**
     * Pitch from forehead/chin, yaw from the eye corners
     */
    static HeadRotation computeHeadRotation(const LandmarkSet& landmarks);

    /**
     * Signed yaw proxy in [-1, 1] from the nose tip offset from centre
     */
    static double computeHeadTurnRatio(const LandmarkSet& landmarks);

    const CalibrationParams& getCalibration() const { return calibration_; }

private:
    CalibrationParams calibration_;
};

} // namespace jewelry_tryon
