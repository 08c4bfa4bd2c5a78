#pragma once

#include <Eigen/Dense>
#include <vector>
#include <cstddef>
#include <utility>

namespace jewelry_tryon {

/**
 * Normalized face landmark.
 * x, y in [0,1] relative to the frame, z relative depth on the x scale.
 */
struct Landmark {
    double x;
    double y;
    double z;

    Landmark() : x(0.0), y(0.0), z(0.0) {}
    Landmark(double x_, double y_, double z_ = 0.0) : x(x_), y(y_), z(z_) {}

    Eigen::Vector3d toVector() const { return Eigen::Vector3d(x, y, z); }
};

/**
 * Fixed indices of the face mesh topology (MediaPipe Face Mesh).
 */
namespace face_mesh {

constexpr int kLandmarkCount = 468;
constexpr int kLandmarkCountWithIris = 478;

constexpr int kNoseTip = 1;
constexpr int kForehead = 10;
constexpr int kLeftEye = 33;
constexpr int kChin = 152;
constexpr int kLeftFaceEdge = 234;
constexpr int kRightEye = 263;
constexpr int kRightFaceEdge = 454;

const std::vector<int>& leftEarCluster();
const std::vector<int>& rightEarCluster();
const std::vector<int>& neckCluster();

} // namespace face_mesh

/**
 * One frame of landmarks from the landmark source.
 *
 * Immutable once built. An empty set means no face was detected.
 */
class LandmarkSet {
public:
    LandmarkSet() = default;
    explicit LandmarkSet(std::vector<Landmark> landmarks)
        : landmarks_(std::move(landmarks)) {}

    bool empty() const { return landmarks_.empty(); }
    size_t size() const { return landmarks_.size(); }

    const Landmark& operator[](size_t idx) const { return landmarks_[idx]; }

    /**
     * Bounds-checked access, throws std::out_of_range
     */
    const Landmark& at(int idx) const;

    bool contains(int idx) const {
        return idx >= 0 && static_cast<size_t>(idx) < landmarks_.size();
    }

    /**
     * True if every index is inside the set
     */
    bool containsAll(const std::vector<int>& indices) const;

    /**
     * True if every coordinate is finite
     */
    bool isFinite() const;

    const std::vector<Landmark>& getLandmarks() const { return landmarks_; }

private:
    std::vector<Landmark> landmarks_;
};

} // namespace jewelry_tryon
