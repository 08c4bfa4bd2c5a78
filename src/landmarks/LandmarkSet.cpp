#include "landmarks/LandmarkSet.h"
#include <cmath>
#include <stdexcept>
#include <string>

namespace jewelry_tryon {

namespace face_mesh {

const std::vector<int>& leftEarCluster() {
    static const std::vector<int> indices = {234, 127, 162, 21, 54};
    return indices;
}

const std::vector<int>& rightEarCluster() {
    static const std::vector<int> indices = {454, 356, 389, 251, 284};
    return indices;
}

const std::vector<int>& neckCluster() {
    // Chin tip and the two jaw points beside it
    static const std::vector<int> indices = {152, 148, 377};
    return indices;
}

} // namespace face_mesh

const Landmark& LandmarkSet::at(int idx) const {
    if (!contains(idx)) {
        throw std::out_of_range("Landmark index " + std::to_string(idx) +
                                " outside set of size " + std::to_string(landmarks_.size()));
    }
    return landmarks_[idx];
}

bool LandmarkSet::containsAll(const std::vector<int>& indices) const {
    for (int idx : indices) {
        if (!contains(idx)) return false;
    }
    return true;
}

bool LandmarkSet::isFinite() const {
    for (const auto& lm : landmarks_) {
        if (!std::isfinite(lm.x) || !std::isfinite(lm.y) || !std::isfinite(lm.z)) {
            return false;
        }
    }
    return true;
}

} // namespace jewelry_tryon
