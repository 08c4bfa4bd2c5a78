#pragma once

#include <string>
#include <vector>
#include "landmarks/LandmarkSet.h"

namespace jewelry_tryon {

/**
 * One tick worth of landmark source output
 */
struct FrameObservation {
    double timestamp = 0.0;  // Seconds
    int width = 0;           // Video frame size in pixels
    int height = 0;
    LandmarkSet landmarks;   // Empty when no face was detected
};

/**
 * Recorded landmark stream, one FrameObservation per video frame.
 */
class LandmarkSequence {
public:
    LandmarkSequence() = default;

    /**
     * Load from a text recording
     * Format:
     *   # comment
     *   landmarks 478              (optional index space, default 478)
     *   frame <timestamp> <width> <height> <count>
     *   x y z                      (count lines, count 0 = no face)
     *   ...
     * Width, height and landmark count must lie in 1..16384.
     */
    bool loadFromTXT(const std::string& filepath);

    /**
     * Save in the same text format
     */
    bool saveToTXT(const std::string& filepath) const;

    void addFrame(const FrameObservation& frame) { frames_.push_back(frame); }

    const std::vector<FrameObservation>& getFrames() const { return frames_; }
    size_t size() const { return frames_.size(); }
    const FrameObservation& operator[](size_t idx) const { return frames_[idx]; }

    int getLandmarkCount() const { return landmark_count_; }
    void setLandmarkCount(int count) { landmark_count_ = count; }

    void clear() { frames_.clear(); }

private:
    std::vector<FrameObservation> frames_;
    int landmark_count_ = face_mesh::kLandmarkCountWithIris;
};

} // namespace jewelry_tryon
