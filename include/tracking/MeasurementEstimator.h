#pragma once

#include "config/CalibrationParams.h"
#include "landmarks/LandmarkSet.h"

namespace jewelry_tryon {

/**
 * Scale references derived from one LandmarkSet, normalized units.
 * Used for sizing only, never for positions.
 */
struct Measurements {
    double ear_width = 0.0;   // Expected earring width
    double neck_width = 0.0;  // Neck width proxy (no neck landmarks in the face mesh)
    double face_width = 0.0;  // Face-edge span, same landmarks as the anchor resolver
    bool valid = false;
};

/**
 * Computes Measurements every frame, no smoothing.
 */
class MeasurementEstimator {
public:
    MeasurementEstimator() = default;
    explicit MeasurementEstimator(const CalibrationParams& calibration) : calibration_(calibration) {}

    /**
     * @return Measurements with valid == false for an empty set, missing
     *         landmarks, non-finite values or a degenerate face width
     */
    Measurements estimate(const LandmarkSet& landmarks) const;

private:
    CalibrationParams calibration_;
};

/**
 * Rate limit for handing Measurements to consumers.
 *
 * Offer the freshest value every frame; it is published when at least
 * `interval` seconds passed since the last publication. The first valid
 * value is published immediately and invalid values never are.
 */
class MeasurementThrottle {
public:
    explicit MeasurementThrottle(double interval = 0.1) : interval_(interval) {}

    /**
     * @return true if `measurements` became the published value
     */
    bool offer(const Measurements& measurements, double timestamp);

    const Measurements& getPublished() const { return published_; }
    bool hasPublished() const { return has_published_; }

    void reset();

private:
    double interval_;
    Measurements published_;
    double last_publish_time_ = 0.0;
    bool has_published_ = false;
};

} // namespace jewelry_tryon
