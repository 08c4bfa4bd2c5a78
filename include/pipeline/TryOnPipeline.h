#pragma once

#include <opencv2/core.hpp>
#include <set>
#include <string>
#include <vector>
#include "config/JewelryConfig.h"
#include "landmarks/LandmarkSequence.h"
#include "physics/MotionSmoother.h"
#include "rendering/OverlayCompositor.h"
#include "tracking/AnchorResolver.h"
#include "tracking/MeasurementEstimator.h"

namespace jewelry_tryon {

enum class TrackingState {
    NoFace,
    FaceDetected
};

/**
 * Output of one tick
 */
struct FrameResult {
    bool face_detected = false;
    bool drawn = false;                // Overlay has jewelry this tick
    std::vector<Anchor> anchors;       // Smoothed anchors that resolved this tick
    Measurements measurements;         // Measurements the overlay was sized with
};

/**
 * One try-on session: landmarks in, overlay surface out.
 *
 * Runs anchor resolution, measurement, smoothing and compositing
 * synchronously for each frame. Smoother state lives as long as the
 * session and is dropped by endSession().
 */
class TryOnPipeline {
public:
    /**
     * @param config Jewelry item configuration
     * @param landmark_count Index space of the landmark source
     * @throws ConfigError if the config does not fit the index space
     */
    TryOnPipeline(const JewelryConfig& config, int landmark_count);

    /**
     * Process one frame. An empty LandmarkSet clears the overlay and
     * leaves the smoother untouched.
     */
    const FrameResult& processFrame(const FrameObservation& frame);

    /**
     * Discard all per-session state
     */
    void endSession();

    TrackingState getState() const { return state_; }
    const FrameResult& getLastResult() const { return result_; }

    /**
     * Overlay of the last processed frame (BGRA, mirrored if configured)
     */
    const cv::Mat& getOverlay() const { return compositor_.getSurface(); }

    const JewelryConfig& getConfig() const { return config_; }
    const OverlayCompositor& getCompositor() const { return compositor_; }
    const MotionSmoother& getSmoother() const { return smoother_; }
    const std::vector<AnchorDefinition>& getAnchorDefinitions() const { return definitions_; }

    /**
     * Anchors needed by a jewelry type: ear clusters (or the configured
     * pair) for earrings, the chin cluster for necklaces.
     */
    static std::vector<AnchorDefinition> buildAnchorDefinitions(const JewelryConfig& config);

private:
    JewelryConfig config_;
    std::vector<AnchorDefinition> definitions_;

    AnchorResolver resolver_;
    MeasurementEstimator estimator_;
    MeasurementThrottle throttle_;
    MotionSmoother smoother_;
    OverlayCompositor compositor_;

    TrackingState state_ = TrackingState::NoFace;
    std::set<std::string> pending_snap_;   // Anchors not yet snapped since the face reappeared
    double last_timestamp_ = 0.0;
    bool has_timestamp_ = false;
    FrameResult result_;
};

} // namespace jewelry_tryon
