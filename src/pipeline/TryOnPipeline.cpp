/**
 * Try-On Pipeline
 *
 * Per-frame flow:
 *   1) Clear the overlay surface at the frame size
 *   2) Measure the face (ear/neck/face width) for sizing
 *   3) Resolve each anchor with perspective and tilt correction
 *   4) Smooth each anchor with its spring-damper
 *   5) Draw the jewelry and mirror the surface
 */

#include "pipeline/TryOnPipeline.h"
#include <iostream>

namespace jewelry_tryon {

namespace {

JewelryConfig validatedConfig(const JewelryConfig& config, int landmark_count) {
    config.validate(landmark_count);
    return config;
}

} // namespace

TryOnPipeline::TryOnPipeline(const JewelryConfig& config, int landmark_count)
    : config_(validatedConfig(config, landmark_count))
    , definitions_(buildAnchorDefinitions(config_))
    , resolver_(config_.calibration)
    , estimator_(config_.calibration)
    , throttle_(config_.calibration.measurement_interval)
    , smoother_(config_.calibration.reference_fps, config_.calibration.max_dt)
    , compositor_(config_) {
    for (const auto& def : definitions_) {
        smoother_.configureAnchor(def.name, config_.physics);
    }
}

std::vector<AnchorDefinition> TryOnPipeline::buildAnchorDefinitions(const JewelryConfig& config) {
    std::vector<AnchorDefinition> defs;

    if (config.type == JewelryType::Necklace) {
        std::vector<int> group = config.landmark_indices.empty()
            ? face_mesh::neckCluster() : config.landmark_indices;
        defs.emplace_back(anchor_names::kNeckCenter, group, AnchorSide::Center,
                          config.calibration.necklace_drop);
        return defs;
    }

    // The face-edge landmarks sit on the ears; use the whole ear cluster
    // there so a single jittery point cannot move the earring
    std::vector<int> pair = config.landmarkPair();
    std::vector<int> left = pair[0] == face_mesh::kLeftFaceEdge
        ? face_mesh::leftEarCluster() : std::vector<int>{pair[0]};
    std::vector<int> right = pair[1] == face_mesh::kRightFaceEdge
        ? face_mesh::rightEarCluster() : std::vector<int>{pair[1]};

    defs.emplace_back(anchor_names::kLeftEar, left, AnchorSide::Left);
    defs.emplace_back(anchor_names::kRightEar, right, AnchorSide::Right);
    return defs;
}

const FrameResult& TryOnPipeline::processFrame(const FrameObservation& frame) {
    result_ = FrameResult();
    compositor_.beginFrame(frame.width, frame.height);

    const double dt = has_timestamp_ ? frame.timestamp - last_timestamp_ : 0.0;
    last_timestamp_ = frame.timestamp;
    has_timestamp_ = true;

    if (frame.landmarks.empty()) {
        if (state_ == TrackingState::FaceDetected) {
            std::cout << "Face lost at t=" << frame.timestamp << std::endl;
        }
        state_ = TrackingState::NoFace;
        return result_;
    }

    if (state_ == TrackingState::NoFace) {
        std::cout << "Face detected at t=" << frame.timestamp << std::endl;
        if (config_.calibration.snap_on_reacquire) {
            for (const auto& def : definitions_) {
                pending_snap_.insert(def.name);
            }
        }
    }
    state_ = TrackingState::FaceDetected;
    result_.face_detected = true;

    Measurements current = estimator_.estimate(frame.landmarks);
    throttle_.offer(current, frame.timestamp);
    if (current.valid) {
        result_.measurements = throttle_.getPublished();
    }

    for (const auto& def : definitions_) {
        Anchor anchor;
        if (!resolver_.resolve(frame.landmarks, def, frame.width, frame.height, anchor)) {
            continue;
        }

        // An anchor that failed to resolve on the reacquiring frame still
        // snaps the next time it resolves
        if (pending_snap_.erase(def.name) > 0) {
            smoother_.snap(def.name, anchor.position);
        } else {
            anchor.position = smoother_.update(def.name, anchor.position, dt);
        }
        result_.anchors.push_back(anchor);
    }

    result_.drawn = compositor_.render(result_.anchors, result_.measurements);
    compositor_.finishFrame();
    return result_;
}

void TryOnPipeline::endSession() {
    smoother_.reset();
    throttle_.reset();
    state_ = TrackingState::NoFace;
    pending_snap_.clear();
    has_timestamp_ = false;
    result_ = FrameResult();
}

} // namespace jewelry_tryon
