#pragma once

#include <atomic>
#include <functional>
#include <string>
#include "landmarks/LandmarkSource.h"
#include "pipeline/TryOnPipeline.h"

namespace jewelry_tryon {

/**
 * Cooperative stop flag, checked before every tick and callback.
 * cancel() may be called from any thread or from inside a callback.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_;
};

enum class SchedulerStatus {
    Completed,  // Source ran out of frames
    Cancelled,
    Failed      // Acquisition, configuration or frame processing failure, see error
};

struct SchedulerReport {
    SchedulerStatus status = SchedulerStatus::Completed;
    std::string error;
    int frames_processed = 0;
    int frames_skipped = 0;   // Late frames superseded by fresher ones
};

/**
 * Frame-driven loop: one tick per frame delivered by the source.
 *
 * Frames that are not newer than the last processed one are dropped,
 * never queued. On every exit, including an exception thrown by the
 * callback, the source is closed and the session state is discarded; no
 * callback runs after that.
 */
class FrameScheduler {
public:
    typedef std::function<void(const FrameObservation&, const FrameResult&, const TryOnPipeline&)> FrameCallback;

    FrameScheduler(LandmarkSource& source, TryOnPipeline& pipeline)
        : source_(source), pipeline_(pipeline) {}

    SchedulerReport run(const CancellationToken& token, const FrameCallback& on_frame = FrameCallback());

private:
    LandmarkSource& source_;
    TryOnPipeline& pipeline_;
};

} // namespace jewelry_tryon
