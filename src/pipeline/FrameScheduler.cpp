#include "pipeline/FrameScheduler.h"
#include <iostream>

namespace jewelry_tryon {

namespace {

/**
 * Closes the source and ends the session when run() returns or unwinds
 */
class ScopedTeardown {
public:
    ScopedTeardown(LandmarkSource& source, TryOnPipeline& pipeline)
        : source_(source), pipeline_(pipeline) {}
    ~ScopedTeardown() {
        source_.close();
        pipeline_.endSession();
    }

private:
    LandmarkSource& source_;
    TryOnPipeline& pipeline_;
};

void reportFailure(SchedulerReport& report, const char* stage, const std::exception& e) {
    std::cerr << stage << ": " << e.what() << std::endl;
    report.status = SchedulerStatus::Failed;
    report.error = e.what();
}

} // namespace

SchedulerReport FrameScheduler::run(const CancellationToken& token, const FrameCallback& on_frame) {
    SchedulerReport report;
    ScopedTeardown teardown(source_, pipeline_);

    try {
        source_.open();
        pipeline_.getConfig().validate(source_.landmarkCount());
    } catch (const AcquisitionError& e) {
        reportFailure(report, "Acquisition failed", e);
        return report;
    } catch (const ConfigError& e) {
        reportFailure(report, "Configuration does not match landmark source", e);
        return report;
    } catch (const std::exception& e) {
        reportFailure(report, "Session start failed", e);
        return report;
    }

    double last_timestamp = 0.0;
    bool has_last = false;

    try {
        while (!token.isCancelled()) {
            FrameObservation frame;
            if (!source_.grab(frame)) {
                break;
            }
            if (token.isCancelled()) {
                break;
            }

            if (has_last && frame.timestamp <= last_timestamp) {
                ++report.frames_skipped;
                continue;
            }
            last_timestamp = frame.timestamp;
            has_last = true;

            const FrameResult& result = pipeline_.processFrame(frame);
            ++report.frames_processed;

            if (on_frame && !token.isCancelled()) {
                on_frame(frame, result, pipeline_);
            }
        }
    } catch (const AcquisitionError& e) {
        reportFailure(report, "Landmark source failed", e);
        return report;
    } catch (const std::exception& e) {
        // Rendering or frame callback failure ends the session like a lost source
        reportFailure(report, "Frame processing failed", e);
        return report;
    }

    report.status = token.isCancelled() ? SchedulerStatus::Cancelled : SchedulerStatus::Completed;
    return report;
}

} // namespace jewelry_tryon
