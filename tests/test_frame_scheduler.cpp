/**
 * Frame Scheduler Test
 *
 * Drives a pipeline from recorded and failing landmark sources and
 * checks completion, cancellation, stale frame dropping, failure
 * reporting and teardown.
 *
 * Usage:
 *   build/bin/test_frame_scheduler
 */

#include "pipeline/FrameScheduler.h"
#include "SyntheticFace.h"
#include <iostream>
#include <stdexcept>

using namespace jewelry_tryon;

/**
 * Replays a fixed number of frames, then fails like a camera unplugged
 * mid-session
 */
class FailingSource : public LandmarkSource {
public:
    explicit FailingSource(int frames_before_failure) : remaining_(frames_before_failure) {}

    void open() override { open_ = true; }
    bool grab(FrameObservation& frame) override {
        if (remaining_-- <= 0) {
            throw AcquisitionError("camera disconnected");
        }
        frame = test::makeFrame(tick_++ / 30.0, test::frontalFace());
        return true;
    }
    void close() override { open_ = false; ++close_calls; }
    bool isOpen() const override { return open_; }
    int landmarkCount() const override { return face_mesh::kLandmarkCountWithIris; }

    int close_calls = 0;

private:
    int remaining_;
    int tick_ = 0;
    bool open_ = false;
};

static LandmarkSequence faceSequence(int frames) {
    LandmarkSequence seq;
    for (int i = 0; i < frames; ++i) {
        seq.addFrame(test::makeFrame(i / 30.0, test::shiftedFace(0.001 * i, 0.0)));
    }
    return seq;
}

static JewelryConfig earrings() {
    JewelryConfig config;
    config.landmark_indices = {234, 454};
    return config;
}

int main() {
    bool all_passed = true;

    // Test 1: Run to the end of the recording
    std::cout << "\n--- Test 1: Completed run ---" << std::endl;
    {
        RecordedLandmarkSource source(faceSequence(10));
        TryOnPipeline pipeline(earrings(), face_mesh::kLandmarkCountWithIris);
        FrameScheduler scheduler(source, pipeline);
        CancellationToken token;

        int callbacks = 0;
        int drawn = 0;
        SchedulerReport report = scheduler.run(token,
            [&](const FrameObservation&, const FrameResult& result, const TryOnPipeline&) {
                ++callbacks;
                if (result.drawn) ++drawn;
            });

        if (report.status == SchedulerStatus::Completed && report.frames_processed == 10 &&
            callbacks == 10 && drawn == 10) {
            std::cout << "  PASS: 10 frames processed and drawn" << std::endl;
        } else {
            std::cerr << "  FAIL: processed " << report.frames_processed << ", callbacks " << callbacks << std::endl;
            all_passed = false;
        }

        if (!source.isOpen() && pipeline.getSmoother().numStates() == 0) {
            std::cout << "  PASS: source closed and session state dropped" << std::endl;
        } else {
            std::cerr << "  FAIL: teardown incomplete" << std::endl;
            all_passed = false;
        }
    }

    // Test 2: Cancel from inside a callback
    std::cout << "\n--- Test 2: Cancellation ---" << std::endl;
    {
        RecordedLandmarkSource source(faceSequence(10));
        TryOnPipeline pipeline(earrings(), face_mesh::kLandmarkCountWithIris);
        FrameScheduler scheduler(source, pipeline);
        CancellationToken token;

        int callbacks = 0;
        SchedulerReport report = scheduler.run(token,
            [&](const FrameObservation&, const FrameResult&, const TryOnPipeline&) {
                if (++callbacks == 3) token.cancel();
            });

        if (report.status == SchedulerStatus::Cancelled && report.frames_processed == 3 &&
            callbacks == 3 && !source.isOpen() && pipeline.getSmoother().numStates() == 0) {
            std::cout << "  PASS: stopped after 3 frames, no further callbacks" << std::endl;
        } else {
            std::cerr << "  FAIL: " << report.frames_processed << " frames after cancel" << std::endl;
            all_passed = false;
        }

        CancellationToken cancelled;
        cancelled.cancel();
        RecordedLandmarkSource again(faceSequence(5));
        FrameScheduler idle(again, pipeline);
        SchedulerReport none = idle.run(cancelled,
            [&](const FrameObservation&, const FrameResult&, const TryOnPipeline&) { ++callbacks; });
        if (none.status == SchedulerStatus::Cancelled && none.frames_processed == 0 &&
            callbacks == 3 && !again.isOpen()) {
            std::cout << "  PASS: pre-cancelled token runs no tick" << std::endl;
        } else {
            std::cerr << "  FAIL: pre-cancelled run processed " << none.frames_processed << std::endl;
            all_passed = false;
        }
    }

    // Test 3: Late frames are dropped
    std::cout << "\n--- Test 3: Stale frames ---" << std::endl;
    {
        LandmarkSequence seq;
        seq.addFrame(test::makeFrame(0.0, test::frontalFace()));
        seq.addFrame(test::makeFrame(0.033, test::frontalFace()));
        seq.addFrame(test::makeFrame(0.020, test::shiftedFace(0.2, 0.0)));   // Superseded
        seq.addFrame(test::makeFrame(0.033, test::shiftedFace(0.2, 0.0)));   // Duplicate
        seq.addFrame(test::makeFrame(0.066, test::frontalFace()));

        RecordedLandmarkSource source(seq);
        TryOnPipeline pipeline(earrings(), face_mesh::kLandmarkCountWithIris);
        FrameScheduler scheduler(source, pipeline);
        CancellationToken token;

        std::vector<double> seen;
        SchedulerReport report = scheduler.run(token,
            [&](const FrameObservation& frame, const FrameResult&, const TryOnPipeline&) {
                seen.push_back(frame.timestamp);
            });

        if (report.frames_processed == 3 && report.frames_skipped == 2 &&
            seen == std::vector<double>({0.0, 0.033, 0.066})) {
            std::cout << "  PASS: 2 stale frames skipped" << std::endl;
        } else {
            std::cerr << "  FAIL: processed " << report.frames_processed
                      << ", skipped " << report.frames_skipped << std::endl;
            all_passed = false;
        }
    }

    // Test 4: Missing recording
    std::cout << "\n--- Test 4: Acquisition failure at start ---" << std::endl;
    {
        RecordedLandmarkSource source("does/not/exist.txt");
        TryOnPipeline pipeline(earrings(), face_mesh::kLandmarkCountWithIris);
        FrameScheduler scheduler(source, pipeline);
        CancellationToken token;
        int callbacks = 0;
        SchedulerReport report = scheduler.run(token,
            [&](const FrameObservation&, const FrameResult&, const TryOnPipeline&) { ++callbacks; });

        if (report.status == SchedulerStatus::Failed && !report.error.empty() &&
            report.frames_processed == 0 && callbacks == 0) {
            std::cout << "  PASS: Failed with \"" << report.error << "\"" << std::endl;
        } else {
            std::cerr << "  FAIL: missing recording not reported" << std::endl;
            all_passed = false;
        }
    }

    // Test 5: Source fails mid-session
    std::cout << "\n--- Test 5: Acquisition failure mid-session ---" << std::endl;
    {
        FailingSource source(4);
        TryOnPipeline pipeline(earrings(), face_mesh::kLandmarkCountWithIris);
        FrameScheduler scheduler(source, pipeline);
        CancellationToken token;
        SchedulerReport report = scheduler.run(token);

        if (report.status == SchedulerStatus::Failed && report.frames_processed == 4 &&
            source.close_calls == 1 && !source.isOpen() && pipeline.getSmoother().numStates() == 0) {
            std::cout << "  PASS: Failed after 4 frames, source closed once" << std::endl;
        } else {
            std::cerr << "  FAIL: status/teardown after mid-session failure" << std::endl;
            all_passed = false;
        }
    }

    // Test 6: Config indices outside the source's index space
    std::cout << "\n--- Test 6: Index space mismatch ---" << std::endl;
    {
        JewelryConfig config = earrings();
        config.landmark_indices = {234, 470};   // Iris range

        LandmarkSequence seq = faceSequence(3);
        seq.setLandmarkCount(face_mesh::kLandmarkCount);
        RecordedLandmarkSource source(seq);
        TryOnPipeline pipeline(config, face_mesh::kLandmarkCountWithIris);
        FrameScheduler scheduler(source, pipeline);
        CancellationToken token;
        SchedulerReport report = scheduler.run(token);

        if (report.status == SchedulerStatus::Failed && report.frames_processed == 0 && !source.isOpen()) {
            std::cout << "  PASS: 468-point source refused for index 470" << std::endl;
        } else {
            std::cerr << "  FAIL: mismatched index space accepted" << std::endl;
            all_passed = false;
        }
    }

    // Test 7: Frame callback throws
    std::cout << "\n--- Test 7: Callback failure ---" << std::endl;
    {
        FailingSource source(10);
        TryOnPipeline pipeline(earrings(), face_mesh::kLandmarkCountWithIris);
        FrameScheduler scheduler(source, pipeline);
        CancellationToken token;

        int callbacks = 0;
        bool escaped = false;
        SchedulerReport report;
        try {
            report = scheduler.run(token,
                [&](const FrameObservation&, const FrameResult&, const TryOnPipeline&) {
                    ++callbacks;
                    throw std::runtime_error("display closed");
                });
        } catch (const std::exception& e) {
            std::cerr << "    escaped: " << e.what() << std::endl;
            escaped = true;
        }

        if (!escaped && report.status == SchedulerStatus::Failed && report.error == "display closed" &&
            report.frames_processed == 1 && callbacks == 1) {
            std::cout << "  PASS: Failed with \"" << report.error << "\" after 1 frame" << std::endl;
        } else {
            std::cerr << "  FAIL: callback exception not reported" << std::endl;
            all_passed = false;
        }

        if (!source.isOpen() && source.close_calls == 1 && pipeline.getSmoother().numStates() == 0) {
            std::cout << "  PASS: source closed once and session state dropped" << std::endl;
        } else {
            std::cerr << "  FAIL: teardown skipped after callback failure" << std::endl;
            all_passed = false;
        }
    }

    std::cout << "\n" << (all_passed ? "RESULT: PASS" : "RESULT: FAIL") << std::endl;
    return all_passed ? 0 : 1;
}
