#pragma once

#include <stdexcept>
#include <string>
#include "landmarks/LandmarkSequence.h"

namespace jewelry_tryon {

/**
 * Camera or landmark model could not be acquired. Fatal to the session.
 */
class AcquisitionError : public std::runtime_error {
public:
    explicit AcquisitionError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Producer of one FrameObservation per video frame (the face landmark
 * detector behind a camera).
 */
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    /**
     * Acquire camera/model resources. Throws AcquisitionError.
     */
    virtual void open() = 0;

    /**
     * Next frame; false at end of stream.
     * Throws AcquisitionError if the source fails mid-session.
     */
    virtual bool grab(FrameObservation& frame) = 0;

    /**
     * Release resources. Safe to call more than once.
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * Size of the fixed landmark index space
     */
    virtual int landmarkCount() const = 0;
};

/**
 * Replays a LandmarkSequence recording
 */
class RecordedLandmarkSource : public LandmarkSource {
public:
    explicit RecordedLandmarkSource(const std::string& filepath) : filepath_(filepath) {}

    /**
     * Replay an in-memory sequence
     */
    explicit RecordedLandmarkSource(const LandmarkSequence& sequence)
        : sequence_(sequence), preloaded_(true) {}

    void open() override;
    bool grab(FrameObservation& frame) override;
    void close() override;
    bool isOpen() const override { return open_; }
    int landmarkCount() const override { return sequence_.getLandmarkCount(); }

private:
    std::string filepath_;
    LandmarkSequence sequence_;
    bool preloaded_ = false;
    bool open_ = false;
    size_t next_ = 0;
};

} // namespace jewelry_tryon
