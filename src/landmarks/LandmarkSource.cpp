#include "landmarks/LandmarkSource.h"

namespace jewelry_tryon {

void RecordedLandmarkSource::open() {
    if (!preloaded_ && !sequence_.loadFromTXT(filepath_)) {
        throw AcquisitionError("Failed to load landmark recording: " + filepath_);
    }
    next_ = 0;
    open_ = true;
}

bool RecordedLandmarkSource::grab(FrameObservation& frame) {
    if (!open_) {
        throw AcquisitionError("Landmark source is not open");
    }
    if (next_ >= sequence_.size()) {
        return false;
    }
    frame = sequence_[next_++];
    return true;
}

void RecordedLandmarkSource::close() {
    open_ = false;
}

} // namespace jewelry_tryon
