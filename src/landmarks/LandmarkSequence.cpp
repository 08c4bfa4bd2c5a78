/**
 * Landmark Sequence
 *
 * Text recordings of the face landmark stream, used to replay
 * sessions without a camera or detector.
 */

#include "landmarks/LandmarkSequence.h"
#include <fstream>
#include <sstream>
#include <iostream>
#include <iomanip>
#include <utility>

namespace jewelry_tryon {

namespace {

// Upper bound for frame dimensions and per-frame landmark count
constexpr int kMaxRecordedSize = 16384;

} // namespace

bool LandmarkSequence::loadFromTXT(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open landmark sequence: " << filepath << std::endl;
        return false;
    }

    frames_.clear();
    landmark_count_ = face_mesh::kLandmarkCountWithIris;

    std::string line;
    int line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        if (line.empty() || line[0] == '#') continue;  // Skip empty lines and comments

        std::istringstream iss(line);
        std::string keyword;
        iss >> keyword;

        if (keyword == "landmarks") {
            if (!(iss >> landmark_count_) || landmark_count_ <= 0 || landmark_count_ > kMaxRecordedSize) {
                std::cerr << "Invalid landmark count at line " << line_no << std::endl;
                return false;
            }
            continue;
        }

        if (keyword != "frame") {
            std::cerr << "Unexpected line " << line_no << " in " << filepath << std::endl;
            return false;
        }

        FrameObservation frame;
        int count = 0;
        if (!(iss >> frame.timestamp >> frame.width >> frame.height >> count) || count < 0) {
            std::cerr << "Invalid frame header at line " << line_no << std::endl;
            return false;
        }
        if (frame.width <= 0 || frame.height <= 0 ||
            frame.width > kMaxRecordedSize || frame.height > kMaxRecordedSize) {
            std::cerr << "Invalid frame size " << frame.width << "x" << frame.height
                      << " at line " << line_no << std::endl;
            return false;
        }
        if (count != 0 && count != landmark_count_) {
            std::cerr << "Frame at line " << line_no << " has " << count
                      << " landmarks, expected " << landmark_count_ << std::endl;
            return false;
        }

        std::vector<Landmark> landmarks;
        landmarks.reserve(count);
        for (int i = 0; i < count; ++i) {
            if (!std::getline(file, line)) {
                std::cerr << "Unexpected end of file in frame starting at line " << line_no << std::endl;
                return false;
            }
            ++line_no;
            std::istringstream pts(line);
            double x, y, z;
            if (!(pts >> x >> y >> z)) {
                std::cerr << "Invalid landmark at line " << line_no << std::endl;
                return false;
            }
            landmarks.emplace_back(x, y, z);
        }
        frame.landmarks = LandmarkSet(std::move(landmarks));
        frames_.push_back(frame);
    }

    file.close();
    std::cout << "Loaded " << frames_.size() << " frames from " << filepath << std::endl;
    return true;
}

bool LandmarkSequence::saveToTXT(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << "# Face landmark sequence" << std::endl;
    file << "# frame <timestamp> <width> <height> <count>, then count lines of x y z" << std::endl;
    file << "landmarks " << landmark_count_ << std::endl;

    for (const auto& frame : frames_) {
        file << "frame " << std::fixed << std::setprecision(6) << frame.timestamp << " "
             << frame.width << " " << frame.height << " " << frame.landmarks.size() << "\n";
        for (const auto& lm : frame.landmarks.getLandmarks()) {
            file << std::setprecision(6) << lm.x << " " << lm.y << " " << lm.z << "\n";
        }
    }

    file.close();
    return true;
}

} // namespace jewelry_tryon
