/**
 * Jewelry Configuration
 *
 * Loads per-item AR settings from YAML and validates them against the
 * landmark index space before a session starts.
 */

#include "config/JewelryConfig.h"
#include "landmarks/LandmarkSet.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace jewelry_tryon {

namespace {

template <typename T>
void readOptional(const YAML::Node& node, const char* key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

JewelryType parseType(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "earrings" || lower == "earring") return JewelryType::Earrings;
    if (lower == "necklace") return JewelryType::Necklace;
    if (lower == "ring" || lower == "bracelet") {
        throw ConfigError("Jewelry type '" + text + "' needs hand tracking and is not supported");
    }
    throw ConfigError("Unknown jewelry type: '" + text + "'");
}

void readCalibration(const YAML::Node& node, CalibrationParams& calib) {
    if (!node) return;
    if (!node.IsMap()) {
        throw ConfigError("'calibration' must be a mapping");
    }
    readOptional(node, "reference_face_width_px", calib.reference_face_width_px);
    readOptional(node, "perspective_shift_px", calib.perspective_shift_px);
    readOptional(node, "pitch_offset_factor", calib.pitch_offset_factor);
    readOptional(node, "necklace_drop", calib.necklace_drop);
    readOptional(node, "ear_width_proportion", calib.ear_width_proportion);
    readOptional(node, "neck_width_proportion", calib.neck_width_proportion);
    readOptional(node, "measurement_interval", calib.measurement_interval);
    readOptional(node, "auto_scale_base_size", calib.auto_scale_base_size);
    readOptional(node, "reference_ear_width", calib.reference_ear_width);
    readOptional(node, "reference_neck_width", calib.reference_neck_width);
    readOptional(node, "reference_fps", calib.reference_fps);
    readOptional(node, "max_dt", calib.max_dt);
    readOptional(node, "highlight_offset", calib.highlight_offset);
    readOptional(node, "highlight_radius", calib.highlight_radius);
    readOptional(node, "highlight_alpha", calib.highlight_alpha);
    readOptional(node, "mirror", calib.mirror);
    readOptional(node, "snap_on_reacquire", calib.snap_on_reacquire);
}

JewelryConfig parseDocument(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        throw ConfigError("Jewelry config must be a mapping");
    }

    JewelryConfig config;
    readOptional(root, "item_id", config.item_id);
    readOptional(root, "name", config.name);
    if (root["type"]) {
        config.type = parseType(root["type"].as<std::string>());
    }

    const YAML::Node ar = root["ar_config"];
    if (ar) {
        if (!ar.IsMap()) {
            throw ConfigError("'ar_config' must be a mapping");
        }
        // camelCase keys are the try-on client's spelling of the same fields
        readOptional(ar, "landmarks", config.landmark_indices);
        readOptional(ar, "landmarkIndices", config.landmark_indices);
        readOptional(ar, "size", config.size);
        readOptional(ar, "color", config.color);
        readOptional(ar, "auto_scale", config.auto_scale);
        readOptional(ar, "autoScale", config.auto_scale);

        const YAML::Node offset = ar["position_offset"];
        if (offset) {
            readOptional(offset, "x", config.position_offset.x());
            readOptional(offset, "y", config.position_offset.y());
        }

        const YAML::Node material = ar["material"];
        if (material) {
            if (material.IsScalar()) {
                config.material.type = material.as<std::string>();
            } else {
                readOptional(material, "type", config.material.type);
                if (material["opacity"]) {
                    config.material.opacity = material["opacity"].as<double>();
                    config.material.has_opacity = true;
                }
            }
        }

        const YAML::Node physics = ar["physics"];
        if (physics) {
            readOptional(physics, "enabled", config.physics.enabled);
            readOptional(physics, "damping", config.physics.damping);
            readOptional(physics, "stiffness", config.physics.stiffness);
        }
    }

    readCalibration(root["calibration"], config.calibration);
    return config;
}

} // namespace

const char* toString(JewelryType type) {
    switch (type) {
        case JewelryType::Earrings: return "earrings";
        case JewelryType::Necklace: return "necklace";
    }
    return "unknown";
}

JewelryConfig JewelryConfig::loadFromFile(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw ConfigError("Failed to open jewelry config: " + filepath);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse jewelry config " + filepath + ": " + e.what());
    }

    try {
        JewelryConfig config = parseDocument(root);
        std::cout << "Loaded jewelry config '" << config.name << "' ("
                  << toString(config.type) << ") from " << filepath << std::endl;
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value in jewelry config " + filepath + ": " + e.what());
    }
}

JewelryConfig JewelryConfig::loadFromString(const std::string& document) {
    try {
        return parseDocument(YAML::Load(document));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid jewelry config: ") + e.what());
    }
}

void JewelryConfig::validate(int landmark_count) const {
    if (landmark_count <= 0) {
        throw ConfigError("Landmark source reports no landmarks");
    }

    auto checkIndex = [landmark_count](int idx, const std::string& what) {
        if (idx < 0 || idx >= landmark_count) {
            std::ostringstream oss;
            oss << what << " landmark index " << idx << " outside [0, " << landmark_count << ")";
            throw ConfigError(oss.str());
        }
    };

    for (int idx : landmark_indices) {
        checkIndex(idx, "Configured");
    }

    // Reference points every frame depends on
    const int reference[] = {face_mesh::kNoseTip, face_mesh::kForehead, face_mesh::kLeftEye,
                             face_mesh::kChin, face_mesh::kLeftFaceEdge, face_mesh::kRightEye,
                             face_mesh::kRightFaceEdge};
    for (int idx : reference) {
        checkIndex(idx, "Reference");
    }
    for (int idx : face_mesh::leftEarCluster()) checkIndex(idx, "Left ear");
    for (int idx : face_mesh::rightEarCluster()) checkIndex(idx, "Right ear");
    for (int idx : face_mesh::neckCluster()) checkIndex(idx, "Neck");

    if (type == JewelryType::Earrings && landmark_indices.size() > 2) {
        std::cerr << "Warning: earrings use two landmarks, ignoring "
                  << landmark_indices.size() - 2 << " extra index(es)" << std::endl;
    }

    if (!(size >= kMinSize && size <= kMaxSize)) {
        std::ostringstream oss;
        oss << "Size " << size << " outside [" << kMinSize << ", " << kMaxSize << "]";
        throw ConfigError(oss.str());
    }

    Eigen::Vector3d rgb;
    if (!parseHexColor(color, rgb)) {
        throw ConfigError("Invalid color '" + color + "', expected #RRGGBB");
    }

    if (material.has_opacity && !(material.opacity >= 0.0 && material.opacity <= 1.0)) {
        throw ConfigError("Material opacity must be in [0, 1]");
    }

    if (!physics.isValid()) {
        std::ostringstream oss;
        oss << "Physics coefficients out of range (stiffness " << physics.stiffness
            << " must be in (0, 1], damping " << physics.damping << " in [0, 1))";
        throw ConfigError(oss.str());
    }

    if (calibration.reference_face_width_px <= 0.0 ||
        calibration.reference_ear_width <= 0.0 ||
        calibration.reference_neck_width <= 0.0) {
        throw ConfigError("Calibration reference widths must be positive");
    }
    if (calibration.reference_fps <= 0.0 || calibration.max_dt <= 0.0) {
        throw ConfigError("Calibration reference_fps and max_dt must be positive");
    }
    if (calibration.measurement_interval < 0.0) {
        throw ConfigError("Calibration measurement_interval must not be negative");
    }
}

std::vector<int> JewelryConfig::landmarkPair() const {
    std::vector<int> pair = {face_mesh::kLeftFaceEdge, face_mesh::kRightFaceEdge};
    if (landmark_indices.size() < 2) {
        std::cerr << "Warning: landmark pair not fully configured, using default ear landmarks"
                  << std::endl;
    }
    for (size_t i = 0; i < 2 && i < landmark_indices.size(); ++i) {
        pair[i] = landmark_indices[i];
    }
    return pair;
}

Eigen::Vector3d JewelryConfig::colorRGB() const {
    Eigen::Vector3d rgb(1.0, 215.0 / 255.0, 0.0);
    parseHexColor(color, rgb);
    return rgb;
}

bool parseHexColor(const std::string& hex, Eigen::Vector3d& rgb) {
    if (hex.empty() || hex[0] != '#') return false;
    std::string digits = hex.substr(1);
    if (digits.size() == 3) {
        digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
    }
    if (digits.size() != 6) return false;
    for (char c : digits) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
    }

    unsigned long value = std::stoul(digits, nullptr, 16);
    rgb = Eigen::Vector3d(((value >> 16) & 0xFF) / 255.0,
                          ((value >> 8) & 0xFF) / 255.0,
                          (value & 0xFF) / 255.0);
    return true;
}

} // namespace jewelry_tryon
