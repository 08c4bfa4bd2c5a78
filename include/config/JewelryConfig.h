#pragma once

#include <Eigen/Dense>
#include <stdexcept>
#include <string>
#include <vector>
#include "config/CalibrationParams.h"
#include "physics/MotionSmoother.h"

namespace jewelry_tryon {

/**
 * Invalid or unreadable jewelry configuration.
 * Raised at load/validation time, never during rendering.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

enum class JewelryType {
    Earrings,
    Necklace
};

const char* toString(JewelryType type);

struct MaterialConfig {
    std::string type = "gold";
    double opacity = 0.0;
    bool has_opacity = false;  // Overrides the material profile opacity when set
};

/**
 * Per-item AR configuration, read-only for the whole session.
 *
 * File format (YAML, a catalog JSON document parses as well):
 *
 *   item_id: ER-001
 *   name: Gold Studs
 *   type: earrings            # earrings | necklace
 *   ar_config:
 *     landmarks: [234, 454]
 *     size: 30                # 10..100 px
 *     color: "#FFD700"
 *     position_offset: {x: 0, y: 0}
 *     material: {type: gold, opacity: 0.95}
 *     physics: {enabled: true, damping: 0.85, stiffness: 0.15}
 *     auto_scale: true
 *   calibration:              # optional, any CalibrationParams field
 *     reference_face_width_px: 150
 */
struct JewelryConfig {
    static constexpr double kMinSize = 10.0;
    static constexpr double kMaxSize = 100.0;

    std::string item_id;
    std::string name;
    JewelryType type = JewelryType::Earrings;

    std::vector<int> landmark_indices;  // Empty: type default
    double size = 30.0;
    std::string color = "#FFD700";
    Eigen::Vector2d position_offset = Eigen::Vector2d::Zero();
    MaterialConfig material;
    PhysicsParams physics;
    bool auto_scale = false;

    CalibrationParams calibration;

    /**
     * Load and parse a config file. Throws ConfigError.
     */
    static JewelryConfig loadFromFile(const std::string& filepath);

    /**
     * Parse a config document held in memory. Throws ConfigError.
     */
    static JewelryConfig loadFromString(const std::string& document);

    /**
     * Check the config against the landmark index space of the source.
     * Throws ConfigError on any out-of-range index or invalid value.
     */
    void validate(int landmark_count) const;

    /**
     * Left/right landmark pair for earrings, falling back to the
     * default face-edge pair {234, 454} for missing entries.
     */
    std::vector<int> landmarkPair() const;

    /**
     * Fill colour as RGB in [0,1]. Assumes validate() passed.
     */
    Eigen::Vector3d colorRGB() const;
};

/**
 * Parse "#RRGGBB" or "#RGB" into RGB in [0,1]
 * @return false if the string is not a hex colour
 */
bool parseHexColor(const std::string& hex, Eigen::Vector3d& rgb);

} // namespace jewelry_tryon
