#pragma once

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace jewelry_tryon {

/**
 * One colour filter step, applied in list order like a CSS filter chain
 */
struct ColorFilter {
    enum Type {
        Brightness,
        Contrast,
        Saturate,
        HueRotate,   // amount in degrees
        Grayscale
    };

    Type type;
    double amount;

    ColorFilter(Type type_, double amount_) : type(type_), amount(amount_) {}

    bool operator==(const ColorFilter& other) const {
        return type == other.type && amount == other.amount;
    }
};

enum class BlendMode {
    Normal,
    Screen
};

/**
 * Visual treatment of a jewelry material
 */
struct MaterialProfile {
    std::string name;
    std::vector<ColorFilter> filters;
    BlendMode blend_mode = BlendMode::Normal;
    double opacity = 1.0;

    /**
     * Run the filter chain on an RGB colour in [0,1]
     */
    Eigen::Vector3d apply(const Eigen::Vector3d& rgb) const;

    bool operator==(const MaterialProfile& other) const {
        return filters == other.filters && blend_mode == other.blend_mode && opacity == other.opacity;
    }
};

/**
 * Profile for a material name (gold, silver, diamond, pearl, platinum,
 * rose-gold). Case, '-', '_' and spaces are ignored. Unknown names get
 * the gold profile.
 */
const MaterialProfile& lookupMaterialProfile(const std::string& material);

bool isKnownMaterial(const std::string& material);

/**
 * The guaranteed default profile
 */
const MaterialProfile& goldMaterialProfile();

/**
 * Filter matrices (W3C Filter Effects, linear RGB coefficients)
 */
Eigen::Matrix3d saturateMatrix(double amount);
Eigen::Matrix3d hueRotateMatrix(double degrees);
Eigen::Matrix3d grayscaleMatrix(double amount);

} // namespace jewelry_tryon
