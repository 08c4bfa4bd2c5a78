/**
 * Material Profiles
 *
 * Fixed material table. Each entry is a filter chain tuned by eye on
 * a warm indoor camera feed.
 */

#include "rendering/MaterialProfile.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>

namespace jewelry_tryon {

namespace {

typedef ColorFilter F;

std::map<std::string, MaterialProfile> buildTable() {
    std::map<std::string, MaterialProfile> table;

    MaterialProfile gold;
    gold.name = "gold";
    gold.filters = {F(F::Brightness, 1.1), F(F::Contrast, 1.05), F(F::Saturate, 1.3), F(F::HueRotate, -5.0)};
    gold.opacity = 0.95;
    table["gold"] = gold;

    MaterialProfile silver;
    silver.name = "silver";
    silver.filters = {F(F::Brightness, 1.2), F(F::Contrast, 0.9), F(F::Saturate, 0.3), F(F::Grayscale, 0.2)};
    silver.opacity = 0.9;
    table["silver"] = silver;

    MaterialProfile diamond;
    diamond.name = "diamond";
    diamond.filters = {F(F::Brightness, 1.5), F(F::Contrast, 1.2), F(F::Saturate, 0.0)};
    diamond.blend_mode = BlendMode::Screen;
    diamond.opacity = 0.8;
    table["diamond"] = diamond;

    MaterialProfile pearl;
    pearl.name = "pearl";
    pearl.filters = {F(F::Brightness, 1.1), F(F::Contrast, 0.95), F(F::Saturate, 0.8), F(F::HueRotate, 10.0)};
    pearl.opacity = 0.95;
    table["pearl"] = pearl;

    MaterialProfile platinum;
    platinum.name = "platinum";
    platinum.filters = {F(F::Brightness, 1.15), F(F::Contrast, 0.95), F(F::Saturate, 0.2)};
    platinum.opacity = 0.92;
    table["platinum"] = platinum;

    MaterialProfile rosegold;
    rosegold.name = "rosegold";
    rosegold.filters = {F(F::Brightness, 1.05), F(F::Contrast, 1.1), F(F::Saturate, 1.4), F(F::HueRotate, 10.0)};
    rosegold.opacity = 0.93;
    table["rosegold"] = rosegold;

    return table;
}

const std::map<std::string, MaterialProfile>& materialTable() {
    static const std::map<std::string, MaterialProfile> table = buildTable();
    return table;
}

std::string normalizeName(const std::string& material) {
    std::string key;
    key.reserve(material.size());
    for (char c : material) {
        if (c == '-' || c == '_' || c == ' ') continue;
        key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return key;
}

Eigen::Vector3d clamp01(const Eigen::Vector3d& v) {
    return v.cwiseMax(0.0).cwiseMin(1.0);
}

} // namespace

Eigen::Matrix3d saturateMatrix(double s) {
    Eigen::Matrix3d m;
    m << 0.213 + 0.787 * s, 0.715 - 0.715 * s, 0.072 - 0.072 * s,
         0.213 - 0.213 * s, 0.715 + 0.285 * s, 0.072 - 0.072 * s,
         0.213 - 0.213 * s, 0.715 - 0.715 * s, 0.072 + 0.928 * s;
    return m;
}

Eigen::Matrix3d hueRotateMatrix(double degrees) {
    const double rad = degrees * M_PI / 180.0;
    const double c = std::cos(rad);
    const double s = std::sin(rad);
    Eigen::Matrix3d m;
    m << 0.213 + c * 0.787 - s * 0.213, 0.715 - c * 0.715 - s * 0.715, 0.072 - c * 0.072 + s * 0.928,
         0.213 - c * 0.213 + s * 0.143, 0.715 + c * 0.285 + s * 0.140, 0.072 - c * 0.072 - s * 0.283,
         0.213 - c * 0.213 - s * 0.787, 0.715 - c * 0.715 + s * 0.715, 0.072 + c * 0.928 + s * 0.072;
    return m;
}

Eigen::Matrix3d grayscaleMatrix(double amount) {
    const double g = 1.0 - std::min(std::max(amount, 0.0), 1.0);
    Eigen::Matrix3d m;
    m << 0.2126 + 0.7874 * g, 0.7152 - 0.7152 * g, 0.0722 - 0.0722 * g,
         0.2126 - 0.2126 * g, 0.7152 + 0.2848 * g, 0.0722 - 0.0722 * g,
         0.2126 - 0.2126 * g, 0.7152 - 0.7152 * g, 0.0722 + 0.9278 * g;
    return m;
}

Eigen::Vector3d MaterialProfile::apply(const Eigen::Vector3d& rgb) const {
    Eigen::Vector3d color = clamp01(rgb);
    for (const auto& filter : filters) {
        switch (filter.type) {
            case ColorFilter::Brightness:
                color *= filter.amount;
                break;
            case ColorFilter::Contrast:
                color = ((color.array() - 0.5) * filter.amount + 0.5).matrix();
                break;
            case ColorFilter::Saturate:
                color = saturateMatrix(filter.amount) * color;
                break;
            case ColorFilter::HueRotate:
                color = hueRotateMatrix(filter.amount) * color;
                break;
            case ColorFilter::Grayscale:
                color = grayscaleMatrix(filter.amount) * color;
                break;
        }
        color = clamp01(color);
    }
    return color;
}

const MaterialProfile& goldMaterialProfile() {
    return materialTable().at("gold");
}

bool isKnownMaterial(const std::string& material) {
    return materialTable().count(normalizeName(material)) > 0;
}

const MaterialProfile& lookupMaterialProfile(const std::string& material) {
    const auto& table = materialTable();
    auto it = table.find(normalizeName(material));
    if (it == table.end()) {
        return goldMaterialProfile();
    }
    return it->second;
}

} // namespace jewelry_tryon
