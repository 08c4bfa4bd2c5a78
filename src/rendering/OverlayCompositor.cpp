/**
 * Overlay Compositor
 *
 * Draws earrings and necklaces as shaded discs/arcs on a transparent
 * surface that sits on top of the mirrored camera preview.
 */

#include "rendering/OverlayCompositor.h"
#include "utils/GeometryUtils.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace jewelry_tryon {

namespace {

const Anchor* findAnchor(const std::vector<Anchor>& anchors, const char* name) {
    for (const auto& anchor : anchors) {
        if (anchor.name == name) return &anchor;
    }
    return nullptr;
}

unsigned char toByte(double v) {
    return static_cast<unsigned char>(std::lround(std::min(std::max(v, 0.0), 1.0) * 255.0));
}

} // namespace

OverlayCompositor::ScopedDrawState::ScopedDrawState(DrawState& state,
                                                    const MaterialProfile* material,
                                                    double opacity)
    : state_(state) {
    state_.material = material;
    state_.opacity = opacity;
}

OverlayCompositor::ScopedDrawState::~ScopedDrawState() {
    state_ = DrawState();
}

OverlayCompositor::OverlayCompositor(const JewelryConfig& config)
    : config_(config)
    , material_(&lookupMaterialProfile(config.material.type)) {
    if (!isKnownMaterial(config.material.type)) {
        std::cerr << "Warning: unknown material '" << config.material.type
                  << "', using the " << material_->name << " profile" << std::endl;
    }
}

void OverlayCompositor::beginFrame(int width, int height) {
    width = std::max(width, 0);
    height = std::max(height, 0);
    surface_.create(height, width, CV_8UC4);
    surface_.setTo(cv::Scalar::all(0));
    primitive_count_ = 0;
}

double OverlayCompositor::resolveSize(const Measurements& measurements) const {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    if (!config_.auto_scale) {
        return config_.size;
    }
    if (!measurements.valid) {
        return nan;
    }

    const CalibrationParams& calib = config_.calibration;
    double size = nan;
    if (config_.type == JewelryType::Necklace) {
        size = calib.auto_scale_base_size * (measurements.neck_width / calib.reference_neck_width);
    } else {
        size = calib.auto_scale_base_size * (measurements.ear_width / calib.reference_ear_width);
    }
    return std::isfinite(size) ? size : nan;
}

double OverlayCompositor::resolveOpacity() const {
    if (config_.material.has_opacity) {
        return config_.material.opacity;
    }
    return material_->opacity;
}

bool OverlayCompositor::render(const std::vector<Anchor>& anchors, const Measurements& measurements) {
    if (surface_.empty()) {
        return false;
    }

    const double size = resolveSize(measurements);
    if (!std::isfinite(size) || size <= 0.0) {
        return false;
    }

    ScopedDrawState scoped(draw_state_, material_, resolveOpacity());

    const Eigen::Vector3d color = material_->apply(config_.colorRGB());
    const Eigen::Vector3d highlight = material_->apply(Eigen::Vector3d::Ones());

    if (config_.type == JewelryType::Earrings) {
        const Anchor* left = findAnchor(anchors, anchor_names::kLeftEar);
        const Anchor* right = findAnchor(anchors, anchor_names::kRightEar);
        if (!left && !right) {
            return false;
        }
        if (left) drawEarring(left->position + config_.position_offset, size, color, highlight);
        if (right) drawEarring(right->position + config_.position_offset, size, color, highlight);
        return true;
    }

    const Anchor* neck = findAnchor(anchors, anchor_names::kNeckCenter);
    if (!neck || !measurements.valid) {
        return false;
    }
    const double chain_width = measurements.neck_width * surface_.cols;
    if (!std::isfinite(chain_width) || chain_width <= 0.0) {
        return false;
    }
    drawNecklace(neck->position + config_.position_offset, chain_width, size, color, highlight);
    return true;
}

void OverlayCompositor::finishFrame() {
    if (config_.calibration.mirror && !surface_.empty()) {
        cv::flip(surface_, surface_, 1);
    }
}

void OverlayCompositor::drawEarring(const Eigen::Vector2d& center, double size,
                                    const Eigen::Vector3d& color, const Eigen::Vector3d& highlight) {
    const CalibrationParams& calib = config_.calibration;
    fillDisc(center, size, color, draw_state_.opacity);

    // Specular highlight toward the upper left
    Eigen::Vector2d shine = center - Eigen::Vector2d::Constant(size * calib.highlight_offset);
    fillDisc(shine, size * calib.highlight_radius, highlight, draw_state_.opacity * calib.highlight_alpha);
}

void OverlayCompositor::drawNecklace(const Eigen::Vector2d& center, double chain_width, double size,
                                     const Eigen::Vector3d& color, const Eigen::Vector3d& highlight) {
    const CalibrationParams& calib = config_.calibration;
    Eigen::Vector2d axes(chain_width * 0.5, chain_width * 0.35);
    int thickness = std::max(2, static_cast<int>(std::lround(size * 0.15)));
    strokeLowerArc(center, axes, thickness, color, draw_state_.opacity);

    Eigen::Vector2d pendant(center.x(), center.y() + axes.y());
    double radius = size * 0.5;
    fillDisc(pendant, radius, color, draw_state_.opacity);
    Eigen::Vector2d shine = pendant - Eigen::Vector2d::Constant(radius * calib.highlight_offset);
    fillDisc(shine, radius * calib.highlight_radius, highlight, draw_state_.opacity * calib.highlight_alpha);
}

void OverlayCompositor::fillDisc(const Eigen::Vector2d& center, double radius,
                                 const Eigen::Vector3d& rgb, double alpha) {
    if (!isFinite(center) || !(radius > 0.0)) return;

    int r = static_cast<int>(std::ceil(radius));
    cv::Rect bounds(static_cast<int>(std::floor(center.x())) - r - 1,
                    static_cast<int>(std::floor(center.y())) - r - 1,
                    2 * r + 3, 2 * r + 3);
    cv::Rect roi = bounds & cv::Rect(0, 0, surface_.cols, surface_.rows);
    if (roi.area() == 0) return;

    cv::Mat mask = cv::Mat::zeros(roi.size(), CV_8UC1);
    cv::circle(mask,
               cv::Point(static_cast<int>(std::lround(center.x())) - roi.x,
                         static_cast<int>(std::lround(center.y())) - roi.y),
               static_cast<int>(std::lround(radius)), cv::Scalar(255), cv::FILLED, cv::LINE_8);
    blendMask(mask, roi, rgb, alpha);
    ++primitive_count_;
}

void OverlayCompositor::strokeLowerArc(const Eigen::Vector2d& center, const Eigen::Vector2d& axes,
                                       int thickness, const Eigen::Vector3d& rgb, double alpha) {
    if (!isFinite(center) || !isFinite(axes) || axes.minCoeff() <= 0.0) return;

    int pad = thickness + 2;
    cv::Rect bounds(static_cast<int>(std::floor(center.x() - axes.x())) - pad,
                    static_cast<int>(std::floor(center.y())) - pad,
                    static_cast<int>(std::ceil(2.0 * axes.x())) + 2 * pad,
                    static_cast<int>(std::ceil(axes.y())) + 2 * pad);
    cv::Rect roi = bounds & cv::Rect(0, 0, surface_.cols, surface_.rows);
    if (roi.area() == 0) return;

    cv::Mat mask = cv::Mat::zeros(roi.size(), CV_8UC1);
    // Image y grows downward, so 0..180 degrees is the lower half
    cv::ellipse(mask,
                cv::Point(static_cast<int>(std::lround(center.x())) - roi.x,
                          static_cast<int>(std::lround(center.y())) - roi.y),
                cv::Size(static_cast<int>(std::lround(axes.x())), static_cast<int>(std::lround(axes.y()))),
                0.0, 0.0, 180.0, cv::Scalar(255), thickness, cv::LINE_8);
    blendMask(mask, roi, rgb, alpha);
    ++primitive_count_;
}

void OverlayCompositor::blendMask(const cv::Mat& mask, const cv::Rect& roi,
                                  const Eigen::Vector3d& rgb, double alpha) {
    alpha = std::min(std::max(alpha, 0.0), 1.0);
    if (alpha <= 0.0) return;

    for (int v = 0; v < roi.height; ++v) {
        const unsigned char* m = mask.ptr<unsigned char>(v);
        cv::Vec4b* dst = surface_.ptr<cv::Vec4b>(roi.y + v) + roi.x;
        for (int u = 0; u < roi.width; ++u) {
            if (m[u] == 0) continue;

            cv::Vec4b& px = dst[u];
            double dst_a = px[3] / 255.0;
            double out_a = alpha + dst_a * (1.0 - alpha);
            // BGR storage order
            double src[3] = {rgb.z(), rgb.y(), rgb.x()};
            for (int c = 0; c < 3; ++c) {
                double dst_c = px[c] / 255.0;
                double out_c = (src[c] * alpha + dst_c * dst_a * (1.0 - alpha)) / out_a;
                px[c] = toByte(out_c);
            }
            px[3] = toByte(out_a);
        }
    }
}

bool OverlayCompositor::compositeOnto(cv::Mat& frame_bgr) const {
    if (frame_bgr.type() != CV_8UC3 || frame_bgr.size() != surface_.size()) {
        std::cerr << "Cannot composite overlay " << surface_.cols << "x" << surface_.rows
                  << " onto frame " << frame_bgr.cols << "x" << frame_bgr.rows << std::endl;
        return false;
    }

    const bool screen = material_->blend_mode == BlendMode::Screen;
    for (int v = 0; v < surface_.rows; ++v) {
        const cv::Vec4b* src = surface_.ptr<cv::Vec4b>(v);
        cv::Vec3b* dst = frame_bgr.ptr<cv::Vec3b>(v);
        for (int u = 0; u < surface_.cols; ++u) {
            if (src[u][3] == 0) continue;
            double a = src[u][3] / 255.0;
            for (int c = 0; c < 3; ++c) {
                double s = src[u][c] / 255.0;
                double d = dst[u][c] / 255.0;
                double blended = screen ? 1.0 - (1.0 - s) * (1.0 - d) : s;
                dst[u][c] = toByte(blended * a + d * (1.0 - a));
            }
        }
    }
    return true;
}

} // namespace jewelry_tryon
