#pragma once

#include <Eigen/Dense>
#include <opencv2/core.hpp>
#include <vector>
#include "config/JewelryConfig.h"
#include "rendering/MaterialProfile.h"
#include "tracking/AnchorResolver.h"
#include "tracking/MeasurementEstimator.h"

namespace jewelry_tryon {

/**
 * Drawing state active while primitives are drawn.
 * Outside of render() it is always the default.
 */
struct DrawState {
    const MaterialProfile* material = nullptr;
    double opacity = 1.0;

    bool isDefault() const { return material == nullptr && opacity == 1.0; }
};

/**
 * Draws jewelry primitives for one frame onto a transparent BGRA surface
 * of the camera frame's size.
 *
 * Each frame is drawn from scratch: beginFrame() resizes and clears,
 * render() draws, finishFrame() mirrors for the selfie preview.
 */
class OverlayCompositor {
public:
    explicit OverlayCompositor(const JewelryConfig& config);

    /**
     * Resize the surface to the frame and clear it to transparent
     */
    void beginFrame(int width, int height);

    /**
     * Draw the configured jewelry at the given anchors.
     * @param anchors Smoothed anchors of this frame (unmirrored pixels)
     * @param measurements Latest published measurements
     * @return false if nothing could be drawn (missing anchor, invalid
     *         measurement for auto-scale, degenerate size)
     */
    bool render(const std::vector<Anchor>& anchors, const Measurements& measurements);

    /**
     * Apply the horizontal mirror if enabled
     */
    void finishFrame();

    /**
     * Final primitive size in pixels, NaN if it cannot be computed
     */
    double resolveSize(const Measurements& measurements) const;

    /**
     * Configured opacity override, else the material's
     */
    double resolveOpacity() const;

    const MaterialProfile& getMaterial() const { return *material_; }
    const DrawState& getDrawState() const { return draw_state_; }
    const cv::Mat& getSurface() const { return surface_; }

    /**
     * Number of primitives (discs, arcs, highlights) in the current frame
     */
    int getPrimitiveCount() const { return primitive_count_; }

    /**
     * Blend the overlay onto a BGR frame of the same size, using the
     * material blend mode.
     * @return false if the sizes or types do not match
     */
    bool compositeOnto(cv::Mat& frame_bgr) const;

private:
    /**
     * Restores the default draw state when leaving render()
     */
    class ScopedDrawState {
    public:
        ScopedDrawState(DrawState& state, const MaterialProfile* material, double opacity);
        ~ScopedDrawState();
    private:
        DrawState& state_;
    };

    void drawEarring(const Eigen::Vector2d& center, double size,
                     const Eigen::Vector3d& color, const Eigen::Vector3d& highlight);
    void drawNecklace(const Eigen::Vector2d& center, double chain_width, double size,
                      const Eigen::Vector3d& color, const Eigen::Vector3d& highlight);

    void fillDisc(const Eigen::Vector2d& center, double radius,
                  const Eigen::Vector3d& rgb, double alpha);
    void strokeLowerArc(const Eigen::Vector2d& center, const Eigen::Vector2d& axes, int thickness,
                        const Eigen::Vector3d& rgb, double alpha);

    /**
     * Source-over blend of a colour through a mask placed at roi
     */
    void blendMask(const cv::Mat& mask, const cv::Rect& roi,
                   const Eigen::Vector3d& rgb, double alpha);

    JewelryConfig config_;
    const MaterialProfile* material_;
    DrawState draw_state_;
    cv::Mat surface_;  // CV_8UC4, BGRA, straight alpha
    int primitive_count_ = 0;
};

} // namespace jewelry_tryon
