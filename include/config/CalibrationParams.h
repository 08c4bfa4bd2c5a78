#pragma once

namespace jewelry_tryon {

/**
 * Empirically tuned calibration values.
 *
 * None of these are physical constants; they were fitted on a 1280x720
 * front camera and can be overridden from the `calibration` section of a
 * jewelry config file.
 */
struct CalibrationParams {
    // Anchor resolver
    double reference_face_width_px = 150.0;  // Face width (px) that maps to scale 1.0
    double perspective_shift_px = 10.0;      // Ear shift per unit depth factor
    double pitch_offset_factor = 0.5;        // Pixels of vertical shift per degree of pitch
    double necklace_drop = 0.35;             // Neck anchor drop below the chin, in face widths

    // Measurement estimator
    double ear_width_proportion = 0.15;      // Earring width relative to ear span
    double neck_width_proportion = 0.65;     // Neck width relative to chin-forehead distance
    double measurement_interval = 0.1;       // Seconds between propagated measurements

    // Auto-scale sizing
    double auto_scale_base_size = 30.0;      // Size (px) at the reference measurement
    double reference_ear_width = 0.05;       // Average normalized ear width
    double reference_neck_width = 0.2;       // Average normalized neck width

    // Motion smoother
    double reference_fps = 60.0;             // Frame rate stiffness/damping are expressed at
    double max_dt = 0.1;                     // Longest step (s) fed to the integrator

    // Compositor
    double highlight_offset = 0.3;           // Highlight centre offset, fraction of size
    double highlight_radius = 0.3;           // Highlight radius, fraction of size
    double highlight_alpha = 0.4;
    bool mirror = true;                      // Flip the overlay for selfie preview

    // Pipeline
    bool snap_on_reacquire = true;           // Snap smoother state when a face reappears
};

} // namespace jewelry_tryon
