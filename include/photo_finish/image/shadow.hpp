#pragma once

#include "photo_finish/config/configuration.hpp"
#include "photo_finish/core/types.hpp"

namespace photo_finish::image {

struct ShadowResult {
    RasterImage canvas;
    bool applied = false;
    int shadow_pixels = 0;  // pixels whose value changed
};

// Shadow alpha plane (CV_32F, 0..opacity) for the configured shape.
cv::Mat build_shadow_plane(const AlphaMask& canvas_mask, const Placement& placement,
                           const config::ShadowConfig& cfg, int canvas_height);

// Composite a soft shadow underneath the subject. Pixels where the subject is
// fully opaque are never modified. Returns the input unchanged (applied =
// false) when disabled or when the canvas holds fewer than min_subject_pixels
// subject pixels.
ShadowResult add_shadow(const RasterImage& canvas, const AlphaMask& canvas_mask,
                        const Placement& placement, const config::ShadowConfig& cfg,
                        const config::CanvasConfig& canvas_cfg, int min_subject_pixels,
                        int occupancy_threshold);

} // namespace photo_finish::image
