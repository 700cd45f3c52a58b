#pragma once

#include "photo_finish/config/configuration.hpp"
#include "photo_finish/core/types.hpp"

#include <optional>

namespace photo_finish::image {

struct CenteredSubject {
    RasterImage canvas;     // RGBA, canvas.size
    AlphaMask canvas_mask;  // subject alpha at its final position
    Placement placement;
};

// Minimal rectangle enclosing all mask values > occupancy_threshold.
std::optional<BoundingBox> compute_bounding_box(const AlphaMask& mask,
                                                int occupancy_threshold);

// Scale factor applied to a bbox of the given size (1.0 when it already fits).
double compute_fit_scale(int bbox_width, int bbox_height,
                         const config::CanvasConfig& cfg);

// Place the subject's bbox center on the canvas center and composite it over
// a canvas filled with cfg.background. The bbox and canvas_mask come from
// `mask`; an RGBA image is composited with its own alpha channel, an RGB image
// with `mask`. Throws EmptySubjectError and DimensionMismatchError.
CenteredSubject center_subject(const RasterImage& image, const AlphaMask& mask,
                               const config::CanvasConfig& cfg,
                               int occupancy_threshold);

} // namespace photo_finish::image
