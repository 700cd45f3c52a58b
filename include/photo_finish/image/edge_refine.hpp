#pragma once

#include "photo_finish/config/configuration.hpp"
#include "photo_finish/core/types.hpp"

namespace photo_finish::image {

struct EdgeRefineStats {
    int partial_pixels = 0;      // pixels inside the defringe band
    int defringed_pixels = 0;    // pixels whose color was unmixed
    double feather_radius_px = 0.0; // effective radius after the size cap
    bool feather_capped = false;
};

struct RefinedSubject {
    RasterImage image;
    AlphaMask mask;
    EdgeRefineStats stats;
};

// Defringe partially transparent edge pixels against the local background
// estimate, then feather the alpha plane. Throws DimensionMismatchError and
// EmptySubjectError (no mask value above occupancy_threshold).
RefinedSubject refine_edges(const RasterImage& image, const AlphaMask& mask,
                            const config::EdgeConfig& cfg,
                            int occupancy_threshold);

// Defringe only; exposed for tests. Returns the unmixed RGB(A) pixels.
cv::Mat defringe(const cv::Mat& pixels, const cv::Mat& alpha, int low, int high,
                 int radius, int* defringed_count = nullptr);

// Effective feather radius for an image size.
double effective_feather_radius(const config::EdgeConfig& cfg, int width, int height);

} // namespace photo_finish::image
