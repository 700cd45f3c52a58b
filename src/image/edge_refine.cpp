#include "photo_finish/image/edge_refine.hpp"
#include "photo_finish/image/compositing.hpp"
#include "photo_finish/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace photo_finish::image {

namespace {

// Disk kernel with weights 1 / (1 + d^2), used to average background colors.
cv::Mat background_kernel(int radius) {
    const int size = 2 * radius + 1;
    cv::Mat k(size, size, CV_32F, cv::Scalar(0.0f));
    const int r2 = radius * radius;
    for (int dy = -radius; dy <= radius; ++dy) {
        for (int dx = -radius; dx <= radius; ++dx) {
            const int d2 = dx * dx + dy * dy;
            if (d2 > r2) continue;
            k.at<float>(dy + radius, dx + radius) = 1.0f / (1.0f + static_cast<float>(d2));
        }
    }
    return k;
}

} // namespace

cv::Mat defringe(const cv::Mat& pixels, const cv::Mat& alpha, int low, int high,
                 int radius, int* defringed_count) {
    cv::Mat out = pixels.clone();
    if (defringed_count) *defringed_count = 0;

    cv::Mat partial = (alpha > low) & (alpha < high);
    if (cv::countNonZero(partial) == 0) {
        return out;
    }

    // Weighted sums of the fully-background neighbours, per channel.
    cv::Mat bg_weight;
    cv::Mat bg_mask = alpha <= low;
    bg_mask.convertTo(bg_weight, CV_32F, 1.0 / 255.0);

    cv::Mat rgb_f;
    rgb_view(pixels).convertTo(rgb_f, CV_32FC3);
    std::vector<cv::Mat> planes;
    cv::split(rgb_f, planes);

    const cv::Mat kernel = background_kernel(radius);
    cv::Mat weight_sum;
    cv::filter2D(bg_weight, weight_sum, CV_32F, kernel, cv::Point(-1, -1), 0.0,
                 cv::BORDER_CONSTANT);
    std::vector<cv::Mat> color_sums(3);
    for (int c = 0; c < 3; ++c) {
        cv::Mat weighted = planes[c].mul(bg_weight);
        cv::filter2D(weighted, color_sums[c], CV_32F, kernel, cv::Point(-1, -1), 0.0,
                     cv::BORDER_CONSTANT);
    }

    const int channels = pixels.channels();
    int count = 0;
    for (int y = 0; y < pixels.rows; ++y) {
        const uint8_t* p = partial.ptr<uint8_t>(y);
        const uint8_t* a = alpha.ptr<uint8_t>(y);
        const float* w = weight_sum.ptr<float>(y);
        uint8_t* dst = out.ptr<uint8_t>(y);
        for (int x = 0; x < pixels.cols; ++x) {
            if (!p[x] || w[x] <= 1e-6f) continue;
            const double af = a[x] / 255.0;
            uint8_t* px = dst + static_cast<size_t>(x) * channels;
            for (int c = 0; c < 3; ++c) {
                const double bg = color_sums[c].at<float>(y, x) / w[x];
                const double fg = (px[c] - (1.0 - af) * bg) / af;
                px[c] = cv::saturate_cast<uint8_t>(std::lround(std::min(255.0, std::max(0.0, fg))));
            }
            ++count;
        }
    }

    if (defringed_count) *defringed_count = count;
    return out;
}

double effective_feather_radius(const config::EdgeConfig& cfg, int width, int height) {
    const double requested = cfg.feather_radius_px;
    if (requested <= 0.0) return 0.0;
    const double ceiling =
        std::max(0.5, cfg.feather_max_fraction * static_cast<double>(std::min(width, height)));
    return std::min(requested, ceiling);
}

RefinedSubject refine_edges(const RasterImage& image, const AlphaMask& mask,
                            const config::EdgeConfig& cfg,
                            int occupancy_threshold) {
    require_same_size(image, mask, "refine_edges");
    if (mask.count_above(occupancy_threshold) == 0) {
        throw EmptySubjectError("mask has no pixel above occupancy threshold " +
                                std::to_string(occupancy_threshold));
    }

    EdgeRefineStats stats;
    cv::Mat alpha = mask.mat().clone();

    if (cfg.erode_iterations > 0) {
        const cv::Mat k = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3));
        cv::erode(alpha, alpha, k, cv::Point(-1, -1), cfg.erode_iterations,
                  cv::BORDER_REPLICATE);
    }

    const int low = cfg.defringe_thresholds[0];
    const int high = cfg.defringe_thresholds[1];
    cv::Mat partial = (alpha > low) & (alpha < high);
    stats.partial_pixels = cv::countNonZero(partial);

    cv::Mat pixels;
    if (cfg.defringe_enabled && stats.partial_pixels > 0) {
        pixels = defringe(image.mat(), alpha, low, high, cfg.defringe_radius_px,
                          &stats.defringed_pixels);
    } else {
        pixels = image.mat().clone();
    }

    const double radius = effective_feather_radius(cfg, image.width(), image.height());
    stats.feather_radius_px = radius;
    stats.feather_capped = radius > 0.0 && radius < cfg.feather_radius_px;
    if (radius > 0.0) {
        cv::Mat alpha_f;
        alpha.convertTo(alpha_f, CV_32F);
        cv::Mat blurred = gaussian_blur_plane(alpha_f, radius, cv::BORDER_REPLICATE);
        blurred.convertTo(alpha, CV_8U);
    }

    if (pixels.channels() == 4) {
        cv::insertChannel(alpha, pixels, 3);
    }

    if (cv::countNonZero(alpha > occupancy_threshold) == 0) {
        throw EmptySubjectError("subject vanished after erosion/feathering");
    }

    RefinedSubject out;
    out.image = RasterImage(pixels);
    out.mask = AlphaMask(alpha);
    out.stats = stats;
    return out;
}

} // namespace photo_finish::image
