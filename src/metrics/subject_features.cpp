#include "photo_finish/metrics/subject_features.hpp"
#include "photo_finish/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace photo_finish::metrics {

FeatureVector SubjectFeatures::to_vector() const {
    FeatureVector v(7);
    v << luminance_mean, luminance_std, dark_ratio, mid_ratio, bright_ratio,
        saturation_mean, saturation_std;
    return v;
}

const std::vector<std::string>& feature_names() {
    static const std::vector<std::string> names = {
            "luminance_mean", "luminance_std",   "dark_ratio",    "mid_ratio",
            "bright_ratio",   "saturation_mean", "saturation_std"};
    return names;
}

double bt601_luminance(double r, double g, double b) {
    return 0.299 * r + 0.587 * g + 0.114 * b;
}

double hsv_saturation(double r, double g, double b) {
    const double mx = std::max(r, std::max(g, b));
    if (mx <= 0.0) return 0.0;
    const double mn = std::min(r, std::min(g, b));
    return (mx - mn) / mx * 255.0;
}

SubjectFeatures extract_subject_features(const RasterImage& image, const AlphaMask& mask,
                                         int occupancy_threshold, int min_subject_pixels) {
    require_same_size(image, mask, "extract_subject_features");

    const cv::Mat& px = image.mat();
    const cv::Mat& alpha = mask.mat();
    const int channels = image.channels();

    // Welford accumulation keeps the std stable for large subjects.
    int64_t n = 0;
    double lum_mean = 0.0, lum_m2 = 0.0;
    double sat_mean = 0.0, sat_m2 = 0.0;
    int64_t dark = 0, mid = 0, bright = 0;

    for (int y = 0; y < px.rows; ++y) {
        const uint8_t* row = px.ptr<uint8_t>(y);
        const uint8_t* a = alpha.ptr<uint8_t>(y);
        for (int x = 0; x < px.cols; ++x) {
            if (a[x] <= occupancy_threshold) continue;
            const uint8_t* p = row + static_cast<size_t>(x) * channels;
            const double r = p[0], g = p[1], b = p[2];
            const double lum = bt601_luminance(r, g, b);
            const double sat = hsv_saturation(r, g, b);

            ++n;
            const double dl = lum - lum_mean;
            lum_mean += dl / static_cast<double>(n);
            lum_m2 += dl * (lum - lum_mean);
            const double ds = sat - sat_mean;
            sat_mean += ds / static_cast<double>(n);
            sat_m2 += ds * (sat - sat_mean);

            if (lum < 50.0) {
                ++dark;
            } else if (lum < 150.0) {
                ++mid;
            } else {
                ++bright;
            }
        }
    }

    if (n < min_subject_pixels) {
        throw InsufficientSubjectError(std::to_string(n) + " subject pixels, need at least " +
                                       std::to_string(min_subject_pixels));
    }

    const double total = static_cast<double>(n);
    SubjectFeatures f;
    f.luminance_mean = lum_mean;
    f.luminance_std = std::sqrt(std::max(0.0, lum_m2 / total));
    f.dark_ratio = static_cast<double>(dark) / total;
    f.mid_ratio = static_cast<double>(mid) / total;
    f.bright_ratio = static_cast<double>(bright) / total;
    f.saturation_mean = sat_mean;
    f.saturation_std = std::sqrt(std::max(0.0, sat_m2 / total));
    f.subject_pixel_count = static_cast<int>(n);
    f.subject_fraction = total / (static_cast<double>(px.rows) * static_cast<double>(px.cols));
    return f;
}

} // namespace photo_finish::metrics
