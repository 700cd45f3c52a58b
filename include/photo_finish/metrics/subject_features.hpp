#pragma once

#include "photo_finish/core/types.hpp"

#include <string>
#include <vector>

namespace photo_finish::metrics {

// Layout identifier of the feature vector; tone models declare the names
// they were trained on and must match feature_names() exactly.
inline constexpr const char* kFeatureLayout = "subject_stats_v1";

struct SubjectFeatures {
    double luminance_mean = 0.0;   // BT.601, 0..255
    double luminance_std = 0.0;
    double dark_ratio = 0.0;       // Y < 50
    double mid_ratio = 0.0;        // 50 <= Y < 150
    double bright_ratio = 0.0;     // Y >= 150
    double saturation_mean = 0.0;  // HSV saturation scaled to 0..255
    double saturation_std = 0.0;

    int subject_pixel_count = 0;
    double subject_fraction = 0.0;

    FeatureVector to_vector() const;
};

const std::vector<std::string>& feature_names();

double bt601_luminance(double r, double g, double b);
double hsv_saturation(double r, double g, double b);

// Statistics over mask > occupancy_threshold only. Throws
// DimensionMismatchError and InsufficientSubjectError.
SubjectFeatures extract_subject_features(const RasterImage& image, const AlphaMask& mask,
                                         int occupancy_threshold, int min_subject_pixels);

} // namespace photo_finish::metrics
