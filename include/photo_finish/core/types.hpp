#pragma once

#include <Eigen/Dense>
#include <opencv2/core.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace photo_finish {

namespace fs = std::filesystem;

// Feature vector consumed by the tone model (fixed length and order per layout)
using FeatureVector = Eigen::VectorXd;
using MatrixXd = Eigen::MatrixXd;

// Owned 8-bit raster, channel order R,G,B(,A). Immutable after construction.
class RasterImage {
public:
    RasterImage() = default;

    // Deep-copies the pixels. Accepts CV_8UC3 (RGB) or CV_8UC4 (RGBA) only.
    explicit RasterImage(const cv::Mat& pixels);

    static RasterImage filled(int width, int height, const cv::Scalar& rgba);

    int width() const { return pixels_.cols; }
    int height() const { return pixels_.rows; }
    int channels() const { return pixels_.channels(); }
    bool has_alpha() const { return pixels_.channels() == 4; }
    bool empty() const { return pixels_.empty(); }

    const cv::Mat& mat() const { return pixels_; }

private:
    cv::Mat pixels_;
};

// Single-channel opacity map. 0 = background, 255 = subject.
class AlphaMask {
public:
    AlphaMask() = default;

    // Deep-copies the values. Accepts CV_8UC1 only.
    explicit AlphaMask(const cv::Mat& values);

    static AlphaMask filled(int width, int height, uint8_t value);

    int width() const { return values_.cols; }
    int height() const { return values_.rows; }
    bool empty() const { return values_.empty(); }

    uint8_t at(int x, int y) const { return values_.at<uint8_t>(y, x); }
    const cv::Mat& mat() const { return values_; }

    int count_above(int threshold) const;

private:
    cv::Mat values_;
};

// Throws DimensionMismatchError unless image and mask have the same size.
void require_same_size(const RasterImage& image, const AlphaMask& mask,
                       const std::string& what);

// Pixel rectangle, right/bottom exclusive.
struct BoundingBox {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;

    int width() const { return right - left; }
    int height() const { return bottom - top; }
    double center_x() const { return 0.5 * (left + right); }
    double center_y() const { return 0.5 * (top + bottom); }

    bool operator==(const BoundingBox& o) const {
        return left == o.left && top == o.top && right == o.right && bottom == o.bottom;
    }
};

// Parametric tone curve: y = ((x*c + b) / 255)^gamma * 255
struct ToneParameters {
    double brightness = 0.0;
    double contrast = 1.0;
    double gamma = 1.0;

    static ToneParameters neutral() { return {0.0, 1.0, 1.0}; }

    bool operator==(const ToneParameters& o) const {
        return brightness == o.brightness && contrast == o.contrast && gamma == o.gamma;
    }
};

// Where the subject ended up on the canvas
struct Placement {
    BoundingBox bbox;        // in source coordinates
    double scale = 1.0;
    int scaled_width = 0;
    int scaled_height = 0;
    int offset_x = 0;        // canvas position of the placed bbox
    int offset_y = 0;
    int translation_x = 0;   // offset_x - bbox.left
    int translation_y = 0;   // offset_y - bbox.top
};

enum class ToneChannelMode {
    PER_CHANNEL,
    LUMINANCE
};

inline std::string tone_channel_mode_to_string(ToneChannelMode mode) {
    switch (mode) {
        case ToneChannelMode::PER_CHANNEL: return "per_channel";
        case ToneChannelMode::LUMINANCE: return "luminance";
        default: return "unknown";
    }
}

inline std::string normalize_token(const std::string& s) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(), std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(), norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(norm.begin(), norm.end(), '-', '_');
    return norm;
}

// Returns false for unknown names.
inline bool string_to_tone_channel_mode(const std::string& s, ToneChannelMode& out) {
    const std::string norm = normalize_token(s);
    if (norm == "per_channel" || norm == "rgb") {
        out = ToneChannelMode::PER_CHANNEL;
        return true;
    }
    if (norm == "luminance" || norm == "luma") {
        out = ToneChannelMode::LUMINANCE;
        return true;
    }
    return false;
}

enum class ScaleMode {
    FIT_OVERSIZED,  // shrink only when the subject exceeds the canvas
    FILL_MARGIN     // always scale to the area inside the margin
};

inline std::string scale_mode_to_string(ScaleMode mode) {
    switch (mode) {
        case ScaleMode::FIT_OVERSIZED: return "fit_oversized";
        case ScaleMode::FILL_MARGIN: return "fill_margin";
        default: return "unknown";
    }
}

inline bool string_to_scale_mode(const std::string& s, ScaleMode& out) {
    const std::string norm = normalize_token(s);
    if (norm == "fit_oversized") {
        out = ScaleMode::FIT_OVERSIZED;
        return true;
    }
    if (norm == "fill_margin") {
        out = ScaleMode::FILL_MARGIN;
        return true;
    }
    return false;
}

enum class ShadowMode {
    SILHOUETTE,
    ELLIPSE
};

inline std::string shadow_mode_to_string(ShadowMode mode) {
    switch (mode) {
        case ShadowMode::SILHOUETTE: return "silhouette";
        case ShadowMode::ELLIPSE: return "ellipse";
        default: return "unknown";
    }
}

inline bool string_to_shadow_mode(const std::string& s, ShadowMode& out) {
    const std::string norm = normalize_token(s);
    if (norm == "silhouette") {
        out = ShadowMode::SILHOUETTE;
        return true;
    }
    if (norm == "ellipse") {
        out = ShadowMode::ELLIPSE;
        return true;
    }
    return false;
}

// Pipeline stage enumeration (fixed order)
enum class Phase {
    EDGE_REFINE = 0,
    FEATURES = 1,
    TONE_PREDICT = 2,
    TONE_APPLY = 3,
    CENTER = 4,
    SHADOW = 5,
    DONE = 6
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::EDGE_REFINE: return "EDGE_REFINE";
        case Phase::FEATURES: return "FEATURES";
        case Phase::TONE_PREDICT: return "TONE_PREDICT";
        case Phase::TONE_APPLY: return "TONE_APPLY";
        case Phase::CENTER: return "CENTER";
        case Phase::SHADOW: return "SHADOW";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace photo_finish
