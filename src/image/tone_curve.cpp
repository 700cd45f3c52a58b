#include "photo_finish/image/tone_curve.hpp"
#include "photo_finish/metrics/subject_features.hpp"

#include <algorithm>
#include <cmath>

namespace photo_finish::image {

namespace {

inline uint8_t to_u8(double v) {
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

inline uint8_t blend(uint8_t x, uint8_t y, uint8_t m) {
    if (m == 255) return y;
    const double d = (static_cast<double>(y) - static_cast<double>(x)) * m / 255.0;
    return to_u8(static_cast<double>(x) + d);
}

} // namespace

double tone_curve_value(double x, const ToneParameters& params) {
    double base = (x * params.contrast + params.brightness) / 255.0;
    base = std::clamp(base, 0.0, 1.0);
    const double y = std::pow(base, params.gamma) * 255.0;
    if (!std::isfinite(y)) return 255.0;
    return std::clamp(y, 0.0, 255.0);
}

std::array<uint8_t, 256> build_tone_lut(const ToneParameters& params) {
    std::array<uint8_t, 256> lut{};
    for (int i = 0; i < 256; ++i) {
        lut[static_cast<size_t>(i)] = to_u8(tone_curve_value(static_cast<double>(i), params));
    }
    return lut;
}

RasterImage apply_tone(const RasterImage& image, const AlphaMask& mask,
                       const ToneParameters& params, ToneChannelMode mode) {
    require_same_size(image, mask, "apply_tone");

    cv::Mat out = image.mat().clone();
    const int cn = out.channels();
    const cv::Mat& m = mask.mat();

    if (mode == ToneChannelMode::PER_CHANNEL) {
        const auto lut = build_tone_lut(params);
        for (int y = 0; y < out.rows; ++y) {
            uint8_t* row = out.ptr<uint8_t>(y);
            const uint8_t* mrow = m.ptr<uint8_t>(y);
            for (int x = 0; x < out.cols; ++x) {
                const uint8_t w = mrow[x];
                if (w == 0) continue;
                uint8_t* px = row + x * cn;
                for (int c = 0; c < 3; ++c) {
                    px[c] = blend(px[c], lut[px[c]], w);
                }
            }
        }
        return RasterImage(out);
    }

    // Luminance mode: scale each channel by Y'/Y to keep the hue.
    for (int y = 0; y < out.rows; ++y) {
        uint8_t* row = out.ptr<uint8_t>(y);
        const uint8_t* mrow = m.ptr<uint8_t>(y);
        for (int x = 0; x < out.cols; ++x) {
            const uint8_t w = mrow[x];
            if (w == 0) continue;
            uint8_t* px = row + x * cn;
            const double lum = metrics::bt601_luminance(px[0], px[1], px[2]);
            const double mapped = tone_curve_value(lum, params);
            for (int c = 0; c < 3; ++c) {
                const double target = lum > 0.0 ? px[c] * (mapped / lum) : mapped;
                px[c] = blend(px[c], to_u8(target), w);
            }
        }
    }
    return RasterImage(out);
}

} // namespace photo_finish::image
