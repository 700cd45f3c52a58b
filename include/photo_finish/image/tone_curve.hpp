#pragma once

#include "photo_finish/core/types.hpp"

#include <array>
#include <cstdint>

namespace photo_finish::image {

// y = clamp(((x*c + b)/255)^gamma * 255, 0, 255); the base is clamped to
// [0, 1] before the power.
double tone_curve_value(double x, const ToneParameters& params);

// 256-entry lookup table, rounded to nearest. Non-decreasing for c, gamma > 0.
std::array<uint8_t, 256> build_tone_lut(const ToneParameters& params);

// Apply the curve to the color channels, weighted by mask/255. Pixels with
// mask 0 and the alpha channel are left untouched. Throws
// DimensionMismatchError.
RasterImage apply_tone(const RasterImage& image, const AlphaMask& mask,
                       const ToneParameters& params, ToneChannelMode mode);

} // namespace photo_finish::image
