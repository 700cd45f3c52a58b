#pragma once

#include "photo_finish/config/configuration.hpp"
#include "photo_finish/core/types.hpp"

#include <filesystem>
#include <string>

namespace photo_finish::testing {

// Uniform RGB image.
RasterImage solid_rgb(int width, int height, int r, int g, int b);

// Mask with `value` inside rect and 0 elsewhere.
AlphaMask rect_mask(int width, int height, const cv::Rect& rect, uint8_t value = 255);

// 200x200 transparent canvas, no feathering, no defringe, no shadow, no model.
config::Config plain_config();

// Fresh, empty directory under the system temp dir.
std::filesystem::path make_temp_dir(const std::string& name);

} // namespace photo_finish::testing
