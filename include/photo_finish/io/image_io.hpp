#pragma once

#include "photo_finish/core/types.hpp"

#include <filesystem>
#include <utility>

namespace photo_finish::io {

namespace fs = std::filesystem;

// Load an image as 8-bit RGB or RGBA. Grayscale becomes RGB, 16-bit data is
// scaled to 8-bit. Throws IOError.
RasterImage read_image(const fs::path& path);

// Load a mask: a single-channel file is used as is, the alpha channel is
// taken from a 4-channel file and a 3-channel file is converted to gray.
AlphaMask read_mask(const fs::path& path);

// Split an RGBA image into its RGB pixels and alpha mask.
std::pair<RasterImage, AlphaMask> split_alpha(const RasterImage& rgba);

// Write an RGB(A) image as PNG, creating parent directories. Throws IOError.
void write_png(const fs::path& path, const RasterImage& image);

} // namespace photo_finish::io
