#pragma once

#include "photo_finish/core/types.hpp"

#include <opencv2/core.hpp>

namespace photo_finish::image {

// Gaussian blur of a float plane with sigma = radius. radius <= 0 returns a copy.
cv::Mat gaussian_blur_plane(const cv::Mat& plane, double radius, int border_type);

// "Over" compositing of an RGB(A) layer onto an RGBA canvas (in place).
// fg_alpha is CV_8UC1 with the same size as fg; the layer's own alpha channel,
// if any, is ignored. Straight-alpha result, rounded to nearest.
void composite_over(cv::Mat& canvas_rgba, const cv::Mat& fg, const cv::Mat& fg_alpha,
                    int offset_x, int offset_y);

// Drop the alpha channel of a 4-channel image, keep 3-channel input as is.
cv::Mat rgb_view(const cv::Mat& pixels);

} // namespace photo_finish::image
