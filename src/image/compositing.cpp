#include "photo_finish/image/compositing.hpp"
#include "photo_finish/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace photo_finish::image {

cv::Mat gaussian_blur_plane(const cv::Mat& plane, double radius, int border_type) {
    if (radius <= 0.0) {
        return plane.clone();
    }
    const int half = static_cast<int>(std::ceil(3.0 * radius));
    const int ksize = 2 * std::max(1, half) + 1;
    cv::Mat out;
    cv::GaussianBlur(plane, out, cv::Size(ksize, ksize), radius, radius, border_type);
    return out;
}

void composite_over(cv::Mat& canvas_rgba, const cv::Mat& fg, const cv::Mat& fg_alpha,
                    int offset_x, int offset_y) {
    if (canvas_rgba.type() != CV_8UC4) {
        throw PhotoFinishError("composite_over requires an RGBA canvas");
    }
    if (fg_alpha.type() != CV_8UC1 || fg_alpha.size() != fg.size()) {
        throw DimensionMismatchError("composite_over: layer alpha does not match layer");
    }

    const int fg_channels = fg.channels();
    const int x0 = std::max(0, offset_x);
    const int y0 = std::max(0, offset_y);
    const int x1 = std::min(canvas_rgba.cols, offset_x + fg.cols);
    const int y1 = std::min(canvas_rgba.rows, offset_y + fg.rows);

    for (int y = y0; y < y1; ++y) {
        const int sy = y - offset_y;
        const uint8_t* src = fg.ptr<uint8_t>(sy);
        const uint8_t* src_a = fg_alpha.ptr<uint8_t>(sy);
        cv::Vec4b* dst = canvas_rgba.ptr<cv::Vec4b>(y);
        for (int x = x0; x < x1; ++x) {
            const int sx = x - offset_x;
            const int a8 = src_a[sx];
            if (a8 == 0) {
                continue;
            }
            const uint8_t* px = src + static_cast<size_t>(sx) * fg_channels;
            cv::Vec4b& d = dst[x];
            if (a8 == 255) {
                d[0] = px[0];
                d[1] = px[1];
                d[2] = px[2];
                d[3] = 255;
                continue;
            }

            const double af = a8 / 255.0;
            const double ab = d[3] / 255.0;
            const double a_out = af + ab * (1.0 - af);
            for (int c = 0; c < 3; ++c) {
                const double v = (px[c] * af + d[c] * ab * (1.0 - af)) / a_out;
                d[c] = cv::saturate_cast<uint8_t>(std::lround(v));
            }
            d[3] = cv::saturate_cast<uint8_t>(std::lround(a_out * 255.0));
        }
    }
}

cv::Mat rgb_view(const cv::Mat& pixels) {
    if (pixels.channels() == 3) {
        return pixels;
    }
    cv::Mat rgb;
    cv::cvtColor(pixels, rgb, cv::COLOR_RGBA2RGB);
    return rgb;
}

} // namespace photo_finish::image
