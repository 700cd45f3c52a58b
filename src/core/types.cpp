#include "photo_finish/core/types.hpp"
#include "photo_finish/core/errors.hpp"

#include <sstream>

namespace photo_finish {

RasterImage::RasterImage(const cv::Mat& pixels) {
    if (pixels.empty()) {
        throw PhotoFinishError("RasterImage requires non-empty pixels");
    }
    if (pixels.type() != CV_8UC3 && pixels.type() != CV_8UC4) {
        throw PhotoFinishError("RasterImage requires 8-bit RGB or RGBA pixels");
    }
    pixels_ = pixels.clone();
}

RasterImage RasterImage::filled(int width, int height, const cv::Scalar& rgba) {
    cv::Mat m(height, width, CV_8UC4, rgba);
    return RasterImage(m);
}

AlphaMask::AlphaMask(const cv::Mat& values) {
    if (values.empty()) {
        throw PhotoFinishError("AlphaMask requires non-empty values");
    }
    if (values.type() != CV_8UC1) {
        throw PhotoFinishError("AlphaMask requires a single 8-bit channel");
    }
    values_ = values.clone();
}

AlphaMask AlphaMask::filled(int width, int height, uint8_t value) {
    cv::Mat m(height, width, CV_8UC1, cv::Scalar(value));
    return AlphaMask(m);
}

int AlphaMask::count_above(int threshold) const {
    if (values_.empty()) return 0;
    cv::Mat above = values_ > threshold;
    return cv::countNonZero(above);
}

void require_same_size(const RasterImage& image, const AlphaMask& mask,
                       const std::string& what) {
    if (image.empty() || mask.empty() ||
        image.width() != mask.width() || image.height() != mask.height()) {
        std::ostringstream oss;
        oss << what << ": image " << image.width() << "x" << image.height()
            << " vs mask " << mask.width() << "x" << mask.height();
        throw DimensionMismatchError(oss.str());
    }
}

} // namespace photo_finish
