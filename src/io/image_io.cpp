#include "photo_finish/io/image_io.hpp"
#include "photo_finish/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace photo_finish::io {

namespace {

cv::Mat load_raw(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("File not found: " + path.string());
    }
    cv::Mat raw;
    try {
        raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot decode " + path.string() + ": " + e.what());
    }
    if (raw.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }
    return raw;
}

cv::Mat to_8bit(const cv::Mat& src) {
    if (src.depth() == CV_8U) {
        return src;
    }
    cv::Mat out;
    switch (src.depth()) {
        case CV_16U:
            src.convertTo(out, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            src.convertTo(out, CV_8U, 255.0);
            break;
        default:
            src.convertTo(out, CV_8U);
            break;
    }
    return out;
}

} // namespace

RasterImage read_image(const fs::path& path) {
    cv::Mat raw = to_8bit(load_raw(path));

    cv::Mat rgb;
    switch (raw.channels()) {
        case 1:
            cv::cvtColor(raw, rgb, cv::COLOR_GRAY2RGB);
            break;
        case 3:
            cv::cvtColor(raw, rgb, cv::COLOR_BGR2RGB);
            break;
        case 4:
            cv::cvtColor(raw, rgb, cv::COLOR_BGRA2RGBA);
            break;
        default:
            throw IOError("Unsupported channel count " + std::to_string(raw.channels()) +
                          " in " + path.string());
    }
    return RasterImage(rgb);
}

AlphaMask read_mask(const fs::path& path) {
    cv::Mat raw = to_8bit(load_raw(path));

    cv::Mat values;
    switch (raw.channels()) {
        case 1:
            values = raw;
            break;
        case 3:
            cv::cvtColor(raw, values, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::extractChannel(raw, values, 3);
            break;
        default:
            throw IOError("Unsupported mask channel count " + std::to_string(raw.channels()) +
                          " in " + path.string());
    }
    return AlphaMask(values);
}

std::pair<RasterImage, AlphaMask> split_alpha(const RasterImage& rgba) {
    if (!rgba.has_alpha()) {
        throw IOError("split_alpha: image has no alpha channel");
    }
    cv::Mat rgb, alpha;
    cv::cvtColor(rgba.mat(), rgb, cv::COLOR_RGBA2RGB);
    cv::extractChannel(rgba.mat(), alpha, 3);
    return {RasterImage(rgb), AlphaMask(alpha)};
}

void write_png(const fs::path& path, const RasterImage& image) {
    if (image.empty()) {
        throw IOError("Refusing to write empty image: " + path.string());
    }
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw IOError("Cannot create directory " + path.parent_path().string() + ": " +
                          ec.message());
        }
    }

    cv::Mat bgr;
    cv::cvtColor(image.mat(), bgr, image.has_alpha() ? cv::COLOR_RGBA2BGRA : cv::COLOR_RGB2BGR);

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), bgr);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write " + path.string());
    }
}

} // namespace photo_finish::io
