#include "test_support.hpp"

#include <random>

namespace photo_finish::testing {

RasterImage solid_rgb(int width, int height, int r, int g, int b) {
    cv::Mat m(height, width, CV_8UC3, cv::Scalar(r, g, b));
    return RasterImage(m);
}

AlphaMask rect_mask(int width, int height, const cv::Rect& rect, uint8_t value) {
    cv::Mat m(height, width, CV_8UC1, cv::Scalar(0));
    m(rect).setTo(cv::Scalar(value));
    return AlphaMask(m);
}

config::Config plain_config() {
    config::Config cfg;
    cfg.canvas.size = {200, 200};
    cfg.canvas.margin_fraction = 0.05f;
    cfg.canvas.background = {255, 255, 255, 0};
    cfg.edge.defringe_enabled = false;
    cfg.edge.feather_radius_px = 0.0f;
    cfg.shadow.enabled = false;
    cfg.tone.model_path.clear();
    cfg.tone.timeout_ms = 0;
    return cfg;
}

std::filesystem::path make_temp_dir(const std::string& name) {
    std::random_device rd;
    const auto dir = std::filesystem::temp_directory_path() /
                     ("photo_finish_" + name + "_" + std::to_string(rd()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace photo_finish::testing
