#include "photo_finish/image/shadow.hpp"
#include "photo_finish/image/compositing.hpp"
#include "photo_finish/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace photo_finish::image {

namespace {

cv::Mat silhouette_shape(const cv::Mat& mask, int offset_px) {
    cv::Mat shape(mask.size(), CV_8UC1, cv::Scalar(0));
    if (offset_px >= mask.rows) return shape;
    if (offset_px >= 0) {
        mask(cv::Rect(0, 0, mask.cols, mask.rows - offset_px))
            .copyTo(shape(cv::Rect(0, offset_px, mask.cols, mask.rows - offset_px)));
    } else {
        const int up = std::min(-offset_px, mask.rows);
        mask(cv::Rect(0, up, mask.cols, mask.rows - up))
            .copyTo(shape(cv::Rect(0, 0, mask.cols, mask.rows - up)));
    }
    return shape;
}

cv::Mat ellipse_shape(const cv::Size& size, const Placement& placement,
                      const config::ShadowConfig& cfg, int offset_px) {
    cv::Mat shape(size, CV_8UC1, cv::Scalar(0));
    const double rx = 0.5 * cfg.ellipse_width_ratio * placement.scaled_width;
    const double ry = 0.5 * cfg.ellipse_height_ratio * placement.scaled_height;
    const int half_w = std::max(1, static_cast<int>(std::lround(rx)));
    const int half_h = std::max(1, static_cast<int>(std::lround(ry)));
    const cv::Point center(placement.offset_x + placement.scaled_width / 2,
                           placement.offset_y + placement.scaled_height + offset_px - half_h);
    cv::ellipse(shape, center, cv::Size(half_w, half_h), 0.0, 0.0, 360.0, cv::Scalar(255),
                cv::FILLED, cv::LINE_AA);
    return shape;
}

} // namespace

cv::Mat build_shadow_plane(const AlphaMask& canvas_mask, const Placement& placement,
                           const config::ShadowConfig& cfg, int canvas_height) {
    ShadowMode mode = ShadowMode::SILHOUETTE;
    if (!string_to_shadow_mode(cfg.mode, mode)) {
        throw ConfigError("unknown shadow.mode: " + cfg.mode);
    }

    const int offset_px = cfg.vertical_offset_ratio > 0.0f
                              ? static_cast<int>(std::lround(cfg.vertical_offset_ratio * canvas_height))
                              : cfg.vertical_offset_px;
    const double blur_px = cfg.blur_radius_ratio > 0.0f
                               ? static_cast<double>(cfg.blur_radius_ratio) * canvas_height
                               : static_cast<double>(cfg.blur_radius_px);

    cv::Mat shape = mode == ShadowMode::ELLIPSE
                        ? ellipse_shape(canvas_mask.mat().size(), placement, cfg, offset_px)
                        : silhouette_shape(canvas_mask.mat(), offset_px);

    cv::Mat plane;
    shape.convertTo(plane, CV_32F, static_cast<double>(cfg.opacity) / 255.0);
    return gaussian_blur_plane(plane, blur_px, cv::BORDER_CONSTANT);
}

ShadowResult add_shadow(const RasterImage& canvas, const AlphaMask& canvas_mask,
                        const Placement& placement, const config::ShadowConfig& cfg,
                        const config::CanvasConfig& canvas_cfg, int min_subject_pixels,
                        int occupancy_threshold) {
    require_same_size(canvas, canvas_mask, "add_shadow");
    if (canvas.channels() != 4) {
        throw PhotoFinishError("add_shadow requires an RGBA canvas");
    }

    ShadowResult result;
    result.canvas = canvas;
    if (!cfg.enabled || cfg.opacity <= 0.0f ||
        canvas_mask.count_above(occupancy_threshold) < min_subject_pixels) {
        return result;
    }

    const cv::Mat s_plane = build_shadow_plane(canvas_mask, placement, cfg, canvas.height());

    // Premultiplied shadow color K (opaque) and canvas background B.
    const double k[3] = {cfg.color[0] / 255.0, cfg.color[1] / 255.0, cfg.color[2] / 255.0};
    const auto& bg = canvas_cfg.background;
    const double b_alpha = bg[3] / 255.0;
    const double b[3] = {bg[0] / 255.0 * b_alpha, bg[1] / 255.0 * b_alpha,
                         bg[2] / 255.0 * b_alpha};

    cv::Mat out = canvas.mat().clone();
    const cv::Mat& m = canvas_mask.mat();
    int changed = 0;

    for (int y = 0; y < out.rows; ++y) {
        cv::Vec4b* row = out.ptr<cv::Vec4b>(y);
        const uint8_t* mrow = m.ptr<uint8_t>(y);
        const float* srow = s_plane.ptr<float>(y);
        for (int x = 0; x < out.cols; ++x) {
            const uint8_t a8 = mrow[x];
            const double s = srow[x];
            if (a8 == 255 || s <= 0.0) continue;

            cv::Vec4b& px = row[x];
            const double a = a8 / 255.0;
            const double w = (1.0 - a) * s;
            const double p_alpha = px[3] / 255.0;
            const double out_alpha = p_alpha + w * (1.0 - b_alpha);

            cv::Vec4b next = px;
            if (out_alpha > 0.0) {
                for (int c = 0; c < 3; ++c) {
                    const double p = px[c] / 255.0 * p_alpha;
                    const double v = (p + w * (k[c] - b[c])) / out_alpha;
                    next[c] = cv::saturate_cast<uint8_t>(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
                }
            }
            next[3] = cv::saturate_cast<uint8_t>(std::lround(std::clamp(out_alpha, 0.0, 1.0) * 255.0));
            if (next != px) {
                px = next;
                ++changed;
            }
        }
    }

    result.canvas = RasterImage(out);
    result.applied = true;
    result.shadow_pixels = changed;
    return result;
}

} // namespace photo_finish::image
