#include "photo_finish/image/centering.hpp"
#include "photo_finish/image/compositing.hpp"
#include "photo_finish/core/errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace photo_finish::image {

std::optional<BoundingBox> compute_bounding_box(const AlphaMask& mask,
                                                int occupancy_threshold) {
    if (mask.empty()) return std::nullopt;

    cv::Mat occupied = mask.mat() > occupancy_threshold;
    std::vector<cv::Point> points;
    cv::findNonZero(occupied, points);
    if (points.empty()) return std::nullopt;

    const cv::Rect r = cv::boundingRect(points);
    BoundingBox bbox;
    bbox.left = r.x;
    bbox.top = r.y;
    bbox.right = r.x + r.width;
    bbox.bottom = r.y + r.height;
    return bbox;
}

double compute_fit_scale(int bbox_width, int bbox_height,
                         const config::CanvasConfig& cfg) {
    ScaleMode mode = ScaleMode::FIT_OVERSIZED;
    if (!string_to_scale_mode(cfg.scale_mode, mode)) {
        throw ConfigError("unknown canvas.scale_mode: " + cfg.scale_mode);
    }

    const int canvas_w = cfg.size[0];
    const int canvas_h = cfg.size[1];
    const bool oversized = bbox_width > canvas_w || bbox_height > canvas_h;
    if (mode == ScaleMode::FIT_OVERSIZED && !oversized) return 1.0;

    const double keep = 1.0 - 2.0 * static_cast<double>(cfg.margin_fraction);
    const int avail_w = std::max(1, static_cast<int>(canvas_w * keep));
    const int avail_h = std::max(1, static_cast<int>(canvas_h * keep));
    return std::min(static_cast<double>(avail_w) / bbox_width,
                    static_cast<double>(avail_h) / bbox_height);
}

CenteredSubject center_subject(const RasterImage& image, const AlphaMask& mask,
                               const config::CanvasConfig& cfg,
                               int occupancy_threshold) {
    require_same_size(image, mask, "center_subject");

    const auto bbox = compute_bounding_box(mask, occupancy_threshold);
    if (!bbox) {
        throw EmptySubjectError("no pixel above occupancy threshold " +
                                std::to_string(occupancy_threshold) + " to center");
    }

    const cv::Rect roi(bbox->left, bbox->top, bbox->width(), bbox->height());
    cv::Mat content = image.mat()(roi);
    cv::Mat content_alpha = mask.mat()(roi);

    Placement placement;
    placement.bbox = *bbox;
    placement.scale = compute_fit_scale(bbox->width(), bbox->height(), cfg);
    placement.scaled_width = bbox->width();
    placement.scaled_height = bbox->height();

    if (placement.scale != 1.0) {
        placement.scaled_width =
            std::max(1, static_cast<int>(std::lround(bbox->width() * placement.scale)));
        placement.scaled_height =
            std::max(1, static_cast<int>(std::lround(bbox->height() * placement.scale)));
        const int interp = placement.scale < 1.0 ? cv::INTER_AREA : cv::INTER_LANCZOS4;
        const cv::Size target(placement.scaled_width, placement.scaled_height);
        cv::Mat scaled, scaled_alpha;
        cv::resize(content, scaled, target, 0.0, 0.0, interp);
        cv::resize(content_alpha, scaled_alpha, target, 0.0, 0.0, interp);
        content = scaled;
        content_alpha = scaled_alpha;
    }

    const int canvas_w = cfg.size[0];
    const int canvas_h = cfg.size[1];
    placement.offset_x = (canvas_w - placement.scaled_width) / 2;
    placement.offset_y = (canvas_h - placement.scaled_height) / 2;
    placement.translation_x = placement.offset_x - bbox->left;
    placement.translation_y = placement.offset_y - bbox->top;

    const auto& bg = cfg.background;
    cv::Mat canvas(canvas_h, canvas_w, CV_8UC4, cv::Scalar(bg[0], bg[1], bg[2], bg[3]));
    // An RGBA layer carries its own coverage; a finished canvas is opaque there
    // and is copied through unchanged on a second pass.
    cv::Mat layer_alpha;
    if (content.channels() == 4) {
        cv::extractChannel(content, layer_alpha, 3);
    } else {
        layer_alpha = content_alpha;
    }
    composite_over(canvas, content, layer_alpha, placement.offset_x, placement.offset_y);

    cv::Mat canvas_alpha(canvas_h, canvas_w, CV_8UC1, cv::Scalar(0));
    content_alpha.copyTo(canvas_alpha(cv::Rect(placement.offset_x, placement.offset_y,
                                               placement.scaled_width,
                                               placement.scaled_height)));

    CenteredSubject out;
    out.canvas = RasterImage(canvas);
    out.canvas_mask = AlphaMask(canvas_alpha);
    out.placement = placement;
    return out;
}

} // namespace photo_finish::image
