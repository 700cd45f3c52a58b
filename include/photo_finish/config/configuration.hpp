#pragma once

#include <array>
#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace photo_finish::config {

namespace fs = std::filesystem;

struct CanvasConfig {
    std::array<int, 2> size{1200, 1200}; // width, height
    float margin_fraction = 0.05f;        // per side
    std::array<int, 4> background{255, 255, 255, 0}; // RGBA
    std::string scale_mode = "fit_oversized"; // fit_oversized | fill_margin
};

struct EdgeConfig {
    bool defringe_enabled = true;
    std::array<int, 2> defringe_thresholds{10, 245}; // partial opacity is (low, high)
    int defringe_radius_px = 4;
    int erode_iterations = 0;            // 3x3 min filter passes before defringe
    float feather_radius_px = 1.5f;      // 0 disables feathering
    float feather_max_fraction = 0.01f;  // cap relative to min(width, height)
};

struct SubjectConfig {
    int occupancy_threshold = 0;  // mask > threshold counts as subject
    int min_subject_pixels = 64;
};

struct ToneConfig {
    struct ParamBounds {
        std::array<float, 2> brightness{-50.0f, 50.0f};
        std::array<float, 2> contrast{0.5f, 2.0f};
        std::array<float, 2> gamma{0.5f, 2.5f};
    } param_bounds;

    bool enabled = true;
    std::string model_path;                 // empty = no model, neutral tone
    std::string channel_mode = "per_channel"; // per_channel | luminance
    int timeout_ms = 2000;                  // 0 = wait indefinitely
};

struct ShadowConfig {
    bool enabled = true;
    std::string mode = "silhouette"; // silhouette | ellipse
    float opacity = 0.4f;
    float blur_radius_px = 10.0f;
    int vertical_offset_px = 12;
    // Fractions of the canvas height; override the pixel values when > 0.
    float vertical_offset_ratio = 0.0f;
    float blur_radius_ratio = 0.0f;
    std::array<int, 3> color{0, 0, 0};
    float ellipse_width_ratio = 0.9f;
    float ellipse_height_ratio = 0.08f;
};

struct RuntimeConfig {
    int parallel_workers = 4;
    std::string input_pattern = "*.png;*.jpg;*.jpeg;*.webp;*.tif;*.tiff";
    bool write_reports = true;
};

struct Config {
    CanvasConfig canvas;
    EdgeConfig edge;
    SubjectConfig subject;
    ToneConfig tone;
    ShadowConfig shadow;
    RuntimeConfig runtime;

    static Config load(const fs::path& path);
    static Config from_yaml(const YAML::Node& node);

    void save(const fs::path& path) const;
    YAML::Node to_yaml() const;

    void validate() const;
};

std::string get_schema_json();

} // namespace photo_finish::config
