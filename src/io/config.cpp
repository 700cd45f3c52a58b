#include "photo_finish/config/configuration.hpp"
#include "photo_finish/core/errors.hpp"
#include "photo_finish/core/types.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace photo_finish::config {

static void read_float_pair(const YAML::Node& n, std::array<float, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<float>();
        out[1] = n[1].as<float>();
    }
}

static void read_int_pair(const YAML::Node& n, std::array<int, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<int>();
        out[1] = n[1].as<int>();
    }
}

template <size_t N>
static void read_int_array(const YAML::Node& n, std::array<int, N>& out) {
    if (n && n.IsSequence() && n.size() == N) {
        for (size_t i = 0; i < N; ++i) {
            out[i] = n[i].as<int>();
        }
    }
}

static bool in_range(float v, float lo, float hi) {
    return std::isfinite(v) && v >= lo && v <= hi;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["canvas"]) {
            auto c = node["canvas"];
            read_int_pair(c["size"], cfg.canvas.size);
            if (c["margin_fraction"]) cfg.canvas.margin_fraction = c["margin_fraction"].as<float>();
            read_int_array(c["background"], cfg.canvas.background);
            if (c["scale_mode"]) cfg.canvas.scale_mode = c["scale_mode"].as<std::string>();
        }

        if (node["edge"]) {
            auto e = node["edge"];
            if (e["defringe_enabled"]) cfg.edge.defringe_enabled = e["defringe_enabled"].as<bool>();
            read_int_pair(e["defringe_thresholds"], cfg.edge.defringe_thresholds);
            if (e["defringe_radius_px"]) cfg.edge.defringe_radius_px = e["defringe_radius_px"].as<int>();
            if (e["erode_iterations"]) cfg.edge.erode_iterations = e["erode_iterations"].as<int>();
            if (e["feather_radius_px"]) cfg.edge.feather_radius_px = e["feather_radius_px"].as<float>();
            if (e["feather_max_fraction"]) cfg.edge.feather_max_fraction = e["feather_max_fraction"].as<float>();
        }

        if (node["subject"]) {
            auto s = node["subject"];
            if (s["occupancy_threshold"]) cfg.subject.occupancy_threshold = s["occupancy_threshold"].as<int>();
            if (s["min_subject_pixels"]) cfg.subject.min_subject_pixels = s["min_subject_pixels"].as<int>();
        }

        if (node["tone"]) {
            auto t = node["tone"];
            if (t["enabled"]) cfg.tone.enabled = t["enabled"].as<bool>();
            if (t["model_path"]) cfg.tone.model_path = t["model_path"].as<std::string>();
            if (t["channel_mode"]) cfg.tone.channel_mode = t["channel_mode"].as<std::string>();
            if (t["timeout_ms"]) cfg.tone.timeout_ms = t["timeout_ms"].as<int>();
            if (t["param_bounds"]) {
                auto b = t["param_bounds"];
                read_float_pair(b["brightness"], cfg.tone.param_bounds.brightness);
                read_float_pair(b["contrast"], cfg.tone.param_bounds.contrast);
                read_float_pair(b["gamma"], cfg.tone.param_bounds.gamma);
            }
        }

        if (node["shadow"]) {
            auto s = node["shadow"];
            if (s["enabled"]) cfg.shadow.enabled = s["enabled"].as<bool>();
            if (s["mode"]) cfg.shadow.mode = s["mode"].as<std::string>();
            if (s["opacity"]) cfg.shadow.opacity = s["opacity"].as<float>();
            if (s["blur_radius_px"]) cfg.shadow.blur_radius_px = s["blur_radius_px"].as<float>();
            if (s["vertical_offset_px"]) cfg.shadow.vertical_offset_px = s["vertical_offset_px"].as<int>();
            if (s["vertical_offset_ratio"]) cfg.shadow.vertical_offset_ratio = s["vertical_offset_ratio"].as<float>();
            if (s["blur_radius_ratio"]) cfg.shadow.blur_radius_ratio = s["blur_radius_ratio"].as<float>();
            read_int_array(s["color"], cfg.shadow.color);
            if (s["ellipse_width_ratio"]) cfg.shadow.ellipse_width_ratio = s["ellipse_width_ratio"].as<float>();
            if (s["ellipse_height_ratio"]) cfg.shadow.ellipse_height_ratio = s["ellipse_height_ratio"].as<float>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
            if (r["input_pattern"]) cfg.runtime.input_pattern = r["input_pattern"].as<std::string>();
            if (r["write_reports"]) cfg.runtime.write_reports = r["write_reports"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["canvas"]["size"].push_back(canvas.size[0]);
    node["canvas"]["size"].push_back(canvas.size[1]);
    node["canvas"]["margin_fraction"] = canvas.margin_fraction;
    for (int v : canvas.background) {
        node["canvas"]["background"].push_back(v);
    }
    node["canvas"]["scale_mode"] = canvas.scale_mode;

    node["edge"]["defringe_enabled"] = edge.defringe_enabled;
    node["edge"]["defringe_thresholds"].push_back(edge.defringe_thresholds[0]);
    node["edge"]["defringe_thresholds"].push_back(edge.defringe_thresholds[1]);
    node["edge"]["defringe_radius_px"] = edge.defringe_radius_px;
    node["edge"]["erode_iterations"] = edge.erode_iterations;
    node["edge"]["feather_radius_px"] = edge.feather_radius_px;
    node["edge"]["feather_max_fraction"] = edge.feather_max_fraction;

    node["subject"]["occupancy_threshold"] = subject.occupancy_threshold;
    node["subject"]["min_subject_pixels"] = subject.min_subject_pixels;

    node["tone"]["enabled"] = tone.enabled;
    node["tone"]["model_path"] = tone.model_path;
    node["tone"]["channel_mode"] = tone.channel_mode;
    node["tone"]["timeout_ms"] = tone.timeout_ms;
    node["tone"]["param_bounds"]["brightness"].push_back(tone.param_bounds.brightness[0]);
    node["tone"]["param_bounds"]["brightness"].push_back(tone.param_bounds.brightness[1]);
    node["tone"]["param_bounds"]["contrast"].push_back(tone.param_bounds.contrast[0]);
    node["tone"]["param_bounds"]["contrast"].push_back(tone.param_bounds.contrast[1]);
    node["tone"]["param_bounds"]["gamma"].push_back(tone.param_bounds.gamma[0]);
    node["tone"]["param_bounds"]["gamma"].push_back(tone.param_bounds.gamma[1]);

    node["shadow"]["enabled"] = shadow.enabled;
    node["shadow"]["mode"] = shadow.mode;
    node["shadow"]["opacity"] = shadow.opacity;
    node["shadow"]["blur_radius_px"] = shadow.blur_radius_px;
    node["shadow"]["vertical_offset_px"] = shadow.vertical_offset_px;
    node["shadow"]["vertical_offset_ratio"] = shadow.vertical_offset_ratio;
    node["shadow"]["blur_radius_ratio"] = shadow.blur_radius_ratio;
    for (int v : shadow.color) {
        node["shadow"]["color"].push_back(v);
    }
    node["shadow"]["ellipse_width_ratio"] = shadow.ellipse_width_ratio;
    node["shadow"]["ellipse_height_ratio"] = shadow.ellipse_height_ratio;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;
    node["runtime"]["input_pattern"] = runtime.input_pattern;
    node["runtime"]["write_reports"] = runtime.write_reports;

    return node;
}

void Config::validate() const {
    if (canvas.size[0] < 1 || canvas.size[1] < 1) {
        throw ValidationError("canvas.size must be [width,height] with both >= 1");
    }
    if (!in_range(canvas.margin_fraction, 0.0f, 0.49f)) {
        throw ValidationError("canvas.margin_fraction must be in [0,0.49]");
    }
    for (int v : canvas.background) {
        if (v < 0 || v > 255) {
            throw ValidationError("canvas.background must be RGBA values in [0,255]");
        }
    }
    ScaleMode scale_mode;
    if (!string_to_scale_mode(canvas.scale_mode, scale_mode)) {
        throw ValidationError("canvas.scale_mode must be 'fit_oversized' or 'fill_margin'");
    }

    const int lo = edge.defringe_thresholds[0];
    const int hi = edge.defringe_thresholds[1];
    if (lo < 0 || hi > 255 || lo >= hi) {
        throw ValidationError("edge.defringe_thresholds must be [low,high] with 0 <= low < high <= 255");
    }
    if (edge.defringe_radius_px < 1 || edge.defringe_radius_px > 32) {
        throw ValidationError("edge.defringe_radius_px must be in [1,32]");
    }
    if (edge.erode_iterations < 0 || edge.erode_iterations > 10) {
        throw ValidationError("edge.erode_iterations must be in [0,10]");
    }
    if (!in_range(edge.feather_radius_px, 0.0f, 16.0f)) {
        throw ValidationError("edge.feather_radius_px must be in [0,16]");
    }
    if (!in_range(edge.feather_max_fraction, 0.0f, 0.1f)) {
        throw ValidationError("edge.feather_max_fraction must be in [0,0.1]");
    }

    if (subject.occupancy_threshold < 0 || subject.occupancy_threshold > 254) {
        throw ValidationError("subject.occupancy_threshold must be in [0,254]");
    }
    if (subject.min_subject_pixels < 1) {
        throw ValidationError("subject.min_subject_pixels must be >= 1");
    }

    ToneChannelMode channel_mode;
    if (!string_to_tone_channel_mode(tone.channel_mode, channel_mode)) {
        throw ValidationError("tone.channel_mode must be 'per_channel' or 'luminance'");
    }
    if (tone.timeout_ms < 0) {
        throw ValidationError("tone.timeout_ms must be >= 0");
    }
    const auto& b = tone.param_bounds;
    if (!std::isfinite(b.brightness[0]) || !std::isfinite(b.brightness[1]) ||
        b.brightness[0] > b.brightness[1]) {
        throw ValidationError("tone.param_bounds.brightness must be [min,max] with min <= max");
    }
    if (!(b.contrast[0] > 0.0f) || !std::isfinite(b.contrast[1]) || b.contrast[0] > b.contrast[1]) {
        throw ValidationError("tone.param_bounds.contrast must be [min,max] with 0 < min <= max");
    }
    if (!(b.gamma[0] > 0.0f) || !std::isfinite(b.gamma[1]) || b.gamma[0] > b.gamma[1]) {
        throw ValidationError("tone.param_bounds.gamma must be [min,max] with 0 < min <= max");
    }
    // Degraded runs must stay representable after clamping.
    if (b.brightness[0] > 0.0f || b.brightness[1] < 0.0f ||
        b.contrast[0] > 1.0f || b.contrast[1] < 1.0f ||
        b.gamma[0] > 1.0f || b.gamma[1] < 1.0f) {
        throw ValidationError("tone.param_bounds must contain the neutral parameters (0,1,1)");
    }

    ShadowMode shadow_mode;
    if (!string_to_shadow_mode(shadow.mode, shadow_mode)) {
        throw ValidationError("shadow.mode must be 'silhouette' or 'ellipse'");
    }
    if (!in_range(shadow.opacity, 0.0f, 1.0f)) {
        throw ValidationError("shadow.opacity must be in [0,1]");
    }
    if (!in_range(shadow.blur_radius_px, 0.0f, 200.0f)) {
        throw ValidationError("shadow.blur_radius_px must be in [0,200]");
    }
    if (shadow.vertical_offset_px < -1000 || shadow.vertical_offset_px > 1000) {
        throw ValidationError("shadow.vertical_offset_px must be in [-1000,1000]");
    }
    if (!in_range(shadow.vertical_offset_ratio, 0.0f, 0.5f) ||
        !in_range(shadow.blur_radius_ratio, 0.0f, 0.5f)) {
        throw ValidationError("shadow.vertical_offset_ratio/blur_radius_ratio must be in [0,0.5]");
    }
    for (int v : shadow.color) {
        if (v < 0 || v > 255) {
            throw ValidationError("shadow.color must be RGB values in [0,255]");
        }
    }
    if (!in_range(shadow.ellipse_width_ratio, 0.0f, 4.0f) ||
        !in_range(shadow.ellipse_height_ratio, 0.0f, 1.0f)) {
        throw ValidationError("shadow.ellipse_width_ratio must be in [0,4] and ellipse_height_ratio in [0,1]");
    }

    if (runtime.parallel_workers < 1 || runtime.parallel_workers > 64) {
        throw ValidationError("runtime.parallel_workers must be in [1,64]");
    }
    if (runtime.input_pattern.empty()) {
        throw ValidationError("runtime.input_pattern must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "canvas": {
      "type": "object",
      "properties": {
        "size": {"type": "array", "items": {"type": "integer", "minimum": 1}, "minItems": 2, "maxItems": 2},
        "margin_fraction": {"type": "number", "minimum": 0, "maximum": 0.49},
        "background": {"type": "array", "items": {"type": "integer", "minimum": 0, "maximum": 255}, "minItems": 4, "maxItems": 4},
        "scale_mode": {"type": "string", "enum": ["fit_oversized", "fill_margin"]}
      }
    },
    "edge": {
      "type": "object",
      "properties": {
        "defringe_enabled": {"type": "boolean"},
        "defringe_thresholds": {"type": "array", "items": {"type": "integer", "minimum": 0, "maximum": 255}, "minItems": 2, "maxItems": 2},
        "defringe_radius_px": {"type": "integer", "minimum": 1, "maximum": 32},
        "erode_iterations": {"type": "integer", "minimum": 0, "maximum": 10},
        "feather_radius_px": {"type": "number", "minimum": 0, "maximum": 16},
        "feather_max_fraction": {"type": "number", "minimum": 0, "maximum": 0.1}
      }
    },
    "subject": {
      "type": "object",
      "properties": {
        "occupancy_threshold": {"type": "integer", "minimum": 0, "maximum": 254},
        "min_subject_pixels": {"type": "integer", "minimum": 1}
      }
    },
    "tone": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "model_path": {"type": "string"},
        "channel_mode": {"type": "string", "enum": ["per_channel", "luminance"]},
        "timeout_ms": {"type": "integer", "minimum": 0},
        "param_bounds": {
          "type": "object",
          "properties": {
            "brightness": {"type": "array", "items": {"type": "number"}, "minItems": 2, "maxItems": 2},
            "contrast": {"type": "array", "items": {"type": "number", "exclusiveMinimum": 0}, "minItems": 2, "maxItems": 2},
            "gamma": {"type": "array", "items": {"type": "number", "exclusiveMinimum": 0}, "minItems": 2, "maxItems": 2}
          }
        }
      }
    },
    "shadow": {
      "type": "object",
      "properties": {
        "enabled": {"type": "boolean"},
        "mode": {"type": "string", "enum": ["silhouette", "ellipse"]},
        "opacity": {"type": "number", "minimum": 0, "maximum": 1},
        "blur_radius_px": {"type": "number", "minimum": 0, "maximum": 200},
        "vertical_offset_px": {"type": "integer", "minimum": -1000, "maximum": 1000},
        "vertical_offset_ratio": {"type": "number", "minimum": 0, "maximum": 0.5},
        "blur_radius_ratio": {"type": "number", "minimum": 0, "maximum": 0.5},
        "color": {"type": "array", "items": {"type": "integer", "minimum": 0, "maximum": 255}, "minItems": 3, "maxItems": 3},
        "ellipse_width_ratio": {"type": "number", "minimum": 0, "maximum": 4},
        "ellipse_height_ratio": {"type": "number", "minimum": 0, "maximum": 1}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1, "maximum": 64},
        "input_pattern": {"type": "string"},
        "write_reports": {"type": "boolean"}
      }
    }
  }
})";
}

} // namespace photo_finish::config
