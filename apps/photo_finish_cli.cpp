#include "photo_finish/config/configuration.hpp"
#include "photo_finish/core/errors.hpp"
#include "photo_finish/core/utils.hpp"
#include "photo_finish/io/image_io.hpp"
#include "photo_finish/image/edge_refine.hpp"
#include "photo_finish/metrics/subject_features.hpp"
#include "photo_finish/pipeline/batch_runner.hpp"
#include "photo_finish/pipeline/finishing_pipeline.hpp"
#include "photo_finish/tone/tone_model.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

using photo_finish::config::Config;
using photo_finish::tone::ToneModel;

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop.store(true);
}

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitDegraded = 2;

void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

int report_error(const std::string& command, const std::exception& e) {
    json err = {{"ok", false}, {"command", command}, {"error", e.what()}};
    if (const auto* pf = dynamic_cast<const photo_finish::PhotoFinishError*>(&e)) {
        if (!pf->stage().empty()) err["stage"] = pf->stage();
        if (!pf->image_id().empty()) err["image_id"] = pf->image_id();
    }
    print_json(err);
    std::cerr << "[ERROR] " << e.what() << std::endl;
    return kExitError;
}

std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

Config load_config_or_default(const std::string& path) {
    Config cfg = path.empty() ? Config() : Config::load(path);
    cfg.validate();
    return cfg;
}

// A missing or broken model is not fatal: the pipeline falls back to neutral
// tone and marks the result degraded.
std::shared_ptr<const ToneModel> load_model_or_null(const Config& cfg, std::string& sha256) {
    if (!cfg.tone.enabled || cfg.tone.model_path.empty()) {
        return nullptr;
    }
    try {
        auto model = photo_finish::tone::load_tone_model(cfg.tone.model_path);
        sha256 = photo_finish::core::sha256_file(cfg.tone.model_path);
        std::cout << "[MODEL] " << model->kind() << " " << model->version() << " ("
                  << sha256.substr(0, 12) << ")" << std::endl;
        return model;
    } catch (const photo_finish::PhotoFinishError& e) {
        std::cerr << "[WARN] " << e.what() << "; tone falls back to neutral" << std::endl;
        return nullptr;
    }
}

std::unique_ptr<std::ofstream> open_event_log(const fs::path& path) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    auto out = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!*out) {
        throw photo_finish::IOError("Cannot open event log: " + path.string());
    }
    return out;
}

void print_usage() {
    std::cout << "Usage: photo_finish_cli <command> [options]\n\n"
              << "Commands:\n"
              << "  finish --image P [--mask M] --out O [--config C] [--model J] [--id ID]\n"
              << "         [--events E] [--no-report] [--strict-exit-codes]\n"
              << "                                  Finish one product photo\n"
              << "  batch --input-dir D [--mask-dir MD] --out-dir OD [--config C] [--model J]\n"
              << "        [--pattern G] [--workers N] [--strict-exit-codes]\n"
              << "                                  Finish every matching image in a directory\n"
              << "  features --image P [--mask M] [--config C]\n"
              << "                                  Print the subject feature vector\n"
              << "  validate-config --path <path> | --yaml <yaml> | --stdin [--strict-exit-codes]\n"
              << "  get-schema                      Print the config JSON schema\n";
}

} // namespace

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << photo_finish::config::get_schema_json() << std::endl;
    return kExitOk;
}

// ============================================================================
// validate-config --path <path> | --yaml <yaml> | --stdin
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        Config cfg;
        if (!path.empty()) {
            cfg = Config::load(path);
        } else {
            const std::string yaml_text = use_stdin ? read_stdin() : yaml_arg;
            cfg = Config::from_yaml(YAML::Load(yaml_text));
        }
        cfg.validate();
        result["valid"] = true;
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("YAML: ") + e.what());
    } catch (const photo_finish::PhotoFinishError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? kExitOk : kExitError;
    }
    return kExitOk;
}

// ============================================================================
// features --image P [--mask M] [--config C]
// ============================================================================
int cmd_features(const std::string& image_path, const std::string& mask_path,
                 const std::string& config_path) {
    try {
        const Config cfg = load_config_or_default(config_path);
        auto req = photo_finish::pipeline::load_finish_request("", image_path, mask_path);
        auto refined = photo_finish::image::refine_edges(req.image, req.mask, cfg.edge,
                                                         cfg.subject.occupancy_threshold);
        auto f = photo_finish::metrics::extract_subject_features(
            refined.image, refined.mask, cfg.subject.occupancy_threshold,
            cfg.subject.min_subject_pixels);

        json values = json::object();
        const auto& names = photo_finish::metrics::feature_names();
        const auto v = f.to_vector();
        for (size_t i = 0; i < names.size(); ++i) {
            values[names[i]] = v[static_cast<Eigen::Index>(i)];
        }
        print_json({{"image_id", req.image_id},
                    {"layout", photo_finish::metrics::kFeatureLayout},
                    {"features", values},
                    {"subject_pixel_count", f.subject_pixel_count},
                    {"subject_fraction", f.subject_fraction}});
        return kExitOk;
    } catch (const std::exception& e) {
        return report_error("features", e);
    }
}

// ============================================================================
// finish --image P [--mask M] --out O ...
// ============================================================================
int cmd_finish(const std::string& image_path, const std::string& mask_path,
               const std::string& out_path, const std::string& config_path,
               const std::string& model_path, const std::string& image_id,
               const std::string& events_path, bool write_report, bool strict_exit) {
    try {
        Config cfg = load_config_or_default(config_path);
        if (!model_path.empty()) cfg.tone.model_path = model_path;

        std::string model_sha;
        auto model = load_model_or_null(cfg, model_sha);
        photo_finish::pipeline::FinishingPipeline pipeline(cfg, model, model_sha);

        const fs::path out(out_path);
        const fs::path events = events_path.empty()
                                    ? out.parent_path() / "events.jsonl"
                                    : fs::path(events_path);
        auto log = open_event_log(events);

        auto req = photo_finish::pipeline::load_finish_request(image_id, image_path, mask_path);
        std::cout << "[FINISH] " << req.image_id << " " << req.image.width() << "x"
                  << req.image.height() << std::endl;

        auto result = pipeline.run(req, *log, &g_stop);
        photo_finish::io::write_png(out, result.image);

        json summary = result.to_json();
        summary["output"] = out.string();
        if (write_report) {
            fs::path report = out;
            report.replace_extension(".finish.json");
            photo_finish::core::write_text(report, summary.dump(2) + "\n");
            summary["report"] = report.string();
        }

        std::cout << "[DONE] " << out.string() << " status=" << result.status << std::endl;
        print_json({{"ok", true},
                    {"image_id", result.image_id},
                    {"status", result.status},
                    {"output", out.string()}});
        if (strict_exit && result.degraded()) {
            return kExitDegraded;
        }
        return kExitOk;
    } catch (const std::exception& e) {
        return report_error("finish", e);
    }
}

// ============================================================================
// batch --input-dir D [--mask-dir MD] --out-dir OD ...
// ============================================================================
int cmd_batch(const std::string& input_dir, const std::string& mask_dir,
              const std::string& out_dir, const std::string& config_path,
              const std::string& model_path, const std::string& pattern, int workers,
              bool strict_exit) {
    try {
        Config cfg = load_config_or_default(config_path);
        if (!model_path.empty()) cfg.tone.model_path = model_path;
        if (!pattern.empty()) cfg.runtime.input_pattern = pattern;
        if (workers > 0) cfg.runtime.parallel_workers = workers;

        std::string model_sha;
        auto model = load_model_or_null(cfg, model_sha);
        photo_finish::pipeline::FinishingPipeline pipeline(cfg, model, model_sha);

        auto items = photo_finish::pipeline::collect_batch_items(input_dir, mask_dir,
                                                                 cfg.runtime.input_pattern);
        std::cout << "[BATCH] " << items.size() << " images, "
                  << cfg.runtime.parallel_workers << " workers" << std::endl;

        fs::create_directories(out_dir);
        auto log = open_event_log(fs::path(out_dir) / "events.jsonl");

        auto summary = photo_finish::pipeline::finish_batch(
            pipeline, items, out_dir, cfg.runtime.parallel_workers, cfg.runtime.write_reports,
            *log, &g_stop);

        json payload = summary.to_json();
        payload["out_dir"] = out_dir;
        photo_finish::core::write_text(fs::path(out_dir) / "batch_summary.json",
                                       payload.dump(2) + "\n");
        print_json(payload);

        if (summary.failed > 0) {
            return kExitError;
        }
        if (strict_exit && summary.degraded > 0) {
            return kExitDegraded;
        }
        return kExitOk;
    } catch (const std::exception& e) {
        return report_error("batch", e);
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return kExitError;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return kExitError;
        }
        return cmd_validate_config(path, yaml, use_stdin, has_flag("--strict-exit-codes"));
    }

    if (command == "features") {
        std::string image = get_arg("--image");
        if (image.empty()) {
            std::cerr << "features requires --image\n";
            return kExitError;
        }
        return cmd_features(image, get_arg("--mask"), get_arg("--config"));
    }

    if (command == "finish") {
        std::string image = get_arg("--image");
        std::string out = get_arg("--out");
        if (image.empty() || out.empty()) {
            std::cerr << "finish requires --image and --out\n";
            return kExitError;
        }
        return cmd_finish(image, get_arg("--mask"), out, get_arg("--config"),
                          get_arg("--model"), get_arg("--id"), get_arg("--events"),
                          !has_flag("--no-report"), has_flag("--strict-exit-codes"));
    }

    if (command == "batch") {
        std::string input_dir = get_arg("--input-dir");
        std::string out_dir = get_arg("--out-dir");
        if (input_dir.empty() || out_dir.empty()) {
            std::cerr << "batch requires --input-dir and --out-dir\n";
            return kExitError;
        }
        std::string workers_str = get_arg("--workers");
        int workers = 0;
        try {
            workers = workers_str.empty() ? 0 : std::stoi(workers_str);
        } catch (const std::exception&) {
            std::cerr << "--workers expects an integer, got '" << workers_str << "'\n";
            return kExitError;
        }
        return cmd_batch(input_dir, get_arg("--mask-dir"), out_dir, get_arg("--config"),
                         get_arg("--model"), get_arg("--pattern"), workers,
                         has_flag("--strict-exit-codes"));
    }

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return kExitOk;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return kExitError;
}
