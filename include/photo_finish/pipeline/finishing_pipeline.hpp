#pragma once

#include "photo_finish/config/configuration.hpp"
#include "photo_finish/core/types.hpp"
#include "photo_finish/image/edge_refine.hpp"
#include "photo_finish/metrics/subject_features.hpp"
#include "photo_finish/tone/tone_predictor.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <ostream>
#include <string>

namespace photo_finish::pipeline {

struct FinishRequest {
    std::string image_id;
    RasterImage image;
    AlphaMask mask;
};

struct FinishResult {
    std::string image_id;
    RasterImage image;          // RGBA, canvas size
    AlphaMask canvas_mask;
    Placement placement;
    metrics::SubjectFeatures features;
    tone::TonePrediction tone;
    ToneChannelMode tone_mode = ToneChannelMode::PER_CHANNEL;
    image::EdgeRefineStats edge;
    bool shadow_applied = false;
    int shadow_pixels = 0;
    std::string status = "ok";  // ok | degraded

    bool degraded() const { return status == "degraded"; }

    nlohmann::json to_json() const;
};

// Runs EDGE_REFINE -> FEATURES -> TONE_PREDICT -> TONE_APPLY -> CENTER ->
// SHADOW for one image. Immutable after construction; run() may be called
// from several threads at once.
class FinishingPipeline {
public:
    // Validates the config (ValidationError / ConfigError).
    FinishingPipeline(config::Config cfg, std::shared_ptr<const tone::ToneModel> model,
                      std::string model_sha256 = "");

    // Events go to `log`, one JSON object per line. A fatal error is
    // annotated with the failing stage and the image id, then rethrown.
    // `stop` is polled between stages; when set, StopRequested is thrown.
    FinishResult run(const FinishRequest& request, std::ostream& log,
                     const std::atomic<bool>* stop = nullptr) const;

    const config::Config& config() const { return cfg_; }

private:
    config::Config cfg_;
    std::shared_ptr<const tone::ToneModel> model_;
    std::string model_sha256_;
    tone::ToneParameterPredictor predictor_;
    ToneChannelMode tone_mode_ = ToneChannelMode::PER_CHANNEL;
};

} // namespace photo_finish::pipeline
