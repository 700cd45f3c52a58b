#include "photo_finish/pipeline/finishing_pipeline.hpp"
#include "photo_finish/core/errors.hpp"
#include "photo_finish/core/events.hpp"
#include "photo_finish/core/utils.hpp"
#include "photo_finish/image/centering.hpp"
#include "photo_finish/image/shadow.hpp"
#include "photo_finish/image/tone_curve.hpp"

#include <chrono>
#include <utility>

namespace photo_finish::pipeline {

using json = nlohmann::json;

namespace {

json tone_params_json(const ToneParameters& p) {
    return {{"brightness", p.brightness}, {"contrast", p.contrast}, {"gamma", p.gamma}};
}

json bbox_json(const BoundingBox& b) {
    return {{"left", b.left}, {"top", b.top}, {"right", b.right}, {"bottom", b.bottom}};
}

json placement_json(const Placement& p) {
    return {
        {"bbox", bbox_json(p.bbox)},
        {"scale", p.scale},
        {"scaled_size", {p.scaled_width, p.scaled_height}},
        {"offset", {p.offset_x, p.offset_y}},
        {"translation", {p.translation_x, p.translation_y}},
    };
}

json features_json(const metrics::SubjectFeatures& f) {
    json values = json::object();
    const auto& names = metrics::feature_names();
    const FeatureVector v = f.to_vector();
    for (size_t i = 0; i < names.size(); ++i) {
        values[names[i]] = v[static_cast<Eigen::Index>(i)];
    }
    return {
        {"layout", metrics::kFeatureLayout},
        {"values", values},
        {"subject_pixel_count", f.subject_pixel_count},
        {"subject_fraction", f.subject_fraction},
    };
}

double elapsed_ms(std::chrono::steady_clock::time_point t0) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0)
        .count();
}

} // namespace

json FinishResult::to_json() const {
    json j;
    j["image_id"] = image_id;
    j["status"] = status;
    j["canvas_size"] = {image.width(), image.height()};
    j["placement"] = placement_json(placement);
    j["features"] = features_json(features);
    j["tone"] = {
        {"params", tone_params_json(tone.params)},
        {"raw", tone_params_json(tone.raw)},
        {"degraded", tone.degraded},
        {"clamped", tone.clamped},
        {"fallback_reason", tone.fallback_reason},
        {"model_version", tone.model_version},
        {"channel_mode", tone_channel_mode_to_string(tone_mode)},
    };
    j["edge"] = {
        {"partial_pixels", edge.partial_pixels},
        {"defringed_pixels", edge.defringed_pixels},
        {"feather_radius_px", edge.feather_radius_px},
        {"feather_capped", edge.feather_capped},
    };
    j["shadow"] = {{"applied", shadow_applied}, {"pixels", shadow_pixels}};
    return j;
}

FinishingPipeline::FinishingPipeline(config::Config cfg,
                                     std::shared_ptr<const tone::ToneModel> model,
                                     std::string model_sha256)
    : cfg_(std::move(cfg)), model_(std::move(model)), model_sha256_(std::move(model_sha256)),
      predictor_(model_, cfg_.tone) {
    cfg_.validate();
    if (!string_to_tone_channel_mode(cfg_.tone.channel_mode, tone_mode_)) {
        throw ConfigError("unknown tone.channel_mode: " + cfg_.tone.channel_mode);
    }
}

FinishResult FinishingPipeline::run(const FinishRequest& request, std::ostream& log,
                                    const std::atomic<bool>* stop) const {
    core::EventEmitter emitter;
    const std::string run_id = request.image_id.empty() ? core::get_run_id() : request.image_id;
    const int occupancy = cfg_.subject.occupancy_threshold;

    json start_extra = {
        {"image_id", request.image_id},
        {"width", request.image.width()},
        {"height", request.image.height()},
        {"tone_model", model_ ? model_->version() : std::string()},
    };
    if (!model_sha256_.empty()) {
        start_extra["tone_model_sha256"] = model_sha256_;
    }
    emitter.run_start(run_id, start_extra, log);

    FinishResult result;
    result.image_id = request.image_id;
    result.tone_mode = tone_mode_;

    Phase phase = Phase::EDGE_REFINE;
    bool phase_open = false;
    auto begin = [&](Phase next) {
        phase = next;
        phase_open = false;
        if (stop && stop->load()) {
            throw StopRequested();
        }
        emitter.phase_start(run_id, phase, log);
        phase_open = true;
        return std::chrono::steady_clock::now();
    };
    auto fail = [&](PhotoFinishError& e) {
        e.set_context(phase_to_string(phase), request.image_id);
        if (phase_open) {
            emitter.phase_end(run_id, phase, "error", {{"error", e.what()}}, log);
        }
        emitter.error(run_id, e.what(), log);
        emitter.run_end(run_id, false, "error", {{"failed_phase", phase_to_string(phase)}}, log);
    };

    try {
        auto t0 = begin(Phase::EDGE_REFINE);
        image::RefinedSubject refined =
            image::refine_edges(request.image, request.mask, cfg_.edge, occupancy);
        result.edge = refined.stats;
        emitter.phase_end(run_id, phase, "ok",
                          {{"partial_pixels", refined.stats.partial_pixels},
                           {"defringed_pixels", refined.stats.defringed_pixels},
                           {"feather_radius_px", refined.stats.feather_radius_px},
                           {"ms", elapsed_ms(t0)}},
                          log);

        t0 = begin(Phase::FEATURES);
        result.features = metrics::extract_subject_features(
            refined.image, refined.mask, occupancy, cfg_.subject.min_subject_pixels);
        emitter.phase_end(run_id, phase, "ok",
                          {{"subject_pixel_count", result.features.subject_pixel_count},
                           {"ms", elapsed_ms(t0)}},
                          log);

        t0 = begin(Phase::TONE_PREDICT);
        if (cfg_.tone.enabled) {
            result.tone = predictor_.predict(result.features.to_vector());
            if (result.tone.degraded) {
                emitter.warning(run_id, "tone_fallback", result.tone.fallback_reason, log);
            }
            emitter.phase_end(run_id, phase, result.tone.degraded ? "degraded" : "ok",
                              {{"params", tone_params_json(result.tone.params)},
                               {"raw", tone_params_json(result.tone.raw)},
                               {"clamped", result.tone.clamped},
                               {"ms", elapsed_ms(t0)}},
                              log);
        } else {
            result.tone.params = ToneParameters::neutral();
            result.tone.raw = ToneParameters::neutral();
            emitter.phase_end(run_id, phase, "skipped", {{"reason", "tone.enabled=false"}}, log);
        }

        t0 = begin(Phase::TONE_APPLY);
        RasterImage toned =
            image::apply_tone(refined.image, refined.mask, result.tone.params, tone_mode_);
        emitter.phase_end(run_id, phase, "ok",
                          {{"channel_mode", tone_channel_mode_to_string(tone_mode_)},
                           {"ms", elapsed_ms(t0)}},
                          log);

        t0 = begin(Phase::CENTER);
        image::CenteredSubject centered =
            image::center_subject(toned, refined.mask, cfg_.canvas, occupancy);
        result.placement = centered.placement;
        result.canvas_mask = centered.canvas_mask;
        emitter.phase_end(run_id, phase, "ok",
                          {{"placement", placement_json(centered.placement)},
                           {"ms", elapsed_ms(t0)}},
                          log);

        t0 = begin(Phase::SHADOW);
        image::ShadowResult shadowed = image::add_shadow(
            centered.canvas, centered.canvas_mask, centered.placement, cfg_.shadow, cfg_.canvas,
            cfg_.subject.min_subject_pixels, occupancy);
        result.image = shadowed.canvas;
        result.shadow_applied = shadowed.applied;
        result.shadow_pixels = shadowed.shadow_pixels;
        emitter.phase_end(run_id, phase, shadowed.applied ? "ok" : "skipped",
                          {{"shadow_pixels", shadowed.shadow_pixels}, {"ms", elapsed_ms(t0)}},
                          log);
    } catch (PhotoFinishError& e) {
        fail(e);
        throw;
    } catch (const cv::Exception& e) {
        PhotoFinishError wrapped(std::string("OpenCV: ") + e.what());
        fail(wrapped);
        throw wrapped;
    }

    result.status = result.tone.degraded ? "degraded" : "ok";
    emitter.run_end(run_id, true, result.status,
                    {{"image_id", request.image_id}, {"degraded", result.degraded()}}, log);
    return result;
}

} // namespace photo_finish::pipeline
