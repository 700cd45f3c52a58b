#include "photo_finish/pipeline/finishing_pipeline.hpp"
#include "photo_finish/core/errors.hpp"
#include "photo_finish/metrics/subject_features.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>
#include <opencv2/imgproc.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace photo_finish;
using photo_finish::testing::plain_config;
using photo_finish::testing::rect_mask;
using photo_finish::testing::solid_rgb;
using json = nlohmann::json;

namespace {

std::vector<json> parse_events(const std::string& log) {
    std::vector<json> events;
    std::istringstream iss(log);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty()) events.push_back(json::parse(line));
    }
    return events;
}

std::vector<std::string> phases_of_type(const std::vector<json>& events, const std::string& type) {
    std::vector<std::string> out;
    for (const auto& e : events) {
        if (e["type"] == type) out.push_back(e["phase_name"].get<std::string>());
    }
    return out;
}

pipeline::FinishRequest gray_request(const std::string& id = "sku-1") {
    pipeline::FinishRequest req;
    req.image_id = id;
    req.image = solid_rgb(100, 100, 100, 100, 100);
    req.mask = AlphaMask::filled(100, 100, 255);
    return req;
}

std::shared_ptr<const tone::ToneModel> neutral_model() {
    return std::make_shared<tone::FixedToneModel>(ToneParameters::neutral());
}

class ThrowingModel : public tone::ToneModel {
public:
    ToneParameters predict(const FeatureVector&) const override {
        throw std::runtime_error("model exploded");
    }
    std::string version() const override { return "throwing"; }
    std::string kind() const override { return "test"; }
    const std::vector<std::string>& feature_names() const override {
        return metrics::feature_names();
    }
};

// Raises the stop flag while the pipeline is inside TONE_PREDICT.
class StoppingModel : public tone::ToneModel {
public:
    explicit StoppingModel(std::atomic<bool>* flag) : flag_(flag) {}
    ToneParameters predict(const FeatureVector&) const override {
        flag_->store(true);
        return ToneParameters::neutral();
    }
    std::string version() const override { return "stopping"; }
    std::string kind() const override { return "test"; }
    const std::vector<std::string>& feature_names() const override {
        return metrics::feature_names();
    }

private:
    std::atomic<bool>* flag_;
};

} // namespace

TEST_CASE("pipeline_runs_stages_in_fixed_order") {
    pipeline::FinishingPipeline p(plain_config(), neutral_model());
    std::ostringstream log;
    auto result = p.run(gray_request(), log);

    REQUIRE(result.status == "ok");
    REQUIRE(result.image.width() == 200);
    REQUIRE(result.image.height() == 200);
    REQUIRE(result.placement.offset_x == 50);
    REQUIRE(result.placement.offset_y == 50);
    REQUIRE(result.image.mat().at<cv::Vec4b>(100, 100) == cv::Vec4b(100, 100, 100, 255));
    REQUIRE(result.image.mat().at<cv::Vec4b>(10, 10) == cv::Vec4b(255, 255, 255, 0));

    auto events = parse_events(log.str());
    REQUIRE(events.front()["type"] == "run_start");
    REQUIRE(events.back()["type"] == "run_end");
    REQUIRE(events.back()["success"] == true);
    REQUIRE(events.back()["status"] == "ok");

    const std::vector<std::string> expected = {"EDGE_REFINE", "FEATURES",   "TONE_PREDICT",
                                               "TONE_APPLY",  "CENTER",     "SHADOW"};
    REQUIRE(phases_of_type(events, "phase_start") == expected);
    REQUIRE(phases_of_type(events, "phase_end") == expected);
    for (const auto& e : events) {
        REQUIRE(e["run_id"] == "sku-1");
    }
}

TEST_CASE("concurrent_runs_match_sequential_run") {
    auto cfg = plain_config();
    cfg.canvas.background = {250, 250, 250, 255};
    cfg.edge.defringe_enabled = true;
    cfg.edge.feather_radius_px = 1.5f;
    cfg.shadow.enabled = true;
    cfg.tone.timeout_ms = 5000;
    auto model = std::make_shared<tone::FixedToneModel>(ToneParameters{12.0, 1.2, 0.9});
    pipeline::FinishingPipeline p(cfg, model);

    std::vector<pipeline::FinishRequest> requests;
    for (int i = 0; i < 6; ++i) {
        cv::Mat px(90 + 10 * i, 120, CV_8UC3);
        cv::randu(px, cv::Scalar::all(0), cv::Scalar::all(256));
        cv::Mat alpha(px.rows, px.cols, CV_8UC1, cv::Scalar(0));
        cv::ellipse(alpha, cv::Point(60, px.rows / 2), cv::Size(40, 30 + i), 0.0, 0.0, 360.0,
                    cv::Scalar(255), cv::FILLED, cv::LINE_AA);
        pipeline::FinishRequest req;
        req.image_id = "item-" + std::to_string(i);
        req.image = RasterImage(px);
        req.mask = AlphaMask(alpha);
        requests.push_back(req);
    }

    std::vector<cv::Mat> sequential;
    for (const auto& req : requests) {
        std::ostringstream log;
        sequential.push_back(p.run(req, log).image.mat());
    }

    std::vector<cv::Mat> concurrent(requests.size());
    std::vector<std::thread> threads;
    for (size_t i = 0; i < requests.size(); ++i) {
        threads.emplace_back([&, i]() {
            std::ostringstream log;
            concurrent[i] = p.run(requests[i], log).image.mat();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (size_t i = 0; i < requests.size(); ++i) {
        REQUIRE(concurrent[i].size() == sequential[i].size());
        REQUIRE(concurrent[i].type() == sequential[i].type());
        cv::Mat diff;
        cv::absdiff(concurrent[i], sequential[i], diff);
        REQUIRE(cv::countNonZero(diff.reshape(1)) == 0);
    }
}

TEST_CASE("pipeline_applies_predicted_tone") {
    auto model = std::make_shared<tone::FixedToneModel>(ToneParameters{20.0, 1.0, 1.0});
    pipeline::FinishingPipeline p(plain_config(), model);
    std::ostringstream log;
    auto result = p.run(gray_request(), log);

    REQUIRE(result.status == "ok");
    REQUIRE(result.tone.params.brightness == 20.0);
    REQUIRE(result.image.mat().at<cv::Vec4b>(100, 100) == cv::Vec4b(120, 120, 120, 255));
}

TEST_CASE("throwing_model_yields_neutral_degraded_result") {
    pipeline::FinishingPipeline p(plain_config(), std::make_shared<ThrowingModel>());
    std::ostringstream log;
    auto result = p.run(gray_request(), log);

    REQUIRE(result.degraded());
    REQUIRE(result.tone.degraded);
    REQUIRE(result.tone.params == ToneParameters::neutral());
    REQUIRE(result.image.mat().at<cv::Vec4b>(100, 100) == cv::Vec4b(100, 100, 100, 255));

    auto events = parse_events(log.str());
    bool saw_fallback = false;
    for (const auto& e : events) {
        if (e["type"] == "warning" && e["code"] == "tone_fallback") saw_fallback = true;
    }
    REQUIRE(saw_fallback);
    REQUIRE(events.back()["status"] == "degraded");
    REQUIRE(events.back()["success"] == true);
}

TEST_CASE("missing_model_marks_result_degraded") {
    pipeline::FinishingPipeline p(plain_config(), nullptr);
    std::ostringstream log;
    auto result = p.run(gray_request(), log);
    REQUIRE(result.status == "degraded");
    REQUIRE(result.tone.fallback_reason == "model_unavailable");
}

TEST_CASE("disabled_tone_skips_prediction_without_degrading") {
    auto cfg = plain_config();
    cfg.tone.enabled = false;
    pipeline::FinishingPipeline p(cfg, nullptr);
    std::ostringstream log;
    auto result = p.run(gray_request(), log);
    REQUIRE(result.status == "ok");
    REQUIRE(result.tone.params == ToneParameters::neutral());
}

TEST_CASE("pipeline_errors_carry_stage_and_image_id") {
    pipeline::FinishingPipeline p(plain_config(), neutral_model());
    auto req = gray_request("sku-empty");
    req.mask = AlphaMask::filled(100, 100, 0);
    std::ostringstream log;

    try {
        p.run(req, log);
        FAIL("expected EmptySubjectError");
    } catch (const EmptySubjectError& e) {
        REQUIRE(e.stage() == "EDGE_REFINE");
        REQUIRE(e.image_id() == "sku-empty");
        REQUIRE(std::string(e.what()).find("[EDGE_REFINE] sku-empty") == 0);
    }

    auto events = parse_events(log.str());
    REQUIRE(events.back()["type"] == "run_end");
    REQUIRE(events.back()["success"] == false);
    REQUIRE(events.back()["failed_phase"] == "EDGE_REFINE");
}

TEST_CASE("insufficient_subject_fails_in_features_stage") {
    pipeline::FinishingPipeline p(plain_config(), neutral_model());
    auto req = gray_request("sku-small");
    req.mask = rect_mask(100, 100, cv::Rect(0, 0, 3, 3));
    std::ostringstream log;

    try {
        p.run(req, log);
        FAIL("expected InsufficientSubjectError");
    } catch (const InsufficientSubjectError& e) {
        REQUIRE(e.stage() == "FEATURES");
        REQUIRE(e.image_id() == "sku-small");
    }
}

TEST_CASE("dimension_mismatch_is_fatal") {
    pipeline::FinishingPipeline p(plain_config(), neutral_model());
    auto req = gray_request();
    req.mask = AlphaMask::filled(50, 100, 255);
    std::ostringstream log;
    REQUIRE_THROWS_AS(p.run(req, log), DimensionMismatchError);
}

TEST_CASE("stop_flag_before_start_runs_no_stage") {
    pipeline::FinishingPipeline p(plain_config(), neutral_model());
    std::atomic<bool> stop{true};
    std::ostringstream log;

    try {
        p.run(gray_request(), log, &stop);
        FAIL("expected StopRequested");
    } catch (const StopRequested& e) {
        REQUIRE(e.stage() == "EDGE_REFINE");
    }
    REQUIRE(phases_of_type(parse_events(log.str()), "phase_start").empty());
}

TEST_CASE("stop_flag_is_honoured_between_stages") {
    std::atomic<bool> stop{false};
    pipeline::FinishingPipeline p(plain_config(), std::make_shared<StoppingModel>(&stop));
    std::ostringstream log;

    try {
        p.run(gray_request(), log, &stop);
        FAIL("expected StopRequested");
    } catch (const StopRequested& e) {
        REQUIRE(e.stage() == "TONE_APPLY");
    }
    const auto started = phases_of_type(parse_events(log.str()), "phase_start");
    REQUIRE(started.size() == 3);
    REQUIRE(started.back() == "TONE_PREDICT");
}

TEST_CASE("pipeline_rejects_invalid_config") {
    auto cfg = plain_config();
    cfg.tone.param_bounds.gamma = {1.5f, 2.0f};
    REQUIRE_THROWS_AS(pipeline::FinishingPipeline(cfg, nullptr), ValidationError);
}

TEST_CASE("finish_result_report_contains_placement_and_tone") {
    auto cfg = plain_config();
    cfg.shadow.enabled = true;
    pipeline::FinishingPipeline p(cfg, neutral_model());
    std::ostringstream log;
    auto result = p.run(gray_request(), log);

    const json report = result.to_json();
    REQUIRE(report["image_id"] == "sku-1");
    REQUIRE(report["status"] == "ok");
    REQUIRE(report["placement"]["offset"][0] == 50);
    REQUIRE(report["tone"]["params"]["contrast"] == 1.0);
    REQUIRE(report["tone"]["channel_mode"] == "per_channel");
    REQUIRE(report["features"]["layout"] == "subject_stats_v1");
    REQUIRE(report["shadow"]["applied"] == true);
}
