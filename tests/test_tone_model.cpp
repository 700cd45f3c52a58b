#include "photo_finish/tone/tone_model.hpp"
#include "photo_finish/tone/tone_predictor.hpp"
#include "photo_finish/core/errors.hpp"
#include "photo_finish/core/utils.hpp"
#include "photo_finish/metrics/subject_features.hpp"
#include "test_support.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <limits>
#include <stdexcept>
#include <thread>

using namespace photo_finish;
using json = nlohmann::json;

namespace {

FeatureVector features_with_luminance(double lum) {
    FeatureVector v = FeatureVector::Zero(7);
    v[0] = lum;
    return v;
}

json forest_json() {
    return json::parse(R"({
      "kind": "random_forest",
      "version": "rf-test-1",
      "feature_names": ["luminance_mean", "luminance_std", "dark_ratio", "mid_ratio",
                        "bright_ratio", "saturation_mean", "saturation_std"],
      "trees": [
        {"nodes": [
          {"feature": 0, "threshold": 100.0, "left": 1, "right": 2},
          {"value": [10.0, 1.2, 0.9]},
          {"value": [-10.0, 0.8, 1.1]}
        ]},
        {"nodes": [
          {"value": [0.0, 1.0, 1.0]}
        ]}
      ]
    })");
}

json mlp_json() {
    json j;
    j["kind"] = "mlp";
    j["version"] = "mlp-test-1";
    j["feature_names"] = metrics::feature_names();
    j["input_mean"] = std::vector<double>(7, 0.0);
    j["input_scale"] = std::vector<double>(7, 1.0);
    // Hidden relu layer passes luminance_mean through twice (positive and
    // negated), output layer maps it to brightness only.
    std::vector<std::vector<double>> w1(2, std::vector<double>(7, 0.0));
    w1[0][0] = 1.0;
    w1[1][0] = -1.0;
    j["layers"] = json::array();
    j["layers"].push_back({{"weights", w1}, {"bias", {0.0, 0.0}}, {"activation", "relu"}});
    j["layers"].push_back({{"weights", {{0.1, -0.1}, {0.0, 0.0}, {0.0, 0.0}}},
                           {"bias", {0.0, 1.0, 1.0}},
                           {"activation", "linear"}});
    return j;
}

class ThrowingModel : public tone::ToneModel {
public:
    ToneParameters predict(const FeatureVector&) const override {
        throw std::runtime_error("inference backend crashed");
    }
    std::string version() const override { return "throwing"; }
    std::string kind() const override { return "test"; }
    const std::vector<std::string>& feature_names() const override {
        return metrics::feature_names();
    }
};

class SlowModel : public tone::ToneModel {
public:
    ToneParameters predict(const FeatureVector&) const override {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        return {5.0, 1.1, 1.0};
    }
    std::string version() const override { return "slow"; }
    std::string kind() const override { return "test"; }
    const std::vector<std::string>& feature_names() const override {
        return metrics::feature_names();
    }
};

class OpaqueThrowModel : public tone::ToneModel {
public:
    ToneParameters predict(const FeatureVector&) const override { throw 42; }
    std::string version() const override { return "opaque"; }
    std::string kind() const override { return "test"; }
    const std::vector<std::string>& feature_names() const override {
        return metrics::feature_names();
    }
};

config::ToneConfig tone_config(int timeout_ms = 0) {
    config::ToneConfig cfg;
    cfg.timeout_ms = timeout_ms;
    return cfg;
}

} // namespace

TEST_CASE("forest_model_averages_tree_leaves") {
    auto model = tone::parse_tone_model(forest_json());
    REQUIRE(model->kind() == "random_forest");
    REQUIRE(model->version() == "rf-test-1");

    auto dark = model->predict(features_with_luminance(50.0));
    REQUIRE(dark.brightness == Catch::Approx(5.0));
    REQUIRE(dark.contrast == Catch::Approx(1.1));
    REQUIRE(dark.gamma == Catch::Approx(0.95));

    // Split threshold is inclusive on the left
    auto edge = model->predict(features_with_luminance(100.0));
    REQUIRE(edge.brightness == Catch::Approx(5.0));

    auto bright = model->predict(features_with_luminance(150.0));
    REQUIRE(bright.brightness == Catch::Approx(-5.0));
    REQUIRE(bright.contrast == Catch::Approx(0.9));
    REQUIRE(bright.gamma == Catch::Approx(1.05));
}

TEST_CASE("mlp_model_runs_forward_pass") {
    auto model = tone::parse_tone_model(mlp_json());
    REQUIRE(model->kind() == "mlp");

    auto p = model->predict(features_with_luminance(120.0));
    REQUIRE(p.brightness == Catch::Approx(12.0));
    REQUIRE(p.contrast == Catch::Approx(1.0));
    REQUIRE(p.gamma == Catch::Approx(1.0));

    auto n = model->predict(features_with_luminance(-30.0));
    REQUIRE(n.brightness == Catch::Approx(-3.0));
}

TEST_CASE("fixed_model_returns_its_parameters") {
    auto model = tone::parse_tone_model(json::parse(R"({"kind":"fixed","params":[3,1.1,0.9]})"));
    auto p = model->predict(features_with_luminance(0.0));
    REQUIRE(p == ToneParameters{3.0, 1.1, 0.9});
}

TEST_CASE("model_rejects_feature_layout_mismatch") {
    auto j = forest_json();
    j["feature_names"][0] = "mean_brightness";
    REQUIRE_THROWS_AS(tone::parse_tone_model(j), ModelUnavailableError);
}

TEST_CASE("model_rejects_malformed_trees") {
    auto j = forest_json();
    j["trees"][0]["nodes"][0]["left"] = 0;
    REQUIRE_THROWS_AS(tone::parse_tone_model(j), ModelUnavailableError);

    j = forest_json();
    j["trees"][0]["nodes"][0]["feature"] = 12;
    REQUIRE_THROWS_AS(tone::parse_tone_model(j), ModelUnavailableError);

    j = forest_json();
    j["trees"][0]["nodes"][1]["value"] = {1.0, 2.0};
    REQUIRE_THROWS_AS(tone::parse_tone_model(j), ModelUnavailableError);

    j = forest_json();
    j["kind"] = "gradient_boosting";
    REQUIRE_THROWS_AS(tone::parse_tone_model(j), ModelUnavailableError);
}

TEST_CASE("mlp_rejects_wrong_output_width") {
    auto j = mlp_json();
    j["layers"][1]["weights"] = {{0.1, -0.1}, {0.0, 0.0}};
    j["layers"][1]["bias"] = {0.0, 1.0};
    REQUIRE_THROWS_AS(tone::parse_tone_model(j), ModelUnavailableError);
}

TEST_CASE("model_rejects_wrong_feature_count") {
    auto model = tone::parse_tone_model(forest_json());
    FeatureVector short_vec = FeatureVector::Zero(3);
    REQUIRE_THROWS_AS(model->predict(short_vec), ModelUnavailableError);
}

TEST_CASE("load_tone_model_reads_file_and_reports_failures") {
    auto dir = photo_finish::testing::make_temp_dir("model");
    core::write_text(dir / "forest.json", forest_json().dump());
    auto model = tone::load_tone_model(dir / "forest.json");
    REQUIRE(model->version() == "rf-test-1");

    core::write_text(dir / "broken.json", "{ not json");
    REQUIRE_THROWS_AS(tone::load_tone_model(dir / "broken.json"), ModelUnavailableError);
    REQUIRE_THROWS_AS(tone::load_tone_model(dir / "missing.json"), ModelUnavailableError);
}

TEST_CASE("predictor_clamps_to_bounds") {
    auto model = std::make_shared<tone::FixedToneModel>(ToneParameters{80.0, 3.5, 0.1});
    tone::ToneParameterPredictor predictor(model, tone_config());

    auto out = predictor.predict(features_with_luminance(100.0));
    REQUIRE_FALSE(out.degraded);
    REQUIRE(out.clamped);
    REQUIRE(out.params.brightness == Catch::Approx(50.0));
    REQUIRE(out.params.contrast == Catch::Approx(2.0));
    REQUIRE(out.params.gamma == Catch::Approx(0.5));
    REQUIRE(out.raw.contrast == Catch::Approx(3.5));
}

TEST_CASE("predictor_output_contrast_always_within_bounds") {
    auto cfg = tone_config();
    for (double c : {-5.0, 0.0, 0.49, 0.5, 1.0, 1.7, 2.0, 2.01, 100.0}) {
        auto model = std::make_shared<tone::FixedToneModel>(ToneParameters{0.0, c, 1.0});
        tone::ToneParameterPredictor predictor(model, cfg);
        auto out = predictor.predict(features_with_luminance(10.0));
        REQUIRE(out.params.contrast >= 0.5);
        REQUIRE(out.params.contrast <= 2.0);
    }
}

TEST_CASE("predictor_keeps_in_range_output") {
    auto model = std::make_shared<tone::FixedToneModel>(ToneParameters{-12.0, 1.3, 0.8});
    tone::ToneParameterPredictor predictor(model, tone_config(1000));
    auto out = predictor.predict(features_with_luminance(10.0));
    REQUIRE_FALSE(out.degraded);
    REQUIRE_FALSE(out.clamped);
    REQUIRE(out.params == ToneParameters{-12.0, 1.3, 0.8});
    REQUIRE(out.model_version == "fixed");
}

TEST_CASE("throwing_model_falls_back_to_neutral") {
    tone::ToneParameterPredictor predictor(std::make_shared<ThrowingModel>(), tone_config());
    auto out = predictor.predict(features_with_luminance(10.0));
    REQUIRE(out.degraded);
    REQUIRE(out.params == ToneParameters::neutral());
    REQUIRE(out.fallback_reason.find("inference backend crashed") != std::string::npos);

    tone::ToneParameterPredictor threaded(std::make_shared<ThrowingModel>(), tone_config(1000));
    auto out2 = threaded.predict(features_with_luminance(10.0));
    REQUIRE(out2.degraded);
    REQUIRE(out2.params == ToneParameters::neutral());
}

TEST_CASE("slow_model_times_out_to_neutral") {
    tone::ToneParameterPredictor predictor(std::make_shared<SlowModel>(), tone_config(20));
    const auto t0 = std::chrono::steady_clock::now();
    auto out = predictor.predict(features_with_luminance(10.0));
    const auto waited = std::chrono::steady_clock::now() - t0;

    REQUIRE(out.degraded);
    REQUIRE(out.fallback_reason == "timeout");
    REQUIRE(out.params == ToneParameters::neutral());
    REQUIRE(waited < std::chrono::milliseconds(400));
}

TEST_CASE("timed_out_call_blocks_new_model_threads_until_it_returns") {
    tone::ToneParameterPredictor predictor(std::make_shared<SlowModel>(), tone_config(20));

    auto first = predictor.predict(features_with_luminance(10.0));
    REQUIRE(first.fallback_reason == "timeout");
    REQUIRE(predictor.pending_timeouts() == 1);

    for (int i = 0; i < 5; ++i) {
        const auto t0 = std::chrono::steady_clock::now();
        auto out = predictor.predict(features_with_luminance(10.0));
        REQUIRE(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(20));
        REQUIRE(out.degraded);
        REQUIRE(out.fallback_reason == "timeout_backlog");
        REQUIRE(out.params == ToneParameters::neutral());
    }
    REQUIRE(predictor.pending_timeouts() == 1);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (predictor.pending_timeouts() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(predictor.pending_timeouts() == 0);

    auto again = predictor.predict(features_with_luminance(10.0));
    REQUIRE(again.fallback_reason == "timeout");
}

TEST_CASE("non_standard_exception_falls_back") {
    tone::ToneParameterPredictor direct(std::make_shared<OpaqueThrowModel>(), tone_config());
    auto out = direct.predict(features_with_luminance(10.0));
    REQUIRE(out.degraded);
    REQUIRE(out.fallback_reason == "model_exception: unknown");

    tone::ToneParameterPredictor threaded(std::make_shared<OpaqueThrowModel>(), tone_config(1000));
    auto out2 = threaded.predict(features_with_luminance(10.0));
    REQUIRE(out2.fallback_reason == "model_exception: unknown");
    REQUIRE(threaded.pending_timeouts() == 0);
}

TEST_CASE("non_finite_model_output_falls_back") {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    auto model = std::make_shared<tone::FixedToneModel>(ToneParameters{nan, 1.0, 1.0});
    tone::ToneParameterPredictor predictor(model, tone_config());
    auto out = predictor.predict(features_with_luminance(10.0));
    REQUIRE(out.degraded);
    REQUIRE(out.fallback_reason == "non_finite_output");
    REQUIRE(out.params == ToneParameters::neutral());
}

TEST_CASE("missing_model_falls_back") {
    tone::ToneParameterPredictor predictor(nullptr, tone_config());
    auto out = predictor.predict(features_with_luminance(10.0));
    REQUIRE(out.degraded);
    REQUIRE(out.fallback_reason == "model_unavailable");
}
