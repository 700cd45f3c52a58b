#pragma once

#include "photo_finish/config/configuration.hpp"
#include "photo_finish/tone/tone_model.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace photo_finish::tone {

struct TonePrediction {
    ToneParameters params;        // clamped, or neutral on fallback
    ToneParameters raw;           // model output before clamping
    bool degraded = false;
    bool clamped = false;
    std::string fallback_reason;  // empty unless degraded
    std::string model_version;
};

// Wraps a ToneModel with bounds clamping, a timeout and neutral fallback.
// predict() never throws for model failures. With a timeout, at most one
// timed-out call per concurrent caller keeps running; while any is pending,
// predict() falls back with reason "timeout_backlog" without calling the model.
class ToneParameterPredictor {
public:
    ToneParameterPredictor(std::shared_ptr<const ToneModel> model, config::ToneConfig cfg);

    TonePrediction predict(const FeatureVector& features) const;

    const ToneModel* model() const { return model_.get(); }

    // Timed-out model calls that have not returned yet.
    int pending_timeouts() const;

private:
    ToneParameters clamp_to_bounds(const ToneParameters& p) const;

    std::shared_ptr<const ToneModel> model_;
    config::ToneConfig cfg_;
    std::shared_ptr<std::atomic<int>> abandoned_;
};

} // namespace photo_finish::tone
