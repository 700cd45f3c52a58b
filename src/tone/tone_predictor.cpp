#include "photo_finish/tone/tone_predictor.hpp"
#include "photo_finish/core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <thread>
#include <utility>

namespace photo_finish::tone {

namespace {

bool all_finite(const ToneParameters& p) {
    return std::isfinite(p.brightness) && std::isfinite(p.contrast) && std::isfinite(p.gamma);
}

double clamp_pair(double v, const std::array<float, 2>& bounds) {
    return std::clamp(v, static_cast<double>(bounds[0]), static_cast<double>(bounds[1]));
}

TonePrediction fallback(const std::string& reason, const std::string& version) {
    TonePrediction out;
    out.params = ToneParameters::neutral();
    out.raw = ToneParameters::neutral();
    out.degraded = true;
    out.fallback_reason = reason;
    out.model_version = version;
    return out;
}

enum CallState : int { CALL_RUNNING = 0, CALL_DONE = 1, CALL_ABANDONED = 2 };

// Marks a worker call finished; releases the backlog slot if the caller
// already gave up on it.
struct CallGuard {
    std::shared_ptr<std::atomic<int>> state;
    std::shared_ptr<std::atomic<int>> abandoned;

    ~CallGuard() {
        if (state->exchange(CALL_DONE) == CALL_ABANDONED) {
            abandoned->fetch_sub(1);
        }
    }
};

} // namespace

ToneParameterPredictor::ToneParameterPredictor(std::shared_ptr<const ToneModel> model,
                                               config::ToneConfig cfg)
    : model_(std::move(model)), cfg_(std::move(cfg)),
      abandoned_(std::make_shared<std::atomic<int>>(0)) {}

int ToneParameterPredictor::pending_timeouts() const {
    return abandoned_->load();
}

ToneParameters ToneParameterPredictor::clamp_to_bounds(const ToneParameters& p) const {
    const auto& b = cfg_.param_bounds;
    return {clamp_pair(p.brightness, b.brightness), clamp_pair(p.contrast, b.contrast),
            clamp_pair(p.gamma, b.gamma)};
}

TonePrediction ToneParameterPredictor::predict(const FeatureVector& features) const {
    if (!model_) {
        return fallback("model_unavailable", "");
    }
    const std::string version = model_->version();

    ToneParameters raw;
    try {
        if (cfg_.timeout_ms <= 0) {
            raw = model_->predict(features);
        } else {
            // A call that timed out earlier and is still running blocks new
            // worker threads until it returns.
            if (abandoned_->load() > 0) {
                return fallback("timeout_backlog", version);
            }

            // The worker owns copies of the model handle, the features and the
            // call state, so a timed-out call can finish on its own.
            auto state = std::make_shared<std::atomic<int>>(CALL_RUNNING);
            std::shared_ptr<std::atomic<int>> abandoned = abandoned_;
            std::shared_ptr<const ToneModel> model = model_;
            std::packaged_task<ToneParameters(FeatureVector)> task(
                [model, state, abandoned](FeatureVector f) {
                    CallGuard guard{state, abandoned};
                    return model->predict(f);
                });
            std::future<ToneParameters> result = task.get_future();
            std::thread(std::move(task), features).detach();

            if (result.wait_for(std::chrono::milliseconds(cfg_.timeout_ms)) !=
                std::future_status::ready) {
                abandoned_->fetch_add(1);
                if (state->exchange(CALL_ABANDONED) == CALL_DONE) {
                    abandoned_->fetch_sub(1);
                }
                return fallback("timeout", version);
            }
            raw = result.get();
        }
    } catch (const ModelUnavailableError& e) {
        return fallback(std::string("model_error: ") + e.what(), version);
    } catch (const std::exception& e) {
        return fallback(std::string("model_exception: ") + e.what(), version);
    } catch (...) {
        return fallback("model_exception: unknown", version);
    }

    if (!all_finite(raw)) {
        return fallback("non_finite_output", version);
    }

    TonePrediction out;
    out.raw = raw;
    out.params = clamp_to_bounds(raw);
    out.clamped = !(out.params == raw);
    out.model_version = version;
    return out;
}

} // namespace photo_finish::tone
