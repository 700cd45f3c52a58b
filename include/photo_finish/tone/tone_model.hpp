#pragma once

#include "photo_finish/core/types.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace photo_finish::tone {

// Regressor from a feature vector to raw (brightness, contrast, gamma).
// Implementations are immutable after construction and safe for concurrent
// predict() calls.
class ToneModel {
public:
    virtual ~ToneModel() = default;

    virtual ToneParameters predict(const FeatureVector& features) const = 0;
    virtual std::string version() const = 0;
    virtual std::string kind() const = 0;
    virtual const std::vector<std::string>& feature_names() const = 0;
};

// Tree ensemble (random forest regressor). Leaves hold the three outputs;
// the prediction is the mean over trees. Split rule: x[feature] <= threshold
// goes left.
class ForestToneModel : public ToneModel {
public:
    struct Node {
        int feature = -1;  // -1 marks a leaf
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        Eigen::Vector3d value = Eigen::Vector3d::Zero();
    };
    using Tree = std::vector<Node>;

    ForestToneModel(std::string version, std::vector<std::string> feature_names,
                    std::vector<Tree> trees);

    ToneParameters predict(const FeatureVector& features) const override;
    std::string version() const override { return version_; }
    std::string kind() const override { return "random_forest"; }
    const std::vector<std::string>& feature_names() const override { return feature_names_; }

    size_t tree_count() const { return trees_.size(); }

private:
    Eigen::Vector3d evaluate_tree(const Tree& tree, const FeatureVector& x) const;

    std::string version_;
    std::vector<std::string> feature_names_;
    std::vector<Tree> trees_;
};

// Small dense network: standardise inputs, then W*x + b per layer.
class MlpToneModel : public ToneModel {
public:
    enum class Activation { LINEAR, RELU, TANH };

    struct Layer {
        MatrixXd weights;  // out x in
        Eigen::VectorXd bias;
        Activation activation = Activation::LINEAR;
    };

    MlpToneModel(std::string version, std::vector<std::string> feature_names,
                 Eigen::VectorXd input_mean, Eigen::VectorXd input_scale,
                 std::vector<Layer> layers);

    ToneParameters predict(const FeatureVector& features) const override;
    std::string version() const override { return version_; }
    std::string kind() const override { return "mlp"; }
    const std::vector<std::string>& feature_names() const override { return feature_names_; }

private:
    std::string version_;
    std::vector<std::string> feature_names_;
    Eigen::VectorXd input_mean_;
    Eigen::VectorXd input_scale_;
    std::vector<Layer> layers_;
};

// Deterministic fixture: always returns the same parameters.
class FixedToneModel : public ToneModel {
public:
    explicit FixedToneModel(ToneParameters params, std::string version = "fixed");

    ToneParameters predict(const FeatureVector& features) const override;
    std::string version() const override { return version_; }
    std::string kind() const override { return "fixed"; }
    const std::vector<std::string>& feature_names() const override;

private:
    ToneParameters params_;
    std::string version_;
};

// Parse a model artifact. Throws ModelUnavailableError on malformed input or
// when its feature_names differ from the extractor layout.
std::shared_ptr<const ToneModel> parse_tone_model(const nlohmann::json& j);

std::shared_ptr<const ToneModel> load_tone_model(const fs::path& path);

} // namespace photo_finish::tone
