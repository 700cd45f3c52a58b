#include "photo_finish/tone/tone_model.hpp"
#include "photo_finish/core/errors.hpp"
#include "photo_finish/core/utils.hpp"
#include "photo_finish/metrics/subject_features.hpp"

#include <cmath>
#include <utility>

namespace photo_finish::tone {

using json = nlohmann::json;

namespace {

void require_feature_count(const FeatureVector& features, size_t expected) {
    if (static_cast<size_t>(features.size()) != expected) {
        throw ModelUnavailableError("feature vector has " + std::to_string(features.size()) +
                                    " entries, model expects " + std::to_string(expected));
    }
}

Eigen::VectorXd read_vector(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_array()) {
        throw ModelUnavailableError(std::string("missing array '") + key + "'");
    }
    const auto& arr = j[key];
    Eigen::VectorXd v(static_cast<Eigen::Index>(arr.size()));
    for (size_t i = 0; i < arr.size(); ++i) {
        v[static_cast<Eigen::Index>(i)] = arr[i].get<double>();
    }
    return v;
}

MlpToneModel::Activation parse_activation(const std::string& s) {
    const std::string a = core::to_lower(s);
    if (a == "relu") return MlpToneModel::Activation::RELU;
    if (a == "tanh") return MlpToneModel::Activation::TANH;
    if (a == "linear" || a == "identity") return MlpToneModel::Activation::LINEAR;
    throw ModelUnavailableError("unknown activation '" + s + "'");
}

std::shared_ptr<const ToneModel> parse_forest(const json& j, std::string version,
                                              std::vector<std::string> names) {
    if (!j.contains("trees") || !j["trees"].is_array() || j["trees"].empty()) {
        throw ModelUnavailableError("random_forest artifact has no trees");
    }
    const int n_features = static_cast<int>(names.size());

    std::vector<ForestToneModel::Tree> trees;
    trees.reserve(j["trees"].size());
    for (const auto& jt : j["trees"]) {
        const json& jnodes = jt.contains("nodes") ? jt["nodes"] : jt;
        if (!jnodes.is_array() || jnodes.empty()) {
            throw ModelUnavailableError("tree without nodes");
        }
        ForestToneModel::Tree tree;
        tree.reserve(jnodes.size());
        const int n_nodes = static_cast<int>(jnodes.size());
        for (int i = 0; i < n_nodes; ++i) {
            const json& jn = jnodes[static_cast<size_t>(i)];
            ForestToneModel::Node node;
            if (jn.contains("value")) {
                const auto& val = jn["value"];
                if (!val.is_array() || val.size() != 3) {
                    throw ModelUnavailableError("leaf value must hold [brightness, contrast, gamma]");
                }
                node.value = Eigen::Vector3d(val[0].get<double>(), val[1].get<double>(),
                                             val[2].get<double>());
            } else {
                node.feature = jn.at("feature").get<int>();
                node.threshold = jn.at("threshold").get<double>();
                node.left = jn.at("left").get<int>();
                node.right = jn.at("right").get<int>();
                if (node.feature < 0 || node.feature >= n_features) {
                    throw ModelUnavailableError("split feature index out of range");
                }
                // Children must come after their parent, which also rules out cycles.
                if (node.left <= i || node.right <= i || node.left >= n_nodes ||
                    node.right >= n_nodes) {
                    throw ModelUnavailableError("invalid child index in tree node " +
                                                std::to_string(i));
                }
            }
            tree.push_back(node);
        }
        trees.push_back(std::move(tree));
    }

    return std::make_shared<ForestToneModel>(std::move(version), std::move(names),
                                             std::move(trees));
}

std::shared_ptr<const ToneModel> parse_mlp(const json& j, std::string version,
                                           std::vector<std::string> names) {
    const Eigen::Index n_in = static_cast<Eigen::Index>(names.size());
    Eigen::VectorXd mean = j.contains("input_mean") ? read_vector(j, "input_mean")
                                                    : Eigen::VectorXd::Zero(n_in);
    Eigen::VectorXd scale = j.contains("input_scale") ? read_vector(j, "input_scale")
                                                      : Eigen::VectorXd::Ones(n_in);
    if (mean.size() != n_in || scale.size() != n_in) {
        throw ModelUnavailableError("input_mean/input_scale length does not match feature_names");
    }

    if (!j.contains("layers") || !j["layers"].is_array() || j["layers"].empty()) {
        throw ModelUnavailableError("mlp artifact has no layers");
    }

    std::vector<MlpToneModel::Layer> layers;
    Eigen::Index width = n_in;
    for (const auto& jl : j["layers"]) {
        const auto& jw = jl.at("weights");
        if (!jw.is_array() || jw.empty() || !jw[0].is_array()) {
            throw ModelUnavailableError("layer weights must be a 2-D array");
        }
        MlpToneModel::Layer layer;
        const Eigen::Index rows = static_cast<Eigen::Index>(jw.size());
        const Eigen::Index cols = static_cast<Eigen::Index>(jw[0].size());
        if (cols != width) {
            throw ModelUnavailableError("layer input width " + std::to_string(cols) +
                                        " does not match previous width " + std::to_string(width));
        }
        layer.weights.resize(rows, cols);
        for (Eigen::Index r = 0; r < rows; ++r) {
            const auto& jrow = jw[static_cast<size_t>(r)];
            if (!jrow.is_array() || static_cast<Eigen::Index>(jrow.size()) != cols) {
                throw ModelUnavailableError("ragged layer weights");
            }
            for (Eigen::Index c = 0; c < cols; ++c) {
                layer.weights(r, c) = jrow[static_cast<size_t>(c)].get<double>();
            }
        }
        layer.bias = read_vector(jl, "bias");
        if (layer.bias.size() != rows) {
            throw ModelUnavailableError("layer bias length does not match weights");
        }
        layer.activation = parse_activation(jl.value("activation", std::string("linear")));
        width = rows;
        layers.push_back(std::move(layer));
    }
    if (width != 3) {
        throw ModelUnavailableError("mlp output width must be 3, got " + std::to_string(width));
    }

    return std::make_shared<MlpToneModel>(std::move(version), std::move(names), std::move(mean),
                                          std::move(scale), std::move(layers));
}

} // namespace

ForestToneModel::ForestToneModel(std::string version, std::vector<std::string> feature_names,
                                 std::vector<Tree> trees)
    : version_(std::move(version)), feature_names_(std::move(feature_names)),
      trees_(std::move(trees)) {}

Eigen::Vector3d ForestToneModel::evaluate_tree(const Tree& tree, const FeatureVector& x) const {
    size_t idx = 0;
    while (tree[idx].feature >= 0) {
        const Node& n = tree[idx];
        idx = static_cast<size_t>(x[n.feature] <= n.threshold ? n.left : n.right);
    }
    return tree[idx].value;
}

ToneParameters ForestToneModel::predict(const FeatureVector& features) const {
    require_feature_count(features, feature_names_.size());
    Eigen::Vector3d sum = Eigen::Vector3d::Zero();
    for (const auto& tree : trees_) {
        sum += evaluate_tree(tree, features);
    }
    const Eigen::Vector3d mean = sum / static_cast<double>(trees_.size());
    return {mean[0], mean[1], mean[2]};
}

MlpToneModel::MlpToneModel(std::string version, std::vector<std::string> feature_names,
                           Eigen::VectorXd input_mean, Eigen::VectorXd input_scale,
                           std::vector<Layer> layers)
    : version_(std::move(version)), feature_names_(std::move(feature_names)),
      input_mean_(std::move(input_mean)), input_scale_(std::move(input_scale)),
      layers_(std::move(layers)) {}

ToneParameters MlpToneModel::predict(const FeatureVector& features) const {
    require_feature_count(features, feature_names_.size());
    Eigen::VectorXd h = features - input_mean_;
    for (Eigen::Index i = 0; i < h.size(); ++i) {
        const double s = input_scale_[i];
        h[i] = s != 0.0 ? h[i] / s : 0.0;
    }
    for (const auto& layer : layers_) {
        h = layer.weights * h + layer.bias;
        switch (layer.activation) {
        case Activation::RELU:
            h = h.cwiseMax(0.0);
            break;
        case Activation::TANH:
            h = h.array().tanh().matrix();
            break;
        case Activation::LINEAR:
            break;
        }
    }
    return {h[0], h[1], h[2]};
}

FixedToneModel::FixedToneModel(ToneParameters params, std::string version)
    : params_(params), version_(std::move(version)) {}

ToneParameters FixedToneModel::predict(const FeatureVector& features) const {
    require_feature_count(features, feature_names().size());
    return params_;
}

const std::vector<std::string>& FixedToneModel::feature_names() const {
    return metrics::feature_names();
}

std::shared_ptr<const ToneModel> parse_tone_model(const json& j) {
    if (!j.is_object()) {
        throw ModelUnavailableError("model artifact must be a JSON object");
    }
    try {
        const std::string kind = core::to_lower(j.value("kind", std::string()));
        std::string version = j.value("version", std::string("unversioned"));

        if (kind == "fixed") {
            const auto& p = j.at("params");
            if (!p.is_array() || p.size() != 3) {
                throw ModelUnavailableError("fixed model params must be [brightness, contrast, gamma]");
            }
            return std::make_shared<FixedToneModel>(
                ToneParameters{p[0].get<double>(), p[1].get<double>(), p[2].get<double>()},
                std::move(version));
        }

        std::vector<std::string> names = j.at("feature_names").get<std::vector<std::string>>();
        if (names != metrics::feature_names()) {
            throw ModelUnavailableError("feature_names do not match layout " +
                                        std::string(metrics::kFeatureLayout));
        }

        if (kind == "random_forest" || kind == "forest") {
            return parse_forest(j, std::move(version), std::move(names));
        }
        if (kind == "mlp") {
            return parse_mlp(j, std::move(version), std::move(names));
        }
        throw ModelUnavailableError("unknown model kind '" + kind + "'");
    } catch (const json::exception& e) {
        throw ModelUnavailableError(std::string("malformed model artifact: ") + e.what());
    }
}

std::shared_ptr<const ToneModel> load_tone_model(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ModelUnavailableError("model file not found: " + path.string());
    }
    std::string text;
    try {
        text = core::read_text(path);
    } catch (const IOError& e) {
        throw ModelUnavailableError(e.what());
    }
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        throw ModelUnavailableError("model file is not valid JSON: " + path.string());
    }
    return parse_tone_model(j);
}

} // namespace photo_finish::tone
