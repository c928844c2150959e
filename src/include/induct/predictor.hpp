/*───────────────────────────────────────────────────────────
 *  predictor.hpp   –  induction-propensity classifier
 *
 *  Untrained ──train()──▶ Trained.  Retraining replaces the fitted
 *  state wholesale; a failed train() leaves the previous state as is.
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "induct/feature_builder.hpp"
#include "induct/feature_scaler.hpp"
#include "induct/model_iface.hpp"
#include "induct/train_record.hpp"

namespace induct {

constexpr std::size_t kMinTrainingSamples = 10;

struct PredictionResult {
    std::string train_id;
    int         predicted_label = 0;
    double      probability     = 0.5;
    double      confidence      = 0.0;      // |p-0.5|*2
};

struct ClassMetrics {
    double      precision = 0.0;
    double      recall    = 0.0;
    double      f1        = 0.0;
    std::size_t support   = 0;
};

struct TrainingReport {
    std::string model_type;
    double      accuracy = 0.0;             // on the test split
    double      cv_mean  = 0.0;
    double      cv_std   = 0.0;
    int         cv_folds = 0;               // 0 ⇒ CV skipped
    std::vector<std::pair<std::string, double>> feature_importance;   // ranked
    std::array<std::array<long, 2>, 2> confusion{};   // [actual][predicted]
    std::array<ClassMetrics, 2>        per_class{};
    std::size_t training_size = 0;
    std::size_t test_size     = 0;
    bool        stratified         = true;
    bool        labels_synthesized = false;

    nlohmann::json to_json() const;
};

/* deterministic part of the synthetic label, in [0,1] */
double synthetic_induct_score(const TrainAttributes& t);

/* one uniform draw per row: label = draw < synthetic_induct_score */
std::vector<int> synthesize_labels(const std::vector<TrainRecord>& data, std::mt19937& rng);

/* untrained rule: fitness tiers, hard 0.1 on work orders / bad cert */
double rule_probability(const TrainAttributes& t);

class Predictor {
public:
    explicit Predictor(std::string model_type = "random_forest",
                       TrainOpt opt = {}, FeatureOptions fopt = {});

    bool is_trained() const { return model_ != nullptr; }
    const std::string& model_type() const { return model_type_; }
    const TrainOpt& train_opt() const { return opt_; }
    const std::string& trained_at() const { return trained_at_; }

    /* rng drives only the synthetic-label draw; split/CV use opt.seed */
    TrainingReport train(const std::vector<TrainRecord>& data, std::mt19937& rng);
    TrainingReport train(const std::vector<TrainRecord>& data);

    std::vector<PredictionResult> predict(const std::vector<TrainRecord>& data) const;

    /* ranked (name, share) of the fitted model; empty when untrained */
    std::vector<std::pair<std::string, double>> feature_importance() const;

    /* one JSON blob: model + scaler + encoders + column order */
    std::string persist() const;
    void        restore(const std::string& blob);    // ModelLoadError ⇒ Untrained

    void save_model(const std::string& path) const;  // temp file + rename
    bool load_model(const std::string& path);        // false ⇒ Untrained

    void reset();

private:
    std::string                  model_type_;
    TrainOpt                     opt_;
    FeatureOptions               fopt_;
    FeatureBuilder               builder_;
    FeatureScaler                scaler_;
    std::unique_ptr<IModel>      model_;
    std::vector<std::string>     importance_cols_;
    std::string                  trained_at_;
};

} // namespace induct
