/* ──────────────────────────────────────────────────────────────
   model_iface.hpp     –  the abstraction layer for classifiers
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace induct {

struct TrainOpt {
    /* generic hyper-params – each model ignores what it doesn't use */
    int      trees             = 100;    // forest / boosting rounds
    int      max_depth         = 10;
    int      min_samples_split = 5;
    int      min_samples_leaf  = 2;
    double   lr                = 0.1;    // gbdt only
    double   subsample         = 0.8;    // rf bagging fraction
    double   colsample         = 0.8;
    double   test_ratio        = 0.2;
    int      cv_folds          = 5;
    uint32_t seed              = 42;
    int      threads           = 1;
};

struct IModel {
    virtual ~IModel() = default;

    /* X is already scaled; y holds 0/1 */
    virtual void fit(const Eigen::MatrixXd& X,
                     const std::vector<int>& y,
                     const TrainOpt&         opt) = 0;

    /* P(y=1) per row */
    virtual std::vector<double> predict_proba(const Eigen::MatrixXd& X) const = 0;

    /* one entry per column, non-negative, sums to 1 (all 0 if unknown) */
    virtual std::vector<double> feature_importance() const = 0;

    virtual nlohmann::json to_json() const = 0;
    virtual void           from_json(const nlohmann::json& j) = 0;

    virtual std::string type_name() const = 0;
    virtual int n_features() const = 0;
};

std::unique_ptr<IModel> make_dtree();
std::unique_ptr<IModel> make_lightgbm(const std::string& booster);   // "rf" | "gbdt"

/* "random_forest" | "lightgbm" | "decision_tree"; InputError otherwise */
std::unique_ptr<IModel> make_model(const std::string& model_type);
bool is_known_model_type(const std::string& model_type);

} // namespace induct
