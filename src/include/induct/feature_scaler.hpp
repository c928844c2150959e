/*───────────────────────────────────────────────────────────
 *  feature_scaler.hpp   –  per-column z-score, frozen after fit
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace induct {

class FeatureScaler {
public:
    void fit(const Eigen::MatrixXd& X);
    Eigen::MatrixXd apply(const Eigen::MatrixXd& X) const;

    bool fitted() const { return mean_.size() > 0; }
    Eigen::Index dims() const { return mean_.size(); }
    const Eigen::VectorXd& mean()  const { return mean_; }
    const Eigen::VectorXd& scale() const { return scale_; }

    nlohmann::json to_json() const;
    static FeatureScaler from_json(const nlohmann::json& j);

private:
    Eigen::VectorXd mean_;
    Eigen::VectorXd scale_;      // population std, 1.0 for constant columns
};

} // namespace induct
