#include "induct/feature_scaler.hpp"

#include <cmath>

#include "induct/errors.hpp"

namespace induct {

void FeatureScaler::fit(const Eigen::MatrixXd& X)
{
    if (X.rows() == 0) throw InputError("cannot fit scaler on an empty matrix");
    mean_ = X.colwise().mean().transpose();
    const Eigen::MatrixXd centered = X.rowwise() - mean_.transpose();
    scale_ = (centered.array().square().colwise().sum() / static_cast<double>(X.rows()))
                 .sqrt().matrix().transpose();
    for (Eigen::Index c = 0; c < scale_.size(); ++c)
        if (!(scale_(c) > 1e-12)) scale_(c) = 1.0;
}

Eigen::MatrixXd FeatureScaler::apply(const Eigen::MatrixXd& X) const
{
    if (X.cols() != mean_.size())
        throw InputError("scaler expects " + std::to_string(mean_.size()) +
                         " columns, got " + std::to_string(X.cols()));
    return ((X.rowwise() - mean_.transpose()).array().rowwise() / scale_.transpose().array()).matrix();
}

nlohmann::json FeatureScaler::to_json() const
{
    std::vector<double> m(mean_.data(), mean_.data() + mean_.size());
    std::vector<double> s(scale_.data(), scale_.data() + scale_.size());
    return {{"mean", m}, {"scale", s}};
}

FeatureScaler FeatureScaler::from_json(const nlohmann::json& j)
{
    const auto m = j.at("mean").get<std::vector<double>>();
    const auto s = j.at("scale").get<std::vector<double>>();
    if (m.empty() || m.size() != s.size())
        throw ModelLoadError("scaler mean/scale size mismatch");

    FeatureScaler fs;
    fs.mean_  = Eigen::Map<const Eigen::VectorXd>(m.data(), static_cast<Eigen::Index>(m.size()));
    fs.scale_ = Eigen::Map<const Eigen::VectorXd>(s.data(), static_cast<Eigen::Index>(s.size()));
    for (Eigen::Index c = 0; c < fs.scale_.size(); ++c)
        if (!std::isfinite(fs.scale_(c)) || fs.scale_(c) <= 0.0)
            throw ModelLoadError("scaler holds a non-positive scale");
    return fs;
}

} // namespace induct
