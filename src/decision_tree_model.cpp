/**********************************************************************
 * decision_tree_model.cpp
 *
 * A light-weight wrapper that exposes a single CART classifier through
 * the generic IModel interface.
 *
 *  ┌─ IModel ──────────────────────────────────────────────────────┐
 *  │ virtual void   fit (X, y, opt)                                │
 *  │ virtual std::vector<double> predict_proba (X) const           │
 *  │ virtual std::vector<double> feature_importance () const       │
 *  └───────────────────────────────────────────────────────────────┘
 *********************************************************************/
#include <memory>
#include <numeric>

#include "induct/decision_tree.hpp"
#include "induct/errors.hpp"
#include "induct/model_iface.hpp"

namespace induct {

class DTreeModel : public IModel
{
public:
    void fit(const Eigen::MatrixXd& X, const std::vector<int>& y,
             const TrainOpt& opt) override
    {
        /* class-balanced weights so a skewed fleet still splits */
        double pos = 0;
        for (int v : y) pos += v;
        const double n = static_cast<double>(y.size());
        const double neg = n - pos;
        std::vector<double> w(y.size(), 1.0);
        if (pos > 0 && neg > 0)
            for (std::size_t i = 0; i < y.size(); ++i)
                w[i] = y[i] ? n / (2.0 * pos) : n / (2.0 * neg);

        tree_ = DecisionTree(opt.max_depth, opt.min_samples_split, opt.min_samples_leaf);
        tree_.fit(X, y, w);
        n_features_ = static_cast<int>(X.cols());
    }

    std::vector<double> predict_proba(const Eigen::MatrixXd& X) const override
    {
        if (X.cols() != n_features_)
            throw InputError("decision tree expects " + std::to_string(n_features_) + " features");
        std::vector<double> p(static_cast<std::size_t>(X.rows()));
        for (Eigen::Index r = 0; r < X.rows(); ++r)
            p[static_cast<std::size_t>(r)] = tree_.predict(X.row(r));
        return p;
    }

    std::vector<double> feature_importance() const override
    {
        std::vector<double> imp = tree_.importance();
        imp.resize(static_cast<std::size_t>(n_features_), 0.0);
        const double s = std::accumulate(imp.begin(), imp.end(), 0.0);
        if (s > 0) for (double& v : imp) v /= s;
        return imp;
    }

    nlohmann::json to_json() const override
    {
        return {{"n_features", n_features_}, {"tree", tree_.to_json()}};
    }

    void from_json(const nlohmann::json& j) override
    {
        const int nf = j.at("n_features").get<int>();
        if (nf <= 0) throw ModelLoadError("decision tree n_features must be positive");
        DecisionTree t;
        t.from_json(j.at("tree"), nf);
        tree_ = std::move(t);
        n_features_ = nf;
    }

    std::string type_name() const override { return "decision_tree"; }
    int n_features() const override { return n_features_; }

private:
    DecisionTree tree_;
    int          n_features_ = 0;
};

std::unique_ptr<IModel> make_dtree() { return std::make_unique<DTreeModel>(); }

bool is_known_model_type(const std::string& t)
{
    return t == "random_forest" || t == "lightgbm" || t == "decision_tree";
}

std::unique_ptr<IModel> make_model(const std::string& model_type)
{
    if (model_type == "decision_tree") return make_dtree();
    if (model_type == "random_forest") return make_lightgbm("rf");
    if (model_type == "lightgbm")      return make_lightgbm("gbdt");
    throw InputError("unknown model type '" + model_type + "'");
}

} // namespace induct
