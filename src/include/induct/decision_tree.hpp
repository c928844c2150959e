/*───────────────────────────────────────────────────────────
 *  decision_tree.hpp   –  weighted CART binary classifier
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <vector>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

namespace induct {

struct DTNode {
    int    feat  = -1;      // -1 ⇒ leaf
    int    left  = -1;
    int    right = -1;
    double thr   = 0.0;     // go left when x[feat] < thr
    double prob  = 0.0;     // weighted P(y=1) at this node
};

class DecisionTree {
public:
    /* md = max depth, mss = min samples to split, msl = min samples per leaf */
    DecisionTree(int md = 10, int mss = 5, int msl = 2, double mg = 0.0);

    void fit(const Eigen::MatrixXd& X,
             const std::vector<int>& y,
             const std::vector<double>& w);

    double predict(const Eigen::Ref<const Eigen::RowVectorXd>& x) const;

    /* total weighted gini decrease per feature, unnormalized */
    const std::vector<double>& importance() const { return importance_; }
    std::size_t node_count() const { return nodes_.size(); }

    nlohmann::json to_json() const;
    void           from_json(const nlohmann::json& arr, int n_features);

private:
    static double gini(double pos, double tot);
    int build(const std::vector<int>& idx,
              const Eigen::MatrixXd& X,
              const std::vector<int>& y,
              const std::vector<double>& w,
              int depth);

    std::vector<DTNode> nodes_;
    std::vector<double> importance_;
    double              min_gain_;
    int                 max_depth_;
    int                 min_samples_split_;
    int                 min_samples_leaf_;
    double              total_w_ = 0.0;
};

} // namespace induct
