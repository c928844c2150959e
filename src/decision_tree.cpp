#include "induct/decision_tree.hpp"

#include <algorithm>
#include <limits>
#include <numeric>

#include "induct/errors.hpp"

namespace induct {

namespace {
constexpr int kMaxCandidates = 32;     // thresholds tried per feature and node
}

DecisionTree::DecisionTree(int md, int mss, int msl, double mg)
    : min_gain_(mg), max_depth_(std::max(1, md)),
      min_samples_split_(std::max(2, mss)), min_samples_leaf_(std::max(1, msl)) {}

double DecisionTree::gini(double pos, double tot)
{
    if (tot <= 0) return 0.0;
    const double q = pos / tot;
    return 2.0 * q * (1.0 - q);
}

int DecisionTree::build(const std::vector<int>& idx,
                        const Eigen::MatrixXd& X,
                        const std::vector<int>& y,
                        const std::vector<double>& w,
                        int depth)
{
    /* ---- weighted positive / total ---- */
    double pos_w = 0.0, tot_w = 0.0;
    for (int i : idx) { tot_w += w[i]; pos_w += w[i] * y[i]; }

    DTNode node;
    node.prob = pos_w / std::max(1e-12, tot_w);
    const double parent_g = gini(pos_w, tot_w);

    if (depth >= max_depth_ || static_cast<int>(idx.size()) < min_samples_split_ ||
        parent_g <= 0.0) {
        nodes_.push_back(node);            // leaf
        return static_cast<int>(nodes_.size()) - 1;
    }

    int    best_f = -1;
    double best_thr = 0.0;
    double best_child = std::numeric_limits<double>::max();   // weighted child impurity

    for (Eigen::Index f = 0; f < X.cols(); ++f) {
        std::vector<double> vals;
        vals.reserve(idx.size());
        for (int i : idx) vals.push_back(X(i, f));
        std::sort(vals.begin(), vals.end());
        vals.erase(std::unique(vals.begin(), vals.end()), vals.end());
        if (vals.size() < 2) continue;

        /* midpoints between distinct values, thinned to kMaxCandidates */
        std::vector<double> cand;
        const std::size_t gaps = vals.size() - 1;
        const std::size_t step = std::max<std::size_t>(1, gaps / kMaxCandidates);
        for (std::size_t g = 0; g < gaps; g += step)
            cand.push_back(0.5 * (vals[g] + vals[g + 1]));

        for (double thr : cand) {
            double l_tot = 0, l_pos = 0, r_tot = 0, r_pos = 0;
            int    l_cnt = 0, r_cnt = 0;
            for (int i : idx) {
                if (X(i, f) < thr) { l_tot += w[i]; l_pos += w[i] * y[i]; ++l_cnt; }
                else               { r_tot += w[i]; r_pos += w[i] * y[i]; ++r_cnt; }
            }
            if (l_cnt < min_samples_leaf_ || r_cnt < min_samples_leaf_) continue;

            const double child = (l_tot * gini(l_pos, l_tot) + r_tot * gini(r_pos, r_tot)) / tot_w;
            if (child < best_child) { best_child = child; best_f = static_cast<int>(f); best_thr = thr; }
        }
    }

    if (best_f == -1 || parent_g - best_child < min_gain_) {
        nodes_.push_back(node);
        return static_cast<int>(nodes_.size()) - 1;
    }

    importance_[static_cast<std::size_t>(best_f)] += (tot_w / total_w_) * (parent_g - best_child);

    std::vector<int> left, right;
    for (int i : idx) (X(i, best_f) < best_thr ? left : right).push_back(i);

    node.feat = best_f;
    node.thr  = best_thr;
    const int self = static_cast<int>(nodes_.size());
    nodes_.push_back(node);                // placeholder, children patched below

    const int l = build(left,  X, y, w, depth + 1);
    const int r = build(right, X, y, w, depth + 1);
    nodes_[self].left  = l;
    nodes_[self].right = r;
    return self;
}

void DecisionTree::fit(const Eigen::MatrixXd& X, const std::vector<int>& y,
                       const std::vector<double>& w)
{
    if (X.rows() == 0 || static_cast<std::size_t>(X.rows()) != y.size() || y.size() != w.size())
        throw InputError("decision tree: X/y/w size mismatch");

    nodes_.clear();
    importance_.assign(static_cast<std::size_t>(X.cols()), 0.0);
    total_w_ = std::accumulate(w.begin(), w.end(), 0.0);
    if (total_w_ <= 0.0) throw InputError("decision tree: sample weights sum to zero");

    std::vector<int> idx(static_cast<std::size_t>(X.rows()));
    std::iota(idx.begin(), idx.end(), 0);
    build(idx, X, y, w, 0);
}

double DecisionTree::predict(const Eigen::Ref<const Eigen::RowVectorXd>& x) const
{
    if (nodes_.empty()) return 0.5;
    int id = 0;
    while (nodes_[id].feat != -1)
        id = (x(nodes_[id].feat) < nodes_[id].thr) ? nodes_[id].left : nodes_[id].right;
    return nodes_[id].prob;
}

nlohmann::json DecisionTree::to_json() const
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& n : nodes_)
        arr.push_back({{"feat", n.feat}, {"thr", n.thr}, {"left", n.left},
                       {"right", n.right}, {"prob", n.prob}});
    return {{"nodes", arr}, {"importance", importance_}};
}

void DecisionTree::from_json(const nlohmann::json& j, int n_features)
{
    std::vector<DTNode> nodes;
    for (const auto& e : j.at("nodes")) {
        DTNode n;
        n.feat  = e.at("feat").get<int>();
        n.thr   = e.at("thr").get<double>();
        n.left  = e.at("left").get<int>();
        n.right = e.at("right").get<int>();
        n.prob  = e.at("prob").get<double>();
        nodes.push_back(n);
    }
    /* every internal node must point at a known feature and at children stored after it */
    const int N = static_cast<int>(nodes.size());
    for (int i = 0; i < N; ++i) {
        const DTNode& n = nodes[static_cast<std::size_t>(i)];
        if (n.feat == -1) continue;
        if (n.feat < 0 || n.feat >= n_features || n.left <= i || n.left >= N ||
            n.right <= i || n.right >= N)
            throw ModelLoadError("decision tree node out of range");
    }
    if (nodes.empty()) throw ModelLoadError("decision tree has no nodes");

    auto imp = j.at("importance").get<std::vector<double>>();
    if (static_cast<int>(imp.size()) != n_features)
        throw ModelLoadError("decision tree importance size mismatch");

    nodes_      = std::move(nodes);
    importance_ = std::move(imp);
}

} // namespace induct
