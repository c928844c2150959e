#include <gtest/gtest.h>

#include "induct/decision_tree.hpp"
#include "induct/errors.hpp"
#include "induct/model_iface.hpp"

using namespace induct;

namespace {
/* y = 1 iff x0 > 0.5; x1 is noise */
void make_xor_free(Eigen::MatrixXd& X, std::vector<int>& y)
{
    const int n = 40;
    X.resize(n, 2);
    y.resize(n);
    for (int i = 0; i < n; ++i) {
        X(i, 0) = i / double(n);
        X(i, 1) = (i * 7) % 5;
        y[i] = X(i, 0) > 0.5 ? 1 : 0;
    }
}
}

TEST(DecisionTree, SeparatesOnTheInformativeFeature)
{
    Eigen::MatrixXd X; std::vector<int> y;
    make_xor_free(X, y);
    DecisionTree t(4, 2, 1);
    t.fit(X, y, std::vector<double>(y.size(), 1.0));

    for (Eigen::Index i = 0; i < X.rows(); ++i)
        EXPECT_EQ(t.predict(X.row(i)) > 0.5 ? 1 : 0, y[static_cast<std::size_t>(i)]);
    EXPECT_GT(t.importance()[0], 0.0);
    EXPECT_DOUBLE_EQ(t.importance()[1], 0.0);
}

TEST(DecisionTree, JsonRestoreRejectsDanglingChildren)
{
    nlohmann::json bad = {{"nodes", {{{"feat", 0}, {"thr", 0.5}, {"left", 5}, {"right", 6}, {"prob", 0.5}}}},
                          {"importance", {1.0}}};
    DecisionTree t;
    EXPECT_THROW(t.from_json(bad, 1), ModelLoadError);

    // node 1 splits onto itself: a walk reaching it would never end
    nlohmann::json loop = {{"nodes", {{{"feat", 0}, {"thr", 0.5}, {"left", 1}, {"right", 1}, {"prob", 0.5}},
                                      {{"feat", 0}, {"thr", 0.5}, {"left", 1}, {"right", 1}, {"prob", 0.5}}}},
                           {"importance", {1.0}}};
    EXPECT_THROW(t.from_json(loop, 1), ModelLoadError);

    // child stored before its parent
    nlohmann::json back = {{"nodes", {{{"feat", 0}, {"thr", 0.5}, {"left", 1}, {"right", 2}, {"prob", 0.5}},
                                      {{"feat", -1}, {"thr", 0.0}, {"left", -1}, {"right", -1}, {"prob", 0.1}},
                                      {{"feat", 0}, {"thr", 0.7}, {"left", 1}, {"right", 3}, {"prob", 0.5}},
                                      {{"feat", -1}, {"thr", 0.0}, {"left", -1}, {"right", -1}, {"prob", 0.9}}}},
                           {"importance", {1.0}}};
    EXPECT_THROW(t.from_json(back, 1), ModelLoadError);
}

TEST(DTreeModel, ImportanceSumsToOneAndSurvivesJson)
{
    Eigen::MatrixXd X; std::vector<int> y;
    make_xor_free(X, y);
    auto m = make_dtree();
    TrainOpt opt; opt.max_depth = 3; opt.min_samples_split = 2; opt.min_samples_leaf = 1;
    m->fit(X, y, opt);

    const auto imp = m->feature_importance();
    ASSERT_EQ(imp.size(), 2u);
    EXPECT_NEAR(imp[0] + imp[1], 1.0, 1e-9);

    auto back = make_dtree();
    back->from_json(m->to_json());
    EXPECT_EQ(back->predict_proba(X), m->predict_proba(X));
}

TEST(ModelFactory, RejectsUnknownType)
{
    EXPECT_THROW(make_model("svm"), InputError);
    EXPECT_TRUE(is_known_model_type("random_forest"));
    EXPECT_FALSE(is_known_model_type("svm"));
}
