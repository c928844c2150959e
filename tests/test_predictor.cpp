#include <gtest/gtest.h>

#include <cstdio>
#include <numeric>

#include "fleet_fixture.hpp"
#include "induct/common.hpp"
#include "induct/errors.hpp"
#include "induct/predictor.hpp"

using namespace induct;

namespace {

class PredictorTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_level(LogLevel::kSilent); fopt_.day_of_week = 2; }

    Predictor make(const std::string& type = "decision_tree") const
    {
        TrainOpt opt;
        opt.trees = 20;
        opt.max_depth = 4;
        return Predictor(type, opt, fopt_);
    }

    FeatureOptions fopt_;
};

TrainRecord one(const std::string& id, double fitness)
{
    TrainRecord r;
    r.train_id = id;
    r.fitness_score = fitness;
    r.open_work_orders = 0;
    r.cert_valid = true;
    return r;
}

} // namespace

TEST_F(PredictorTest, UntrainedHighFitnessTrainIsInducted)
{
    Predictor p = make();
    const auto res = p.predict({one("T1", 90)});
    ASSERT_EQ(res.size(), 1u);
    EXPECT_DOUBLE_EQ(res[0].probability, 0.9);
    EXPECT_EQ(res[0].predicted_label, 1);
    EXPECT_NEAR(res[0].confidence, 0.8, 1e-12);
}

TEST_F(PredictorTest, UntrainedRuleTiers)
{
    std::vector<TrainRecord> rows = {one("A", 85), one("B", 75), one("C", 70), one("D", 64), one("E", 95),
                                     one("F", 95)};
    rows[4].open_work_orders = 1;
    rows[5].cert_valid = false;
    const auto res = make().predict(rows);
    EXPECT_DOUBLE_EQ(res[0].probability, 0.9);
    EXPECT_DOUBLE_EQ(res[1].probability, 0.8);
    EXPECT_DOUBLE_EQ(res[2].probability, 0.7);
    EXPECT_DOUBLE_EQ(res[3].probability, 0.3);
    EXPECT_EQ(res[3].predicted_label, 0);
    EXPECT_DOUBLE_EQ(res[4].probability, 0.1);
    EXPECT_DOUBLE_EQ(res[5].probability, 0.1);
}

TEST_F(PredictorTest, UntrainedEmptyFleetIsEmptyAndDuplicatesAreRejected)
{
    Predictor p = make();
    EXPECT_TRUE(p.predict({}).empty());
    EXPECT_THROW(p.predict({one("A", 80), one("A", 81)}), InputError);
}

TEST_F(PredictorTest, SyntheticScoreRules)
{
    TrainAttributes t;
    t.fitness_score = 92; t.recent_delays = 0; t.days_since_maintenance = 3;
    EXPECT_DOUBLE_EQ(synthetic_induct_score(t), 1.0);
    t.open_work_orders = 1;
    EXPECT_NEAR(synthetic_induct_score(t), 0.5, 1e-12);
    t.open_work_orders = 0; t.cert_valid = false; t.fitness_score = 60;
    EXPECT_DOUBLE_EQ(synthetic_induct_score(t), 0.0);
}

TEST_F(PredictorTest, SyntheticLabelsFavourFitTrains)
{
    std::vector<TrainRecord> fit, unfit;
    for (int i = 0; i < 400; ++i) {
        fit.push_back(one("F" + std::to_string(i), 95));
        TrainRecord u = one("U" + std::to_string(i), 65);
        u.recent_delays = 5;
        unfit.push_back(u);
    }
    std::mt19937 rng(7);
    const auto yf = synthesize_labels(fit, rng);
    const auto yu = synthesize_labels(unfit, rng);
    const int nf = std::accumulate(yf.begin(), yf.end(), 0);
    const int nu = std::accumulate(yu.begin(), yu.end(), 0);
    EXPECT_GT(nf, 280);
    EXPECT_LT(nu, 100);
}

TEST_F(PredictorTest, TrainingNeedsTenSamplesAndTwoClasses)
{
    Predictor p = make();
    auto small = testing_fleet::labelled_fleet(60);
    small.resize(9);
    EXPECT_THROW(p.train(small), InsufficientDataError);
    EXPECT_THROW(p.train({}), InsufficientDataError);

    auto single = testing_fleet::labelled_fleet(20);
    for (auto& r : single) r.target_induct = 1;
    EXPECT_THROW(p.train(single), InsufficientDataError);
    EXPECT_FALSE(p.is_trained());
}

TEST_F(PredictorTest, PartiallyLabelledDataIsRejected)
{
    auto rows = testing_fleet::labelled_fleet(20);
    rows[3].target_induct.reset();
    Predictor p = make();
    EXPECT_THROW(p.train(rows), InputError);
}

TEST_F(PredictorTest, TrainsAndReports)
{
    Predictor p = make();
    std::mt19937 rng(1);
    const TrainingReport rep = p.train(testing_fleet::labelled_fleet(60), rng);

    EXPECT_TRUE(p.is_trained());
    EXPECT_FALSE(rep.labels_synthesized);
    EXPECT_TRUE(rep.stratified);
    EXPECT_EQ(rep.training_size + rep.test_size, 60u);
    long cm_total = rep.confusion[0][0] + rep.confusion[0][1] + rep.confusion[1][0] + rep.confusion[1][1];
    EXPECT_EQ(static_cast<std::size_t>(cm_total), rep.test_size);
    EXPECT_GE(rep.accuracy, 0.8);
    EXPECT_EQ(rep.cv_folds, 5);
    EXPECT_GE(rep.cv_mean, 0.6);
    ASSERT_FALSE(rep.feature_importance.empty());
    for (std::size_t i = 1; i < rep.feature_importance.size(); ++i)
        EXPECT_GE(rep.feature_importance[i - 1].second, rep.feature_importance[i].second);
    EXPECT_EQ(rep.per_class[0].support + rep.per_class[1].support, rep.test_size);
}

TEST_F(PredictorTest, TrainedPredictionHasConfidence)
{
    Predictor p = make();
    p.train(testing_fleet::labelled_fleet(60));
    auto fleet = testing_fleet::healthy_fleet(5);
    fleet[1].depot = "Muttom";
    const auto res = p.predict(fleet);
    ASSERT_EQ(res.size(), 5u);
    for (const auto& r : res) {
        EXPECT_GE(r.probability, 0.0);
        EXPECT_LE(r.probability, 1.0);
        EXPECT_EQ(r.predicted_label, r.probability > 0.5 ? 1 : 0);
        EXPECT_NEAR(r.confidence, std::fabs(r.probability - 0.5) * 2, 1e-12);
    }
    EXPECT_THROW(p.predict({}), InputError);
}

TEST_F(PredictorTest, FailedRetrainKeepsPreviousModel)
{
    Predictor p = make();
    p.train(testing_fleet::labelled_fleet(60));
    const auto fleet = testing_fleet::healthy_fleet(8);
    const auto before = p.predict(fleet);

    auto single = testing_fleet::labelled_fleet(30);
    for (auto& r : single) r.target_induct = 0;
    EXPECT_THROW(p.train(single), InsufficientDataError);

    ASSERT_TRUE(p.is_trained());
    const auto after = p.predict(fleet);
    for (std::size_t i = 0; i < fleet.size(); ++i)
        EXPECT_DOUBLE_EQ(before[i].probability, after[i].probability);
}

TEST_F(PredictorTest, PersistRestoreReproducesPredictions)
{
    Predictor p = make();
    p.train(testing_fleet::labelled_fleet(60));
    const auto fleet = testing_fleet::healthy_fleet(10);

    Predictor q = make("random_forest");
    q.restore(p.persist());
    EXPECT_TRUE(q.is_trained());
    EXPECT_EQ(q.model_type(), "decision_tree");

    const auto a = p.predict(fleet), b = q.predict(fleet);
    for (std::size_t i = 0; i < fleet.size(); ++i) EXPECT_DOUBLE_EQ(a[i].probability, b[i].probability);
}

TEST_F(PredictorTest, CorruptBlobLeavesUntrained)
{
    Predictor p = make();
    p.train(testing_fleet::labelled_fleet(60));
    const std::string good = p.persist();

    EXPECT_THROW(p.restore("{not json"), ModelLoadError);
    EXPECT_FALSE(p.is_trained());

    auto j = nlohmann::json::parse(good);
    j["scaler"]["mean"].erase(0);
    EXPECT_THROW(p.restore(j.dump()), ModelLoadError);
    EXPECT_FALSE(p.is_trained());

    j = nlohmann::json::parse(good);
    j["model_type"] = "svm";
    EXPECT_THROW(p.restore(j.dump()), ModelLoadError);

    // columns and scaler agree with each other but not with the model
    j = nlohmann::json::parse(good);
    j["feature_columns"].erase(j["feature_columns"].size() - 1);
    j["scaler"]["mean"].erase(j["scaler"]["mean"].size() - 1);
    j["scaler"]["scale"].erase(j["scaler"]["scale"].size() - 1);
    EXPECT_THROW(p.restore(j.dump()), ModelLoadError);
    EXPECT_FALSE(p.is_trained());

    EXPECT_NO_THROW(p.restore(good));
    EXPECT_TRUE(p.is_trained());
}

TEST_F(PredictorTest, PersistUntrainedIsInputError)
{
    EXPECT_THROW(make().persist(), InputError);
}

TEST_F(PredictorTest, BoosterRejectionIsInputErrorAndKeepsPreviousModel)
{
    Predictor p = make("lightgbm");
    p.train(testing_fleet::labelled_fleet(60));
    const std::string before = p.persist();

    TrainOpt bad = p.train_opt();
    bad.colsample = 1.5;  // LightGBM requires feature_fraction in (0, 1]
    Predictor q("lightgbm", bad, fopt_);
    EXPECT_THROW(q.train(testing_fleet::labelled_fleet(60)), InputError);
    EXPECT_FALSE(q.is_trained());

    ASSERT_NO_THROW(q.restore(before));
    EXPECT_THROW(q.train(testing_fleet::labelled_fleet(60)), InputError);
    EXPECT_TRUE(q.is_trained());
    EXPECT_EQ(nlohmann::json::parse(q.persist())["trained_at"], nlohmann::json::parse(before)["trained_at"]);
}

TEST_F(PredictorTest, SaveAndLoadModelFile)
{
    const std::string path = ::testing::TempDir() + "induct_model_test.json";
    std::remove(path.c_str());

    Predictor p = make();
    EXPECT_THROW(p.save_model(path), InputError);
    EXPECT_FALSE(p.load_model(path));

    p.train(testing_fleet::labelled_fleet(60));
    p.save_model(path);
    EXPECT_TRUE(file_exists(path));
    EXPECT_FALSE(file_exists(path + ".tmp"));

    Predictor q = make();
    EXPECT_TRUE(q.load_model(path));
    EXPECT_TRUE(q.is_trained());

    write_file_atomic(path, "garbage");
    EXPECT_FALSE(q.load_model(path));
    EXPECT_FALSE(q.is_trained());
    std::remove(path.c_str());
}

TEST_F(PredictorTest, RandomForestBackendTrains)
{
    Predictor p = make("random_forest");
    std::mt19937 rng(3);
    const TrainingReport rep = p.train(testing_fleet::labelled_fleet(60), rng);
    EXPECT_EQ(rep.model_type, "random_forest");
    EXPECT_GE(rep.accuracy, 0.6);
    const auto res = p.predict(testing_fleet::healthy_fleet(4));
    EXPECT_EQ(res.size(), 4u);

    Predictor q = make("decision_tree");
    q.restore(p.persist());
    const auto back = q.predict(testing_fleet::healthy_fleet(4));
    for (std::size_t i = 0; i < res.size(); ++i) EXPECT_NEAR(res[i].probability, back[i].probability, 1e-6);
}

TEST_F(PredictorTest, SyntheticLabelsAreUsedWithoutLabelColumn)
{
    auto rows = testing_fleet::labelled_fleet(60);
    for (auto& r : rows) r.target_induct.reset();
    Predictor p = make();
    std::mt19937 rng(11);
    const TrainingReport rep = p.train(rows, rng);
    EXPECT_TRUE(rep.labels_synthesized);
    EXPECT_TRUE(p.is_trained());
}
