#include <gtest/gtest.h>

#include <cstdio>

#include "induct/common.hpp"
#include "induct/errors.hpp"
#include "induct/planner_config.hpp"

using namespace induct;

TEST(PlannerConfig, DefaultsMatchThePlanningPolicy)
{
    const AppConfig c = parse_config(nlohmann::json::object());
    EXPECT_EQ(c.planner.target_inductions, 25);
    EXPECT_DOUBLE_EQ(c.planner.weights.shunting_cost, 0.30);
    EXPECT_EQ(c.planner.capacity_of("Aluva"), 12);
    EXPECT_EQ(c.planner.capacity_of("Kalamassery"), 5);
    EXPECT_EQ(c.planner.capacity_of("Elsewhere"), 10);
    EXPECT_DOUBLE_EQ(c.planner.solver_timeout_seconds, 60.0);
    EXPECT_EQ(c.model.model_type, "random_forest");
    EXPECT_EQ(c.model.train.trees, 100);
    EXPECT_EQ(c.model.train.cv_folds, 5);
    EXPECT_EQ(c.model.train.seed, 42u);
}

TEST(PlannerConfig, PartialOverridesKeepOtherDefaults)
{
    const auto j = nlohmann::json::parse(R"({
        "optimization": {"target_inductions": 18, "weights": {"mileage_balance": 0.5},
                         "depot_capacities": {"Muttom": 6}},
        "ml_model": {"model_type": "decision_tree", "max_depth": 6}
    })");
    const AppConfig c = parse_config(j);
    EXPECT_EQ(c.planner.target_inductions, 18);
    EXPECT_DOUBLE_EQ(c.planner.weights.mileage_balance, 0.5);
    EXPECT_DOUBLE_EQ(c.planner.weights.service_priority, 0.30);
    EXPECT_EQ(c.planner.capacity_of("Muttom"), 6);
    EXPECT_EQ(c.planner.capacity_of("Aluva"), 10);
    EXPECT_EQ(c.model.model_type, "decision_tree");
    EXPECT_EQ(c.model.train.max_depth, 6);
}

TEST(PlannerConfig, InvalidValuesAreInputErrors)
{
    EXPECT_THROW(parse_config(nlohmann::json::parse(R"({"optimization": {"mip_gap": 1.5}})")), InputError);
    EXPECT_THROW(parse_config(nlohmann::json::parse(R"({"optimization": {"solver_timeout": 0}})")), InputError);
    EXPECT_THROW(parse_config(nlohmann::json::parse(R"({"optimization": {"weights": {"shunting_cost": -1}}})")),
                 InputError);
    EXPECT_THROW(parse_config(nlohmann::json::parse(R"({"optimization": {"target_inductions": "many"}})")),
                 InputError);
    EXPECT_THROW(parse_config(nlohmann::json::parse(R"({"ml_model": {"model_type": "svm"}})")), InputError);
    EXPECT_THROW(parse_config(nlohmann::json::array()), InputError);
}

TEST(PlannerConfig, LoadFromFile)
{
    const std::string path = ::testing::TempDir() + "induct_config_test.json";
    write_file_atomic(path, R"({"optimization": {"solver": "SCIP"}})");
    EXPECT_EQ(load_config(path).planner.solver_backend, "SCIP");

    write_file_atomic(path, "{ broken");
    EXPECT_THROW(load_config(path), InputError);
    std::remove(path.c_str());
    EXPECT_THROW(load_config(path), InputError);
}
