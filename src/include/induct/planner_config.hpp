/*───────────────────────────────────────────────────────────
 *  planner_config.hpp   –  optimizer + model settings
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "induct/model_iface.hpp"

namespace induct {

struct ObjectiveWeights {
    double service_priority = 0.30;
    double mileage_balance  = 0.25;
    double shunting_cost    = 0.30;    // subtracted
    double depot_efficiency = 0.15;
};

struct PlannerConfig {
    ObjectiveWeights weights;
    std::map<std::string, int> depot_capacity = {
        {"Aluva", 12}, {"Palarivattom", 8}, {"Kalamassery", 5}};
    int    default_depot_capacity = 10;

    int    target_inductions      = 25;
    double min_induction_fitness  = 60.0;

    std::string solver_backend          = "CBC";
    double      solver_timeout_seconds  = 60.0;
    double      mip_gap                 = 0.01;

    int capacity_of(const std::string& depot) const;
};

struct ModelConfig {
    std::string model_type = "random_forest";
    std::string model_path = "models/induction_model.json";
    TrainOpt    train;
};

struct AppConfig {
    PlannerConfig planner;
    ModelConfig   model;
};

/* every key optional; InputError on malformed or out-of-range values */
AppConfig parse_config(const nlohmann::json& j);
AppConfig load_config(const std::string& path);
nlohmann::json config_to_json(const AppConfig& cfg);

void validate(const PlannerConfig& cfg);
void validate(const ModelConfig& cfg);

} // namespace induct
