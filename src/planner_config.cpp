#include "induct/planner_config.hpp"

#include "induct/common.hpp"
#include "induct/errors.hpp"

namespace induct {

int PlannerConfig::capacity_of(const std::string& depot) const
{
    auto it = depot_capacity.find(depot);
    return it == depot_capacity.end() ? default_depot_capacity : it->second;
}

void validate(const PlannerConfig& c)
{
    const auto& w = c.weights;
    if (w.service_priority < 0 || w.mileage_balance < 0 || w.shunting_cost < 0 || w.depot_efficiency < 0)
        throw InputError("objective weights must be non-negative");
    for (const auto& kv : c.depot_capacity)
        if (kv.second < 0) throw InputError("negative capacity for depot " + kv.first);
    if (c.default_depot_capacity < 0) throw InputError("negative default depot capacity");
    if (c.target_inductions < 0) throw InputError("target_inductions must be >= 0");
    if (!(c.solver_timeout_seconds > 0)) throw InputError("solver_timeout must be positive");
    if (!(c.mip_gap >= 0 && c.mip_gap < 1)) throw InputError("mip_gap must lie in [0,1)");
    if (c.solver_backend.empty()) throw InputError("solver backend is empty");
}

void validate(const ModelConfig& c)
{
    if (!is_known_model_type(c.model_type)) throw InputError("unknown model_type '" + c.model_type + "'");
    const TrainOpt& o = c.train;
    if (o.trees < 1 || o.max_depth < 1) throw InputError("n_estimators and max_depth must be >= 1");
    if (o.min_samples_split < 2 || o.min_samples_leaf < 1)
        throw InputError("min_samples_split must be >= 2 and min_samples_leaf >= 1");
    if (!(o.test_ratio > 0 && o.test_ratio < 1)) throw InputError("test_size must lie in (0,1)");
    if (o.cv_folds < 2) throw InputError("cross_validation_folds must be >= 2");
}

/* reads j[key] into dst when present; type errors become InputError */
template <typename T>
static void opt_get(const nlohmann::json& j, const char* key, T& dst)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        dst = it->get<T>();
    } catch (const nlohmann::json::exception&) {
        throw InputError(std::string("config key '") + key + "' has the wrong type");
    }
}

AppConfig parse_config(const nlohmann::json& j)
{
    if (!j.is_object()) throw InputError("config root must be an object");
    AppConfig cfg;

    /* ── optimization ── */
    if (j.contains("optimization")) {
        const auto& o = j.at("optimization");
        PlannerConfig& p = cfg.planner;
        opt_get(o, "target_inductions", p.target_inductions);
        opt_get(o, "min_fitness_score", p.min_induction_fitness);
        opt_get(o, "solver", p.solver_backend);
        opt_get(o, "solver_timeout", p.solver_timeout_seconds);
        opt_get(o, "mip_gap", p.mip_gap);
        opt_get(o, "default_depot_capacity", p.default_depot_capacity);
        if (o.contains("weights")) {
            const auto& w = o.at("weights");
            opt_get(w, "service_priority", p.weights.service_priority);
            opt_get(w, "mileage_balance", p.weights.mileage_balance);
            opt_get(w, "shunting_cost", p.weights.shunting_cost);
            opt_get(w, "depot_efficiency", p.weights.depot_efficiency);
        }
        if (o.contains("depot_capacities")) {
            std::map<std::string, int> caps;
            opt_get(o, "depot_capacities", caps);
            p.depot_capacity = std::move(caps);
        }
    }

    /* ── ml_model ── */
    if (j.contains("ml_model")) {
        const auto& m = j.at("ml_model");
        ModelConfig& mc = cfg.model;
        opt_get(m, "model_type", mc.model_type);
        opt_get(m, "model_path", mc.model_path);
        opt_get(m, "n_estimators", mc.train.trees);
        opt_get(m, "max_depth", mc.train.max_depth);
        opt_get(m, "min_samples_split", mc.train.min_samples_split);
        opt_get(m, "min_samples_leaf", mc.train.min_samples_leaf);
        opt_get(m, "learning_rate", mc.train.lr);
        opt_get(m, "test_size", mc.train.test_ratio);
        opt_get(m, "cross_validation_folds", mc.train.cv_folds);
        opt_get(m, "random_state", mc.train.seed);
    }

    validate(cfg.planner);
    validate(cfg.model);
    return cfg;
}

AppConfig load_config(const std::string& path)
{
    std::string text;
    try {
        text = read_file(path);
    } catch (const Error& e) {
        throw InputError(e.what());
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw InputError("config " + path + ": " + e.what());
    }
    AppConfig cfg = parse_config(j);
    logI("config loaded from " + path);
    return cfg;
}

nlohmann::json config_to_json(const AppConfig& cfg)
{
    const PlannerConfig& p = cfg.planner;
    const ModelConfig&   m = cfg.model;
    return {
        {"optimization",
         {{"target_inductions", p.target_inductions},
          {"min_fitness_score", p.min_induction_fitness},
          {"solver", p.solver_backend},
          {"solver_timeout", p.solver_timeout_seconds},
          {"mip_gap", p.mip_gap},
          {"default_depot_capacity", p.default_depot_capacity},
          {"depot_capacities", p.depot_capacity},
          {"weights",
           {{"service_priority", p.weights.service_priority},
            {"mileage_balance", p.weights.mileage_balance},
            {"shunting_cost", p.weights.shunting_cost},
            {"depot_efficiency", p.weights.depot_efficiency}}}}},
        {"ml_model",
         {{"model_type", m.model_type},
          {"model_path", m.model_path},
          {"n_estimators", m.train.trees},
          {"max_depth", m.train.max_depth},
          {"min_samples_split", m.train.min_samples_split},
          {"min_samples_leaf", m.train.min_samples_leaf},
          {"learning_rate", m.train.lr},
          {"test_size", m.train.test_ratio},
          {"cross_validation_folds", m.train.cv_folds},
          {"random_state", m.train.seed}}}};
}

} // namespace induct
