/************************************************************************
 * main.cpp  –  induct_plan: one planning cycle from the command line
 *
 *   induct_plan --fleet=fleet.csv [--config=planner.json]
 *               [--model=random_forest|lightgbm|decision_tree]
 *               [--model_path=models/induction_model.json]
 *               [--train] [--seed=N] [--target=T]
 *               [--override=ID:0|1[:reason]] ...  [--out=plan.json] [--quiet]
 ************************************************************************/
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "induct/common.hpp"
#include "induct/errors.hpp"
#include "induct/fleet_csv.hpp"
#include "induct/planner_config.hpp"
#include "induct/planning_session.hpp"

using namespace induct;

struct OverrideArg {
    std::string id;
    int         decision = 0;
    std::string reason;
};

static OverrideArg parse_override(const std::string& s)
{
    const auto p1 = s.find(':');
    if (p1 == std::string::npos) throw InputError("--override expects ID:0|1[:reason]");
    const auto p2 = s.find(':', p1 + 1);
    OverrideArg o;
    o.id = s.substr(0, p1);
    const std::string d = s.substr(p1 + 1, p2 == std::string::npos ? std::string::npos : p2 - p1 - 1);
    if (d != "0" && d != "1") throw InputError("override decision must be 0 or 1, got '" + d + "'");
    o.decision = d == "1";
    if (p2 != std::string::npos) o.reason = s.substr(p2 + 1);
    return o;
}

static void usage()
{
    std::cerr << "usage: induct_plan --fleet=<csv> [--config=<json>] [--model=<type>]\n"
                 "                   [--model_path=<file>] [--train] [--seed=<n>] [--target=<T>]\n"
                 "                   [--override=ID:0|1[:reason]]... [--out=<json>] [--quiet]\n";
}

int main(int argc, char* argv[])
{
    /* ========== 1. CLI and defaults ========================= */
    std::string fleet_path, config_path, out_path, model_type, model_path;
    bool do_train = false, have_seed = false;
    int  target   = -1;
    uint32_t seed = 0;
    std::vector<OverrideArg> overrides;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a(argv[i]);
            if      (a == "--train")                      do_train    = true;
            else if (a == "--quiet")                      set_log_level(LogLevel::kWarn);
            else if (a == "--help" || a == "-h")          { usage(); return 0; }
            else if (a.rfind("--fleet=", 0) == 0)         fleet_path  = a.substr(8);
            else if (a.rfind("--config=", 0) == 0)        config_path = a.substr(9);
            else if (a.rfind("--model=", 0) == 0)         model_type  = a.substr(8);
            else if (a.rfind("--model_path=", 0) == 0)    model_path  = a.substr(13);
            else if (a.rfind("--target=", 0) == 0)        target      = std::stoi(a.substr(9));
            else if (a.rfind("--seed=", 0) == 0)          { seed = static_cast<uint32_t>(std::stoul(a.substr(7))); have_seed = true; }
            else if (a.rfind("--override=", 0) == 0)      overrides.push_back(parse_override(a.substr(11)));
            else if (a.rfind("--out=", 0) == 0)           out_path    = a.substr(6);
            else { logE("unknown option " + a); usage(); return 2; }
        }
    } catch (const std::exception& e) {
        logE(std::string("bad argument: ") + e.what());
        return 2;
    }
    if (fleet_path.empty()) { usage(); return 2; }

    try {
        /* ========== 2. config + model =========================== */
        AppConfig cfg = config_path.empty() ? AppConfig{} : load_config(config_path);
        if (!model_type.empty()) cfg.model.model_type = model_type;
        if (!model_path.empty()) cfg.model.model_path = model_path;
        if (target >= 0)         cfg.planner.target_inductions = target;
        validate(cfg.model);

        std::vector<TrainRecord> fleet = load_fleet_csv(fleet_path);

        Predictor predictor(cfg.model.model_type, cfg.model.train);
        if (do_train) {
            std::mt19937 rng(have_seed ? seed : std::random_device{}());
            try {
                TrainingReport rep = predictor.train(fleet, rng);
                std::cerr << rep.to_json().dump(2) << '\n';
                predictor.save_model(cfg.model.model_path);
            } catch (const InsufficientDataError& e) {
                logW(std::string(e.what()) + "; continuing with rule-based scores");
            }
        } else {
            if (!predictor.load_model(cfg.model.model_path))
                logI("no trained model; planning with rule-based scores");
        }

        /* ========== 3. plan + overrides ========================= */
        PlanningSession session(predictor, InductionOptimizer(cfg.planner));
        session.plan(fleet, cfg.planner.target_inductions);
        for (const auto& o : overrides) {
            try {
                session.override_decision(o.id, o.decision, o.reason);
            } catch (const OverrideNotFoundError& e) {
                logW(e.what());
            }
        }

        /* ========== 4. output =================================== */
        nlohmann::json j;
        j["outcome"] = outcome_to_json(session.outcome());
        j["ranking"] = ranking_to_json(session.ranking());
        j["status"]  = session.system_status();

        if (out_path.empty()) {
            std::cout << j.dump(2) << '\n';
        } else {
            write_file_atomic(out_path, j.dump(2));
            logI("plan written to " + out_path);
        }
    } catch (const Error& e) {
        logE(e.what());
        return 1;
    }
    return 0;
}
