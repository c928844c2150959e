/*───────────────────────────────────────────────────────────
 *  optimizer.hpp   –  binary integer program over the fleet
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "induct/planner_config.hpp"
#include "induct/predictor.hpp"
#include "induct/train_record.hpp"

namespace induct {

constexpr const char* kOverrideMarker = "Manual override by operator";

enum class SolveStatus {
    kOptimal,
    kFeasible,       // stopped with an incumbent but without an optimality proof
    kInfeasible,
    kNotSolved,      // time limit without any incumbent
    kError,
};

enum class DecisionSource { kOptimizer, kPredictorFallback };

const char* to_string(SolveStatus s);
const char* to_string(DecisionSource s);

struct Decision {
    int         induct = 0;
    std::string reasoning;
    bool        manual_override = false;
};

struct ManualOverride {
    int         decision = 0;
    std::string reason;
};

struct OutcomeSummary {
    int total_trains   = 0;
    int trains_inducted = 0;
    int trains_held    = 0;
    std::vector<std::string> inducted_trains;    // input order
    std::vector<std::string> held_trains;
    double avg_fitness_inducted = 0.0;
    double avg_fitness_held     = 0.0;
    double avg_mileage_inducted = 0.0;
    double avg_mileage_held     = 0.0;
    std::map<std::string, int> depot_distribution;   // inducted per depot
    int manual_overrides_applied = 0;
};

struct OptimizationOutcome {
    SolveStatus             status = SolveStatus::kError;
    DecisionSource          source = DecisionSource::kOptimizer;
    std::optional<double>   objective_value;
    int                     target_inductions = 0;
    std::string             solver_message;
    std::vector<std::string>        train_order;   // input order
    std::map<std::string, Decision> decisions;
    OutcomeSummary          summary;

    bool used_fallback() const { return source == DecisionSource::kPredictorFallback; }
};

/* recomputed from the full decision map every time */
OutcomeSummary summarize(const std::vector<TrainAttributes>& fleet,
                         const std::map<std::string, Decision>& decisions);

std::string build_reasoning(const TrainAttributes& t, int decision, double probability);

/* pandas-style quantile with linear interpolation; q in [0,1] */
double linear_quantile(std::vector<double> v, double q);

nlohmann::json outcome_to_json(const OptimizationOutcome& o);

class InductionOptimizer {
public:
    explicit InductionOptimizer(PlannerConfig cfg = {});

    OptimizationOutcome optimize(const std::vector<TrainRecord>& records,
                                 const std::vector<PredictionResult>& predictions,
                                 int target_inductions) const;
    OptimizationOutcome optimize(const std::vector<TrainRecord>& records,
                                 const std::vector<PredictionResult>& predictions) const;

    /* ids absent from the decision map are skipped (logged) */
    void apply_manual_overrides(OptimizationOutcome& outcome,
                                const std::vector<TrainRecord>& records,
                                const std::map<std::string, ManualOverride>& overrides) const;

    const PlannerConfig& config() const { return cfg_; }

private:
    struct Candidate {
        TrainAttributes attr;
        double probability = 0.5;
        int    label       = 0;
        int    depot_pos   = 0;       // 0-based, stable input order
        bool   excluded    = false;
    };

    std::vector<Candidate> candidates(const std::vector<TrainAttributes>& fleet,
                                      const std::vector<PredictionResult>& preds) const;
    std::vector<int> fallback_decisions(const std::vector<Candidate>& c) const;

    PlannerConfig cfg_;
};

} // namespace induct
