/*───────────────────────────────────────────────────────────
 *  planning_session.hpp   –  state of one planning cycle
 *
 *  Holds the records, predictions, outcome and overrides that the
 *  API layer used to keep in globals.  Not thread-safe; one session
 *  per fleet per thread.
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "induct/decision_assembler.hpp"
#include "induct/optimizer.hpp"
#include "induct/predictor.hpp"

namespace induct {

class PlanningSession {
public:
    PlanningSession(Predictor& predictor, InductionOptimizer optimizer);

    /* predict + optimize; drops any overrides of the previous cycle */
    const OptimizationOutcome& plan(std::vector<TrainRecord> records, int target_inductions);
    const OptimizationOutcome& plan(std::vector<TrainRecord> records);

    /* OverrideNotFoundError / InputError leave everything untouched */
    void override_decision(const std::string& train_id, int decision,
                           const std::string& reason = "");

    /* fresh optimizer run over the stored records and predictions */
    void clear_overrides();

    bool has_plan() const { return planned_; }
    const OptimizationOutcome& outcome() const;
    const std::vector<TrainRecord>& records() const { return records_; }
    const std::vector<PredictionResult>& predictions() const { return predictions_; }
    const std::map<std::string, ManualOverride>& overrides() const { return overrides_; }

    std::vector<RankedDecision> ranking() const;
    nlohmann::json system_status() const;

private:
    Predictor&                            predictor_;
    InductionOptimizer                    optimizer_;
    std::vector<TrainRecord>              records_;
    std::vector<PredictionResult>         predictions_;
    std::map<std::string, ManualOverride> overrides_;
    OptimizationOutcome                   outcome_;
    int                                   target_ = 0;
    bool                                  planned_ = false;
};

} // namespace induct
