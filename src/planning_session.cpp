#include "induct/planning_session.hpp"

#include "induct/common.hpp"
#include "induct/errors.hpp"

namespace induct {

PlanningSession::PlanningSession(Predictor& predictor, InductionOptimizer optimizer)
    : predictor_(predictor), optimizer_(std::move(optimizer)) {}

const OptimizationOutcome& PlanningSession::plan(std::vector<TrainRecord> records)
{
    return plan(std::move(records), optimizer_.config().target_inductions);
}

const OptimizationOutcome& PlanningSession::plan(std::vector<TrainRecord> records, int target_inductions)
{
    if (records.empty()) throw InputError("planning cycle received an empty fleet");

    /* build everything first; the session only changes once it all worked */
    std::vector<PredictionResult> preds = predictor_.predict(records);
    OptimizationOutcome out = optimizer_.optimize(records, preds, target_inductions);

    records_     = std::move(records);
    predictions_ = std::move(preds);
    outcome_     = std::move(out);
    target_      = target_inductions;
    overrides_.clear();
    planned_     = true;

    logI("planned " + std::to_string(outcome_.summary.total_trains) + " trains: " +
         std::to_string(outcome_.summary.trains_inducted) + " inducted via " + to_string(outcome_.source));
    return outcome_;
}

void PlanningSession::override_decision(const std::string& train_id, int decision,
                                        const std::string& reason)
{
    if (!planned_ || !outcome_.decisions.count(train_id)) throw OverrideNotFoundError(train_id);
    if (decision != 0 && decision != 1) throw InputError("override decision must be 0 or 1");

    ManualOverride ov{decision, reason};
    optimizer_.apply_manual_overrides(outcome_, records_, {{train_id, ov}});
    overrides_[train_id] = std::move(ov);
    logI("override " + train_id + " -> " + (decision ? "induct" : "hold"));
}

void PlanningSession::clear_overrides()
{
    if (!planned_) return;
    outcome_ = optimizer_.optimize(records_, predictions_, target_);
    overrides_.clear();
}

const OptimizationOutcome& PlanningSession::outcome() const
{
    if (!planned_) throw Error("no planning cycle has run yet");
    return outcome_;
}

std::vector<RankedDecision> PlanningSession::ranking() const
{
    return assemble_ranking(outcome(), records_);
}

nlohmann::json PlanningSession::system_status() const
{
    return {{"total_trains", planned_ ? outcome_.summary.total_trains : 0},
            {"trains_inducted", planned_ ? outcome_.summary.trains_inducted : 0},
            {"manual_overrides", overrides_.size()},
            {"decision_source", planned_ ? to_string(outcome_.source) : "none"},
            {"model_trained", predictor_.is_trained()},
            {"model_type", predictor_.model_type()}};
}

} // namespace induct
