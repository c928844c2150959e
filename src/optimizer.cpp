/*──────────────────────────────────────────────────────────────────────
 *  optimizer.cpp  –  induction selection as a 0/1 program (OR-tools)
 *
 *  max  Σ x_i · ( w_s·service_i + w_m·mileage_i − w_c·shunt_i + w_d·depot_i )
 *  s.t. max(1,T−10) ≤ Σ x_i ≤ T+10
 *       x_i = 0                      for excluded trains
 *       Σ_{i∈depot d} x_i ≤ cap_d
 *       Σ_{i∈high mileage} x_i ≤ ⌊0.4T⌋
 *       Σ_{i∈good OTP} x_i ≥ ⌊0.6T⌋     (only if |good OTP| ≥ 0.6T)
 *
 *  Anything but OPTIMAL falls back to the predictor's labels.
 *─────────────────────────────────────────────────────────────────────*/
#include "induct/optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <numeric>
#include <unordered_map>

#include "absl/time/time.h"
#include "ortools/linear_solver/linear_solver.h"

#include "induct/common.hpp"
#include "induct/errors.hpp"

namespace induct {

using operations_research::MPConstraint;
using operations_research::MPObjective;
using operations_research::MPSolver;
using operations_research::MPSolverParameters;
using operations_research::MPVariable;

namespace {
constexpr double kHighMileageQuantile = 0.8;
constexpr double kHighMileageShare    = 0.4;
constexpr double kGoodOtpThreshold    = 90.0;
constexpr double kGoodOtpShare        = 0.6;
constexpr int    kTargetSlack         = 10;
}

const char* to_string(SolveStatus s)
{
    switch (s) {
    case SolveStatus::kOptimal:    return "optimal";
    case SolveStatus::kFeasible:   return "feasible";
    case SolveStatus::kInfeasible: return "infeasible";
    case SolveStatus::kNotSolved:  return "not_solved";
    case SolveStatus::kError:      return "error";
    }
    return "error";
}

const char* to_string(DecisionSource s)
{
    return s == DecisionSource::kOptimizer ? "optimizer" : "predictor_fallback";
}

double linear_quantile(std::vector<double> v, double q)
{
    if (v.empty()) return 0.0;
    std::sort(v.begin(), v.end());
    const double h  = (static_cast<double>(v.size()) - 1.0) * clamp_val(q, 0.0, 1.0);
    const auto   lo = static_cast<std::size_t>(std::floor(h));
    const std::size_t hi = std::min(lo + 1, v.size() - 1);
    return v[lo] + (h - static_cast<double>(lo)) * (v[hi] - v[lo]);
}

/* ───────────── reasoning ───────────── */
std::string build_reasoning(const TrainAttributes& t, int decision, double p)
{
    std::vector<std::string> why;
    if (decision == 1) {
        if (t.fitness_score >= 85) why.push_back("High fitness score (" + fmt_fixed(t.fitness_score, 1) + ")");
        if (t.open_work_orders == 0) why.push_back("No open work orders");
        if (t.cert_valid) why.push_back("Valid fitness certificate");
        if (t.recent_delays == 0) why.push_back("No recent service delays");
        if (p > 0.7) why.push_back("ML model recommends induction (" + fmt_fixed(p, 2) + " confidence)");
    } else {
        if (t.open_work_orders > 0) why.push_back("Open work orders (" + std::to_string(t.open_work_orders) + ")");
        if (!t.cert_valid) why.push_back("Invalid/expired fitness certificate");
        if (t.fitness_score < 70) why.push_back("Low fitness score (" + fmt_fixed(t.fitness_score, 1) + ")");
        if (t.recent_delays > 2) why.push_back("Multiple recent delays (" + std::to_string(t.recent_delays) + ")");
        if (t.mechanical_issues > 0) why.push_back("Mechanical issues (" + std::to_string(t.mechanical_issues) + ")");
        if (p < 0.3) why.push_back("ML model recommends holding (" + fmt_fixed(p, 2) + " confidence)");
    }

    std::string s = decision == 1 ? "Inducted: " : "Held: ";
    if (why.empty()) return s + "Residual optimization choice";
    for (std::size_t i = 0; i < why.size(); ++i) s += (i ? ", " : "") + why[i];
    return s;
}

/* ───────────── summary ───────────── */
OutcomeSummary summarize(const std::vector<TrainAttributes>& fleet,
                         const std::map<std::string, Decision>& decisions)
{
    OutcomeSummary s;
    double fit_in = 0, fit_out = 0, mil_in = 0, mil_out = 0;
    for (const auto& t : fleet) {
        auto it = decisions.find(t.train_id);
        if (it == decisions.end()) continue;
        ++s.total_trains;
        if (it->second.manual_override) ++s.manual_overrides_applied;
        if (it->second.induct == 1) {
            s.inducted_trains.push_back(t.train_id);
            fit_in += t.fitness_score;
            mil_in += t.mileage;
            ++s.depot_distribution[t.depot];
        } else {
            s.held_trains.push_back(t.train_id);
            fit_out += t.fitness_score;
            mil_out += t.mileage;
        }
    }
    s.trains_inducted = static_cast<int>(s.inducted_trains.size());
    s.trains_held     = static_cast<int>(s.held_trains.size());
    if (s.trains_inducted) {
        s.avg_fitness_inducted = fit_in / s.trains_inducted;
        s.avg_mileage_inducted = mil_in / s.trains_inducted;
    }
    if (s.trains_held) {
        s.avg_fitness_held = fit_out / s.trains_held;
        s.avg_mileage_held = mil_out / s.trains_held;
    }
    return s;
}

/* ───────────── optimizer ───────────── */
InductionOptimizer::InductionOptimizer(PlannerConfig cfg) : cfg_(std::move(cfg))
{
    validate(cfg_);
}

std::vector<InductionOptimizer::Candidate>
InductionOptimizer::candidates(const std::vector<TrainAttributes>& fleet,
                               const std::vector<PredictionResult>& preds) const
{
    std::unordered_map<std::string, const PredictionResult*> by_id;
    for (const auto& p : preds) by_id[p.train_id] = &p;

    std::unordered_map<std::string, int> depot_seen;
    std::vector<Candidate> out;
    out.reserve(fleet.size());
    for (const auto& t : fleet) {
        Candidate c;
        c.attr = t;
        auto it = by_id.find(t.train_id);
        if (it != by_id.end()) {
            c.probability = clamp_val(it->second->probability, 0.0, 1.0);
            c.label       = it->second->predicted_label;
        }
        c.depot_pos = depot_seen[t.depot]++;
        c.excluded  = is_excluded(t, cfg_.min_induction_fitness);
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<int> InductionOptimizer::fallback_decisions(const std::vector<Candidate>& c) const
{
    std::vector<int> x(c.size(), 0);
    std::map<std::string, std::vector<std::size_t>> per_depot;
    for (std::size_t i = 0; i < c.size(); ++i) {
        if (c[i].label == 1 && !c[i].excluded) {
            x[i] = 1;
            per_depot[c[i].attr.depot].push_back(i);
        }
    }
    /* over capacity: keep the most probable, input order on ties */
    for (auto& kv : per_depot) {
        auto& v = kv.second;
        const std::size_t cap = static_cast<std::size_t>(cfg_.capacity_of(kv.first));
        if (v.size() <= cap) continue;
        std::stable_sort(v.begin(), v.end(),
                         [&](std::size_t a, std::size_t b) { return c[a].probability > c[b].probability; });
        for (std::size_t k = cap; k < v.size(); ++k) x[v[k]] = 0;
    }
    return x;
}

OptimizationOutcome InductionOptimizer::optimize(const std::vector<TrainRecord>& records,
                                                 const std::vector<PredictionResult>& predictions) const
{
    return optimize(records, predictions, cfg_.target_inductions);
}

OptimizationOutcome InductionOptimizer::optimize(const std::vector<TrainRecord>& records,
                                                 const std::vector<PredictionResult>& predictions,
                                                 int T) const
{
    if (records.empty()) throw InputError("cannot optimize an empty fleet");
    if (T < 0) throw InputError("target inductions must be >= 0");
    validate_identifiers(records);

    const std::vector<TrainAttributes> fleet = resolve_all(records);
    const std::vector<Candidate> cand = candidates(fleet, predictions);
    const std::size_t n = cand.size();

    OptimizationOutcome out;
    out.target_inductions = T;
    for (const auto& t : fleet) out.train_order.push_back(t.train_id);

    std::vector<int> x(n, 0);
    bool solved = false;

    try {
        std::unique_ptr<MPSolver> solver(MPSolver::CreateSolver(cfg_.solver_backend));
        if (!solver) {
            out.status = SolveStatus::kError;
            out.solver_message = "solver backend '" + cfg_.solver_backend + "' unavailable";
        } else {
            const double inf = solver->infinity();

            /* ---------- variables + objective ---------- */
            double mean_mileage = 0.0;
            for (const auto& c : cand) mean_mileage += c.attr.mileage;
            mean_mileage /= static_cast<double>(n);

            const ObjectiveWeights& w = cfg_.weights;
            MPObjective* obj = solver->MutableObjective();
            std::vector<MPVariable*> xv(n);
            for (std::size_t i = 0; i < n; ++i) {
                const TrainAttributes& t = cand[i].attr;
                xv[i] = solver->MakeBoolVar("x_" + std::to_string(i));
                if (cand[i].excluded) xv[i]->SetUB(0.0);

                const double service = 0.4 * (100.0 * cand[i].probability) + 0.3 * t.fitness_score
                                     + 0.2 * std::max(0.0, 100.0 - static_cast<double>(t.branding_hours))
                                     + 0.1 * t.on_time_performance;
                const double mileage = std::max(0.0, mean_mileage - t.mileage) / 1000.0;
                const double shunt   = 5.0 * cand[i].depot_pos;
                const double cap     = cfg_.capacity_of(t.depot);
                const double depot   = 2.0 * std::max(0.0, std::floor(0.8 * cap) - (cand[i].depot_pos + 1));

                obj->SetCoefficient(xv[i], w.service_priority * service + w.mileage_balance * mileage
                                               - w.shunting_cost * shunt + w.depot_efficiency * depot);
            }
            obj->SetMaximization();

            /* 1. total inductions */
            MPConstraint* total = solver->MakeRowConstraint(std::max(1, T - kTargetSlack), T + kTargetSlack, "total");
            for (auto* v : xv) total->SetCoefficient(v, 1.0);

            /* 3. depot capacity */
            std::map<std::string, MPConstraint*> depot_rows;
            for (std::size_t i = 0; i < n; ++i) {
                const std::string& d = cand[i].attr.depot;
                auto it = depot_rows.find(d);
                if (it == depot_rows.end())
                    it = depot_rows.emplace(d, solver->MakeRowConstraint(-inf, cfg_.capacity_of(d), "cap_" + d)).first;
                it->second->SetCoefficient(xv[i], 1.0);
            }

            /* 4. high-mileage quintile */
            std::vector<double> miles;
            for (const auto& c : cand) miles.push_back(c.attr.mileage);
            const double mthr = linear_quantile(miles, kHighMileageQuantile);
            MPConstraint* high = solver->MakeRowConstraint(-inf, std::floor(kHighMileageShare * T), "high_mileage");
            for (std::size_t i = 0; i < n; ++i)
                if (cand[i].attr.mileage > mthr) high->SetCoefficient(xv[i], 1.0);

            /* 5. on-time performance floor */
            std::size_t good = 0;
            for (const auto& c : cand) good += c.attr.on_time_performance >= kGoodOtpThreshold;
            if (static_cast<double>(good) >= kGoodOtpShare * T) {
                MPConstraint* otp = solver->MakeRowConstraint(std::floor(kGoodOtpShare * T), inf, "good_otp");
                for (std::size_t i = 0; i < n; ++i)
                    if (cand[i].attr.on_time_performance >= kGoodOtpThreshold) otp->SetCoefficient(xv[i], 1.0);
            }

            /* ---------- solve ---------- */
            solver->SetTimeLimit(absl::Milliseconds(static_cast<int64_t>(cfg_.solver_timeout_seconds * 1000.0)));
            MPSolverParameters params;
            params.SetDoubleParam(MPSolverParameters::RELATIVE_MIP_GAP, cfg_.mip_gap);

            const MPSolver::ResultStatus rs = solver->Solve(params);
            switch (rs) {
            case MPSolver::OPTIMAL:    out.status = SolveStatus::kOptimal;    break;
            case MPSolver::FEASIBLE:   out.status = SolveStatus::kFeasible;   break;
            case MPSolver::INFEASIBLE: out.status = SolveStatus::kInfeasible; break;
            case MPSolver::NOT_SOLVED: out.status = SolveStatus::kNotSolved;  break;
            default:                   out.status = SolveStatus::kError;      break;
            }
            out.solver_message = std::string("solver returned ") + to_string(out.status);

            if (out.status == SolveStatus::kOptimal) {
                for (std::size_t i = 0; i < n; ++i) x[i] = xv[i]->solution_value() > 0.5 ? 1 : 0;
                out.objective_value = obj->Value();
                solved = true;
            }
        }
    } catch (const std::exception& e) {
        out.status = SolveStatus::kError;
        out.solver_message = std::string("solver failure: ") + e.what();
    }

    if (solved) {
        out.source = DecisionSource::kOptimizer;
        logI("optimizer: optimal, objective=" + fmt_fixed(*out.objective_value, 2));
    } else {
        out.source = DecisionSource::kPredictorFallback;
        x = fallback_decisions(cand);
        logW("optimizer " + std::string(to_string(out.status)) + " (" + out.solver_message +
             "); using predictor labels");
    }

    for (std::size_t i = 0; i < n; ++i) {
        Decision d;
        d.induct    = x[i];
        d.reasoning = build_reasoning(cand[i].attr, x[i], cand[i].probability);
        out.decisions[cand[i].attr.train_id] = std::move(d);
    }
    out.summary = summarize(fleet, out.decisions);
    return out;
}

void InductionOptimizer::apply_manual_overrides(OptimizationOutcome& outcome,
                                                const std::vector<TrainRecord>& records,
                                                const std::map<std::string, ManualOverride>& overrides) const
{
    for (const auto& kv : overrides)
        if (kv.second.decision != 0 && kv.second.decision != 1)
            throw InputError("override for " + kv.first + " must be 0 or 1");

    for (const auto& kv : overrides) {
        auto it = outcome.decisions.find(kv.first);
        if (it == outcome.decisions.end()) {
            logW("override for unknown train " + kv.first + " skipped");
            continue;
        }
        Decision& d = it->second;
        if (d.induct != kv.second.decision) {
            d.induct = kv.second.decision;
            d.reasoning = std::string(d.induct ? "Inducted: " : "Held: ") + kOverrideMarker;
            if (!kv.second.reason.empty()) d.reasoning += " (" + kv.second.reason + ")";
        }
        d.manual_override = true;
    }
    outcome.summary = summarize(resolve_all(records), outcome.decisions);
}

/* ───────────── json ───────────── */
nlohmann::json outcome_to_json(const OptimizationOutcome& o)
{
    nlohmann::json dec = nlohmann::json::object(), why = nlohmann::json::object();
    for (const auto& id : o.train_order) {
        auto it = o.decisions.find(id);
        if (it == o.decisions.end()) continue;
        dec[id] = it->second.induct;
        why[id] = it->second.reasoning;
    }
    const OutcomeSummary& s = o.summary;
    nlohmann::json j = {
        {"status", to_string(o.status)},
        {"decision_source", to_string(o.source)},
        {"solver_message", o.solver_message},
        {"target_inductions", o.target_inductions},
        {"decisions", dec},
        {"reasoning", why},
        {"summary",
         {{"total_trains", s.total_trains},
          {"trains_inducted", s.trains_inducted},
          {"trains_held", s.trains_held},
          {"inducted_trains", s.inducted_trains},
          {"held_trains", s.held_trains},
          {"avg_fitness_inducted", s.avg_fitness_inducted},
          {"avg_fitness_held", s.avg_fitness_held},
          {"avg_mileage_inducted", s.avg_mileage_inducted},
          {"avg_mileage_held", s.avg_mileage_held},
          {"depot_distribution", s.depot_distribution},
          {"manual_overrides_applied", s.manual_overrides_applied}}}};
    j["objective_value"] = o.objective_value ? nlohmann::json(*o.objective_value) : nlohmann::json(nullptr);
    return j;
}

} // namespace induct
