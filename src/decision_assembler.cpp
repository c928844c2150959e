#include "induct/decision_assembler.hpp"

#include <algorithm>

namespace induct {

std::vector<RankedDecision> assemble_ranking(const OptimizationOutcome& outcome,
                                             const std::vector<TrainRecord>& records)
{
    const std::vector<TrainAttributes> fleet = resolve_all(records);

    std::vector<RankedDecision> rows;
    rows.reserve(fleet.size());
    for (const auto& t : fleet) {
        RankedDecision r;
        r.train_id         = t.train_id;
        r.fitness_score    = t.fitness_score;
        r.depot            = t.depot;
        r.mileage          = t.mileage;
        r.open_work_orders = t.open_work_orders;
        r.recent_delays    = t.recent_delays;
        r.cert_valid       = t.cert_valid;

        auto it = outcome.decisions.find(t.train_id);
        if (it != outcome.decisions.end()) {
            r.decision        = it->second.induct;
            r.reasoning       = it->second.reasoning;
            r.manual_override = it->second.manual_override;
        } else {
            r.reasoning = "No reasoning available";
        }
        r.final_decision = r.decision == 1 ? "Induct" : "Hold";
        rows.push_back(std::move(r));
    }

    std::stable_sort(rows.begin(), rows.end(), [](const RankedDecision& a, const RankedDecision& b) {
        if (a.decision != b.decision) return a.decision > b.decision;
        return a.fitness_score > b.fitness_score;
    });
    for (std::size_t i = 0; i < rows.size(); ++i) rows[i].priority_rank = i + 1;
    return rows;
}

nlohmann::json ranking_to_json(const std::vector<RankedDecision>& ranking)
{
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : ranking)
        arr.push_back({{"priority_rank", r.priority_rank},
                       {"train_id", r.train_id},
                       {"induction_decision", r.decision},
                       {"final_decision", r.final_decision},
                       {"fitness_score", r.fitness_score},
                       {"depot", r.depot},
                       {"mileage", r.mileage},
                       {"open_work_orders", r.open_work_orders},
                       {"recent_delays", r.recent_delays},
                       {"cert_valid", r.cert_valid},
                       {"manual_override", r.manual_override},
                       {"reasoning", r.reasoning}});
    return arr;
}

} // namespace induct
