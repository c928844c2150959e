/*───────────────────────────────────────────────────────────
 *  decision_assembler.hpp   –  outcome + records → ranked table
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "induct/optimizer.hpp"
#include "induct/train_record.hpp"

namespace induct {

struct RankedDecision {
    std::size_t priority_rank = 0;     // 1-based, dense
    std::string train_id;
    int         decision = 0;
    std::string final_decision;        // "Induct" | "Hold"
    double      fitness_score = 0.0;
    std::string depot;
    double      mileage = 0.0;
    long        open_work_orders = 0;
    long        recent_delays = 0;
    bool        cert_valid = true;
    bool        manual_override = false;
    std::string reasoning;
};

/* induct first, fitness descending, input order on ties */
std::vector<RankedDecision> assemble_ranking(const OptimizationOutcome& outcome,
                                             const std::vector<TrainRecord>& records);

nlohmann::json ranking_to_json(const std::vector<RankedDecision>& ranking);

} // namespace induct
