// Deterministic fleets for the test suite.
#pragma once

#include <string>
#include <vector>

#include "induct/train_record.hpp"

namespace induct {
namespace testing_fleet {

inline std::string train_name(int i)
{
    std::string n = std::to_string(i + 1);
    return "KMRL-" + std::string(3 - n.size(), '0') + n;
}

/* n healthy trains dealt round-robin over Aluva, Palarivattom and Kalamassery */
inline std::vector<TrainRecord> healthy_fleet(int n = 25)
{
    static const char* const kDepots[] = {"Aluva", "Palarivattom", "Kalamassery"};
    std::vector<TrainRecord> out;
    for (int i = 0; i < n; ++i) {
        TrainRecord r;
        r.train_id               = train_name(i);
        r.depot                  = kDepots[i % 3];
        r.fitness_score          = 70.0 + (i * 7) % 30;
        r.mileage                = 80000 + 3000L * i;
        r.days_since_maintenance = (i * 5) % 28;
        r.open_work_orders       = 0;
        r.cert_valid             = true;
        r.days_to_cert_expiry    = 10 + (i * 11) % 200;
        r.branding_hours         = (i * 13) % 120;
        r.recent_delays          = i % 4;
        r.total_delay_minutes    = 3.0 * (i % 4);
        r.mechanical_issues      = 0;
        r.door_faults            = i % 2;
        r.on_time_performance    = 90.0 + (i % 10);
        out.push_back(r);
    }
    return out;
}

/* labels that a tree can learn: fit ≥ 80 and no work orders */
inline std::vector<TrainRecord> labelled_fleet(int n = 60)
{
    std::vector<TrainRecord> out = healthy_fleet(n);
    for (int i = 0; i < n; ++i) {
        TrainRecord& r = out[static_cast<std::size_t>(i)];
        r.fitness_score = 55.0 + (i * 17) % 45;
        if (i % 7 == 0) r.open_work_orders = 2;
        r.target_induct = (*r.fitness_score >= 80.0 && *r.open_work_orders == 0) ? 1 : 0;
    }
    return out;
}

}  // namespace testing_fleet
}  // namespace induct
