#include "induct/train_record.hpp"

#include <cmath>
#include <unordered_set>

#include "induct/common.hpp"
#include "induct/errors.hpp"

namespace induct {

double fleet_mean_mileage(const std::vector<TrainRecord>& records)
{
    double sum = 0.0;
    std::size_t n = 0;
    for (const auto& r : records) {
        if (!r.mileage) continue;
        sum += static_cast<double>(*r.mileage);
        ++n;
    }
    return n ? sum / static_cast<double>(n) : defaults::kMileage;
}

/* NaN reaches us from float columns; treat it like an absent cell */
static double num_or(const std::optional<double>& v, double dflt)
{
    return (v && std::isfinite(*v)) ? *v : dflt;
}

static long count_or(const std::optional<long>& v, long dflt)
{
    return v ? std::max(0L, *v) : dflt;
}

TrainAttributes resolve(const TrainRecord& r, double fleet_mileage)
{
    TrainAttributes t;
    t.train_id = r.train_id;
    const std::string depot = trim_copy(r.depot);
    t.depot = depot.empty() ? kUnknownDepot : depot;

    t.fitness_score          = clamp_val(num_or(r.fitness_score, defaults::kFitnessScore), 0.0, 100.0);
    t.mileage                = r.mileage ? static_cast<double>(std::max(0L, *r.mileage)) : fleet_mileage;
    t.days_since_maintenance = count_or(r.days_since_maintenance, defaults::kDaysSinceMaint);
    t.open_work_orders       = count_or(r.open_work_orders, defaults::kOpenWorkOrders);
    t.cert_valid             = r.cert_valid.value_or(defaults::kCertValid);
    t.days_to_cert_expiry    = r.days_to_cert_expiry.value_or(defaults::kDaysToCertExpiry);
    t.branding_hours         = count_or(r.branding_hours, defaults::kBrandingHours);
    t.recent_delays          = count_or(r.recent_delays, defaults::kRecentDelays);
    t.total_delay_minutes    = std::max(0.0, num_or(r.total_delay_minutes, defaults::kTotalDelayMinutes));
    t.mechanical_issues      = count_or(r.mechanical_issues, defaults::kMechanicalIssues);
    t.door_faults            = count_or(r.door_faults, defaults::kDoorFaults);
    t.on_time_performance    = clamp_val(num_or(r.on_time_performance, defaults::kOnTimePerformance),
                                         0.0, 100.0);
    return t;
}

std::vector<TrainAttributes> resolve_all(const std::vector<TrainRecord>& records)
{
    const double mean = fleet_mean_mileage(records);
    std::vector<TrainAttributes> out;
    out.reserve(records.size());
    for (const auto& r : records) out.push_back(resolve(r, mean));
    return out;
}

void validate_identifiers(const std::vector<TrainRecord>& records)
{
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < records.size(); ++i) {
        const std::string& id = records[i].train_id;
        if (trim_copy(id).empty())
            throw InputError("row " + std::to_string(i) + " has an empty train_id");
        if (!seen.insert(id).second)
            throw InputError("duplicate train_id " + id);
    }
}

bool is_excluded(const TrainAttributes& t, double min_fitness)
{
    return t.open_work_orders > 0 || !t.cert_valid || t.fitness_score < min_fitness;
}

} // namespace induct
