/*───────────────────────────────────────────────────────────
 *  train_record.hpp   –  raw per-train row + its resolved form
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace induct {

/* ────────────────── neutral defaults for absent fields ────────────────── */
namespace defaults {
constexpr double kFitnessScore        = 50.0;
constexpr long   kDaysSinceMaint      = 30;
constexpr double kMileage             = 100000.0;   // only when no train reports one
constexpr long   kBrandingHours       = 0;
constexpr long   kRecentDelays        = 0;
constexpr double kTotalDelayMinutes   = 0.0;
constexpr long   kOpenWorkOrders      = 0;
constexpr long   kDoorFaults          = 0;
constexpr long   kMechanicalIssues    = 0;
constexpr bool   kCertValid           = true;
constexpr long   kDaysToCertExpiry    = 30;
constexpr double kOnTimePerformance   = 90.0;
}  // namespace defaults

constexpr const char* kUnknownDepot = "Unknown";

/* One row per train, as delivered by the data adapter.  Any field may be
 * absent; nothing here is mutated during a planning run.               */
struct TrainRecord {
    std::string train_id;
    std::string depot;                              // empty ⇒ unknown

    std::optional<double> fitness_score;            // 0‥100
    std::optional<long>   mileage;
    std::optional<long>   days_since_maintenance;
    std::optional<long>   open_work_orders;
    std::optional<bool>   cert_valid;
    std::optional<long>   days_to_cert_expiry;      // negative once expired
    std::optional<long>   branding_hours;
    std::optional<long>   recent_delays;
    std::optional<double> total_delay_minutes;
    std::optional<long>   mechanical_issues;
    std::optional<long>   door_faults;
    std::optional<double> on_time_performance;      // 0‥100

    std::optional<int>    target_induct;            // training label, 0/1
};

/* TrainRecord with every default applied */
struct TrainAttributes {
    std::string train_id;
    std::string depot = kUnknownDepot;

    double fitness_score          = defaults::kFitnessScore;
    double mileage                = defaults::kMileage;
    long   days_since_maintenance = defaults::kDaysSinceMaint;
    long   open_work_orders       = defaults::kOpenWorkOrders;
    bool   cert_valid             = defaults::kCertValid;
    long   days_to_cert_expiry    = defaults::kDaysToCertExpiry;
    long   branding_hours         = defaults::kBrandingHours;
    long   recent_delays          = defaults::kRecentDelays;
    double total_delay_minutes    = defaults::kTotalDelayMinutes;
    long   mechanical_issues      = defaults::kMechanicalIssues;
    long   door_faults            = defaults::kDoorFaults;
    double on_time_performance    = defaults::kOnTimePerformance;
};

/* mean of the reported mileages, or defaults::kMileage if none */
double fleet_mean_mileage(const std::vector<TrainRecord>& records);

/* applies defaults; negative counts clamp to 0, scores clamp to 0‥100 */
TrainAttributes resolve(const TrainRecord& r, double fleet_mileage);
std::vector<TrainAttributes> resolve_all(const std::vector<TrainRecord>& records);

/* throws InputError on an empty id or a duplicate id */
void validate_identifiers(const std::vector<TrainRecord>& records);

/* "must hold" rule shared by the optimizer and its fallback path */
bool is_excluded(const TrainAttributes& t, double min_fitness);

} // namespace induct
