/*──────────────────────────────────────────────────────────────────────
 *  feature_builder.cpp
 *
 *  Raw fields are resolved (defaults applied) first, then every column
 *  is filled as one Eigen vector.  fit_transform() records the column
 *  order; transform() reproduces it exactly for any input shape.
 *─────────────────────────────────────────────────────────────────────*/
#include "induct/feature_builder.hpp"

#include <ctime>

#include "induct/common.hpp"
#include "induct/errors.hpp"

namespace induct {

const std::vector<std::string> kFeatureColumns = {
    "fitness_score",       "days_since_maintenance", "mileage",
    "branding_hours",      "recent_delays",          "total_delay_minutes",
    "open_work_orders",    "door_faults",            "mechanical_issues",
    "cert_valid",          "days_to_cert_expiry",    "fitness_trend",
    "maintenance_urgency", "operational_risk",       "depot_encoded",
    "day_of_week",         "is_weekend"};

static const char* const kDepotField = "depot";

/* ---------- engineered scalars ---------- */
double fitness_trend(const TrainAttributes& t)
{
    return clamp_val(t.fitness_score - 0.5 * static_cast<double>(t.days_since_maintenance),
                     0.0, 100.0);
}

double maintenance_urgency(const TrainAttributes& t)
{
    double u = 0.0;
    if      (t.days_since_maintenance > 21) u += 3.0;
    else if (t.days_since_maintenance > 14) u += 2.0;
    else if (t.days_since_maintenance > 7)  u += 1.0;
    u += 2.0 * static_cast<double>(t.open_work_orders);
    u += 1.5 * static_cast<double>(t.mechanical_issues);
    return std::min(u, 10.0);
}

double operational_risk(const TrainAttributes& t)
{
    double r = 0.5 * static_cast<double>(t.recent_delays)
             + 1.0 * static_cast<double>(t.door_faults);
    if      (t.fitness_score < 70.0) r += 2.0;
    else if (t.fitness_score < 80.0) r += 1.0;
    if (!t.cert_valid) r += 3.0;
    return std::min(r, 10.0);
}

/* ---------- FeatureTable ---------- */
int FeatureTable::column_index(const std::string& name) const
{
    for (std::size_t c = 0; c < columns.size(); ++c)
        if (columns[c] == name) return static_cast<int>(c);
    return -1;
}

Eigen::VectorXd FeatureTable::column(const std::string& name) const
{
    const int c = column_index(name);
    if (c < 0) throw InputError("no feature column '" + name + "'");
    return values.col(c);
}

/* ---------- FeatureBuilder ---------- */
FeatureBuilder::FeatureBuilder(FeatureOptions opt) : opt_(opt)
{
    encoders_.emplace(kDepotField, CategoryRegistry{});
}

int FeatureBuilder::planning_day() const
{
    if (opt_.day_of_week) return clamp_val(*opt_.day_of_week, 0, 6);
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    return (tm.tm_wday + 6) % 7;        // tm: Sunday=0 → Monday=0
}

void FeatureBuilder::fill_frame(Frame& f, const std::vector<TrainAttributes>& rows,
                                const std::vector<int>& depot_codes) const
{
    const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
    for (const auto& name : kFeatureColumns) f[name] = Eigen::VectorXd::Zero(n);

    const int dow = planning_day();
    for (Eigen::Index i = 0; i < n; ++i) {
        const TrainAttributes& t = rows[static_cast<std::size_t>(i)];
        f["fitness_score"](i)          = t.fitness_score;
        f["days_since_maintenance"](i) = static_cast<double>(t.days_since_maintenance);
        f["mileage"](i)                = t.mileage;
        f["branding_hours"](i)         = static_cast<double>(t.branding_hours);
        f["recent_delays"](i)          = static_cast<double>(t.recent_delays);
        f["total_delay_minutes"](i)    = t.total_delay_minutes;
        f["open_work_orders"](i)       = static_cast<double>(t.open_work_orders);
        f["door_faults"](i)            = static_cast<double>(t.door_faults);
        f["mechanical_issues"](i)      = static_cast<double>(t.mechanical_issues);
        f["cert_valid"](i)             = t.cert_valid ? 1.0 : 0.0;
        f["days_to_cert_expiry"](i)    = static_cast<double>(t.days_to_cert_expiry);
        f["fitness_trend"](i)          = fitness_trend(t);
        f["maintenance_urgency"](i)    = maintenance_urgency(t);
        f["operational_risk"](i)       = operational_risk(t);
        f["depot_encoded"](i)          = static_cast<double>(depot_codes[static_cast<std::size_t>(i)]);
        f["day_of_week"](i)            = static_cast<double>(dow);
        f["is_weekend"](i)             = dow >= 5 ? 1.0 : 0.0;
    }
}

FeatureBuilder::Frame FeatureBuilder::build_frame(const std::vector<TrainAttributes>& rows, bool learn)
{
    if (!learn) return static_cast<const FeatureBuilder&>(*this).build_frame(rows);

    CategoryRegistry& depots = encoders_[kDepotField];
    std::vector<int> codes;
    codes.reserve(rows.size());
    for (const auto& t : rows) codes.push_back(depots.learn(t.depot));

    Frame f;
    fill_frame(f, rows, codes);
    return f;
}

FeatureBuilder::Frame FeatureBuilder::build_frame(const std::vector<TrainAttributes>& rows) const
{
    const CategoryRegistry& depots = encoder(kDepotField);
    std::vector<int> codes;
    codes.reserve(rows.size());
    for (const auto& t : rows) codes.push_back(depots.code_of(t.depot));

    Frame f;
    fill_frame(f, rows, codes);
    return f;
}

FeatureTable FeatureBuilder::project(const Frame& f,
                                     const std::vector<TrainAttributes>& rows,
                                     const std::vector<std::string>& cols)
{
    FeatureTable out;
    out.columns = cols;
    out.train_ids.reserve(rows.size());
    for (const auto& t : rows) out.train_ids.push_back(t.train_id);

    const Eigen::Index n = static_cast<Eigen::Index>(rows.size());
    out.values = Eigen::MatrixXd::Zero(n, static_cast<Eigen::Index>(cols.size()));
    for (std::size_t c = 0; c < cols.size(); ++c) {
        auto it = f.find(cols[c]);
        if (it != f.end()) out.values.col(static_cast<Eigen::Index>(c)) = it->second;
    }
    return out;
}

FeatureTable FeatureBuilder::fit_transform(const std::vector<TrainRecord>& records)
{
    const auto rows = resolve_all(records);
    const Frame f = build_frame(rows, true);
    if (columns_.empty()) columns_ = kFeatureColumns;
    return project(f, rows, columns_);
}

FeatureTable FeatureBuilder::transform(const std::vector<TrainRecord>& records) const
{
    const auto rows = resolve_all(records);
    const Frame f = build_frame(rows);
    return project(f, rows, columns_.empty() ? kFeatureColumns : columns_);
}

const CategoryRegistry& FeatureBuilder::encoder(const std::string& field) const
{
    auto it = encoders_.find(field);
    if (it == encoders_.end()) throw InputError("no encoder for field '" + field + "'");
    return it->second;
}

void FeatureBuilder::set_feature_columns(std::vector<std::string> cols)
{
    if (cols.empty()) throw InputError("feature column list is empty");
    columns_ = std::move(cols);
}

void FeatureBuilder::set_encoder(const std::string& field, CategoryRegistry reg)
{
    encoders_[field] = std::move(reg);
}

nlohmann::json FeatureBuilder::encoders_to_json() const
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto& kv : encoders_) j[kv.first] = kv.second.to_json();
    return j;
}

void FeatureBuilder::encoders_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) throw ModelLoadError("encoders must be an object");
    std::map<std::string, CategoryRegistry> regs;
    for (auto it = j.begin(); it != j.end(); ++it)
        regs.emplace(it.key(), CategoryRegistry::from_json(it.value()));
    if (!regs.count(kDepotField)) regs.emplace(kDepotField, CategoryRegistry{});
    encoders_ = std::move(regs);
}

void FeatureBuilder::reset()
{
    columns_.clear();
    encoders_.clear();
    encoders_.emplace(kDepotField, CategoryRegistry{});
}

} // namespace induct
