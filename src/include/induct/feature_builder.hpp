/*───────────────────────────────────────────────────────────
 *  feature_builder.hpp   –  TrainRecord table → numeric matrix
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "induct/category_registry.hpp"
#include "induct/train_record.hpp"

namespace induct {

/* default column order; the order recorded at fit time wins afterwards */
extern const std::vector<std::string> kFeatureColumns;

struct FeatureOptions {
    /* 0 = Monday … 6 = Sunday; unset ⇒ taken from the local clock */
    std::optional<int> day_of_week;
};

struct FeatureTable {
    std::vector<std::string> train_ids;
    std::vector<std::string> columns;
    Eigen::MatrixXd          values;      // rows = trains, cols = columns

    int  column_index(const std::string& name) const;   // -1 if absent
    Eigen::VectorXd column(const std::string& name) const;
    std::size_t rows() const { return train_ids.size(); }
};

/* ---------- engineered scalars (pure) ---------- */
double fitness_trend(const TrainAttributes& t);
double maintenance_urgency(const TrainAttributes& t);
double operational_risk(const TrainAttributes& t);

class FeatureBuilder {
public:
    explicit FeatureBuilder(FeatureOptions opt = {});

    /* training mode: learns categories, records the column order */
    FeatureTable fit_transform(const std::vector<TrainRecord>& records);

    /* prediction mode: unseen categories → Unknown, output projected
       onto the recorded columns (missing → 0, extras dropped)        */
    FeatureTable transform(const std::vector<TrainRecord>& records) const;

    bool has_recorded_columns() const { return !columns_.empty(); }
    const std::vector<std::string>& feature_columns() const { return columns_; }
    const CategoryRegistry& encoder(const std::string& field) const;

    /* restore path */
    void set_feature_columns(std::vector<std::string> cols);
    void set_encoder(const std::string& field, CategoryRegistry reg);

    nlohmann::json encoders_to_json() const;
    void encoders_from_json(const nlohmann::json& j);

    void reset();

private:
    using Frame = std::map<std::string, Eigen::VectorXd>;

    Frame build_frame(const std::vector<TrainAttributes>& rows, bool learn);
    Frame build_frame(const std::vector<TrainAttributes>& rows) const;
    void  fill_frame(Frame& f, const std::vector<TrainAttributes>& rows,
                     const std::vector<int>& depot_codes) const;
    int   planning_day() const;

    static FeatureTable project(const Frame& f,
                                const std::vector<TrainAttributes>& rows,
                                const std::vector<std::string>& cols);

    FeatureOptions                          opt_;
    std::vector<std::string>                columns_;
    std::map<std::string, CategoryRegistry> encoders_;   // keyed by raw field
};

} // namespace induct
