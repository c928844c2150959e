#include <gtest/gtest.h>

#include <limits>

#include "fleet_fixture.hpp"
#include "induct/errors.hpp"
#include "induct/feature_builder.hpp"

using namespace induct;

namespace {
FeatureOptions monday() { FeatureOptions o; o.day_of_week = 0; return o; }
}

TEST(EngineeredFeatures, FitnessTrendIsClamped)
{
    TrainAttributes t;
    t.fitness_score = 90; t.days_since_maintenance = 10;
    EXPECT_DOUBLE_EQ(fitness_trend(t), 85.0);
    t.fitness_score = 10; t.days_since_maintenance = 40;
    EXPECT_DOUBLE_EQ(fitness_trend(t), 0.0);
}

TEST(EngineeredFeatures, MaintenanceUrgencyBucketsAndCap)
{
    TrainAttributes t;
    t.days_since_maintenance = 22;
    EXPECT_DOUBLE_EQ(maintenance_urgency(t), 3.0);
    t.days_since_maintenance = 15;
    EXPECT_DOUBLE_EQ(maintenance_urgency(t), 2.0);
    t.days_since_maintenance = 8; t.open_work_orders = 1; t.mechanical_issues = 2;
    EXPECT_DOUBLE_EQ(maintenance_urgency(t), 1.0 + 2.0 + 3.0);
    t.days_since_maintenance = 7; t.open_work_orders = 0; t.mechanical_issues = 0;
    EXPECT_DOUBLE_EQ(maintenance_urgency(t), 0.0);
    t.open_work_orders = 9;
    EXPECT_DOUBLE_EQ(maintenance_urgency(t), 10.0);
}

TEST(EngineeredFeatures, OperationalRisk)
{
    TrainAttributes t;
    t.fitness_score = 85; t.recent_delays = 2; t.door_faults = 1;
    EXPECT_DOUBLE_EQ(operational_risk(t), 2.0);
    t.fitness_score = 75;
    EXPECT_DOUBLE_EQ(operational_risk(t), 3.0);
    t.fitness_score = 65; t.cert_valid = false;
    EXPECT_DOUBLE_EQ(operational_risk(t), 7.0);
    t.recent_delays = 20;
    EXPECT_DOUBLE_EQ(operational_risk(t), 10.0);
}

TEST(FeatureBuilder, MissingFieldsTakeDefaults)
{
    std::vector<TrainRecord> rows(2);
    rows[0].train_id = "A"; rows[0].mileage = 120000;
    rows[1].train_id = "B";
    FeatureBuilder fb(monday());
    const FeatureTable t = fb.fit_transform(rows);

    EXPECT_DOUBLE_EQ(t.column("fitness_score")(1), 50.0);
    EXPECT_DOUBLE_EQ(t.column("days_since_maintenance")(1), 30.0);
    EXPECT_DOUBLE_EQ(t.column("mileage")(1), 120000.0);       // fleet mean of the reported
    EXPECT_DOUBLE_EQ(t.column("cert_valid")(1), 1.0);
    EXPECT_DOUBLE_EQ(t.column("days_to_cert_expiry")(1), 30.0);
    EXPECT_DOUBLE_EQ(t.column("depot_encoded")(1), 0.0);
    EXPECT_DOUBLE_EQ(t.column("is_weekend")(0), 0.0);
}

TEST(FeatureBuilder, MileageFallsBackWhenNobodyReportsIt)
{
    std::vector<TrainRecord> rows(1);
    rows[0].train_id = "A";
    FeatureBuilder fb(monday());
    EXPECT_DOUBLE_EQ(fb.fit_transform(rows).column("mileage")(0), 100000.0);
}

TEST(FeatureBuilder, NaNIsTreatedAsMissing)
{
    std::vector<TrainRecord> rows(1);
    rows[0].train_id = "A";
    rows[0].fitness_score = std::numeric_limits<double>::quiet_NaN();
    FeatureBuilder fb(monday());
    EXPECT_DOUBLE_EQ(fb.fit_transform(rows).column("fitness_score")(0), 50.0);
}

TEST(FeatureBuilder, ColumnOrderStableAcrossInputShapes)
{
    FeatureBuilder fb(monday());
    const auto fit = fb.fit_transform(testing_fleet::healthy_fleet(25));
    ASSERT_EQ(fit.columns, kFeatureColumns);

    for (int n : {1, 3, 40}) {
        auto fleet = testing_fleet::healthy_fleet(n);
        for (auto& r : fleet) { r.mileage.reset(); r.door_faults.reset(); r.depot.clear(); }
        const FeatureTable t = fb.transform(fleet);
        EXPECT_EQ(t.columns, fb.feature_columns());
        EXPECT_EQ(t.values.rows(), n);
        EXPECT_EQ(t.values.cols(), static_cast<Eigen::Index>(kFeatureColumns.size()));
    }
}

TEST(FeatureBuilder, ProjectsOntoRecordedColumns)
{
    FeatureBuilder fb(monday());
    fb.set_feature_columns({"mileage", "fitness_score", "legacy_col"});
    auto fleet = testing_fleet::healthy_fleet(4);
    const FeatureTable t = fb.transform(fleet);

    ASSERT_EQ(t.columns, (std::vector<std::string>{"mileage", "fitness_score", "legacy_col"}));
    EXPECT_DOUBLE_EQ(t.values(2, 0), static_cast<double>(*fleet[2].mileage));
    EXPECT_DOUBLE_EQ(t.values(2, 1), *fleet[2].fitness_score);
    EXPECT_TRUE(t.values.col(2).isZero());
}

TEST(FeatureBuilder, UnseenDepotAfterTrainingMapsToUnknown)
{
    FeatureBuilder fb(monday());
    fb.fit_transform(testing_fleet::healthy_fleet(6));
    const std::size_t learned = fb.encoder("depot").size();
    EXPECT_EQ(learned, 4u);    // Unknown + three depots

    auto fleet = testing_fleet::healthy_fleet(2);
    fleet[0].depot = "Muttom";
    const FeatureTable t = fb.transform(fleet);
    EXPECT_DOUBLE_EQ(t.column("depot_encoded")(0), 0.0);
    EXPECT_DOUBLE_EQ(t.column("depot_encoded")(1), fb.encoder("depot").code_of("Palarivattom"));
    EXPECT_EQ(fb.encoder("depot").size(), learned);
}

TEST(FeatureBuilder, RefitAppendsNewCategories)
{
    FeatureBuilder fb(monday());
    fb.fit_transform(testing_fleet::healthy_fleet(3));
    const int aluva = fb.encoder("depot").code_of("Aluva");

    auto more = testing_fleet::healthy_fleet(3);
    more[1].depot = "Muttom";
    fb.fit_transform(more);
    EXPECT_EQ(fb.encoder("depot").code_of("Aluva"), aluva);
    EXPECT_EQ(fb.encoder("depot").code_of("Muttom"), 4);
}

TEST(FeatureBuilder, WeekendFlagFollowsPlanningDay)
{
    FeatureOptions sat; sat.day_of_week = 5;
    FeatureBuilder fb(sat);
    const FeatureTable t = fb.fit_transform(testing_fleet::healthy_fleet(2));
    EXPECT_DOUBLE_EQ(t.column("day_of_week")(0), 5.0);
    EXPECT_DOUBLE_EQ(t.column("is_weekend")(1), 1.0);
}

TEST(FeatureBuilder, UnknownColumnLookupThrows)
{
    FeatureBuilder fb(monday());
    const FeatureTable t = fb.fit_transform(testing_fleet::healthy_fleet(2));
    EXPECT_EQ(t.column_index("nope"), -1);
    EXPECT_THROW(t.column("nope"), InputError);
}
