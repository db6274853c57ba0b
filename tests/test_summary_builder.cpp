#include "worker/summary_builder.hpp"
#include <gtest/gtest.h>

using namespace evsim;
using namespace evsim::worker;
using timeline::TimelineSnapshot;

namespace {

grid::GridPoint weighted(int hp_ev, double weight) {
    grid::GridPoint p;
    p.hp_ev = hp_ev;
    p.weight = weight;
    p.has_survival = true;
    p.survival = 1.0;
    return p;
}

TimelineSnapshot snapshot(const std::string& id, int sequence, int player_hp, int max_hp) {
    TimelineSnapshot s;
    s.turn = 1;
    s.event_id = id;
    s.sequence = sequence;
    s.description = id;
    s.probability = 1.0;
    s.hp_distribution = { { player_hp, 1.0 } };
    s.opponent_hp_distribution = { { 100, 1.0 } };
    s.hp = { player_hp, 100 };
    s.max_hp = { max_hp, 100 };
    return s;
}

} // anonymous namespace

TEST(SummaryBuilder, DistributionsBlendByWeight) {
    std::vector<grid::GridPoint> points = { weighted(0, 0.25), weighted(8, 0.75) };
    std::vector<PointResult> results(2);
    results[0].hp_distribution = { { 0, 0.5 }, { 40, 0.5 } };
    results[1].hp_distribution = { { 40, 1.0 } };

    auto dist = combine_distributions(points, results);
    ASSERT_EQ(dist.size(), 2u);
    EXPECT_EQ(dist[0].hp, 0);
    EXPECT_NEAR(dist[0].probability, 0.125, 1e-12);
    EXPECT_NEAR(dist[1].probability, 0.875, 1e-12);
}

TEST(SummaryBuilder, SnapshotsMatchByEventId) {
    std::vector<grid::GridPoint> points = { weighted(0, 0.5), weighted(8, 0.5) };
    std::vector<PointResult> results(2);
    results[0].snapshots = { snapshot("hit", 0, 20, 100), snapshot("heal", 1, 60, 100) };
    // Second point has a different event sequence
    results[1].snapshots = { snapshot("hit", 0, 40, 120), snapshot("extra", 1, 40, 120),
                             snapshot("heal", 2, 80, 120) };

    auto combined = combine_snapshots(points, results);
    ASSERT_EQ(combined.size(), 3u);
    EXPECT_EQ(combined[0].event_id, "hit");
    EXPECT_EQ(combined[0].hp.player, 30);
    EXPECT_EQ(combined[0].max_hp.player, 110);
    EXPECT_DOUBLE_EQ(combined[0].probability, 1.0);

    // "heal" keeps the smallest sequence it was seen with
    EXPECT_EQ(combined[1].event_id, "heal");
    EXPECT_EQ(combined[1].hp.player, 70);
    EXPECT_EQ(combined[2].event_id, "extra");
    EXPECT_DOUBLE_EQ(combined[2].probability, 0.5);
    EXPECT_EQ(combined[2].hp.player, 40);
}

TEST(SummaryBuilder, ZeroDeltaIsNotReported) {
    std::vector<grid::GridPoint> points = { weighted(0, 1.0) };
    std::vector<PointResult> results(1);
    TimelineSnapshot s = snapshot("noop", 0, 50, 100);
    s.has_delta = true;
    results[0].snapshots = { s };

    auto combined = combine_snapshots(points, results);
    ASSERT_EQ(combined.size(), 1u);
    EXPECT_FALSE(combined[0].has_delta);

    s.delta_hp.player = 12.0;
    s.max_hp_before.player = 100.0;
    results[0].snapshots = { s };
    combined = combine_snapshots(points, results);
    ASSERT_TRUE(combined[0].has_delta);
    EXPECT_DOUBLE_EQ(combined[0].delta_hp.player, 12.0);
}

TEST(SummaryBuilder, GridSummaryChoosesSections) {
    std::vector<grid::GridPoint> points = { weighted(0, 0.5), weighted(8, 0.5) };
    std::vector<PointResult> results(2);

    grid::GridConfig cfg;
    cfg.enabled = true;
    cfg.axis_step = 8;

    JobSummary survival_only = build_grid_summary(points, results, cfg, 0, 0, false);
    EXPECT_TRUE(survival_only.has_heatmap);
    EXPECT_TRUE(survival_only.has_sensitivity);
    EXPECT_FALSE(survival_only.has_top_plans);
    EXPECT_DOUBLE_EQ(survival_only.survival, 1.0);

    cfg.enable_survival = true;
    JobSummary with_plans = build_grid_summary(points, results, cfg, 0, 0, true);
    EXPECT_TRUE(with_plans.has_top_plans);
    EXPECT_EQ(with_plans.heatmap[0].metric, grid::HeatmapMetric::DAMAGE_RANGE);
}
