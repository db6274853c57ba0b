#include "worker/summary_builder.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <unordered_map>

namespace evsim::worker {

namespace {

using timeline::DistributionPoint;
using timeline::TimelineSnapshot;

void accumulate(std::map<int, double>& bucket,
                const std::vector<DistributionPoint>& distribution,
                double contribution, int fallback_hp) {
    if (distribution.empty()) {
        bucket[std::max(0, fallback_hp)] += contribution;
        return;
    }
    for (const auto& dp : distribution) bucket[dp.hp] += dp.probability * contribution;
}

std::vector<DistributionPoint> normalized(const std::map<int, double>& bucket, double total) {
    std::vector<DistributionPoint> out;
    if (bucket.empty() || total <= 0.0) return out;
    for (const auto& [hp, mass] : bucket) out.push_back({ hp, mass / total });
    return out;
}

/// Running per-event blend of snapshots across grid points.
struct SnapshotBlend {
    const TimelineSnapshot* first = nullptr;
    int sequence = 0;
    double total = 0.0;
    SidePair<std::map<int, double>> distribution;
    SidePair<double> max_hp_sum;
    SidePair<double> delta_sum;
    SidePair<double> max_before_sum;
};

} // anonymous namespace

std::vector<DistributionPoint>
combine_distributions(const std::vector<grid::GridPoint>& points,
                      const std::vector<PointResult>& results) {
    std::map<int, double> bucket;
    for (size_t i = 0; i < points.size() && i < results.size(); i++) {
        for (const auto& dp : results[i].hp_distribution) {
            bucket[dp.hp] += dp.probability * points[i].weight;
        }
    }

    std::vector<DistributionPoint> out;
    for (const auto& [hp, mass] : bucket) out.push_back({ hp, mass });
    return out;
}

std::vector<TimelineSnapshot>
combine_snapshots(const std::vector<grid::GridPoint>& points,
                  const std::vector<PointResult>& results) {
    std::vector<std::string> order;
    std::unordered_map<std::string, SnapshotBlend> blends;

    for (size_t i = 0; i < points.size() && i < results.size(); i++) {
        const double weight = points[i].weight;
        for (const auto& snap : results[i].snapshots) {
            if (snap.event_id.empty()) continue;

            auto it = blends.find(snap.event_id);
            if (it == blends.end()) {
                it = blends.emplace(snap.event_id, SnapshotBlend{}).first;
                it->second.first = &snap;
                it->second.sequence = snap.sequence;
                order.push_back(snap.event_id);
            }
            SnapshotBlend& blend = it->second;
            blend.sequence = std::min(blend.sequence, snap.sequence);

            const double contribution = snap.probability * weight;
            blend.total += contribution;

            accumulate(blend.distribution.player, snap.hp_distribution, contribution,
                       snap.hp.player);
            accumulate(blend.distribution.opponent, snap.opponent_hp_distribution, contribution,
                       snap.hp.opponent);

            for (BattleSide side : ALL_SIDES) {
                blend.max_hp_sum[side] += snap.max_hp[side] * contribution;
                if (snap.has_delta) {
                    blend.delta_sum[side] += snap.delta_hp[side] * contribution;
                    blend.max_before_sum[side] += snap.max_hp_before[side] * contribution;
                }
            }
        }
    }

    std::vector<TimelineSnapshot> combined;
    combined.reserve(order.size());
    for (const auto& id : order) {
        const SnapshotBlend& blend = blends.at(id);
        const TimelineSnapshot& first = *blend.first;
        const double total = blend.total > 0.0 ? blend.total : 1.0;

        TimelineSnapshot snap;
        snap.turn = first.turn;
        snap.event_id = id;
        snap.sequence = blend.sequence;
        snap.description = first.description;
        snap.has_actor = first.has_actor;
        snap.actor = first.actor;
        snap.probability = blend.total;
        snap.damage_rolls = first.damage_rolls;

        snap.hp_distribution = normalized(blend.distribution.player, total);
        snap.opponent_hp_distribution = normalized(blend.distribution.opponent, total);

        SidePair<double> average;
        average.player = timeline::weighted_average(snap.hp_distribution);
        average.opponent = timeline::weighted_average(snap.opponent_hp_distribution);

        for (BattleSide side : ALL_SIDES) {
            snap.hp[side] = static_cast<int>(std::lround(average[side]));
            snap.max_hp[side] = static_cast<int>(std::lround(blend.max_hp_sum[side] / total));
        }

        // A delta of exactly zero on both sides is not reported
        if (blend.delta_sum.player != 0.0 || blend.delta_sum.opponent != 0.0) {
            snap.has_delta = true;
            for (BattleSide side : ALL_SIDES) {
                snap.delta_hp[side] = blend.delta_sum[side] / total;
                snap.max_hp_before[side] = blend.max_before_sum[side] / total;
            }
        }
        combined.push_back(std::move(snap));
    }

    std::stable_sort(combined.begin(), combined.end(),
        [](const TimelineSnapshot& a, const TimelineSnapshot& b) {
            if (a.sequence != b.sequence) return a.sequence < b.sequence;
            return a.turn < b.turn;
        });
    return combined;
}

JobSummary build_deterministic_summary(const timeline::SimulationResult& result,
                                       BattleSide side) {
    JobSummary summary;
    summary.survival = result.survival[side];
    summary.hp_distribution = result.final_distribution[side];
    summary.snapshots = result.snapshots;
    return summary;
}

JobSummary build_grid_summary(const std::vector<grid::GridPoint>& points,
                              const std::vector<PointResult>& results,
                              const grid::GridConfig& config,
                              int base_hp_ev, int base_def_ev,
                              bool use_damage_range) {
    const bool optimize_offense = config.enable_ko && !config.enable_survival;
    const bool defense_insights = config.enabled && !optimize_offense;

    JobSummary summary;
    summary.survival = grid::aggregate_survival(points);
    summary.hp_distribution = combine_distributions(points, results);
    summary.snapshots = combine_snapshots(points, results);

    if (defense_insights) {
        summary.has_heatmap = true;
        summary.heatmap = grid::build_heatmap(points, use_damage_range
                                                          ? grid::HeatmapMetric::DAMAGE_RANGE
                                                          : grid::HeatmapMetric::SURVIVAL);
        summary.has_sensitivity = true;
        summary.sensitivity = grid::compute_sensitivity(points, base_hp_ev, base_def_ev,
                                                        config.defense_step());
    }
    if (defense_insights && config.enable_survival) {
        summary.has_top_plans = true;
        summary.top_plans = grid::rank_top_plans(points, config.target_survival);
    }
    if (optimize_offense) {
        summary.has_ko_chance = true;
        summary.ko_chance = grid::aggregate_ko_chance(points);
        summary.has_ko_plans = true;
        summary.ko_plans = grid::rank_offense_plans(points, config.target_ko);
    }
    return summary;
}

} // namespace evsim::worker
