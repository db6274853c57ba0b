/**
 * EV grid — candidate stat investments and their Bayesian weighting.
 *
 * A defensive grid enumerates (HP EV, Def EV) pairs, an offensive grid
 * (Atk EV, SpA EV) pairs. Every point carries a prior weight and a
 * posterior weight (normalized to sum 1) plus the metrics recorded by
 * the orchestrator after simulating the point. Everything here is pure
 * arithmetic over point lists; no simulation happens in this module.
 */

#ifndef EVSIM_GRID_EV_GRID_HPP
#define EVSIM_GRID_EV_GRID_HPP

#include "core/battle_types.hpp"
#include "timeline/snapshot.hpp"
#include <string>
#include <vector>

namespace evsim::grid {

constexpr int MIN_GRID_STEP = 4;
constexpr double PLAN_TARGET_EPS = 1e-4;
constexpr double UNLISTED_CUSTOM_WEIGHT = 1e-6;
constexpr int MAX_PLANS = 3;

// ═══════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════

enum class PriorType {
    UNIFORM,
    META,
    CUSTOM
};

std::string prior_type_to_string(PriorType type);
PriorType prior_type_from_string(const std::string& s, PriorType def);

struct CustomWeight {
    int hp_ev = 0;
    int def_ev = 0;
    double weight = 0.0;
};

struct PriorConfig {
    PriorType type = PriorType::UNIFORM;
    std::string meta_profile = "balanced";
    std::vector<CustomWeight> custom_weights;
};

/// Inclusive EV interval.
struct EvRange {
    int min = 0;
    int max = 252;
};

struct GridConfig {
    bool enabled = false;
    BattleSide target_side = BattleSide::PLAYER;

    EvRange hp_range;
    EvRange def_range;
    int axis_step = 8;
    bool has_max_combined = false;
    int max_combined = 0;

    EvRange atk_range;
    EvRange spa_range;
    int offense_step = 0;               // 0 = axis_step
    bool has_offense_max_combined = false;
    int offense_max_combined = 0;

    PriorConfig prior;

    // Observation: the named event dealt [min, max] percent of max HP
    std::string observation_event_id;
    bool has_observation_percent = false;
    double observation_min_percent = 0.0;
    double observation_max_percent = 100.0;

    double target_survival = 0.0;       // <= 0 = no target
    double target_ko = 0.0;
    bool enable_survival = false;
    bool enable_ko = false;

    // Opponent bulk-range analysis
    bool enable_opponent_bulk_range = false;
    bool has_opponent_damage_range = false;
    double damage_range_min_percent = 0.0;
    double damage_range_max_percent = 100.0;

    /// Effective defensive step, max(MIN_GRID_STEP, axis_step).
    int defense_step() const;
    /// Effective offensive step, max(MIN_GRID_STEP, offense_step or axis_step).
    int offense_grid_step() const;

    /// True when the opponent bulk-range heatmap is requested.
    bool wants_damage_range() const {
        return enabled && target_side == BattleSide::OPPONENT &&
               enable_opponent_bulk_range && has_opponent_damage_range;
    }
};

/**
 * Reject configurations that can never produce a grid.
 * @throws ConfigurationError on reversed or negative ranges, ranges or
 *         steps above 252 EVs, or a non-positive step
 */
void validate_config(const GridConfig& config);

// ═══════════════════════════════════════════════════════════════
// Grid points
// ═══════════════════════════════════════════════════════════════

enum class PointKind {
    DEFENSE,
    OFFENSE
};

struct GridPoint {
    PointKind kind = PointKind::DEFENSE;
    int hp_ev = 0;
    int def_ev = 0;
    int atk_ev = 0;
    int spa_ev = 0;

    double prior_weight = 1.0;
    double weight = 1.0;

    bool has_survival = false;
    double survival = 0.0;
    bool has_ko_chance = false;
    double ko_chance = 0.0;
    bool has_observation = false;
    double observation_likelihood = 0.0;
    bool has_damage_range = false;
    double damage_range_likelihood = 0.0;

    int defense_total() const { return hp_ev + def_ev; }
    int offense_total() const { return atk_ev + spa_ev; }
};

/// Prior weight of a defensive (hp, def) pair under the configured prior.
double prior_weight(const PriorConfig& prior, int hp_ev, int def_ev);

/**
 * HP x Def grid, normalized.
 * @throws ConfigurationError when the configuration is invalid or no pair
 *         fits under the combined cap
 */
std::vector<GridPoint> build_defense_grid(const GridConfig& config);

/**
 * Atk x SpA grid with a uniform prior, normalized.
 * @throws ConfigurationError as build_defense_grid
 */
std::vector<GridPoint> build_offense_grid(const GridConfig& config);

/// Divide by the sum; uniform when the sum is not positive.
void normalize_weights(std::vector<GridPoint>& points);

/**
 * Posterior = prior * max(0, likelihood), renormalized.
 * A null likelihood list only renormalizes.
 */
void apply_observation_likelihoods(std::vector<GridPoint>& points,
                                   const std::vector<double>* likelihoods);

double aggregate_survival(const std::vector<GridPoint>& points);
double aggregate_ko_chance(const std::vector<GridPoint>& points);

// ═══════════════════════════════════════════════════════════════
// Reporting
// ═══════════════════════════════════════════════════════════════

enum class HeatmapMetric {
    SURVIVAL,
    DAMAGE_RANGE
};

std::string heatmap_metric_to_string(HeatmapMetric metric);

struct HeatmapCell {
    int hp_ev = 0;
    int def_ev = 0;
    double value = 0.0;
    double weight = 0.0;
    HeatmapMetric metric = HeatmapMetric::SURVIVAL;
};

std::vector<HeatmapCell> build_heatmap(const std::vector<GridPoint>& points,
                                       HeatmapMetric metric);

struct SurvivalPlan {
    int hp_ev = 0;
    int def_ev = 0;
    double survival = 0.0;
    int total_ev = 0;
    bool meets_target = false;
};

/**
 * Without a target: the MAX_PLANS best points by survival (stable).
 * With a target: every qualifying point tied at the minimal total
 * investment, or nothing when no point qualifies.
 */
std::vector<SurvivalPlan> rank_top_plans(const std::vector<GridPoint>& points, double target);

struct OffensePlan {
    int atk_ev = 0;
    int spa_ev = 0;
    double ko_chance = 0.0;
    int total_ev = 0;
    bool meets_target = false;
};

/**
 * Offensive points sorted by KO chance desc, total EV, Atk, SpA asc.
 * With a target only qualifying points are considered (all of them when
 * none qualify). Points are grouped into tiers of equal KO chance and
 * the minimal-investment entries of each tier are taken, up to MAX_PLANS.
 */
std::vector<OffensePlan> rank_offense_plans(const std::vector<GridPoint>& points, double target);

struct Sensitivity {
    double hp = 0.0;
    double def = 0.0;
};

/// Nearest point by Manhattan distance; nullptr for an empty grid.
const GridPoint* find_nearest_point(const std::vector<GridPoint>& points, int hp_ev, int def_ev);

/**
 * Finite-difference survival slope per EV around the base investment,
 * one step up each axis. Missing neighbours contribute no change.
 */
Sensitivity compute_sensitivity(const std::vector<GridPoint>& points,
                                int base_hp_ev, int base_def_ev, int step);

// ═══════════════════════════════════════════════════════════════
// Opponent bulk-range analysis
// ═══════════════════════════════════════════════════════════════

/**
 * Narrow the defensive ranges around the opponent's current EVs for the
 * bulk-range heatmap: step at least 8, half-span max(6 * step, 48),
 * combined cap at most 252. Returns the config unchanged when the
 * analysis is off or the configured step is already coarse enough.
 */
GridConfig focus_bulk_range(const GridConfig& config, int base_hp_ev, int base_def_ev);

/**
 * Fraction of the observed attack's rolls whose share of the defender's
 * max HP lies inside the configured damage range. The observed attack is
 * the observation event if it has rolls, else the first player attack,
 * else the first attack. Returns false when there is nothing to measure.
 */
bool damage_range_likelihood(const std::vector<timeline::TimelineSnapshot>& snapshots,
                             const GridConfig& config, double& out);

} // namespace evsim::grid

#endif // EVSIM_GRID_EV_GRID_HPP
