#include "grid/ev_grid.hpp"
#include "core/errors.hpp"
#include "core/stat_formula.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace evsim::grid {

namespace {

struct MetaProfile {
    const char* name;
    double hp_mean;
    double def_mean;
    double hp_sigma;
    double def_sigma;
    double correlation;
};

// Common defensive spreads seen in competitive play
constexpr MetaProfile META_PROFILES[] = {
    { "bulky",    244.0, 108.0, 42.0, 36.0, 0.35 },
    { "balanced", 196.0,  92.0, 48.0, 40.0, 0.20 },
    { "agile",    164.0,  68.0, 50.0, 34.0, 0.10 },
};

const MetaProfile& find_profile(const std::string& name) {
    for (const auto& p : META_PROFILES) {
        if (name == p.name) return p;
    }
    return META_PROFILES[1];
}

double bivariate_gaussian(int hp_ev, int def_ev, const MetaProfile& p) {
    double x = (hp_ev - p.hp_mean) / p.hp_sigma;
    double y = (def_ev - p.def_mean) / p.def_sigma;
    double rho = p.correlation;
    double exponent = -1.0 / (2.0 * (1.0 - rho * rho)) * (x * x - 2.0 * rho * x * y + y * y);
    return std::exp(exponent);
}

void check_range(const EvRange& range, const char* name) {
    if (range.min < 0 || range.max < range.min || range.max > MAX_STAT_EV) {
        throw ConfigurationError(std::string("Invalid ") + name + " range [" +
                                 std::to_string(range.min) + ", " +
                                 std::to_string(range.max) + "]");
    }
}

} // anonymous namespace

// ── Configuration ──

std::string prior_type_to_string(PriorType type) {
    switch (type) {
        case PriorType::UNIFORM: return "uniform";
        case PriorType::META:    return "meta";
        case PriorType::CUSTOM:  return "custom";
    }
    return "uniform";
}

PriorType prior_type_from_string(const std::string& s, PriorType def) {
    if (s == "uniform") return PriorType::UNIFORM;
    if (s == "meta")    return PriorType::META;
    if (s == "custom")  return PriorType::CUSTOM;
    return def;
}

int GridConfig::defense_step() const {
    return std::max(MIN_GRID_STEP, axis_step);
}

int GridConfig::offense_grid_step() const {
    return std::max(MIN_GRID_STEP, offense_step > 0 ? offense_step : axis_step);
}

void validate_config(const GridConfig& config) {
    if (config.axis_step <= 0) {
        throw ConfigurationError("axisStep must be positive, got " +
                                 std::to_string(config.axis_step));
    }
    if (config.offense_step < 0) {
        throw ConfigurationError("offenseStep must be positive, got " +
                                 std::to_string(config.offense_step));
    }
    if (config.axis_step > MAX_STAT_EV || config.offense_step > MAX_STAT_EV) {
        throw ConfigurationError("Grid step exceeds " + std::to_string(MAX_STAT_EV) + " EVs");
    }
    check_range(config.hp_range, "hp");
    check_range(config.def_range, "def");
    check_range(config.atk_range, "atk");
    check_range(config.spa_range, "spa");
    if (config.has_observation_percent &&
        config.observation_max_percent < config.observation_min_percent) {
        throw ConfigurationError("observationPercent is reversed");
    }
    if (config.has_opponent_damage_range &&
        config.damage_range_max_percent < config.damage_range_min_percent) {
        throw ConfigurationError("opponentDamageRange is reversed");
    }
}

// ── Grid construction ──

double prior_weight(const PriorConfig& prior, int hp_ev, int def_ev) {
    if (prior.type == PriorType::UNIFORM) return 1.0;

    if (prior.type == PriorType::CUSTOM && !prior.custom_weights.empty()) {
        for (const auto& entry : prior.custom_weights) {
            if (entry.hp_ev == hp_ev && entry.def_ev == def_ev) {
                return std::max(entry.weight, 0.0);
            }
        }
        return UNLISTED_CUSTOM_WEIGHT;
    }

    // META, or CUSTOM without a table
    return bivariate_gaussian(hp_ev, def_ev, find_profile(prior.meta_profile));
}

std::vector<GridPoint> build_defense_grid(const GridConfig& config) {
    validate_config(config);

    const int step = config.defense_step();
    std::vector<GridPoint> points;
    for (int hp = config.hp_range.min; hp <= config.hp_range.max; hp += step) {
        for (int def = config.def_range.min; def <= config.def_range.max; def += step) {
            if (config.has_max_combined && hp + def > config.max_combined) continue;

            GridPoint p;
            p.kind = PointKind::DEFENSE;
            p.hp_ev = hp;
            p.def_ev = def;
            p.prior_weight = prior_weight(config.prior, hp, def);
            p.weight = p.prior_weight;
            points.push_back(p);
        }
    }
    if (points.empty()) {
        throw ConfigurationError("Defensive grid has no points under the combined EV cap");
    }

    normalize_weights(points);
    return points;
}

std::vector<GridPoint> build_offense_grid(const GridConfig& config) {
    validate_config(config);

    const int step = config.offense_grid_step();
    bool has_limit = config.has_offense_max_combined || config.has_max_combined;
    int limit = config.has_offense_max_combined ? config.offense_max_combined
                                                : config.max_combined;

    std::vector<GridPoint> points;
    for (int atk = config.atk_range.min; atk <= config.atk_range.max; atk += step) {
        for (int spa = config.spa_range.min; spa <= config.spa_range.max; spa += step) {
            if (has_limit && atk + spa > limit) continue;

            GridPoint p;
            p.kind = PointKind::OFFENSE;
            p.atk_ev = atk;
            p.spa_ev = spa;
            points.push_back(p);
        }
    }
    if (points.empty()) {
        throw ConfigurationError("Offensive grid has no points under the combined EV cap");
    }

    normalize_weights(points);
    return points;
}

void normalize_weights(std::vector<GridPoint>& points) {
    double sum = 0.0;
    for (const auto& p : points) sum += p.weight;

    if (!(sum > 0.0)) {
        double uniform = 1.0 / static_cast<double>(std::max<size_t>(points.size(), 1));
        for (auto& p : points) p.weight = uniform;
        return;
    }
    for (auto& p : points) p.weight /= sum;
}

void apply_observation_likelihoods(std::vector<GridPoint>& points,
                                   const std::vector<double>* likelihoods) {
    if (likelihoods) {
        for (size_t i = 0; i < points.size(); i++) {
            double l = i < likelihoods->size() ? std::max((*likelihoods)[i], 0.0) : 0.0;
            points[i].has_observation = true;
            points[i].observation_likelihood = l;
            points[i].weight = points[i].prior_weight * l;
        }
    }
    normalize_weights(points);
}

double aggregate_survival(const std::vector<GridPoint>& points) {
    double total = 0.0;
    for (const auto& p : points) total += p.weight * (p.has_survival ? p.survival : 0.0);
    return total;
}

double aggregate_ko_chance(const std::vector<GridPoint>& points) {
    double total = 0.0;
    for (const auto& p : points) total += p.weight * (p.has_ko_chance ? p.ko_chance : 0.0);
    return total;
}

// ── Reporting ──

std::string heatmap_metric_to_string(HeatmapMetric metric) {
    return metric == HeatmapMetric::DAMAGE_RANGE ? "damageRange" : "survival";
}

std::vector<HeatmapCell> build_heatmap(const std::vector<GridPoint>& points,
                                       HeatmapMetric metric) {
    std::vector<HeatmapCell> cells;
    cells.reserve(points.size());
    for (const auto& p : points) {
        HeatmapCell c;
        c.hp_ev = p.hp_ev;
        c.def_ev = p.def_ev;
        c.weight = p.weight;
        c.metric = metric;
        if (metric == HeatmapMetric::DAMAGE_RANGE) {
            c.value = p.has_damage_range ? p.damage_range_likelihood : 0.0;
        } else {
            c.value = p.has_survival ? p.survival : 0.0;
        }
        cells.push_back(c);
    }
    return cells;
}

std::vector<SurvivalPlan> rank_top_plans(const std::vector<GridPoint>& points, double target) {
    auto survival_of = [](const GridPoint* p) { return p->has_survival ? p->survival : 0.0; };

    std::vector<const GridPoint*> sorted;
    for (const auto& p : points) sorted.push_back(&p);

    std::vector<SurvivalPlan> plans;

    if (target <= 0.0) {
        std::stable_sort(sorted.begin(), sorted.end(),
            [&](const GridPoint* a, const GridPoint* b) { return survival_of(a) > survival_of(b); });
        for (size_t i = 0; i < sorted.size() && i < static_cast<size_t>(MAX_PLANS); i++) {
            plans.push_back({ sorted[i]->hp_ev, sorted[i]->def_ev, survival_of(sorted[i]),
                              sorted[i]->defense_total(), false });
        }
        return plans;
    }

    std::vector<const GridPoint*> candidates;
    for (const GridPoint* p : sorted) {
        if (survival_of(p) >= target - PLAN_TARGET_EPS) candidates.push_back(p);
    }
    if (candidates.empty()) return plans;

    std::stable_sort(candidates.begin(), candidates.end(),
        [&](const GridPoint* a, const GridPoint* b) {
            if (a->defense_total() != b->defense_total()) {
                return a->defense_total() < b->defense_total();
            }
            return survival_of(a) > survival_of(b);
        });

    const int min_total = candidates.front()->defense_total();
    for (const GridPoint* p : candidates) {
        if (p->defense_total() != min_total) break;
        plans.push_back({ p->hp_ev, p->def_ev, survival_of(p), p->defense_total(), true });
    }
    return plans;
}

std::vector<OffensePlan> rank_offense_plans(const std::vector<GridPoint>& points, double target) {
    std::vector<OffensePlan> entries;
    for (const auto& p : points) {
        if (p.kind != PointKind::OFFENSE || !p.has_ko_chance) continue;
        entries.push_back({ p.atk_ev, p.spa_ev, p.ko_chance, p.offense_total(), false });
    }
    if (entries.empty()) return entries;

    const bool has_target = target > 0.0;
    auto meets = [&](const OffensePlan& e) {
        return has_target && e.ko_chance >= target - PLAN_TARGET_EPS;
    };

    std::stable_sort(entries.begin(), entries.end(),
        [](const OffensePlan& a, const OffensePlan& b) {
            if (a.ko_chance != b.ko_chance) return a.ko_chance > b.ko_chance;
            if (a.total_ev != b.total_ev) return a.total_ev < b.total_ev;
            if (a.atk_ev != b.atk_ev) return a.atk_ev < b.atk_ev;
            return a.spa_ev < b.spa_ev;
        });

    std::vector<OffensePlan> pool;
    if (has_target) {
        for (const auto& e : entries) {
            if (meets(e)) pool.push_back(e);
        }
    }
    if (pool.empty()) pool = entries;

    std::vector<OffensePlan> selected;
    size_t i = 0;
    while (i < pool.size() && selected.size() < static_cast<size_t>(MAX_PLANS)) {
        const double tier_chance = pool[i].ko_chance;
        size_t tier_end = i;
        int min_ev = std::numeric_limits<int>::max();
        while (tier_end < pool.size() &&
               std::abs(pool[tier_end].ko_chance - tier_chance) <= PLAN_TARGET_EPS) {
            min_ev = std::min(min_ev, pool[tier_end].total_ev);
            tier_end++;
        }
        for (size_t j = i; j < tier_end && selected.size() < static_cast<size_t>(MAX_PLANS); j++) {
            if (pool[j].total_ev == min_ev) selected.push_back(pool[j]);
        }
        i = tier_end;
    }

    for (auto& plan : selected) plan.meets_target = meets(plan);
    return selected;
}

const GridPoint* find_nearest_point(const std::vector<GridPoint>& points, int hp_ev, int def_ev) {
    const GridPoint* best = nullptr;
    int best_distance = std::numeric_limits<int>::max();
    for (const auto& p : points) {
        int distance = std::abs(p.hp_ev - hp_ev) + std::abs(p.def_ev - def_ev);
        if (distance < best_distance) {
            best = &p;
            best_distance = distance;
        }
    }
    return best;
}

Sensitivity compute_sensitivity(const std::vector<GridPoint>& points,
                                int base_hp_ev, int base_def_ev, int step) {
    Sensitivity s;
    const GridPoint* nearest = find_nearest_point(points, base_hp_ev, base_def_ev);
    if (!nearest) return s;

    auto find_exact = [&](int hp_ev, int def_ev) -> const GridPoint* {
        for (const auto& p : points) {
            if (p.hp_ev == hp_ev && p.def_ev == def_ev) return &p;
        }
        return nullptr;
    };
    const GridPoint* hp_up = find_exact(nearest->hp_ev + step, nearest->def_ev);
    const GridPoint* def_up = find_exact(nearest->hp_ev, nearest->def_ev + step);

    auto survival_of = [](const GridPoint* p, double fallback) {
        return (p && p->has_survival) ? p->survival : fallback;
    };
    double base = survival_of(nearest, 0.0);
    double divisor = static_cast<double>(std::max(step, 1));

    s.hp = (survival_of(hp_up, base) - base) / divisor;
    s.def = (survival_of(def_up, base) - base) / divisor;
    return s;
}

// ── Opponent bulk-range analysis ──

GridConfig focus_bulk_range(const GridConfig& config, int base_hp_ev, int base_def_ev) {
    if (!config.wants_damage_range()) return config;

    const int step = std::max(config.axis_step, 8);
    if (step <= config.axis_step) return config;

    const int span = std::max(step * 6, 48);
    const int half = std::max(span, step * 3);

    auto clamp_around = [&](const EvRange& range, int center) {
        EvRange next;
        next.min = std::max(range.min, center - half);
        next.max = std::min(range.max, center + half);
        if (next.max - next.min < step * 3) return range;
        return next;
    };

    GridConfig focused = config;
    focused.axis_step = step;
    focused.hp_range = clamp_around(config.hp_range, base_hp_ev);
    focused.def_range = clamp_around(config.def_range, base_def_ev);
    focused.has_max_combined = true;
    focused.max_combined = std::min(config.has_max_combined ? config.max_combined : 252, 252);
    return focused;
}

bool damage_range_likelihood(const std::vector<timeline::TimelineSnapshot>& snapshots,
                             const GridConfig& config, double& out) {
    if (config.target_side != BattleSide::OPPONENT ||
        !config.enable_opponent_bulk_range || !config.has_opponent_damage_range) {
        return false;
    }

    const timeline::TimelineSnapshot* observed = nullptr;
    const timeline::TimelineSnapshot* first_player = nullptr;
    const timeline::TimelineSnapshot* first = nullptr;
    for (const auto& snap : snapshots) {
        if (snap.damage_rolls.empty()) continue;
        if (!first) first = &snap;
        if (!first_player && snap.has_actor && snap.actor == BattleSide::PLAYER) {
            first_player = &snap;
        }
        if (!observed && !config.observation_event_id.empty() &&
            snap.event_id == config.observation_event_id) {
            observed = &snap;
        }
    }

    const timeline::TimelineSnapshot* target = observed ? observed
                                             : first_player ? first_player : first;
    if (!target || !target->has_actor) return false;

    BattleSide defender = opposite(target->actor);
    int max_hp = target->max_hp[defender];
    if (max_hp <= 0) return false;

    double lo = config.damage_range_min_percent / 100.0;
    double hi = config.damage_range_max_percent / 100.0;
    int matches = 0;
    for (int roll : target->damage_rolls) {
        double share = static_cast<double>(roll) / max_hp;
        if (share >= lo && share <= hi) matches++;
    }
    out = static_cast<double>(matches) / static_cast<double>(target->damage_rolls.size());
    return true;
}

} // namespace evsim::grid
