/**
 * TimelineSimulator — Branch State Machine over a scripted scenario.
 *
 * Starting from one branch, every action and event maps each branch to
 * zero or more children (attacks split one child per damage roll), and
 * the population is merged by canonical key after every step so its size
 * tracks the number of distinct reachable states.
 *
 * Per turn (only the first MAX_TIMELINE_TURNS are simulated):
 *   1. turn-start events without a linked action
 *   2. actions in order; after each, a snapshot and the events linked to it
 *   3. action-phase events without a linked action
 *   4. end-of-turn Leftovers recovery
 *   5. turn-end events
 * The simulation stops as soon as every branch is terminated.
 */

#ifndef EVSIM_TIMELINE_TIMELINE_SIMULATOR_HPP
#define EVSIM_TIMELINE_TIMELINE_SIMULATOR_HPP

#include "damage/damage_cache.hpp"
#include "damage/damage_calculator.hpp"
#include "data/game_data.hpp"
#include "timeline/branch.hpp"
#include "timeline/scenario.hpp"
#include "timeline/snapshot.hpp"
#include <string>
#include <vector>

namespace evsim::timeline {

struct SimulationOptions {
    BattleStyle style = BattleStyle::SINGLES;
    bool allow_raid_stellar = false;

    // Observation event: mass whose damage / max HP of the target lies in
    // [observation_min, observation_max] (fractions, inclusive).
    std::string observation_event_id;
    bool has_observation_range = false;
    double observation_min = 0.0;
    double observation_max = 1.0;
};

struct SimulationResult {
    SidePair<double> survival;
    SidePair<std::vector<DistributionPoint>> final_distribution;
    std::vector<TimelineSnapshot> snapshots;
    double observation_likelihood = 0.0;
    size_t peak_branches = 0;
};

class TimelineSimulator {
public:
    /**
     * @param data  catalog used to resolve move types for stellar
     *              bookkeeping; may be nullptr (every move is Normal)
     */
    TimelineSimulator(damage::DamageCache& cache,
                      damage::DamageCalculator& calculator,
                      const data::GameData* data = nullptr);

    /**
     * Run the scenario once.
     * @throws ComputationError from the damage calculator
     */
    SimulationResult simulate(const Scenario& scenario,
                              const SidePair<Combatant>& combatants,
                              const FieldState& field,
                              const SimulationOptions& options);

private:
    struct RunState;

    struct EventOutcome {
        std::vector<Branch> branches;
        double observation = 0.0;
        std::vector<int> damage_rolls;
    };

    damage::DamageCache& cache_;
    damage::DamageCalculator& calculator_;
    const data::GameData* data_;

    /// Returns true when every branch is terminated afterwards.
    bool run_events(RunState& st, const std::vector<const BattleEvent*>& events);

    void commit(RunState& st, EventOutcome outcome, const std::string& id,
                SnapshotParams params, const std::vector<PreEventBranch>& before);

    EventOutcome process_event(const BattleEvent& event, RunState& st);
    EventOutcome process_action(const BattleAction& action, RunState& st);

    EventOutcome process_attack(BattleSide actor, bool has_target, BattleSide target,
                                const MoveConfig& move, const std::string& event_id,
                                RunState& st);

    MoveConfig prepare_move(const MoveConfig& move, const Branch& branch,
                            BattleSide actor, const SimulationOptions& options) const;
};

} // namespace evsim::timeline

#endif // EVSIM_TIMELINE_TIMELINE_SIMULATOR_HPP
