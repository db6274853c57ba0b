/**
 * TimelineSnapshot — probability-weighted view of the branch population
 * right after one action or event.
 */

#ifndef EVSIM_TIMELINE_SNAPSHOT_HPP
#define EVSIM_TIMELINE_SNAPSHOT_HPP

#include "timeline/branch.hpp"
#include <string>
#include <vector>

namespace evsim::timeline {

struct TimelineSnapshot {
    int turn = 0;
    std::string event_id;
    int sequence = 0;
    std::string description;
    bool has_actor = false;
    BattleSide actor = BattleSide::PLAYER;

    SidePair<int> hp;                   // rounded weighted average
    SidePair<int> max_hp;
    double probability = 0.0;

    std::vector<DistributionPoint> hp_distribution;           // player
    std::vector<DistributionPoint> opponent_hp_distribution;

    std::vector<int> damage_rolls;      // attacks only

    bool has_delta = false;
    SidePair<double> delta_hp;          // average HP before minus after
    SidePair<double> max_hp_before;
};

/// HP, max HP and mass of each branch before an event, for delta reporting.
struct PreEventBranch {
    SidePair<int> hp;
    SidePair<int> max_hp;
    double probability = 0.0;
};

std::vector<PreEventBranch> capture_pre_event(const std::vector<Branch>& branches);

struct SnapshotParams {
    int turn = 0;
    std::string event_id;
    int sequence = 0;
    std::string description;
    bool has_actor = false;
    BattleSide actor = BattleSide::PLAYER;
    const std::vector<PreEventBranch>* before = nullptr;
    std::vector<int> damage_rolls;
};

/**
 * Build a snapshot of the merged population.
 * Returns false (and leaves out untouched) when there are no branches.
 */
bool build_snapshot(const std::vector<Branch>& branches, SnapshotParams params,
                    TimelineSnapshot& out);

} // namespace evsim::timeline

#endif // EVSIM_TIMELINE_SNAPSHOT_HPP
