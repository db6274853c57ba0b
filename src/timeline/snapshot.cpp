#include "timeline/snapshot.hpp"
#include <cmath>

namespace evsim::timeline {

std::vector<PreEventBranch> capture_pre_event(const std::vector<Branch>& branches) {
    std::vector<PreEventBranch> out;
    out.reserve(branches.size());
    for (const auto& b : branches) {
        PreEventBranch pre;
        for (BattleSide side : ALL_SIDES) {
            pre.hp[side] = b.hp(side);
            pre.max_hp[side] = b.max_hp(side);
        }
        pre.probability = b.probability;
        out.push_back(pre);
    }
    return out;
}

bool build_snapshot(const std::vector<Branch>& branches, SnapshotParams params,
                    TimelineSnapshot& out) {
    if (branches.empty()) return false;

    TimelineSnapshot snap;
    snap.turn = params.turn;
    snap.event_id = std::move(params.event_id);
    snap.sequence = params.sequence;
    snap.description = std::move(params.description);
    snap.has_actor = params.has_actor;
    snap.actor = params.actor;
    snap.damage_rolls = std::move(params.damage_rolls);

    snap.hp_distribution = to_distribution(branches, BattleSide::PLAYER);
    snap.opponent_hp_distribution = to_distribution(branches, BattleSide::OPPONENT);

    SidePair<double> average;
    average.player = snap.hp_distribution.empty()
        ? branches.front().hp(BattleSide::PLAYER) : weighted_average(snap.hp_distribution);
    average.opponent = snap.opponent_hp_distribution.empty()
        ? branches.front().hp(BattleSide::OPPONENT) : weighted_average(snap.opponent_hp_distribution);

    for (BattleSide side : ALL_SIDES) {
        snap.hp[side] = static_cast<int>(std::lround(average[side]));
        snap.max_hp[side] = branches.front().max_hp(side);
    }
    for (const auto& b : branches) snap.probability += b.probability;

    if (params.before && !params.before->empty()) {
        double total = 0.0;
        SidePair<double> hp_before;
        SidePair<double> max_before;
        for (const auto& pre : *params.before) {
            total += pre.probability;
            for (BattleSide side : ALL_SIDES) {
                hp_before[side] += pre.hp[side] * pre.probability;
                max_before[side] += pre.max_hp[side] * pre.probability;
            }
        }
        if (total <= 0.0) total = 1.0;

        snap.has_delta = true;
        for (BattleSide side : ALL_SIDES) {
            snap.delta_hp[side] = hp_before[side] / total - average[side];
            snap.max_hp_before[side] = max_before[side] / total;
        }
    }

    out = std::move(snap);
    return true;
}

} // namespace evsim::timeline
