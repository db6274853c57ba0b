/**
 * Branch — one hypothesized world-state with its probability mass.
 *
 * Branches are plain values. Each one owns its combatants and field, so
 * an event can copy a branch and mutate the copy without touching
 * siblings. The population lives in a BranchArena; after every event the
 * arena is merged so that branches with the same canonical key collapse
 * into one, summing mass.
 */

#ifndef EVSIM_TIMELINE_BRANCH_HPP
#define EVSIM_TIMELINE_BRANCH_HPP

#include "core/battle_types.hpp"
#include <set>
#include <string>
#include <vector>

namespace evsim::timeline {

struct Branch {
    SidePair<Combatant> combatants;             // current_hp / max_hp are authoritative
    SidePair<std::set<std::string>> stellar_used;
    SidePair<int> last_damage;
    FieldState field;
    double probability = 1.0;
    bool terminated = false;

    int hp(BattleSide side) const { return combatants[side].current_hp; }
    int max_hp(BattleSide side) const { return combatants[side].max_hp; }
    void set_hp(BattleSide side, int value) { combatants[side].current_hp = value; }

    bool any_side_down() const { return hp(BattleSide::PLAYER) <= 0 || hp(BattleSide::OPPONENT) <= 0; }
};

/**
 * Starting branch for a pair of combatants. Max HP falls back to the
 * current HP (or 1); a current HP of -1 means full.
 */
Branch make_initial_branch(const SidePair<Combatant>& combatants, const FieldState& field);

/**
 * Merge key: HP, tera state, stellar markers, species/ability/item/status,
 * non-zero boosts and last damage per side, the field signature and the
 * terminated flag.
 */
std::string canonical_key(const Branch& branch);

struct DistributionPoint {
    int hp = 0;
    double probability = 0.0;
};

/// Mass grouped by HP for one side, normalized and sorted by HP.
std::vector<DistributionPoint> to_distribution(const std::vector<Branch>& branches,
                                               BattleSide side);

/// Sum of hp * probability; 0 for an empty distribution.
double weighted_average(const std::vector<DistributionPoint>& distribution);

class BranchArena {
public:
    BranchArena() = default;
    explicit BranchArena(Branch initial) { branches_.push_back(std::move(initial)); }

    std::vector<Branch>& branches() { return branches_; }
    const std::vector<Branch>& branches() const { return branches_; }

    /// Replace the population (the output of one event).
    void assign(std::vector<Branch> next) { branches_ = std::move(next); }

    /**
     * Collapse branches with equal canonical keys. The first branch of a
     * key keeps its slot and absorbs the mass of later ones.
     */
    void merge();

    double total_probability() const;
    bool all_terminated() const;

    /// Mass of branches where the side still has HP.
    double survival(BattleSide side) const;

    size_t size() const { return branches_.size(); }

private:
    std::vector<Branch> branches_;
};

} // namespace evsim::timeline

#endif // EVSIM_TIMELINE_BRANCH_HPP
