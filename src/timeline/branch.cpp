#include "timeline/branch.hpp"
#include <algorithm>
#include <map>
#include <sstream>
#include <unordered_map>

namespace evsim::timeline {

namespace {

constexpr char DELIM = '|';

void write_side_conditions(std::ostringstream& os, const SideConditions& s) {
    os << s.reflect << s.light_screen << s.aurora_veil << s.tailwind
       << s.helping_hand << s.friend_guard << s.stealth_rock << ':' << s.spikes;
}

void write_side(std::ostringstream& os, const Branch& b, BattleSide side) {
    const Combatant& c = b.combatants[side];
    os << c.current_hp << DELIM
       << tera_mode_to_string(c.tera_mode) << DELIM << c.tera_type << DELIM
       << c.species << DELIM << c.ability << DELIM << c.item << DELIM << c.status << DELIM;
    for (const auto& [stat, stage] : c.boosts) {
        if (stage != 0) os << stat_to_string(stat) << ':' << stage << ',';
    }
    os << DELIM;
    // std::set iterates sorted
    for (const auto& type : b.stellar_used[side]) os << type << ',';
    os << DELIM << b.last_damage[side] << DELIM;
}

} // anonymous namespace

Branch make_initial_branch(const SidePair<Combatant>& combatants, const FieldState& field) {
    Branch branch;
    branch.combatants = combatants;
    branch.field = field;
    for (BattleSide side : ALL_SIDES) {
        Combatant& c = branch.combatants[side];
        if (c.max_hp <= 0) c.max_hp = std::max(1, c.current_hp);
        if (c.current_hp < 0) c.current_hp = c.max_hp;
        c.current_hp = std::min(c.current_hp, c.max_hp);
    }
    return branch;
}

std::string canonical_key(const Branch& branch) {
    std::ostringstream os;
    write_side(os, branch, BattleSide::PLAYER);
    write_side(os, branch, BattleSide::OPPONENT);

    const FieldState& f = branch.field;
    os << f.weather << DELIM << f.terrain << DELIM
       << f.trick_room << f.wonder_room << f.magic_room << f.gravity << DELIM;
    write_side_conditions(os, f.sides.player);
    os << DELIM;
    write_side_conditions(os, f.sides.opponent);
    os << DELIM << (branch.terminated ? 1 : 0);
    return os.str();
}

std::vector<DistributionPoint> to_distribution(const std::vector<Branch>& branches,
                                               BattleSide side) {
    std::map<int, double> buckets;
    for (const auto& b : branches) {
        buckets[std::max(0, b.hp(side))] += b.probability;
    }

    double total = 0.0;
    for (const auto& [hp, p] : buckets) total += p;
    if (total <= 0.0) return {};

    std::vector<DistributionPoint> out;
    out.reserve(buckets.size());
    for (const auto& [hp, p] : buckets) {
        out.push_back({hp, p / total});
    }
    return out;
}

double weighted_average(const std::vector<DistributionPoint>& distribution) {
    double sum = 0.0;
    for (const auto& d : distribution) sum += d.hp * d.probability;
    return sum;
}

void BranchArena::merge() {
    std::unordered_map<std::string, size_t> slot_of;
    slot_of.reserve(branches_.size());

    std::vector<Branch> merged;
    merged.reserve(branches_.size());

    for (auto& branch : branches_) {
        std::string key = canonical_key(branch);
        auto it = slot_of.find(key);
        if (it != slot_of.end()) {
            merged[it->second].probability += branch.probability;
        } else {
            slot_of.emplace(std::move(key), merged.size());
            merged.push_back(std::move(branch));
        }
    }
    branches_ = std::move(merged);
}

double BranchArena::total_probability() const {
    double total = 0.0;
    for (const auto& b : branches_) total += b.probability;
    return total;
}

bool BranchArena::all_terminated() const {
    return std::all_of(branches_.begin(), branches_.end(),
                       [](const Branch& b) { return b.terminated; });
}

double BranchArena::survival(BattleSide side) const {
    double mass = 0.0;
    for (const auto& b : branches_) {
        if (b.hp(side) > 0) mass += b.probability;
    }
    return mass;
}

} // namespace evsim::timeline
