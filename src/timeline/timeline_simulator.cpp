#include "timeline/timeline_simulator.hpp"
#include <algorithm>
#include <cmath>

namespace evsim::timeline {

struct TimelineSimulator::RunState {
    explicit RunState(const SimulationOptions& opts) : options(opts) {}

    const SimulationOptions& options;
    BranchArena arena;
    std::vector<TimelineSnapshot> snapshots;
    int sequence = 0;
    int turn = 0;
    double observation = 0.0;
    size_t peak_branches = 0;
};

namespace {

int clamp_stage(int value) {
    return std::max(MIN_STAGE, std::min(MAX_STAGE, value));
}

int floor_to_int(double value) {
    if (!std::isfinite(value)) return 0;
    return static_cast<int>(std::floor(value));
}

// ── Non-attack event rules ──
// Each takes the pre-event population and returns the post-event one.

std::vector<Branch> apply_stat_change(const BattleEvent& ev, const StatChangeEvent& change,
                                      const std::vector<Branch>& branches) {
    if (!ev.has_actor) return branches;
    std::vector<Branch> out;
    out.reserve(branches.size());
    for (const auto& branch : branches) {
        out.push_back(branch);
        if (branch.terminated) continue;

        BoostTable& boosts = out.back().combatants[ev.actor].boosts;
        for (const auto& [stat, delta] : change.stages) {
            auto it = boosts.find(stat);
            int next = clamp_stage((it != boosts.end() ? it->second : 0) + delta);
            if (next == 0) {
                boosts.erase(stat);
            } else {
                boosts[stat] = next;
            }
        }
    }
    return out;
}

int resolve_hp_amount(const HpAdjustmentEvent& adj, int max_hp, int last_damage) {
    bool has_fraction = adj.denominator != 0.0;
    double fraction = has_fraction ? adj.numerator / adj.denominator : 0.0;
    double amount = std::isfinite(adj.amount) ? adj.amount : 0.0;

    switch (adj.mode) {
        case HpAdjustMode::PERCENT_MAX:
            return floor_to_int(max_hp * amount / 100.0);
        case HpAdjustMode::PERCENT_LAST_DAMAGE:
            return floor_to_int(last_damage * amount / 100.0);
        case HpAdjustMode::FRACTION_MAX:
            if (has_fraction) return floor_to_int(max_hp * std::max(0.0, fraction));
            break;
        case HpAdjustMode::FRACTION_LAST_DAMAGE:
            if (has_fraction) return floor_to_int(last_damage * std::max(0.0, fraction));
            break;
        case HpAdjustMode::ABSOLUTE:
            break;
    }
    // Fraction modes without a fraction fall back to the raw amount
    return floor_to_int(amount);
}

std::vector<Branch> apply_hp_adjustment(const BattleEvent& ev, const HpAdjustmentEvent& adj,
                                        const std::vector<Branch>& branches) {
    if (!adj.has_target && !ev.has_actor) return branches;
    BattleSide side = adj.has_target ? adj.target : ev.actor;

    std::vector<Branch> out;
    out.reserve(branches.size());
    for (const auto& branch : branches) {
        out.push_back(branch);
        if (branch.terminated) continue;

        Branch& b = out.back();
        int amount = resolve_hp_amount(adj, b.max_hp(side), b.last_damage[side]);
        if (adj.is_damage) {
            int dmg = std::max(0, std::min(amount, b.hp(side)));
            b.set_hp(side, b.hp(side) - dmg);
            b.last_damage[side] = dmg;
            if (b.hp(side) <= 0) b.terminated = true;
        } else {
            b.set_hp(side, std::min(b.max_hp(side), b.hp(side) + std::abs(amount)));
        }
    }
    return out;
}

int resolve_heal_amount(const HealingEvent& heal, int max_hp) {
    switch (heal.kind) {
        case HealingEvent::Kind::FRACTION: {
            double ratio = 0.0;
            if (heal.has_fraction) {
                ratio = heal.fraction;
            } else if (heal.denominator != 0.0) {
                ratio = heal.numerator / heal.denominator;
            }
            return std::max(floor_to_int(max_hp * std::max(0.0, ratio)), 1);
        }
        case HealingEvent::Kind::RANGE_MIN:
        case HealingEvent::Kind::ABSOLUTE:
            return heal.amount;
    }
    return 0;
}

std::vector<Branch> apply_healing(const BattleEvent& ev, const HealingEvent& heal,
                                  const std::vector<Branch>& branches) {
    if (!ev.has_actor) return branches;
    std::vector<Branch> out;
    out.reserve(branches.size());
    for (const auto& branch : branches) {
        out.push_back(branch);
        if (branch.terminated) continue;

        Branch& b = out.back();
        int amount = std::max(0, resolve_heal_amount(heal, b.max_hp(ev.actor)));
        b.set_hp(ev.actor, std::min(b.max_hp(ev.actor), b.hp(ev.actor) + amount));
    }
    return out;
}

// Status changes touch every branch, terminated ones included.
std::vector<Branch> apply_status(const BattleEvent& ev, const StatusEvent& status,
                                 const std::vector<Branch>& branches) {
    if (!ev.has_actor) return branches;
    std::vector<Branch> out = branches;
    for (auto& b : out) {
        b.combatants[ev.actor].status = status.clears ? std::string() : status.status;
    }
    return out;
}

std::vector<Branch> apply_switch(BattleSide side, const SwitchEvent& sw,
                                 const std::vector<Branch>& branches) {
    std::vector<Branch> out;
    out.reserve(branches.size());
    for (const auto& branch : branches) {
        out.push_back(branch);
        if (branch.terminated) continue;

        Branch& b = out.back();
        Combatant& c = b.combatants[side];
        if (!sw.species.empty()) c.species = sw.species;
        if (sw.has_ability) c.ability = sw.ability;
        if (sw.has_item) c.item = sw.item;
        c.status.clear();
        c.boosts.clear();
        c.tera_mode = TeraMode::NONE;
        c.tera_type.clear();

        if (sw.has_hp_percent) {
            double pct = std::max(0.0, std::min(100.0, sw.hp_percent));
            int hp = static_cast<int>(std::lround(c.max_hp * pct / 100.0));
            c.current_hp = std::max(0, std::min(c.max_hp, hp));
        } else {
            c.current_hp = c.max_hp;
        }
        b.last_damage[side] = 0;
    }
    return out;
}

std::vector<Branch> apply_field_toggle(const FieldToggleEvent& toggle,
                                       const std::vector<Branch>& branches) {
    std::vector<Branch> out = branches;
    for (auto& b : out) {
        b.field = merge_field(b.field, toggle.update);
    }
    return out;
}

void apply_leftovers(std::vector<Branch>& branches) {
    for (auto& b : branches) {
        if (b.terminated) continue;
        for (BattleSide side : ALL_SIDES) {
            const Combatant& c = b.combatants[side];
            if (c.item != "Leftovers") continue;
            if (c.current_hp <= 0 || c.current_hp >= c.max_hp) continue;
            int recovery = std::max(1, c.max_hp / 16);
            b.set_hp(side, std::min(c.max_hp, c.current_hp + recovery));
        }
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// TimelineSimulator
// ═══════════════════════════════════════════════════════════════

TimelineSimulator::TimelineSimulator(damage::DamageCache& cache,
                                     damage::DamageCalculator& calculator,
                                     const data::GameData* data)
    : cache_(cache), calculator_(calculator), data_(data) {}

SimulationResult TimelineSimulator::simulate(const Scenario& scenario,
                                             const SidePair<Combatant>& combatants,
                                             const FieldState& field,
                                             const SimulationOptions& options) {
    RunState st(options);
    st.arena = BranchArena(make_initial_branch(combatants, field));
    st.peak_branches = 1;

    size_t turn_count = std::min(scenario.turns.size(),
                                 static_cast<size_t>(MAX_TIMELINE_TURNS));

    for (size_t t = 0; t < turn_count; t++) {
        const TimelineTurn& turn = scenario.turns[t];
        st.turn = turn.turn;

        std::vector<const BattleEvent*> turn_start;
        std::vector<const BattleEvent*> action_unlinked;
        std::vector<const BattleEvent*> turn_end;
        for (const auto& ev : turn.events) {
            if (ev.timing == EventTiming::TURN_START && ev.related_action_id.empty()) {
                turn_start.push_back(&ev);
            } else if (ev.timing == EventTiming::ACTION && ev.related_action_id.empty()) {
                action_unlinked.push_back(&ev);
            } else if (ev.timing == EventTiming::TURN_END) {
                turn_end.push_back(&ev);
            }
        }

        if (run_events(st, turn_start)) break;

        bool stop = false;
        for (const BattleAction* action : order_actions(turn, options.style)) {
            std::vector<PreEventBranch> before = capture_pre_event(st.arena.branches());
            EventOutcome outcome = process_action(*action, st);

            SnapshotParams params;
            params.description = describe_action(*action);
            params.has_actor = true;
            params.actor = action->actor;
            commit(st, std::move(outcome), action->id, std::move(params), before);

            std::vector<const BattleEvent*> linked;
            for (const auto& ev : turn.events) {
                if (ev.timing == EventTiming::ACTION && ev.related_action_id == action->id) {
                    linked.push_back(&ev);
                }
            }
            if (run_events(st, linked) || st.arena.all_terminated()) {
                stop = true;
                break;
            }
        }
        if (stop || st.arena.all_terminated()) break;

        if (run_events(st, action_unlinked)) break;

        apply_leftovers(st.arena.branches());
        st.arena.merge();

        if (run_events(st, turn_end)) break;
        if (st.arena.all_terminated()) break;
    }

    SimulationResult result;
    for (BattleSide side : ALL_SIDES) {
        result.survival[side] = st.arena.survival(side);
        result.final_distribution[side] = to_distribution(st.arena.branches(), side);
    }
    result.snapshots = std::move(st.snapshots);
    result.observation_likelihood = st.observation;
    result.peak_branches = st.peak_branches;
    return result;
}

bool TimelineSimulator::run_events(RunState& st, const std::vector<const BattleEvent*>& events) {
    for (const BattleEvent* ev : events) {
        std::vector<PreEventBranch> before = capture_pre_event(st.arena.branches());
        EventOutcome outcome = process_event(*ev, st);

        SnapshotParams params;
        params.description = !ev->label.empty() ? ev->label : ev->id;
        params.has_actor = ev->has_actor;
        params.actor = ev->actor;
        commit(st, std::move(outcome), ev->id, std::move(params), before);

        if (st.arena.all_terminated()) return true;
    }
    return false;
}

void TimelineSimulator::commit(RunState& st, EventOutcome outcome, const std::string& id,
                               SnapshotParams params, const std::vector<PreEventBranch>& before) {
    st.peak_branches = std::max(st.peak_branches, outcome.branches.size());
    st.arena.assign(std::move(outcome.branches));
    st.arena.merge();

    if (!st.options.observation_event_id.empty() && id == st.options.observation_event_id) {
        st.observation = outcome.observation;
    }

    params.turn = st.turn;
    params.event_id = id;
    params.sequence = st.sequence++;
    params.before = &before;
    params.damage_rolls = std::move(outcome.damage_rolls);

    TimelineSnapshot snap;
    if (build_snapshot(st.arena.branches(), std::move(params), snap)) {
        st.snapshots.push_back(std::move(snap));
    }
}

TimelineSimulator::EventOutcome
TimelineSimulator::process_event(const BattleEvent& ev, RunState& st) {
    const std::vector<Branch>& branches = st.arena.branches();

    return std::visit(Overloaded{
        [&](const AttackEvent& a) {
            if (!ev.has_actor) return EventOutcome{branches, 0.0, {}};
            return process_attack(ev.actor, a.has_target, a.target, a.move, ev.id, st);
        },
        [&](const HealingEvent& h) {
            return EventOutcome{apply_healing(ev, h, branches), 0.0, {}};
        },
        [&](const HpAdjustmentEvent& h) {
            return EventOutcome{apply_hp_adjustment(ev, h, branches), 0.0, {}};
        },
        [&](const StatChangeEvent& s) {
            return EventOutcome{apply_stat_change(ev, s, branches), 0.0, {}};
        },
        [&](const StatusEvent& s) {
            return EventOutcome{apply_status(ev, s, branches), 0.0, {}};
        },
        [&](const SwitchEvent& s) {
            if (!ev.has_actor) return EventOutcome{branches, 0.0, {}};
            return EventOutcome{apply_switch(ev.actor, s, branches), 0.0, {}};
        },
        [&](const FieldToggleEvent& f) {
            return EventOutcome{apply_field_toggle(f, branches), 0.0, {}};
        },
    }, ev.payload);
}

TimelineSimulator::EventOutcome
TimelineSimulator::process_action(const BattleAction& action, RunState& st) {
    const std::vector<Branch>& branches = st.arena.branches();

    return std::visit(Overloaded{
        [&](const MoveAction& m) {
            return process_attack(action.actor, m.has_target, m.target, m.move, action.id, st);
        },
        [&](const SwitchEvent& s) {
            return EventOutcome{apply_switch(action.actor, s, branches), 0.0, {}};
        },
        [&](const PassAction&) {
            return EventOutcome{branches, 0.0, {}};
        },
    }, action.payload);
}

MoveConfig TimelineSimulator::prepare_move(const MoveConfig& move, const Branch& branch,
                                           BattleSide actor,
                                           const SimulationOptions& options) const {
    const Combatant& attacker = branch.combatants[actor];
    MoveConfig prepared = move;
    if (!prepared.has_tera_mode) {
        prepared.has_tera_mode = true;
        prepared.tera_mode = attacker.tera_mode;
    }
    if (prepared.tera_type.empty()) prepared.tera_type = attacker.tera_type;

    if (prepared.tera_mode == TeraMode::STELLAR) {
        if (options.allow_raid_stellar) {
            prepared.stellar_first_use = true;
        } else {
            std::string type = data::resolve_move_type(data_, prepared, attacker);
            prepared.stellar_first_use = branch.stellar_used[actor].count(type) == 0;
        }
    }
    return prepared;
}

TimelineSimulator::EventOutcome
TimelineSimulator::process_attack(BattleSide actor, bool has_target, BattleSide target_in,
                                  const MoveConfig& move, const std::string& event_id,
                                  RunState& st) {
    const SimulationOptions& options = st.options;
    BattleSide target = has_target ? target_in : opposite(actor);
    bool observing = !options.observation_event_id.empty() &&
                     event_id == options.observation_event_id &&
                     options.has_observation_range;

    EventOutcome out;
    for (const Branch& branch : st.arena.branches()) {
        if (branch.terminated) {
            out.branches.push_back(branch);
            continue;
        }
        if (branch.hp(actor) <= 0 || branch.hp(target) <= 0) {
            out.branches.push_back(branch);
            out.branches.back().terminated = true;
            continue;
        }

        const Combatant& attacker = branch.combatants[actor];
        MoveConfig prepared = prepare_move(move, branch, actor, options);
        std::string move_type = data::resolve_move_type(data_, prepared, attacker);

        damage::AttackContext ctx;
        ctx.actor = actor;
        ctx.attacker = &attacker;
        ctx.defender = &branch.combatants[target];
        ctx.move = &prepared;
        ctx.field = &branch.field;
        ctx.style = options.style;

        const damage::DamageComputation& comp = cache_.get_or_compute(ctx, calculator_);
        double roll_probability = branch.probability / static_cast<double>(comp.rolls.size());

        if (out.damage_rolls.empty()) {
            for (const auto& roll : comp.rolls) out.damage_rolls.push_back(roll.damage);
        }

        bool flips_tera = prepared.tera_mode != attacker.tera_mode;

        for (const auto& roll : comp.rolls) {
            Branch child = branch;
            child.probability = roll_probability;

            int dmg = std::max(0, std::min(roll.damage, child.hp(target)));
            child.set_hp(target, child.hp(target) - dmg);
            child.last_damage[target] = dmg;

            if (roll.drain > 0) {
                child.set_hp(actor, std::min(child.max_hp(actor), child.hp(actor) + roll.drain));
            }
            if (roll.recoil > 0) {
                child.set_hp(actor, std::max(0, child.hp(actor) - roll.recoil));
            }

            if (observing) {
                double percent = child.max_hp(target) > 0
                    ? static_cast<double>(dmg) / child.max_hp(target) : 0.0;
                if (percent >= options.observation_min && percent <= options.observation_max) {
                    out.observation += roll_probability;
                }
            }

            if (flips_tera) {
                child.combatants[actor].tera_mode = prepared.tera_mode;
                child.combatants[actor].tera_type = prepared.tera_type;
            }
            if (prepared.tera_mode == TeraMode::STELLAR && !options.allow_raid_stellar) {
                child.stellar_used[actor].insert(move_type);
            }

            if (child.any_side_down()) child.terminated = true;
            out.branches.push_back(std::move(child));
        }
    }
    return out;
}

} // namespace evsim::timeline
