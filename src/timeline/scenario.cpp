#include "timeline/scenario.hpp"

namespace evsim::timeline {

namespace {

std::string side_label(BattleSide side) {
    return side == BattleSide::PLAYER ? "Player" : "Opponent";
}

} // anonymous namespace

EventTiming timing_from_string(const std::string& s, EventTiming def) {
    if (s == "turn-start") return EventTiming::TURN_START;
    if (s == "action")     return EventTiming::ACTION;
    if (s == "turn-end")   return EventTiming::TURN_END;
    return def;
}

HpAdjustMode hp_mode_from_string(const std::string& s, HpAdjustMode def) {
    if (s == "absolute")             return HpAdjustMode::ABSOLUTE;
    if (s == "percent-max")          return HpAdjustMode::PERCENT_MAX;
    if (s == "percent-last-damage")  return HpAdjustMode::PERCENT_LAST_DAMAGE;
    if (s == "fraction-max")         return HpAdjustMode::FRACTION_MAX;
    if (s == "fraction-last-damage") return HpAdjustMode::FRACTION_LAST_DAMAGE;
    return def;
}

std::string describe_action(const BattleAction& action) {
    const std::string who = side_label(action.actor);
    return std::visit(Overloaded{
        [&](const MoveAction& m)  { return who + ": " + m.move.name; },
        [&](const SwitchEvent& s) { return who + " switches to " + s.species; },
        [&](const PassAction&)    { return who + " passes"; },
    }, action.payload);
}

std::vector<const BattleAction*> order_actions(const TimelineTurn& turn, BattleStyle style) {
    std::vector<const BattleAction*> ordered;
    ordered.reserve(turn.actions.size());

    if (style == BattleStyle::DOUBLES) {
        for (const auto& action : turn.actions) ordered.push_back(&action);
        return ordered;
    }

    BattleSide first = turn.has_order ? turn.order : BattleSide::PLAYER;
    for (BattleSide side : { first, opposite(first) }) {
        for (const auto& action : turn.actions) {
            if (action.actor == side) ordered.push_back(&action);
        }
    }
    return ordered;
}

} // namespace evsim::timeline
