/**
 * Scenario — scripted turns, actions and auxiliary events.
 *
 * Event and action payloads are closed sets held in std::variant and
 * dispatched with std::visit. Every event carries a timing phase and may
 * be linked to an action of the same turn by id.
 */

#ifndef EVSIM_TIMELINE_SCENARIO_HPP
#define EVSIM_TIMELINE_SCENARIO_HPP

#include "core/battle_types.hpp"
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace evsim::timeline {

constexpr int MAX_TIMELINE_TURNS = 5;

/// Overload set for std::visit over event and action payloads.
template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

enum class EventTiming {
    TURN_START,
    ACTION,
    TURN_END
};

EventTiming timing_from_string(const std::string& s, EventTiming def);

// ── Event payloads ──

struct AttackEvent {
    bool has_target = false;        // false = the actor's foe
    BattleSide target = BattleSide::OPPONENT;
    MoveConfig move;
};

struct HealingEvent {
    enum class Kind { ABSOLUTE, FRACTION, RANGE_MIN };

    Kind kind = Kind::ABSOLUTE;
    int amount = 0;                 // ABSOLUTE amount, or RANGE_MIN lower bound

    // FRACTION: explicit fraction, else numerator / denominator
    bool has_fraction = false;
    double fraction = 0.0;
    double numerator = 1.0;
    double denominator = 0.0;
};

enum class HpAdjustMode {
    ABSOLUTE,
    PERCENT_MAX,
    PERCENT_LAST_DAMAGE,
    FRACTION_MAX,
    FRACTION_LAST_DAMAGE
};

HpAdjustMode hp_mode_from_string(const std::string& s, HpAdjustMode def);

struct HpAdjustmentEvent {
    bool has_target = false;        // false = the actor
    BattleSide target = BattleSide::PLAYER;
    double amount = 0.0;
    bool is_damage = false;
    HpAdjustMode mode = HpAdjustMode::ABSOLUTE;
    double numerator = 1.0;
    double denominator = 0.0;       // 0 = no fraction given
};

struct StatChangeEvent {
    std::map<StatId, int> stages;   // signed deltas
};

struct StatusEvent {
    std::string status;
    bool clears = false;
};

/// Used both as an event payload and as a switch action.
struct SwitchEvent {
    std::string species;            // empty = keep
    bool has_ability = false;
    std::string ability;
    bool has_item = false;
    std::string item;
    bool has_hp_percent = false;
    double hp_percent = 100.0;
};

struct FieldToggleEvent {
    FieldUpdate update;
};

using EventPayload = std::variant<AttackEvent, HealingEvent, HpAdjustmentEvent,
                                  StatChangeEvent, StatusEvent, SwitchEvent,
                                  FieldToggleEvent>;

struct BattleEvent {
    std::string id;
    std::string label;
    bool has_actor = false;
    BattleSide actor = BattleSide::PLAYER;
    EventTiming timing = EventTiming::ACTION;
    std::string related_action_id;  // empty = not linked
    EventPayload payload;
};

// ── Actions ──

struct MoveAction {
    bool has_target = false;
    BattleSide target = BattleSide::OPPONENT;
    MoveConfig move;                // action-level tera choice already folded in
};

struct PassAction {};

using ActionPayload = std::variant<MoveAction, SwitchEvent, PassAction>;

struct BattleAction {
    std::string id;
    BattleSide actor = BattleSide::PLAYER;
    ActionPayload payload;
};

std::string describe_action(const BattleAction& action);

// ── Turns ──

struct TimelineTurn {
    int turn = 1;
    std::string id;
    std::string label;
    bool has_order = false;         // which side acts first in singles
    BattleSide order = BattleSide::PLAYER;
    std::vector<BattleAction> actions;
    std::vector<BattleEvent> events;
};

struct Scenario {
    bool allow_raid_stellar = false;
    std::vector<TimelineTurn> turns;
};

/// Actions in execution order for the given battle style.
std::vector<const BattleAction*> order_actions(const TimelineTurn& turn, BattleStyle style);

} // namespace evsim::timeline

#endif // EVSIM_TIMELINE_SCENARIO_HPP
