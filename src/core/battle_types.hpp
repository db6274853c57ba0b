/**
 * Battle model — value types shared by every module.
 *
 * Combatants, field state and move configurations are plain values:
 * each branch of the timeline owns its own copies, nothing is aliased
 * between parallel world-states.
 */

#ifndef EVSIM_CORE_BATTLE_TYPES_HPP
#define EVSIM_CORE_BATTLE_TYPES_HPP

#include <map>
#include <string>
#include <vector>

namespace evsim {

// ── Sides ──

enum class BattleSide {
    PLAYER,
    OPPONENT
};

inline BattleSide opposite(BattleSide side) {
    return side == BattleSide::PLAYER ? BattleSide::OPPONENT : BattleSide::PLAYER;
}

std::string side_to_string(BattleSide side);
BattleSide side_from_string(const std::string& s, BattleSide def);

/// One value per battle side (player / opponent).
template<typename T>
struct SidePair {
    T player{};
    T opponent{};

    T& operator[](BattleSide side) {
        return side == BattleSide::PLAYER ? player : opponent;
    }
    const T& operator[](BattleSide side) const {
        return side == BattleSide::PLAYER ? player : opponent;
    }
};

constexpr BattleSide ALL_SIDES[2] = { BattleSide::PLAYER, BattleSide::OPPONENT };

enum class BattleStyle {
    SINGLES,
    DOUBLES
};

// ── Stats ──

enum class StatId { HP, ATK, DEF, SPA, SPD, SPE };

constexpr StatId ALL_STATS[6] = {
    StatId::HP, StatId::ATK, StatId::DEF, StatId::SPA, StatId::SPD, StatId::SPE
};

std::string stat_to_string(StatId stat);
bool stat_from_string(const std::string& s, StatId& out);

struct StatsTable {
    int hp = 0;
    int atk = 0;
    int def = 0;
    int spa = 0;
    int spd = 0;
    int spe = 0;

    int& operator[](StatId stat);
    int operator[](StatId stat) const;

    static StatsTable filled(int value) {
        return StatsTable{value, value, value, value, value, value};
    }
};

/// Stat stages; a stage of 0 is never stored.
using BoostTable = std::map<StatId, int>;

constexpr int MIN_STAGE = -6;
constexpr int MAX_STAGE = 6;

// ── Terastallization ──

enum class TeraMode {
    NONE,
    TERA,
    STELLAR,
    NORMAL
};

std::string tera_mode_to_string(TeraMode mode);
TeraMode tera_mode_from_string(const std::string& s, TeraMode def);

// ── Combatant ──

struct Combatant {
    std::string species;
    int level = 50;
    std::string nature = "Hardy";
    std::string ability;            // empty = none
    std::string item;               // empty = none
    std::string status;             // "brn", "par", ... empty = healthy
    TeraMode tera_mode = TeraMode::NONE;
    std::string tera_type;

    StatsTable ivs = StatsTable::filled(31);
    StatsTable evs;
    BoostTable boosts;

    int current_hp = -1;            // -1 = full
    int max_hp = 0;                 // 0 = resolve from base stats

    bool has_base_stat_overrides = false;
    StatsTable base_stat_overrides;
    std::vector<std::string> type_overrides;
};

// ── Field ──

struct SideConditions {
    bool reflect = false;
    bool light_screen = false;
    bool aurora_veil = false;
    bool tailwind = false;
    bool helping_hand = false;
    bool friend_guard = false;
    bool stealth_rock = false;
    int spikes = 0;

    bool operator==(const SideConditions& o) const {
        return reflect == o.reflect && light_screen == o.light_screen &&
               aurora_veil == o.aurora_veil && tailwind == o.tailwind &&
               helping_hand == o.helping_hand && friend_guard == o.friend_guard &&
               stealth_rock == o.stealth_rock && spikes == o.spikes;
    }
};

struct FieldState {
    std::string weather;            // "Sun", "Rain", "Sand", "Snow", empty = clear
    std::string terrain;            // "Electric", "Grassy", "Misty", "Psychic"
    bool trick_room = false;
    bool wonder_room = false;
    bool magic_room = false;
    bool gravity = false;
    SidePair<SideConditions> sides;
};

enum class SideCondition {
    REFLECT,
    LIGHT_SCREEN,
    AURORA_VEIL,
    TAILWIND,
    HELPING_HAND,
    FRIEND_GUARD,
    STEALTH_ROCK,
    SPIKES
};

/// Request key ("isReflect", ..., "spikes"); false for unknown names.
bool side_condition_from_key(const std::string& key, SideCondition& out);

/// Set one condition; booleans take value != 0, spikes the layer count.
void set_side_condition(SideConditions& side, SideCondition condition, int value);

/// Partial field update carried by a field-toggle event.
struct FieldUpdate {
    bool set_weather = false;
    std::string weather;
    bool set_terrain = false;
    std::string terrain;
    bool set_trick_room = false;
    bool trick_room = false;
    bool set_wonder_room = false;
    bool wonder_room = false;
    bool set_magic_room = false;
    bool magic_room = false;
    bool set_gravity = false;
    bool gravity = false;

    // Only the listed conditions change; the rest of each side is kept
    SidePair<std::map<SideCondition, int>> sides;
};

FieldState merge_field(const FieldState& base, const FieldUpdate& update);

// ── Moves ──

enum class MoveCategory {
    PHYSICAL,
    SPECIAL,
    STATUS
};

std::string category_to_string(MoveCategory c);
MoveCategory category_from_string(const std::string& s, MoveCategory def);

struct MoveConfig {
    std::string name;
    bool is_crit = false;
    int hits = 0;                   // 0 = move default
    int priority = 0;
    double drain_percent = 0.0;     // fraction of damage dealt, 0.5 = half
    double recoil_percent = 0.0;

    std::string type_override;
    int power_override = 0;
    bool has_category_override = false;
    MoveCategory category_override = MoveCategory::PHYSICAL;

    bool has_tera_mode = false;     // false = inherit the user's current mode
    TeraMode tera_mode = TeraMode::NONE;
    std::string tera_type;
    bool stellar_first_use = false;
};

} // namespace evsim

#endif // EVSIM_CORE_BATTLE_TYPES_HPP
