#include "core/battle_types.hpp"

namespace evsim {

std::string side_to_string(BattleSide side) {
    return side == BattleSide::PLAYER ? "player" : "opponent";
}

BattleSide side_from_string(const std::string& s, BattleSide def) {
    if (s == "player") return BattleSide::PLAYER;
    if (s == "opponent") return BattleSide::OPPONENT;
    return def;
}

std::string stat_to_string(StatId stat) {
    switch (stat) {
        case StatId::HP:  return "hp";
        case StatId::ATK: return "atk";
        case StatId::DEF: return "def";
        case StatId::SPA: return "spa";
        case StatId::SPD: return "spd";
        case StatId::SPE: return "spe";
    }
    return "hp";
}

bool stat_from_string(const std::string& s, StatId& out) {
    for (StatId stat : ALL_STATS) {
        if (stat_to_string(stat) == s) {
            out = stat;
            return true;
        }
    }
    return false;
}

int& StatsTable::operator[](StatId stat) {
    switch (stat) {
        case StatId::HP:  return hp;
        case StatId::ATK: return atk;
        case StatId::DEF: return def;
        case StatId::SPA: return spa;
        case StatId::SPD: return spd;
        case StatId::SPE: return spe;
    }
    return hp;
}

int StatsTable::operator[](StatId stat) const {
    switch (stat) {
        case StatId::HP:  return hp;
        case StatId::ATK: return atk;
        case StatId::DEF: return def;
        case StatId::SPA: return spa;
        case StatId::SPD: return spd;
        case StatId::SPE: return spe;
    }
    return hp;
}

std::string tera_mode_to_string(TeraMode mode) {
    switch (mode) {
        case TeraMode::NONE:    return "none";
        case TeraMode::TERA:    return "tera";
        case TeraMode::STELLAR: return "stellar";
        case TeraMode::NORMAL:  return "normal";
    }
    return "none";
}

TeraMode tera_mode_from_string(const std::string& s, TeraMode def) {
    if (s == "none")    return TeraMode::NONE;
    if (s == "tera")    return TeraMode::TERA;
    if (s == "stellar") return TeraMode::STELLAR;
    if (s == "normal")  return TeraMode::NORMAL;
    return def;
}

std::string category_to_string(MoveCategory c) {
    switch (c) {
        case MoveCategory::PHYSICAL: return "physical";
        case MoveCategory::SPECIAL:  return "special";
        case MoveCategory::STATUS:   return "status";
    }
    return "physical";
}

MoveCategory category_from_string(const std::string& s, MoveCategory def) {
    if (s == "physical" || s == "Physical") return MoveCategory::PHYSICAL;
    if (s == "special" || s == "Special")   return MoveCategory::SPECIAL;
    if (s == "status" || s == "Status")     return MoveCategory::STATUS;
    return def;
}

bool side_condition_from_key(const std::string& key, SideCondition& out) {
    static const std::map<std::string, SideCondition> KEYS = {
        { "isReflect",     SideCondition::REFLECT },
        { "isLightScreen", SideCondition::LIGHT_SCREEN },
        { "isAuroraVeil",  SideCondition::AURORA_VEIL },
        { "isTailwind",    SideCondition::TAILWIND },
        { "isHelpingHand", SideCondition::HELPING_HAND },
        { "isFriendGuard", SideCondition::FRIEND_GUARD },
        { "isSR",          SideCondition::STEALTH_ROCK },
        { "spikes",        SideCondition::SPIKES },
    };
    auto it = KEYS.find(key);
    if (it == KEYS.end()) return false;
    out = it->second;
    return true;
}

void set_side_condition(SideConditions& side, SideCondition condition, int value) {
    switch (condition) {
        case SideCondition::REFLECT:      side.reflect = value != 0; break;
        case SideCondition::LIGHT_SCREEN: side.light_screen = value != 0; break;
        case SideCondition::AURORA_VEIL:  side.aurora_veil = value != 0; break;
        case SideCondition::TAILWIND:     side.tailwind = value != 0; break;
        case SideCondition::HELPING_HAND: side.helping_hand = value != 0; break;
        case SideCondition::FRIEND_GUARD: side.friend_guard = value != 0; break;
        case SideCondition::STEALTH_ROCK: side.stealth_rock = value != 0; break;
        case SideCondition::SPIKES:       side.spikes = value < 0 ? 0 : (value > 3 ? 3 : value); break;
    }
}

FieldState merge_field(const FieldState& base, const FieldUpdate& update) {
    FieldState merged = base;
    if (update.set_weather)     merged.weather = update.weather;
    if (update.set_terrain)     merged.terrain = update.terrain;
    if (update.set_trick_room)  merged.trick_room = update.trick_room;
    if (update.set_wonder_room) merged.wonder_room = update.wonder_room;
    if (update.set_magic_room)  merged.magic_room = update.magic_room;
    if (update.set_gravity)     merged.gravity = update.gravity;

    for (BattleSide side : ALL_SIDES) {
        for (const auto& [condition, value] : update.sides[side]) {
            set_side_condition(merged.sides[side], condition, value);
        }
    }
    return merged;
}

} // namespace evsim
