#include "damage/standard_calculator.hpp"
#include "core/errors.hpp"
#include "core/stat_formula.hpp"
#include "data/type_chart.hpp"
#include <algorithm>
#include <cmath>

namespace evsim::damage {

namespace {

// 4096-based modifiers
constexpr int MOD_SPREAD       = 3072;
constexpr int MOD_BOOST        = 6144;   // 1.5x
constexpr int MOD_HALF         = 2048;
constexpr int MOD_DOUBLE       = 8192;
constexpr int MOD_STELLAR      = 4915;   // 1.2x, non-STAB stellar first use
constexpr int MOD_EXPERT_BELT  = 4915;
constexpr int MOD_LIFE_ORB     = 5324;
constexpr int MOD_SCREEN_DBL   = 2732;
constexpr int MOD_FRIEND_GUARD = 3072;

struct Effective {
    TeraMode mode = TeraMode::NONE;
    std::string tera_type;
};

Effective effective_tera(const Combatant& c, const MoveConfig* move) {
    Effective e;
    e.mode = c.tera_mode;
    e.tera_type = c.tera_type;
    if (move && move->has_tera_mode) e.mode = move->tera_mode;
    if (move && !move->tera_type.empty()) e.tera_type = move->tera_type;
    return e;
}

bool is_terastallized(const Effective& e) {
    return e.mode == TeraMode::TERA && !e.tera_type.empty();
}

bool has_type(const std::vector<std::string>& types, const std::string& t) {
    return std::find(types.begin(), types.end(), t) != types.end();
}

bool side_has_screen(const SideConditions& side, MoveCategory category) {
    if (side.aurora_veil) return true;
    return category == MoveCategory::PHYSICAL ? side.reflect : side.light_screen;
}

int weather_modifier(const std::string& weather, const std::string& move_type) {
    if (weather == "Sun" || weather == "Harsh Sunshine") {
        if (move_type == "Fire") return MOD_BOOST;
        if (move_type == "Water") return MOD_HALF;
    } else if (weather == "Rain" || weather == "Heavy Rain") {
        if (move_type == "Water") return MOD_BOOST;
        if (move_type == "Fire") return MOD_HALF;
    }
    return 4096;
}

int stage_of(const Combatant& c, StatId stat) {
    auto it = c.boosts.find(stat);
    return it != c.boosts.end() ? it->second : 0;
}

int default_hits(const data::MoveData& move, const Combatant& attacker) {
    if (move.min_hits == move.max_hits) return move.min_hits;
    return attacker.ability == "Skill Link" ? move.max_hits : move.min_hits;
}

} // anonymous namespace

int apply_stage(int stat, int stage) {
    stage = std::max(MIN_STAGE, std::min(MAX_STAGE, stage));
    if (stage >= 0) return stat * (2 + stage) / 2;
    return stat * 2 / (2 - stage);
}

int apply_modifier(int value, int mod4096) {
    long long x = static_cast<long long>(value) * mod4096;
    return static_cast<int>((x + 2047) / 4096);
}

StandardDamageCalculator::StandardDamageCalculator(const data::GameData& data)
    : data_(data) {}

const data::SpeciesData& StandardDamageCalculator::require_species(const std::string& name) const {
    const data::SpeciesData* species = data_.find_species(name);
    if (!species) {
        throw ComputationError("Unknown species: " + name);
    }
    return *species;
}

DamageComputation StandardDamageCalculator::compute(const AttackContext& ctx) {
    if (!ctx.attacker || !ctx.defender || !ctx.move || !ctx.field) {
        throw ComputationError("Incomplete attack context");
    }
    const Combatant& attacker = *ctx.attacker;
    const Combatant& defender = *ctx.defender;
    const MoveConfig& move = *ctx.move;
    const FieldState& field = *ctx.field;

    const data::MoveData* move_data = data_.find_move(move.name);
    if (!move_data) {
        throw ComputationError("Unknown move: " + move.name);
    }
    const data::SpeciesData& atk_species = require_species(attacker.species);
    const data::SpeciesData& def_species = require_species(defender.species);

    StatsTable atk_stats = calc_all_stats(
        attacker, attacker.has_base_stat_overrides ? attacker.base_stat_overrides
                                                   : atk_species.base_stats);
    StatsTable def_stats = calc_all_stats(
        defender, defender.has_base_stat_overrides ? defender.base_stat_overrides
                                                   : def_species.base_stats);

    int defender_max_hp = defender.max_hp > 0 ? defender.max_hp : def_stats.hp;
    int defender_hp = defender.current_hp < 0 ? defender_max_hp : defender.current_hp;

    DamageComputation out;
    out.move_type = data::resolve_move_type(&data_, move, attacker);

    Effective atk_tera = effective_tera(attacker, &move);
    Effective def_tera = effective_tera(defender, nullptr);

    MoveCategory category = move.has_category_override ? move.category_override
                                                       : move_data->category;
    if (move.name == "Tera Blast" && atk_tera.mode != TeraMode::NONE &&
        atk_tera.mode != TeraMode::NORMAL && !move.has_category_override) {
        int a = apply_stage(atk_stats.atk, stage_of(attacker, StatId::ATK));
        int s = apply_stage(atk_stats.spa, stage_of(attacker, StatId::SPA));
        category = a > s ? MoveCategory::PHYSICAL : MoveCategory::SPECIAL;
    }

    int power = move.power_override > 0 ? move.power_override : move_data->base_power;

    auto zero_result = [&]() {
        DamageRoll roll;
        out.rolls.push_back(roll);
        return out;
    };
    if (category == MoveCategory::STATUS || power <= 0) {
        return zero_result();
    }

    // ── Type effectiveness ──
    std::vector<std::string> def_types = defender.type_overrides.empty()
        ? def_species.types : defender.type_overrides;
    if (is_terastallized(def_tera)) def_types = { def_tera.tera_type };
    double effectiveness = data::type_effectiveness(out.move_type, def_types);
    if (effectiveness == 0.0) {
        return zero_result();
    }

    // ── Attack / defense stats ──
    bool physical = category == MoveCategory::PHYSICAL;
    StatId atk_id = physical ? StatId::ATK : StatId::SPA;
    // Wonder Room swaps the defender's Def and SpD
    StatId def_id = physical != field.wonder_room ? StatId::DEF : StatId::SPD;

    int atk_stage = stage_of(attacker, atk_id);
    int def_stage = stage_of(defender, def_id);
    if (move.is_crit) {
        atk_stage = std::max(atk_stage, 0);
        def_stage = std::min(def_stage, 0);
    }

    int attack = apply_stage(atk_stats[atk_id], atk_stage);
    if (physical && (attacker.ability == "Huge Power" || attacker.ability == "Pure Power")) {
        attack *= 2;
    }
    if (physical && attacker.ability == "Guts" && !attacker.status.empty()) {
        attack = apply_modifier(attack, MOD_BOOST);
    }
    if (physical && attacker.item == "Choice Band") attack = apply_modifier(attack, MOD_BOOST);
    if (!physical && attacker.item == "Choice Specs") attack = apply_modifier(attack, MOD_BOOST);

    int defense = apply_stage(def_stats[def_id], def_stage);
    if (!physical && defender.item == "Assault Vest") {
        defense = apply_modifier(defense, MOD_BOOST);
    }
    defense = std::max(1, defense);

    const SideConditions& atk_side = field.sides[ctx.actor];
    const SideConditions& def_side = field.sides[opposite(ctx.actor)];
    if (atk_side.helping_hand) power = apply_modifier(power, MOD_BOOST);

    // ── Base damage ──
    int level = std::max(1, attacker.level);
    int base = (2 * level / 5 + 2) * power * attack / defense / 50 + 2;

    bool doubles = ctx.style == BattleStyle::DOUBLES;
    if (doubles && move_data->spread) base = apply_modifier(base, MOD_SPREAD);
    base = apply_modifier(base, weather_modifier(field.weather, out.move_type));
    if (move.is_crit) base = base * 3 / 2;

    // ── STAB ──
    std::vector<std::string> atk_types = attacker.type_overrides.empty()
        ? atk_species.types : attacker.type_overrides;
    bool original_stab = has_type(atk_types, out.move_type);
    int stab = 4096;
    if (is_terastallized(atk_tera)) {
        if (out.move_type == atk_tera.tera_type && original_stab) {
            stab = MOD_DOUBLE;
        } else if (out.move_type == atk_tera.tera_type || original_stab) {
            stab = MOD_BOOST;
        }
    } else if (atk_tera.mode == TeraMode::STELLAR && move.stellar_first_use) {
        stab = original_stab ? MOD_DOUBLE : MOD_STELLAR;
    } else if (original_stab) {
        stab = MOD_BOOST;
    }

    bool burned = physical && attacker.status == "brn" && attacker.ability != "Guts";

    int hits = move.hits > 0 ? move.hits : default_hits(*move_data, attacker);
    hits = std::max(1, hits);

    double drain_fraction = move.drain_percent > 0.0 ? move.drain_percent : move_data->drain;
    double recoil_fraction = move.recoil_percent > 0.0 ? move.recoil_percent : move_data->recoil;

    for (int r = 0; r < NUM_DAMAGE_ROLLS; r++) {
        int dmg = base * (85 + r) / 100;
        dmg = apply_modifier(dmg, stab);
        dmg = static_cast<int>(std::floor(dmg * effectiveness));
        if (burned) dmg = apply_modifier(dmg, MOD_HALF);

        if (!move.is_crit && side_has_screen(def_side, category)) {
            dmg = apply_modifier(dmg, doubles ? MOD_SCREEN_DBL : MOD_HALF);
        }
        if (def_side.friend_guard) dmg = apply_modifier(dmg, MOD_FRIEND_GUARD);
        if ((defender.ability == "Multiscale" || defender.ability == "Shadow Shield") &&
            defender_hp >= defender_max_hp) {
            dmg = apply_modifier(dmg, MOD_HALF);
        }
        if (attacker.item == "Expert Belt" && effectiveness > 1.0) {
            dmg = apply_modifier(dmg, MOD_EXPERT_BELT);
        }
        if (attacker.item == "Life Orb") dmg = apply_modifier(dmg, MOD_LIFE_ORB);

        dmg = std::max(1, dmg) * hits;

        DamageRoll roll;
        roll.damage = dmg;
        roll.percent = defender_max_hp > 0 ? static_cast<double>(dmg) / defender_max_hp : 0.0;
        if (drain_fraction > 0.0) {
            roll.drain = static_cast<int>(std::ceil(dmg * drain_fraction));
        }
        if (recoil_fraction > 0.0) {
            roll.recoil = static_cast<int>(std::floor(dmg * recoil_fraction));
        }
        out.rolls.push_back(roll);
    }
    return out;
}

} // namespace evsim::damage
