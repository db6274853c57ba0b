#include "damage/damage_cache.hpp"
#include "core/errors.hpp"
#include <sstream>

namespace evsim::damage {

namespace {

void write_stats(std::ostringstream& os, const StatsTable& t) {
    os << t.hp << ',' << t.atk << ',' << t.def << ','
       << t.spa << ',' << t.spd << ',' << t.spe;
}

void write_combatant(std::ostringstream& os, const Combatant& c) {
    os << c.species << '|' << c.level << '|' << c.ability << '|' << c.item << '|'
       << c.nature << '|' << c.status << '|' << tera_mode_to_string(c.tera_mode)
       << '|' << c.tera_type << '|' << c.current_hp << '/' << c.max_hp << "|iv:";
    write_stats(os, c.ivs);
    os << "|ev:";
    write_stats(os, c.evs);
    os << "|b:";
    // BoostTable is ordered and never holds zero stages
    for (const auto& [stat, stage] : c.boosts) {
        os << stat_to_string(stat) << stage << ',';
    }
    if (c.has_base_stat_overrides) {
        os << "|base:";
        write_stats(os, c.base_stat_overrides);
    }
    if (!c.type_overrides.empty()) {
        os << "|types:";
        for (const auto& t : c.type_overrides) os << t << ',';
    }
}

void write_move(std::ostringstream& os, const MoveConfig& m) {
    os << m.name << '|' << m.is_crit << '|' << m.hits << '|' << m.priority << '|'
       << m.drain_percent << '|' << m.recoil_percent << '|' << m.type_override
       << '|' << m.power_override << '|';
    if (m.has_category_override) os << category_to_string(m.category_override);
    os << '|';
    if (m.has_tera_mode) os << tera_mode_to_string(m.tera_mode);
    os << '|' << m.tera_type << '|' << m.stellar_first_use;
}

void write_side(std::ostringstream& os, const SideConditions& s) {
    os << s.reflect << s.light_screen << s.aurora_veil << s.tailwind
       << s.helping_hand << s.friend_guard << s.stealth_rock << s.spikes;
}

void write_field(std::ostringstream& os, const FieldState& f) {
    os << f.weather << '|' << f.terrain << '|' << f.trick_room << f.wonder_room
       << f.magic_room << f.gravity << '|';
    write_side(os, f.sides.player);
    os << '|';
    write_side(os, f.sides.opponent);
}

} // anonymous namespace

DamageCache::DamageCache(size_t capacity)
    : capacity_(capacity > 0 ? capacity : 1) {}

const DamageComputation* DamageCache::get(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    entries_.splice(entries_.begin(), entries_, it->second);
    return &it->second->second;
}

void DamageCache::put(const std::string& key, DamageComputation result) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        it->second->second = std::move(result);
        entries_.splice(entries_.begin(), entries_, it->second);
        return;
    }

    entries_.emplace_front(key, std::move(result));
    index_[key] = entries_.begin();

    if (entries_.size() > capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }
}

const DamageComputation& DamageCache::get_or_compute(const AttackContext& ctx,
                                                     DamageCalculator& calculator) {
    std::string key = make_key(ctx);
    if (const DamageComputation* cached = get(key)) {
        hits_++;
        return *cached;
    }

    misses_++;
    DamageComputation computed = calculator.compute(ctx);
    if (computed.rolls.empty()) {
        throw ComputationError("Damage calculator returned no rolls for " +
                               (ctx.move ? ctx.move->name : std::string("<no move>")));
    }
    put(key, std::move(computed));
    return entries_.front().second;
}

void DamageCache::clear() {
    entries_.clear();
    index_.clear();
}

std::string DamageCache::make_key(const AttackContext& ctx) {
    std::ostringstream os;
    os << side_to_string(ctx.actor) << '#'
       << (ctx.style == BattleStyle::DOUBLES ? 'D' : 'S') << '#';
    if (ctx.attacker) write_combatant(os, *ctx.attacker);
    os << '#';
    if (ctx.defender) write_combatant(os, *ctx.defender);
    os << '#';
    if (ctx.move) write_move(os, *ctx.move);
    os << '#';
    if (ctx.field) write_field(os, *ctx.field);
    return os.str();
}

} // namespace evsim::damage
