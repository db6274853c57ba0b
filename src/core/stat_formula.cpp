#include "core/stat_formula.hpp"
#include <algorithm>

namespace evsim {

namespace {

struct NatureEntry {
    const char* name;
    StatId plus;
    StatId minus;
};

// Neutral natures have plus == minus.
constexpr NatureEntry NATURES[] = {
    {"Hardy",   StatId::ATK, StatId::ATK},
    {"Lonely",  StatId::ATK, StatId::DEF},
    {"Brave",   StatId::ATK, StatId::SPE},
    {"Adamant", StatId::ATK, StatId::SPA},
    {"Naughty", StatId::ATK, StatId::SPD},
    {"Bold",    StatId::DEF, StatId::ATK},
    {"Docile",  StatId::DEF, StatId::DEF},
    {"Relaxed", StatId::DEF, StatId::SPE},
    {"Impish",  StatId::DEF, StatId::SPA},
    {"Lax",     StatId::DEF, StatId::SPD},
    {"Timid",   StatId::SPE, StatId::ATK},
    {"Hasty",   StatId::SPE, StatId::DEF},
    {"Serious", StatId::SPE, StatId::SPE},
    {"Jolly",   StatId::SPE, StatId::SPA},
    {"Naive",   StatId::SPE, StatId::SPD},
    {"Modest",  StatId::SPA, StatId::ATK},
    {"Mild",    StatId::SPA, StatId::DEF},
    {"Quiet",   StatId::SPA, StatId::SPE},
    {"Bashful", StatId::SPA, StatId::SPA},
    {"Rash",    StatId::SPA, StatId::SPD},
    {"Calm",    StatId::SPD, StatId::ATK},
    {"Gentle",  StatId::SPD, StatId::DEF},
    {"Sassy",   StatId::SPD, StatId::SPE},
    {"Careful", StatId::SPD, StatId::SPA},
    {"Quirky",  StatId::SPD, StatId::SPD},
};

const NatureEntry* find_nature(const std::string& nature) {
    for (const auto& entry : NATURES) {
        if (nature == entry.name) return &entry;
    }
    return nullptr;
}

} // anonymous namespace

int nature_modifier_tenths(const std::string& nature, StatId stat) {
    if (stat == StatId::HP) return 10;
    const NatureEntry* entry = find_nature(nature);
    if (!entry || entry->plus == entry->minus) return 10;
    if (entry->plus == stat) return 11;
    if (entry->minus == stat) return 9;
    return 10;
}

bool is_known_nature(const std::string& nature) {
    return find_nature(nature) != nullptr;
}

int calc_stat(StatId stat, int base, int iv, int ev, int level,
              const std::string& nature) {
    int clamped_ev = std::max(0, std::min(MAX_STAT_EV, ev));
    int clamped_iv = std::max(0, std::min(31, iv));
    int core = (2 * base + clamped_iv + clamped_ev / 4) * level / 100;

    if (stat == StatId::HP) {
        // Shedinja-style base 1 HP is always 1
        if (base == 1) return 1;
        return core + level + 10;
    }
    return (core + 5) * nature_modifier_tenths(nature, stat) / 10;
}

StatsTable calc_all_stats(const Combatant& combatant, const StatsTable& base) {
    StatsTable out;
    for (StatId stat : ALL_STATS) {
        out[stat] = calc_stat(stat, base[stat], combatant.ivs[stat],
                              combatant.evs[stat], combatant.level,
                              combatant.nature);
    }
    return out;
}

int min_ev_for_stat(StatId stat, int target_stat, int base, int iv, int level,
                    const std::string& nature) {
    int low = 0;
    int high = MAX_STAT_EV;
    int best = MAX_STAT_EV;

    while (low <= high) {
        int mid = (low + high) / 2;
        if (calc_stat(stat, base, iv, mid, level, nature) >= target_stat) {
            best = mid;
            high = mid - 1;
        } else {
            low = mid + 1;
        }
    }
    return std::min(MAX_STAT_EV, (best + 3) / 4 * 4);
}

} // namespace evsim
