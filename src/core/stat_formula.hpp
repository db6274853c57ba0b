/**
 * Stat formula — base stat + IV + EV + level + nature -> final stat.
 *
 * Generation 3+ arithmetic:
 *   HP    = floor((2B + IV + floor(EV/4)) * L / 100) + L + 10
 *   other = floor((floor((2B + IV + floor(EV/4)) * L / 100) + 5) * N)
 * with N = 1.1 / 1.0 / 0.9 from the nature.
 */

#ifndef EVSIM_CORE_STAT_FORMULA_HPP
#define EVSIM_CORE_STAT_FORMULA_HPP

#include "core/battle_types.hpp"
#include <string>

namespace evsim {

constexpr int MAX_STAT_EV = 252;
constexpr int MAX_TOTAL_EV = 510;

/**
 * Nature multiplier for a stat, in tenths (11, 10 or 9).
 * Unknown natures are treated as neutral.
 */
int nature_modifier_tenths(const std::string& nature, StatId stat);

bool is_known_nature(const std::string& nature);

int calc_stat(StatId stat, int base, int iv, int ev, int level,
              const std::string& nature);

/// All six final stats for a combatant with the given base stats.
StatsTable calc_all_stats(const Combatant& combatant, const StatsTable& base);

/**
 * Smallest EV (rounded up to a multiple of 4) reaching target_stat,
 * or MAX_STAT_EV when unreachable.
 */
int min_ev_for_stat(StatId stat, int target_stat, int base, int iv, int level,
                    const std::string& nature);

} // namespace evsim

#endif // EVSIM_CORE_STAT_FORMULA_HPP
