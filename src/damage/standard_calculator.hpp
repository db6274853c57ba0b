/**
 * StandardDamageCalculator — simplified generation 9 damage formula.
 *
 * Covers the modifiers that matter for bulk/offense investment questions:
 * spread, weather, critical hits, the 16 random rolls, STAB (including
 * terastallization and stellar), type effectiveness, burn, screens,
 * Helping Hand, Friend Guard and a handful of common items/abilities.
 * Anything outside that list is treated as neutral.
 */

#ifndef EVSIM_DAMAGE_STANDARD_CALCULATOR_HPP
#define EVSIM_DAMAGE_STANDARD_CALCULATOR_HPP

#include "damage/damage_calculator.hpp"
#include "data/game_data.hpp"
#include <vector>

namespace evsim::damage {

constexpr int NUM_DAMAGE_ROLLS = 16;

class StandardDamageCalculator : public DamageCalculator {
public:
    explicit StandardDamageCalculator(const data::GameData& data);

    /**
     * @throws ComputationError for unknown species or moves
     */
    DamageComputation compute(const AttackContext& ctx) override;

private:
    const data::GameData& data_;

    const data::SpeciesData& require_species(const std::string& name) const;
};

/// Stage multiplier applied to a stat (stage in [-6, 6]).
int apply_stage(int stat, int stage);

/// Multiply by mod/4096 and round half down, the game's fixed-point rounding.
int apply_modifier(int value, int mod4096);

} // namespace evsim::damage

#endif // EVSIM_DAMAGE_STANDARD_CALCULATOR_HPP
