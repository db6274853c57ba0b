/**
 * DamageCalculator — seam to the game's damage rules.
 *
 * Given attacker, defender, move, field and battle style, a calculator
 * returns every damage value the attack can roll. Each roll is assumed
 * equally likely. Drain and recoil are reported per roll.
 *
 * Implementations signal failure by throwing ComputationError.
 */

#ifndef EVSIM_DAMAGE_DAMAGE_CALCULATOR_HPP
#define EVSIM_DAMAGE_DAMAGE_CALCULATOR_HPP

#include "core/battle_types.hpp"
#include <string>
#include <vector>

namespace evsim::damage {

struct DamageRoll {
    int damage = 0;
    double percent = 0.0;       // damage / defender max HP
    int drain = 0;              // HP restored to the attacker
    int recoil = 0;             // HP lost by the attacker
};

struct DamageComputation {
    std::vector<DamageRoll> rolls;
    std::string move_type;
};

/// Everything a calculator may look at for one attack.
struct AttackContext {
    BattleSide actor = BattleSide::PLAYER;
    const Combatant* attacker = nullptr;
    const Combatant* defender = nullptr;
    const MoveConfig* move = nullptr;
    const FieldState* field = nullptr;
    BattleStyle style = BattleStyle::SINGLES;
};

class DamageCalculator {
public:
    virtual ~DamageCalculator() = default;

    /**
     * Compute all damage rolls for one attack.
     * Must return at least one roll.
     */
    virtual DamageComputation compute(const AttackContext& ctx) = 0;
};

} // namespace evsim::damage

#endif // EVSIM_DAMAGE_DAMAGE_CALCULATOR_HPP
