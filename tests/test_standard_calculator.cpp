#include "damage/standard_calculator.hpp"
#include "data/type_chart.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace evsim;
using namespace evsim::damage;

namespace {

/**
 * Testmon (base 100 across the board, Normal type) at level 50 has
 * 120 in every non-HP stat and 175 HP with no investment.
 */
class StandardCalculatorTest : public ::testing::Test {
protected:
    data::JsonGameData catalog = test_support::make_catalog();
    SidePair<Combatant> combatants;
    MoveConfig move;
    FieldState field;
    BattleStyle style = BattleStyle::SINGLES;

    void SetUp() override {
        data::SpeciesData ghost;
        ghost.name = "Spooky";
        ghost.base_stats = StatsTable::filled(100);
        ghost.types = { "Ghost" };
        catalog.add_species(ghost);

        data::MoveData wave;
        wave.name = "Wave";
        wave.type = "Water";
        wave.category = MoveCategory::SPECIAL;
        wave.base_power = 90;
        wave.spread = true;
        catalog.add_move(wave);

        data::MoveData growl;
        growl.name = "Growl";
        growl.category = MoveCategory::STATUS;
        catalog.add_move(growl);

        combatants.player.species = "Testmon";
        combatants.opponent.species = "Testmon";
        combatants.opponent.max_hp = 175;
        combatants.opponent.current_hp = 175;
        move.name = "Hit";
    }

    DamageComputation compute() {
        StandardDamageCalculator calc(catalog);
        AttackContext ctx;
        ctx.actor = BattleSide::PLAYER;
        ctx.attacker = &combatants.player;
        ctx.defender = &combatants.opponent;
        ctx.move = &move;
        ctx.field = &field;
        ctx.style = style;
        return calc.compute(ctx);
    }

    int max_roll() { return compute().rolls.back().damage; }
};

} // anonymous namespace

TEST(DamageArithmetic, StageMultipliers) {
    EXPECT_EQ(apply_stage(100, 0), 100);
    EXPECT_EQ(apply_stage(100, 1), 150);
    EXPECT_EQ(apply_stage(100, 6), 400);
    EXPECT_EQ(apply_stage(100, -1), 66);
    EXPECT_EQ(apply_stage(100, -6), 25);
    EXPECT_EQ(apply_stage(100, 9), 400);
}

TEST(DamageArithmetic, ModifierRoundsHalfDown) {
    EXPECT_EQ(apply_modifier(31, 6144), 46);     // 46.5
    EXPECT_EQ(apply_modifier(37, 6144), 55);     // 55.5
    EXPECT_EQ(apply_modifier(40, 6144), 60);
    EXPECT_EQ(apply_modifier(37, 4096), 37);
}

TEST(TypeChart, Effectiveness) {
    EXPECT_DOUBLE_EQ(data::type_effectiveness("Fire", "Grass"), 2.0);
    EXPECT_DOUBLE_EQ(data::type_effectiveness("Normal", "Rock"), 0.5);
    EXPECT_DOUBLE_EQ(data::type_effectiveness("Normal", "Ghost"), 0.0);
    EXPECT_DOUBLE_EQ(data::type_effectiveness("Ground", std::vector<std::string>{ "Fire", "Steel" }), 4.0);
    EXPECT_DOUBLE_EQ(data::type_effectiveness("Made Up", "Fire"), 1.0);
    EXPECT_TRUE(data::is_known_type("Fairy"));
    EXPECT_FALSE(data::is_known_type("Shadow"));
}

TEST_F(StandardCalculatorTest, SixteenRollsWithStab) {
    DamageComputation r = compute();
    ASSERT_EQ(r.rolls.size(), static_cast<size_t>(NUM_DAMAGE_ROLLS));
    EXPECT_EQ(r.move_type, "Normal");
    EXPECT_EQ(r.rolls.front().damage, 46);
    EXPECT_EQ(r.rolls.back().damage, 55);
    EXPECT_NEAR(r.rolls.front().percent, 46.0 / 175.0, 1e-12);
    for (size_t i = 1; i < r.rolls.size(); i++) {
        EXPECT_LE(r.rolls[i - 1].damage, r.rolls[i].damage);
    }
}

TEST_F(StandardCalculatorTest, SunBoostsFireMoves) {
    move.name = "Blast";
    EXPECT_EQ(max_roll(), 41);
    field.weather = "Sun";
    EXPECT_EQ(max_roll(), 61);
    field.weather = "Rain";
    EXPECT_LT(max_roll(), 41);
}

TEST_F(StandardCalculatorTest, CriticalHitIgnoresScreens) {
    int plain = max_roll();
    field.sides.opponent.reflect = true;
    int screened = max_roll();
    EXPECT_LT(screened, plain);

    move.is_crit = true;
    EXPECT_GT(max_roll(), plain);
}

TEST_F(StandardCalculatorTest, ImmunityDealsNothing) {
    combatants.opponent.species = "Spooky";
    DamageComputation r = compute();
    ASSERT_EQ(r.rolls.size(), 1u);
    EXPECT_EQ(r.rolls[0].damage, 0);
}

TEST_F(StandardCalculatorTest, TerastallizedDefenderUsesTeraType) {
    combatants.opponent.species = "Spooky";
    combatants.opponent.tera_mode = TeraMode::TERA;
    combatants.opponent.tera_type = "Normal";
    EXPECT_EQ(max_roll(), 55);
}

TEST_F(StandardCalculatorTest, StatusMovesDealNothing) {
    move.name = "Growl";
    DamageComputation r = compute();
    ASSERT_EQ(r.rolls.size(), 1u);
    EXPECT_EQ(r.rolls[0].damage, 0);
}

TEST_F(StandardCalculatorTest, MultiHitMultipliesEachRoll) {
    move.hits = 2;
    EXPECT_EQ(max_roll(), 110);
}

TEST_F(StandardCalculatorTest, DrainAndRecoilFollowDamage) {
    move.drain_percent = 0.5;
    move.recoil_percent = 0.33;
    DamageComputation r = compute();
    EXPECT_EQ(r.rolls.front().drain, 23);
    EXPECT_EQ(r.rolls.back().drain, 28);       // ceil(27.5)
    EXPECT_EQ(r.rolls.back().recoil, 18);      // floor(18.15)
}

TEST_F(StandardCalculatorTest, SpreadMovesAreWeakerInDoubles) {
    move.name = "Wave";
    int singles = max_roll();
    style = BattleStyle::DOUBLES;
    EXPECT_LT(max_roll(), singles);
}

TEST_F(StandardCalculatorTest, AttackBoostsRaiseDamage) {
    int neutral = max_roll();
    combatants.player.boosts[StatId::ATK] = 2;
    EXPECT_GT(max_roll(), neutral);
}

TEST_F(StandardCalculatorTest, UnknownMoveOrSpeciesThrows) {
    move.name = "Nonexistent";
    EXPECT_THROW(compute(), ComputationError);

    move.name = "Hit";
    combatants.opponent.species = "Missingmon";
    EXPECT_THROW(compute(), ComputationError);
}
