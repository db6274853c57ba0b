#include "core/stat_formula.hpp"
#include <gtest/gtest.h>

using namespace evsim;

TEST(StatFormula, HpUsesLevelPlusTen) {
    // Garchomp, level 50, 31 IV, 252 EV
    EXPECT_EQ(calc_stat(StatId::HP, 108, 31, 252, 50, "Jolly"), 215);
    EXPECT_EQ(calc_stat(StatId::HP, 108, 31, 0, 50, "Jolly"), 183);
}

TEST(StatFormula, NatureScalesNonHpStats) {
    EXPECT_EQ(calc_stat(StatId::ATK, 130, 31, 252, 50, "Hardy"), 182);
    EXPECT_EQ(calc_stat(StatId::ATK, 130, 31, 252, 50, "Adamant"), 200);
    EXPECT_EQ(calc_stat(StatId::ATK, 130, 31, 252, 50, "Modest"), 163);
}

TEST(StatFormula, EvsAreClampedToTheStatCap) {
    EXPECT_EQ(calc_stat(StatId::DEF, 100, 31, 400, 50, "Hardy"),
              calc_stat(StatId::DEF, 100, 31, 252, 50, "Hardy"));
    EXPECT_EQ(calc_stat(StatId::DEF, 100, 31, -8, 50, "Hardy"),
              calc_stat(StatId::DEF, 100, 31, 0, 50, "Hardy"));
}

TEST(StatFormula, BaseOneHpIsAlwaysOne) {
    EXPECT_EQ(calc_stat(StatId::HP, 1, 31, 252, 100, "Hardy"), 1);
}

TEST(StatFormula, NatureModifiers) {
    EXPECT_EQ(nature_modifier_tenths("Adamant", StatId::ATK), 11);
    EXPECT_EQ(nature_modifier_tenths("Adamant", StatId::SPA), 9);
    EXPECT_EQ(nature_modifier_tenths("Adamant", StatId::SPE), 10);
    EXPECT_EQ(nature_modifier_tenths("Adamant", StatId::HP), 10);
    EXPECT_EQ(nature_modifier_tenths("Serious", StatId::SPE), 10);
    EXPECT_EQ(nature_modifier_tenths("Unknown", StatId::ATK), 10);

    EXPECT_TRUE(is_known_nature("Bold"));
    EXPECT_FALSE(is_known_nature("bold"));
}

TEST(StatFormula, CalcAllStatsUsesCombatantBuild) {
    Combatant c;
    c.level = 50;
    c.nature = "Bold";
    c.evs.hp = 252;
    c.evs.def = 252;

    StatsTable stats = calc_all_stats(c, StatsTable::filled(100));
    EXPECT_EQ(stats.hp, 207);
    EXPECT_EQ(stats.def, 167);
    EXPECT_EQ(stats.atk, 108);
    EXPECT_EQ(stats.spe, 120);
}

TEST(StatFormula, MinimumEvForTarget) {
    EXPECT_EQ(min_ev_for_stat(StatId::HP, 214, 108, 31, 50, "Hardy"), 244);
    EXPECT_EQ(min_ev_for_stat(StatId::HP, 183, 108, 31, 50, "Hardy"), 0);
    EXPECT_EQ(min_ev_for_stat(StatId::HP, 999, 108, 31, 50, "Hardy"), MAX_STAT_EV);
}
