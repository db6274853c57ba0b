#include "timeline/branch.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <map>

using namespace evsim;
using namespace evsim::timeline;

namespace {

Branch branch_with(int player_hp, int opponent_hp, double p) {
    Branch b = make_initial_branch(test_support::make_combatants(100, 100), FieldState());
    b.set_hp(BattleSide::PLAYER, player_hp);
    b.set_hp(BattleSide::OPPONENT, opponent_hp);
    b.probability = p;
    return b;
}

std::map<std::string, double> mass_by_key(const BranchArena& arena) {
    std::map<std::string, double> out;
    for (const auto& b : arena.branches()) out[canonical_key(b)] += b.probability;
    return out;
}

} // anonymous namespace

TEST(Branch, InitialBranchFillsMissingHp) {
    SidePair<Combatant> pair = test_support::make_combatants(120, 80);
    pair.player.current_hp = -1;
    pair.opponent.max_hp = 0;
    pair.opponent.current_hp = 55;

    Branch b = make_initial_branch(pair, FieldState());
    EXPECT_EQ(b.hp(BattleSide::PLAYER), 120);
    EXPECT_EQ(b.max_hp(BattleSide::OPPONENT), 55);
    EXPECT_EQ(b.hp(BattleSide::OPPONENT), 55);
    EXPECT_DOUBLE_EQ(b.probability, 1.0);
    EXPECT_FALSE(b.terminated);
}

TEST(Branch, MergeCollapsesEqualStatesAndKeepsMass) {
    BranchArena arena;
    arena.assign({ branch_with(60, 100, 0.25), branch_with(40, 100, 0.25),
                   branch_with(60, 100, 0.5) });
    arena.merge();

    ASSERT_EQ(arena.size(), 2u);
    EXPECT_DOUBLE_EQ(arena.total_probability(), 1.0);
    // First occurrence keeps its slot
    EXPECT_EQ(arena.branches()[0].hp(BattleSide::PLAYER), 60);
    EXPECT_DOUBLE_EQ(arena.branches()[0].probability, 0.75);
}

TEST(Branch, MergeIsOrderIndependent) {
    std::vector<Branch> input = { branch_with(10, 90, 0.1), branch_with(20, 90, 0.2),
                                  branch_with(10, 90, 0.3), branch_with(20, 80, 0.4) };
    BranchArena forward;
    forward.assign(input);
    forward.merge();

    std::reverse(input.begin(), input.end());
    BranchArena backward;
    backward.assign(input);
    backward.merge();

    auto a = mass_by_key(forward);
    auto b = mass_by_key(backward);
    ASSERT_EQ(a.size(), b.size());
    for (const auto& [key, mass] : a) {
        ASSERT_TRUE(b.count(key));
        EXPECT_NEAR(mass, b[key], 1e-12);
    }
}

TEST(Branch, MergeAfterMergeChangesNothing) {
    BranchArena arena;
    arena.assign({ branch_with(10, 90, 0.5), branch_with(10, 90, 0.5) });
    arena.merge();
    auto once = mass_by_key(arena);
    arena.merge();
    EXPECT_EQ(mass_by_key(arena), once);
}

TEST(Branch, KeySeparatesBoostsFieldAndTermination) {
    Branch base = branch_with(50, 50, 1.0);
    const std::string key = canonical_key(base);

    Branch boosted = base;
    boosted.combatants.player.boosts[StatId::DEF] = 1;
    EXPECT_NE(canonical_key(boosted), key);

    Branch rain = base;
    rain.field.weather = "Rain";
    EXPECT_NE(canonical_key(rain), key);

    Branch spikes = base;
    spikes.field.sides.opponent.spikes = 2;
    EXPECT_NE(canonical_key(spikes), key);

    Branch done = base;
    done.terminated = true;
    EXPECT_NE(canonical_key(done), key);

    Branch stellar = base;
    stellar.stellar_used.player.insert("Fire");
    EXPECT_NE(canonical_key(stellar), key);

    Branch hit = base;
    hit.last_damage.opponent = 12;
    EXPECT_NE(canonical_key(hit), key);

    // Probability is not part of the state
    Branch lighter = base;
    lighter.probability = 0.1;
    EXPECT_EQ(canonical_key(lighter), key);
}

TEST(Branch, DistributionIsNormalizedAndSorted) {
    std::vector<Branch> branches = { branch_with(70, 0, 0.2), branch_with(30, 0, 0.2),
                                     branch_with(70, 0, 0.1) };
    auto dist = to_distribution(branches, BattleSide::PLAYER);

    ASSERT_EQ(dist.size(), 2u);
    EXPECT_EQ(dist[0].hp, 30);
    EXPECT_EQ(dist[1].hp, 70);
    EXPECT_NEAR(dist[0].probability, 0.4, 1e-12);
    EXPECT_NEAR(dist[1].probability, 0.6, 1e-12);
    EXPECT_NEAR(weighted_average(dist), 30 * 0.4 + 70 * 0.6, 1e-9);
    EXPECT_TRUE(to_distribution({}, BattleSide::PLAYER).empty());
}

TEST(Branch, SurvivalCountsLivingMass) {
    BranchArena arena;
    arena.assign({ branch_with(0, 50, 0.3), branch_with(20, 0, 0.7) });
    EXPECT_DOUBLE_EQ(arena.survival(BattleSide::PLAYER), 0.7);
    EXPECT_DOUBLE_EQ(arena.survival(BattleSide::OPPONENT), 0.3);
    EXPECT_FALSE(arena.all_terminated());
}
