#include "worker/job_orchestrator.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>

using namespace evsim;
using namespace evsim::worker;
using evsim::test_support::ScriptedCalculator;
using evsim::test_support::attack_turn;

namespace {

class JobOrchestratorTest : public ::testing::Test {
protected:
    data::JsonGameData catalog = test_support::make_catalog();
    ScriptedCalculator calc;
    std::vector<JobResponse> responses;
    OrchestratorConfig config;

    std::unique_ptr<JobOrchestrator> make() {
        return std::make_unique<JobOrchestrator>(
            catalog, calc, [this](const JobResponse& r) { responses.push_back(r); }, config);
    }

    /// Opponent hits the player once; the player's max HP comes from its EVs.
    static JobRequest base_request(const std::string& id) {
        JobRequest req;
        req.request_id = id;
        req.combatants.player.species = "Testmon";
        req.combatants.opponent = test_support::make_combatant("Testmon", 100);
        req.scenario.turns.push_back(attack_turn(1, BattleSide::OPPONENT, "Hit"));
        return req;
    }

    /// HP EVs 0 / 4 / 8 with Def fixed at 0.
    static JobRequest grid_request(const std::string& id) {
        JobRequest req = base_request(id);
        req.has_grid = true;
        req.grid.enabled = true;
        req.grid.hp_range = { 0, 8 };
        req.grid.def_range = { 0, 0 };
        req.grid.axis_step = 4;
        return req;
    }

    std::vector<JobResponse> of_type(ResponseType type) const {
        std::vector<JobResponse> out;
        for (const auto& r : responses) {
            if (r.type == type) out.push_back(r);
        }
        return out;
    }

    size_t terminal_count() const {
        size_t n = 0;
        for (const auto& r : responses) n += r.is_terminal() ? 1 : 0;
        return n;
    }
};

} // anonymous namespace

TEST_F(JobOrchestratorTest, DeterministicRunCompletes) {
    calc.set_rolls("Hit", { 40, 60 });
    JobRequest req = base_request("det");
    req.combatants.player.max_hp = 100;
    auto orch = make();

    ASSERT_TRUE(orch->start(req));
    EXPECT_TRUE(orch->busy());
    orch->run();

    EXPECT_FALSE(orch->busy());
    EXPECT_EQ(orch->last_state(), JobState::COMPLETE);
    ASSERT_EQ(responses.size(), 2u);
    EXPECT_EQ(responses[0].type, ResponseType::PROGRESS);
    EXPECT_EQ(responses[0].progress.phase, JobPhase::INITIALIZING);
    EXPECT_EQ(responses[1].type, ResponseType::COMPLETE);
    EXPECT_EQ(responses[1].request_id, "det");

    const JobSummary& s = responses[1].summary;
    EXPECT_DOUBLE_EQ(s.survival, 1.0);
    ASSERT_EQ(s.hp_distribution.size(), 2u);
    EXPECT_EQ(s.snapshots.size(), 1u);
    EXPECT_FALSE(s.has_heatmap);
    EXPECT_FALSE(s.has_top_plans);
}

TEST_F(JobOrchestratorTest, DisabledGridRunsDeterministically) {
    calc.set_rolls("Hit", { 10 });
    JobRequest req = grid_request("off");
    req.grid.enabled = false;
    auto orch = make();

    ASSERT_TRUE(orch->start(req));
    orch->run();
    auto complete = of_type(ResponseType::COMPLETE);
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_FALSE(complete[0].summary.has_heatmap);
    EXPECT_TRUE(of_type(ResponseType::PROGRESS).size() == 1u);
}

TEST_F(JobOrchestratorTest, DefensiveGridReportsSurvivalInsights) {
    // Testmon at 0 HP EVs has 175 HP; 4 and 8 EVs give 176
    calc.set_rolls("Hit", { 175 });
    JobRequest req = grid_request("grid");
    req.grid.enable_survival = true;
    req.grid.target_survival = 0.5;
    req.options.batch_size = 2;
    auto orch = make();

    ASSERT_TRUE(orch->start(req));
    orch->run();
    ASSERT_EQ(orch->last_state(), JobState::COMPLETE);

    auto progress = of_type(ResponseType::PROGRESS);
    ASSERT_EQ(progress.size(), 4u);
    EXPECT_EQ(progress[1].progress.phase, JobPhase::PROCESSING);
    EXPECT_EQ(progress[1].progress.total, 3);
    EXPECT_EQ(progress[2].progress.phase, JobPhase::EVALUATING);
    EXPECT_EQ(progress[2].progress.processed, 2);
    EXPECT_EQ(progress[3].progress.phase, JobPhase::FINALIZING);
    EXPECT_EQ(progress[3].progress.processed, 3);

    const JobSummary s = of_type(ResponseType::COMPLETE).at(0).summary;
    EXPECT_NEAR(s.survival, 2.0 / 3.0, 1e-12);
    ASSERT_TRUE(s.has_heatmap);
    EXPECT_EQ(s.heatmap.size(), 3u);
    EXPECT_DOUBLE_EQ(s.heatmap[0].value, 0.0);
    EXPECT_DOUBLE_EQ(s.heatmap[1].value, 1.0);

    ASSERT_TRUE(s.has_top_plans);
    ASSERT_EQ(s.top_plans.size(), 1u);
    EXPECT_EQ(s.top_plans[0].hp_ev, 4);
    EXPECT_TRUE(s.top_plans[0].meets_target);

    ASSERT_TRUE(s.has_sensitivity);
    EXPECT_NEAR(s.sensitivity.hp, 0.25, 1e-12);
    EXPECT_FALSE(s.has_ko_chance);
    EXPECT_EQ(terminal_count(), 1u);
}

TEST_F(JobOrchestratorTest, ObservationConcentratesThePosterior) {
    calc.set_rolls("Hit", { 88 });
    JobRequest req = grid_request("obs");
    req.grid.hp_range = { 0, 4 };
    req.grid.observation_event_id = "t1-opponent";
    req.grid.has_observation_percent = true;
    req.grid.observation_min_percent = 50.2;
    req.grid.observation_max_percent = 100.0;
    auto orch = make();

    ASSERT_TRUE(orch->start(req));
    orch->run();

    const JobSummary s = of_type(ResponseType::COMPLETE).at(0).summary;
    ASSERT_EQ(s.heatmap.size(), 2u);
    // 88 / 175 is inside the observed band, 88 / 176 is not
    EXPECT_DOUBLE_EQ(s.heatmap[0].weight, 1.0);
    EXPECT_DOUBLE_EQ(s.heatmap[1].weight, 0.0);
    ASSERT_FALSE(s.hp_distribution.empty());
    EXPECT_EQ(s.hp_distribution.front().hp, 175 - 88);
}

TEST_F(JobOrchestratorTest, OffensiveGridReportsKoChance) {
    calc.set_rule("Hit", [](const damage::AttackContext& ctx) {
        return ScriptedCalculator::rolls_of({ ctx.attacker->evs.atk >= 4 ? 100 : 50 });
    });
    JobRequest req = base_request("ko");
    req.combatants.player.max_hp = 100;
    req.scenario.turns.clear();
    req.scenario.turns.push_back(attack_turn(1, BattleSide::PLAYER, "Hit"));
    req.has_grid = true;
    req.grid.enabled = true;
    req.grid.enable_ko = true;
    req.grid.target_ko = 0.9;
    req.grid.atk_range = { 0, 4 };
    req.grid.spa_range = { 0, 0 };
    req.grid.axis_step = 4;
    auto orch = make();

    ASSERT_TRUE(orch->start(req));
    orch->run();
    ASSERT_EQ(orch->last_state(), JobState::COMPLETE);

    const JobSummary s = of_type(ResponseType::COMPLETE).at(0).summary;
    ASSERT_TRUE(s.has_ko_chance);
    EXPECT_NEAR(s.ko_chance, 0.5, 1e-12);
    ASSERT_TRUE(s.has_ko_plans);
    ASSERT_EQ(s.ko_plans.size(), 1u);
    EXPECT_EQ(s.ko_plans[0].atk_ev, 4);
    EXPECT_TRUE(s.ko_plans[0].meets_target);
    EXPECT_FALSE(s.has_heatmap);
    EXPECT_FALSE(s.has_top_plans);
}

TEST_F(JobOrchestratorTest, SurvivalAndKoTogetherRunBothGrids) {
    calc.set_rolls("Hit", { 10 });
    JobRequest req = grid_request("both");
    req.grid.enable_survival = true;
    req.grid.enable_ko = true;
    req.grid.atk_range = { 0, 0 };
    req.grid.spa_range = { 0, 0 };
    auto orch = make();

    ASSERT_TRUE(orch->start(req));
    orch->run();

    const JobSummary s = of_type(ResponseType::COMPLETE).at(0).summary;
    EXPECT_TRUE(s.has_heatmap);
    EXPECT_TRUE(s.has_top_plans);
    EXPECT_TRUE(s.has_ko_chance);
    EXPECT_TRUE(s.has_ko_plans);
    EXPECT_NEAR(s.survival, 1.0, 1e-12);
}

TEST_F(JobOrchestratorTest, BusyOrchestratorRejectsASecondJob) {
    calc.set_rolls("Hit", { 10 });
    auto orch = make();

    ASSERT_TRUE(orch->start(grid_request("first")));
    EXPECT_FALSE(orch->start(base_request("second")));

    auto errors = of_type(ResponseType::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].request_id, "second");
    EXPECT_NE(errors[0].error.find("first"), std::string::npos);

    ASSERT_TRUE(orch->busy());
    EXPECT_EQ(orch->active_handle()->request_id(), "first");
    orch->run();
    EXPECT_EQ(orch->last_state(), JobState::COMPLETE);
}

TEST_F(JobOrchestratorTest, CancelStopsBetweenBatches) {
    calc.set_rolls("Hit", { 10 });
    JobRequest req = grid_request("c1");
    req.options.batch_size = 1;
    auto orch = make();

    ASSERT_TRUE(orch->start(req));
    EXPECT_TRUE(orch->resume());
    EXPECT_FALSE(orch->cancel("someone-else"));
    EXPECT_TRUE(orch->cancel("c1"));
    EXPECT_FALSE(orch->resume());

    EXPECT_EQ(orch->last_state(), JobState::CANCELLED);
    EXPECT_FALSE(orch->busy());
    ASSERT_EQ(of_type(ResponseType::CANCELLED).size(), 1u);
    EXPECT_TRUE(of_type(ResponseType::COMPLETE).empty());
    EXPECT_EQ(terminal_count(), 1u);
}

TEST_F(JobOrchestratorTest, CancelBeforeDeterministicRun) {
    calc.set_rolls("Hit", { 10 });
    JobRequest req = base_request("c2");
    auto orch = make();

    ASSERT_TRUE(orch->start(req));
    orch->active_handle()->cancel();
    orch->run();
    EXPECT_EQ(orch->last_state(), JobState::CANCELLED);
    EXPECT_EQ(calc.calls(), 0);
}

TEST_F(JobOrchestratorTest, CancelWhenIdleDoesNothing) {
    auto orch = make();
    EXPECT_FALSE(orch->cancel("nothing"));
    EXPECT_FALSE(orch->resume());
    EXPECT_TRUE(responses.empty());
    EXPECT_EQ(orch->last_state(), JobState::IDLE);
}

TEST_F(JobOrchestratorTest, DeadlineRaisesTimeout) {
    auto origin = std::chrono::steady_clock::time_point();
    std::chrono::milliseconds now(0);

    // Every damage computation costs one simulated second
    calc.set_rule("Hit", [&now](const damage::AttackContext&) {
        now += std::chrono::milliseconds(1000);
        return ScriptedCalculator::rolls_of({ 10 });
    });
    JobRequest req = grid_request("slow");
    req.options.timeout_ms = 1500;
    auto orch = make();
    orch->set_clock([&] { return origin + now; });

    ASSERT_TRUE(orch->start(req));
    orch->run();

    EXPECT_EQ(orch->last_state(), JobState::ERROR);
    auto errors = of_type(ResponseType::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].error.find("timeout"), std::string::npos);
    EXPECT_NE(errors[0].error.find("processed 2/3"), std::string::npos);
    EXPECT_TRUE(of_type(ResponseType::COMPLETE).empty());
}

TEST_F(JobOrchestratorTest, CalculatorFailureEndsTheJob) {
    calc.set_rule("Hit", [](const damage::AttackContext&) -> std::vector<damage::DamageRoll> {
        throw ComputationError("no data for Hit");
    });
    auto orch = make();

    ASSERT_TRUE(orch->start(grid_request("boom")));
    orch->run();

    EXPECT_EQ(orch->last_state(), JobState::ERROR);
    auto errors = of_type(ResponseType::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error, "no data for Hit");
    EXPECT_FALSE(orch->busy());
}

TEST_F(JobOrchestratorTest, UnknownSpeciesFailsAtStart) {
    JobRequest req = base_request("bad");
    req.combatants.opponent.species = "Missingno";
    auto orch = make();

    EXPECT_FALSE(orch->start(req));
    EXPECT_FALSE(orch->busy());
    EXPECT_EQ(orch->last_state(), JobState::ERROR);
    auto errors = of_type(ResponseType::ERROR);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error, "Unknown species: Missingno");
}

TEST_F(JobOrchestratorTest, InvalidGridFailsAtStart) {
    JobRequest req = grid_request("bad-grid");
    req.grid.axis_step = 0;
    auto orch = make();

    EXPECT_FALSE(orch->start(req));
    EXPECT_EQ(of_type(ResponseType::ERROR).size(), 1u);

    // Free again for the next job
    calc.set_rolls("Hit", { 10 });
    EXPECT_TRUE(orch->start(base_request("next")));
}
