#include "io/request_parser.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>

using namespace evsim;

namespace {

const char* RUN_MESSAGE = R"({
  "type": "run",
  "payload": {
    "requestId": "req-7",
    "pokemon": {
      "player":   { "species": "Garchomp", "level": 50, "nature": "Jolly",
                    "item": "Leftovers", "evs": { "hp": 4, "atk": 252 },
                    "boosts": { "atk": 8, "def": 0 }, "teraType": "Steel" },
      "opponent": { "species": "Testmon", "currentHP": 80, "maxHP": 160,
                    "overrides": { "baseStats": { "hp": 90, "atk": 90, "def": 90,
                                                  "spa": 90, "spd": 90, "spe": 90 } } }
    },
    "field": { "weather": "Rain", "defenderSide": { "isReflect": true, "spikes": 2 } },
    "options": { "batchSize": 25, "timeoutMs": 5000, "battleStyle": "doubles",
                 "allowRaidStellar": true },
    "scenario": {
      "turns": [
        { "turn": 1, "order": "opponent",
          "actions": [
            { "actor": "player", "move": { "name": "Earthquake", "isCrit": true },
              "teraMode": "tera", "teraType": "Ground" },
            { "id": "opp-move", "actor": "opponent", "type": "move",
              "move": { "name": "Hit", "overrides": { "power": 120 } } }
          ],
          "events": [
            { "type": "healing", "actor": "player", "amount": "fraction",
              "fractionNumerator": 1, "fractionDenominator": 16, "timing": "turn-end" },
            { "id": "sr", "type": "field-toggle",
              "attackerSide": { "isSR": true }, "field": { "trickRoom": true } },
            { "type": "stat-change", "actor": "opponent", "stages": { "spe": -1 },
              "relatedActionId": "opp-move" }
          ] },
        { "actions": [ { "actor": "opponent", "type": "switch",
                         "targetSpecies": "Garchomp", "setHpPercent": 75 } ] }
      ]
    },
    "evConfig": {
      "enabled": true, "targetSide": "opponent", "hpRange": [0, 252], "defRange": [4, 100],
      "axisStep": 16, "maxCombinedEV": 300, "prior": "bulky",
      "observationEventId": "opp-move", "observationPercent": [30, 45],
      "enableSurvival": true, "targetSurvival": 0.9
    }
  }
})";

JsonValue payload_with(const std::string& scenario_json, const std::string& extra = "") {
    return JsonReader::parse(
        R"({"requestId":"r","pokemon":{"player":{"species":"A"},"opponent":{"species":"B"}},)"
        R"("scenario":)" + scenario_json + extra + "}");
}

} // anonymous namespace

TEST(RequestParser, ParsesAFullRunMessage) {
    HostMessage msg = RequestParser::parse_message(JsonReader::parse(RUN_MESSAGE));
    ASSERT_EQ(msg.type, MessageType::RUN);
    EXPECT_EQ(msg.request_id, "req-7");

    const worker::JobRequest& req = msg.request;
    const Combatant& player = req.combatants.player;
    EXPECT_EQ(player.species, "Garchomp");
    EXPECT_EQ(player.nature, "Jolly");
    EXPECT_EQ(player.item, "Leftovers");
    EXPECT_EQ(player.evs.atk, 252);
    EXPECT_EQ(player.evs.def, 0);
    EXPECT_EQ(player.ivs.spe, 31);
    EXPECT_EQ(player.boosts.at(StatId::ATK), MAX_STAGE);
    EXPECT_EQ(player.boosts.count(StatId::DEF), 0u);
    EXPECT_EQ(player.current_hp, -1);

    const Combatant& opponent = req.combatants.opponent;
    EXPECT_EQ(opponent.current_hp, 80);
    EXPECT_EQ(opponent.max_hp, 160);
    ASSERT_TRUE(opponent.has_base_stat_overrides);
    EXPECT_EQ(opponent.base_stat_overrides.def, 90);

    EXPECT_EQ(req.field.weather, "Rain");
    EXPECT_TRUE(req.field.sides.opponent.reflect);
    EXPECT_EQ(req.field.sides.opponent.spikes, 2);
    EXPECT_FALSE(req.field.sides.player.reflect);

    EXPECT_EQ(req.options.batch_size, 25);
    EXPECT_EQ(req.options.timeout_ms, 5000);
    EXPECT_EQ(req.options.style, BattleStyle::DOUBLES);
    EXPECT_TRUE(req.scenario.allow_raid_stellar);
}

TEST(RequestParser, ScenarioIdsAndPayloads) {
    HostMessage msg = RequestParser::parse_message(JsonReader::parse(RUN_MESSAGE));
    const timeline::Scenario& s = msg.request.scenario;
    ASSERT_EQ(s.turns.size(), 2u);

    const timeline::TimelineTurn& t1 = s.turns[0];
    EXPECT_EQ(t1.id, "turn-1");
    ASSERT_TRUE(t1.has_order);
    EXPECT_EQ(t1.order, BattleSide::OPPONENT);
    ASSERT_EQ(t1.actions.size(), 2u);
    EXPECT_EQ(t1.actions[0].id, "t1-action-0");
    EXPECT_EQ(t1.actions[1].id, "opp-move");

    const auto& eq = std::get<timeline::MoveAction>(t1.actions[0].payload);
    EXPECT_EQ(eq.move.name, "Earthquake");
    EXPECT_TRUE(eq.move.is_crit);
    ASSERT_TRUE(eq.move.has_tera_mode);
    EXPECT_EQ(eq.move.tera_mode, TeraMode::TERA);
    EXPECT_EQ(eq.move.tera_type, "Ground");
    EXPECT_EQ(std::get<timeline::MoveAction>(t1.actions[1].payload).move.power_override, 120);

    ASSERT_EQ(t1.events.size(), 3u);
    EXPECT_EQ(t1.events[0].id, "t1-healing-0");
    EXPECT_EQ(t1.events[0].timing, timeline::EventTiming::TURN_END);
    const auto& heal = std::get<timeline::HealingEvent>(t1.events[0].payload);
    EXPECT_EQ(heal.kind, timeline::HealingEvent::Kind::FRACTION);
    EXPECT_DOUBLE_EQ(heal.denominator, 16.0);

    const auto& toggle = std::get<timeline::FieldToggleEvent>(t1.events[1].payload);
    EXPECT_FALSE(t1.events[1].has_actor);
    EXPECT_TRUE(toggle.update.set_trick_room);
    EXPECT_FALSE(toggle.update.set_weather);
    ASSERT_EQ(toggle.update.sides.player.count(SideCondition::STEALTH_ROCK), 1u);
    EXPECT_TRUE(toggle.update.sides.opponent.empty());

    EXPECT_EQ(t1.events[2].related_action_id, "opp-move");
    EXPECT_EQ(std::get<timeline::StatChangeEvent>(t1.events[2].payload).stages.at(StatId::SPE), -1);

    const timeline::TimelineTurn& t2 = s.turns[1];
    EXPECT_EQ(t2.turn, 2);
    EXPECT_FALSE(t2.has_order);
    const auto& sw = std::get<timeline::SwitchEvent>(t2.actions[0].payload);
    EXPECT_EQ(sw.species, "Garchomp");
    EXPECT_DOUBLE_EQ(sw.hp_percent, 75.0);
}

TEST(RequestParser, GridConfiguration) {
    HostMessage msg = RequestParser::parse_message(JsonReader::parse(RUN_MESSAGE));
    ASSERT_TRUE(msg.request.has_grid);
    const grid::GridConfig& g = msg.request.grid;

    EXPECT_TRUE(g.enabled);
    EXPECT_EQ(g.target_side, BattleSide::OPPONENT);
    EXPECT_EQ(g.def_range.min, 4);
    EXPECT_EQ(g.def_range.max, 100);
    EXPECT_EQ(g.axis_step, 16);
    ASSERT_TRUE(g.has_max_combined);
    EXPECT_EQ(g.max_combined, 300);
    EXPECT_EQ(g.prior.type, grid::PriorType::META);
    EXPECT_EQ(g.prior.meta_profile, "bulky");
    EXPECT_EQ(g.observation_event_id, "opp-move");
    ASSERT_TRUE(g.has_observation_percent);
    EXPECT_DOUBLE_EQ(g.observation_max_percent, 45.0);
    EXPECT_TRUE(g.enable_survival);
    EXPECT_FALSE(g.enable_ko);
    EXPECT_DOUBLE_EQ(g.target_survival, 0.9);
}

TEST(RequestParser, CustomPriorObject) {
    grid::GridConfig g = RequestParser::parse_grid(JsonReader::parse(
        R"({"enabled":true,"prior":{"type":"custom","customWeights":[{"hpEV":4,"defEV":8,"weight":2.5}]}})"));
    EXPECT_EQ(g.prior.type, grid::PriorType::CUSTOM);
    ASSERT_EQ(g.prior.custom_weights.size(), 1u);
    EXPECT_EQ(g.prior.custom_weights[0].def_ev, 8);
    EXPECT_DOUBLE_EQ(g.prior.custom_weights[0].weight, 2.5);

    EXPECT_THROW(RequestParser::parse_grid(JsonReader::parse(R"({"prior":{"type":"weird"}})")),
                 ConfigurationError);
}

TEST(RequestParser, LegacyGridKeyIsAccepted) {
    worker::JobRequest req = RequestParser::parse_request(
        payload_with(R"({"turns":[]})", R"(,"evGridConfig":{"enabled":true})"));
    EXPECT_TRUE(req.has_grid);
    EXPECT_TRUE(req.grid.enabled);

    worker::JobRequest bare = RequestParser::parse_request(payload_with(R"({"turns":[]})"));
    EXPECT_FALSE(bare.has_grid);
}

TEST(RequestParser, CancelMessage) {
    HostMessage msg = RequestParser::parse_message(
        JsonReader::parse(R"({"type":"cancel","payload":{"requestId":"req-7"}})"));
    EXPECT_EQ(msg.type, MessageType::CANCEL);
    EXPECT_EQ(msg.request_id, "req-7");

    EXPECT_THROW(RequestParser::parse_message(JsonReader::parse(R"({"type":"cancel","payload":{}})")),
                 ConfigurationError);
}

TEST(RequestParser, RejectsMalformedRequests) {
    auto parse = [](const std::string& json) {
        return RequestParser::parse_message(JsonReader::parse(json));
    };

    EXPECT_THROW(parse(R"({"type":"explode","payload":{}})"), ConfigurationError);
    EXPECT_THROW(parse(R"([1,2])"), ConfigurationError);
    EXPECT_THROW(parse(R"({"type":"run","payload":{"pokemon":{}}})"), ConfigurationError);
    EXPECT_THROW(parse(R"({"type":"run","payload":{"requestId":"x","scenario":{"turns":[]}}})"),
                 ConfigurationError);

    EXPECT_THROW(RequestParser::parse_request(payload_with(R"({})")), ConfigurationError);
    EXPECT_THROW(RequestParser::parse_request(payload_with(
                     R"({"turns":[{"events":[{"type":"ability-activation","actor":"player"}]}]})")),
                 ConfigurationError);
    EXPECT_THROW(RequestParser::parse_request(payload_with(
                     R"({"turns":[{"actions":[{"actor":"both","move":{"name":"Hit"}}]}]})")),
                 ConfigurationError);
    EXPECT_THROW(RequestParser::parse_request(payload_with(
                     R"({"turns":[{"actions":[{"actor":"player","move":{}}]}]})")),
                 ConfigurationError);
    EXPECT_THROW(RequestParser::parse_request(payload_with(
                     R"({"turns":[{"events":[{"type":"stat-change","stages":{"luck":1}}]}]})")),
                 ConfigurationError);
    EXPECT_THROW(RequestParser::parse_request(payload_with(
                     R"({"turns":[{"events":[{"type":"healing","actor":"player"}]}]})")),
                 ConfigurationError);
    EXPECT_THROW(RequestParser::parse_grid(JsonReader::parse(R"({"hpRange":[0]})")),
                 ConfigurationError);
    EXPECT_THROW(RequestParser::parse_grid(JsonReader::parse(R"({"defRange":[0, 1e20]})")),
                 ConfigurationError);
    EXPECT_THROW(RequestParser::parse_grid(JsonReader::parse(R"({"atkRange":[-8, 8]})")),
                 ConfigurationError);
}
