#include "io/request_parser.hpp"
#include "core/errors.hpp"
#include "core/stat_formula.hpp"
#include <algorithm>

namespace evsim {

namespace {

using timeline::BattleAction;
using timeline::BattleEvent;

/// Reads an optional side; throws on anything but "player" / "opponent".
bool read_side(const JsonValue& v, const std::string& what, BattleSide& out) {
    if (v.is_null()) return false;
    std::string s = v.get_string();
    if (s != "player" && s != "opponent") {
        throw ConfigurationError(what + " must be \"player\" or \"opponent\"");
    }
    out = side_from_string(s, BattleSide::PLAYER);
    return true;
}

void read_stats(const JsonValue& v, StatsTable& out) {
    if (!v.is_object()) return;
    for (StatId stat : ALL_STATS) {
        const JsonValue& entry = v[stat_to_string(stat)];
        if (entry.is_number()) out[stat] = entry.as_int();
    }
}

bool read_range(const JsonValue& v, const std::string& what, grid::EvRange& out) {
    if (v.is_null()) return false;
    double lo = 0.0;
    double hi = 0.0;
    if (!v.get_number_pair(lo, hi)) {
        throw ConfigurationError(what + " must be a [min, max] pair");
    }
    if (lo < 0.0 || hi > MAX_STAT_EV || lo > hi) {
        throw ConfigurationError(what + " must lie within [0, " +
                                 std::to_string(MAX_STAT_EV) + "]");
    }
    out.min = static_cast<int>(lo);
    out.max = static_cast<int>(hi);
    return true;
}

bool read_percent_pair(const JsonValue& v, const std::string& what, double& lo, double& hi) {
    if (v.is_null()) return false;
    if (!v.get_number_pair(lo, hi)) {
        throw ConfigurationError(what + " must be a [min, max] pair");
    }
    return true;
}

int condition_value(const JsonValue& v) {
    if (v.is_bool()) return v.as_bool() ? 1 : 0;
    return v.get_int(0);
}

void apply_side(const JsonValue& v, SideConditions& side) {
    if (!v.is_object()) return;
    for (const auto& key : v.keys()) {
        SideCondition condition;
        if (side_condition_from_key(key, condition)) {
            set_side_condition(side, condition, condition_value(v[key]));
        }
    }
}

void collect_side_update(const JsonValue& v, std::map<SideCondition, int>& out) {
    if (!v.is_object()) return;
    for (const auto& key : v.keys()) {
        SideCondition condition;
        if (side_condition_from_key(key, condition)) {
            out[condition] = condition_value(v[key]);
        }
    }
}

FieldUpdate parse_field_update(const JsonValue& ev) {
    FieldUpdate u;
    const JsonValue& f = ev["field"];
    if (f.is_object()) {
        if (f.has("weather")) {
            u.set_weather = true;
            u.weather = f["weather"].get_string();
        }
        if (f.has("terrain")) {
            u.set_terrain = true;
            u.terrain = f["terrain"].get_string();
        }
        if (f.has("trickRoom")) {
            u.set_trick_room = true;
            u.trick_room = f["trickRoom"].get_bool();
        }
        if (f.has("wonderRoom")) {
            u.set_wonder_room = true;
            u.wonder_room = f["wonderRoom"].get_bool();
        }
        if (f.has("magicRoom")) {
            u.set_magic_room = true;
            u.magic_room = f["magicRoom"].get_bool();
        }
        if (f.has("gravity")) {
            u.set_gravity = true;
            u.gravity = f["gravity"].get_bool();
        }
    }
    collect_side_update(ev["attackerSide"], u.sides.player);
    collect_side_update(ev["defenderSide"], u.sides.opponent);
    return u;
}

timeline::SwitchEvent parse_switch(const JsonValue& v) {
    timeline::SwitchEvent sw;
    sw.species = v["targetSpecies"].get_string(v["pokemon"]["species"].get_string());
    if (v.has("ability")) {
        sw.has_ability = true;
        sw.ability = v["ability"].get_string();
    }
    if (v.has("item")) {
        sw.has_item = true;
        sw.item = v["item"].get_string();
    }
    if (v["setHpPercent"].is_number()) {
        sw.has_hp_percent = true;
        sw.hp_percent = v["setHpPercent"].as_number();
    }
    return sw;
}

timeline::HealingEvent parse_healing(const JsonValue& ev, const std::string& id) {
    timeline::HealingEvent heal;
    const JsonValue& amount = ev["amount"];
    if (amount.is_number()) {
        heal.kind = timeline::HealingEvent::Kind::ABSOLUTE;
        heal.amount = amount.as_int();
    } else if (amount.get_string() == "fraction") {
        heal.kind = timeline::HealingEvent::Kind::FRACTION;
        if (ev["fraction"].is_number()) {
            heal.has_fraction = true;
            heal.fraction = ev["fraction"].as_number();
        }
        heal.numerator = ev["fractionNumerator"].get_number(1.0);
        heal.denominator = ev["fractionDenominator"].get_number(0.0);
    } else if (amount.is_object()) {
        heal.kind = timeline::HealingEvent::Kind::RANGE_MIN;
        heal.amount = amount["min"].get_int(0);
    } else {
        throw ConfigurationError("Healing event " + id + " has no usable amount");
    }
    return heal;
}

timeline::StatChangeEvent parse_stat_change(const JsonValue& ev, const std::string& id) {
    timeline::StatChangeEvent change;
    const JsonValue& stages = ev["stages"];
    for (const auto& key : stages.keys()) {
        StatId stat;
        if (!stat_from_string(key, stat)) {
            throw ConfigurationError("Stat-change event " + id + " names unknown stat " + key);
        }
        change.stages[stat] = stages[key].get_int(0);
    }
    return change;
}

BattleEvent parse_event(const JsonValue& ev, int turn, size_t index) {
    BattleEvent event;
    const std::string kind = ev["type"].get_string();
    event.id = ev["id"].get_string("t" + std::to_string(turn) + "-" + kind + "-" +
                                   std::to_string(index));
    event.label = ev["label"].get_string();
    event.has_actor = read_side(ev["actor"], "Event " + event.id + " actor", event.actor);
    event.timing = timeline::timing_from_string(ev["timing"].get_string("action"),
                                                timeline::EventTiming::ACTION);
    event.related_action_id = ev["relatedActionId"].get_string();

    if (kind == "attack") {
        timeline::AttackEvent attack;
        attack.move = RequestParser::parse_move(ev["move"]);
        attack.has_target = read_side(ev["target"], "Event " + event.id + " target", attack.target);
        event.payload = attack;
    } else if (kind == "healing") {
        event.payload = parse_healing(ev, event.id);
    } else if (kind == "hp-adjustment") {
        timeline::HpAdjustmentEvent adj;
        adj.has_target = read_side(ev["target"], "Event " + event.id + " target", adj.target);
        adj.amount = ev["amount"].get_number(0.0);
        adj.is_damage = ev["isDamage"].get_bool(false);
        adj.mode = timeline::hp_mode_from_string(ev["mode"].get_string("absolute"),
                                                 timeline::HpAdjustMode::ABSOLUTE);
        adj.numerator = ev["fractionNumerator"].get_number(1.0);
        adj.denominator = ev["fractionDenominator"].get_number(0.0);
        event.payload = adj;
    } else if (kind == "stat-change") {
        event.payload = parse_stat_change(ev, event.id);
    } else if (kind == "status") {
        timeline::StatusEvent status;
        status.status = ev["status"].get_string();
        status.clears = ev["clears"].get_bool(false);
        event.payload = status;
    } else if (kind == "switch") {
        event.payload = parse_switch(ev);
    } else if (kind == "field-toggle") {
        event.payload = timeline::FieldToggleEvent{ parse_field_update(ev) };
    } else {
        throw ConfigurationError("Unknown event type \"" + kind + "\" in turn " +
                                 std::to_string(turn));
    }
    return event;
}

BattleAction parse_action(const JsonValue& a, int turn, size_t index) {
    BattleAction action;
    action.id = a["id"].get_string("t" + std::to_string(turn) + "-action-" +
                                   std::to_string(index));
    if (!read_side(a["actor"], "Action " + action.id + " actor", action.actor)) {
        throw ConfigurationError("Action " + action.id + " has no actor");
    }

    const std::string kind = a["type"].get_string("move");
    if (kind == "move") {
        timeline::MoveAction move;
        move.move = RequestParser::parse_move(a["move"]);
        move.has_target = read_side(a["target"], "Action " + action.id + " target", move.target);
        // Tera chosen on the action applies to its move
        if (a["teraMode"].is_string()) {
            move.move.has_tera_mode = true;
            move.move.tera_mode = tera_mode_from_string(a["teraMode"].as_string(), TeraMode::NONE);
        }
        if (a["teraType"].is_string()) {
            move.move.tera_type = a["teraType"].as_string();
        }
        action.payload = move;
    } else if (kind == "switch") {
        action.payload = parse_switch(a);
    } else if (kind == "pass") {
        action.payload = timeline::PassAction{};
    } else {
        throw ConfigurationError("Unknown action type \"" + kind + "\" in turn " +
                                 std::to_string(turn));
    }
    return action;
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════════
// Messages
// ═══════════════════════════════════════════════════════════════

HostMessage RequestParser::parse_message(const JsonValue& message) {
    if (!message.is_object()) {
        throw ConfigurationError("Message must be a JSON object");
    }

    HostMessage out;
    const std::string type = message["type"].get_string();
    const JsonValue& payload = message["payload"];

    if (type == "run") {
        out.type = MessageType::RUN;
        out.request = parse_request(payload);
        out.request_id = out.request.request_id;
    } else if (type == "cancel") {
        out.type = MessageType::CANCEL;
        out.request_id = payload["requestId"].get_string();
        if (out.request_id.empty()) {
            throw ConfigurationError("Cancel message without requestId");
        }
    } else {
        throw ConfigurationError("Unknown message type \"" + type + "\"");
    }
    return out;
}

worker::JobRequest RequestParser::parse_request(const JsonValue& payload) {
    if (!payload.is_object()) {
        throw ConfigurationError("Run message without a payload object");
    }

    worker::JobRequest req;
    req.request_id = payload["requestId"].get_string();
    if (req.request_id.empty()) {
        throw ConfigurationError("Run payload without requestId");
    }

    const JsonValue& pokemon = payload["pokemon"];
    if (!pokemon["player"].is_object() || !pokemon["opponent"].is_object()) {
        throw ConfigurationError("pokemon.player and pokemon.opponent are required");
    }
    req.combatants.player = parse_combatant(pokemon["player"]);
    req.combatants.opponent = parse_combatant(pokemon["opponent"]);

    req.scenario = parse_scenario(payload["scenario"]);
    req.field = parse_field(payload["field"]);

    const JsonValue& opts = payload["options"];
    req.options.batch_size = opts["batchSize"].get_int(0);
    req.options.timeout_ms = static_cast<long long>(opts["timeoutMs"].get_number(0.0));
    req.options.style = opts["battleStyle"].get_string("singles") == "doubles"
        ? BattleStyle::DOUBLES : BattleStyle::SINGLES;
    if (opts["allowRaidStellar"].is_bool()) {
        req.scenario.allow_raid_stellar = opts["allowRaidStellar"].as_bool();
    }

    const JsonValue& ev_config = payload.has("evConfig") ? payload["evConfig"]
                                                         : payload["evGridConfig"];
    if (ev_config.is_object()) {
        req.has_grid = true;
        req.grid = parse_grid(ev_config);
    }
    return req;
}

// ═══════════════════════════════════════════════════════════════
// Battle model
// ═══════════════════════════════════════════════════════════════

Combatant RequestParser::parse_combatant(const JsonValue& p) {
    Combatant c;
    c.species = p["species"].get_string();
    if (c.species.empty()) {
        throw ConfigurationError("Pokemon entry without species");
    }
    c.level = p["level"].get_int(50);
    c.nature = p["nature"].get_string("Hardy");
    c.ability = p["ability"].get_string();
    c.item = p["item"].get_string();
    c.status = p["status"].get_string();
    c.tera_mode = tera_mode_from_string(p["teraMode"].get_string("none"), TeraMode::NONE);
    c.tera_type = p["teraType"].get_string();

    read_stats(p["ivs"], c.ivs);
    read_stats(p["evs"], c.evs);

    const JsonValue& boosts = p["boosts"];
    for (const auto& key : boosts.keys()) {
        StatId stat;
        if (!stat_from_string(key, stat)) continue;
        int stage = std::max(MIN_STAGE, std::min(MAX_STAGE, boosts[key].get_int(0)));
        if (stage != 0) c.boosts[stat] = stage;
    }

    c.current_hp = p["currentHP"].get_int(-1);
    c.max_hp = p["maxHP"].get_int(0);

    for (const auto& t : p["types"].as_array()) {
        if (t.is_string()) c.type_overrides.push_back(t.as_string());
    }

    const JsonValue& base = p["overrides"]["baseStats"];
    if (base.is_object()) {
        c.has_base_stat_overrides = true;
        read_stats(base, c.base_stat_overrides);
    }
    return c;
}

FieldState RequestParser::parse_field(const JsonValue& f) {
    FieldState field;
    if (!f.is_object()) return field;

    field.weather = f["weather"].get_string();
    field.terrain = f["terrain"].get_string();
    field.trick_room = f["trickRoom"].get_bool(false);
    field.wonder_room = f["wonderRoom"].get_bool(false);
    field.magic_room = f["magicRoom"].get_bool(false);
    field.gravity = f["gravity"].get_bool(false);
    apply_side(f["attackerSide"], field.sides.player);
    apply_side(f["defenderSide"], field.sides.opponent);
    return field;
}

MoveConfig RequestParser::parse_move(const JsonValue& m) {
    MoveConfig move;
    move.name = m["name"].get_string();
    if (move.name.empty()) {
        throw ConfigurationError("Move without a name");
    }

    const JsonValue& overrides = m["overrides"];
    move.type_override = m["type"].get_string(overrides["type"].get_string());
    move.power_override = m["power"].get_int(overrides["power"].get_int(0));
    std::string category = m["category"].get_string(overrides["category"].get_string());
    if (!category.empty()) {
        move.has_category_override = true;
        move.category_override = category_from_string(category, MoveCategory::PHYSICAL);
    }

    if (m["teraMode"].is_string()) {
        move.has_tera_mode = true;
        move.tera_mode = tera_mode_from_string(m["teraMode"].as_string(), TeraMode::NONE);
    }
    move.tera_type = m["teraType"].get_string();

    move.is_crit = m["isCrit"].get_bool(false);
    move.hits = m["hits"].get_int(0);
    move.priority = m["priority"].get_int(0);
    move.drain_percent = m["drainPercent"].get_number(0.0);
    move.recoil_percent = m["recoilPercent"].get_number(0.0);
    move.stellar_first_use = m["stellarFirstUse"].get_bool(false);
    return move;
}

timeline::Scenario RequestParser::parse_scenario(const JsonValue& s) {
    if (!s.is_object() || !s["turns"].is_array()) {
        throw ConfigurationError("scenario.turns must be an array");
    }

    timeline::Scenario scenario;
    scenario.allow_raid_stellar = s["allowRaidStellar"].get_bool(false);

    const auto& turns = s["turns"].as_array();
    for (size_t i = 0; i < turns.size(); i++) {
        const JsonValue& t = turns[i];
        timeline::TimelineTurn turn;
        turn.turn = t["turn"].get_int(static_cast<int>(i) + 1);
        turn.id = t["id"].get_string("turn-" + std::to_string(turn.turn));
        turn.label = t["label"].get_string();
        turn.has_order = read_side(t["order"], "Turn " + turn.id + " order", turn.order);

        const auto& actions = t["actions"].as_array();
        for (size_t a = 0; a < actions.size(); a++) {
            turn.actions.push_back(parse_action(actions[a], turn.turn, a));
        }
        const auto& events = t["events"].as_array();
        for (size_t e = 0; e < events.size(); e++) {
            turn.events.push_back(parse_event(events[e], turn.turn, e));
        }
        scenario.turns.push_back(std::move(turn));
    }
    return scenario;
}

// ═══════════════════════════════════════════════════════════════
// Grid configuration
// ═══════════════════════════════════════════════════════════════

grid::GridConfig RequestParser::parse_grid(const JsonValue& c) {
    grid::GridConfig cfg;
    cfg.enabled = c["enabled"].get_bool(false);
    read_side(c["targetSide"], "evConfig.targetSide", cfg.target_side);

    read_range(c["hpRange"], "evConfig.hpRange", cfg.hp_range);
    read_range(c["defRange"], "evConfig.defRange", cfg.def_range);
    read_range(c["atkRange"], "evConfig.atkRange", cfg.atk_range);
    read_range(c["spaRange"], "evConfig.spaRange", cfg.spa_range);
    cfg.axis_step = c["axisStep"].get_int(8);
    cfg.offense_step = c["offenseStep"].get_int(0);

    if (c["maxCombinedEV"].is_number()) {
        cfg.has_max_combined = true;
        cfg.max_combined = c["maxCombinedEV"].as_int();
    }
    if (c["offenseMaxCombinedEV"].is_number()) {
        cfg.has_offense_max_combined = true;
        cfg.offense_max_combined = c["offenseMaxCombinedEV"].as_int();
    }

    const JsonValue& prior = c["prior"];
    if (prior.is_string()) {
        // A bare profile name ("bulky") selects that meta profile
        const std::string& name = prior.as_string();
        cfg.prior.type = grid::prior_type_from_string(name, grid::PriorType::META);
        if (cfg.prior.type == grid::PriorType::META && name != "meta") {
            cfg.prior.meta_profile = name;
        }
    } else if (prior.is_object()) {
        const std::string type = prior["type"].get_string("uniform");
        if (type != "uniform" && type != "meta" && type != "custom") {
            throw ConfigurationError("Unknown prior type \"" + type + "\"");
        }
        cfg.prior.type = grid::prior_type_from_string(type, grid::PriorType::UNIFORM);
        cfg.prior.meta_profile = prior["metaProfile"].get_string("balanced");
        for (const auto& w : prior["customWeights"].as_array()) {
            grid::CustomWeight entry;
            entry.hp_ev = w["hpEV"].get_int(0);
            entry.def_ev = w["defEV"].get_int(0);
            entry.weight = w["weight"].get_number(0.0);
            cfg.prior.custom_weights.push_back(entry);
        }
    }

    cfg.observation_event_id = c["observationEventId"].get_string();
    cfg.has_observation_percent = read_percent_pair(c["observationPercent"],
                                                    "evConfig.observationPercent",
                                                    cfg.observation_min_percent,
                                                    cfg.observation_max_percent);

    cfg.target_survival = c["targetSurvival"].get_number(0.0);
    cfg.target_ko = c["targetKO"].get_number(0.0);
    cfg.enable_survival = c["enableSurvival"].get_bool(false);
    cfg.enable_ko = c["enableKO"].get_bool(false);

    cfg.enable_opponent_bulk_range = c["enableOpponentBulkRange"].get_bool(false);
    cfg.has_opponent_damage_range = read_percent_pair(c["opponentDamageRange"],
                                                      "evConfig.opponentDamageRange",
                                                      cfg.damage_range_min_percent,
                                                      cfg.damage_range_max_percent);
    return cfg;
}

} // namespace evsim
