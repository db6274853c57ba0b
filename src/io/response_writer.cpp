#include "io/response_writer.hpp"
#include <sstream>

namespace evsim {

namespace {

void write_distribution(JsonWriter& w, const std::vector<timeline::DistributionPoint>& dist) {
    w.begin_array();
    for (const auto& dp : dist) {
        w.begin_object();
        w.kv("hp", dp.hp).kv("probability", dp.probability);
        w.end_object();
    }
    w.end_array();
}

template<typename T>
void write_side_pair(JsonWriter& w, const SidePair<T>& pair) {
    w.begin_object();
    w.kv("player", pair.player).kv("opponent", pair.opponent);
    w.end_object();
}

} // anonymous namespace

void ResponseWriter::write(std::ostream& os, const worker::JobResponse& response) {
    os << to_line(response) << '\n' << std::flush;
}

std::string ResponseWriter::to_line(const worker::JobResponse& response) {
    std::ostringstream line;
    JsonWriter w(line, 0);

    w.begin_object();
    w.kv("type", worker::response_type_to_string(response.type));
    w.key("payload").begin_object();
    w.kv("requestId", response.request_id);

    switch (response.type) {
        case worker::ResponseType::PROGRESS:
            w.key("progress").begin_object();
            w.kv("requestId", response.request_id)
             .kv("processed", response.progress.processed)
             .kv("total", response.progress.total)
             .kv("elapsedMs", response.progress.elapsed_ms)
             .kv("phase", worker::phase_to_string(response.progress.phase));
            w.end_object();
            break;
        case worker::ResponseType::COMPLETE:
            w.key("summary");
            write_summary(w, response.summary);
            break;
        case worker::ResponseType::ERROR:
            w.kv("error", response.error);
            break;
        case worker::ResponseType::CANCELLED:
            break;
    }

    w.end_object();
    w.end_object();
    return line.str();
}

void ResponseWriter::write_summary(JsonWriter& w, const worker::JobSummary& s) {
    w.begin_object();
    w.kv("survival", s.survival);
    w.key("hpDistribution");
    write_distribution(w, s.hp_distribution);

    if (s.has_heatmap) {
        w.key("heatmap").begin_array();
        for (const auto& cell : s.heatmap) {
            w.begin_object();
            w.kv("hpEV", cell.hp_ev)
             .kv("defEV", cell.def_ev)
             .kv("survival", cell.value)
             .kv("weight", cell.weight)
             .kv("metric", grid::heatmap_metric_to_string(cell.metric));
            w.end_object();
        }
        w.end_array();
    }

    if (s.has_top_plans) {
        w.key("topPlans").begin_array();
        for (const auto& plan : s.top_plans) {
            w.begin_object();
            w.kv("hpEV", plan.hp_ev)
             .kv("defEV", plan.def_ev)
             .kv("survival", plan.survival)
             .kv("investment", plan.total_ev)
             .kv("totalEV", plan.total_ev)
             .kv("meetsTarget", plan.meets_target);
            w.end_object();
        }
        w.end_array();
    }

    if (s.has_ko_chance) w.kv("koChance", s.ko_chance);

    if (s.has_ko_plans) {
        w.key("koPlans").begin_array();
        for (const auto& plan : s.ko_plans) {
            w.begin_object();
            w.kv("atkEV", plan.atk_ev)
             .kv("spaEV", plan.spa_ev)
             .kv("koChance", plan.ko_chance)
             .kv("totalEV", plan.total_ev)
             .kv("meetsTarget", plan.meets_target);
            w.end_object();
        }
        w.end_array();
    }

    if (s.has_sensitivity) {
        w.key("sensitivity").begin_object();
        w.kv("hpSensitivity", s.sensitivity.hp).kv("defSensitivity", s.sensitivity.def);
        w.end_object();
    }

    w.key("snapshots").begin_array();
    for (const auto& snap : s.snapshots) write_snapshot(w, snap);
    w.end_array();

    w.end_object();
}

void ResponseWriter::write_snapshot(JsonWriter& w, const timeline::TimelineSnapshot& snap) {
    w.begin_object();
    w.kv("turn", snap.turn)
     .kv("eventId", snap.event_id)
     .kv("sequence", snap.sequence)
     .kv("description", snap.description);
    if (snap.has_actor) w.kv("actor", side_to_string(snap.actor));

    w.key("hp");
    write_side_pair(w, snap.hp);
    w.key("maxHP");
    write_side_pair(w, snap.max_hp);
    w.kv("probability", snap.probability);

    w.key("hpDistribution");
    write_distribution(w, snap.hp_distribution);
    w.key("opponentHpDistribution");
    write_distribution(w, snap.opponent_hp_distribution);

    if (!snap.damage_rolls.empty()) {
        w.key("damageRolls").begin_array();
        for (int roll : snap.damage_rolls) w.value(roll);
        w.end_array();
    }
    if (snap.has_delta) {
        w.key("deltaHP");
        write_side_pair(w, snap.delta_hp);
        w.key("maxHPBefore");
        write_side_pair(w, snap.max_hp_before);
    }
    w.end_object();
}

} // namespace evsim
