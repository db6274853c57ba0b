#include "worker/job_orchestrator.hpp"
#include "core/errors.hpp"
#include "core/stat_formula.hpp"
#include "timeline/timeline_simulator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

namespace evsim::worker {

struct JobOrchestrator::Job {
    enum class Stage {
        DETERMINISTIC,
        DEFENSE,
        OFFENSE,
        DONE
    };

    struct GridEvaluation {
        std::vector<grid::GridPoint> points;
        std::vector<PointResult> results;
        std::vector<double> observations;     // defensive grid only
        size_t next = 0;
        bool announced = false;
    };

    Job(const JobRequest& req, size_t cache_capacity)
        : handle(std::make_shared<JobHandle>(req.request_id)),
          request(req),
          cache(cache_capacity) {}

    std::shared_ptr<JobHandle> handle;
    JobRequest request;

    SidePair<Combatant> base;
    SidePair<StatsTable> base_stats;
    BattleSide target = BattleSide::PLAYER;

    damage::DamageCache cache;
    timeline::SimulationOptions sim_options;
    bool observing = false;

    Stage stage = Stage::DETERMINISTIC;
    bool need_defense = false;
    bool need_offense = false;
    bool use_damage_range = false;
    grid::GridConfig defense_config;
    GridEvaluation defense;
    GridEvaluation offense;

    int batch_size = DEFAULT_BATCH_SIZE;
    std::chrono::steady_clock::time_point started;
    std::chrono::steady_clock::time_point deadline;

    GridEvaluation& current() { return stage == Stage::OFFENSE ? offense : defense; }
};

JobOrchestrator::JobOrchestrator(const data::GameData& data,
                                 damage::DamageCalculator& calculator,
                                 ResponseSink sink,
                                 const OrchestratorConfig& config)
    : data_(data),
      calculator_(calculator),
      sink_(std::move(sink)),
      config_(config),
      clock_([] { return std::chrono::steady_clock::now(); }) {}

JobOrchestrator::~JobOrchestrator() = default;

// ═══════════════════════════════════════════════════════════════
// Host interface
// ═══════════════════════════════════════════════════════════════

bool JobOrchestrator::start(const JobRequest& request) {
    if (job_) {
        if (config_.verbose) {
            std::cerr << "[Orchestrator] Rejecting " << request.request_id
                      << ": job " << job_->handle->request_id() << " is active\n";
        }
        emit_terminal(ResponseType::ERROR, request.request_id,
                      "Another simulation is already running (" +
                      job_->handle->request_id() + ")");
        return false;
    }

    job_ = std::make_unique<Job>(request, config_.cache_capacity);
    job_->started = clock_();
    last_state_ = JobState::RUNNING;

    emit_progress(*job_, 0, 0, JobPhase::INITIALIZING);

    try {
        prepare(*job_);
    } catch (const std::exception& e) {
        fail(request.request_id, e.what());
        return false;
    }
    return true;
}

bool JobOrchestrator::resume() {
    if (!job_) return false;

    Job& job = *job_;
    const std::string request_id = job.handle->request_id();

    try {
        if (job.stage == Job::Stage::DETERMINISTIC) {
            if (job.handle->cancelled()) {
                emit_terminal(ResponseType::CANCELLED, request_id);
                release(JobState::CANCELLED);
                return false;
            }
            run_deterministic(job);
            return false;
        }

        Job::GridEvaluation& eval = job.current();
        const int total = static_cast<int>(eval.points.size());
        if (!eval.announced) {
            eval.announced = true;
            emit_progress(job, 0, total, JobPhase::PROCESSING);
        }

        while (eval.next < eval.points.size()) {
            if (!evaluate_point(job)) return false;

            const int processed = static_cast<int>(eval.next);
            const bool batch_end = processed % job.batch_size == 0 || processed == total;
            if (batch_end) {
                emit_progress(job, processed, total,
                              processed == total ? JobPhase::FINALIZING : JobPhase::EVALUATING);
            }

            if (clock_() > job.deadline) {
                long long seconds = std::llround(elapsed_ms(job) / 1000.0);
                throw TimeoutError("Simulation timeout after " + std::to_string(seconds) +
                                   "s (processed " + std::to_string(processed) + "/" +
                                   std::to_string(total) + " points)",
                                   processed, total);
            }
            if (batch_end) break;
        }

        if (eval.next >= eval.points.size()) {
            finish_grid(job);
            if (job.stage == Job::Stage::DONE) {
                finish(job);
                return false;
            }
        }
        return true;
    } catch (const std::exception& e) {
        fail(request_id, e.what());
        return false;
    }
}

void JobOrchestrator::run() {
    while (resume()) {
    }
}

bool JobOrchestrator::cancel(const std::string& request_id) {
    if (!job_ || job_->handle->request_id() != request_id) return false;
    if (config_.verbose) {
        std::cerr << "[Orchestrator] Cancel requested for " << request_id << "\n";
    }
    job_->handle->cancel();
    return true;
}

std::shared_ptr<JobHandle> JobOrchestrator::active_handle() const {
    return job_ ? job_->handle : nullptr;
}

// ═══════════════════════════════════════════════════════════════
// Job setup
// ═══════════════════════════════════════════════════════════════

void JobOrchestrator::prepare(Job& job) {
    const JobRequest& req = job.request;

    job.batch_size = std::max(1, req.options.batch_size > 0 ? req.options.batch_size
                                                            : config_.default_batch_size);
    long long timeout_ms = req.options.timeout_ms > 0 ? req.options.timeout_ms
                                                      : config_.default_timeout_ms;
    job.deadline = job.started + std::chrono::milliseconds(timeout_ms);

    job.base = resolve_combatants(req.combatants, job.base_stats);
    job.target = req.has_grid ? req.grid.target_side : BattleSide::PLAYER;

    timeline::SimulationOptions& opts = job.sim_options;
    opts.style = req.options.style;
    opts.allow_raid_stellar = req.scenario.allow_raid_stellar;
    if (req.has_grid && !req.grid.observation_event_id.empty()) {
        opts.observation_event_id = req.grid.observation_event_id;
        if (req.grid.has_observation_percent) {
            opts.has_observation_range = true;
            opts.observation_min = std::max(0.0, req.grid.observation_min_percent / 100.0);
            opts.observation_max = std::min(1.0, req.grid.observation_max_percent / 100.0);
        }
    }
    job.observing = !opts.observation_event_id.empty() && opts.has_observation_range;

    if (!req.has_grid || !req.grid.enabled) {
        job.stage = Job::Stage::DETERMINISTIC;
        if (config_.verbose) {
            std::cerr << "[Orchestrator] " << req.request_id << ": deterministic run, "
                      << req.scenario.turns.size() << " turns\n";
        }
        return;
    }

    const grid::GridConfig& cfg = req.grid;
    grid::validate_config(cfg);
    job.need_defense = !cfg.enable_ko || cfg.enable_survival;
    job.need_offense = cfg.enable_ko;
    job.use_damage_range = cfg.wants_damage_range();

    if (job.need_defense) {
        const Combatant& target = job.base[job.target];
        job.defense_config = grid::focus_bulk_range(cfg, target.evs.hp, target.evs.def);
        job.defense.points = grid::build_defense_grid(job.defense_config);
    }
    if (job.need_offense) {
        job.offense.points = grid::build_offense_grid(cfg);
    }
    job.stage = job.need_defense ? Job::Stage::DEFENSE : Job::Stage::OFFENSE;

    if (config_.verbose) {
        std::cerr << "[Orchestrator] " << req.request_id << ": target "
                  << side_to_string(job.target)
                  << ", defensive points " << job.defense.points.size()
                  << ", offensive points " << job.offense.points.size()
                  << ", prior " << grid::prior_type_to_string(cfg.prior.type)
                  << ", batch " << job.batch_size
                  << ", timeout " << timeout_ms << "ms\n";
    }
}

SidePair<Combatant> JobOrchestrator::resolve_combatants(const SidePair<Combatant>& input,
                                                        SidePair<StatsTable>& base_stats) const {
    SidePair<Combatant> out;
    for (BattleSide side : ALL_SIDES) {
        Combatant c = input[side];
        if (c.species.empty()) {
            throw ConfigurationError("Missing species for " + side_to_string(side));
        }
        const data::SpeciesData* species = data_.find_species(c.species);
        if (!species) {
            throw ConfigurationError("Unknown species: " + c.species);
        }

        base_stats[side] = c.has_base_stat_overrides ? c.base_stat_overrides
                                                     : species->base_stats;
        if (c.max_hp <= 0) {
            c.max_hp = calc_stat(StatId::HP, base_stats[side].hp, c.ivs.hp, c.evs.hp,
                                 c.level, c.nature);
        }
        if (c.current_hp < 0) {
            c.current_hp = c.max_hp;
        }
        c.current_hp = std::min(c.current_hp, c.max_hp);
        out[side] = std::move(c);
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════
// Evaluation
// ═══════════════════════════════════════════════════════════════

bool JobOrchestrator::evaluate_point(Job& job) {
    if (job.handle->cancelled()) {
        if (config_.verbose) {
            std::cerr << "[Orchestrator] " << job.handle->request_id() << " cancelled\n";
        }
        emit_terminal(ResponseType::CANCELLED, job.handle->request_id());
        release(JobState::CANCELLED);
        return false;
    }

    Job::GridEvaluation& eval = job.current();
    grid::GridPoint& point = eval.points[eval.next];

    SidePair<Combatant> combatants = job.base;
    Combatant& invested = combatants[job.target];
    if (point.kind == grid::PointKind::OFFENSE) {
        invested.evs.atk = point.atk_ev;
        invested.evs.spa = point.spa_ev;
    } else {
        invested.evs.hp = point.hp_ev;
        invested.evs.def = point.def_ev;
        invested.max_hp = calc_stat(StatId::HP, job.base_stats[job.target].hp,
                                    invested.ivs.hp, point.hp_ev,
                                    invested.level, invested.nature);
        invested.current_hp = invested.max_hp;
    }

    timeline::TimelineSimulator simulator(job.cache, calculator_, &data_);
    timeline::SimulationResult result = simulator.simulate(job.request.scenario, combatants,
                                                           job.request.field, job.sim_options);

    point.has_survival = true;
    point.survival = result.survival[job.target];
    if (point.kind == grid::PointKind::OFFENSE) {
        point.has_ko_chance = true;
        point.ko_chance = 1.0 - result.survival[opposite(job.target)];
    }
    if (job.use_damage_range) {
        double likelihood = 0.0;
        if (grid::damage_range_likelihood(result.snapshots, job.request.grid, likelihood)) {
            point.has_damage_range = true;
            point.damage_range_likelihood = likelihood;
        }
    }
    if (point.kind == grid::PointKind::DEFENSE) {
        eval.observations.push_back(result.observation_likelihood);
    }

    PointResult kept;
    kept.hp_distribution = std::move(result.final_distribution[job.target]);
    kept.snapshots = std::move(result.snapshots);
    eval.results.push_back(std::move(kept));

    eval.next++;
    return true;
}

void JobOrchestrator::run_deterministic(Job& job) {
    timeline::TimelineSimulator simulator(job.cache, calculator_, &data_);
    timeline::SimulationResult result = simulator.simulate(job.request.scenario, job.base,
                                                           job.request.field, job.sim_options);

    JobResponse response;
    response.type = ResponseType::COMPLETE;
    response.request_id = job.handle->request_id();
    response.summary = build_deterministic_summary(result, job.target);

    if (config_.verbose) {
        std::cerr << "[Orchestrator] " << response.request_id << " complete: survival "
                  << response.summary.survival << ", peak branches " << result.peak_branches
                  << "\n";
    }
    if (sink_) sink_(response);
    release(JobState::COMPLETE);
}

void JobOrchestrator::finish_grid(Job& job) {
    if (job.stage == Job::Stage::DEFENSE) {
        grid::apply_observation_likelihoods(job.defense.points,
                                            job.observing ? &job.defense.observations : nullptr);
        job.stage = job.need_offense ? Job::Stage::OFFENSE : Job::Stage::DONE;
    } else {
        job.stage = Job::Stage::DONE;
    }
}

void JobOrchestrator::finish(Job& job) {
    const grid::GridConfig& cfg = job.request.grid;
    const Combatant& target = job.base[job.target];

    JobResponse response;
    response.type = ResponseType::COMPLETE;
    response.request_id = job.handle->request_id();

    if (job.need_defense) {
        response.summary = build_grid_summary(job.defense.points, job.defense.results,
                                              job.defense_config, target.evs.hp, target.evs.def,
                                              job.use_damage_range);
        if (job.need_offense) {
            response.summary.has_ko_chance = true;
            response.summary.ko_chance = grid::aggregate_ko_chance(job.offense.points);
            response.summary.has_ko_plans = true;
            response.summary.ko_plans = grid::rank_offense_plans(job.offense.points, cfg.target_ko);
        }
    } else {
        response.summary = build_grid_summary(job.offense.points, job.offense.results, cfg,
                                              target.evs.hp, target.evs.def,
                                              job.use_damage_range);
    }

    if (config_.verbose) {
        std::cerr << "[Orchestrator] " << response.request_id << " complete in "
                  << elapsed_ms(job) << "ms: survival " << response.summary.survival
                  << ", cache " << job.cache.hits() << " hits / "
                  << job.cache.misses() << " misses\n";
    }
    if (sink_) sink_(response);
    release(JobState::COMPLETE);
}

// ═══════════════════════════════════════════════════════════════
// Responses
// ═══════════════════════════════════════════════════════════════

long long JobOrchestrator::elapsed_ms(const Job& job) const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - job.started).count();
}

void JobOrchestrator::emit_progress(const Job& job, int processed, int total, JobPhase phase) {
    JobResponse response;
    response.type = ResponseType::PROGRESS;
    response.request_id = job.handle->request_id();
    response.progress.processed = processed;
    response.progress.total = total;
    response.progress.elapsed_ms = elapsed_ms(job);
    response.progress.phase = phase;

    if (config_.verbose && phase != JobPhase::INITIALIZING) {
        std::cerr << "[Orchestrator] " << response.request_id << " "
                  << phase_to_string(phase) << " " << processed << "/" << total << "\n";
    }
    if (sink_) sink_(response);
}

void JobOrchestrator::emit_terminal(ResponseType type, const std::string& request_id,
                                    const std::string& error) {
    JobResponse response;
    response.type = type;
    response.request_id = request_id;
    response.error = error;
    if (sink_) sink_(response);
}

void JobOrchestrator::fail(const std::string& request_id, const std::string& message) {
    if (config_.verbose) {
        std::cerr << "[Orchestrator] " << request_id << " failed: " << message << "\n";
    }
    emit_terminal(ResponseType::ERROR, request_id, message);
    release(JobState::ERROR);
}

void JobOrchestrator::release(JobState state) {
    job_.reset();
    last_state_ = state;
}

} // namespace evsim::worker
