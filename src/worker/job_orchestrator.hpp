/**
 * JobOrchestrator — runs one job at a time over the EV grid.
 *
 * A job is driven cooperatively: start() validates and queues it,
 * resume() evaluates at most one batch of grid points and returns, run()
 * resumes until the job ends. Between batches the host may poll for
 * cancel messages; cancellation is an atomic flag on the JobHandle and
 * can also be raised from another thread or from the response sink.
 *
 * Every job ends with exactly one terminal response (complete, error or
 * cancelled), after which the orchestrator is free for the next start().
 *
 * Flow:
 *   grid disabled           -> one deterministic run
 *   defensive grid (HP/Def) -> survival, heatmap, plans, sensitivity
 *   offensive grid (Atk/SpA)-> KO chance, KO plans
 */

#ifndef EVSIM_WORKER_JOB_ORCHESTRATOR_HPP
#define EVSIM_WORKER_JOB_ORCHESTRATOR_HPP

#include "damage/damage_cache.hpp"
#include "damage/damage_calculator.hpp"
#include "data/game_data.hpp"
#include "worker/job_types.hpp"
#include "worker/summary_builder.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace evsim::worker {

/// Identity and cancel flag of the active job.
class JobHandle {
public:
    explicit JobHandle(std::string request_id) : request_id_(std::move(request_id)) {}

    const std::string& request_id() const { return request_id_; }

    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::string request_id_;
    std::atomic<bool> cancelled_{false};
};

struct OrchestratorConfig {
    int default_batch_size = DEFAULT_BATCH_SIZE;
    long long default_timeout_ms = DEFAULT_TIMEOUT_MS;
    size_t cache_capacity = damage::DEFAULT_CACHE_CAPACITY;
    bool verbose = false;
};

class JobOrchestrator {
public:
    using ResponseSink = std::function<void(const JobResponse&)>;
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    JobOrchestrator(const data::GameData& data,
                    damage::DamageCalculator& calculator,
                    ResponseSink sink,
                    const OrchestratorConfig& config = OrchestratorConfig());
    ~JobOrchestrator();

    /// Replace the steady clock used for elapsed time and the deadline.
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    /**
     * Accept a job. Emits an initializing progress response.
     * Returns false (and emits an error for request.request_id) when
     * another job is active or the request is invalid.
     */
    bool start(const JobRequest& request);

    /**
     * Evaluate up to one batch of grid points, then return.
     * Returns true while the job still has work left.
     */
    bool resume();

    /// resume() until the active job ends.
    void run();

    /**
     * Flag the active job for cancellation. No effect (returns false)
     * when no job is active or the id does not match.
     */
    bool cancel(const std::string& request_id);

    bool busy() const { return job_ != nullptr; }

    /// Handle of the active job, nullptr when idle.
    std::shared_ptr<JobHandle> active_handle() const;

    JobState last_state() const { return last_state_; }

private:
    struct Job;

    const data::GameData& data_;
    damage::DamageCalculator& calculator_;
    ResponseSink sink_;
    OrchestratorConfig config_;
    Clock clock_;

    std::unique_ptr<Job> job_;
    JobState last_state_ = JobState::IDLE;

    void prepare(Job& job);
    SidePair<Combatant> resolve_combatants(const SidePair<Combatant>& input,
                                           SidePair<StatsTable>& base_stats) const;

    /// Evaluate one point; returns false when the job was cancelled first.
    bool evaluate_point(Job& job);
    void run_deterministic(Job& job);
    void finish_grid(Job& job);
    void finish(Job& job);

    long long elapsed_ms(const Job& job) const;
    void emit_progress(const Job& job, int processed, int total, JobPhase phase);
    void emit_terminal(ResponseType type, const std::string& request_id,
                       const std::string& error = std::string());
    void fail(const std::string& request_id, const std::string& message);
    void release(JobState state);
};

} // namespace evsim::worker

#endif // EVSIM_WORKER_JOB_ORCHESTRATOR_HPP
