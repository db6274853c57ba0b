/**
 * Job request / response types exchanged with the orchestrator.
 */

#ifndef EVSIM_WORKER_JOB_TYPES_HPP
#define EVSIM_WORKER_JOB_TYPES_HPP

#include "core/battle_types.hpp"
#include "grid/ev_grid.hpp"
#include "timeline/branch.hpp"
#include "timeline/scenario.hpp"
#include "timeline/snapshot.hpp"
#include <string>
#include <vector>

namespace evsim::worker {

constexpr int DEFAULT_BATCH_SIZE = 100;
constexpr long long DEFAULT_TIMEOUT_MS = 30000;

struct ExecutionOptions {
    int batch_size = 0;                 // 0 = orchestrator default
    long long timeout_ms = 0;           // 0 = orchestrator default
    BattleStyle style = BattleStyle::SINGLES;
};

struct JobRequest {
    std::string request_id;
    timeline::Scenario scenario;
    SidePair<Combatant> combatants;
    FieldState field;
    ExecutionOptions options;
    bool has_grid = false;              // false = deterministic run
    grid::GridConfig grid;
};

enum class JobPhase {
    INITIALIZING,
    PROCESSING,
    EVALUATING,
    FINALIZING
};

std::string phase_to_string(JobPhase phase);

struct ProgressInfo {
    int processed = 0;
    int total = 0;
    long long elapsed_ms = 0;
    JobPhase phase = JobPhase::INITIALIZING;
};

struct JobSummary {
    double survival = 0.0;
    std::vector<timeline::DistributionPoint> hp_distribution;

    bool has_heatmap = false;
    std::vector<grid::HeatmapCell> heatmap;
    bool has_top_plans = false;
    std::vector<grid::SurvivalPlan> top_plans;
    bool has_ko_chance = false;
    double ko_chance = 0.0;
    bool has_ko_plans = false;
    std::vector<grid::OffensePlan> ko_plans;
    bool has_sensitivity = false;
    grid::Sensitivity sensitivity;

    std::vector<timeline::TimelineSnapshot> snapshots;
};

enum class ResponseType {
    PROGRESS,
    COMPLETE,
    ERROR,
    CANCELLED
};

std::string response_type_to_string(ResponseType type);

/// One message to the host. Only the fields of its type are meaningful.
struct JobResponse {
    ResponseType type = ResponseType::PROGRESS;
    std::string request_id;
    ProgressInfo progress;
    JobSummary summary;
    std::string error;

    bool is_terminal() const { return type != ResponseType::PROGRESS; }
};

/// Outcome of the most recent job, for hosts and tests.
enum class JobState {
    IDLE,
    RUNNING,
    COMPLETE,
    CANCELLED,
    ERROR
};

std::string state_to_string(JobState state);

} // namespace evsim::worker

#endif // EVSIM_WORKER_JOB_TYPES_HPP
