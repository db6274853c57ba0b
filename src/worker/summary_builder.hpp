/**
 * Summary assembly — blends per-point timeline results into one summary.
 *
 * Distributions and snapshots from every grid point are mixed with the
 * point's posterior weight. Snapshots are matched across points by event
 * id and reported in sequence order.
 */

#ifndef EVSIM_WORKER_SUMMARY_BUILDER_HPP
#define EVSIM_WORKER_SUMMARY_BUILDER_HPP

#include "grid/ev_grid.hpp"
#include "timeline/timeline_simulator.hpp"
#include "worker/job_types.hpp"
#include <vector>

namespace evsim::worker {

/// What the orchestrator keeps from one simulated grid point.
struct PointResult {
    std::vector<timeline::DistributionPoint> hp_distribution;
    std::vector<timeline::TimelineSnapshot> snapshots;
};

/// Weight-blended HP distribution, sorted by HP.
std::vector<timeline::DistributionPoint>
combine_distributions(const std::vector<grid::GridPoint>& points,
                      const std::vector<PointResult>& results);

std::vector<timeline::TimelineSnapshot>
combine_snapshots(const std::vector<grid::GridPoint>& points,
                  const std::vector<PointResult>& results);

/// Summary of a single run with the grid disabled.
JobSummary build_deterministic_summary(const timeline::SimulationResult& result,
                                       BattleSide side);

/**
 * Summary of an evaluated grid. Heatmap and sensitivity are reported for
 * defensive grids; survival plans only when survival analysis is on;
 * KO chance and plans for offense-only grids.
 */
JobSummary build_grid_summary(const std::vector<grid::GridPoint>& points,
                              const std::vector<PointResult>& results,
                              const grid::GridConfig& config,
                              int base_hp_ev, int base_def_ev,
                              bool use_damage_range);

} // namespace evsim::worker

#endif // EVSIM_WORKER_SUMMARY_BUILDER_HPP
