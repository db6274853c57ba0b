#include "worker/job_types.hpp"

namespace evsim::worker {

std::string phase_to_string(JobPhase phase) {
    switch (phase) {
        case JobPhase::INITIALIZING: return "initializing";
        case JobPhase::PROCESSING:   return "processing";
        case JobPhase::EVALUATING:   return "evaluating";
        case JobPhase::FINALIZING:   return "finalizing";
    }
    return "processing";
}

std::string response_type_to_string(ResponseType type) {
    switch (type) {
        case ResponseType::PROGRESS:  return "progress";
        case ResponseType::COMPLETE:  return "complete";
        case ResponseType::ERROR:     return "error";
        case ResponseType::CANCELLED: return "cancelled";
    }
    return "error";
}

std::string state_to_string(JobState state) {
    switch (state) {
        case JobState::IDLE:      return "idle";
        case JobState::RUNNING:   return "running";
        case JobState::COMPLETE:  return "complete";
        case JobState::CANCELLED: return "cancelled";
        case JobState::ERROR:     return "error";
    }
    return "idle";
}

} // namespace evsim::worker
