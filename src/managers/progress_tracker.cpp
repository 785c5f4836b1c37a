#include "progress_tracker.hpp"
#include "bridge_log.hpp"
#include <fmt/format.h>
#include <cctype>

const char* status_name(ProgressStatus status) {
    switch (status) {
        case ProgressStatus::Idle:      return "idle";
        case ProgressStatus::Active:    return "active";
        case ProgressStatus::Completed: return "completed";
        case ProgressStatus::Failed:    return "failed";
    }
    return "unknown";
}

const char* step_name(int step) {
    switch (step) {
        case STEP_PLAN:    return "Plan";
        case STEP_DEPLOY:  return "Deploy";
        case STEP_VERIFY:  return "Verify";
        case STEP_PREVIEW: return "Preview";
        default:           return "Idle";
    }
}

std::string describe(const ProgressState& state) {
    if (state.step == STEP_IDLE) return "0:idle";
    std::string name = step_name(state.step);
    for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return fmt::format("{}:{}-{}", state.step, name, status_name(state.status));
}

void ProgressTracker::publish(const ProgressState& next) {
    dipole_log(fmt::format("progress: {} -> {} (invocation {})",
                           describe(state_), describe(next), invocation_));
    state_ = next;
    if (listener_) listener_(state_);
}

bool ProgressTracker::advance(const ProgressState& from, const ProgressState& to) {
    if (state_ != from) {
        dipole_log(fmt::format("progress: rejected {} -> {} (expected {})",
                               describe(state_), describe(to), describe(from)));
        return false;
    }
    publish(to);
    return true;
}

void ProgressTracker::begin_plan() {
    invocation_++;
    publish({STEP_PLAN, ProgressStatus::Active});
}

bool ProgressTracker::complete_plan() {
    return advance({STEP_PLAN, ProgressStatus::Active}, {STEP_PLAN, ProgressStatus::Completed});
}

void ProgressTracker::begin_deploy() {
    invocation_++;
    publish({STEP_DEPLOY, ProgressStatus::Active});
}

bool ProgressTracker::begin_verify() {
    return advance({STEP_DEPLOY, ProgressStatus::Active}, {STEP_VERIFY, ProgressStatus::Active});
}

bool ProgressTracker::complete_verify() {
    return advance({STEP_VERIFY, ProgressStatus::Active}, {STEP_VERIFY, ProgressStatus::Completed});
}

bool ProgressTracker::complete_preview() {
    return advance({STEP_VERIFY, ProgressStatus::Active}, {STEP_PREVIEW, ProgressStatus::Completed});
}

bool ProgressTracker::fail() {
    if (state_.status != ProgressStatus::Active) {
        dipole_log(fmt::format("progress: rejected fail from {}", describe(state_)));
        return false;
    }
    publish({state_.step, ProgressStatus::Failed});
    return true;
}
