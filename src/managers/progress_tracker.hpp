#pragma once

#include <functional>
#include <string>

enum class ProgressStatus { Idle, Active, Completed, Failed };

// Phase steps: 0 idle, 1 plan, 2 deploy, 3 verify, 4 preview
constexpr int STEP_IDLE    = 0;
constexpr int STEP_PLAN    = 1;
constexpr int STEP_DEPLOY  = 2;
constexpr int STEP_VERIFY  = 3;
constexpr int STEP_PREVIEW = 4;

struct ProgressState {
    int step = STEP_IDLE;
    ProgressStatus status = ProgressStatus::Idle;

    bool operator==(const ProgressState& o) const { return step == o.step && status == o.status; }
    bool operator!=(const ProgressState& o) const { return !(*this == o); }
};

const char* status_name(ProgressStatus status);
const char* step_name(int step);      // "Plan", "Deploy", "Verify", "Preview"
std::string describe(const ProgressState& state);   // e.g. "2:deploy-active"

// Deployment phase tracker, for display only: nothing branches on it.
//
// begin_plan() / begin_deploy() open a new invocation and overwrite the
// state directly. Every other transition must start from the matching
// active state; anything else is rejected (returns false), so within one
// invocation the step never decreases and idle never jumps to completed.
class ProgressTracker {
public:
    using Listener = std::function<void(const ProgressState&)>;

    const ProgressState& state() const { return state_; }

    // Number of invocations opened so far
    int invocation() const { return invocation_; }

    void begin_plan();          // -> 1 active
    bool complete_plan();       // 1 active -> 1 completed
    void begin_deploy();        // -> 2 active
    bool begin_verify();        // 2 active -> 3 active
    bool complete_verify();     // 3 active -> 3 completed (no URL)
    bool complete_preview();    // 3 active -> 4 completed (URL available)
    bool fail();                // n active -> n failed

    // Called with every accepted state
    void set_listener(Listener listener) { listener_ = std::move(listener); }

private:
    bool advance(const ProgressState& from, const ProgressState& to);
    void publish(const ProgressState& next);

    ProgressState state_;
    int invocation_ = 0;
    Listener listener_;
};
