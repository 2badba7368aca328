#pragma once
#include "runtime.hpp"
#include "state.hpp"
#include <string>

namespace arena {

// UNDERSTAND_GOAL -> CREATE_PLAN -> EXECUTE_STEP -> EVALUATE
//                 -> (EXECUTE_STEP | REPLAN | TERMINATE)
class PlanningMachine {
public:
    explicit PlanningMachine(const RunContext& ctx) : ctx_(ctx) {}

    static PlanningState initial_state(const std::string& input,
                                       const std::string& memory_context,
                                       int max_steps, int max_replans);

    // Runs the step named by state.phase. Never throws.
    void step(PlanningState& state);
    void run(PlanningState& state);

    // "Goal: ..." followed by one line per executed step.
    static std::string summarize(const PlanningState& state);

private:
    const RunContext& ctx_;

    void understand_goal(PlanningState& state);
    void create_plan(PlanningState& state);
    void execute_step(PlanningState& state);
    void evaluate(PlanningState& state);
    void replan(PlanningState& state);
    void advance(PlanningState& state);
    void terminate(PlanningState& state);
    void fail(PlanningState& state, const std::string& error);

    std::string progress_text(const PlanningState& state) const;
};

} // namespace arena
