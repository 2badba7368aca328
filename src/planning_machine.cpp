#include "planning_machine.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <iostream>

namespace arena {

PlanningState PlanningMachine::initial_state(const std::string& input,
                                             const std::string& memory_context,
                                             int max_steps, int max_replans) {
    PlanningState s;
    s.input = input;
    s.memory_context = memory_context;
    s.max_steps = max_steps < 0 ? 0 : max_steps;
    s.max_replans = max_replans < 0 ? 0 : max_replans;
    s.phase = phase::kUnderstandGoal;
    s.append(Role::user, input);
    return s;
}

void PlanningMachine::run(PlanningState& state) {
    while (!state.finished()) step(state);
}

void PlanningMachine::step(PlanningState& state) {
    if (state.finished()) return;
    std::string current = state.phase;
    state.trace.push_back(current);
    ctx_.log_step("planning", current, "step " + std::to_string(state.current_step_index));

    try {
        if (current == phase::kUnderstandGoal)    understand_goal(state);
        else if (current == phase::kCreatePlan)   create_plan(state);
        else if (current == phase::kExecuteStep)  execute_step(state);
        else if (current == phase::kEvaluate)     evaluate(state);
        else if (current == phase::kReplan)       replan(state);
        else {
            state.trace.pop_back();
            fail(state, "unknown step: " + current);
        }
    } catch (const std::exception& e) {
        fail(state, current + " failed: " + e.what());
    }
}

std::string PlanningMachine::summarize(const PlanningState& state) {
    std::string out = "Goal: " + state.goal + "\n";
    for (auto& [idx, rec] : state.completed_steps) {
        out += std::string(rec.success ? "[ok] " : "[failed] ") +
               std::to_string(idx + 1) + ". " + rec.description + ": " + rec.result + "\n";
    }
    if (state.truncated) {
        out += "[step limit reached after " + std::to_string(state.completed_steps.size()) + " steps]\n";
    }
    return out;
}

std::string PlanningMachine::progress_text(const PlanningState& state) const {
    std::string text = "Goal: " + state.goal + "\nPlan:\n";
    for (size_t i = 0; i < state.plan.size(); i++) {
        text += std::to_string(i + 1) + ". " + state.plan[i];
        auto it = state.completed_steps.find(i);
        if (it != state.completed_steps.end()) {
            text += it->second.success ? " [done: " : " [failed: ";
            text += it->second.result + "]";
        }
        text += "\n";
    }
    return text;
}

// ── Steps ──────────────────────────────────────────────────────────────

void PlanningMachine::understand_goal(PlanningState& state) {
    state.goal = trim(state.input);
    state.phase = phase::kCreatePlan;
}

void PlanningMachine::create_plan(PlanningState& state) {
    std::string prompt;
    if (!state.memory_context.empty()) {
        prompt += "Context from earlier interactions:\n" + state.memory_context + "\n\n";
    }
    prompt += "Break the goal below into a short numbered list of concrete steps. "
              "Reply with the list only.\n\nGoal: " + state.goal;

    std::vector<std::string> plan;
    try {
        std::string text = ctx_.generate(prompt, state.messages);
        state.append(Role::agent, text, {{"step", phase::kCreatePlan}});
        plan = parse_plan(text);
    } catch (const std::exception& e) {
        std::string error = std::string("plan generation failed: ") + e.what();
        std::cerr << "[planning] " << error << "\n";
        state.errors.push_back(error);
    }
    // A goal without a usable plan is executed as a single step
    if (plan.empty()) plan.push_back(state.goal);

    state.plan = std::move(plan);
    state.current_step_index = 0;
    state.plan_valid = true;
    state.phase = phase::kExecuteStep;
}

void PlanningMachine::execute_step(PlanningState& state) {
    if (static_cast<int>(state.completed_steps.size()) >= state.max_steps) {
        state.truncated = true;
        terminate(state);
        return;
    }

    size_t i = state.current_step_index;
    StepRecord rec;
    rec.index = i;
    rec.description = state.plan.at(i);

    std::string prompt = progress_text(state) +
        "\nCarry out step " + std::to_string(i + 1) + ": " + rec.description + "\n";
    std::string tools = ctx_.tools ? ctx_.tools->help_text() : "";
    if (!tools.empty()) {
        prompt += "\nAvailable tools:\n" + tools +
                  "\nTo use a tool reply with\nAction: the tool name\n"
                  "Action Input: the tool arguments as a JSON object\n";
    }
    prompt += "Otherwise reply with\nFinal Answer: the result of the step\n"
              "If the step cannot be done, include " + std::string(kPlanBlocked) + " and the reason.\n";

    try {
        std::string text = ctx_.generate(prompt, state.messages);
        state.append(Role::agent, text, {{"step", phase::kExecuteStep}, {"index", i}});
        ParsedOutput parsed = parse_agent_output(text);

        if (parsed.action) {
            ActionOutcome outcome = invoke_action(ctx_, *parsed.action);
            if (outcome.invoked) state.tools_used.push_back(outcome.action.name);
            state.append(Role::tool, outcome.text,
                         {{"tool", outcome.action.name},
                          {"status", action_status_name(outcome.status)}});
            rec.success = outcome.ok();
            rec.result = outcome.text;
        } else {
            rec.success = true;
            rec.result = parsed.final_answer ? *parsed.final_answer : trim(text);
        }
    } catch (const std::exception& e) {
        rec.success = false;
        rec.result = std::string("Error: ") + e.what();
    }

    if (!rec.success) {
        std::cerr << "[planning] step " << (i + 1) << " failed: " << rec.result << "\n";
    }
    // Executed steps are never rewritten
    state.completed_steps.emplace(i, std::move(rec));
    state.phase = phase::kEvaluate;
}

void PlanningMachine::evaluate(PlanningState& state) {
    size_t i = state.current_step_index;
    auto it = state.completed_steps.find(i);
    if (it == state.completed_steps.end()) {
        fail(state, "no result for step " + std::to_string(i + 1));
        return;
    }

    const StepRecord& rec = it->second;
    bool blocked = !rec.success || rec.result.find(kPlanBlocked) != std::string::npos;
    state.plan_valid = !blocked;

    if (blocked && state.replan_count < state.max_replans) {
        state.phase = phase::kReplan;
        return;
    }
    advance(state);
}

// Keeps plan[0..i], replaces everything after it.
void PlanningMachine::replan(PlanningState& state) {
    size_t i = state.current_step_index;
    state.replan_count++;

    std::string prompt = progress_text(state) +
        "\nStep " + std::to_string(i + 1) + " did not succeed. Write a numbered list of the "
        "steps that should follow it to still reach the goal. Do not repeat finished steps.\n";

    std::vector<std::string> next;
    bool generated = false;
    try {
        std::string text = ctx_.generate(prompt, state.messages);
        state.append(Role::agent, text, {{"step", phase::kReplan}, {"replan", state.replan_count}});
        next = parse_plan(text);
        generated = true;
    } catch (const std::exception& e) {
        std::string error = std::string("replan failed: ") + e.what();
        std::cerr << "[planning] " << error << "\n";
        state.errors.push_back(error);
    }
    if (!generated) {
        next.assign(state.plan.begin() + static_cast<std::ptrdiff_t>(i + 1), state.plan.end());
    }

    state.plan.resize(i + 1);
    state.plan.insert(state.plan.end(), next.begin(), next.end());
    state.plan_valid = true;
    advance(state);
}

void PlanningMachine::advance(PlanningState& state) {
    if (state.current_step_index + 1 < state.plan.size()) {
        state.current_step_index++;
        state.phase = phase::kExecuteStep;
    } else {
        state.current_step_index = state.plan.size();
        terminate(state);
    }
}

void PlanningMachine::terminate(PlanningState& state) {
    state.output = summarize(state);
    state.phase = phase::kTerminate;
}

void PlanningMachine::fail(PlanningState& state, const std::string& error) {
    std::cerr << "[planning] " << error << "\n";
    state.errors.push_back(error);
    terminate(state);
}

} // namespace arena
