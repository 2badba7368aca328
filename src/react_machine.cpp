#include "react_machine.hpp"
#include "errors.hpp"
#include <iostream>

namespace arena {

ReActState ReactMachine::initial_state(const std::string& input,
                                       const std::string& memory_context,
                                       int max_steps) {
    ReActState s;
    s.input = input;
    s.memory_context = memory_context;
    s.max_steps = max_steps < 0 ? 0 : max_steps;
    s.phase = phase::kThink;
    s.append(Role::user, input);
    return s;
}

void ReactMachine::run(ReActState& state) {
    while (!state.finished()) step(state);
}

void ReactMachine::step(ReActState& state) {
    if (state.finished()) return;
    std::string current = state.phase;
    state.trace.push_back(current);
    ctx_.log_step("react", current, "step " + std::to_string(state.step_count));

    try {
        if (current == phase::kThink)         think(state);
        else if (current == phase::kAct)      act(state);
        else if (current == phase::kObserve)  observe(state);
        else {
            state.trace.pop_back();
            fail(state, "unknown step: " + current);
        }
    } catch (const std::exception& e) {
        fail(state, current + " failed: " + e.what());
    }
}

std::string ReactMachine::build_prompt(const ReActState& state) const {
    std::string prompt = "Answer the question, using tools when they help.\n\n";

    std::string tools = ctx_.tools ? ctx_.tools->help_text() : "";
    if (!tools.empty()) prompt += "Available tools:\n" + tools + "\n";

    prompt +=
        "Use this format:\n"
        "Thought: your reasoning\n"
        "Action: the tool name\n"
        "Action Input: the tool arguments as a JSON object\n"
        "or, once you know the answer:\n"
        "Thought: your reasoning\n"
        "Final Answer: the answer\n\n";

    if (!state.memory_context.empty()) {
        prompt += "Context from earlier interactions:\n" + state.memory_context + "\n\n";
    }
    prompt += "Question: " + state.input + "\n";

    // Scratchpad: everything after the question
    for (size_t i = 1; i < state.messages.size(); i++) {
        auto& m = state.messages[i];
        if (m.role == Role::tool) prompt += "Observation: " + m.content + "\n";
        else if (m.role == Role::agent) prompt += m.content + "\n";
    }
    return prompt;
}

// ── Steps ──────────────────────────────────────────────────────────────

void ReactMachine::think(ReActState& state) {
    state.action.reset();
    state.action_result.reset();
    state.action_status.clear();

    if (state.step_count >= state.max_steps) {
        truncate(state);
        return;
    }

    std::string text;
    try {
        text = ctx_.generate(build_prompt(state), state.messages);
    } catch (const std::exception& e) {
        std::string error = std::string("generation failed: ") + e.what();
        std::cerr << "[react] " << error << "\n";
        state.errors.push_back(error);
        state.output = state.observation ? *state.observation : "[error] " + error;
        state.phase = phase::kTerminate;
        return;
    }

    ParsedOutput parsed = parse_agent_output(text);
    state.thought = parsed.thought;
    state.append(Role::agent, text, {{"step", phase::kThink}});

    if (parsed.action) {
        state.action = parsed.action;
        state.finish_after_observe = parsed.final_answer.has_value();
        state.phase = phase::kAct;
        return;
    }

    state.final_answer = parsed.final_answer ? *parsed.final_answer : parsed.thought;
    state.output = *state.final_answer;
    state.phase = phase::kTerminate;
}

void ReactMachine::act(ReActState& state) {
    if (!state.action) {
        state.errors.push_back("ACT without a proposed action");
        state.phase = phase::kThink;
        return;
    }

    ActionOutcome outcome = invoke_action(ctx_, *state.action);
    state.action = outcome.action;
    state.action_result = outcome.text;
    state.action_status = action_status_name(outcome.status);
    if (outcome.invoked) state.tools_used.push_back(outcome.action.name);
    if (!outcome.ok()) {
        std::cerr << "[react] action '" << outcome.action.name << "' "
                  << state.action_status << ": " << outcome.text << "\n";
    }
    state.phase = phase::kObserve;
}

void ReactMachine::observe(ReActState& state) {
    state.observation = state.action_result.value_or("");
    state.action_result.reset();

    std::string tool = state.action ? state.action->name : "";
    state.append(Role::tool, *state.observation,
                 {{"tool", tool}, {"status", state.action_status}});
    state.step_count++;

    if (state.finish_after_observe) {
        state.final_answer = *state.observation;
        state.output = *state.observation;
        state.phase = phase::kTerminate;
    } else if (state.step_count >= state.max_steps) {
        truncate(state);
    } else {
        state.phase = phase::kThink;
    }
}

// Step-limit truncation is a normal outcome.
void ReactMachine::truncate(ReActState& state) {
    state.truncated = true;
    state.output = "[step limit reached after " + std::to_string(state.step_count) + " steps] " +
                   state.observation.value_or("");
    state.phase = phase::kTerminate;
}

void ReactMachine::fail(ReActState& state, const std::string& error) {
    std::cerr << "[react] " << error << "\n";
    state.errors.push_back(error);
    state.output = state.observation ? *state.observation : "[error] " + error;
    state.phase = phase::kTerminate;
}

} // namespace arena
